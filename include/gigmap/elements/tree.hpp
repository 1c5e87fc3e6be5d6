#pragma once

#include <gigmap/element.hpp>
#include <gigmap/nj_tree.hpp>
#include <optional>
#include <string>

namespace gigmap
{

/**
 * TreeElement — neighbor-joining tree drawn beside the genome rows.
 *
 * Reads a square distance table (--{id}-distmat), builds the tree over the
 * genomes already on the axis (or every genome in the table when the axis is
 * still empty), then sets and fixes the axis order to the tree's leaf order.
 */
class TreeElement : public Element
{
   public:
    TreeElement(std::string id, std::string axis_name, int x_index, int y_index);

    ReadResult read(ReadContext& ctx) override;
    void       plot(PlotContext& ctx) override;

    // Present once read() returned ready().
    const std::optional<TreeLayout>& tree() const { return tree_; }

   private:
    std::string               axis_name_;
    int                       x_index_;
    int                       y_index_;
    std::optional<TreeLayout> tree_;
};

}   // namespace gigmap
