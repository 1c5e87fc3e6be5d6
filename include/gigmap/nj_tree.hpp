#pragma once

#include <gigmap/labelled_matrix.hpp>
#include <string>
#include <vector>

namespace gigmap
{

/**
 * TreeLayout — a neighbor-joining tree drawn as a rectangular dendrogram.
 *
 * The root sits at x = 0 and every node at its cumulative branch length.
 * Leaf i of leaf_order() is drawn at y = i so the tree lines up with any
 * panel whose rows follow the same order. Coordinates describe line
 * segments separated by NaN.
 */
class TreeLayout
{
   public:
    struct Node
    {
        std::string         name;   // leaf id, empty for internal nodes
        int                 parent = -1;
        double              length = 0.0;   // branch length to parent
        std::vector<size_t> children;
        double              x = 0.0;
        double              y = 0.0;
    };

    TreeLayout(std::vector<Node> nodes, size_t root);

    const std::vector<std::string>& leaf_order() const { return leaf_order_; }
    const std::vector<Node>&        nodes() const { return nodes_; }
    size_t                          root() const { return root_; }

    const std::vector<double>&      x_coords() const { return x_; }
    const std::vector<double>&      y_coords() const { return y_; }
    const std::vector<std::string>& text() const { return text_; }

    // Dotted guides from each leaf tip out to max_x().
    const std::vector<double>& extension_x_coords() const { return ext_x_; }
    const std::vector<double>& extension_y_coords() const { return ext_y_; }

    double max_x() const { return max_x_; }

   private:
    void layout();

    std::vector<Node>        nodes_;
    size_t                   root_;
    std::vector<std::string> leaf_order_;
    std::vector<double>      x_;
    std::vector<double>      y_;
    std::vector<std::string> text_;
    std::vector<double>      ext_x_;
    std::vector<double>      ext_y_;
    double                   max_x_ = 0.0;
};

// Saitou-Nei neighbor joining over `ids`, each of which must label both a row
// and a column of `distances`. Negative branch lengths are clamped to zero.
// Throws DataError for fewer than two ids, a missing id or a missing distance.
TreeLayout make_nj_tree(const std::vector<std::string>& ids, const LabelledMatrix& distances);

}   // namespace gigmap
