#pragma once

#include <gigmap/element.hpp>
#include <map>
#include <string>
#include <vector>

namespace gigmap
{

enum class StripOrientation
{
    Vertical,     // one cell per member down a column, beside the heatmap rows
    Horizontal,   // one cell per member along a row, under the heatmap columns
};

/**
 * AnnotationElement — labels (and optionally orders) one axis from a table.
 *
 * Arguments (namespaced under the element id):
 *   csv            annotation table; without it the element disables itself
 *   index-col      column holding member ids (default "{axis}_id")
 *   label-col      column holding display labels (default: the id)
 *   max-label-len  labels are cut to this many characters when read (60)
 *   order          text file listing ids in the wanted order; fixes the axis
 *   color-col      column drawn as a colored strip along the axis
 */
class AnnotationElement : public Element
{
   public:
    AnnotationElement(std::string      id,
                      std::string      axis_name,
                      StripOrientation orientation,
                      int              x_index,
                      int              y_index);

    ReadResult read(ReadContext& ctx) override;
    void       plot(PlotContext& ctx) override;

    const std::string& axis_name() const { return axis_name_; }

    // Labels as set on the axis, after truncation, in table (or order file) order.
    const std::vector<std::pair<std::string, std::string>>& labels() const { return labels_; }

    bool has_colors() const { return !color_col_.empty(); }

   private:
    std::string      axis_name_;
    StripOrientation orientation_;
    int              x_index_;
    int              y_index_;

    std::vector<std::pair<std::string, std::string>> labels_;
    std::string                                      color_col_;
    std::map<std::string, std::string>               color_values_;   // id -> raw cell
    bool                                             numeric_colors_ = false;
};

// First `max_len` characters of `label`.
std::string truncate_label(const std::string& label, size_t max_len);

}   // namespace gigmap
