#pragma once

#include <gigmap/element.hpp>
#include <gigmap/labelled_matrix.hpp>
#include <gigmap/ordering.hpp>
#include <string>

namespace gigmap
{

// Which axis runs along the heatmap columns (x) and rows (y), and the
// default table column holding each axis' ids.
struct HeatmapAxes
{
    std::string x_axis      = "gene";
    std::string x_col       = "sseqid";
    std::string y_axis      = "genome";
    std::string y_col       = "genome";
    std::string value_col   = "pident";
};

/**
 * HeatmapElement — long-format values pivoted to a y_axis x x_axis grid.
 *
 * Each axis the heatmap touches is extended with its members and, unless an
 * earlier element fixed it, ordered by clustering the pivoted values.
 */
class HeatmapElement : public Element
{
   public:
    HeatmapElement(std::string id, HeatmapAxes axes, int x_index, int y_index);

    ReadResult read(ReadContext& ctx) override;
    void       plot(PlotContext& ctx) override;

    const HeatmapAxes&    axes() const { return axes_; }
    const LabelledMatrix& values() const { return wide_; }

    // Range of the plotted values and the color mapping, valid after read().
    double             min_value() const { return min_val_; }
    double             max_value() const { return max_val_; }
    double             zmin() const { return zmin_; }
    double             zmax() const { return max_val_; }
    const std::string& colorscale_name() const { return colorscale_; }

    void set_ordering_options(const OrderingOptions& options) { ordering_ = options; }

   private:
    void order_axis(ReadContext& ctx, const std::string& axis_name, const LabelledMatrix& rows);

    HeatmapAxes     axes_;
    int             x_index_;
    int             y_index_;
    OrderingOptions ordering_;

    LabelledMatrix wide_;   // rows: y_axis members, columns: x_axis members
    double         min_val_ = 0.0;
    double         max_val_ = 0.0;
    double         zmin_    = 0.0;
    std::string    colorscale_;
};

}   // namespace gigmap
