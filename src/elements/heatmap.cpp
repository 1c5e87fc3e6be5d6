#include <algorithm>
#include <cmath>
#include <gigmap/canvas.hpp>
#include <gigmap/color.hpp>
#include <gigmap/elements/heatmap.hpp>
#include <gigmap/error.hpp>
#include <gigmap/logger.hpp>
#include <gigmap/table.hpp>
#include <limits>

namespace gigmap
{

namespace
{

std::vector<Argument> heatmap_arguments(const HeatmapAxes& axes)
{
    return {
        Argument("csv", "Long-format table with one row per " + axes.x_axis + " and " + axes.y_axis),
        Argument(axes.x_axis + "-col",
                 "Column holding " + axes.x_axis + " ids",
                 ArgType::String,
                 ArgValue{axes.x_col}),
        Argument(axes.y_axis + "-col",
                 "Column holding " + axes.y_axis + " ids",
                 ArgType::String,
                 ArgValue{axes.y_col}),
        Argument("val-col", "Column holding the plotted values", ArgType::String, ArgValue{axes.value_col}),
        Argument("colorscale", "Name of the colorscale", ArgType::String, ArgValue{std::string("blues")}),
        Argument("min-val", "Values below this are left empty", ArgType::Float),
    };
}

std::vector<double> index_positions(size_t n)
{
    std::vector<double> out(n);
    for (size_t i = 0; i < n; ++i)
        out[i] = static_cast<double>(i);
    return out;
}

}   // namespace

HeatmapElement::HeatmapElement(std::string id, HeatmapAxes axes, int x_index, int y_index)
    : Element(std::move(id), heatmap_arguments(axes)),
      axes_(std::move(axes)),
      x_index_(x_index),
      y_index_(y_index)
{
}

// ─── Read ───────────────────────────────────────────────────────────────────

ReadResult HeatmapElement::read(ReadContext& ctx)
{
    const ParamMap& p   = ctx.params();
    auto            csv = p.get_string("csv");
    if (!csv)
        return ReadResult::disabled("no --" + id() + "-csv given");

    colorscale_ = *p.get_string("colorscale");
    if (!has_colorscale(colorscale_))
    {
        throw ConfigError("--" + id() + "-colorscale: unknown colorscale '" + colorscale_ + "'");
    }

    const std::string x_col   = *p.get_string(axes_.x_axis + "-col");
    const std::string y_col   = *p.get_string(axes_.y_axis + "-col");
    const std::string val_col = *p.get_string("val-col");

    Table table = read_table(*csv);
    // Validates the value column up front so a bad cell names its row.
    table.numeric_column(val_col);
    LabelledMatrix wide = pivot(table, y_col, x_col, val_col);

    // Drop values under the threshold, then members left without any value.
    auto min_val = p.get_double("min-val");
    if (min_val)
    {
        for (Eigen::Index r = 0; r < wide.values.rows(); ++r)
            for (Eigen::Index c = 0; c < wide.values.cols(); ++c)
                if (wide.values(r, c) < *min_val)
                    wide.values(r, c) = std::numeric_limits<double>::quiet_NaN();
    }

    std::vector<std::string> rows;
    std::vector<std::string> cols;
    for (size_t r = 0; r < wide.rows(); ++r)
    {
        if (wide.values.row(static_cast<Eigen::Index>(r)).array().isNaN().all())
            continue;
        rows.push_back(wide.row_labels[r]);
    }
    for (size_t c = 0; c < wide.cols(); ++c)
    {
        if (wide.values.col(static_cast<Eigen::Index>(c)).array().isNaN().all())
            continue;
        cols.push_back(wide.col_labels[c]);
    }
    if (rows.size() < 2 || cols.size() < 2)
    {
        throw DataError("'" + *csv + "' has " + std::to_string(rows.size()) + " " + axes_.y_axis
                        + " and " + std::to_string(cols.size()) + " " + axes_.x_axis
                        + " ids with values" + (min_val ? " at or above --" + id() + "-min-val" : "")
                        + ", at least two of each are needed");
    }
    wide_ = wide.subset(rows, cols);

    min_val_ = std::numeric_limits<double>::infinity();
    max_val_ = -std::numeric_limits<double>::infinity();
    for (Eigen::Index r = 0; r < wide_.values.rows(); ++r)
    {
        for (Eigen::Index c = 0; c < wide_.values.cols(); ++c)
        {
            const double v = wide_.values(r, c);
            if (std::isnan(v))
                continue;
            min_val_ = std::min(min_val_, v);
            max_val_ = std::max(max_val_, v);
        }
    }
    // "blues" starts one value range below the minimum so no cell is drawn near-white.
    zmin_ = colorscale_ == "blues" ? min_val_ - (max_val_ - min_val_) : min_val_;

    order_axis(ctx, axes_.x_axis, wide_.transposed());
    order_axis(ctx, axes_.y_axis, wide_);

    GIGMAP_LOG_INFO(id(),
                    "{} {} x {} {} from {}",
                    wide_.rows(),
                    axes_.y_axis,
                    wide_.cols(),
                    axes_.x_axis,
                    *csv);
    return ReadResult::ready();
}

void HeatmapElement::order_axis(ReadContext&          ctx,
                                const std::string&    axis_name,
                                const LabelledMatrix& rows)
{
    Axis& axis = ctx.axis(axis_name);
    // Checked immediately before ordering; a fixed order is final.
    if (axis.is_fixed())
    {
        GIGMAP_LOG_DEBUG(id(),
                         "{} order fixed by '{}', not clustering",
                         axis_name,
                         axis.fixed_by());
        return;
    }
    axis.extend(rows.row_labels);
    axis.set_order(order_by_linkage(rows, ordering_), id());
}

// ─── Plot ───────────────────────────────────────────────────────────────────

void HeatmapElement::plot(PlotContext& ctx)
{
    const Axis& x_axis = ctx.axis(axes_.x_axis);
    const Axis& y_axis = ctx.axis(axes_.y_axis);

    HeatmapTrace trace;
    trace.name       = id();
    trace.z          = wide_.reindexed(y_axis.order(), x_axis.order()).values;
    trace.x_labels   = x_axis.labels();
    trace.y_labels   = y_axis.labels();
    trace.zmin       = zmin_;
    trace.zmax       = max_val_;
    trace.colorscale = colorscale_;

    Canvas&      canvas = ctx.canvas();
    PanelOptions options;
    options.share_x = true;
    options.share_y = true;
    canvas.add(id(), x_index_, y_index_, options);
    canvas.plot(id(), std::move(trace));

    AxisFormat x_format;
    x_format.tickvals   = index_positions(x_axis.length());
    x_format.ticktext   = x_axis.labels();
    x_format.tick_angle = -90.0f;
    canvas.format_axis(id(), AxisDim::X, x_format);

    AxisFormat y_format;
    y_format.tickvals = index_positions(y_axis.length());
    y_format.ticktext = y_axis.labels();
    canvas.format_axis(id(), AxisDim::Y, y_format);

    canvas.anchor_xaxis(x_index_, Side::Bottom);
    canvas.anchor_yaxis(y_index_, Side::Right);
}

}   // namespace gigmap
