#include <gigmap/canvas.hpp>
#include <gigmap/elements/colorbar.hpp>

namespace gigmap
{

ColorbarElement::ColorbarElement(std::string           id,
                                 const HeatmapElement& heatmap,
                                 int                   x_index,
                                 int                   y_index,
                                 std::string           label,
                                 size_t                steps)
    : Element(std::move(id), {}, {heatmap.id()}),
      heatmap_(heatmap),
      x_index_(x_index),
      y_index_(y_index),
      label_(std::move(label)),
      steps_(steps < 1 ? 1 : steps)
{
}

ReadResult ColorbarElement::read(ReadContext& ctx)
{
    if (!ctx.dependency_enabled(heatmap_.id()))
        return ReadResult::disabled("heatmap '" + heatmap_.id() + "' is disabled");
    return ReadResult::ready();
}

void ColorbarElement::plot(PlotContext& ctx)
{
    const double lo = heatmap_.min_value();
    const double hi = heatmap_.max_value();
    // A constant heatmap gets a single cell.
    const size_t n = hi > lo ? steps_ : 1;

    HeatmapTrace bar;
    bar.name = id();
    bar.z.resize(1, static_cast<Eigen::Index>(n));
    bar.x.resize(n);
    for (size_t i = 0; i < n; ++i)
    {
        const double v = n == 1 ? lo : lo + (hi - lo) * static_cast<double>(i) / static_cast<double>(n - 1);
        bar.x[i]                            = v;
        bar.z(0, static_cast<Eigen::Index>(i)) = v;
    }
    bar.y          = {0.0};
    bar.y_labels   = {label_};
    bar.zmin       = heatmap_.zmin();
    bar.zmax       = heatmap_.zmax();
    bar.colorscale = heatmap_.colorscale_name();

    Canvas&      canvas = ctx.canvas();
    PanelOptions options;
    options.height  = 0.05;
    options.padding = 0.05;
    canvas.add(id(), x_index_, y_index_, options);
    canvas.plot(id(), std::move(bar));

    AxisFormat y_format;
    y_format.tickvals = {0.0};
    y_format.ticktext = {label_};
    canvas.format_axis(id(), AxisDim::Y, y_format);

    canvas.anchor_yaxis(y_index_, Side::Right);
    canvas.anchor_xaxis(x_index_, Side::Bottom);
}

}   // namespace gigmap
