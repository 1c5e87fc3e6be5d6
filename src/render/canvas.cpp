#include <algorithm>
#include <cmath>
#include <gigmap/canvas.hpp>
#include <gigmap/logger.hpp>
#include <limits>
#include <set>
#include <stdexcept>

#include "layout.hpp"

namespace gigmap
{

// ─── Figure ─────────────────────────────────────────────────────────────────

const Panel* Figure::find(const std::string& id) const
{
    for (const auto& p : panels)
    {
        if (p.id == id)
            return &p;
    }
    return nullptr;
}

Panel* Figure::find(const std::string& id)
{
    for (auto& p : panels)
    {
        if (p.id == id)
            return &p;
    }
    return nullptr;
}

Side Figure::x_side(int x_index) const
{
    auto it = x_anchor.find(x_index);
    return it != x_anchor.end() ? it->second : Side::Bottom;
}

Side Figure::y_side(int y_index) const
{
    auto it = y_anchor.find(y_index);
    return it != y_anchor.end() ? it->second : Side::Left;
}

namespace
{

struct Extent
{
    double min = std::numeric_limits<double>::infinity();
    double max = -std::numeric_limits<double>::infinity();

    bool valid() const { return min <= max; }

    void include(double v)
    {
        if (!std::isfinite(v))
            return;
        min = std::min(min, v);
        max = std::max(max, v);
    }

    void merge(const Extent& other)
    {
        if (!other.valid())
            return;
        min = std::min(min, other.min);
        max = std::max(max, other.max);
    }
};

// Cell centres along one heatmap dimension, widened by half a cell each side.
Extent cell_extent(const std::vector<double>& centers, Eigen::Index count)
{
    Extent e;
    if (count <= 0)
        return e;
    if (centers.empty())
    {
        e.min = -0.5;
        e.max = static_cast<double>(count) - 0.5;
        return e;
    }
    for (double c : centers)
        e.include(c);
    double half = 0.5;
    if (centers.size() > 1)
        half = std::abs(centers[1] - centers[0]) * 0.5;
    if (e.valid())
    {
        e.min -= half;
        e.max += half;
    }
    return e;
}

void trace_extent(const Trace& trace, Extent& x, Extent& y)
{
    if (const auto* hm = std::get_if<HeatmapTrace>(&trace))
    {
        x.merge(cell_extent(hm->x, hm->z.cols()));
        y.merge(cell_extent(hm->y, hm->z.rows()));
    }
    else if (const auto* line = std::get_if<LineTrace>(&trace))
    {
        for (double v : line->x)
            x.include(v);
        for (double v : line->y)
            y.include(v);
    }
}

float widest_label(const TickResult& ticks, float font_size)
{
    float w = 0.0f;
    for (const auto& label : ticks.labels)
        w = std::max(w, estimate_text_width(label, font_size));
    return w;
}

}   // namespace

void Figure::compute_layout()
{
    // Grid tracks
    std::set<int> xs;
    std::set<int> ys;
    for (const auto& p : panels)
    {
        xs.insert(p.x_index);
        ys.insert(p.y_index);
    }
    column_indices.assign(xs.begin(), xs.end());
    row_indices.assign(ys.rbegin(), ys.rend());

    auto position_of = [](const std::vector<int>& v, int index)
    { return static_cast<int>(std::find(v.begin(), v.end(), index) - v.begin()); };

    for (auto& p : panels)
    {
        p.column = position_of(column_indices, p.x_index);
        p.row    = position_of(row_indices, p.y_index);
    }

    // Data ranges, pooled across shared axes
    std::vector<Extent> x_extent(panels.size());
    std::vector<Extent> y_extent(panels.size());
    for (size_t i = 0; i < panels.size(); ++i)
    {
        for (const auto& t : panels[i].traces)
            trace_extent(t, x_extent[i], y_extent[i]);
    }

    std::map<int, Extent> shared_x;   // column -> pooled extent
    std::map<int, Extent> shared_y;   // row -> pooled extent
    std::map<int, int>    shared_x_count;
    std::map<int, int>    shared_y_count;
    for (size_t i = 0; i < panels.size(); ++i)
    {
        const auto& p = panels[i];
        if (p.options.share_x)
        {
            shared_x[p.column].merge(x_extent[i]);
            ++shared_x_count[p.column];
        }
        if (p.options.share_y)
        {
            shared_y[p.row].merge(y_extent[i]);
            ++shared_y_count[p.row];
        }
    }

    for (size_t i = 0; i < panels.size(); ++i)
    {
        auto&  p  = panels[i];
        Extent ex = p.options.share_x ? shared_x[p.column] : x_extent[i];
        Extent ey = p.options.share_y ? shared_y[p.row] : y_extent[i];

        if (p.x_format.range)
        {
            ex.min = p.x_format.range->first;
            ex.max = p.x_format.range->second;
        }
        if (p.y_format.range)
        {
            ey.min = p.y_format.range->first;
            ey.max = p.y_format.range->second;
        }
        p.x_min = ex.valid() || p.x_format.range ? ex.min : 0.0;
        p.x_max = ex.valid() || p.x_format.range ? ex.max : 1.0;
        p.y_min = ey.valid() || p.y_format.range ? ey.min : 0.0;
        p.y_max = ey.valid() || p.y_format.range ? ey.max : 1.0;
    }

    // Tick label ownership: a shared axis labels only its outermost panel on
    // the anchored side.
    const int last_row    = static_cast<int>(row_indices.size()) - 1;
    const int last_column = static_cast<int>(column_indices.size()) - 1;
    for (auto& p : panels)
    {
        p.draw_x_ticklabels = p.x_format.show_ticklabels;
        if (p.draw_x_ticklabels && p.options.share_x && shared_x_count[p.column] > 1)
        {
            Side side    = x_side(p.x_index);
            int  extreme = (side == Side::Top) ? last_row : 0;
            for (const auto& q : panels)
            {
                if (q.column != p.column || !q.options.share_x || !q.x_format.show_ticklabels)
                    continue;
                extreme = (side == Side::Top) ? std::min(extreme, q.row) : std::max(extreme, q.row);
            }
            p.draw_x_ticklabels = (p.row == extreme);
        }

        p.draw_y_ticklabels = p.y_format.show_ticklabels;
        if (p.draw_y_ticklabels && p.options.share_y && shared_y_count[p.row] > 1)
        {
            Side side    = y_side(p.y_index);
            int  extreme = (side == Side::Right) ? 0 : last_column;
            for (const auto& q : panels)
            {
                if (q.row != p.row || !q.options.share_y || !q.y_format.show_ticklabels)
                    continue;
                extreme = (side == Side::Right) ? std::max(extreme, q.column)
                                                : std::min(extreme, q.column);
            }
            p.draw_y_ticklabels = (p.column == extreme);
        }
    }

    // Margins sized to the labels drawn on each side
    const float font = style.tick_font_size;
    Margins     margins;
    const float title_top = style.title.empty() ? 20.0f : 20.0f + style.title_font_size * 2.0f;
    margins.top           = title_top;
    for (const auto& p : panels)
    {
        if (p.draw_y_ticklabels)
        {
            float w = widest_label(axis_ticks(p.y_format, p.y_min, p.y_max), font) + 12.0f;
            if (!p.y_format.title.empty())
                w += font * 1.8f;
            if (y_side(p.y_index) == Side::Right)
                margins.right = std::max(margins.right, w + 10.0f);
            else
                margins.left = std::max(margins.left, w + 10.0f);
        }
        if (p.draw_x_ticklabels)
        {
            auto  ticks = axis_ticks(p.x_format, p.x_min, p.x_max);
            float h     = std::abs(p.x_format.tick_angle) >= 45.0f ? widest_label(ticks, font)
                                                                   : font * 1.4f;
            h += 10.0f;
            if (!p.x_format.title.empty())
                h += font * 1.8f;
            if (x_side(p.x_index) == Side::Top)
                margins.top = std::max(margins.top, title_top + h);
            else
                margins.bottom = std::max(margins.bottom, h + 10.0f);
        }
    }

    // Track sizing hints: the largest request in each column/row wins
    std::vector<std::optional<double>> col_fractions(column_indices.size());
    std::vector<double>                col_padding(column_indices.size(), 0.0);
    std::vector<std::optional<double>> row_fractions(row_indices.size());
    std::vector<double>                row_padding(row_indices.size(), 0.0);
    for (const auto& p : panels)
    {
        auto& cf = col_fractions[static_cast<size_t>(p.column)];
        if (p.options.width)
            cf = std::max(cf.value_or(0.0), *p.options.width);
        auto& rf = row_fractions[static_cast<size_t>(p.row)];
        if (p.options.height)
            rf = std::max(rf.value_or(0.0), *p.options.height);
        col_padding[static_cast<size_t>(p.column)] =
            std::max(col_padding[static_cast<size_t>(p.column)], p.options.padding);
        row_padding[static_cast<size_t>(p.row)] =
            std::max(row_padding[static_cast<size_t>(p.row)], p.options.padding);
    }
    // Padding only separates a track from the one before it.
    if (!col_padding.empty())
        col_padding.front() = 0.0;
    if (!row_padding.empty())
        row_padding.front() = 0.0;

    auto rects = compute_grid_layout(static_cast<float>(style.width),
                                     static_cast<float>(style.height),
                                     col_fractions,
                                     col_padding,
                                     row_fractions,
                                     row_padding,
                                     margins,
                                     style.hgap,
                                     style.vgap);

    const size_t ncols = column_indices.size();
    for (auto& p : panels)
    {
        p.viewport = rects[static_cast<size_t>(p.row) * ncols + static_cast<size_t>(p.column)];
    }
}

// ─── SubplotCanvas ──────────────────────────────────────────────────────────

void SubplotCanvas::add(const std::string& panel_id,
                        int                x_index,
                        int                y_index,
                        const PanelOptions& options)
{
    if (figure_.find(panel_id) != nullptr)
    {
        throw std::invalid_argument("panel '" + panel_id + "' already exists");
    }
    for (const auto& p : figure_.panels)
    {
        if (p.x_index == x_index && p.y_index == y_index)
        {
            throw std::invalid_argument("panel '" + panel_id + "' overlaps panel '" + p.id
                                        + "' at (" + std::to_string(x_index) + ", "
                                        + std::to_string(y_index) + ")");
        }
    }

    Panel panel;
    panel.id      = panel_id;
    panel.x_index = x_index;
    panel.y_index = y_index;
    panel.options = options;
    figure_.panels.push_back(std::move(panel));
    GIGMAP_LOG_DEBUG("canvas", "Added panel '{}' at ({}, {})", panel_id, x_index, y_index);
}

Panel& SubplotCanvas::panel(const std::string& panel_id)
{
    Panel* p = figure_.find(panel_id);
    if (p == nullptr)
    {
        throw std::out_of_range("unknown panel '" + panel_id + "'");
    }
    return *p;
}

void SubplotCanvas::plot(const std::string& panel_id, Trace trace)
{
    panel(panel_id).traces.push_back(std::move(trace));
}

void SubplotCanvas::format_axis(const std::string& panel_id, AxisDim dim, const AxisFormat& fmt)
{
    auto& p = panel(panel_id);
    if (dim == AxisDim::X)
        p.x_format = fmt;
    else
        p.y_format = fmt;
}

void SubplotCanvas::anchor_xaxis(int x_index, Side side)
{
    if (side != Side::Top && side != Side::Bottom)
    {
        throw std::invalid_argument("x axis can only be anchored to the top or bottom");
    }
    figure_.x_anchor[x_index] = side;
}

void SubplotCanvas::anchor_yaxis(int y_index, Side side)
{
    if (side != Side::Left && side != Side::Right)
    {
        throw std::invalid_argument("y axis can only be anchored to the left or right");
    }
    figure_.y_anchor[y_index] = side;
}

void SubplotCanvas::update_layout(const LayoutUpdate& update)
{
    auto& style = figure_.style;
    if (update.title)
        style.title = *update.title;
    if (update.width)
        style.width = *update.width;
    if (update.height)
        style.height = *update.height;
    if (update.background)
        style.background = *update.background;
    if (update.plot_background)
        style.plot_background = *update.plot_background;
}

const Figure& SubplotCanvas::figure()
{
    figure_.compute_layout();
    return figure_;
}

}   // namespace gigmap
