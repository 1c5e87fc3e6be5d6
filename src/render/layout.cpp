#include "layout.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace gigmap
{

std::vector<Track> split_extent(float                                     total,
                                const std::vector<std::optional<double>>& fractions,
                                const std::vector<double>&                padding,
                                float                                     gap)
{
    const size_t       n = fractions.size();
    std::vector<Track> tracks(n);
    if (n == 0)
        return tracks;

    float claimed  = 0.0f;
    int   flexible = 0;
    for (size_t i = 0; i < n; ++i)
    {
        if (fractions[i])
            claimed += static_cast<float>(*fractions[i]) * total;
        else
            ++flexible;
        if (i < padding.size())
            claimed += static_cast<float>(padding[i]) * total;
    }
    claimed += gap * static_cast<float>(n - 1);

    float remainder = std::max(0.0f, total - claimed);
    float flex_size = flexible > 0 ? remainder / static_cast<float>(flexible) : 0.0f;

    float cursor = 0.0f;
    for (size_t i = 0; i < n; ++i)
    {
        if (i > 0)
            cursor += gap;
        if (i < padding.size())
            cursor += static_cast<float>(padding[i]) * total;

        float size = fractions[i] ? static_cast<float>(*fractions[i]) * total : flex_size;
        tracks[i].offset = cursor;
        tracks[i].size   = std::max(0.0f, size);
        cursor += tracks[i].size;
    }
    return tracks;
}

std::vector<Rect> compute_grid_layout(float                                     figure_width,
                                      float                                     figure_height,
                                      const std::vector<std::optional<double>>& col_fractions,
                                      const std::vector<double>&                col_padding,
                                      const std::vector<std::optional<double>>& row_fractions,
                                      const std::vector<double>&                row_padding,
                                      const Margins&                            margins,
                                      float                                     hgap,
                                      float                                     vgap)
{
    float inner_w = std::max(0.0f, figure_width - margins.left - margins.right);
    float inner_h = std::max(0.0f, figure_height - margins.top - margins.bottom);

    auto cols = split_extent(inner_w, col_fractions, col_padding, hgap);
    auto rows = split_extent(inner_h, row_fractions, row_padding, vgap);

    std::vector<Rect> rects;
    rects.reserve(cols.size() * rows.size());

    // Row 0 at top: y increases downward in screen coords
    for (const auto& row : rows)
    {
        for (const auto& col : cols)
        {
            Rect r;
            r.x = margins.left + col.offset;
            r.y = margins.top + row.offset;
            r.w = col.size;
            r.h = row.size;
            rects.push_back(r);
        }
    }
    return rects;
}

float estimate_text_width(const std::string& text, float font_size)
{
    // Average advance of a sans-serif glyph is roughly 0.6 em.
    return static_cast<float>(text.size()) * font_size * 0.6f;
}

// ─── Tick generation ────────────────────────────────────────────────────────
// Pick spacing as 1, 2 or 5 x 10^n so the range gets roughly target_ticks ticks.

namespace
{

double nice_number(double x, bool round_flag)
{
    double exp_v = std::floor(std::log10(x));
    double frac  = x / std::pow(10.0, exp_v);
    double nice;
    if (round_flag)
    {
        if (frac < 1.5)
            nice = 1.0;
        else if (frac < 3.0)
            nice = 2.0;
        else if (frac < 7.0)
            nice = 5.0;
        else
            nice = 10.0;
    }
    else
    {
        if (frac <= 1.0)
            nice = 1.0;
        else if (frac <= 2.0)
            nice = 2.0;
        else if (frac <= 5.0)
            nice = 5.0;
        else
            nice = 10.0;
    }
    return nice * std::pow(10.0, exp_v);
}

// Enough decimals to tell neighbouring ticks apart, trailing zeros trimmed.
std::string format_tick_value(double value, double spacing)
{
    if (std::abs(value) < std::abs(spacing) * 1e-6)
        return "0";

    int decimals = 0;
    if (spacing > 0.0 && std::isfinite(spacing))
        decimals = std::max(0, static_cast<int>(std::ceil(-std::log10(spacing))));

    char buf[64];
    if (std::abs(value) >= 1e9 || decimals > 9)
    {
        std::snprintf(buf, sizeof(buf), "%.3e", value);
        return buf;
    }
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
    return buf;
}

}   // namespace

TickResult generate_ticks(double dmin, double dmax, int target_ticks)
{
    TickResult result;
    if (!std::isfinite(dmin) || !std::isfinite(dmax))
        return result;

    double range = dmax - dmin;
    if (range <= 0.0)
    {
        result.positions.push_back(dmin);
        result.labels.push_back(format_tick_value(dmin, 1.0));
        return result;
    }

    double nice_range = nice_number(range, false);
    double spacing    = nice_number(nice_range / static_cast<double>(target_ticks - 1), true);
    if (spacing <= 0.0 || !std::isfinite(spacing))
    {
        result.positions.push_back(dmin);
        result.labels.push_back(format_tick_value(dmin, range));
        return result;
    }

    double nice_min  = std::floor(dmin / spacing) * spacing;
    double nice_max  = std::ceil(dmax / spacing) * spacing;
    int    max_iters = target_ticks * 3;
    int    iters     = 0;
    for (double v = nice_min; v <= nice_max + spacing * 0.5 && iters < max_iters;
         v += spacing, ++iters)
    {
        if (v >= dmin - spacing * 0.01 && v <= dmax + spacing * 0.01)
        {
            // Snap near-zero values to exactly zero to avoid "-0" labels
            if (std::abs(v) < spacing * 1e-6)
                v = 0.0;
            result.positions.push_back(v);
            result.labels.push_back(format_tick_value(v, spacing));
        }
    }
    return result;
}

TickResult axis_ticks(const AxisFormat& format, double dmin, double dmax)
{
    if (format.tickvals.empty())
        return generate_ticks(dmin, dmax);

    double lo = std::min(dmin, dmax);
    double hi = std::max(dmin, dmax);

    TickResult result;
    for (size_t i = 0; i < format.tickvals.size(); ++i)
    {
        double v = format.tickvals[i];
        if (v < lo || v > hi)
            continue;
        result.positions.push_back(v);
        if (i < format.ticktext.size())
        {
            result.labels.push_back(format.ticktext[i]);
        }
        else
        {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%g", v);
            result.labels.emplace_back(buf);
        }
    }
    return result;
}

}   // namespace gigmap
