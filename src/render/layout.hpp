#pragma once

#include <gigmap/canvas.hpp>
#include <optional>
#include <string>
#include <vector>

namespace gigmap
{

// Pixels reserved around the whole grid for titles and tick labels.
struct Margins
{
    float left   = 20.0f;
    float right  = 20.0f;
    float bottom = 20.0f;
    float top    = 20.0f;
};

// One grid track (a column or a row) after splitting.
struct Track
{
    float offset = 0.0f;
    float size   = 0.0f;
};

// Split `total` pixels into tracks. A track with a fraction claims that share
// of `total`; the others divide the remainder evenly. `padding[i]` (also a
// fraction of `total`) is inserted before track i, `gap` pixels between
// consecutive tracks. Sizes are clamped at zero.
std::vector<Track> split_extent(float                                     total,
                                const std::vector<std::optional<double>>& fractions,
                                const std::vector<double>&                padding,
                                float                                     gap);

// Viewport rects for a cols x rows grid inside the figure, row-major with row
// 0 at the top.
std::vector<Rect> compute_grid_layout(float                                     figure_width,
                                      float                                     figure_height,
                                      const std::vector<std::optional<double>>& col_fractions,
                                      const std::vector<double>&                col_padding,
                                      const std::vector<std::optional<double>>& row_fractions,
                                      const std::vector<double>&                row_padding,
                                      const Margins&                            margins,
                                      float                                     hgap,
                                      float                                     vgap);

// Approximate rendered width of a label in a proportional sans-serif font.
float estimate_text_width(const std::string& text, float font_size);

struct TickResult
{
    std::vector<double>      positions;
    std::vector<std::string> labels;
};

// "Nice" numeric ticks (1/2/5 x 10^n spacing) covering [dmin, dmax].
TickResult generate_ticks(double dmin, double dmax, int target_ticks = 6);

// Ticks for an axis: explicit tickvals/ticktext when given, generated otherwise.
// Ticks outside [dmin, dmax] are dropped.
TickResult axis_ticks(const AxisFormat& format, double dmin, double dmax);

}   // namespace gigmap
