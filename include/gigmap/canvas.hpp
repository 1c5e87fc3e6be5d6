#pragma once

#include <eigen3/Eigen/Core>
#include <cstdint>
#include <gigmap/color.hpp>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace gigmap
{

struct Rect
{
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;
};

enum class Side
{
    Left,
    Right,
    Top,
    Bottom,
};

enum class AxisDim
{
    X,
    Y,
};

enum class LineDash
{
    Solid,
    Dot,
    Dash,
};

// Placement hints for one panel. width/height are fractions of the figure's
// plot area claimed by the panel's column/row; columns and rows without a
// hint share what is left. padding is the fraction of the plot area left
// empty before the panel (left of its column, above its row).
struct PanelOptions
{
    bool                  share_x = false;
    bool                  share_y = false;
    std::optional<double> width;
    std::optional<double> height;
    double                padding = 0.0;
};

struct AxisFormat
{
    std::optional<std::pair<double, double>> range;
    // Explicit tick positions; when empty ticks are generated from the range.
    std::vector<double>      tickvals;
    std::vector<std::string> ticktext;
    bool                     show_ticklabels = true;
    bool                     show_line       = false;
    std::string              title;
    // Degrees, counter-clockwise. -90 renders x labels vertically.
    float tick_angle = 0.0f;
};

// Grid of cells. Column c is centred on x[c] (or c when x is empty), row r on
// y[r] (or r). NaN cells are left empty.
struct HeatmapTrace
{
    std::string              name;
    Eigen::MatrixXd          z;
    std::vector<double>      x;
    std::vector<double>      y;
    std::vector<std::string> x_labels;   // hover text per column
    std::vector<std::string> y_labels;   // hover text per row
    double                   zmin       = 0.0;
    double                   zmax       = 1.0;
    std::string              colorscale = "blues";
    // Discrete mode: when non-empty, z holds indices into this palette.
    std::vector<Color> palette;
};

// Polyline; a NaN in x or y breaks the line into separate segments.
struct LineTrace
{
    std::string              name;
    std::vector<double>      x;
    std::vector<double>      y;
    std::vector<std::string> text;   // hover text; a run takes the text of its first point
    Color                    color = colors::black;
    float                    width = 1.0f;
    LineDash                 dash  = LineDash::Solid;
};

using Trace = std::variant<HeatmapTrace, LineTrace>;

struct Panel
{
    std::string        id;
    int                x_index = 0;
    int                y_index = 0;
    PanelOptions       options;
    AxisFormat         x_format;
    AxisFormat         y_format;
    std::vector<Trace> traces;

    // Filled in by Figure::compute_layout().
    Rect   viewport;
    int    column = 0;
    int    row    = 0;
    double x_min  = 0.0;
    double x_max  = 1.0;
    double y_min  = 0.0;
    double y_max  = 1.0;
    bool   draw_x_ticklabels = false;
    bool   draw_y_ticklabels = false;
};

struct FigureStyle
{
    uint32_t    width  = 1200;
    uint32_t    height = 800;
    std::string title;
    Color       background      = colors::white;
    Color       plot_background = colors::white;
    float       hgap            = 4.0f;
    float       vgap            = 4.0f;
    float       tick_font_size  = 10.0f;
    float       title_font_size = 16.0f;
};

// Figure-level settings to change; unset fields are left as they are.
struct LayoutUpdate
{
    std::optional<std::string> title;
    std::optional<uint32_t>    width;
    std::optional<uint32_t>    height;
    std::optional<Color>       background;
    std::optional<Color>       plot_background;
};

// The composed figure: panels in insertion order plus grid-level settings.
struct Figure
{
    FigureStyle          style;
    std::vector<Panel>   panels;
    std::map<int, Side>  x_anchor;   // x_index -> Bottom/Top
    std::map<int, Side>  y_anchor;   // y_index -> Left/Right
    std::vector<int>     column_indices;   // ascending x_index
    std::vector<int>     row_indices;      // descending y_index, top row first

    const Panel* find(const std::string& id) const;
    Panel*       find(const std::string& id);

    Side x_side(int x_index) const;
    Side y_side(int y_index) const;

    // Resolve grid position, data ranges, tick label ownership and pixel
    // viewports for every panel.
    void compute_layout();
};

/**
 * Canvas — the drawing surface elements render into.
 *
 * Panels are addressed by a caller-chosen id and placed on an integer grid:
 * larger x_index is further right, larger y_index is higher up.
 */
class Canvas
{
   public:
    virtual ~Canvas() = default;

    // Throws std::invalid_argument if the panel id is already in use.
    virtual void add(const std::string& panel_id,
                     int                x_index,
                     int                y_index,
                     const PanelOptions& options = {}) = 0;

    // Throws std::out_of_range for an unknown panel id.
    virtual void plot(const std::string& panel_id, Trace trace)                               = 0;
    virtual void format_axis(const std::string& panel_id, AxisDim dim, const AxisFormat& fmt) = 0;

    virtual void anchor_xaxis(int x_index, Side side) = 0;
    virtual void anchor_yaxis(int y_index, Side side) = 0;

    virtual void               update_layout(const LayoutUpdate& update) = 0;
    virtual const FigureStyle& style() const                            = 0;

    // Lays out and returns the composed figure.
    virtual const Figure& figure() = 0;
};

class SubplotCanvas : public Canvas
{
   public:
    SubplotCanvas() = default;

    void add(const std::string& panel_id,
             int                x_index,
             int                y_index,
             const PanelOptions& options = {}) override;
    void plot(const std::string& panel_id, Trace trace) override;
    void format_axis(const std::string& panel_id, AxisDim dim, const AxisFormat& fmt) override;
    void anchor_xaxis(int x_index, Side side) override;
    void anchor_yaxis(int y_index, Side side) override;

    void               update_layout(const LayoutUpdate& update) override;
    const FigureStyle& style() const override { return figure_.style; }
    const Figure&      figure() override;

    bool   has_panel(const std::string& panel_id) const { return figure_.find(panel_id) != nullptr; }
    size_t panel_count() const { return figure_.panels.size(); }

   private:
    Panel& panel(const std::string& panel_id);

    Figure figure_;
};

}   // namespace gigmap
