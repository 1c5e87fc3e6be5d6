#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <gigmap/export.hpp>
#include <gigmap/logger.hpp>
#include <sstream>
#include <vector>

#include "render/layout.hpp"

namespace gigmap
{

// ─── SVG Helpers ────────────────────────────────────────────────────────────

namespace
{

std::string svg_color(const Color& c)
{
    auto channel = [](float v)
    { return static_cast<int>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f)); };
    char buf[64];
    std::snprintf(buf, sizeof(buf), "rgb(%d,%d,%d)", channel(c.r), channel(c.g), channel(c.b));
    return buf;
}

std::string fmt(double v)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6g", v);
    return buf;
}

std::string xml_escape(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
    {
        switch (c)
        {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&apos;";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

// Map data coordinates to SVG pixel coordinates within a viewport.
// SVG has Y-down, data has Y-up, so we flip Y.
struct DataToSvg
{
    float  vp_x, vp_y, vp_w, vp_h;
    double x_min, x_max, y_min, y_max;

    double map_x(double data_x) const
    {
        double range = x_max - x_min;
        if (range == 0.0)
            range = 1.0;
        return vp_x + (data_x - x_min) / range * vp_w;
    }

    double map_y(double data_y) const
    {
        double range = y_max - y_min;
        if (range == 0.0)
            range = 1.0;
        return vp_y + (1.0 - (data_y - y_min) / range) * vp_h;
    }
};

std::string clip_id(const Panel& panel)
{
    std::string id = "clip-";
    for (char c : panel.id)
        id += std::isalnum(static_cast<unsigned char>(c)) ? c : '_';
    return id;
}

// Centre of cell i and half its extent along one dimension.
double cell_center(const std::vector<double>& centers, Eigen::Index i)
{
    return centers.empty() ? static_cast<double>(i) : centers[static_cast<size_t>(i)];
}

double cell_half(const std::vector<double>& centers)
{
    if (centers.size() > 1)
        return std::abs(centers[1] - centers[0]) * 0.5;
    return 0.5;
}

void emit_heatmap(std::ostringstream& svg, const HeatmapTrace& hm, const DataToSvg& m)
{
    const Eigen::Index rows = hm.z.rows();
    const Eigen::Index cols = hm.z.cols();
    if (rows == 0 || cols == 0)
        return;

    const Colorscale* scale = nullptr;
    if (hm.palette.empty())
        scale = &colorscale(hm.colorscale);

    const double hx = cell_half(hm.x);
    const double hy = cell_half(hm.y);

    svg << "    <g class=\"heatmap\"";
    if (!hm.name.empty())
        svg << " data-name=\"" << xml_escape(hm.name) << "\"";
    svg << " shape-rendering=\"crispEdges\">\n";

    for (Eigen::Index r = 0; r < rows; ++r)
    {
        const double cy = cell_center(hm.y, r);
        const double y0 = m.map_y(cy + hy);
        const double y1 = m.map_y(cy - hy);
        for (Eigen::Index c = 0; c < cols; ++c)
        {
            double v = hm.z(r, c);
            if (std::isnan(v))
                continue;

            Color fill;
            if (scale != nullptr)
            {
                fill = scale->map(v, hm.zmin, hm.zmax);
            }
            else
            {
                auto idx = static_cast<long>(v);
                if (idx < 0 || static_cast<size_t>(idx) >= hm.palette.size())
                    continue;
                fill = hm.palette[static_cast<size_t>(idx)];
            }

            const double cx = cell_center(hm.x, c);
            const double x0 = m.map_x(cx - hx);
            const double x1 = m.map_x(cx + hx);
            svg << "      <rect x=\"" << fmt(x0) << "\" y=\"" << fmt(y0) << "\" width=\""
                << fmt(x1 - x0) << "\" height=\"" << fmt(y1 - y0) << "\" fill=\""
                << svg_color(fill) << "\">";
            if (static_cast<size_t>(c) < hm.x_labels.size()
                && static_cast<size_t>(r) < hm.y_labels.size())
            {
                svg << "<title>" << xml_escape(hm.y_labels[static_cast<size_t>(r)]) << " / "
                    << xml_escape(hm.x_labels[static_cast<size_t>(c)]) << ": " << fmt(v)
                    << "</title>";
            }
            svg << "</rect>\n";
        }
    }
    svg << "    </g>\n";
}

// One <polyline> per run of finite points.
void emit_line(std::ostringstream& svg, const LineTrace& line, const DataToSvg& m)
{
    const size_t n = std::min(line.x.size(), line.y.size());
    if (n < 2)
        return;

    svg << "    <g class=\"line\"";
    if (!line.name.empty())
        svg << " data-name=\"" << xml_escape(line.name) << "\"";
    svg << " fill=\"none\" stroke=\"" << svg_color(line.color) << "\" stroke-width=\""
        << fmt(line.width) << "\" stroke-opacity=\"" << fmt(line.color.a) << "\"";
    if (line.dash == LineDash::Dot)
        svg << " stroke-dasharray=\"1,3\"";
    else if (line.dash == LineDash::Dash)
        svg << " stroke-dasharray=\"6,3\"";
    svg << ">\n";

    std::vector<std::pair<double, double>> run;
    size_t                                 run_start = 0;
    auto flush = [&]()
    {
        if (run.size() >= 2)
        {
            svg << "      <polyline points=\"";
            for (size_t i = 0; i < run.size(); ++i)
            {
                if (i > 0)
                    svg << " ";
                svg << fmt(run[i].first) << "," << fmt(run[i].second);
            }
            svg << "\"";
            if (run_start < line.text.size() && !line.text[run_start].empty())
                svg << "><title>" << xml_escape(line.text[run_start]) << "</title></polyline>\n";
            else
                svg << "/>\n";
        }
        run.clear();
    };

    for (size_t i = 0; i < n; ++i)
    {
        if (!std::isfinite(line.x[i]) || !std::isfinite(line.y[i]))
        {
            flush();
            continue;
        }
        if (run.empty())
            run_start = i;
        run.emplace_back(m.map_x(line.x[i]), m.map_y(line.y[i]));
    }
    flush();

    svg << "    </g>\n";
}

void emit_tick_labels(std::ostringstream& svg,
                      const Figure&       figure,
                      const Panel&        panel,
                      const DataToSvg&    m)
{
    constexpr float tick_len = 4.0f;
    const float     font     = figure.style.tick_font_size;

    svg << "    <g class=\"tick-labels\" font-family=\"sans-serif\" font-size=\"" << fmt(font)
        << "\" fill=\"#333\">\n";

    if (panel.draw_x_ticklabels)
    {
        const bool  top      = figure.x_side(panel.x_index) == Side::Top;
        const float edge     = top ? m.vp_y : m.vp_y + m.vp_h;
        const float dir      = top ? -1.0f : 1.0f;
        const bool  vertical = std::abs(panel.x_format.tick_angle) >= 45.0f;

        auto ticks = axis_ticks(panel.x_format, panel.x_min, panel.x_max);
        for (size_t i = 0; i < ticks.positions.size(); ++i)
        {
            double sx = m.map_x(ticks.positions[i]);
            svg << "      <line x1=\"" << fmt(sx) << "\" y1=\"" << fmt(edge) << "\" x2=\""
                << fmt(sx) << "\" y2=\"" << fmt(edge + dir * tick_len)
                << "\" stroke=\"#000\" stroke-width=\"1\"/>\n";

            double ly = edge + dir * (tick_len + 2.0f);
            if (vertical)
            {
                // Reads bottom-to-top, anchored at the axis
                const char* anchor = top ? "start" : "end";
                svg << "      <text x=\"" << fmt(sx) << "\" y=\"" << fmt(ly)
                    << "\" text-anchor=\"" << anchor << "\" dominant-baseline=\"middle\" "
                    << "transform=\"rotate(" << fmt(panel.x_format.tick_angle) << "," << fmt(sx)
                    << "," << fmt(ly) << ")\">" << xml_escape(ticks.labels[i]) << "</text>\n";
            }
            else
            {
                double ty = top ? ly : ly + font;
                svg << "      <text x=\"" << fmt(sx) << "\" y=\"" << fmt(ty)
                    << "\" text-anchor=\"middle\">" << xml_escape(ticks.labels[i])
                    << "</text>\n";
            }
        }
    }

    if (panel.draw_y_ticklabels)
    {
        const bool  right = figure.y_side(panel.y_index) == Side::Right;
        const float edge  = right ? m.vp_x + m.vp_w : m.vp_x;
        const float dir   = right ? 1.0f : -1.0f;

        auto ticks = axis_ticks(panel.y_format, panel.y_min, panel.y_max);
        for (size_t i = 0; i < ticks.positions.size(); ++i)
        {
            double sy = m.map_y(ticks.positions[i]);
            svg << "      <line x1=\"" << fmt(edge) << "\" y1=\"" << fmt(sy) << "\" x2=\""
                << fmt(edge + dir * tick_len) << "\" y2=\"" << fmt(sy)
                << "\" stroke=\"#000\" stroke-width=\"1\"/>\n";
            svg << "      <text x=\"" << fmt(edge + dir * (tick_len + 3.0f)) << "\" y=\""
                << fmt(sy + font * 0.35f) << "\" text-anchor=\"" << (right ? "start" : "end")
                << "\">" << xml_escape(ticks.labels[i]) << "</text>\n";
        }
    }

    svg << "    </g>\n";
}

void emit_axis_lines(std::ostringstream& svg,
                     const Figure&       figure,
                     const Panel&        panel,
                     const DataToSvg&    m)
{
    if (panel.x_format.show_line)
    {
        float y = figure.x_side(panel.x_index) == Side::Top ? m.vp_y : m.vp_y + m.vp_h;
        svg << "    <line x1=\"" << fmt(m.vp_x) << "\" y1=\"" << fmt(y) << "\" x2=\""
            << fmt(m.vp_x + m.vp_w) << "\" y2=\"" << fmt(y)
            << "\" stroke=\"#000\" stroke-width=\"1\"/>\n";
    }
    if (panel.y_format.show_line)
    {
        float x = figure.y_side(panel.y_index) == Side::Right ? m.vp_x + m.vp_w : m.vp_x;
        svg << "    <line x1=\"" << fmt(x) << "\" y1=\"" << fmt(m.vp_y) << "\" x2=\"" << fmt(x)
            << "\" y2=\"" << fmt(m.vp_y + m.vp_h) << "\" stroke=\"#000\" stroke-width=\"1\"/>\n";
    }
}

void emit_axis_titles(std::ostringstream& svg, const Panel& panel, const DataToSvg& m)
{
    constexpr float label_font = 12.0f;

    if (!panel.x_format.title.empty())
    {
        float cx = m.vp_x + m.vp_w * 0.5f;
        float ly = m.vp_y + m.vp_h + 30.0f;
        svg << "    <text x=\"" << fmt(cx) << "\" y=\"" << fmt(ly)
            << "\" text-anchor=\"middle\" font-family=\"sans-serif\" font-size=\""
            << fmt(label_font) << "\" fill=\"#333\">" << xml_escape(panel.x_format.title)
            << "</text>\n";
    }

    if (!panel.y_format.title.empty())
    {
        float cy = m.vp_y + m.vp_h * 0.5f;
        float lx = m.vp_x - 30.0f;
        svg << "    <text x=\"" << fmt(lx) << "\" y=\"" << fmt(cy)
            << "\" text-anchor=\"middle\" font-family=\"sans-serif\" font-size=\""
            << fmt(label_font) << "\" fill=\"#333\" transform=\"rotate(-90," << fmt(lx) << ","
            << fmt(cy) << ")\">" << xml_escape(panel.y_format.title) << "</text>\n";
    }
}

void emit_panel(std::ostringstream& svg, const Figure& figure, const Panel& panel)
{
    DataToSvg m;
    m.vp_x  = panel.viewport.x;
    m.vp_y  = panel.viewport.y;
    m.vp_w  = panel.viewport.w;
    m.vp_h  = panel.viewport.h;
    m.x_min = panel.x_min;
    m.x_max = panel.x_max;
    m.y_min = panel.y_min;
    m.y_max = panel.y_max;

    const std::string clip = clip_id(panel);

    svg << "  <g class=\"panel\" id=\"" << xml_escape(panel.id) << "\">\n";
    svg << "    <defs>\n";
    svg << "      <clipPath id=\"" << clip << "\">\n";
    svg << "        <rect x=\"" << fmt(m.vp_x) << "\" y=\"" << fmt(m.vp_y) << "\" width=\""
        << fmt(m.vp_w) << "\" height=\"" << fmt(m.vp_h) << "\"/>\n";
    svg << "      </clipPath>\n";
    svg << "    </defs>\n";

    svg << "    <rect x=\"" << fmt(m.vp_x) << "\" y=\"" << fmt(m.vp_y) << "\" width=\""
        << fmt(m.vp_w) << "\" height=\"" << fmt(m.vp_h) << "\" fill=\""
        << svg_color(figure.style.plot_background) << "\"/>\n";

    svg << "    <g clip-path=\"url(#" << clip << ")\">\n";
    for (const auto& trace : panel.traces)
    {
        if (const auto* hm = std::get_if<HeatmapTrace>(&trace))
            emit_heatmap(svg, *hm, m);
        else if (const auto* line = std::get_if<LineTrace>(&trace))
            emit_line(svg, *line, m);
    }
    svg << "    </g>\n";

    emit_axis_lines(svg, figure, panel, m);
    emit_tick_labels(svg, figure, panel, m);
    emit_axis_titles(svg, panel, m);

    svg << "  </g>\n";
}

}   // anonymous namespace

// ─── SvgExporter ────────────────────────────────────────────────────────────

std::string SvgExporter::to_string(const Figure& figure)
{
    const uint32_t w = figure.style.width;
    const uint32_t h = figure.style.height;

    std::ostringstream svg;
    svg << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    svg << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << w << "\" height=\"" << h
        << "\" viewBox=\"0 0 " << w << " " << h << "\">\n";

    svg << "  <rect width=\"100%\" height=\"100%\" fill=\"" << svg_color(figure.style.background)
        << "\"/>\n";

    if (!figure.style.title.empty())
    {
        svg << "  <text x=\"" << fmt(w * 0.5) << "\" y=\""
            << fmt(10.0f + figure.style.title_font_size)
            << "\" text-anchor=\"middle\" font-family=\"sans-serif\" font-size=\""
            << fmt(figure.style.title_font_size) << "\" font-weight=\"bold\" fill=\"#000\">"
            << xml_escape(figure.style.title) << "</text>\n";
    }

    for (const auto& panel : figure.panels)
    {
        emit_panel(svg, figure, panel);
    }

    svg << "</svg>\n";
    return svg.str();
}

bool SvgExporter::write_svg(const std::string& path, const Figure& figure)
{
    std::string content = to_string(figure);

    std::ofstream file(path);
    if (!file.is_open())
    {
        GIGMAP_LOG_ERROR("export", "Cannot open '{}' for writing", path);
        return false;
    }

    file << content;
    return file.good();
}

}   // namespace gigmap
