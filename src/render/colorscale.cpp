#include <algorithm>
#include <cmath>
#include <gigmap/color.hpp>
#include <gigmap/error.hpp>

namespace gigmap
{

Colorscale::Colorscale(std::string name, std::vector<ColorStop> stops)
    : name_(std::move(name)), stops_(std::move(stops))
{
    std::stable_sort(stops_.begin(),
                     stops_.end(),
                     [](const ColorStop& a, const ColorStop& b) { return a.position < b.position; });
}

Color Colorscale::sample(double t) const
{
    if (stops_.empty())
        return colors::black;
    if (!std::isfinite(t))
        t = 0.0;
    t = std::clamp(t, 0.0, 1.0);

    if (t <= stops_.front().position)
        return stops_.front().color;
    if (t >= stops_.back().position)
        return stops_.back().color;

    for (size_t i = 1; i < stops_.size(); ++i)
    {
        const auto& hi = stops_[i];
        if (t > hi.position)
            continue;
        const auto& lo   = stops_[i - 1];
        double      span = hi.position - lo.position;
        float       f    = span > 0.0 ? static_cast<float>((t - lo.position) / span) : 1.0f;
        return Color{lo.color.r + (hi.color.r - lo.color.r) * f,
                     lo.color.g + (hi.color.g - lo.color.g) * f,
                     lo.color.b + (hi.color.b - lo.color.b) * f,
                     lo.color.a + (hi.color.a - lo.color.a) * f};
    }
    return stops_.back().color;
}

Color Colorscale::map(double value, double zmin, double zmax) const
{
    double range = zmax - zmin;
    if (range <= 0.0)
        return sample(1.0);
    return sample((value - zmin) / range);
}

namespace
{

std::vector<ColorStop> even_stops(std::initializer_list<Color> colors)
{
    std::vector<ColorStop> stops;
    double                 n = static_cast<double>(colors.size() - 1);
    size_t                 i = 0;
    for (const auto& c : colors)
    {
        stops.push_back({static_cast<double>(i++) / n, c});
    }
    return stops;
}

// ColorBrewer sequential schemes and matplotlib's viridis.
const std::vector<Colorscale>& builtin_scales()
{
    static const std::vector<Colorscale> scales = {
        Colorscale("blues",
                   even_stops({rgb8(247, 251, 255),
                               rgb8(222, 235, 247),
                               rgb8(198, 219, 239),
                               rgb8(158, 202, 225),
                               rgb8(107, 174, 214),
                               rgb8(66, 146, 198),
                               rgb8(33, 113, 181),
                               rgb8(8, 81, 156),
                               rgb8(8, 48, 107)})),
        Colorscale("reds",
                   even_stops({rgb8(255, 245, 240),
                               rgb8(254, 224, 210),
                               rgb8(252, 187, 161),
                               rgb8(252, 146, 114),
                               rgb8(251, 106, 74),
                               rgb8(239, 59, 44),
                               rgb8(203, 24, 29),
                               rgb8(165, 15, 21),
                               rgb8(103, 0, 13)})),
        Colorscale("greens",
                   even_stops({rgb8(247, 252, 245),
                               rgb8(229, 245, 224),
                               rgb8(199, 233, 192),
                               rgb8(161, 217, 155),
                               rgb8(116, 196, 118),
                               rgb8(65, 171, 93),
                               rgb8(35, 139, 69),
                               rgb8(0, 109, 44),
                               rgb8(0, 68, 27)})),
        Colorscale("greys",
                   even_stops({rgb8(255, 255, 255),
                               rgb8(240, 240, 240),
                               rgb8(217, 217, 217),
                               rgb8(189, 189, 189),
                               rgb8(150, 150, 150),
                               rgb8(115, 115, 115),
                               rgb8(82, 82, 82),
                               rgb8(37, 37, 37),
                               rgb8(0, 0, 0)})),
        Colorscale("viridis",
                   even_stops({rgb8(68, 1, 84),
                               rgb8(72, 40, 120),
                               rgb8(62, 74, 137),
                               rgb8(49, 104, 142),
                               rgb8(38, 130, 142),
                               rgb8(31, 158, 137),
                               rgb8(53, 183, 121),
                               rgb8(109, 205, 89),
                               rgb8(180, 222, 44),
                               rgb8(253, 231, 37)})),
    };
    return scales;
}

}   // namespace

const Colorscale& colorscale(std::string_view name)
{
    for (const auto& scale : builtin_scales())
    {
        if (scale.name() == name)
            return scale;
    }
    throw ConfigError("unknown colorscale '" + std::string(name) + "'");
}

bool has_colorscale(std::string_view name)
{
    const auto& scales = builtin_scales();
    return std::any_of(scales.begin(),
                       scales.end(),
                       [&](const Colorscale& s) { return s.name() == name; });
}

std::vector<std::string> colorscale_names()
{
    std::vector<std::string> names;
    for (const auto& scale : builtin_scales())
        names.push_back(scale.name());
    return names;
}

}   // namespace gigmap
