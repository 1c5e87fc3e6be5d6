#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace gigmap
{

struct Color
{
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    constexpr Color() = default;
    constexpr Color(float r, float g, float b, float a = 1.0f) : r(r), g(g), b(b), a(a) {}
};

inline constexpr Color rgb(float r, float g, float b)
{
    return Color{r, g, b, 1.0f};
}

inline constexpr Color rgb8(int r, int g, int b)
{
    return Color{static_cast<float>(r) / 255.0f,
                 static_cast<float>(g) / 255.0f,
                 static_cast<float>(b) / 255.0f,
                 1.0f};
}

namespace colors
{
inline constexpr Color black{0.0f, 0.0f, 0.0f};
inline constexpr Color white{1.0f, 1.0f, 1.0f};
inline constexpr Color gray{0.5f, 0.5f, 0.5f};
inline constexpr Color light_gray{0.85f, 0.85f, 0.85f};
}   // namespace colors

// Qualitative palette for categorical annotation strips (10 visually distinct colors)
namespace palette
{
inline constexpr Color default_cycle[] = {
    {0.122f, 0.467f, 0.706f},   // steel blue
    {1.000f, 0.498f, 0.055f},   // orange
    {0.173f, 0.627f, 0.173f},   // green
    {0.839f, 0.153f, 0.157f},   // red
    {0.580f, 0.404f, 0.741f},   // purple
    {0.549f, 0.337f, 0.294f},   // brown
    {0.890f, 0.467f, 0.761f},   // pink
    {0.498f, 0.498f, 0.498f},   // gray
    {0.737f, 0.741f, 0.133f},   // olive
    {0.090f, 0.745f, 0.812f},   // cyan
};
inline constexpr size_t default_cycle_size = sizeof(default_cycle) / sizeof(default_cycle[0]);
}   // namespace palette

struct ColorStop
{
    double position = 0.0;   // 0..1
    Color  color;
};

// A continuous color map sampled by linear interpolation between stops.
class Colorscale
{
   public:
    Colorscale(std::string name, std::vector<ColorStop> stops);

    const std::string&            name() const { return name_; }
    const std::vector<ColorStop>& stops() const { return stops_; }

    // t is clamped to [0, 1].
    Color sample(double t) const;

    // Map a value within [zmin, zmax]; a degenerate range maps to the top stop.
    Color map(double value, double zmin, double zmax) const;

   private:
    std::string            name_;
    std::vector<ColorStop> stops_;
};

// Built-in scales: "blues", "reds", "greens", "greys", "viridis".
// Throws ConfigError for an unknown name.
const Colorscale& colorscale(std::string_view name);

bool                     has_colorscale(std::string_view name);
std::vector<std::string> colorscale_names();

}   // namespace gigmap
