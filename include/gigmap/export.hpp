#pragma once

#include <gigmap/canvas.hpp>
#include <string>

namespace gigmap
{

// Vector export of a laid-out figure. Call Canvas::figure() first so panel
// viewports and ranges are resolved.
class SvgExporter
{
   public:
    static std::string to_string(const Figure& figure);

    // Returns false if the file could not be written.
    static bool write_svg(const std::string& path, const Figure& figure);
};

}   // namespace gigmap
