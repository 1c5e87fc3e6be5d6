#pragma once

#include <gigmap/element.hpp>
#include <gigmap/elements/heatmap.hpp>
#include <string>

namespace gigmap
{

// Horizontal color key for a heatmap: one strip of steps cells spanning the
// heatmap's value range with its colorscale and zmin.
class ColorbarElement : public Element
{
   public:
    ColorbarElement(std::string           id,
                    const HeatmapElement& heatmap,
                    int                   x_index,
                    int                   y_index,
                    std::string           label,
                    size_t                steps = 100);

    ReadResult read(ReadContext& ctx) override;
    void       plot(PlotContext& ctx) override;

    const std::string& label() const { return label_; }

   private:
    const HeatmapElement& heatmap_;
    int                   x_index_;
    int                   y_index_;
    std::string           label_;
    size_t                steps_;
};

}   // namespace gigmap
