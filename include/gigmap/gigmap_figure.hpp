#pragma once

#include <gigmap/builder.hpp>
#include <string>

namespace gigmap
{

class AnnotationElement;
class ColorbarElement;
class HeatmapElement;
class TreeElement;

/**
 * GigMapFigure — the gene x genome composite figure.
 *
 * Elements, in read order:
 *   genomeAnnot     genome labels / order / color strip   (2, 0)
 *   geneAnnot       gene labels / order / color strip     (1, -1)
 *   genomeTree      neighbor-joining tree of genomes      (0, 0)
 *   genomeHeatmap   percent identity, gene x genome       (1, 0)
 *   genomeColorbar  key for the heatmap                   (1, -2)
 *
 * Global arguments: output-prefix, output-folder, title, width, height.
 */
class GigMapFigure : public Builder
{
   public:
    GigMapFigure();

    // "{output-folder}/{output-prefix}.svg". Valid once arguments are parsed.
    std::string output_path() const;

    const AnnotationElement& genome_annotation() const;
    const AnnotationElement& gene_annotation() const;
    const TreeElement&       genome_tree() const;
    const HeatmapElement&    genome_heatmap() const;
    const ColorbarElement&   genome_colorbar() const;

   protected:
    void read_global(const ParamMap& global, AxisRegistry& axes) override;
    void plot_global(const ParamMap& global, Canvas& canvas) override;
};

}   // namespace gigmap
