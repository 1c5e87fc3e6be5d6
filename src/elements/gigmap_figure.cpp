#include <filesystem>
#include <gigmap/canvas.hpp>
#include <gigmap/elements/annotation.hpp>
#include <gigmap/elements/colorbar.hpp>
#include <gigmap/elements/heatmap.hpp>
#include <gigmap/elements/tree.hpp>
#include <gigmap/error.hpp>
#include <gigmap/gigmap_figure.hpp>
#include <gigmap/logger.hpp>

namespace gigmap
{

namespace
{

std::vector<Argument> figure_arguments()
{
    return {
        Argument("output-prefix",
                 "Name of the rendered file, without extension",
                 ArgType::String,
                 ArgValue{std::string("gigmap-render")}),
        Argument("output-folder",
                 "Directory the rendered file is written to",
                 ArgType::String,
                 ArgValue{std::string("./")}),
        Argument("title", "Figure title"),
        Argument("width", "Figure width in pixels", ArgType::Integer, ArgValue{1200LL}),
        Argument("height", "Figure height in pixels", ArgType::Integer, ArgValue{800LL}),
    };
}

std::vector<std::unique_ptr<Element>> figure_elements()
{
    std::vector<std::unique_ptr<Element>> elements;
    elements.push_back(
        std::make_unique<AnnotationElement>("genomeAnnot", "genome", StripOrientation::Vertical, 2, 0));
    elements.push_back(
        std::make_unique<AnnotationElement>("geneAnnot", "gene", StripOrientation::Horizontal, 1, -1));
    elements.push_back(std::make_unique<TreeElement>("genomeTree", "genome", 0, 0));

    auto heatmap = std::make_unique<HeatmapElement>("genomeHeatmap", HeatmapAxes{}, 1, 0);
    auto colorbar =
        std::make_unique<ColorbarElement>("genomeColorbar", *heatmap, 1, -2, "Percent Identity");
    elements.push_back(std::move(heatmap));
    elements.push_back(std::move(colorbar));
    return elements;
}

template <typename T>
const T& element_as(const Builder& builder, const std::string& id)
{
    return static_cast<const T&>(*builder.element(id));
}

}   // namespace

GigMapFigure::GigMapFigure() : Builder(figure_arguments(), figure_elements(), "gig-map-render") {}

std::string GigMapFigure::output_path() const
{
    const ParamMap& global = params(global_namespace);
    std::filesystem::path folder(*global.get_string("output-folder"));
    return (folder / (*global.get_string("output-prefix") + ".svg")).string();
}

const AnnotationElement& GigMapFigure::genome_annotation() const
{
    return element_as<AnnotationElement>(*this, "genomeAnnot");
}

const AnnotationElement& GigMapFigure::gene_annotation() const
{
    return element_as<AnnotationElement>(*this, "geneAnnot");
}

const TreeElement& GigMapFigure::genome_tree() const
{
    return element_as<TreeElement>(*this, "genomeTree");
}

const HeatmapElement& GigMapFigure::genome_heatmap() const
{
    return element_as<HeatmapElement>(*this, "genomeHeatmap");
}

const ColorbarElement& GigMapFigure::genome_colorbar() const
{
    return element_as<ColorbarElement>(*this, "genomeColorbar");
}

void GigMapFigure::read_global(const ParamMap& global, AxisRegistry&)
{
    for (const char* key : {"width", "height"})
    {
        const long long v = *global.get_int(key);
        if (v < 1 || v > 100000)
            throw ConfigError(std::string("--") + key + " must be between 1 and 100000, got "
                              + std::to_string(v));
    }
}

void GigMapFigure::plot_global(const ParamMap& global, Canvas& canvas)
{
    LayoutUpdate update;
    update.width           = static_cast<uint32_t>(*global.get_int("width"));
    update.height          = static_cast<uint32_t>(*global.get_int("height"));
    update.background      = colors::white;
    update.plot_background = colors::white;
    if (auto title = global.get_string("title"))
        update.title = *title;
    canvas.update_layout(update);
    GIGMAP_LOG_DEBUG(log_id(), "Figure layout {}x{}", *update.width, *update.height);
}

}   // namespace gigmap
