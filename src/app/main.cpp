// gigmap-render: compose the gene x genome figure and write it as SVG.

#include <exception>
#include <filesystem>
#include <gigmap/canvas.hpp>
#include <gigmap/command_line.hpp>
#include <gigmap/export.hpp>
#include <gigmap/gigmap_figure.hpp>
#include <gigmap/logger.hpp>
#include <iostream>

int main(int argc, char* argv[])
{
    using namespace gigmap;

    Logger::instance().add_sink(sinks::console_sink());
    try
    {
        CommandLine cmd = parse_command_line(argc, argv);
        configure_logging(cmd);

        GigMapFigure figure;
        if (cmd.help)
        {
            std::cout << figure.usage("gigmap-render")
                      << "\nTool options:\n"
                         "  --params <file>\n      JSON object of default argument values\n"
                         "  --log-level <trace|debug|info|warn|error|critical>\n"
                         "  --log-file <path>\n";
            return 0;
        }

        SubplotCanvas canvas;
        figure.run(cmd.params, canvas);

        const std::string path = figure.output_path();
        const auto        dir  = std::filesystem::path(path).parent_path();
        if (!dir.empty())
            std::filesystem::create_directories(dir);

        if (!SvgExporter::write_svg(path, canvas.figure()))
            return 1;
        GIGMAP_LOG_INFO("app", "Wrote {}", path);
    }
    catch (const std::exception& e)
    {
        GIGMAP_LOG_CRITICAL("app", "{}", e.what());
        return 1;
    }
    return 0;
}
