// gigmap-aggregate: condense alignment results into a directory store.

#include <exception>
#include <gigmap/aggregate.hpp>
#include <gigmap/command_line.hpp>
#include <gigmap/error.hpp>
#include <gigmap/logger.hpp>
#include <iostream>
#include <variant>

namespace
{

const char* usage_text =
    "Usage: gigmap-aggregate --alignments <csv> --gene-order <txt[.gz]> --dists <csv>\n"
    "                        --tsne-coords <csv> --output-dir <dir> [--dists-n-rows <n>]\n"
    "\n"
    "  --alignments     Alignments of genes across genomes (CSV)\n"
    "  --gene-order     Gene ids ordered by presence across genomes, one per line\n"
    "  --dists          Pairwise distances between all genomes (CSV)\n"
    "  --tsne-coords    t-SNE coordinates for all genes (CSV)\n"
    "  --output-dir     Directory receiving one file per stored key\n"
    "  --dists-n-rows   Rows per chunk of distances (default: 1000)\n"
    "  --log-level, --log-file, --params as for gigmap-render\n";

std::string required(const gigmap::RawParams& params, const std::string& key)
{
    auto it = params.find(key);
    if (it == params.end() || it->second.empty())
        throw gigmap::ConfigError("missing required argument --" + key);
    return it->second;
}

}   // namespace

int main(int argc, char* argv[])
{
    using namespace gigmap;

    Logger::instance().add_sink(sinks::console_sink());
    try
    {
        CommandLine cmd = parse_command_line(argc, argv);
        configure_logging(cmd);
        if (cmd.help)
        {
            std::cout << usage_text;
            return 0;
        }

        const RawParams& params = cmd.params;
        Argument         n_rows_arg("dists-n-rows", "Rows per chunk of distances", ArgType::Integer, ArgValue{1000LL});

        AggregateOptions options;
        options.alignments  = required(params, "alignments");
        options.gene_order  = required(params, "gene-order");
        options.dists       = required(params, "dists");
        options.tsne_coords = required(params, "tsne-coords");
        const std::string output_dir = required(params, "output-dir");

        if (auto it = params.find("dists-n-rows"); it != params.end())
        {
            const long long n = std::get<long long>(n_rows_arg.parse(it->second, "dists-n-rows"));
            if (n < 1)
                throw ConfigError("--dists-n-rows must be at least 1");
            options.dists_n_rows = static_cast<size_t>(n);
        }

        for (const auto& [key, value] : params)
        {
            if (key != "alignments" && key != "gene-order" && key != "dists" && key != "tsne-coords"
                && key != "output-dir" && key != "dists-n-rows")
                throw ConfigError("unrecognized argument --" + key);
        }

        DirectoryStore   store(output_dir);
        AggregateSummary summary = aggregate_results(options, store);
        GIGMAP_LOG_INFO("app",
                        "Stored {} alignments, {} genes, {} genomes and {} distance chunks in {}",
                        summary.alignments,
                        summary.genes,
                        summary.genomes,
                        summary.distance_chunks,
                        output_dir);
    }
    catch (const std::exception& e)
    {
        GIGMAP_LOG_CRITICAL("app", "{}", e.what());
        return 1;
    }
    return 0;
}
