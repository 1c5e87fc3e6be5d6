#include <algorithm>
#include <charconv>
#include <cmath>
#include <gigmap/aggregate.hpp>
#include <gigmap/error.hpp>
#include <gigmap/logger.hpp>
#include <limits>
#include <map>
#include <sstream>
#include <unordered_map>

namespace gigmap
{

namespace
{

std::string with_thousands(double value)
{
    if (!std::isfinite(value))
        return format_number(value);
    const long long   v      = std::llround(value);
    const std::string digits = std::to_string(v < 0 ? -v : v);
    std::string       out;
    for (size_t i = 0; i < digits.size(); ++i)
    {
        if (i > 0 && (digits.size() - i) % 3 == 0)
            out += ',';
        out += digits[i];
    }
    return v < 0 ? "-" + out : out;
}

std::string join_lines(const std::vector<std::string>& items)
{
    std::string out;
    for (const auto& item : items)
    {
        out += item;
        out += '\n';
    }
    return out;
}

std::string serialize(const Table& table)
{
    std::ostringstream out;
    write_table(out, table);
    return out.str();
}

struct Group
{
    double                   pident   = std::numeric_limits<double>::quiet_NaN();
    double                   coverage = std::numeric_limits<double>::quiet_NaN();
    std::vector<std::string> lines;
};

// NaN-skipping maximum.
void keep_max(double& current, double candidate)
{
    if (std::isnan(candidate))
        return;
    if (std::isnan(current) || candidate > current)
        current = candidate;
}

}   // namespace

// ─── Formatting ─────────────────────────────────────────────────────────────

std::string format_number(double value)
{
    if (std::isnan(value))
        return {};
    if (std::isinf(value))
        return value > 0 ? "inf" : "-inf";

    char buf[64];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc())
        return std::to_string(value);
    std::string out(buf, end);
    if (out.find_first_of(".e") == std::string::npos)
        out += ".0";
    return out;
}

std::string format_alignment(const std::string& qseqid,
                             double             qstart,
                             double             qend,
                             double             pident,
                             double             coverage)
{
    return qseqid + ": " + with_thousands(qstart) + " - " + with_thousands(qend) + "; "
           + format_number(pident) + "% identity / " + format_number(coverage) + "% coverage";
}

// ─── Aggregation ────────────────────────────────────────────────────────────

AggregateSummary aggregate_results(const AggregateOptions& options, KeyValueStore& store)
{
    if (options.dists_n_rows == 0)
        throw ConfigError("--dists-n-rows must be at least 1");

    GIGMAP_LOG_INFO("aggregate", "Reading from {}", options.alignments);
    const Table raw = read_table(options.alignments);
    if (raw.row_count() == 0)
        throw DataError(options.alignments + " contains no alignments");

    const auto& qseqid = raw.column("qseqid");
    const auto& sseqid = raw.column("sseqid");
    const auto& genome = raw.column("genome");
    const auto  pident = raw.numeric_column("pident");
    const auto  qstart = raw.numeric_column("qstart");
    const auto  qend   = raw.numeric_column("qend");
    const auto  sstart = raw.numeric_column("sstart");
    const auto  send   = raw.numeric_column("send");
    const auto  slen   = raw.numeric_column("slen");

    // One group per (gene, genome), sorted by gene then genome.
    std::map<std::pair<std::string, std::string>, Group> groups;
    for (size_t r = 0; r < raw.row_count(); ++r)
    {
        const double coverage = 100.0 * (send[r] - sstart[r] + 1.0) / slen[r];
        Group&       g        = groups[{sseqid[r], genome[r]}];
        keep_max(g.pident, pident[r]);
        keep_max(g.coverage, coverage);
        g.lines.push_back(format_alignment(qseqid[r], qstart[r], qend[r], pident[r], coverage));
    }

    std::vector<std::string>                genome_list;
    std::unordered_map<std::string, size_t> genome_ix;
    for (const auto& [key, group] : groups)
    {
        if (genome_ix.emplace(key.second, genome_list.size()).second)
            genome_list.push_back(key.second);
    }
    GIGMAP_LOG_INFO("aggregate", "Read in a list of {} genomes", genome_list.size());

    GIGMAP_LOG_INFO("aggregate", "Reading from {}", options.tsne_coords);
    const Table tsne = read_table_indexed(options.tsne_coords);
    GIGMAP_LOG_INFO("aggregate",
                    "Read in {} rows and {} columns",
                    tsne.row_count(),
                    tsne.column_count());

    GIGMAP_LOG_INFO("aggregate", "Reading from {}", options.dists);
    const Table          dists_table = read_table_indexed(options.dists);
    const LabelledMatrix all_dists   = numeric_matrix(dists_table);
    GIGMAP_LOG_INFO("aggregate",
                    "Read in {} rows and {} columns",
                    all_dists.rows(),
                    all_dists.cols());
    const LabelledMatrix dists = all_dists.reindexed(genome_list, genome_list);

    const std::vector<std::string> gene_list = read_lines(options.gene_order);
    GIGMAP_LOG_INFO("aggregate", "Read in a list of {} genes", gene_list.size());
    std::unordered_map<std::string, size_t> gene_ix;
    for (size_t i = 0; i < gene_list.size(); ++i)
        gene_ix.emplace(gene_list[i], i);

    Table condensed({"pident", "coverage", "description", "gene_ix", "genome_ix"}, "alignments");
    for (const auto& [key, group] : groups)
    {
        auto gene = gene_ix.find(key.first);
        if (gene == gene_ix.end())
        {
            throw DataError("gene '" + key.first + "' from " + options.alignments
                            + " is not listed in " + options.gene_order);
        }
        std::string description;
        for (size_t i = 0; i < group.lines.size(); ++i)
        {
            if (i > 0)
                description += '\n';
            description += group.lines[i];
        }
        condensed.add_row({format_number(group.pident),
                           format_number(group.coverage),
                           description,
                           std::to_string(gene->second),
                           std::to_string(genome_ix.at(key.second))});
    }

    GIGMAP_LOG_INFO("aggregate", "Saving alignments");
    store.put("alignments", serialize(condensed));
    store.put("gene_ix", join_lines(gene_list));
    store.put("genome_ix", join_lines(genome_list));

    std::vector<std::string> dists_keys;
    for (size_t start = 0; start < dists.rows(); start += options.dists_n_rows)
    {
        const size_t stop = std::min(dists.rows(), start + options.dists_n_rows);
        Table        chunk(dists.col_labels, "distances");
        chunk.set_index(dists_table.index_name());
        for (size_t r = start; r < stop; ++r)
        {
            std::vector<std::string> cells;
            cells.reserve(dists.cols());
            for (size_t c = 0; c < dists.cols(); ++c)
                cells.push_back(format_number(
                    dists.values(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c))));
            chunk.add_row(dists.row_labels[r], std::move(cells));
        }
        const std::string key = "distances_" + std::to_string(dists_keys.size());
        store.put(key, serialize(chunk));
        dists_keys.push_back(key);
        GIGMAP_LOG_INFO("aggregate", "Wrote {} chunks of distances", dists_keys.size());
    }
    store.put("distances_keys", join_lines(dists_keys));

    GIGMAP_LOG_INFO("aggregate", "Saving tsne");
    store.put("tsne", serialize(tsne));

    AggregateSummary summary;
    summary.alignments      = condensed.row_count();
    summary.genes           = gene_list.size();
    summary.genomes         = genome_list.size();
    summary.distance_chunks = dists_keys.size();
    return summary;
}

// ─── Reading back ───────────────────────────────────────────────────────────

std::vector<std::string> read_list(const KeyValueStore& store, const std::string& key)
{
    auto value = store.get(key);
    if (!value)
        throw DataError("store has no key '" + key + "'");

    std::vector<std::string> out;
    std::istringstream       in(*value);
    std::string              line;
    while (std::getline(in, line))
    {
        if (!line.empty())
            out.push_back(line);
    }
    return out;
}

Table read_stored_table(const KeyValueStore& store, const std::string& key, bool indexed)
{
    auto value = store.get(key);
    if (!value)
        throw DataError("store has no key '" + key + "'");
    std::istringstream in(*value);
    return parse_table(in, key, indexed);
}

LabelledMatrix read_distances(const KeyValueStore& store)
{
    LabelledMatrix              out;
    std::vector<LabelledMatrix> chunks;
    size_t                      rows = 0;
    for (const auto& key : read_list(store, "distances_keys"))
    {
        chunks.push_back(numeric_matrix(read_stored_table(store, key, true)));
        if (chunks.size() > 1 && chunks.back().col_labels != chunks.front().col_labels)
            throw DataError("distance chunk '" + key + "' has different columns than the first chunk");
        rows += chunks.back().rows();
    }
    if (chunks.empty())
        return out;

    out.col_labels = chunks.front().col_labels;
    out.values.resize(static_cast<Eigen::Index>(rows), static_cast<Eigen::Index>(out.cols()));
    Eigen::Index offset = 0;
    for (const auto& chunk : chunks)
    {
        out.values.middleRows(offset, static_cast<Eigen::Index>(chunk.rows())) = chunk.values;
        offset += static_cast<Eigen::Index>(chunk.rows());
        out.row_labels.insert(out.row_labels.end(), chunk.row_labels.begin(), chunk.row_labels.end());
    }
    return out;
}

}   // namespace gigmap
