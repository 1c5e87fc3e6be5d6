#pragma once

#include <gigmap/labelled_matrix.hpp>
#include <gigmap/store.hpp>
#include <gigmap/table.hpp>
#include <string>
#include <vector>

namespace gigmap
{

struct AggregateOptions
{
    std::string alignments;    // CSV of gene alignments across genomes
    std::string gene_order;    // gene ids, one per line, ordered by similarity
    std::string dists;         // square genome distance table
    std::string tsne_coords;   // per-gene t-SNE coordinates
    size_t      dists_n_rows = 1000;
};

struct AggregateSummary
{
    size_t alignments      = 0;   // condensed (gene, genome) rows
    size_t genes           = 0;
    size_t genomes         = 0;
    size_t distance_chunks = 0;
};

/**
 * Condense alignment results for fast display and write them to `store`.
 *
 * Keys written:
 *   alignments      CSV: pident, coverage, description, gene_ix, genome_ix
 *   gene_ix         gene ids, one per line, position = gene_ix
 *   genome_ix       genome ids in first-seen order, position = genome_ix
 *   distances_{n}   CSV chunks of at most dists_n_rows rows of the
 *                   genome x genome distance table
 *   distances_keys  the chunk keys, one per line, in row order
 *   tsne            CSV of the t-SNE coordinates
 *
 * Throws DataError for a missing column, a gene absent from the gene order
 * or an alignment table without rows, and ConfigError for dists_n_rows == 0.
 */
AggregateSummary aggregate_results(const AggregateOptions& options, KeyValueStore& store);

// One alignment summary line, e.g.
// "contig_1: 1,200 - 2,400; 98.5% identity / 100.0% coverage".
std::string format_alignment(const std::string& qseqid,
                             double             qstart,
                             double             qend,
                             double             pident,
                             double             coverage);

// Shortest text that reads back as the same double; integral values keep a
// trailing ".0". NaN is written as an empty string.
std::string format_number(double value);

// Values stored as one entry per line.
std::vector<std::string> read_list(const KeyValueStore& store, const std::string& key);
// A stored CSV table. Throws DataError when the key is absent.
Table read_stored_table(const KeyValueStore& store, const std::string& key, bool indexed);
// The distance table reassembled from its chunks.
LabelledMatrix read_distances(const KeyValueStore& store);

}   // namespace gigmap
