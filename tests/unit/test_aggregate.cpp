#include <cmath>
#include <gigmap/aggregate.hpp>
#include <gigmap/error.hpp>
#include <gigmap/store.hpp>
#include <gtest/gtest.h>
#include <limits>
#include <string>

#include "util/temp_files.hpp"

using namespace gigmap;

// ─── Formatting ─────────────────────────────────────────────────────────────

TEST(FormatNumber, IntegralValuesKeepDecimalPoint)
{
    EXPECT_EQ(format_number(1.0), "1.0");
    EXPECT_EQ(format_number(100.0), "100.0");
    EXPECT_EQ(format_number(-3.0), "-3.0");
}

TEST(FormatNumber, ShortestRoundTrip)
{
    EXPECT_EQ(format_number(98.5), "98.5");
    EXPECT_EQ(format_number(0.1), "0.1");
    EXPECT_EQ(std::stod(format_number(1.0 / 3.0)), 1.0 / 3.0);
}

TEST(FormatNumber, NonFiniteValues)
{
    EXPECT_EQ(format_number(std::numeric_limits<double>::quiet_NaN()), "");
    EXPECT_EQ(format_number(std::numeric_limits<double>::infinity()), "inf");
    EXPECT_EQ(format_number(-std::numeric_limits<double>::infinity()), "-inf");
}

TEST(FormatAlignment, ThousandsSeparators)
{
    EXPECT_EQ(format_alignment("contig_1", 1200, 2400, 98.5, 100.0),
              "contig_1: 1,200 - 2,400; 98.5% identity / 100.0% coverage");
    EXPECT_EQ(format_alignment("q", 1234567, 999, 50.25, 12.5),
              "q: 1,234,567 - 999; 50.25% identity / 12.5% coverage");
}

// ─── aggregate_results ──────────────────────────────────────────────────────

class AggregateTest : public ::testing::Test
{
   protected:
    test::TempDir    dir;
    AggregateOptions options;

    void SetUp() override
    {
        options.alignments =
            dir.write("alignments.csv",
                      "qseqid,sseqid,genome,pident,qstart,qend,sstart,send,slen\n"
                      "contig_1,geneA,g2,98.5,1200,2400,1,1000,1000\n"
                      "contig_2,geneA,g2,90,5000,6000,1,500,1000\n"
                      "contig_3,geneB,g1,100,1,300,1,300,300\n"
                      "contig_4,geneA,g1,80,10,20,1,250,1000\n");
        options.gene_order  = dir.write("gene_order.txt", "geneB\ngeneA\n");
        options.dists       = dir.write("dists.csv",
                                  "genome,g1,g2,g3\n"
                                  "g1,0,0.1,0.5\n"
                                  "g2,0.1,0,0.4\n"
                                  "g3,0.5,0.4,0\n");
        options.tsne_coords = dir.write("tsne.csv", "gene,x,y\ngeneA,1.5,2\ngeneB,-1,0.25\n");
    }
};

TEST_F(AggregateTest, SummaryCountsGroups)
{
    MemoryStore store;
    auto        summary = aggregate_results(options, store);
    EXPECT_EQ(summary.alignments, 3u);
    EXPECT_EQ(summary.genes, 2u);
    EXPECT_EQ(summary.genomes, 2u);
    EXPECT_EQ(summary.distance_chunks, 1u);
    EXPECT_EQ(store.keys(),
              (std::vector<std::string>{
                  "alignments", "distances_0", "distances_keys", "gene_ix", "genome_ix", "tsne"}));
}

TEST_F(AggregateTest, IndexListsFollowGeneOrderAndGroupOrder)
{
    MemoryStore store;
    aggregate_results(options, store);
    EXPECT_EQ(read_list(store, "gene_ix"), (std::vector<std::string>{"geneB", "geneA"}));
    // Groups are sorted by gene, then genome, so g1 is seen first.
    EXPECT_EQ(read_list(store, "genome_ix"), (std::vector<std::string>{"g1", "g2"}));
}

TEST_F(AggregateTest, CondensedRowsKeepBestValues)
{
    MemoryStore store;
    aggregate_results(options, store);

    Table table = read_stored_table(store, "alignments", false);
    EXPECT_EQ(table.columns(),
              (std::vector<std::string>{"pident", "coverage", "description", "gene_ix", "genome_ix"}));
    ASSERT_EQ(table.row_count(), 3u);

    // (geneA, g1), (geneA, g2), (geneB, g1)
    EXPECT_EQ(table.column("pident"), (std::vector<std::string>{"80.0", "98.5", "100.0"}));
    EXPECT_EQ(table.column("coverage"), (std::vector<std::string>{"25.0", "100.0", "100.0"}));
    EXPECT_EQ(table.column("gene_ix"), (std::vector<std::string>{"1", "1", "0"}));
    EXPECT_EQ(table.column("genome_ix"), (std::vector<std::string>{"0", "1", "0"}));
    EXPECT_EQ(table.column("description")[1],
              "contig_1: 1,200 - 2,400; 98.5% identity / 100.0% coverage\n"
              "contig_2: 5,000 - 6,000; 90.0% identity / 50.0% coverage");
}

TEST_F(AggregateTest, DistancesAreChunkedAndReassembled)
{
    options.dists_n_rows = 1;
    MemoryStore store;
    auto        summary = aggregate_results(options, store);
    EXPECT_EQ(summary.distance_chunks, 2u);
    EXPECT_EQ(read_list(store, "distances_keys"),
              (std::vector<std::string>{"distances_0", "distances_1"}));

    LabelledMatrix dists = read_distances(store);
    EXPECT_EQ(dists.row_labels, (std::vector<std::string>{"g1", "g2"}));
    EXPECT_EQ(dists.col_labels, (std::vector<std::string>{"g1", "g2"}));
    EXPECT_DOUBLE_EQ(dists.values(0, 1), 0.1);
    EXPECT_DOUBLE_EQ(dists.values(1, 1), 0.0);
}

TEST_F(AggregateTest, GenomeMissingFromDistancesIsEmpty)
{
    options.dists = dir.write("partial.csv", "genome,g1\ng1,0\n");
    MemoryStore store;
    aggregate_results(options, store);

    LabelledMatrix dists = read_distances(store);
    ASSERT_EQ(dists.rows(), 2u);
    EXPECT_DOUBLE_EQ(dists.values(0, 0), 0.0);
    EXPECT_TRUE(std::isnan(dists.values(1, 1)));
}

TEST_F(AggregateTest, TsneIsStoredAsRead)
{
    MemoryStore store;
    aggregate_results(options, store);
    Table tsne = read_stored_table(store, "tsne", true);
    EXPECT_EQ(tsne.row_labels(), (std::vector<std::string>{"geneA", "geneB"}));
    EXPECT_EQ(tsne.column("y"), (std::vector<std::string>{"2", "0.25"}));
}

TEST_F(AggregateTest, WritesToDirectoryStore)
{
    DirectoryStore store(dir.path() / "results");
    aggregate_results(options, store);
    EXPECT_TRUE(store.contains("alignments"));
    EXPECT_EQ(read_list(store, "genome_ix").size(), 2u);
}

TEST_F(AggregateTest, GeneMissingFromOrderIsDataError)
{
    options.gene_order = dir.write("short_order.txt", "geneA\n");
    MemoryStore store;
    EXPECT_THROW(aggregate_results(options, store), DataError);
}

TEST_F(AggregateTest, MissingColumnIsDataError)
{
    options.alignments = dir.write("no_slen.csv",
                                   "qseqid,sseqid,genome,pident,qstart,qend,sstart,send\n"
                                   "q,geneA,g1,99,1,10,1,10\n");
    MemoryStore store;
    EXPECT_THROW(aggregate_results(options, store), DataError);
}

TEST_F(AggregateTest, EmptyAlignmentsIsDataError)
{
    options.alignments =
        dir.write("empty.csv", "qseqid,sseqid,genome,pident,qstart,qend,sstart,send,slen\n");
    MemoryStore store;
    EXPECT_THROW(aggregate_results(options, store), DataError);
}

TEST_F(AggregateTest, ZeroChunkSizeIsConfigError)
{
    options.dists_n_rows = 0;
    MemoryStore store;
    EXPECT_THROW(aggregate_results(options, store), ConfigError);
}

// ─── Reading back ───────────────────────────────────────────────────────────

TEST(StoredResults, MissingKeysAreDataErrors)
{
    MemoryStore store;
    EXPECT_THROW(read_list(store, "gene_ix"), DataError);
    EXPECT_THROW(read_stored_table(store, "alignments", false), DataError);
    EXPECT_THROW(read_distances(store), DataError);
}

TEST(StoredResults, NoChunksGivesEmptyMatrix)
{
    MemoryStore store;
    store.put("distances_keys", "");
    EXPECT_EQ(read_distances(store).rows(), 0u);
}

TEST(StoredResults, MismatchedChunkColumnsAreDataError)
{
    MemoryStore store;
    store.put("distances_keys", "distances_0\ndistances_1\n");
    store.put("distances_0", "genome,g1,g2\ng1,0,1\n");
    store.put("distances_1", "genome,g1,g3\ng2,1,0\n");
    EXPECT_THROW(read_distances(store), DataError);
}
