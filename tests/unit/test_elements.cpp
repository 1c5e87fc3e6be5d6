#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <gigmap/canvas.hpp>
#include <gigmap/elements/annotation.hpp>
#include <gigmap/elements/colorbar.hpp>
#include <gigmap/elements/heatmap.hpp>
#include <gigmap/elements/tree.hpp>
#include <gigmap/error.hpp>
#include <gigmap/export.hpp>
#include <gigmap/gigmap_figure.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "util/gigmap_inputs.hpp"

using namespace gigmap;

namespace
{

std::set<std::string> as_set(const std::vector<std::string>& v)
{
    return {v.begin(), v.end()};
}

const HeatmapTrace& heatmap_trace(SubplotCanvas& canvas, const std::string& panel_id)
{
    const Panel* panel = canvas.figure().find(panel_id);
    EXPECT_NE(panel, nullptr);
    return std::get<HeatmapTrace>(panel->traces.at(0));
}

}   // namespace

class ElementsTest : public ::testing::Test
{
   protected:
    test::GigMapInputs inputs;
    GigMapFigure       figure;
    SubplotCanvas      canvas;
};

// ─── Annotation ─────────────────────────────────────────────────────────────

TEST(TruncateLabel, CutsToMaxLength)
{
    EXPECT_EQ(truncate_label("Escherichia coli", 3), "Esc");
    EXPECT_EQ(truncate_label("E. coli", 60), "E. coli");
    EXPECT_EQ(truncate_label("abc", 3), "abc");
}

TEST_F(ElementsTest, AnnotationWithoutCsvIsDisabled)
{
    figure.run({}, canvas);
    EXPECT_FALSE(figure.genome_annotation().enabled());
    EXPECT_FALSE(figure.gene_annotation().enabled());
    EXPECT_EQ(canvas.panel_count(), 0u);
}

TEST_F(ElementsTest, AnnotationSetsLabelsFromLabelColumn)
{
    figure.run({{"genomeAnnot-csv", inputs.genome_csv}, {"genomeAnnot-label-col", "name"}},
               canvas);

    const Axis& genome = figure.axes().axis("genome");
    EXPECT_EQ(genome.order(), (std::vector<std::string>{"g1", "g2", "g3", "g4", "g5"}));
    EXPECT_EQ(genome.label("g3"), "Bacillus subtilis");
    EXPECT_FALSE(genome.is_fixed());
    // No color column, no panel
    EXPECT_FALSE(canvas.has_panel("genomeAnnot"));
}

TEST_F(ElementsTest, AnnotationWithoutLabelColumnUsesIds)
{
    figure.run({{"genomeAnnot-csv", inputs.genome_csv}}, canvas);
    EXPECT_EQ(figure.axes().axis("genome").label("g1"), "g1");
}

TEST_F(ElementsTest, AnnotationTruncatesLabels)
{
    figure.run({{"genomeAnnot-csv", inputs.genome_csv},
                {"genomeAnnot-label-col", "name"},
                {"genomeAnnot-max-label-len", "3"}},
               canvas);

    EXPECT_EQ(figure.axes().axis("genome").label("g1"), "Esc");
    EXPECT_EQ(figure.genome_annotation().labels().front().second, "Esc");
}

TEST_F(ElementsTest, UnannotatedIdKeepsRawLabel)
{
    auto subset = inputs.dir.write("two_genomes.csv",
                                   "genome_id,name\n"
                                   "g1,Escherichia coli\n"
                                   "g2,Salmonella enterica\n");
    auto values = inputs.dir.write("three_genomes.csv",
                                   "sseqid,genome,pident\n"
                                   "a,g1,100\n"
                                   "a,g2,90\n"
                                   "a,unannotated_genome,80\n"
                                   "b,g1,70\n"
                                   "b,g2,60\n"
                                   "b,unannotated_genome,50\n");
    figure.run({{"genomeAnnot-csv", subset},
                {"genomeAnnot-label-col", "name"},
                {"genomeAnnot-max-label-len", "3"},
                {"genomeHeatmap-csv", values}},
               canvas);

    const Axis& genome = figure.axes().axis("genome");
    EXPECT_EQ(genome.label("g1"), "Esc");
    EXPECT_EQ(genome.label("g2"), "Sal");
    EXPECT_EQ(genome.label("unannotated_genome"), "unannotated_genome");

    const auto& labels = heatmap_trace(canvas, "genomeHeatmap").y_labels;
    EXPECT_EQ(as_set(labels), (std::set<std::string>{"Esc", "Sal", "unannotated_genome"}));
}

TEST_F(ElementsTest, AnnotationRejectsNonPositiveLabelLength)
{
    figure.parse_args({{"genomeAnnot-csv", inputs.genome_csv}, {"genomeAnnot-max-label-len", "0"}});
    EXPECT_THROW(figure.read_data(), ConfigError);
}

TEST_F(ElementsTest, AnnotationMissingLabelColumnIsDataError)
{
    figure.parse_args({{"genomeAnnot-csv", inputs.genome_csv}, {"genomeAnnot-label-col", "strain"}});
    EXPECT_THROW(figure.read_data(), DataError);
}

TEST_F(ElementsTest, AnnotationDuplicateIdIsDataError)
{
    auto path = inputs.dir.write("dup.csv", "genome_id,name\ng1,A\ng1,B\n");
    figure.parse_args({{"genomeAnnot-csv", path}});
    EXPECT_THROW(figure.read_data(), DataError);
}

TEST_F(ElementsTest, OrderFileFixesAxis)
{
    auto order = inputs.dir.write("order.txt", "g3\ng1\ng2\ng4\ng5\n");
    RawParams params = inputs.full();
    params["genomeAnnot-order"] = order;
    figure.run(params, canvas);

    const Axis& genome = figure.axes().axis("genome");
    EXPECT_TRUE(genome.is_fixed());
    EXPECT_EQ(genome.fixed_by(), "genomeAnnot");
    EXPECT_EQ(genome.order(), (std::vector<std::string>{"g3", "g1", "g2", "g4", "g5"}));

    // The tree cannot reorder a fixed axis, so it stands down.
    EXPECT_FALSE(figure.genome_tree().enabled());
    EXPECT_FALSE(canvas.has_panel("genomeTree"));

    // Heatmap rows follow the fixed order; g5 has no alignments.
    const auto& trace = heatmap_trace(canvas, "genomeHeatmap");
    ASSERT_EQ(trace.z.rows(), 5);
    EXPECT_EQ(trace.y_labels.front(), "Bacillus subtilis");
    EXPECT_TRUE(trace.z.row(4).array().isNaN().all());
}

TEST_F(ElementsTest, OrderFileValueMissingFromTableIsDataError)
{
    auto order = inputs.dir.write("order.txt", "g1\ng9\n");
    figure.parse_args({{"genomeAnnot-csv", inputs.genome_csv}, {"genomeAnnot-order", order}});
    EXPECT_THROW(figure.read_data(), DataError);
}

TEST_F(ElementsTest, CategoricalColorStrip)
{
    figure.run({{"genomeAnnot-csv", inputs.genome_csv}, {"genomeAnnot-color-col", "phylum"}},
               canvas);

    ASSERT_TRUE(figure.genome_annotation().has_colors());
    const auto& strip = heatmap_trace(canvas, "genomeAnnot");
    ASSERT_EQ(strip.z.rows(), 5);
    ASSERT_EQ(strip.z.cols(), 1);
    EXPECT_EQ(strip.palette.size(), palette::default_cycle_size);
    // Proteobacteria first, Firmicutes second
    EXPECT_DOUBLE_EQ(strip.z(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(strip.z(2, 0), 1.0);
    EXPECT_DOUBLE_EQ(strip.z(4, 0), 0.0);
}

TEST_F(ElementsTest, NumericColorStripAlongGenes)
{
    figure.run({{"geneAnnot-csv", inputs.gene_csv}, {"geneAnnot-color-col", "length"}}, canvas);

    const auto& strip = heatmap_trace(canvas, "geneAnnot");
    ASSERT_EQ(strip.z.rows(), 1);
    ASSERT_EQ(strip.z.cols(), 4);
    EXPECT_TRUE(strip.palette.empty());
    EXPECT_EQ(strip.colorscale, "viridis");
    EXPECT_DOUBLE_EQ(strip.zmin, 1062.0);
    EXPECT_DOUBLE_EQ(strip.zmax, 4029.0);
    EXPECT_TRUE(std::isnan(strip.z(0, 3)));
}

// ─── Tree ───────────────────────────────────────────────────────────────────

TEST_F(ElementsTest, TreeFixesOrderOverAnnotatedGenomes)
{
    figure.run(inputs.full(), canvas);

    ASSERT_TRUE(figure.genome_tree().enabled());
    ASSERT_TRUE(figure.genome_tree().tree().has_value());

    const Axis& genome = figure.axes().axis("genome");
    EXPECT_TRUE(genome.is_fixed());
    EXPECT_EQ(genome.fixed_by(), "genomeTree");
    // g5 has no distances, so it drops out of the order
    EXPECT_EQ(as_set(genome.order()), (std::set<std::string>{"g1", "g2", "g3", "g4"}));
    EXPECT_EQ(genome.order(), figure.genome_tree().tree()->leaf_order());

    // Sister genomes end up adjacent
    const auto& order = genome.order();
    auto        pos   = [&](const std::string& id)
    { return std::find(order.begin(), order.end(), id) - order.begin(); };
    EXPECT_EQ(std::abs(pos("g1") - pos("g2")), 1);
    EXPECT_EQ(std::abs(pos("g3") - pos("g4")), 1);
}

TEST_F(ElementsTest, TreeWithoutAnnotationsUsesEveryDistmatRow)
{
    figure.run({{"genomeTree-distmat", inputs.distmat}}, canvas);

    const Axis& genome = figure.axes().axis("genome");
    EXPECT_EQ(genome.length(), 4u);
    EXPECT_TRUE(canvas.has_panel("genomeTree"));

    const Panel* panel = canvas.figure().find("genomeTree");
    ASSERT_EQ(panel->traces.size(), 2u);
    EXPECT_EQ(std::get<LineTrace>(panel->traces[1]).dash, LineDash::Dot);
    ASSERT_TRUE(panel->x_format.range.has_value());
    EXPECT_LT(panel->x_format.range->first, 0.0);
}

TEST_F(ElementsTest, TreeBranchesCarryHoverText)
{
    figure.run({{"genomeTree-distmat", inputs.distmat}}, canvas);

    const Panel* panel = canvas.figure().find("genomeTree");
    ASSERT_NE(panel, nullptr);
    const auto& branches = std::get<LineTrace>(panel->traces.at(0));
    EXPECT_EQ(branches.text, figure.genome_tree().tree()->text());
    EXPECT_EQ(branches.text.size(), branches.x.size());
    EXPECT_NE(std::find(branches.text.begin(), branches.text.end(), "g1 (1)"),
              branches.text.end());

    std::string svg = SvgExporter::to_string(canvas.figure());
    EXPECT_NE(svg.find("<title>g1 (1)</title></polyline>"), std::string::npos);
    EXPECT_NE(svg.find("<title>branch length: "), std::string::npos);
}

TEST_F(ElementsTest, TreeWithoutDistmatIsDisabled)
{
    figure.run({{"genomeAnnot-csv", inputs.genome_csv}}, canvas);
    EXPECT_FALSE(figure.genome_tree().enabled());
    EXPECT_FALSE(figure.axes().axis("genome").is_fixed());
}

TEST_F(ElementsTest, TreeSharingTooFewGenomesIsDataError)
{
    auto other = inputs.dir.write("other.csv", "genome,x1,x2\nx1,0,1\nx2,1,0\n");
    figure.parse_args({{"genomeAnnot-csv", inputs.genome_csv}, {"genomeTree-distmat", other}});
    EXPECT_THROW(figure.read_data(), DataError);
}

// ─── Heatmap ────────────────────────────────────────────────────────────────

TEST_F(ElementsTest, HeatmapPlotsAlongFixedGenomeOrder)
{
    figure.run(inputs.full(), canvas);

    const auto& hm = figure.genome_heatmap();
    ASSERT_TRUE(hm.enabled());
    EXPECT_DOUBLE_EQ(hm.min_value(), 30.0);
    EXPECT_DOUBLE_EQ(hm.max_value(), 100.0);
    // blues starts one range below the minimum
    EXPECT_DOUBLE_EQ(hm.zmin(), -40.0);
    EXPECT_DOUBLE_EQ(hm.zmax(), 100.0);

    const Axis& genome = figure.axes().axis("genome");
    const Axis& gene   = figure.axes().axis("gene");
    // Gene d has no alignments; clustering orders only a, b and c.
    EXPECT_EQ(as_set(gene.order()), (std::set<std::string>{"a", "b", "c"}));
    EXPECT_FALSE(gene.is_fixed());

    const auto& trace = heatmap_trace(canvas, "genomeHeatmap");
    ASSERT_EQ(trace.z.rows(), 4);
    ASSERT_EQ(trace.z.cols(), 3);
    EXPECT_EQ(trace.y_labels, genome.labels());
    EXPECT_EQ(trace.x_labels, gene.labels());

    // Spot-check one cell against the input
    const auto& rows = genome.order();
    const auto& cols = gene.order();
    auto r = std::find(rows.begin(), rows.end(), "g3") - rows.begin();
    auto c = std::find(cols.begin(), cols.end(), "c") - cols.begin();
    EXPECT_DOUBLE_EQ(trace.z(r, c), 100.0);
}

TEST_F(ElementsTest, HeatmapClustersGenomesWithoutTree)
{
    figure.run({{"genomeHeatmap-csv", inputs.alignments}}, canvas);

    const Axis& genome = figure.axes().axis("genome");
    EXPECT_FALSE(genome.is_fixed());
    EXPECT_EQ(as_set(genome.order()), (std::set<std::string>{"g1", "g2", "g3", "g4"}));
    EXPECT_TRUE(canvas.has_panel("genomeHeatmap"));
    EXPECT_TRUE(canvas.has_panel("genomeColorbar"));
}

TEST_F(ElementsTest, HeatmapMinValDropsEmptyMembers)
{
    figure.run({{"genomeHeatmap-csv", inputs.alignments}, {"genomeHeatmap-min-val", "95"}},
               canvas);

    const auto& values = figure.genome_heatmap().values();
    EXPECT_EQ(as_set(values.row_labels), (std::set<std::string>{"g1", "g2", "g3"}));
    EXPECT_EQ(values.cols(), 3u);
    EXPECT_DOUBLE_EQ(figure.genome_heatmap().min_value(), 95.0);
}

TEST_F(ElementsTest, HeatmapMinValLeavingTooFewMembersIsDataError)
{
    figure.parse_args({{"genomeHeatmap-csv", inputs.alignments}, {"genomeHeatmap-min-val", "101"}});
    EXPECT_THROW(figure.read_data(), DataError);
}

TEST_F(ElementsTest, HeatmapUnknownColorscaleIsConfigError)
{
    figure.parse_args({{"genomeHeatmap-csv", inputs.alignments}, {"genomeHeatmap-colorscale", "jet"}});
    EXPECT_THROW(figure.read_data(), ConfigError);
}

TEST_F(ElementsTest, HeatmapNonNumericValueIsDataError)
{
    auto path = inputs.dir.write("bad.csv", "sseqid,genome,pident\na,g1,high\na,g2,90\n");
    figure.parse_args({{"genomeHeatmap-csv", path}});
    EXPECT_THROW(figure.read_data(), DataError);
}

TEST_F(ElementsTest, HeatmapCustomColumns)
{
    auto path = inputs.dir.write("renamed.csv",
                                 "gene,strain,identity\n"
                                 "a,g1,90\na,g2,80\nb,g1,70\nb,g2,60\n");
    figure.run({{"genomeHeatmap-csv", path},
                {"genomeHeatmap-gene-col", "gene"},
                {"genomeHeatmap-genome-col", "strain"},
                {"genomeHeatmap-val-col", "identity"},
                {"genomeHeatmap-colorscale", "reds"}},
               canvas);

    const auto& hm = figure.genome_heatmap();
    EXPECT_EQ(hm.values().rows(), 2u);
    EXPECT_EQ(hm.colorscale_name(), "reds");
    EXPECT_DOUBLE_EQ(hm.zmin(), 60.0);
}

// ─── Colorbar ───────────────────────────────────────────────────────────────

TEST_F(ElementsTest, ColorbarSpansHeatmapRange)
{
    figure.run(inputs.full(), canvas);

    const auto& bar = heatmap_trace(canvas, "genomeColorbar");
    ASSERT_EQ(bar.z.rows(), 1);
    ASSERT_EQ(bar.z.cols(), 100);
    EXPECT_DOUBLE_EQ(bar.z(0, 0), 30.0);
    EXPECT_DOUBLE_EQ(bar.z(0, 99), 100.0);
    EXPECT_DOUBLE_EQ(bar.zmin, -40.0);
    EXPECT_EQ(bar.colorscale, "blues");
    EXPECT_EQ(bar.y_labels, (std::vector<std::string>{"Percent Identity"}));
}

TEST_F(ElementsTest, ColorbarFollowsDisabledHeatmap)
{
    figure.run({{"genomeTree-distmat", inputs.distmat}}, canvas);
    EXPECT_FALSE(figure.genome_heatmap().enabled());
    EXPECT_FALSE(figure.genome_colorbar().enabled());
    EXPECT_FALSE(canvas.has_panel("genomeColorbar"));
}

// ─── Layout of the full figure ──────────────────────────────────────────────

TEST_F(ElementsTest, FullFigurePanelsAndLabelOwnership)
{
    RawParams params                = inputs.full();
    params["genomeAnnot-color-col"] = "phylum";
    params["geneAnnot-color-col"]   = "length";
    figure.run(params, canvas);

    const Figure& fig = canvas.figure();
    for (const char* id : {"genomeAnnot", "geneAnnot", "genomeTree", "genomeHeatmap", "genomeColorbar"})
        EXPECT_NE(fig.find(id), nullptr) << id;

    // Genome labels sit on the strip right of the heatmap, gene labels under
    // the gene strip.
    EXPECT_FALSE(fig.find("genomeHeatmap")->draw_y_ticklabels);
    EXPECT_FALSE(fig.find("genomeTree")->draw_y_ticklabels);
    EXPECT_TRUE(fig.find("genomeAnnot")->draw_y_ticklabels);
    EXPECT_FALSE(fig.find("genomeHeatmap")->draw_x_ticklabels);
    EXPECT_TRUE(fig.find("geneAnnot")->draw_x_ticklabels);

    // Tree left of the heatmap, colorbar at the bottom
    EXPECT_LT(fig.find("genomeTree")->viewport.x, fig.find("genomeHeatmap")->viewport.x);
    EXPECT_GT(fig.find("genomeColorbar")->viewport.y, fig.find("geneAnnot")->viewport.y);
}

// ─── Elements outside the composite figure ──────────────────────────────────

TEST(HeatmapElement, WorksWithCustomAxes)
{
    test::GigMapInputs inputs;
    HeatmapAxes        axes;
    axes.x_axis = "genome";
    axes.x_col  = "genome";
    axes.y_axis = "gene";
    axes.y_col  = "sseqid";

    std::vector<std::unique_ptr<Element>> elements;
    elements.push_back(std::make_unique<HeatmapElement>("hm", axes, 0, 0));
    Builder builder({}, std::move(elements));

    SubplotCanvas canvas;
    builder.run({{"hm-csv", inputs.alignments}, {"hm-colorscale", "greens"}}, canvas);

    const auto& trace = std::get<HeatmapTrace>(canvas.figure().find("hm")->traces.at(0));
    EXPECT_EQ(trace.z.rows(), 3);
    EXPECT_EQ(trace.z.cols(), 4);
}
