#include <gigmap/canvas.hpp>
#include <gigmap/export.hpp>
#include <gtest/gtest.h>
#include <limits>
#include <string>

#include "util/temp_files.hpp"

using namespace gigmap;

namespace
{

size_t count_occurrences(const std::string& haystack, const std::string& needle)
{
    size_t count = 0;
    size_t pos   = 0;
    while ((pos = haystack.find(needle, pos)) != std::string::npos)
    {
        ++count;
        pos += needle.size();
    }
    return count;
}

HeatmapTrace labelled_heatmap()
{
    HeatmapTrace hm;
    hm.name = "identity";
    hm.z.resize(2, 2);
    hm.z << 0.0, 0.5, std::numeric_limits<double>::quiet_NaN(), 1.0;
    hm.x_labels = {"geneA", "geneB"};
    hm.y_labels = {"g1", "g2"};
    return hm;
}

}   // namespace

TEST(SvgExport, DocumentHasSizeAndClosingTag)
{
    SubplotCanvas canvas;
    LayoutUpdate  update;
    update.width  = 640u;
    update.height = 480u;
    canvas.update_layout(update);
    canvas.add("a", 0, 0);

    std::string svg = SvgExporter::to_string(canvas.figure());
    EXPECT_EQ(svg.rfind("<?xml", 0), 0u);
    EXPECT_NE(svg.find("width=\"640\" height=\"480\""), std::string::npos);
    EXPECT_NE(svg.find("viewBox=\"0 0 640 480\""), std::string::npos);
    EXPECT_NE(svg.find("<g class=\"panel\" id=\"a\">"), std::string::npos);
    EXPECT_EQ(svg.substr(svg.size() - 7), "</svg>\n");
}

TEST(SvgExport, NanCellsAreLeftEmpty)
{
    SubplotCanvas canvas;
    canvas.add("hm", 0, 0);
    canvas.plot("hm", labelled_heatmap());

    std::string svg = SvgExporter::to_string(canvas.figure());
    EXPECT_EQ(count_occurrences(svg, "</rect>"), 3u);
    EXPECT_NE(svg.find("data-name=\"identity\""), std::string::npos);
}

TEST(SvgExport, CellsCarryHoverTitles)
{
    SubplotCanvas canvas;
    canvas.add("hm", 0, 0);
    canvas.plot("hm", labelled_heatmap());

    std::string svg = SvgExporter::to_string(canvas.figure());
    EXPECT_NE(svg.find("<title>g1 / geneB: 0.5</title>"), std::string::npos);
    EXPECT_NE(svg.find("<title>g2 / geneB: 1</title>"), std::string::npos);
}

TEST(SvgExport, ContinuousFillFollowsColorscale)
{
    SubplotCanvas canvas;
    canvas.add("hm", 0, 0);
    HeatmapTrace hm;
    hm.z          = Eigen::MatrixXd::Zero(1, 1);
    hm.zmin       = 0.0;
    hm.zmax       = 1.0;
    hm.colorscale = "blues";
    canvas.plot("hm", hm);

    std::string svg = SvgExporter::to_string(canvas.figure());
    EXPECT_NE(svg.find("fill=\"rgb(247,251,255)\"></rect>"), std::string::npos);
}

TEST(SvgExport, PaletteModeIndexesColors)
{
    SubplotCanvas canvas;
    canvas.add("strip", 0, 0);
    HeatmapTrace hm;
    hm.z.resize(1, 3);
    hm.z << 0.0, 1.0, 5.0;
    hm.palette = {rgb(1.0f, 0.0f, 0.0f), rgb(0.0f, 1.0f, 0.0f)};
    canvas.plot("strip", hm);

    std::string svg = SvgExporter::to_string(canvas.figure());
    EXPECT_NE(svg.find("fill=\"rgb(255,0,0)\"></rect>"), std::string::npos);
    EXPECT_NE(svg.find("fill=\"rgb(0,255,0)\"></rect>"), std::string::npos);
    // index 5 has no palette entry
    EXPECT_EQ(count_occurrences(svg, "</rect>"), 2u);
}

TEST(SvgExport, NanBreaksLineIntoRuns)
{
    const double  nan = std::numeric_limits<double>::quiet_NaN();
    SubplotCanvas canvas;
    canvas.add("tree", 0, 0);
    LineTrace line;
    line.name = "branches";
    line.x    = {0.0, 1.0, nan, 1.0, 2.0};
    line.y    = {0.0, 0.0, nan, 1.0, 1.0};
    line.dash = LineDash::Dot;
    canvas.plot("tree", line);

    std::string svg = SvgExporter::to_string(canvas.figure());
    EXPECT_EQ(count_occurrences(svg, "<polyline"), 2u);
    EXPECT_NE(svg.find("data-name=\"branches\""), std::string::npos);
    EXPECT_NE(svg.find("stroke-dasharray=\"1,3\""), std::string::npos);
}

TEST(SvgExport, LineRunsTakeTitleFromFirstPoint)
{
    const double  nan = std::numeric_limits<double>::quiet_NaN();
    SubplotCanvas canvas;
    canvas.add("tree", 0, 0);
    LineTrace line;
    line.x    = {0.0, 1.0, nan, 1.0, 2.0, nan, 0.0, 0.0};
    line.y    = {0.0, 0.0, nan, 1.0, 1.0, nan, 0.0, 1.0};
    line.text = {"g1 (1)", "g1 (1)", "", "a<b", "a<b", "", "", ""};
    canvas.plot("tree", line);

    std::string svg = SvgExporter::to_string(canvas.figure());
    EXPECT_EQ(count_occurrences(svg, "<polyline"), 3u);
    EXPECT_EQ(count_occurrences(svg, "</polyline>"), 2u);
    EXPECT_NE(svg.find("<title>g1 (1)</title></polyline>"), std::string::npos);
    EXPECT_NE(svg.find("<title>a&lt;b</title></polyline>"), std::string::npos);
}

TEST(SvgExport, TickTextIsRenderedAndRotated)
{
    SubplotCanvas canvas;
    canvas.add("hm", 0, 0);
    canvas.plot("hm", labelled_heatmap());
    AxisFormat x;
    x.tickvals   = {0.0, 1.0};
    x.ticktext   = {"geneA", "geneB"};
    x.tick_angle = -90.0f;
    canvas.format_axis("hm", AxisDim::X, x);

    std::string svg = SvgExporter::to_string(canvas.figure());
    EXPECT_NE(svg.find(">geneA</text>"), std::string::npos);
    EXPECT_NE(svg.find("transform=\"rotate(-90,"), std::string::npos);
}

TEST(SvgExport, TextIsEscaped)
{
    SubplotCanvas canvas;
    LayoutUpdate  update;
    update.title = "Genes <core> & accessory";
    canvas.update_layout(update);
    canvas.add("a&b", 0, 0);

    std::string svg = SvgExporter::to_string(canvas.figure());
    EXPECT_NE(svg.find("Genes &lt;core&gt; &amp; accessory"), std::string::npos);
    EXPECT_NE(svg.find("id=\"a&amp;b\""), std::string::npos);
    EXPECT_NE(svg.find("clip-a_b"), std::string::npos);
}

TEST(SvgExport, WriteSvgMatchesToString)
{
    test::TempDir dir;
    SubplotCanvas canvas;
    canvas.add("hm", 0, 0);
    canvas.plot("hm", labelled_heatmap());
    const Figure& fig = canvas.figure();

    const std::string path = dir.file("out.svg");
    ASSERT_TRUE(SvgExporter::write_svg(path, fig));
    EXPECT_EQ(test::TempDir::read(path), SvgExporter::to_string(fig));
}

TEST(SvgExport, WriteSvgFailsForMissingDirectory)
{
    test::TempDir dir;
    SubplotCanvas canvas;
    canvas.add("a", 0, 0);
    EXPECT_FALSE(SvgExporter::write_svg(dir.file("no/such/dir/out.svg"), canvas.figure()));
}
