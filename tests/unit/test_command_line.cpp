#include <gigmap/command_line.hpp>
#include <gigmap/error.hpp>
#include <gigmap/logger.hpp>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "util/temp_files.hpp"

using namespace gigmap;

namespace
{

CommandLine parse(std::vector<const char*> args)
{
    args.insert(args.begin(), "gigmap-render");
    return parse_command_line(static_cast<int>(args.size()), args.data());
}

}   // namespace

// ─── parse_command_line ─────────────────────────────────────────────────────

TEST(CommandLine, KeyValuePairs)
{
    auto cmd = parse({"--genomeHeatmap-csv", "aln.csv", "--width=900"});
    EXPECT_FALSE(cmd.help);
    EXPECT_EQ(cmd.params,
              (RawParams{{"genomeHeatmap-csv", "aln.csv"}, {"width", "900"}}));
}

TEST(CommandLine, ValueMayContainEquals)
{
    auto cmd = parse({"--title=a=b"});
    EXPECT_EQ(cmd.params.at("title"), "a=b");
}

TEST(CommandLine, LaterRepeatWins)
{
    auto cmd = parse({"--width", "100", "--width", "200"});
    EXPECT_EQ(cmd.params.at("width"), "200");
}

TEST(CommandLine, HelpAndLoggingOptionsAreSplitOff)
{
    auto cmd = parse({"-h", "--log-level", "debug", "--log-file=run.log", "--title", "x"});
    EXPECT_TRUE(cmd.help);
    ASSERT_TRUE(cmd.log_level.has_value());
    EXPECT_EQ(*cmd.log_level, "debug");
    ASSERT_TRUE(cmd.log_file.has_value());
    EXPECT_EQ(*cmd.log_file, "run.log");
    EXPECT_EQ(cmd.params, (RawParams{{"title", "x"}}));
}

TEST(CommandLine, PositionalArgumentIsConfigError)
{
    EXPECT_THROW(parse({"aln.csv"}), ConfigError);
    EXPECT_THROW(parse({"--"}), ConfigError);
    EXPECT_THROW(parse({"--=x"}), ConfigError);
}

TEST(CommandLine, MissingValueIsConfigError)
{
    EXPECT_THROW(parse({"--width"}), ConfigError);
}

TEST(CommandLine, ParamsFileSuppliesDefaults)
{
    test::TempDir dir;
    auto path = dir.write("params.json", R"({"width": 640, "title": "From file"})");

    auto cmd = parse({"--params", path.c_str(), "--title", "From argv"});
    EXPECT_EQ(cmd.params.at("width"), "640");
    EXPECT_EQ(cmd.params.at("title"), "From argv");
    EXPECT_EQ(cmd.params.count("params"), 0u);
}

TEST(CommandLine, MissingParamsFileIsConfigError)
{
    EXPECT_THROW(parse({"--params", "/nonexistent/params.json"}), ConfigError);
}

// ─── parse_params_json ──────────────────────────────────────────────────────

TEST(ParamsJson, ScalarsBecomeRawText)
{
    auto params = parse_params_json(
        R"({ "genomeHeatmap-min-val": 50.5, "width": -12, "flag": true, "off": false,
             "skipped": null, "exp": 1e3 })");
    EXPECT_EQ(params,
              (RawParams{{"genomeHeatmap-min-val", "50.5"},
                         {"width", "-12"},
                         {"flag", "true"},
                         {"off", "false"},
                         {"exp", "1e3"}}));
}

TEST(ParamsJson, StringEscapes)
{
    auto params = parse_params_json(R"({"title": "Genes \"core\"\n\u00e9\\/"})");
    EXPECT_EQ(params.at("title"), "Genes \"core\"\n\xc3\xa9\\/");
}

TEST(ParamsJson, EmptyObject)
{
    EXPECT_TRUE(parse_params_json("  {}  ").empty());
}

TEST(ParamsJson, NestedValuesAreRejected)
{
    EXPECT_THROW(parse_params_json(R"({"a": [1, 2]})"), ConfigError);
    EXPECT_THROW(parse_params_json(R"({"a": {"b": 1}})"), ConfigError);
}

TEST(ParamsJson, MalformedInputIsConfigError)
{
    EXPECT_THROW(parse_params_json(""), ConfigError);
    EXPECT_THROW(parse_params_json("[]"), ConfigError);
    EXPECT_THROW(parse_params_json(R"({"a": 1)"), ConfigError);
    EXPECT_THROW(parse_params_json(R"({"a": 1} x)"), ConfigError);
    EXPECT_THROW(parse_params_json(R"({"a": wrong})"), ConfigError);
    EXPECT_THROW(parse_params_json(R"({"a": "\q"})"), ConfigError);
}

// ─── configure_logging ──────────────────────────────────────────────────────

class ConfigureLoggingTest : public ::testing::Test
{
   protected:
    void SetUp() override { saved_level_ = Logger::instance().get_level(); }

    void TearDown() override
    {
        Logger::instance().clear_sinks();
        Logger::instance().set_level(saved_level_);
    }

    LogLevel saved_level_ = LogLevel::Info;
};

TEST_F(ConfigureLoggingTest, SetsLevelAndConsoleSink)
{
    CommandLine cmd;
    cmd.log_level = "warning";
    configure_logging(cmd);
    EXPECT_EQ(Logger::instance().get_level(), LogLevel::Warning);
    EXPECT_EQ(Logger::instance().sink_count(), 1u);
}

TEST_F(ConfigureLoggingTest, AddsFileSink)
{
    test::TempDir dir;
    CommandLine   cmd;
    cmd.log_file = dir.file("run.log");
    configure_logging(cmd);
    EXPECT_EQ(Logger::instance().sink_count(), 2u);
}

TEST_F(ConfigureLoggingTest, UnknownLevelIsConfigError)
{
    CommandLine cmd;
    cmd.log_level = "chatty";
    EXPECT_THROW(configure_logging(cmd), ConfigError);
}
