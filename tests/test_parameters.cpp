/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/argument_parser.hpp"
#include "core/parameters.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace goop::core;

namespace {

    class ParametersFileTest : public ::testing::Test {
    protected:
        void SetUp() override {
            dir_ = std::filesystem::temp_directory_path() /
                   ("goop_params_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
            std::filesystem::create_directories(dir_);
        }

        void TearDown() override {
            std::error_code ec;
            std::filesystem::remove_all(dir_, ec);
        }

        std::filesystem::path write(const std::string& name, const std::string& text) const {
            const auto path = dir_ / name;
            std::ofstream(path) << text;
            return path;
        }

        std::filesystem::path dir_;
    };

    std::expected<args::ParsedArgs, std::string> parse(std::vector<std::string> argv) {
        argv.insert(argv.begin(), "goop-battle");
        return args::parse_args(argv);
    }

} // namespace

TEST(Parameters, DefaultsAreValid) {
    const param::ViewerParameters params;
    EXPECT_TRUE(param::validate(params));
    EXPECT_FLOAT_EQ(params.atlas.spacing, 15.0f);
    EXPECT_EQ(params.atlas.index_base, 0u);
    EXPECT_FALSE(params.atlas.debug_sentinel);
    EXPECT_EQ(params.pick.tolerance, 2u);
    EXPECT_EQ(params.board.owner_colors.size(), 4u);
}

TEST(Parameters, MissingKeysKeepDefaults) {
    const auto j = nlohmann::json::parse(R"({"atlas": {"index_base": 1}, "board": {"rows": 3}})");
    const auto params = param::ViewerParameters::from_json(j);
    EXPECT_EQ(params.atlas.index_base, 1u);
    EXPECT_FLOAT_EQ(params.atlas.spacing, 15.0f);
    EXPECT_EQ(params.board.rows, 3u);
    EXPECT_EQ(params.board.cols, 16u);
    EXPECT_EQ(params.window.width, 1280);
    EXPECT_EQ(params.log_level, "info");
}

TEST(Parameters, JsonRoundTripKeepsEveryField) {
    param::ViewerParameters params;
    params.atlas.spacing = 20.0f;
    params.atlas.debug_sentinel = true;
    params.pick.radius = 2;
    params.board.owner_colors = {{1, 2, 3}};
    params.board.demo_seed = 99;
    params.window.margin = 0.8f;
    params.log_file = "goop.log";

    const auto copy = param::ViewerParameters::from_json(params.to_json());
    EXPECT_EQ(copy.to_json(), params.to_json());
}

TEST(Parameters, ValidateRejectsBadValues) {
    const auto rejected = [](auto mutate) {
        param::ViewerParameters params;
        mutate(params);
        return !param::validate(params).has_value();
    };

    EXPECT_TRUE(rejected([](auto& p) { p.atlas.spacing = 0.0f; }));
    EXPECT_TRUE(rejected([](auto& p) { p.atlas.spacing = 4.0f; })); // needs sqrt(15) + 1
    EXPECT_TRUE(rejected([](auto& p) { p.atlas.max_fill = 0; }));
    EXPECT_TRUE(rejected([](auto& p) { p.atlas.index_base = 2; }));
    EXPECT_TRUE(rejected([](auto& p) { p.atlas.fill_scale = 1.5f; }));
    EXPECT_TRUE(rejected([](auto& p) { p.board.rows = 0; }));
    EXPECT_TRUE(rejected([](auto& p) { p.board.rows = 64; p.board.cols = 65; }));
    EXPECT_TRUE(rejected([](auto& p) { p.pick.tolerance = 9; }));
    EXPECT_TRUE(rejected([](auto& p) { p.pick.radius = 5; }));
    EXPECT_TRUE(rejected([](auto& p) { p.window.height = 0; }));
    EXPECT_TRUE(rejected([](auto& p) { p.window.margin = 0.0f; }));

    EXPECT_FALSE(rejected([](auto& p) { p.board.rows = 64; p.board.cols = 64; }));
    EXPECT_FALSE(rejected([](auto& p) { p.atlas.spacing = 5.0f; }));
    EXPECT_FALSE(rejected([](auto& p) { p.atlas.max_fill = 4; p.atlas.spacing = 3.0f; }));
}

TEST_F(ParametersFileTest, SaveThenLoad) {
    param::ViewerParameters params;
    params.board.rows = 5;
    params.board.cols = 7;
    params.atlas.index_base = 1;

    ASSERT_TRUE(param::save_viewer_parameters(params, dir_));
    ASSERT_TRUE(std::filesystem::exists(dir_ / "goop_battle.json"));

    const auto loaded = param::load_viewer_parameters(dir_ / "goop_battle.json");
    ASSERT_TRUE(loaded) << loaded.error();
    EXPECT_EQ(loaded->board.rows, 5u);
    EXPECT_EQ(loaded->board.cols, 7u);
    EXPECT_EQ(loaded->atlas.index_base, 1u);
}

TEST_F(ParametersFileTest, LoadReportsErrors) {
    EXPECT_FALSE(param::load_viewer_parameters(dir_ / "missing.json"));
    EXPECT_FALSE(param::load_viewer_parameters(write("broken.json", "{ not json")));
    EXPECT_FALSE(param::load_viewer_parameters(write("wrong_type.json", R"({"board": {"rows": "many"}})")));
    EXPECT_FALSE(param::load_viewer_parameters(write("invalid.json", R"({"atlas": {"index_base": 3}})")));
}

TEST(ArgumentParser, NoFlagsGivesDefaults) {
    const auto parsed = parse({});
    ASSERT_TRUE(parsed) << parsed.error();
    ASSERT_TRUE(std::holds_alternative<args::ViewerMode>(*parsed));
    const auto& params = std::get<args::ViewerMode>(*parsed).params;
    EXPECT_EQ(params.board.rows, 12u);
    EXPECT_EQ(params.board.cols, 16u);
}

TEST(ArgumentParser, FlagsOverrideDefaults) {
    const auto parsed = parse({"--rows", "5", "--cols", "6", "--index-base", "1", "--debug-sentinel",
                               "--seed", "42", "--width", "800", "--log-level", "debug"});
    ASSERT_TRUE(parsed) << parsed.error();
    const auto& params = std::get<args::ViewerMode>(*parsed).params;
    EXPECT_EQ(params.board.rows, 5u);
    EXPECT_EQ(params.board.cols, 6u);
    EXPECT_EQ(params.atlas.index_base, 1u);
    EXPECT_TRUE(params.atlas.debug_sentinel);
    EXPECT_EQ(params.board.demo_seed, 42u);
    EXPECT_EQ(params.window.width, 800);
    EXPECT_EQ(params.log_level, "debug");
}

TEST(ArgumentParser, HelpReturnsHelpMode) {
    const auto parsed = parse({"--help"});
    ASSERT_TRUE(parsed) << parsed.error();
    EXPECT_TRUE(std::holds_alternative<args::HelpMode>(*parsed));
}

TEST(ArgumentParser, RejectsBadInput) {
    EXPECT_FALSE(parse({"--no-such-flag"}));
    EXPECT_FALSE(parse({"--rows", "abc"}));
    EXPECT_FALSE(parse({"--spacing", "2"}));
    EXPECT_FALSE(parse({"--index-base", "2"}));
    EXPECT_FALSE(parse({"--config", "/nonexistent/goop.json"}));
    EXPECT_FALSE(args::parse_args(std::vector<std::string>{}));
}

TEST_F(ParametersFileTest, FlagsOverrideConfigFile) {
    const auto config = write("goop.json", R"({"board": {"rows": 8, "cols": 9}, "pick": {"radius": 1}})");
    const auto parsed = parse({"--config", config.string(), "--cols", "10"});
    ASSERT_TRUE(parsed) << parsed.error();
    const auto& params = std::get<args::ViewerMode>(*parsed).params;
    EXPECT_EQ(params.board.rows, 8u);
    EXPECT_EQ(params.board.cols, 10u);
    EXPECT_EQ(params.pick.radius, 1u);
}
