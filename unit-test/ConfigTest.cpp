#include <cstdlib>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "test/fixtures.hpp"

using namespace std;
using namespace localjudge;
namespace po = boost::program_options;

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("LOCALJUDGE_TIME_LIMIT");
        unsetenv("LOCALJUDGE_TEST_CASE_DIR");
    }

    static options parse(vector<string> args, options opt = options()) {
        args.insert(args.begin(), "localjudge");
        vector<const char *> argv;
        for (auto &arg : args) argv.push_back(arg.c_str());

        po::variables_map vm;
        po::store(po::parse_command_line((int)argv.size(), argv.data(), describe_options()), vm);
        po::notify(vm);
        apply_options(vm, opt);
        return opt;
    }
};

TEST_F(ConfigTest, Defaults) {
    auto opt = parse({});
    EXPECT_EQ(opt.time_limit, 3000);
    EXPECT_EQ(opt.mode, compare_mode::LENIENT);
    EXPECT_EQ(opt.max_diffs, 10);
    EXPECT_EQ(opt.repeat, 1);
    EXPECT_TRUE(opt.cases.empty());
    EXPECT_FALSE(opt.show_missing_output);
    EXPECT_FALSE(opt.show_raw_output);
    EXPECT_TRUE(opt.test_case_dir.empty());
    EXPECT_TRUE(opt.json_report.empty());
}

TEST_F(ConfigTest, ParsesCommandLine) {
    auto opt = parse({"--time", "500", "--strict", "--repeat", "3", "--cases", "1", "sample",
                      "--max-diffs=-1", "--raw", "--show-missing-output", "--dir", "data", "--json", "report.json"});
    EXPECT_EQ(opt.time_limit, 500);
    EXPECT_EQ(opt.mode, compare_mode::STRICT);
    EXPECT_EQ(opt.repeat, 3);
    EXPECT_EQ(opt.cases, vector<string>({"1", "sample"}));
    EXPECT_FALSE(opt.max_diffs);
    EXPECT_TRUE(opt.show_raw_output);
    EXPECT_TRUE(opt.show_missing_output);
    EXPECT_EQ(opt.test_case_dir.string(), "data");
    EXPECT_EQ(opt.json_report.string(), "report.json");
}

TEST_F(ConfigTest, CommandLineOverridesGivenDefaults) {
    options defaults;
    defaults.time_limit = 1000;
    defaults.repeat = 2;

    auto opt = parse({"--time", "700"}, defaults);
    EXPECT_EQ(opt.time_limit, 700);
    EXPECT_EQ(opt.repeat, 2);
}

TEST_F(ConfigTest, EnvironmentFallback) {
    setenv("LOCALJUDGE_TIME_LIMIT", "1234", 1);
    setenv("LOCALJUDGE_TEST_CASE_DIR", "/data/cases", 1);

    auto opt = parse({});
    EXPECT_EQ(opt.time_limit, 1234);
    EXPECT_EQ(opt.test_case_dir.string(), "/data/cases");

    opt = parse({"--time", "99", "--dir", "cases"});
    EXPECT_EQ(opt.time_limit, 99);
    EXPECT_EQ(opt.test_case_dir.string(), "cases");
}

TEST_F(ConfigTest, InvalidEnvironmentValueIsRejected) {
    setenv("LOCALJUDGE_TIME_LIMIT", "fast", 1);
    EXPECT_THROW(parse({}), po::error);
}

TEST_F(ConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(parse({"--time", "0"}), po::error);
    EXPECT_THROW(parse({"--time", "abc"}), po::error);
    EXPECT_THROW(parse({"--repeat", "0"}), po::error);
    EXPECT_THROW(parse({"--repeat", "-1"}), po::error);
    EXPECT_THROW(parse({"--repeat=-1"}), po::error);
    EXPECT_THROW(parse({"--unknown"}), po::error);
}

TEST_F(ConfigTest, LoadsConfigurationFile) {
    temp_dir dir;
    auto config = dir.write("config.json", R"({
        "time_limit": 700,
        "strict": true,
        "max_diffs": null,
        "repeat": 2,
        "cases": [1, "sample"],
        "show_missing_output": true,
        "test_case_dir": "cases"
    })");

    auto opt = parse({"--config", config.string()});
    EXPECT_EQ(opt.time_limit, 700);
    EXPECT_EQ(opt.mode, compare_mode::STRICT);
    EXPECT_FALSE(opt.max_diffs);
    EXPECT_EQ(opt.repeat, 2);
    EXPECT_EQ(opt.cases, vector<string>({"1", "sample"}));
    EXPECT_TRUE(opt.show_missing_output);
    EXPECT_EQ(opt.test_case_dir.string(), "cases");

    opt = parse({"--config", config.string(), "--time", "900", "--max-diffs", "3"});
    EXPECT_EQ(opt.time_limit, 900);
    EXPECT_EQ(opt.max_diffs, 3);
}

TEST_F(ConfigTest, MalformedConfigurationFileIsSetupError) {
    temp_dir dir;
    auto malformed = dir.write("malformed.json", "{ time_limit: ");
    auto wrong_type = dir.write("wrong_type.json", R"({"time_limit": "fast"})");

    EXPECT_THROW(parse({"--config", malformed.string()}), setup_error);
    EXPECT_THROW(parse({"--config", wrong_type.string()}), setup_error);
    EXPECT_THROW(parse({"--config", (dir.path() / "nonexistent.json").string()}), setup_error);
}

TEST_F(ConfigTest, RejectsNonPositiveRepeatInConfigurationFile) {
    temp_dir dir;
    auto negative = dir.write("negative.json", R"({"repeat": -1})");
    auto zero = dir.write("zero.json", R"({"repeat": 0})");

    EXPECT_THROW(parse({"--config", negative.string()}), po::error);
    EXPECT_THROW(parse({"--config", zero.string()}), po::error);
}
