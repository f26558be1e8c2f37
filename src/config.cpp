#include "config.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace localjudge {
using namespace std;
namespace po = boost::program_options;

po::options_description describe_options() {
    po::options_description desc("localjudge options");

    // clang-format off
    desc.add_options()
        ("dir,d", po::value<string>(), "set the test case directory containing *.in and *.out files, default to test_case next to the tested program. You can either pass it from environ LOCALJUDGE_TEST_CASE_DIR")
        ("time,t", po::value<int>(), "set wall time limit in milliseconds, default to 3000. You can either pass it from environ LOCALJUDGE_TIME_LIMIT")
        ("strict", "compare output byte by byte instead of ignoring surrounding whitespace and blank lines")
        ("repeat,r", po::value<int>(), "run each test case the given times to measure the stability of run time, default to 1")
        ("cases,c", po::value<vector<string>>()->multitoken(), "run only the given test cases (e.g. \"1 02 sample\"), numbers match numeric case names, other tokens match substrings")
        ("raw", "display the output of the program for every test case")
        ("max-diffs", po::value<int>(), "set the maximum number of different lines displayed for wrong answers, default to 10, negative for unlimited")
        ("show-missing-output", "display the output of the program when the expected output file is missing")
        ("json", po::value<string>(), "write the results in JSON format to file")
        ("config", po::value<string>(), "load options from a JSON configuration file, command line options take precedence")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    return desc;
}

static size_t to_repeat(int repeat) {
    if (repeat <= 0)
        throw po::validation_error(po::validation_error::invalid_option_value, "repeat", to_string(repeat));
    return repeat;
}

static void validate_options(const options &opt) {
    if (opt.time_limit <= 0)
        throw po::validation_error(po::validation_error::invalid_option_value, "time", to_string(opt.time_limit));
    if (opt.repeat == 0)
        throw po::validation_error(po::validation_error::invalid_option_value, "repeat", "0");
}

void load_options(const filesystem::path &config_file, options &opt) {
    if (!filesystem::is_regular_file(config_file))
        throw setup_error(fmt::format("Configuration file {} does not exist", config_file));

    try {
        nlohmann::json j = nlohmann::json::parse(read_file_content(config_file));
        if (j.contains("time_limit")) opt.time_limit = j.at("time_limit").get<int>();
        if (j.contains("strict")) opt.mode = j.at("strict").get<bool>() ? compare_mode::STRICT : compare_mode::LENIENT;
        if (j.contains("max_diffs")) {
            auto &max_diffs = j.at("max_diffs");
            if (max_diffs.is_null() || max_diffs.get<int>() < 0)
                opt.max_diffs = nullopt;
            else
                opt.max_diffs = max_diffs.get<size_t>();
        }
        if (j.contains("repeat")) opt.repeat = to_repeat(j.at("repeat").get<int>());
        if (j.contains("cases")) {
            opt.cases.clear();
            // 和 Python 版本的习惯一致，允许直接写数字
            for (auto &token : j.at("cases"))
                opt.cases.push_back(token.is_number() ? to_string(token.get<long long>()) : token.get<string>());
        }
        if (j.contains("show_missing_output")) opt.show_missing_output = j.at("show_missing_output").get<bool>();
        if (j.contains("show_raw_output")) opt.show_raw_output = j.at("show_raw_output").get<bool>();
        if (j.contains("test_case_dir")) opt.test_case_dir = j.at("test_case_dir").get<string>();
        if (j.contains("json_report")) opt.json_report = j.at("json_report").get<string>();
    } catch (nlohmann::json::exception &e) {
        throw setup_error(fmt::format("Configuration file {} is malformed: {}", config_file, e.what()));
    }

    LOG(INFO) << "Loaded configuration file " << config_file;
}

void apply_options(const po::variables_map &vm, options &opt) {
    if (vm.count("config")) {
        load_options(vm.at("config").as<string>(), opt);
    }

    if (vm.count("dir")) {
        opt.test_case_dir = vm.at("dir").as<string>();
    } else if (getenv("LOCALJUDGE_TEST_CASE_DIR")) {
        opt.test_case_dir = get_env("LOCALJUDGE_TEST_CASE_DIR", "");
    }

    if (vm.count("time")) {
        opt.time_limit = vm.at("time").as<int>();
    } else if (getenv("LOCALJUDGE_TIME_LIMIT")) {
        string value = get_env("LOCALJUDGE_TIME_LIMIT", "");
        try {
            opt.time_limit = boost::lexical_cast<int>(value);
        } catch (boost::bad_lexical_cast &) {
            throw po::validation_error(po::validation_error::invalid_option_value, "LOCALJUDGE_TIME_LIMIT", value);
        }
    }

    if (vm.count("strict")) opt.mode = compare_mode::STRICT;
    if (vm.count("repeat")) opt.repeat = to_repeat(vm.at("repeat").as<int>());
    if (vm.count("cases")) opt.cases = vm.at("cases").as<vector<string>>();
    if (vm.count("raw")) opt.show_raw_output = true;
    if (vm.count("show-missing-output")) opt.show_missing_output = true;
    if (vm.count("json")) opt.json_report = vm.at("json").as<string>();

    if (vm.count("max-diffs")) {
        int max_diffs = vm.at("max-diffs").as<int>();
        if (max_diffs < 0)
            opt.max_diffs = nullopt;
        else
            opt.max_diffs = max_diffs;
    }

    validate_options(opt);
}

}  // namespace localjudge
