#include "judge/checker.hpp"
#include <fmt/core.h>
#include <string.h>
#include <boost/algorithm/string.hpp>
#include <regex>
#include <sstream>

namespace localjudge {
using namespace std;

// 这些栈帧属于评测框架、boost.stacktrace 或 C++ 运行时的异常处理，对选手没有意义
static const char *const hidden_frames[] = {
    "localjudge::",
    "boost::stacktrace",
    "__cxa_",
    "__cxxabiv1",
    "__gxx_personality",
    "_Unwind_",
    "std::terminate",
    "std::_Function_handler",
    "std::function",
    "std::__invoke",
    "__libc_start"};

// boost::stacktrace 的栈帧格式为 " 3# function at file:line"
static const regex frame_line(R"(^\s*(\d+)# (.*)$)");

vector<string> split_lines(const string &text, compare_mode mode) {
    vector<string> lines;
    boost::split(lines, text, boost::is_any_of("\n"));

    if (mode == compare_mode::STRICT) return lines;

    vector<string> result;
    for (auto &line : lines) {
        boost::algorithm::trim(line);
        if (!line.empty()) result.push_back(line);
    }
    return result;
}

bool compare_output(const string &actual, const string &expected, compare_mode mode) {
    if (mode == compare_mode::STRICT) return actual == expected;
    return split_lines(actual, mode) == split_lines(expected, mode);
}

vector<diff_entry> diff_lines(const vector<string> &actual, const vector<string> &expected, optional<size_t> max_diffs, size_t &total) {
    vector<diff_entry> diffs;
    total = 0;

    auto record = [&](diff_entry &&entry) {
        ++total;
        if (!max_diffs || diffs.size() < *max_diffs)
            diffs.push_back(move(entry));
    };

    size_t lines = max(actual.size(), expected.size());
    for (size_t i = 0; i < lines; ++i) {
        if (i >= actual.size()) {
            // 程序输出提前结束，后面的行不再逐一比较
            record({i + 1, expected[i], nullopt});
            break;
        }

        if (i >= expected.size()) {
            record({i + 1, nullopt, actual[i]});
        } else if (actual[i] != expected[i]) {
            record({i + 1, expected[i], actual[i]});
        }
    }
    return diffs;
}

static bool is_hidden_frame(const string &frame) {
    // 程序入口 _start，不能按子串匹配，否则会误伤 game_start 这样的选手函数
    if (frame == "_start" || boost::algorithm::starts_with(frame, "_start ")) return true;
    for (const char *pattern : hidden_frames)
        if (frame.find(pattern) != string::npos)
            return true;
    return false;
}

string filter_trace(const string &error_output) {
    stringstream ss(error_output);
    string result, line;
    int frame_no = 0;
    while (getline(ss, line)) {
        smatch match;
        if (regex_match(line, match, frame_line)) {
            if (is_hidden_frame(match[2].str())) continue;
            result += fmt::format("{:2}# {}\n", frame_no++, match[2].str());
        } else {
            result += line + "\n";
        }
    }
    return result;
}

static string describe_crash(const runguard_result &run) {
    if (run.signal > 0)
        return fmt::format("terminated by signal {} ({})", run.signal, strsignal(run.signal));
    return fmt::format("exited with code {}", run.exitcode);
}

check_result classify(const runguard_result &run, const optional<string> &expected, const options &opt) {
    check_result result;
    result.run = run;

    if (run.outcome == run_outcome::TIMED_OUT) {
        result.verdict = status::TIME_LIMIT_EXCEEDED;
        return result;
    }

    if (run.outcome == run_outcome::CRASHED) {
        result.verdict = status::RUNTIME_ERROR;
        result.message = filter_trace(run.error_output);
        if (!result.message.empty() && result.message.back() != '\n') result.message += '\n';
        result.message += describe_crash(run);
        return result;
    }

    if (!expected) {
        result.verdict = status::MISSING;
        result.message = "expected output file is missing";
        if (opt.show_missing_output) result.raw_output = run.output;
        return result;
    }

    if (compare_output(run.output, *expected, opt.mode)) {
        result.verdict = status::ACCEPTED;
        return result;
    }

    result.verdict = status::WRONG_ANSWER;
    vector<string> actual_lines = split_lines(run.output, opt.mode);
    vector<string> expected_lines = split_lines(*expected, opt.mode);
    // 两者都以换行结尾时，换行之后的空串不算作一行
    if (opt.mode == compare_mode::STRICT &&
        boost::algorithm::ends_with(run.output, "\n") && boost::algorithm::ends_with(*expected, "\n")) {
        actual_lines.pop_back();
        expected_lines.pop_back();
    }
    result.diffs = diff_lines(actual_lines, expected_lines, opt.max_diffs, result.total_diffs);
    return result;
}

}  // namespace localjudge
