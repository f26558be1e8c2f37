#include "judge/report.hpp"
#include <fmt/core.h>
#include <map>
#include "common/io_utils.hpp"
#include "common/status.hpp"

namespace localjudge {
using namespace std;
namespace fs = std::filesystem;
using json = nlohmann::json;

static const string separator(40, '-');

string quote(const string &s) {
    // 和 Python 的 repr 一样，只含单引号时改用双引号
    char q = (s.find('\'') != string::npos && s.find('"') == string::npos) ? '"' : '\'';
    string result(1, q);
    for (unsigned char c : s) {
        switch (c) {
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (c == q)
                    result += fmt::format("\\{}", (char)c);
                else if (c < 0x20 || c == 0x7f)
                    result += fmt::format("\\x{:02x}", (int)c);
                else
                    result += (char)c;
        }
    }
    result += q;
    return result;
}

string format_time(const case_result &result) {
    if (result.runs.empty()) return "N/A";
    if (result.runs.size() == 1) return fmt::format("{:.2f}ms", result.runs[0].run.wall_time);
    auto stat = result.statistics();
    return fmt::format("{:.2f}ms (min:{:.2f}, max:{:.2f})", stat.average, stat.min, stat.max);
}

void print_header(ostream &os, const fs::path &target, size_t case_count) {
    os << "=== Running Tests on " << target.filename().string() << " ===" << endl
       << "Target: " << target.string() << endl
       << "Cases: " << case_count << " selected" << endl
       << separator << endl;
}

static void print_raw_output(ostream &os, const char *title, const string &output) {
    os << "  [" << title << "]" << endl
       << output << endl
       << "  [End Raw Output]" << endl;
}

void print_case_result(ostream &os, const case_result &result, const options &opt) {
    os << "[" << result.name << "] Status: " << get_short_name(result.verdict()) << " | Time: " << format_time(result) << endl;

    if (!result.runs.empty()) {
        const check_result &last = result.runs.back();
        switch (last.verdict) {
            case status::WRONG_ANSWER:
                os << "  [Wrong Answer Info]" << endl;
                for (auto &diff : last.diffs) {
                    if (!diff.actual) {
                        os << "    Error: Insufficient output lines." << endl;
                        continue;
                    }
                    os << "    line " << diff.line << ": got:    " << quote(*diff.actual) << endl
                       << "            expect: " << (diff.expected ? quote(*diff.expected) : "<EOF>") << endl;
                }
                if (last.total_diffs > last.diffs.size())
                    os << "    ... and " << last.total_diffs - last.diffs.size() << " more differences." << endl;
                break;
            case status::RUNTIME_ERROR:
                os << "  [Runtime Error Info]" << endl
                   << last.message << endl;
                break;
            case status::TIME_LIMIT_EXCEEDED:
                os << "  [Time Limit Exceeded]" << endl;
                break;
            case status::MISSING:
                os << "  [Info] " << last.message << endl;
                if (last.raw_output) print_raw_output(os, "Raw Output (Missing .out)", *last.raw_output);
                break;
            default:
                break;
        }

        if (opt.show_raw_output) print_raw_output(os, "Raw Output", last.run.output);
    }

    os << separator << endl;
}

void print_summary(ostream &os, const vector<case_result> &results) {
    map<status, size_t> counts;
    for (auto &result : results) ++counts[result.verdict()];

    os << "Accepted " << counts[status::ACCEPTED] << "/" << results.size();
    for (auto &[stat, count] : counts)
        if (stat != status::ACCEPTED) os << ", " << get_short_name(stat) << ": " << count;
    os << endl;
}

template <typename T>
static json optional_to_json(const optional<T> &value) {
    if (value) return *value;
    return nullptr;
}

json to_json(const case_result &result) {
    json runs = json::array();
    for (auto &check : result.runs) {
        json diffs = json::array();
        for (auto &diff : check.diffs) {
            diffs.push_back({{"line", diff.line},
                             {"expected", optional_to_json(diff.expected)},
                             {"actual", optional_to_json(diff.actual)}});
        }

        json run = {{"status", get_short_name(check.verdict)},
                    {"time", check.run.wall_time},
                    {"exitcode", check.run.exitcode},
                    {"output", check.run.output},
                    {"error_output", check.run.error_output},
                    {"diffs", diffs},
                    {"total_diffs", check.total_diffs},
                    {"message", check.message}};
        if (check.run.signal > 0) run["signal"] = check.run.signal;
        runs.push_back(run);
    }

    auto stat = result.statistics();
    return {{"name", result.name},
            {"status", get_short_name(result.verdict())},
            {"times", result.times()},
            {"statistics", {{"average", stat.average}, {"min", stat.min}, {"max", stat.max}}},
            {"runs", runs}};
}

json to_json(const vector<case_result> &results) {
    json j = json::array();
    for (auto &result : results) j.push_back(to_json(result));
    return j;
}

void write_json_report(const fs::path &path, const vector<case_result> &results) {
    // 程序输出不一定是合法的 UTF-8，非法字节替换为 U+FFFD
    write_file_content(path, to_json(results).dump(4, ' ', false, json::error_handler_t::replace));
}

}  // namespace localjudge
