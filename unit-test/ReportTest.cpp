#include <sstream>
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "judge/report.hpp"
#include "test/assertions.hpp"
#include "test/fixtures.hpp"

using namespace std;
using namespace localjudge;
using json = nlohmann::json;

class ReportTest : public ::testing::Test {
protected:
    options opt;

    static case_result make_result(const string &name, const vector<check_result> &runs) {
        case_result result;
        result.name = name;
        result.runs = runs;
        return result;
    }

    static check_result make_check(status verdict, double time, const string &output = "") {
        check_result check;
        check.verdict = verdict;
        check.run = make_run(verdict == status::RUNTIME_ERROR ? run_outcome::CRASHED : run_outcome::COMPLETED, output);
        check.run.wall_time = time;
        return check;
    }

    string print(const case_result &result) {
        stringstream ss;
        print_case_result(ss, result, opt);
        return ss.str();
    }
};

TEST_F(ReportTest, QuoteShowsInvisibleCharacters) {
    EXPECT_EQ(quote("2"), "'2'");
    EXPECT_EQ(quote("2 "), "'2 '");
    EXPECT_EQ(quote("a\tb\r"), "'a\\tb\\r'");
    EXPECT_EQ(quote("it's"), "\"it's\"");
    EXPECT_EQ(quote("'\""), "'\\'\"'");
    EXPECT_EQ(quote(string("\x01", 1)), "'\\x01'");
}

TEST_F(ReportTest, FormatTime) {
    EXPECT_EQ(format_time(make_result("1", {})), "N/A");
    EXPECT_EQ(format_time(make_result("1", {make_check(status::ACCEPTED, 1.5)})), "1.50ms");
    EXPECT_EQ(format_time(make_result("1", {make_check(status::ACCEPTED, 1),
                                            make_check(status::ACCEPTED, 2),
                                            make_check(status::ACCEPTED, 6)})),
              "3.00ms (min:1.00, max:6.00)");
}

TEST_F(ReportTest, PrintsAcceptedCase) {
    EXPECT_EQ(print(make_result("01", {make_check(status::ACCEPTED, 12.5)})),
              "[01] Status: AC | Time: 12.50ms\n" + string(40, '-') + "\n");
}

TEST_F(ReportTest, PrintsWrongAnswerDiff) {
    auto check = make_check(status::WRONG_ANSWER, 1);
    check.diffs = {{2, string("2"), string("2 ")},
                   {5, nullopt, string("extra")},
                   {6, string("6"), nullopt}};
    check.total_diffs = 5;

    string text = print(make_result("02", {check}));
    EXPECT_CONTAINS(text, "[02] Status: WA");
    EXPECT_CONTAINS(text, "  [Wrong Answer Info]\n");
    EXPECT_CONTAINS(text, "    line 2: got:    '2 '\n            expect: '2'\n");
    EXPECT_CONTAINS(text, "    line 5: got:    'extra'\n            expect: <EOF>\n");
    EXPECT_CONTAINS(text, "    Error: Insufficient output lines.\n");
    EXPECT_CONTAINS(text, "    ... and 2 more differences.\n");
}

TEST_F(ReportTest, PrintsRuntimeErrorAndTimeLimit) {
    auto crashed = make_check(status::RUNTIME_ERROR, 1);
    crashed.message = "exited with code 1";
    string text = print(make_result("re", {crashed}));
    EXPECT_CONTAINS(text, "  [Runtime Error Info]\nexited with code 1\n");

    text = print(make_result("tle", {make_check(status::TIME_LIMIT_EXCEEDED, 3000)}));
    EXPECT_CONTAINS(text, "[tle] Status: TLE | Time: 3000.00ms");
    EXPECT_CONTAINS(text, "  [Time Limit Exceeded]");
}

TEST_F(ReportTest, PrintsRawOutput) {
    auto missing = make_check(status::MISSING, 1, "42\n");
    missing.message = "expected output file is missing";
    missing.raw_output = "42\n";
    string text = print(make_result("4", {missing}));
    EXPECT_CONTAINS(text, "  [Info] expected output file is missing\n");
    EXPECT_CONTAINS(text, "  [Raw Output (Missing .out)]\n42\n\n  [End Raw Output]\n");
    EXPECT_NOT_CONTAINS(text, "  [Raw Output]\n");

    opt.show_raw_output = true;
    text = print(make_result("1", {make_check(status::ACCEPTED, 1, "1 2 3")}));
    EXPECT_CONTAINS(text, "  [Raw Output]\n1 2 3\n  [End Raw Output]\n");
}

TEST_F(ReportTest, PrintsHeaderAndSummary) {
    stringstream header;
    print_header(header, "/home/user/solution", 3);
    EXPECT_EQ(header.str(),
              "=== Running Tests on solution ===\n"
              "Target: /home/user/solution\n"
              "Cases: 3 selected\n" +
                  string(40, '-') + "\n");

    stringstream summary;
    print_summary(summary, {make_result("1", {make_check(status::ACCEPTED, 1)}),
                            make_result("2", {make_check(status::WRONG_ANSWER, 1)}),
                            make_result("3", {make_check(status::ACCEPTED, 1)})});
    EXPECT_EQ(summary.str(), "Accepted 2/3, WA: 1\n");
}

TEST_F(ReportTest, JsonReport) {
    auto check = make_check(status::WRONG_ANSWER, 2.5, "1\n");
    check.diffs = {{2, string("2"), nullopt}};
    check.total_diffs = 1;

    json expected = {
        {"name", "2"},
        {"status", "WA"},
        {"times", {2.5}},
        {"statistics", {{"average", 2.5}, {"min", 2.5}, {"max", 2.5}}},
        {"runs", {{{"status", "WA"},
                   {"time", 2.5},
                   {"exitcode", 0},
                   {"output", "1\n"},
                   {"error_output", ""},
                   {"diffs", {{{"line", 2}, {"expected", "2"}, {"actual", nullptr}}}},
                   {"total_diffs", 1},
                   {"message", ""}}}}};
    EXPECT_JSON_EQ(to_json(make_result("2", {check})), expected);

    temp_dir dir;
    auto path = dir.path() / "report.json";
    write_json_report(path, {make_result("2", {check})});
    EXPECT_JSON_EQ(json::parse(read_file_content(path)), json::array({expected}));
}
