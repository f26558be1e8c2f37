#include "judge/tester.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <numeric>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "env.hpp"

namespace localjudge {
using namespace std;
namespace fs = std::filesystem;

time_statistics summarize(const vector<double> &times) {
    time_statistics stat;
    if (times.empty()) return stat;
    stat.average = accumulate(times.begin(), times.end(), 0.0) / times.size();
    stat.min = *min_element(times.begin(), times.end());
    stat.max = *max_element(times.begin(), times.end());
    return stat;
}

status case_result::verdict() const {
    if (runs.empty()) return status::ACCEPTED;
    return runs.back().verdict;
}

vector<double> case_result::times() const {
    vector<double> result;
    for (auto &run : runs) result.push_back(run.run.wall_time);
    return result;
}

time_statistics case_result::statistics() const {
    return summarize(times());
}

tester::tester(vector<string> command, fs::path work_dir, const options &opt)
    : command(move(command)), work_dir(move(work_dir)), opt(opt) {}

void tester::on_case_finished(function<void(const case_result &)> callback) {
    case_finished.push_back(move(callback));
}

void tester::fire_case_finished(const case_result &result) {
    for (auto &callback : case_finished)
        callback(result);
}

runguard_result tester::execute(const string &input) {
    runguard_options run_opt;
    run_opt.command = command;
    run_opt.input = input;
    run_opt.time_limit = opt.time_limit;
    run_opt.work_dir = work_dir;
    // 不论待测程序是什么，都要告诉它处于 worker 模式，防止它再次启动评测流程
    run_opt.env[WORKER_ENV] = "1";

    runguard_result result;
    try {
        result = runit(run_opt);
    } catch (runtime_error &e) {
        throw setup_error(fmt::format("Unable to run {}: {}", command[0], e.what()));
    }

    if (result.outcome == run_outcome::CRASHED && result.exitcode == E_INTERNAL_ERROR &&
        result.error_output.find(MISSING_CALLBACK_DIAGNOSTIC) != string::npos) {
        throw missing_callback_error(fmt::format("{} is running in worker mode without a solution callback", command[0]));
    }
    return result;
}

case_result tester::run_case(const test_case &tc) {
    case_result result;
    result.name = tc.name;

    for (size_t i = 0; i < opt.repeat; ++i) {
        check_result check = classify(execute(tc.input), tc.expected, opt);
        LOG(INFO) << fmt::format("Test case [{}] run #{}: {} in {:.2f} ms", tc.name, i + 1, get_short_name(check.verdict), check.run.wall_time);

        bool accepted = check.verdict == status::ACCEPTED;
        result.runs.push_back(move(check));
        if (!accepted) break;
    }
    return result;
}

vector<case_result> tester::run(const vector<test_case> &cases) {
    vector<case_result> results;
    for (auto &tc : cases) {
        results.push_back(run_case(tc));
        fire_case_finished(results.back());
    }
    return results;
}

vector<test_case> select_test_cases(const options &opt) {
    vector<test_case> all_cases;
    try {
        all_cases = collect_test_cases(opt.test_case_dir);
    } catch (system_error &e) {
        throw setup_error(fmt::format("Unable to load test cases from {}: {}", opt.test_case_dir, e.what()));
    }

    if (all_cases.empty() && opt.cases.empty())
        throw setup_error(fmt::format("No .in files found in {}", opt.test_case_dir));

    vector<test_case> selected = filter_test_cases(all_cases, opt.cases);
    if (!opt.cases.empty() && selected.empty())
        LOG(WARNING) << "No cases matched filter: " << boost::algorithm::join(opt.cases, " ");
    return selected;
}

}  // namespace localjudge
