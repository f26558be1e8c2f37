#include "judge/session.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <system_error>
#include "common/exceptions.hpp"
#include "judge/report.hpp"
#include "judge/tester.hpp"

namespace localjudge {
using namespace std;
namespace fs = std::filesystem;

int run_session(const vector<string> &command, const fs::path &work_dir, const options &opt, ostream &os) {
    vector<case_result> results;
    try {
        vector<test_case> cases = select_test_cases(opt);
        if (cases.empty()) {
            os << "[WARNING] No cases matched filter" << endl;
            return EXIT_SUCCESS;
        }

        print_header(os, command[0], cases.size());

        tester t(command, work_dir, opt);
        t.on_case_finished([&](const case_result &result) {
            print_case_result(os, result, opt);
        });
        results = t.run(cases);
        print_summary(os, results);

        if (!opt.json_report.empty()) {
            write_json_report(opt.json_report, results);
            LOG(INFO) << "Report written to " << opt.json_report;
        }
    } catch (setup_error &e) {
        LOG(ERROR) << e;
        cerr << "Error: " << e.what() << endl;
        return EXIT_FAILURE;
    } catch (system_error &e) {
        LOG(ERROR) << "Unable to write report: " << e.what();
        cerr << "Error: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    bool passed = all_of(results.begin(), results.end(), [](const case_result &result) {
        return result.verdict() == status::ACCEPTED || result.verdict() == status::MISSING;
    });
    return passed ? EXIT_SUCCESS : EXIT_FAILURE;
}

}  // namespace localjudge
