#include "judge/case_repository.hpp"
#include <glog/logging.h>
#include <algorithm>
#include "common/io_utils.hpp"
#include "common/stl_utils.hpp"

namespace localjudge {
using namespace std;
namespace fs = std::filesystem;

static bool case_order(const test_case &a, const test_case &b) {
    auto na = first_number(a.name), nb = first_number(b.name);
    if (na && nb) {
        if (*na != *nb) return *na < *nb;
        return a.name < b.name;
    }
    if (na || nb) return (bool)na;
    return a.name < b.name;
}

vector<test_case> collect_test_cases(const fs::path &dir) {
    vector<test_case> cases;
    if (!fs::is_directory(dir)) {
        LOG(WARNING) << "Test case directory " << dir << " does not exist";
        return cases;
    }

    for (auto &entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".in") continue;

        test_case tc;
        tc.name = entry.path().stem().string();
        tc.input_path = entry.path();
        tc.input = read_file_content(entry.path());
        tc.expected = read_file_content_if_exists(fs::path(entry.path()).replace_extension(".out"));
        cases.push_back(move(tc));
    }

    sort(cases.begin(), cases.end(), case_order);
    return cases;
}

bool match_case(const string &name, const string &token) {
    if (is_integer(token))
        return is_integer(name) && integer_equal(name, token);
    return name.find(token) != string::npos;
}

vector<test_case> filter_test_cases(const vector<test_case> &cases, const vector<string> &tokens) {
    if (tokens.empty()) return cases;

    vector<test_case> result;
    for (auto &tc : cases) {
        bool matched = any_of(tokens.begin(), tokens.end(), [&](const string &token) {
            return match_case(tc.name, token);
        });
        if (matched) result.push_back(tc);
    }
    return result;
}

}  // namespace localjudge
