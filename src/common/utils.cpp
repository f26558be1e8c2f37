#include "common/utils.hpp"
#include <stdlib.h>
#include <unistd.h>

extern char **environ;

namespace localjudge {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

vector<string> make_environment(const map<string, string> &overrides) {
    vector<string> env;
    for (char **it = environ; it && *it; ++it) {
        string entry(*it);
        string key = entry.substr(0, entry.find('='));
        if (!overrides.count(key))
            env.push_back(move(entry));
    }
    for (auto &[key, value] : overrides)
        env.push_back(key + "=" + value);
    return env;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::milliseconds() const {
    return duration<chrono::duration<double, milli>>().count();
}

}  // namespace localjudge
