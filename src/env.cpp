#include "env.hpp"
#include <cstring>
#include "common/utils.hpp"

namespace localjudge {
using namespace std;

const char *const WORKER_ENV = "LOCALJUDGE_WORKER";
const char *const WORKER_FLAG = "--localjudge-worker";
const char *const MISSING_CALLBACK_DIAGNOSTIC = "localjudge: recursive invocation or missing solution callback";

bool is_worker_process() {
    return get_env(WORKER_ENV, "") == "1";
}

bool is_worker_process(int argc, const char *const argv[]) {
    if (is_worker_process()) return true;
    for (int i = 1; i < argc; ++i)
        if (strcmp(argv[i], WORKER_FLAG) == 0)
            return true;
    return false;
}

}  // namespace localjudge
