#include "test/fixtures.hpp"
#include <fmt/core.h>
#include <stdlib.h>
#include <cerrno>
#include <chrono>
#include <system_error>
#include <thread>
#include "common/io_utils.hpp"

namespace localjudge {
using namespace std;
namespace fs = std::filesystem;

temp_dir::temp_dir() {
    string pattern = (fs::temp_directory_path() / "localjudge-test-XXXXXX").string();
    if (!mkdtemp(pattern.data()))
        throw system_error(errno, system_category(), "unable to create temporary directory");
    dir = fs::canonical(pattern);
}

temp_dir::~temp_dir() {
    error_code ec;
    fs::remove_all(dir, ec);
}

const fs::path &temp_dir::path() const {
    return dir;
}

fs::path temp_dir::write(const string &name, const string &content) const {
    fs::path file = dir / name;
    fs::create_directories(file.parent_path());
    write_file_content(file, content);
    return file;
}

runguard_result make_run(run_outcome outcome, const string &output, const string &error_output, int exitcode, int signal) {
    runguard_result run;
    run.outcome = outcome;
    run.output = output;
    run.error_output = error_output;
    run.wall_time = 1;
    run.exitcode = exitcode;
    run.signal = signal;
    return run;
}

static bool is_running(pid_t pid) {
    optional<string> stat;
    try {
        stat = read_file_content_if_exists(fmt::format("/proc/{}/stat", pid));
    } catch (system_error &) {
        // 进程在检查和读取之间退出
        return false;
    }
    if (!stat) return false;
    // /proc/[pid]/stat: "pid (comm) state ..."，comm 中可能含有空格和括号
    auto pos = stat->rfind(')');
    return pos != string::npos && pos + 2 < stat->size() && (*stat)[pos + 2] != 'Z';
}

bool process_alive(pid_t pid, int timeout_ms) {
    auto deadline = chrono::steady_clock::now() + chrono::milliseconds(timeout_ms);
    while (is_running(pid)) {
        if (chrono::steady_clock::now() >= deadline) return true;
        this_thread::sleep_for(chrono::milliseconds(10));
    }
    return false;
}

}  // namespace localjudge
