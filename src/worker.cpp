#include "worker.hpp"
#include <glog/logging.h>
#include <boost/core/demangle.hpp>
#include <boost/stacktrace.hpp>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <typeinfo>
#include <unistd.h>
#include "common/exceptions.hpp"
#include "env.hpp"
#include "judge/session.hpp"

namespace localjudge {
using namespace std;
namespace fs = std::filesystem;
namespace po = boost::program_options;

void worker_terminate_handler() {
    // 已经输出的答案要保留，方便对照调用栈查看程序运行到了哪里
    cout.flush();
    fflush(stdout);

    cerr << "Traceback (most recent call first):" << endl
         << boost::stacktrace::stacktrace();

    if (exception_ptr eptr = current_exception()) {
        try {
            rethrow_exception(eptr);
        } catch (exception &e) {
            cerr << boost::core::demangle(typeid(e).name()) << ": " << e.what() << endl;
        } catch (...) {
            cerr << "terminate called after throwing a non-std::exception object" << endl;
        }
    } else {
        cerr << "terminate called without an active exception" << endl;
    }

    _exit(E_RUNTIME_ERROR);
}

void run_worker(const solution_fn &solution) {
    if (!solution) {
        cerr << MISSING_CALLBACK_DIAGNOSTIC << endl;
        exit(E_INTERNAL_ERROR);
    }

    set_terminate(worker_terminate_handler);
    solution();

    cout.flush();
    fflush(stdout);
    exit(E_SUCCESS);
}

int run_tests(int argc, char *argv[], const solution_fn &solution, options opt) {
    if (is_worker_process(argc, argv)) run_worker(solution);

    if (!google::IsGoogleLoggingInitialized())
        google::InitGoogleLogging(argv[0]);

    po::options_description desc = describe_options();
    po::variables_map vm;

    try {
        // 自测程序自己的参数交给自测程序处理
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .allow_unregistered()
                      .run(),
                  vm);
        po::notify(vm);
        apply_options(vm, opt);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    } catch (setup_error &e) {
        cerr << "Error: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "Run the solution against the test cases in the test case directory" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "localjudge 1.0" << endl;
        return EXIT_SUCCESS;
    }

    error_code ec;
    fs::path self = fs::read_symlink("/proc/self/exe", ec);
    if (ec) {
        LOG(ERROR) << "Unable to locate the running executable: " << ec.message();
        cerr << "Error: unable to locate the running executable: " << ec.message() << endl;
        return EXIT_FAILURE;
    }

    if (opt.test_case_dir.empty()) opt.test_case_dir = self.parent_path() / "test_case";

    return run_session({self.string(), WORKER_FLAG}, self.parent_path(), opt, cout);
}

}  // namespace localjudge
