#include <glog/logging.h>
#include <boost/program_options.hpp>
#include <filesystem>
#include <iostream>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "env.hpp"
#include "judge/session.hpp"
#include "worker.hpp"
using namespace std;

int main(int argc, char* argv[]) {
    // localjudge 被当成待测程序启动时，没有可以调用的解答函数，输出诊断信息后退出
    if (localjudge::is_worker_process(argc, argv)) localjudge::run_worker(nullptr);

    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc = localjudge::describe_options();
    po::options_description hidden;
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    hidden.add_options()
        ("cmd", po::value<vector<string>>(), "the program to be tested and its arguments");
    // clang-format on
    positional.add("cmd", -1);

    po::options_description all;
    all.add(desc).add(hidden);

    localjudge::options opt;
    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(all)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
        localjudge::apply_options(vm, opt);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    } catch (localjudge::setup_error& e) {
        LOG(ERROR) << e;
        cerr << "Error: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "localjudge: run a program against local test cases like an online judge" << endl
             << "Each test case is a pair of files NAME.in and NAME.out in the test case directory." << endl
             << "The program reads NAME.in from stdin and its stdout is compared with NAME.out." << endl
             << "Usage: " << argv[0] << " [options] [--] program [args...]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "localjudge 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (!vm.count("cmd")) {
        cerr << "the program to be tested is required" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    vector<string> command = vm.at("cmd").as<vector<string>>();
    filesystem::path target = filesystem::absolute(command[0]);
    if (!filesystem::is_regular_file(target)) {
        LOG(ERROR) << "Target program " << target << " does not exist";
        cerr << "Error: Target program not found: " << target.string() << endl;
        return EXIT_FAILURE;
    }
    command[0] = target.string();

    if (opt.test_case_dir.empty()) opt.test_case_dir = target.parent_path() / "test_case";

    return localjudge::run_session(command, target.parent_path(), opt, cout);
}
