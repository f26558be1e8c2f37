#include "worker.hpp"

// 没有绑定解答函数，被评测时只能输出诊断信息
int main(int argc, char *argv[]) {
    return localjudge::run_tests(argc, argv, nullptr);
}
