#include <iostream>
#include "worker.hpp"
using namespace std;

// 读入 n，输出 n 的平方
static void solve() {
    long long n;
    cin >> n;
    cout << n * n << endl;
}

int main(int argc, char *argv[]) {
    return localjudge::run_tests(argc, argv, solve);
}
