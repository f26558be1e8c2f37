#include <iostream>
#include <stdexcept>
#include <vector>
#include "worker.hpp"
using namespace std;

// 不内联，保证调用栈中有这一帧
[[gnu::noinline]] int lookup_value(const vector<int> &values, size_t index) {
    if (index >= values.size())
        throw out_of_range("index " + to_string(index) + " out of range");
    return values[index];
}

[[gnu::noinline]] void solve() {
    vector<int> values = {1, 2, 3};
    cout << "partial" << endl;
    cout << lookup_value(values, 7) << endl;
}

int main(int argc, char *argv[]) {
    return localjudge::run_tests(argc, argv, solve);
}
