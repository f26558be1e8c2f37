#include "common/stl_utils.hpp"
#include <algorithm>
#include <cctype>

namespace localjudge {
using namespace std;

// 文件名可能含有 UTF-8 字符，char 为负数时不能直接传给 isdigit
static bool is_digit(char c) {
    return isdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_integer(const string &s) {
    return !s.empty() && all_of(s.begin(), s.end(), is_digit);
}

optional<unsigned long long> first_number(const string &s) {
    auto begin = find_if(s.begin(), s.end(), is_digit);
    if (begin == s.end()) return nullopt;
    auto end = find_if_not(begin, s.end(), is_digit);
    unsigned long long value = 0;
    for (auto it = begin; it != end; ++it)
        value = value * 10 + (*it - '0');
    return value;
}

static string strip_leading_zeros(const string &s) {
    auto pos = s.find_first_not_of('0');
    return pos == string::npos ? "0" : s.substr(pos);
}

bool integer_equal(const string &a, const string &b) {
    return strip_leading_zeros(a) == strip_leading_zeros(b);
}

}  // namespace localjudge
