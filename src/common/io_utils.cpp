#include "common/io_utils.hpp"
#include <cerrno>
#include <fstream>
#include <iterator>
#include <system_error>

namespace localjudge {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path, ios::in | ios::binary);
    if (!fin)
        throw system_error(errno, system_category(), "unable to read file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

optional<string> read_file_content_if_exists(const fs::path &path) {
    if (!fs::exists(path)) {
        return nullopt;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::out | ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to write file " + path.string());
    fout << content;
    if (!fout)
        throw system_error(errno, system_category(), "error when writing file " + path.string());
}

}  // namespace localjudge
