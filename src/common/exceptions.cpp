#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace localjudge {
using namespace std;

localjudge_exception::localjudge_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *localjudge_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const localjudge_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

setup_error::setup_error(const string &message)
    : localjudge_exception(message) {}

missing_callback_error::missing_callback_error(const string &message)
    : setup_error(message) {}

}  // namespace localjudge
