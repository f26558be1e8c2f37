#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace localjudge {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_short_string = boost::assign::map_list_of
    (status::ACCEPTED, "AC")
    (status::WRONG_ANSWER, "WA")
    (status::TIME_LIMIT_EXCEEDED, "TLE")
    (status::RUNTIME_ERROR, "RE")
    (status::MISSING, "MISSING");
// clang-format on

const char *get_short_name(status stat) {
    return status_short_string.at(stat);
}

}  // namespace localjudge
