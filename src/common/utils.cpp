#include "common/utils.hpp"
#include <time.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace arena {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

string iso8601_now() {
    time_t now = chrono::system_clock::to_time_t(chrono::system_clock::now());
    struct tm tm;
    gmtime_r(&now, &tm);
    stringstream ss;
    ss << put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

chrono::system_clock::time_point parse_iso8601(const string &text) {
    // Docker 返回的时间形如 2024-01-01T00:00:00.123456789Z，这里只需要精确到秒
    struct tm tm = {};
    istringstream ss(text);
    ss >> get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) return chrono::system_clock::time_point{};
    return chrono::system_clock::from_time_t(timegm(&tm));
}

string random_uuid() {
    return boost::lexical_cast<string>(boost::uuids::random_generator()());
}

const char *const truncation_marker = "\n[Logs truncated due to size limit]\n";

bool truncate_output(string &text, size_t limit) {
    if (text.size() <= limit) return false;
    text.resize(limit);
    text += truncation_marker;
    return true;
}

}  // namespace arena
