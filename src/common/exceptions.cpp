#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace arena {
using namespace std;

arena_exception::arena_exception()
    : arena_exception("") {}

arena_exception::arena_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *arena_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const arena_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : arena_exception() {}

internal_error::internal_error(const string &message)
    : arena_exception(message) {}

network_error::network_error()
    : arena_exception() {}

network_error::network_error(const string &message)
    : arena_exception(message) {}

queue_error::queue_error()
    : arena_exception() {}

queue_error::queue_error(const string &message)
    : arena_exception(message) {}

engine_error::engine_error(long status_code, const string &message)
    : arena_exception(message), status_code(status_code) {}

}  // namespace arena
