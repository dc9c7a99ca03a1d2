#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace sandbox {
using namespace std;

sandbox_exception::sandbox_exception()
    : sandbox_exception("") {}

sandbox_exception::sandbox_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *sandbox_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const sandbox_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

validation_error::validation_error(const string &message)
    : sandbox_exception(message) {}

environment_not_found::environment_not_found(const string &message)
    : sandbox_exception(message) {}

workspace_error::workspace_error(const string &message)
    : sandbox_exception(message) {}

quota_exceeded::quota_exceeded(const string &message, chrono::seconds retry_after)
    : sandbox_exception(message), retry_after(retry_after) {}

sandbox_launch_error::sandbox_launch_error(const string &message)
    : sandbox_exception(message) {}

execution_timeout::execution_timeout(const string &message)
    : sandbox_exception(message) {}

execution_error::execution_error(const string &message)
    : sandbox_exception(message) {}

permission_denied::permission_denied(const string &message)
    : sandbox_exception(message) {}

invalid_state::invalid_state(const string &message)
    : sandbox_exception(message) {}

not_found::not_found(const string &message)
    : sandbox_exception(message) {}

}  // namespace sandbox
