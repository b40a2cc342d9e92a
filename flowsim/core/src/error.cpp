#include <flowsim/core/error.hpp>

#include <exception>

namespace flowsim::core {

namespace {

void append_chain(std::string& out, const std::exception& error) {
    if (!out.empty()) {
        out += ": ";
    }
    out += error.what();
    try {
        std::rethrow_if_nested(error);
    } catch (const std::exception& cause) {
        append_chain(out, cause);
    } catch (...) {
        out += ": unknown exception";
    }
}

} // namespace

std::string describe_exception_chain(const std::exception& error) {
    std::string out;
    append_chain(out, error);
    return out;
}

} // namespace flowsim::core
