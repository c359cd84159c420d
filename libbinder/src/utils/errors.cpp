#include "../../include/errors.hpp"

namespace binder {

const char* to_string(const ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::Path:          return "path";
        case ErrorKind::Conversion:    return "conversion";
        case ErrorKind::Processing:    return "processing";
        case ErrorKind::Structure:     return "structure";
        case ErrorKind::Automation:    return "automation";
        case ErrorKind::Cancelled:     return "cancelled";
    }
    return "unknown";
}

void throw_nested(const ErrorKind kind, const std::string& message,
                  const std::filesystem::path& path) {
    std::throw_with_nested(Error(kind, message, path));
}

namespace {

void collect(const std::exception& e, std::vector<std::string>& out) {
    out.emplace_back(e.what());
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& nested) {
        collect(nested, out);
    } catch (...) {
        out.emplace_back("unknown exception");
    }
}

} // namespace

std::vector<std::string> describe_chain(const std::exception_ptr& ep) {
    std::vector<std::string> out;
    if (!ep) {
        return out;
    }
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        collect(e, out);
    } catch (...) {
        out.emplace_back("unknown exception");
    }
    return out;
}

void throw_if_cancelled(const bool cancelled, const std::string_view where) {
    if (cancelled) {
        throw Error(ErrorKind::Cancelled, "cancelled during " + std::string(where));
    }
}

} // namespace binder
