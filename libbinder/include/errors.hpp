/**
 * @file errors.hpp
 * @brief Exception type and error taxonomy shared by all libbinder components.
 */

#ifndef BINDER_ERRORS_HPP
#define BINDER_ERRORS_HPP

#include <exception>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace binder {

/**
 * @brief Category of a failure.
 *
 * Cancelled is not a failure from the caller's point of view; it travels
 * as an exception internally so that every stage unwinds the same way,
 * and the orchestrator turns it into a distinct outcome.
 */
enum class ErrorKind {
    Configuration, ///< Bad or missing setting, detected before any file I/O
    Path,          ///< Missing directory, unreadable or unwritable file
    Conversion,    ///< A single source file could not be converted
    Processing,    ///< A PDF primitive failed (corrupt fragment, write error)
    Structure,     ///< Invalid document structure (TOC nesting, empty section)
    Automation,    ///< External converter process is in an unrecoverable state
    Cancelled      ///< Cooperative cancellation was observed
};

/// @return Stable lowercase name of an ErrorKind (e.g. "processing").
const char* to_string(ErrorKind kind) noexcept;

/**
 * @brief The single exception type thrown by libbinder.
 *
 * Lower-level causes are attached with std::throw_with_nested and can be
 * recovered with describe_chain().
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message, std::filesystem::path path = {})
        : std::runtime_error(message), kind_(kind), path_(std::move(path)) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

    /// @return The file or directory the error is about, if any.
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    ErrorKind kind_;
    std::filesystem::path path_;
};

/**
 * @brief Throw an Error that wraps the exception currently being handled.
 *
 * Must be called from inside a catch block.
 */
[[noreturn]] void throw_nested(ErrorKind kind, const std::string& message,
                               const std::filesystem::path& path = {});

/**
 * @brief Flatten an exception and all nested causes into messages.
 * @param ep The outermost exception.
 * @return Messages from outermost to innermost.
 */
std::vector<std::string> describe_chain(const std::exception_ptr& ep);

/// @throws Error(ErrorKind::Cancelled) when @p cancelled is true.
void throw_if_cancelled(bool cancelled, std::string_view where);

} // namespace binder

#endif // BINDER_ERRORS_HPP
