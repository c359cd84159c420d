#include "../../include/atomic_file.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <system_error>

namespace binder {

namespace {

constexpr std::string_view kTag = "AtomicFile";

// owns the scratch file until it has been promoted
struct ScratchGuard {
    std::filesystem::path path;
    bool armed = false;

    ~ScratchGuard() {
        if (!armed) return;
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove scratch file " + path.string() + ": " + ec.message(), kTag);
        } else {
            Logger::log(LogLevel::Debug, "Discarded scratch file " + path.string(), kTag);
        }
    }
};

} // namespace

std::filesystem::path scratch_path_for(const std::filesystem::path& target, const std::string_view suffix) {
    auto scratch = target;
    scratch += std::string(suffix);
    return scratch;
}

void atomic_replace(const std::filesystem::path& target,
                    const FileProducer& producer,
                    const std::string_view suffix) {
    if (target.empty()) {
        throw Error(ErrorKind::Path, "empty target path");
    }
    const auto dir = target.has_parent_path() ? target.parent_path() : std::filesystem::path(".");
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        throw Error(ErrorKind::Path, "target directory does not exist: " + dir.string(), dir);
    }

    ScratchGuard guard{scratch_path_for(target, suffix)};

    // a scratch file left by an interrupted run is never promoted
    std::filesystem::remove(guard.path, ec);

    guard.armed = true;
    producer(guard.path);

    const auto size = std::filesystem::file_size(guard.path, ec);
    if (ec) {
        throw Error(ErrorKind::Processing, "nothing was written for " + target.string(), target);
    }
    if (size == 0) {
        throw Error(ErrorKind::Processing, "empty content produced for " + target.string(), target);
    }

    std::filesystem::rename(guard.path, target, ec);
    if (ec) {
        throw Error(ErrorKind::Path, "cannot replace " + target.string() + ": " + ec.message(), target);
    }
    guard.armed = false;
    Logger::log(LogLevel::Debug, "Replaced " + target.string(), kTag);
}

void atomic_copy(const std::filesystem::path& source, const std::filesystem::path& target) {
    atomic_replace(target, [&source](const std::filesystem::path& scratch) {
        std::error_code ec;
        std::filesystem::copy_file(source, scratch, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            throw Error(ErrorKind::Path, "cannot copy " + source.string() + ": " + ec.message(), source);
        }
    });
}

} // namespace binder
