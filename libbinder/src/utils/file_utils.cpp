#include "../../include/file_utils.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <system_error>
#include <thread>

namespace binder {

    unique_FILE open_file(const std::filesystem::path& path, const char* mode) {
        return unique_FILE(std::fopen(path.c_str(), mode));
    }

    std::filesystem::path make_temp_dir_for(const std::filesystem::path& input_path,
                                            const std::string& prefix,
                                            const std::filesystem::path& base) {
        std::error_code ec;
        const auto root = base.empty() ? std::filesystem::temp_directory_path(ec) : base;
        if (ec) {
            throw Error(ErrorKind::Path, "no usable temp directory (" + ec.message() + ")");
        }
        const auto base_tmp = root / ("binder-" + prefix);

        std::string stem = input_path.stem().string();
        if (stem.size() > 32) stem.resize(32);
        auto dir = base_tmp / (prefix + "_" + stem + "_" + RandomUtils::random_suffix());

        std::filesystem::create_directories(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Error,
                "Failed to create temp dir: " + dir.string() + " (" + ec.message() + ")",
                "file_utils");
            throw Error(ErrorKind::Path, "cannot create temp dir " + dir.string() + ": " + ec.message(), dir);
        }
        return dir;
    }

    bool cleanup_temp_dir(const std::filesystem::path& dir, const std::string_view tag) noexcept {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove temp dir: " + dir.string() + " (" + ec.message() + ")", tag);
            return false;
        }
        Logger::log(LogLevel::Debug, "Removed temp dir: " + dir.string(), tag);
        // drop the shared "binder-*" parent once it is empty
        const auto parent = dir.parent_path();
        if (parent.filename().string().starts_with("binder-")) {
            std::filesystem::remove(parent, ec);
        }
        return true;
    }

    std::string ascii_lower(const std::string_view s) {
        std::string out(s);
        std::ranges::transform(out, out.begin(), [](const unsigned char c) {
            return c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c);
        });
        return out;
    }

    std::string lower_extension(const std::filesystem::path& path) {
        return ascii_lower(path.extension().string());
    }

    bool has_pdf_signature(const std::filesystem::path& path) {
        const auto f = open_file(path, "rb");
        if (!f) return false;
        std::array<char, 5> head{};
        if (std::fread(head.data(), 1, head.size(), f.get()) != head.size()) return false;
        return std::memcmp(head.data(), "%PDF-", head.size()) == 0;
    }

    void move_file(const std::filesystem::path& from, const std::filesystem::path& to) {
        std::error_code ec;
        std::filesystem::rename(from, to, ec);
        if (!ec) return;
        // rename fails across devices, e.g. when the temp root is a tmpfs
        std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            throw Error(ErrorKind::Path, "cannot move " + from.string() + " to " + to.string() + ": " + ec.message(), to);
        }
        std::filesystem::remove(from, ec);
    }

    bool wait_for_stable_file(const std::filesystem::path& path,
                              const std::chrono::milliseconds timeout,
                              const int stable_polls,
                              const std::chrono::milliseconds interval) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        std::uintmax_t last_size = 0;
        int unchanged = 0;
        while (true) {
            std::error_code ec;
            const auto size = std::filesystem::file_size(path, ec);
            if (!ec && size > 0) {
                unchanged = (size == last_size) ? unchanged + 1 : 0;
                last_size = size;
                if (unchanged >= stable_polls) return true;
            } else {
                unchanged = 0;
                last_size = 0;
            }
            if (std::chrono::steady_clock::now() >= deadline) return false;
            std::this_thread::sleep_for(interval);
        }
    }

} // namespace binder
