#ifndef BINDER_FILE_UTILS_HPP
#define BINDER_FILE_UTILS_HPP

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace binder {

    struct FileCloser {
        void operator()(FILE* f) const { if (f) std::fclose(f); }
    };
    using unique_FILE = std::unique_ptr<FILE, FileCloser>;

    /**
     * @brief Opens a file with C stdio.
     * @param path The path to the file.
     * @param mode The fopen mode string (e.g. "rb", "wb").
     * @return Owning FILE handle, null if the open failed.
     */
    unique_FILE open_file(const std::filesystem::path& path, const char* mode);

    /**
     * @brief Creates a unique directory "binder-{prefix}/{prefix}_{stem}_{random}"
     * under @p base (the system temp directory when empty).
     * @throws Error(ErrorKind::Path) if the directory cannot be created.
     */
    std::filesystem::path make_temp_dir_for(const std::filesystem::path& input_path,
                                            const std::string& prefix,
                                            const std::filesystem::path& base = {});

    /**
     * @brief Recursively removes a directory, logging instead of throwing.
     * @return True if the directory no longer exists.
     */
    bool cleanup_temp_dir(const std::filesystem::path& dir,
                          std::string_view tag = "file_utils") noexcept;

    /// @return Lowercased extension including the dot (".docx"), empty if none.
    std::string lower_extension(const std::filesystem::path& path);

    /// @return ASCII-lowercased copy of @p s; non-ASCII bytes are kept.
    std::string ascii_lower(std::string_view s);

    /// @return True if the file starts with "%PDF-".
    bool has_pdf_signature(const std::filesystem::path& path);

    /**
     * @brief Moves a file, falling back to copy and remove across filesystems.
     * @throws Error(ErrorKind::Path) if neither works.
     */
    void move_file(const std::filesystem::path& from, const std::filesystem::path& to);

    /**
     * @brief Waits until @p path exists with a non-zero size that stays the
     * same for @p stable_polls consecutive polls.
     * @return False if that did not happen within @p timeout.
     */
    bool wait_for_stable_file(const std::filesystem::path& path,
                              std::chrono::milliseconds timeout,
                              int stable_polls,
                              std::chrono::milliseconds interval = std::chrono::milliseconds(200));

    /**
     * @brief Owns a temporary directory for the lifetime of the object.
     *
     * The directory and everything under it is removed on destruction,
     * on every exit path.
     */
    class ScopedTempDir {
    public:
        ScopedTempDir(const std::filesystem::path& input_path,
                      const std::string& prefix,
                      const std::filesystem::path& base = {})
            : path_(make_temp_dir_for(input_path, prefix, base)) {}

        ~ScopedTempDir() { remove(); }

        ScopedTempDir(const ScopedTempDir&) = delete;
        ScopedTempDir& operator=(const ScopedTempDir&) = delete;

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

        /// Remove now. Safe to call more than once.
        void remove() noexcept {
            if (!path_.empty()) {
                cleanup_temp_dir(path_, "ScopedTempDir");
                path_.clear();
            }
        }

    private:
        std::filesystem::path path_;
    };

} // namespace binder

#endif // BINDER_FILE_UTILS_HPP
