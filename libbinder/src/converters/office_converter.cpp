#include "../../include/office_converter.hpp"
#include "../../include/config.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <array>
#include <map>

namespace binder {

namespace {

constexpr std::string_view kTag = "OfficeConverter";
constexpr std::array<std::string_view, 3> kOoxmlExtensions{".docx", ".xlsx", ".pptx"};

struct ArchiveReadDeleter {
    void operator()(archive* a) const { if (a) archive_read_free(a); }
};
using unique_archive = std::unique_ptr<archive, ArchiveReadDeleter>;

void clear_directory(const std::filesystem::path& dir) {
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        std::filesystem::remove_all(entry.path(), ec);
    }
}

} // namespace

OfficeConverter::OfficeConverter(const Config& config, std::filesystem::path scratch_root)
    : command_(config.office_command),
      timeout_(config.retry.office_timeout),
      scratch_root_(std::move(scratch_root)) {}

OfficeConverter::~OfficeConverter() {
    cleanup();
}

bool OfficeConverter::is_ooxml_package(const std::filesystem::path& path) {
    const unique_archive a(archive_read_new());
    if (!a) return false;
    archive_read_support_format_zip(a.get());
    if (archive_read_open_filename(a.get(), path.c_str(), 10240) != ARCHIVE_OK) {
        return false;
    }
    archive_entry* entry = nullptr;
    int r;
    while ((r = archive_read_next_header(a.get(), &entry)) == ARCHIVE_OK) {
        const char* name = archive_entry_pathname(entry);
        if (name && std::string_view(name) == "[Content_Types].xml") {
            return true;
        }
        archive_read_data_skip(a.get());
    }
    if (r != ARCHIVE_EOF) {
        Logger::log(LogLevel::Debug,
            "libarchive: " + path.string() + ": " + (archive_error_string(a.get()) ? archive_error_string(a.get()) : "read error"),
            kTag);
    }
    return false;
}

void OfficeConverter::preflight(const std::filesystem::path& source) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(source, ec);
    if (ec) {
        throw Error(ErrorKind::Conversion, "cannot read " + source.string() + ": " + ec.message(), source);
    }
    if (size == 0) {
        throw Error(ErrorKind::Conversion, "empty document", source);
    }
    const std::string ext = lower_extension(source);
    for (const auto ooxml : kOoxmlExtensions) {
        if (ext == ooxml && !is_ooxml_package(source)) {
            throw Error(ErrorKind::Conversion, "not a valid " + ext.substr(1) + " package", source);
        }
    }
}

void OfficeConverter::convert(const std::filesystem::path& source,
                              const std::filesystem::path& output) {
    if (session_dir_.empty()) {
        session_dir_ = make_temp_dir_for(source, "office", scratch_root_);
        std::filesystem::create_directories(session_dir_ / "profile");
        std::filesystem::create_directories(session_dir_ / "out");
        Logger::log(LogLevel::Debug, "Office session at " + session_dir_.string(), kTag);
    }
    const auto out_dir = session_dir_ / "out";
    clear_directory(out_dir);

    const auto argv = expand_command(command_, {
        {"input", std::filesystem::absolute(source).string()},
        {"outdir", out_dir.string()},
        {"profile", (session_dir_ / "profile").string()},
    });

    const auto result = process_.run(argv, timeout_);
    if (result.timed_out) {
        throw Error(ErrorKind::Automation,
            "office conversion timed out after " + std::to_string(timeout_.count()) + "s", source);
    }
    if (result.exit_code != 0) {
        throw Error(ErrorKind::Conversion,
            "office suite exited with code " + std::to_string(result.exit_code), source);
    }

    auto produced = out_dir / source.stem();
    produced += ".pdf";
    std::error_code ec;
    if (!std::filesystem::is_regular_file(produced, ec)) {
        throw Error(ErrorKind::Conversion, "office suite produced no PDF", source);
    }
    move_file(produced, output);
}

void OfficeConverter::set_scratch_root(const std::filesystem::path& dir) {
    cleanup();
    scratch_root_ = dir;
}

void OfficeConverter::cleanup() noexcept {
    process_.terminate();
    if (!session_dir_.empty()) {
        cleanup_temp_dir(session_dir_, kTag);
        session_dir_.clear();
    }
}

} // namespace binder
