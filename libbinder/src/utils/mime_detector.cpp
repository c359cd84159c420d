#include <magic.h>
#include "../../include/mime_detector.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <memory>

namespace binder {

namespace {

struct MagicCloser {
    void operator()(magic_set* m) const { if (m) magic_close(m); }
};
using unique_magic = std::unique_ptr<magic_set, MagicCloser>;

} // namespace

std::string MimeDetector::detect(const std::filesystem::path& path) {
    const unique_magic magic(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR));
    if (!magic) return {};
    if (magic_load(magic.get(), nullptr) != 0) {
        Logger::log(LogLevel::Debug, std::string("libmagic database unavailable: ") +
                    (magic_error(magic.get()) ? magic_error(magic.get()) : "unknown"), "MimeDetector");
        return {};
    }
    const char* mime = magic_file(magic.get(), path.c_str());
    return mime ? mime : "";
}

bool MimeDetector::is_pdf(const std::filesystem::path& path) {
    if (!has_pdf_signature(path)) {
        return false;
    }
    const std::string mime = detect(path);
    if (!mime.empty() && mime != "application/pdf") {
        Logger::log(LogLevel::Debug, path.filename().string() + " has PDF signature but libmagic says " + mime,
                    "MimeDetector");
        return false;
    }
    return true;
}

} // namespace binder
