#ifndef BINDER_MIME_DETECTOR_HPP
#define BINDER_MIME_DETECTOR_HPP

#include <filesystem>
#include <string>

namespace binder {

    /**
     * @brief Content-based file type detection backed by libmagic.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file.
         *
         * @param path The filesystem path to the file.
         * @return The MIME type (e.g. "application/pdf"), or an empty string
         * when libmagic or its system database is unavailable.
         */
        static std::string detect(const std::filesystem::path& path);

        /**
         * @brief Check that a file is a PDF.
         *
         * A file qualifies if it starts with the "%PDF-" signature and,
         * when libmagic can classify it, libmagic agrees.
         */
        static bool is_pdf(const std::filesystem::path& path);
    };

} // namespace binder

#endif // BINDER_MIME_DETECTOR_HPP
