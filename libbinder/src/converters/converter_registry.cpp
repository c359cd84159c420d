#include "../../include/converter_registry.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/image_converter.hpp"
#include "../../include/legacy_converter.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/office_converter.hpp"
#include "../../include/pdf_passthrough_converter.hpp"
#include <algorithm>
#include <condition_variable>
#include <cstdio>
#include <functional>
#include <mutex>

namespace binder {

namespace {

constexpr std::string_view kTag = "ConverterRegistry";

constexpr std::array<std::pair<std::string_view, ConverterKind>, 19> kExtensions{{
    {".doc", ConverterKind::OfficeDocument},
    {".docx", ConverterKind::OfficeDocument},
    {".xls", ConverterKind::OfficeDocument},
    {".xlsx", ConverterKind::OfficeDocument},
    {".ppt", ConverterKind::OfficeDocument},
    {".pptx", ConverterKind::OfficeDocument},
    {".rtf", ConverterKind::OfficeDocument},
    {".odt", ConverterKind::OfficeDocument},
    {".ods", ConverterKind::OfficeDocument},
    {".odp", ConverterKind::OfficeDocument},
    {".jpg", ConverterKind::Image},
    {".jpeg", ConverterKind::Image},
    {".png", ConverterKind::Image},
    {".bmp", ConverterKind::Image},
    {".tif", ConverterKind::Image},
    {".tiff", ConverterKind::Image},
    {".jtd", ConverterKind::LegacyWordProcessor},
    {".jtt", ConverterKind::LegacyWordProcessor},
    {".pdf", ConverterKind::PdfPassthrough},
}};

constexpr std::array<std::string_view, 3> kMetadataFiles{"thumbs.db", "desktop.ini", ".ds_store"};

// sleeps for dur unless stop is requested first
void cancellable_wait(const std::stop_token& stop, const std::chrono::milliseconds dur) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lock(m);
    cv.wait_for(lock, stop, dur, [] { return false; });
}

void remove_quietly(const std::filesystem::path& p) {
    std::error_code ec;
    std::filesystem::remove(p, ec);
}

} // namespace

const char* to_string(const ConverterKind kind) noexcept {
    switch (kind) {
        case ConverterKind::OfficeDocument: return "office";
        case ConverterKind::Image: return "image";
        case ConverterKind::LegacyWordProcessor: return "legacy";
        case ConverterKind::PdfPassthrough: return "pdf";
    }
    return "unknown";
}

const char* to_string(const ConversionFailure failure) noexcept {
    switch (failure) {
        case ConversionFailure::Unsupported: return "unsupported";
        case ConversionFailure::Ignored: return "ignored";
        case ConversionFailure::InvalidInput: return "invalid-input";
        case ConversionFailure::ConversionFailed: return "conversion-failed";
        case ConversionFailure::InvalidOutput: return "invalid-output";
    }
    return "unknown";
}

ConverterRegistry::ConverterRegistry(const Config& config, std::filesystem::path scratch_root)
    : config_(config), scratch_root_(std::move(scratch_root)) {
    converters_[static_cast<std::size_t>(ConverterKind::OfficeDocument)] =
        std::make_unique<OfficeConverter>(config_, scratch_root_);
    converters_[static_cast<std::size_t>(ConverterKind::Image)] = std::make_unique<ImageConverter>();
    converters_[static_cast<std::size_t>(ConverterKind::LegacyWordProcessor)] =
        std::make_unique<LegacyConverter>(config_);
    converters_[static_cast<std::size_t>(ConverterKind::PdfPassthrough)] =
        std::make_unique<PdfPassthroughConverter>();
}

ConverterRegistry::~ConverterRegistry() {
    cleanup_all();
}

void ConverterRegistry::set_scratch_root(const std::filesystem::path& dir) {
    cleanup_all();
    scratch_root_ = dir;
    for (const auto& c : converters_) {
        if (c) c->set_scratch_root(scratch_root_);
    }
}

std::span<const std::pair<std::string_view, ConverterKind>> ConverterRegistry::extension_table() noexcept {
    return kExtensions;
}

std::optional<ConverterKind> ConverterRegistry::kind_for(const std::filesystem::path& path) {
    const std::string ext = lower_extension(path);
    for (const auto& [e, kind] : kExtensions) {
        if (e == ext) return kind;
    }
    return std::nullopt;
}

bool ConverterRegistry::is_ignorable(const std::filesystem::path& path) {
    const std::string name = path.filename().string();
    if (name.empty()) return true;
    if (name.starts_with(".") || name.starts_with("~$")) return true;
    if (path.extension().string().starts_with(".$")) return true;
    const std::string lower = ascii_lower(name);
    for (const auto m : kMetadataFiles) {
        if (lower == m) return true;
    }
    return false;
}

std::string ConverterRegistry::unique_output_name(const std::filesystem::path& source) {
    std::error_code ec;
    auto abs = std::filesystem::absolute(source, ec);
    if (ec) abs = source;
    const auto h = std::hash<std::string>{}(abs.lexically_normal().string());
    char hex[9];
    std::snprintf(hex, sizeof(hex), "%08x", static_cast<unsigned>(h & 0xffffffffu));
    return source.stem().string() + "_" + hex + ".pdf";
}

void ConverterRegistry::replace(const ConverterKind kind, std::unique_ptr<IConverter> converter) {
    if (!converter) {
        throw Error(ErrorKind::Configuration, std::string("null converter for ") + to_string(kind));
    }
    auto& slot = converters_[static_cast<std::size_t>(kind)];
    if (slot) slot->cleanup();
    converter->set_scratch_root(scratch_root_);
    slot = std::move(converter);
}

IConverter& ConverterRegistry::converter(const ConverterKind kind) const {
    return *converters_[static_cast<std::size_t>(kind)];
}

ConversionResult ConverterRegistry::convert(const std::filesystem::path& source,
                                            const std::filesystem::path& output,
                                            const std::stop_token stop) {
    ConversionResult result;
    result.source_path = source;

    if (is_ignorable(source)) {
        result.failure_reason = ConversionFailure::Ignored;
        return result;
    }
    const auto kind = kind_for(source);
    if (!kind) {
        result.failure_reason = ConversionFailure::Unsupported;
        result.message = "unsupported extension '" + source.extension().string() + "'";
        return result;
    }

    IConverter& conv = converter(*kind);
    const auto target = output.empty() ? scratch_root_ / unique_output_name(source) : output;

    try {
        conv.preflight(source);
    } catch (const Error& e) {
        if (e.kind() == ErrorKind::Cancelled) throw;
        Logger::log(LogLevel::Warning, "Rejected " + source.string() + ": " + e.what(), kTag);
        result.failure_reason = ConversionFailure::InvalidInput;
        result.message = e.what();
        return result;
    }

    const int max_attempts = conv.is_retryable() ? std::max(1, config_.retry.max_attempts) : 1;
    bool bad_output = false;

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        throw_if_cancelled(stop.stop_requested(), "conversion of " + source.filename().string());
        result.attempts_used = attempt;
        bad_output = false;
        try {
            conv.convert(source, target);
            if (!MimeDetector::is_pdf(target)) {
                bad_output = true;
                throw Error(ErrorKind::Conversion, "output is not a PDF", target);
            }
            result.pdf_path = target;
            result.message.clear();
            Logger::log(LogLevel::Debug,
                std::string(conv.get_name()) + " converted " + source.string() + " (attempt " + std::to_string(attempt) + ")",
                kTag);
            return result;
        } catch (const Error& e) {
            if (e.kind() == ErrorKind::Cancelled) throw;
            result.message = e.what();
        } catch (const std::exception& e) {
            result.message = e.what();
        }

        remove_quietly(target);
        conv.cleanup();
        Logger::log(LogLevel::Warning,
            std::string(conv.get_name()) + " attempt " + std::to_string(attempt) + "/" + std::to_string(max_attempts) +
            " failed for " + source.string() + ": " + result.message,
            kTag);

        if (attempt < max_attempts) {
            cancellable_wait(stop, config_.retry.base_backoff * attempt);
            throw_if_cancelled(stop.stop_requested(), "retry backoff for " + source.filename().string());
        }
    }

    result.failure_reason = bad_output ? ConversionFailure::InvalidOutput : ConversionFailure::ConversionFailed;
    Logger::log(LogLevel::Error, "Giving up on " + source.string() + ": " + result.message, kTag);
    return result;
}

void ConverterRegistry::cleanup_all() noexcept {
    for (const auto& c : converters_) {
        if (c) c->cleanup();
    }
}

} // namespace binder
