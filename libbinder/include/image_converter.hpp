/**
 * @file image_converter.hpp
 * @brief Raster images to PDF pages.
 */

#ifndef BINDER_IMAGE_CONVERTER_HPP
#define BINDER_IMAGE_CONVERTER_HPP

#include "converter.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace binder {

/**
 * @brief An image ready to be embedded as a PDF XObject.
 */
struct EncodedImage {
    int width = 0;
    int height = 0;
    int components = 3;        ///< 1 (gray) or 3 (RGB)
    std::string filter;        ///< "/FlateDecode" or "/DCTDecode"
    std::string data;          ///< Encoded sample data
};

/**
 * @brief Converts PNG, JPEG, TIFF and BMP files, one image per page.
 *
 * @details Pixels are normalized to 8-bit gray or RGB; alpha is composited
 * on white and palettes are expanded. Gray and RGB JPEGs are embedded
 * unchanged, CMYK JPEGs are decoded to RGB. Every directory of a
 * multi-page TIFF becomes one page. Each page is A4, portrait or
 * landscape following the image, with the image scaled to fit and
 * centered. Pure and deterministic: failures are permanent.
 */
class ImageConverter final : public IConverter {
public:
    [[nodiscard]] std::string_view get_name() const noexcept override { return "ImageConverter"; }
    [[nodiscard]] ConverterKind kind() const noexcept override { return ConverterKind::Image; }

    void convert(const std::filesystem::path& source,
                 const std::filesystem::path& output) override;

    /**
     * @brief Decode @p source into embeddable images.
     * @throws Error(ErrorKind::Conversion) for unreadable or unsupported images.
     */
    static std::vector<EncodedImage> load(const std::filesystem::path& source);
};

} // namespace binder

#endif // BINDER_IMAGE_CONVERTER_HPP
