#include "../../include/image_converter.hpp"
#include "../../include/atomic_file.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/pdf_builder.hpp"
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <png.h>
#include <jpeglib.h>
#include <tiffio.h>
#include <zlib.h>
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <vector>

extern "C" {
#include "bmplib.h"
}

namespace binder {

namespace {

constexpr std::string_view kTag = "ImageConverter";
constexpr double kPageMargin = 36.0;

[[noreturn]] void fail(const std::filesystem::path& source, const std::string& what) {
    throw Error(ErrorKind::Conversion, what, source);
}

// alpha over a white background
unsigned char over_white(const unsigned value, const unsigned alpha) {
    return static_cast<unsigned char>((value * alpha + 255u * (255u - alpha) + 127u) / 255u);
}

std::string deflate(const std::vector<unsigned char>& raw, const std::filesystem::path& source) {
    uLongf size = compressBound(static_cast<uLong>(raw.size()));
    std::string out(size, '\0');
    if (compress2(reinterpret_cast<Bytef*>(out.data()), &size, raw.data(),
                  static_cast<uLong>(raw.size()), Z_BEST_COMPRESSION) != Z_OK) {
        fail(source, "zlib compression failed");
    }
    out.resize(size);
    return out;
}

EncodedImage flate_image(const int width, const int height, const int components,
                         const std::vector<unsigned char>& raw, const std::filesystem::path& source) {
    EncodedImage img;
    img.width = width;
    img.height = height;
    img.components = components;
    img.filter = "/FlateDecode";
    img.data = deflate(raw, source);
    return img;
}

void check_dimensions(const long width, const long height, const std::filesystem::path& source) {
    if (width <= 0 || height <= 0) {
        fail(source, "image has no pixels");
    }
    if (width > 30000 || height > 30000) {
        fail(source, "image dimensions too large (" + std::to_string(width) + "x" + std::to_string(height) + ")");
    }
}

// ---------- PNG ----------

void png_error_fn(png_structp, const png_const_charp msg) {
    Logger::log(LogLevel::Debug, std::string("libpng: ") + msg, "libpng");
    throw Error(ErrorKind::Conversion, std::string("libpng: ") + msg);
}

void png_warning_fn(png_structp, const png_const_charp msg) {
    Logger::log(LogLevel::Debug, std::string("libpng: ") + msg, "libpng");
}

struct PngRead {
    png_structp png = nullptr;
    png_infop info = nullptr;

    ~PngRead() {
        if (png || info) png_destroy_read_struct(&png, &info, nullptr);
    }
};

std::vector<EncodedImage> load_png(const std::filesystem::path& source) {
    const auto f = open_file(source, "rb");
    if (!f) fail(source, "cannot open image");

    PngRead r;
    r.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
    if (!r.png) fail(source, "png_create_read_struct failed");
    r.info = png_create_info_struct(r.png);
    if (!r.info) fail(source, "png_create_info_struct failed");

    png_init_io(r.png, f.get());
    png_read_info(r.png, r.info);

    const auto width = png_get_image_width(r.png, r.info);
    const auto height = png_get_image_height(r.png, r.info);
    check_dimensions(width, height, source);

    // normalize to 8-bit RGB or RGBA
    png_set_expand(r.png);
    png_set_strip_16(r.png);
    png_set_gray_to_rgb(r.png);
    png_set_interlace_handling(r.png);
    png_read_update_info(r.png, r.info);

    const int channels = png_get_channels(r.png, r.info);
    if (channels != 3 && channels != 4) fail(source, "unexpected PNG layout");
    const auto rowbytes = png_get_rowbytes(r.png, r.info);

    std::vector<unsigned char> pixels(rowbytes * height);
    std::vector<png_bytep> rows(height);
    for (png_uint_32 y = 0; y < height; ++y) rows[y] = pixels.data() + y * rowbytes;
    png_read_image(r.png, rows.data());
    png_read_end(r.png, nullptr);

    std::vector<unsigned char> rgb;
    rgb.reserve(static_cast<std::size_t>(width) * height * 3);
    for (png_uint_32 y = 0; y < height; ++y) {
        const unsigned char* p = rows[y];
        for (png_uint_32 x = 0; x < width; ++x, p += channels) {
            const unsigned a = channels == 4 ? p[3] : 255u;
            rgb.push_back(over_white(p[0], a));
            rgb.push_back(over_white(p[1], a));
            rgb.push_back(over_white(p[2], a));
        }
    }
    return {flate_image(static_cast<int>(width), static_cast<int>(height), 3, rgb, source)};
}

// ---------- JPEG ----------

struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
};

void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto* err = reinterpret_cast<JpegErrorMgr*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    Logger::log(LogLevel::Debug, std::string("libjpeg: ") + err->msg, "libjpeg");
    throw Error(ErrorKind::Conversion, std::string("libjpeg: ") + err->msg);
}

struct JpegDecompress {
    jpeg_decompress_struct cinfo{};
    JpegErrorMgr jerr{};

    JpegDecompress() {
        cinfo.err = jpeg_std_error(&jerr.pub);
        jerr.pub.error_exit = jpeg_error_exit_throw;
        jpeg_create_decompress(&cinfo);
    }
    ~JpegDecompress() { jpeg_destroy_decompress(&cinfo); }

    JpegDecompress(const JpegDecompress&) = delete;
    JpegDecompress& operator=(const JpegDecompress&) = delete;
};

std::string read_all(const std::filesystem::path& source) {
    const auto f = open_file(source, "rb");
    if (!f) fail(source, "cannot open image");
    std::string data;
    char buf[65536];
    std::size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f.get())) > 0) data.append(buf, n);
    if (std::ferror(f.get())) fail(source, "read error");
    return data;
}

std::vector<EncodedImage> load_jpeg(const std::filesystem::path& source) {
    std::string bytes = read_all(source);
    if (bytes.empty()) fail(source, "empty image");

    JpegDecompress d;
    jpeg_mem_src(&d.cinfo, reinterpret_cast<unsigned char*>(bytes.data()),
                 static_cast<unsigned long>(bytes.size()));
    jpeg_read_header(&d.cinfo, TRUE);
    check_dimensions(d.cinfo.image_width, d.cinfo.image_height, source);

    const int width = static_cast<int>(d.cinfo.image_width);
    const int height = static_cast<int>(d.cinfo.image_height);

    if (d.cinfo.jpeg_color_space == JCS_GRAYSCALE || d.cinfo.num_components == 3) {
        // PDF readers decode baseline and progressive DCT streams directly
        EncodedImage img;
        img.width = width;
        img.height = height;
        img.components = d.cinfo.num_components == 1 ? 1 : 3;
        img.filter = "/DCTDecode";
        img.data = std::move(bytes);
        return {std::move(img)};
    }

    if (d.cinfo.num_components != 4) fail(source, "unsupported JPEG color layout");

    d.cinfo.out_color_space = JCS_CMYK;
    jpeg_start_decompress(&d.cinfo);
    const bool inverted = d.cinfo.saw_Adobe_marker;
    std::vector<unsigned char> row(static_cast<std::size_t>(width) * 4);
    std::vector<unsigned char> rgb;
    rgb.reserve(static_cast<std::size_t>(width) * height * 3);
    while (d.cinfo.output_scanline < d.cinfo.output_height) {
        JSAMPROW rp = row.data();
        jpeg_read_scanlines(&d.cinfo, &rp, 1);
        for (int x = 0; x < width; ++x) {
            const unsigned char* p = row.data() + x * 4;
            unsigned c = p[0], m = p[1], yy = p[2], k = p[3];
            // Adobe writes CMYK inverted, so the samples already are 1 - C etc.
            if (!inverted) {
                c = 255u - c; m = 255u - m; yy = 255u - yy; k = 255u - k;
            }
            rgb.push_back(static_cast<unsigned char>(c * k / 255u));
            rgb.push_back(static_cast<unsigned char>(m * k / 255u));
            rgb.push_back(static_cast<unsigned char>(yy * k / 255u));
        }
    }
    jpeg_finish_decompress(&d.cinfo);
    return {flate_image(width, height, 3, rgb, source)};
}

// ---------- TIFF ----------

struct TiffCloser {
    void operator()(TIFF* t) const { if (t) TIFFClose(t); }
};

std::vector<EncodedImage> load_tiff(const std::filesystem::path& source) {
    TIFFSetWarningHandler(nullptr);
    const std::unique_ptr<TIFF, TiffCloser> tif(TIFFOpen(source.c_str(), "r"));
    if (!tif) fail(source, "cannot open TIFF");

    std::vector<EncodedImage> pages;
    do {
        uint32_t width = 0, height = 0;
        TIFFGetField(tif.get(), TIFFTAG_IMAGEWIDTH, &width);
        TIFFGetField(tif.get(), TIFFTAG_IMAGELENGTH, &height);
        if (width == 0 || height == 0) {
            Logger::log(LogLevel::Debug, "Skipping empty TIFF directory in " + source.string(), kTag);
            continue;
        }
        check_dimensions(width, height, source);

        std::vector<uint32_t> raster(static_cast<std::size_t>(width) * height);
        if (!TIFFReadRGBAImageOriented(tif.get(), width, height, raster.data(), ORIENTATION_TOPLEFT, 0)) {
            fail(source, "cannot decode TIFF directory " + std::to_string(pages.size()));
        }
        std::vector<unsigned char> rgb;
        rgb.reserve(raster.size() * 3);
        for (const uint32_t px : raster) {
            // RGBA raster samples are premultiplied
            const unsigned a = TIFFGetA(px);
            rgb.push_back(static_cast<unsigned char>(std::min(255u, TIFFGetR(px) + 255u - a)));
            rgb.push_back(static_cast<unsigned char>(std::min(255u, TIFFGetG(px) + 255u - a)));
            rgb.push_back(static_cast<unsigned char>(std::min(255u, TIFFGetB(px) + 255u - a)));
        }
        pages.push_back(flate_image(static_cast<int>(width), static_cast<int>(height), 3, rgb, source));
    } while (TIFFReadDirectory(tif.get()));

    if (pages.empty()) fail(source, "TIFF contains no images");
    return pages;
}

// ---------- BMP ----------

struct ScopedBmp {
    BMPHANDLE h = nullptr;
    unsigned char* buffer = nullptr;

    ~ScopedBmp() {
        if (h) bmp_free(h);
        std::free(buffer);
    }
};

std::vector<EncodedImage> load_bmp(const std::filesystem::path& source) {
    const auto f = open_file(source, "rb");
    if (!f) fail(source, "cannot open image");

    ScopedBmp in;
    in.h = bmpread_new(f.get());
    if (!in.h) fail(source, "bmplib: cannot create read handle");

    if (bmpread_load_info(in.h) != BMP_RESULT_OK) {
        fail(source, std::string("bmplib: ") + bmp_errmsg(in.h));
    }
    int width = 0, height = 0, channels = 0, bits = 0;
    bmpread_dimensions(in.h, &width, &height, &channels, &bits, nullptr);
    check_dimensions(width, height, source);
    if (channels < 1 || channels > 4 || (bits != 8 && bits != 16)) {
        fail(source, "unsupported BMP layout (" + std::to_string(channels) + "x" + std::to_string(bits) + " bit)");
    }

    in.buffer = static_cast<unsigned char*>(std::malloc(bmpread_buffersize(in.h)));
    if (!in.buffer) fail(source, "out of memory");
    if (bmpread_load_image(in.h, &in.buffer) != BMP_RESULT_OK) {
        fail(source, std::string("bmplib: ") + bmp_errmsg(in.h));
    }

    const int bytes = bits / 8;
    const auto sample = [&](const std::size_t i) -> unsigned {
        if (bytes == 1) return in.buffer[i];
        std::uint16_t v;
        std::memcpy(&v, in.buffer + i * 2, 2);
        return v >> 8;
    };

    const bool gray = channels <= 2;
    std::vector<unsigned char> out;
    out.reserve(static_cast<std::size_t>(width) * height * (gray ? 1 : 3));
    const std::size_t count = static_cast<std::size_t>(width) * height;
    for (std::size_t p = 0; p < count; ++p) {
        const std::size_t base = p * channels;
        const bool has_alpha = channels == 2 || channels == 4;
        const unsigned a = has_alpha ? sample(base + channels - 1) : 255u;
        if (gray) {
            out.push_back(over_white(sample(base), a));
        } else {
            out.push_back(over_white(sample(base), a));
            out.push_back(over_white(sample(base + 1), a));
            out.push_back(over_white(sample(base + 2), a));
        }
    }
    return {flate_image(width, height, gray ? 1 : 3, out, source)};
}

QPDFObjectHandle image_xobject(QPDF& pdf, const EncodedImage& img) {
    auto stream = QPDFObjectHandle::newStream(&pdf);
    stream.replaceStreamData(img.data, QPDFObjectHandle::newName(img.filter), QPDFObjectHandle::newNull());
    auto dict = stream.getDict();
    dict.replaceKey("/Type", QPDFObjectHandle::newName("/XObject"));
    dict.replaceKey("/Subtype", QPDFObjectHandle::newName("/Image"));
    dict.replaceKey("/Width", QPDFObjectHandle::newInteger(img.width));
    dict.replaceKey("/Height", QPDFObjectHandle::newInteger(img.height));
    dict.replaceKey("/ColorSpace", QPDFObjectHandle::newName(img.components == 1 ? "/DeviceGray" : "/DeviceRGB"));
    dict.replaceKey("/BitsPerComponent", QPDFObjectHandle::newInteger(8));
    return stream;
}

void append_image_page(QPDF& pdf, const EncodedImage& img) {
    const pdf::PageSize page = img.width > img.height ? pdf::kA4Landscape : pdf::kA4;
    const double box_w = page.width - 2 * kPageMargin;
    const double box_h = page.height - 2 * kPageMargin;
    const double scale = std::min(box_w / img.width, box_h / img.height);
    const double w = img.width * scale;
    const double h = img.height * scale;
    const double x = (page.width - w) / 2.0;
    const double y = (page.height - h) / 2.0;

    auto xobjects = QPDFObjectHandle::newDictionary();
    xobjects.replaceKey("/Im0", image_xobject(pdf, img));
    auto resources = QPDFObjectHandle::newDictionary();
    resources.replaceKey("/XObject", xobjects);

    const std::string content = "q " + pdf::num(w) + " 0 0 " + pdf::num(h) + " " +
                                pdf::num(x) + " " + pdf::num(y) + " cm /Im0 Do Q\n";
    pdf::append_page(pdf, content, resources, page);
}

} // namespace

std::vector<EncodedImage> ImageConverter::load(const std::filesystem::path& source) {
    const std::string ext = lower_extension(source);
    if (ext == ".png") return load_png(source);
    if (ext == ".jpg" || ext == ".jpeg") return load_jpeg(source);
    if (ext == ".tif" || ext == ".tiff") return load_tiff(source);
    if (ext == ".bmp") return load_bmp(source);
    fail(source, "unsupported image type '" + ext + "'");
}

void ImageConverter::convert(const std::filesystem::path& source,
                             const std::filesystem::path& output) {
    std::vector<EncodedImage> images;
    try {
        images = load(source);
    } catch (const Error& e) {
        if (!e.path().empty()) throw;
        throw Error(e.kind(), e.what(), source);
    }

    QPDF pdf;
    pdf.emptyPDF();
    for (const auto& img : images) {
        append_image_page(pdf, img);
    }
    atomic_replace(output, [&](const std::filesystem::path& scratch) {
        pdf::write(pdf, scratch);
    }, ".img.tmp");
    Logger::log(LogLevel::Debug,
        "Converted " + source.string() + " (" + std::to_string(images.size()) + " page(s))", kTag);
}

} // namespace binder
