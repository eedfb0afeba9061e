#include "binary.hpp"
#include "util.hpp"

#include <algorithm>
#include <array>
#include <filesystem>
#include <initializer_list>

namespace linkagent {

namespace {

constexpr size_t kSniffBytes = 4096;

constexpr std::array<const char*, 28> kBinaryExtensions = {
    ".zip", ".tar", ".gz", ".exe", ".dll", ".so", ".class", ".jar", ".war", ".7z",
    ".doc", ".docx", ".xls", ".xlsx", ".ppt", ".pptx", ".odt", ".ods", ".odp",
    ".bin", ".dat", ".obj", ".o", ".a", ".lib", ".wasm", ".pyc", ".pyo",
};

std::string lower_extension(const std::string& path) {
    return to_lower(std::filesystem::path(path).extension().string());
}

bool starts_with_bytes(const std::string& bytes, std::initializer_list<unsigned char> sig,
                       size_t offset = 0) {
    if (bytes.size() < offset + sig.size()) return false;
    size_t i = offset;
    for (unsigned char b : sig) {
        if (static_cast<unsigned char>(bytes[i++]) != b) return false;
    }
    return true;
}

} // namespace

bool is_binary_extension(const std::string& path) {
    std::string ext = lower_extension(path);
    if (ext.empty()) return false;
    return std::find(kBinaryExtensions.begin(), kBinaryExtensions.end(), ext) !=
           kBinaryExtensions.end();
}

std::optional<ImageFormat> image_format_for(const std::string& path) {
    std::string ext = lower_extension(path);
    if (ext == ".jpg" || ext == ".jpeg") return ImageFormat::JPEG;
    if (ext == ".png") return ImageFormat::PNG;
    if (ext == ".gif") return ImageFormat::GIF;
    if (ext == ".bmp") return ImageFormat::BMP;
    if (ext == ".webp") return ImageFormat::WebP;
    if (ext == ".tiff" || ext == ".tif") return ImageFormat::TIFF;
    if (ext == ".svg") return ImageFormat::SVG;
    if (ext == ".ico") return ImageFormat::ICO;
    if (ext == ".avif") return ImageFormat::AVIF;
    return std::nullopt;
}

bool is_binary_file(const std::string& path, const std::string& content) {
    if (is_binary_extension(path)) return true;
    if (content.empty()) return false;

    size_t n = std::min(content.size(), kSniffBytes);
    size_t non_printable = 0;
    for (size_t i = 0; i < n; ++i) {
        auto b = static_cast<unsigned char>(content[i]);
        if (b == 0) return true;
        if (b < 9 || (b > 13 && b < 32)) ++non_printable;
    }
    return static_cast<double>(non_printable) / static_cast<double>(n) > 0.3;
}

bool validate_image_format(const std::string& bytes, ImageFormat format) {
    if (bytes.size() < 8 && format != ImageFormat::SVG) return false;

    switch (format) {
        case ImageFormat::PNG:
            return starts_with_bytes(bytes, {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A});
        case ImageFormat::JPEG:
            return starts_with_bytes(bytes, {0xFF, 0xD8, 0xFF});
        case ImageFormat::GIF:
            return starts_with_bytes(bytes, {'G', 'I', 'F', '8'});
        case ImageFormat::BMP:
            return starts_with_bytes(bytes, {'B', 'M'});
        case ImageFormat::WebP:
            return starts_with_bytes(bytes, {'R', 'I', 'F', 'F'}) &&
                   starts_with_bytes(bytes, {'W', 'E', 'B', 'P'}, 8);
        case ImageFormat::TIFF:
            return starts_with_bytes(bytes, {'I', 'I', 0x2A, 0x00}) ||
                   starts_with_bytes(bytes, {'M', 'M', 0x00, 0x2A});
        case ImageFormat::ICO:
            return starts_with_bytes(bytes, {0x00, 0x00, 0x01, 0x00});
        case ImageFormat::SVG: {
            std::string head = bytes.substr(0, 1000);
            return head.find("<svg") != std::string::npos ||
                   head.find("<?xml") != std::string::npos;
        }
        case ImageFormat::AVIF:
            // ISO-BMFF: 'ftyp' box at offset 4, brand avif/avis at 8
            return starts_with_bytes(bytes, {'f', 't', 'y', 'p'}, 4) &&
                   (starts_with_bytes(bytes, {'a', 'v', 'i', 'f'}, 8) ||
                    starts_with_bytes(bytes, {'a', 'v', 'i', 's'}, 8));
    }
    return false;
}

const char* image_format_name(ImageFormat format) {
    switch (format) {
        case ImageFormat::JPEG: return "JPEG";
        case ImageFormat::PNG:  return "PNG";
        case ImageFormat::GIF:  return "GIF";
        case ImageFormat::BMP:  return "BMP";
        case ImageFormat::WebP: return "WebP";
        case ImageFormat::TIFF: return "TIFF";
        case ImageFormat::SVG:  return "SVG";
        case ImageFormat::ICO:  return "ICO";
        case ImageFormat::AVIF: return "AVIF";
    }
    return "unknown";
}

const char* image_mime_type(ImageFormat format) {
    switch (format) {
        case ImageFormat::JPEG: return "image/jpeg";
        case ImageFormat::PNG:  return "image/png";
        case ImageFormat::GIF:  return "image/gif";
        case ImageFormat::BMP:  return "image/bmp";
        case ImageFormat::WebP: return "image/webp";
        case ImageFormat::TIFF: return "image/tiff";
        case ImageFormat::SVG:  return "image/svg+xml";
        case ImageFormat::ICO:  return "image/x-icon";
        case ImageFormat::AVIF: return "image/avif";
    }
    return "application/octet-stream";
}

} // namespace linkagent
