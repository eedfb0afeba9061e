#pragma once
#include <optional>
#include <string>

namespace linkagent {

enum class ImageFormat {
    JPEG,
    PNG,
    GIF,
    BMP,
    WebP,
    TIFF,
    SVG,
    ICO,
    AVIF
};

// Extension lookup, case-insensitive (".PNG" == ".png")
bool is_binary_extension(const std::string& path);
std::optional<ImageFormat> image_format_for(const std::string& path);

// Known binary extension, a null byte in the first 4KB, or more than 30%
// non-printable bytes there. Empty content is never binary unless the
// extension says so.
bool is_binary_file(const std::string& path, const std::string& content);

// Magic-byte check of content against the expected format
bool validate_image_format(const std::string& bytes, ImageFormat format);

const char* image_format_name(ImageFormat format);
const char* image_mime_type(ImageFormat format);

} // namespace linkagent
