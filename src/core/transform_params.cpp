#include "core/transform_params.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>
#include <sstream>

namespace
{
    std::string toLower(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    bool isHexString(const std::string &value)
    {
        return std::all_of(value.begin(), value.end(),
                           [](unsigned char c)
                           { return std::isxdigit(c) != 0; });
    }

    // Accepts positive sizes plus ffmpeg's -1/-2 aspect-preserving markers
    bool isValidScaleDimension(int value)
    {
        return value > 0 || value == -1 || value == -2;
    }
}

int TransformParams::clampQuality(int quality)
{
    return std::max(MIN_QUALITY, std::min(MAX_QUALITY, quality));
}

int TransformParams::bitrateForQuality(int quality)
{
    double fraction = clampQuality(quality) / 100.0;
    double kbps = MIN_BITRATE_KBPS + fraction * (MAX_BITRATE_KBPS - MIN_BITRATE_KBPS);
    return static_cast<int>(std::lround(kbps));
}

std::vector<std::string> TransformParams::videoCodecArgs(const std::string &format)
{
    if (format == "mp4")
    {
        return {"-c:v", "libx264", "-preset", "fast", "-crf", "28"};
    }
    if (format == "webm")
    {
        return {"-c:v", "libvpx", "-b:v", "1M"};
    }
    return {"-c:v", "mjpeg"};
}

std::optional<std::pair<int, int>> TransformParams::parseResolution(const std::string &resolution)
{
    static const std::regex pattern(R"(^\s*(-?\d{1,5})\s*[:xX]\s*(-?\d{1,5})\s*$)");
    std::smatch match;
    if (!std::regex_match(resolution, match, pattern))
    {
        return std::nullopt;
    }

    int width = std::stoi(match[1].str());
    int height = std::stoi(match[2].str());
    if (!isValidScaleDimension(width) || !isValidScaleDimension(height))
    {
        return std::nullopt;
    }
    // Both sides cannot be derived from the aspect ratio
    if (width < 0 && height < 0)
    {
        return std::nullopt;
    }
    return std::make_pair(width, height);
}

std::optional<std::string> TransformParams::scaleFilter(const std::string &resolution)
{
    if (resolution.empty() || resolution == "original")
    {
        return std::nullopt;
    }
    auto parsed = parseResolution(resolution);
    if (!parsed)
    {
        return std::nullopt;
    }
    return "scale=" + std::to_string(parsed->first) + ":" + std::to_string(parsed->second);
}

std::string TransformParams::quoteConcatPath(const std::string &path)
{
    std::string quoted = "'";
    for (char c : path)
    {
        if (c == '\'')
        {
            quoted += "'\\''";
        }
        else
        {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string TransformParams::buildConcatList(const std::vector<std::filesystem::path> &inputs)
{
    std::ostringstream list;
    for (size_t i = 0; i < inputs.size(); ++i)
    {
        if (i)
            list << "\n";
        list << "file " << quoteConcatPath(inputs[i].string());
    }
    return list.str();
}

TransformParams::Point TransformParams::watermarkOrigin(double image_width, double image_height, double text_width,
                                                        int font_size, WatermarkPosition position)
{
    const double margin = WATERMARK_MARGIN;
    const double text_height = font_size;

    switch (position)
    {
    case WatermarkPosition::TOP_LEFT:
        return {margin, margin + text_height};
    case WatermarkPosition::TOP_RIGHT:
        return {image_width - text_width - margin, margin + text_height};
    case WatermarkPosition::BOTTOM_LEFT:
        return {margin, image_height - margin};
    case WatermarkPosition::BOTTOM_RIGHT:
        return {image_width - text_width - margin, image_height - margin};
    case WatermarkPosition::CENTER:
    default:
        return {(image_width - text_width) / 2.0, (image_height + text_height) / 2.0};
    }
}

std::optional<WatermarkPosition> TransformParams::parseWatermarkPosition(const std::string &value)
{
    std::string name = toLower(value);
    if (name == "top-left")
        return WatermarkPosition::TOP_LEFT;
    if (name == "top-right")
        return WatermarkPosition::TOP_RIGHT;
    if (name == "bottom-left")
        return WatermarkPosition::BOTTOM_LEFT;
    if (name == "bottom-right")
        return WatermarkPosition::BOTTOM_RIGHT;
    if (name == "center")
        return WatermarkPosition::CENTER;
    return std::nullopt;
}

std::string TransformParams::watermarkPositionName(WatermarkPosition position)
{
    switch (position)
    {
    case WatermarkPosition::TOP_LEFT:
        return "top-left";
    case WatermarkPosition::TOP_RIGHT:
        return "top-right";
    case WatermarkPosition::BOTTOM_LEFT:
        return "bottom-left";
    case WatermarkPosition::BOTTOM_RIGHT:
        return "bottom-right";
    case WatermarkPosition::CENTER:
    default:
        return "center";
    }
}

RgbColor TransformParams::parseHexColor(const std::string &value)
{
    std::string hex = value;
    if (!hex.empty() && hex[0] == '#')
    {
        hex.erase(0, 1);
    }
    if (!isHexString(hex))
    {
        return {0, 0, 0};
    }
    if (hex.size() == 3)
    {
        hex = std::string{hex[0], hex[0], hex[1], hex[1], hex[2], hex[2]};
    }
    if (hex.size() != 6)
    {
        return {0, 0, 0};
    }

    return {std::stoi(hex.substr(0, 2), nullptr, 16),
            std::stoi(hex.substr(2, 2), nullptr, 16),
            std::stoi(hex.substr(4, 2), nullptr, 16)};
}

std::string TransformParams::normalizeImageFormat(const std::string &format)
{
    std::string name = toLower(format);
    if (name == "jpeg" || name == "jpg")
        return "jpeg";
    if (name == "webp")
        return "webp";
    if (name == "bmp")
        return "bmp";
    return "png";
}

std::string TransformParams::imageMimeType(const std::string &format)
{
    std::string name = normalizeImageFormat(format);
    if (name == "jpeg")
        return "image/jpeg";
    if (name == "webp")
        return "image/webp";
    if (name == "bmp")
        return "image/bmp";
    return "image/png";
}

std::string TransformParams::imageEncoderExtension(const std::string &format)
{
    std::string name = normalizeImageFormat(format);
    if (name == "jpeg")
        return ".jpg";
    return "." + name;
}

std::string TransformParams::videoMimeType(const std::string &format)
{
    std::string name = toLower(format);
    if (name == "mp4")
        return "video/mp4";
    if (name == "webm")
        return "video/webm";
    if (name == "avi")
        return "video/x-msvideo";
    if (name == "mov")
        return "video/quicktime";
    if (name == "mkv")
        return "video/x-matroska";
    return "application/octet-stream";
}

bool TransformParams::isValidContainerFormat(const std::string &format)
{
    if (format.empty() || format.size() > 10)
    {
        return false;
    }
    return std::all_of(format.begin(), format.end(),
                       [](unsigned char c)
                       { return std::isalnum(c) != 0; });
}

std::string TransformParams::sanitizeDisplayFilename(const std::string &filename)
{
    // Only the last path component is ever shown
    std::string base = filename;
    auto slash = base.find_last_of("/\\");
    if (slash != std::string::npos)
    {
        base = base.substr(slash + 1);
    }

    std::string safe;
    for (unsigned char c : base)
    {
        if (c < 0x20 || c == 0x7f || c == '"' || c == '\\' || c == ';')
        {
            continue;
        }
        safe += static_cast<char>(c);
    }
    if (safe.empty() || safe == "." || safe == "..")
    {
        return "file";
    }
    return safe;
}
