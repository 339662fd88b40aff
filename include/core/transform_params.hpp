#pragma once

#include "core/conversion_spec.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Pure parameter derivation for transformations
 *
 * Everything here is deterministic and free of I/O so that the mapping from a
 * request to concrete tool arguments can be tested in isolation.
 */
class TransformParams
{
public:
    static constexpr int MIN_QUALITY = 10;
    static constexpr int MAX_QUALITY = 100;
    static constexpr int DEFAULT_QUALITY = 50;
    static constexpr int MIN_BITRATE_KBPS = 32;
    static constexpr int MAX_BITRATE_KBPS = 320;
    static constexpr int WATERMARK_MARGIN = 20;

    struct Point
    {
        double x = 0.0;
        double y = 0.0;
    };

    static int clampQuality(int quality);

    /**
     * @brief MP3 bitrate for a quality setting
     *
     * Linear between 32 kbps and 320 kbps on quality/100, rounded to the
     * nearest kbps. Quality is clamped to [10, 100] first.
     */
    static int bitrateForQuality(int quality);

    // ffmpeg video codec arguments for an output container
    static std::vector<std::string> videoCodecArgs(const std::string &format);

    /**
     * @brief Parse a "W:H" or "WxH" resolution
     *
     * -1 and -2 are accepted for one side (keep aspect ratio); zero and other
     * negative values are rejected.
     * @return nullopt when the string is not a valid resolution
     */
    static std::optional<std::pair<int, int>> parseResolution(const std::string &resolution);

    // "scale=W:H" for ffmpeg, or nullopt when resolution is "original"
    static std::optional<std::string> scaleFilter(const std::string &resolution);

    // Quote a path for one line of an ffmpeg concat list
    static std::string quoteConcatPath(const std::string &path);

    // One "file '<path>'" line per input, in the given order
    static std::string buildConcatList(const std::vector<std::filesystem::path> &inputs);

    /**
     * @brief Baseline origin of watermark text
     * @param image_width Image width in pixels
     * @param image_height Image height in pixels
     * @param text_width Measured width of the rendered text
     * @param font_size Font size in pixels, used as text height
     * @param position Anchor corner or center
     */
    static Point watermarkOrigin(double image_width, double image_height, double text_width,
                                 int font_size, WatermarkPosition position);

    static std::optional<WatermarkPosition> parseWatermarkPosition(const std::string &value);
    static std::string watermarkPositionName(WatermarkPosition position);

    // "#rgb" or "#rrggbb", leading '#' optional; anything else is black
    static RgbColor parseHexColor(const std::string &value);

    // Maps a requested image format onto one of jpeg, webp, bmp, png
    static std::string normalizeImageFormat(const std::string &format);
    static std::string imageMimeType(const std::string &format);
    // File extension OpenCV uses to pick the encoder, with leading dot
    static std::string imageEncoderExtension(const std::string &format);

    static std::string videoMimeType(const std::string &format);

    // Container names are restricted to 1-10 ASCII alphanumerics
    static bool isValidContainerFormat(const std::string &format);

    // Client filename reduced to something safe inside a quoted header value
    static std::string sanitizeDisplayFilename(const std::string &filename);
};
