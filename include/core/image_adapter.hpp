#pragma once

#include "core/transformation_adapter.hpp"
#include <opencv2/core.hpp>

/**
 * @brief Image conversion, resizing and text watermarking through OpenCV
 *
 * Runs in-process. Decoding and encoding cannot be interrupted, so the
 * context is checked between those steps.
 */
class ImageAdapter : public TransformationAdapter
{
public:
    std::string name() const override { return "opencv"; }
    bool supports(OperationKind kind) const override;

    Artifact execute(const ConversionSpec &spec, const std::vector<StagedAsset> &inputs,
                     const TransformContext &context) override;

    /**
     * @brief Draw watermark text onto an image
     * @param image 8-bit image with 1, 3 or 4 channels
     * @param spec Carries text, font size, color, opacity and position
     * @return New image; grayscale input comes back as BGR
     */
    static cv::Mat renderWatermark(const cv::Mat &image, const ConversionSpec &spec);

private:
    static cv::Mat load(const std::filesystem::path &path);
    static cv::Mat prepareForEncoding(const cv::Mat &image, const std::string &format);
    static void store(const cv::Mat &image, const std::filesystem::path &path);
};
