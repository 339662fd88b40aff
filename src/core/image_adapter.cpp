#include "core/image_adapter.hpp"
#include "core/errors.hpp"
#include "core/transform_params.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace
{
    constexpr int WATERMARK_FONT = cv::FONT_HERSHEY_SIMPLEX;
}

bool ImageAdapter::supports(OperationKind kind) const
{
    return kind == OperationKind::IMAGE_CONVERT ||
           kind == OperationKind::IMAGE_RESIZE ||
           kind == OperationKind::IMAGE_WATERMARK;
}

cv::Mat ImageAdapter::load(const std::filesystem::path &path)
{
    cv::Mat image = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
    if (image.empty())
    {
        throw TransformFailed("Unsupported or corrupt image");
    }
    // 16-bit and float sources are scaled down to 8 bits per channel
    if (image.depth() == CV_16U)
    {
        image.convertTo(image, CV_8U, 1.0 / 257.0);
    }
    else if (image.depth() != CV_8U)
    {
        cv::normalize(image, image, 0, 255, cv::NORM_MINMAX, CV_8U);
    }
    return image;
}

cv::Mat ImageAdapter::prepareForEncoding(const cv::Mat &image, const std::string &format)
{
    // JPEG and BMP have no alpha channel
    if (image.channels() == 4 && (format == "jpeg" || format == "bmp"))
    {
        cv::Mat flat;
        cv::cvtColor(image, flat, cv::COLOR_BGRA2BGR);
        return flat;
    }
    return image;
}

void ImageAdapter::store(const cv::Mat &image, const std::filesystem::path &path)
{
    if (!cv::imwrite(path.string(), image))
    {
        throw TransformFailed("No encoder available for " + path.extension().string());
    }
}

cv::Mat ImageAdapter::renderWatermark(const cv::Mat &image, const ConversionSpec &spec)
{
    cv::Mat base;
    if (image.channels() == 1)
    {
        cv::cvtColor(image, base, cv::COLOR_GRAY2BGR);
    }
    else
    {
        base = image;
    }

    const int thickness = std::max(1, spec.font_size / 12);
    const double scale = cv::getFontScaleFromHeight(WATERMARK_FONT, spec.font_size, thickness);
    int baseline = 0;
    cv::Size text_size = cv::getTextSize(spec.watermark_text, WATERMARK_FONT, scale, thickness, &baseline);

    auto origin = TransformParams::watermarkOrigin(base.cols, base.rows, text_size.width, spec.font_size,
                                                   spec.position);

    cv::Mat overlay = base.clone();
    cv::Scalar color(spec.color.b, spec.color.g, spec.color.r, 255);
    cv::putText(overlay, spec.watermark_text, cv::Point(cvRound(origin.x), cvRound(origin.y)), WATERMARK_FONT,
                scale, color, thickness, cv::LINE_AA);

    if (spec.opacity >= 1.0)
    {
        return overlay;
    }
    cv::Mat blended;
    cv::addWeighted(overlay, spec.opacity, base, 1.0 - spec.opacity, 0.0, blended);
    return blended;
}

Artifact ImageAdapter::execute(const ConversionSpec &spec, const std::vector<StagedAsset> &inputs,
                               const TransformContext &context)
{
    if (inputs.empty())
    {
        throw TransformFailed("No input to process");
    }
    context.checkpoint();

    try
    {
        cv::Mat image = load(inputs.front().path);
        context.checkpoint();

        std::string format;
        std::string download_name;
        cv::Mat result;

        switch (spec.kind)
        {
        case OperationKind::IMAGE_CONVERT:
            format = TransformParams::normalizeImageFormat(spec.output_format);
            download_name = "converted." + format;
            result = image;
            break;
        case OperationKind::IMAGE_RESIZE:
        {
            format = TransformParams::normalizeImageFormat(spec.output_format);
            download_name = "resized." + format;
            bool shrinking = static_cast<long long>(spec.width) * spec.height <
                             static_cast<long long>(image.cols) * image.rows;
            cv::resize(image, result, cv::Size(spec.width, spec.height), 0, 0,
                       shrinking ? cv::INTER_AREA : cv::INTER_LINEAR);
            break;
        }
        case OperationKind::IMAGE_WATERMARK:
            format = "png";
            download_name = "watermarked.png";
            result = renderWatermark(image, spec);
            break;
        default:
            throw TransformFailed("OpenCV cannot perform " + OperationKinds::getName(spec.kind));
        }

        context.checkpoint();

        auto output = context.workspace.resolve("output" + TransformParams::imageEncoderExtension(format));
        store(prepareForEncoding(result, format), output);
        Logger::debug("Encoded " + std::to_string(result.cols) + "x" + std::to_string(result.rows) + " " + format +
                      " image");

        return makeArtifact(output, TransformParams::imageMimeType(format), download_name);
    }
    catch (const cv::Exception &e)
    {
        throw TransformFailed(e.err.empty() ? std::string(e.what()) : e.err);
    }
}
