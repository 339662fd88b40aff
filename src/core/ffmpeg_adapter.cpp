#include "core/ffmpeg_adapter.hpp"
#include "core/errors.hpp"
#include "core/transform_params.hpp"
#include "logging/logger.hpp"
#include <fstream>
#include <sstream>

namespace
{
    constexpr size_t MAX_DIAGNOSTIC_CHARS = 600;

    const std::vector<std::string> COMMON_ARGS = {"-hide_banner", "-nostdin", "-y", "-loglevel", "error"};
}

FfmpegAdapter::FfmpegAdapter(std::string ffmpeg_path) : ffmpeg_path_(std::move(ffmpeg_path))
{
}

bool FfmpegAdapter::supports(OperationKind kind) const
{
    return kind == OperationKind::AUDIO_COMPRESS ||
           kind == OperationKind::AUDIO_MERGE ||
           kind == OperationKind::VIDEO_TRANSCODE;
}

std::vector<std::string> FfmpegAdapter::buildCommand(const std::string &ffmpeg_path, const ConversionSpec &spec,
                                                     const std::vector<StagedAsset> &inputs,
                                                     const std::filesystem::path &output,
                                                     const std::filesystem::path &concat_list)
{
    std::vector<std::string> args{ffmpeg_path};
    args.insert(args.end(), COMMON_ARGS.begin(), COMMON_ARGS.end());

    switch (spec.kind)
    {
    case OperationKind::AUDIO_COMPRESS:
    {
        int bitrate = spec.bitrate_kbps > 0 ? spec.bitrate_kbps : TransformParams::bitrateForQuality(spec.quality);
        args.insert(args.end(), {"-i", inputs.at(0).path.string(),
                                 "-vn", "-codec:a", "libmp3lame", "-b:a", std::to_string(bitrate) + "k",
                                 output.string()});
        break;
    }
    case OperationKind::AUDIO_MERGE:
        args.insert(args.end(), {"-f", "concat", "-safe", "0", "-i", concat_list.string(),
                                 "-vn", "-codec:a", "libmp3lame", "-q:a", "2",
                                 output.string()});
        break;
    case OperationKind::VIDEO_TRANSCODE:
    {
        args.insert(args.end(), {"-i", inputs.at(0).path.string()});
        auto codec = TransformParams::videoCodecArgs(spec.output_format);
        args.insert(args.end(), codec.begin(), codec.end());
        if (auto filter = TransformParams::scaleFilter(spec.resolution))
        {
            args.insert(args.end(), {"-vf", *filter});
        }
        args.push_back(output.string());
        break;
    }
    default:
        throw TransformFailed("ffmpeg cannot perform " + OperationKinds::getName(spec.kind));
    }
    return args;
}

std::string FfmpegAdapter::summarizeDiagnostics(const std::string &stderr_tail)
{
    std::istringstream stream(stderr_tail);
    std::string line;
    std::string summary;
    while (std::getline(stream, line))
    {
        while (!line.empty() && (line.back() == '\r' || line.back() == ' '))
            line.pop_back();
        if (line.empty())
            continue;
        if (!summary.empty())
            summary += "; ";
        summary += line;
    }
    if (summary.size() > MAX_DIAGNOSTIC_CHARS)
    {
        summary = "..." + summary.substr(summary.size() - MAX_DIAGNOSTIC_CHARS);
    }
    return summary;
}

Artifact FfmpegAdapter::execute(const ConversionSpec &spec, const std::vector<StagedAsset> &inputs,
                                const TransformContext &context)
{
    if (inputs.empty())
    {
        throw TransformFailed("No input to process");
    }
    context.checkpoint();

    std::filesystem::path output;
    std::filesystem::path concat_list;
    std::string mime_type;
    std::string download_name;

    switch (spec.kind)
    {
    case OperationKind::AUDIO_COMPRESS:
        output = context.workspace.resolve("compressed.mp3");
        mime_type = "audio/mpeg";
        download_name = "compressed-" + inputs.front().display_name + ".mp3";
        break;
    case OperationKind::AUDIO_MERGE:
    {
        output = context.workspace.resolve("merged.mp3");
        concat_list = context.workspace.resolve("concat.txt");
        mime_type = "audio/mpeg";
        download_name = "merged-audio.mp3";

        std::vector<std::filesystem::path> paths;
        for (const auto &input : inputs)
        {
            paths.push_back(input.path);
        }
        std::ofstream list(concat_list, std::ios::binary | std::ios::trunc);
        list << TransformParams::buildConcatList(paths) << "\n";
        list.close();
        if (!list)
        {
            throw ResourceError("Failed to write concat list");
        }
        break;
    }
    case OperationKind::VIDEO_TRANSCODE:
        output = context.workspace.resolve("output." + spec.output_format);
        mime_type = TransformParams::videoMimeType(spec.output_format);
        download_name = "video." + spec.output_format;
        break;
    default:
        throw TransformFailed("ffmpeg cannot perform " + OperationKinds::getName(spec.kind));
    }

    auto argv = buildCommand(ffmpeg_path_, spec, inputs, output, concat_list);

    ProcessRunner::Options options;
    options.timeout = context.remaining();
    options.working_directory = context.workspace.path();

    ProcessResult result = ProcessRunner::run(argv, options, context.token);
    if (!result.success())
    {
        std::string diagnostics = summarizeDiagnostics(result.stderr_tail);
        Logger::warn("ffmpeg exited with code " + std::to_string(result.exit_code) + " for " +
                     OperationKinds::getName(spec.kind));
        throw TransformFailed(diagnostics.empty() ? "ffmpeg exited with code " + std::to_string(result.exit_code)
                                                  : diagnostics);
    }

    return makeArtifact(output, mime_type, download_name);
}
