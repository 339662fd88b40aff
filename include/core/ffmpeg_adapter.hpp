#pragma once

#include "core/process_runner.hpp"
#include "core/transformation_adapter.hpp"
#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief Audio and video operations backed by the ffmpeg command line tool
 *
 * Handles audio compression, audio concatenation and video transcoding. The
 * tool runs through ProcessRunner with the context's remaining time as its
 * timeout, so cancellation and deadlines kill the child process.
 */
class FfmpegAdapter : public TransformationAdapter
{
public:
    explicit FfmpegAdapter(std::string ffmpeg_path = "ffmpeg");

    std::string name() const override { return "ffmpeg"; }
    bool supports(OperationKind kind) const override;

    Artifact execute(const ConversionSpec &spec, const std::vector<StagedAsset> &inputs,
                     const TransformContext &context) override;

    /**
     * @brief Build the complete argument vector for one invocation
     * @param ffmpeg_path Program to run
     * @param spec Validated operation spec
     * @param inputs Staged inputs, in submission order
     * @param output Output file path
     * @param concat_list Concat list path, used by audio merge only
     */
    static std::vector<std::string> buildCommand(const std::string &ffmpeg_path, const ConversionSpec &spec,
                                                 const std::vector<StagedAsset> &inputs,
                                                 const std::filesystem::path &output,
                                                 const std::filesystem::path &concat_list);

    // Last meaningful lines of ffmpeg's stderr, trimmed for an error message
    static std::string summarizeDiagnostics(const std::string &stderr_tail);

private:
    std::string ffmpeg_path_;
};
