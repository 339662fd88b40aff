#include "test_base.hpp"
#include "core/errors.hpp"
#include "core/ffmpeg_adapter.hpp"
#include <algorithm>
#include <sstream>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace
{
    bool containsSequence(const std::vector<std::string> &args, const std::vector<std::string> &seq)
    {
        return std::search(args.begin(), args.end(), seq.begin(), seq.end()) != args.end();
    }

    std::string readAll(const fs::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }
}

class FfmpegAdapterTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        manager_ = std::make_unique<WorkspaceManager>(temp_root_ / "work");
        workspace_ = manager_->create();
        tools_dir_ = temp_root_ / "bin";
    }

    StagedAsset stagedInput(const std::string &name, const std::string &display)
    {
        StagedAsset asset;
        asset.path = writeFile(workspace_->path(), name, "input-bytes");
        asset.display_name = display;
        asset.size_bytes = 11;
        return asset;
    }

    // Records its arguments into args.txt (cwd is the workspace) and writes the last one
    fs::path recordingFfmpeg()
    {
        return writeScript(tools_dir_, "ffmpeg", "printf '%s\\n' \"$@\" > args.txt\n"
                                                 "for last; do :; done\n"
                                                 "printf 'encoded' > \"$last\"");
    }

    std::unique_ptr<WorkspaceManager> manager_;
    WorkspaceHandle workspace_;
    fs::path tools_dir_;
    CancellationToken token_;
};

TEST_F(FfmpegAdapterTest, CompressCommandUsesDerivedBitrate)
{
    ConversionSpec spec;
    spec.kind = OperationKind::AUDIO_COMPRESS;
    spec.quality = 50;
    spec.bitrate_kbps = 176;

    std::vector<StagedAsset> inputs{stagedInput("in.wav", "song.wav")};
    auto args = FfmpegAdapter::buildCommand("ffmpeg", spec, inputs, "/w/out.mp3", "");

    EXPECT_EQ(args.front(), "ffmpeg");
    EXPECT_TRUE(containsSequence(args, {"-hide_banner", "-nostdin", "-y", "-loglevel", "error"}));
    EXPECT_TRUE(containsSequence(args, {"-i", inputs[0].path.string()}));
    EXPECT_TRUE(containsSequence(args, {"-codec:a", "libmp3lame", "-b:a", "176k"}));
    EXPECT_EQ(args.back(), "/w/out.mp3");
}

TEST_F(FfmpegAdapterTest, MergeCommandUsesConcatDemuxer)
{
    ConversionSpec spec;
    spec.kind = OperationKind::AUDIO_MERGE;

    auto args = FfmpegAdapter::buildCommand("ffmpeg", spec, {}, "/w/merged.mp3", "/w/concat.txt");
    EXPECT_TRUE(containsSequence(args, {"-f", "concat", "-safe", "0", "-i", "/w/concat.txt"}));
    EXPECT_TRUE(containsSequence(args, {"-codec:a", "libmp3lame", "-q:a", "2"}));
}

TEST_F(FfmpegAdapterTest, VideoCommandAddsScaleOnlyWhenRequested)
{
    ConversionSpec spec;
    spec.kind = OperationKind::VIDEO_TRANSCODE;
    spec.output_format = "webm";
    spec.resolution = "640x360";
    std::vector<StagedAsset> inputs{stagedInput("in.mov", "clip.mov")};

    auto args = FfmpegAdapter::buildCommand("ffmpeg", spec, inputs, "/w/output.webm", "");
    EXPECT_TRUE(containsSequence(args, {"-c:v", "libvpx", "-b:v", "1M"}));
    EXPECT_TRUE(containsSequence(args, {"-vf", "scale=640:360"}));

    spec.resolution = "original";
    spec.output_format = "mp4";
    args = FfmpegAdapter::buildCommand("ffmpeg", spec, inputs, "/w/output.mp4", "");
    EXPECT_TRUE(containsSequence(args, {"-c:v", "libx264", "-preset", "fast", "-crf", "28"}));
    EXPECT_EQ(std::find(args.begin(), args.end(), "-vf"), args.end());
}

TEST_F(FfmpegAdapterTest, CompressProducesNamedArtifact)
{
    FfmpegAdapter adapter(recordingFfmpeg().string());
    ConversionSpec spec;
    spec.kind = OperationKind::AUDIO_COMPRESS;
    spec.bitrate_kbps = 61;

    TransformContext context(*workspace_, token_, 10s);
    auto artifact = adapter.execute(spec, {stagedInput("in.wav", "voice.wav")}, context);

    EXPECT_EQ(artifact.mime_type, "audio/mpeg");
    EXPECT_EQ(artifact.download_name, "compressed-voice.wav.mp3");
    EXPECT_EQ(artifact.path.parent_path(), workspace_->path());
    EXPECT_EQ(readAll(artifact.path), "encoded");
    EXPECT_NE(readAll(workspace_->path() / "args.txt").find("61k"), std::string::npos);
}

TEST_F(FfmpegAdapterTest, MergeWritesConcatListInSubmissionOrder)
{
    FfmpegAdapter adapter(recordingFfmpeg().string());
    ConversionSpec spec;
    spec.kind = OperationKind::AUDIO_MERGE;

    std::vector<StagedAsset> inputs{stagedInput("000-a.mp3", "b.mp3"),
                                    stagedInput("001-b.mp3", "a.mp3"),
                                    stagedInput("002-c.mp3", "c.mp3")};
    TransformContext context(*workspace_, token_, 10s);
    auto artifact = adapter.execute(spec, inputs, context);

    EXPECT_EQ(artifact.download_name, "merged-audio.mp3");
    std::string list = readAll(workspace_->path() / "concat.txt");
    auto first = list.find("000-a.mp3");
    auto second = list.find("001-b.mp3");
    auto third = list.find("002-c.mp3");
    ASSERT_NE(first, std::string::npos);
    EXPECT_LT(first, second);
    EXPECT_LT(second, third);
}

TEST_F(FfmpegAdapterTest, VideoArtifactNamedAfterFormat)
{
    FfmpegAdapter adapter(recordingFfmpeg().string());
    ConversionSpec spec;
    spec.kind = OperationKind::VIDEO_TRANSCODE;
    spec.output_format = "webm";

    TransformContext context(*workspace_, token_, 10s);
    auto artifact = adapter.execute(spec, {stagedInput("in.mp4", "clip.mp4")}, context);

    EXPECT_EQ(artifact.download_name, "video.webm");
    EXPECT_EQ(artifact.mime_type, "video/webm");
}

TEST_F(FfmpegAdapterTest, NonZeroExitCarriesDiagnostics)
{
    auto tool = writeScript(tools_dir_, "ffmpeg", "echo 'in.wav: Invalid data found when processing input' >&2\nexit 1");
    FfmpegAdapter adapter(tool.string());
    ConversionSpec spec;
    spec.kind = OperationKind::AUDIO_COMPRESS;

    TransformContext context(*workspace_, token_, 10s);
    try
    {
        adapter.execute(spec, {stagedInput("in.wav", "x.wav")}, context);
        FAIL() << "expected TransformFailed";
    }
    catch (const TransformFailed &e)
    {
        EXPECT_NE(std::string(e.what()).find("Invalid data found"), std::string::npos);
    }
}

TEST_F(FfmpegAdapterTest, MissingOutputIsFailure)
{
    auto tool = writeScript(tools_dir_, "ffmpeg", "exit 0");
    FfmpegAdapter adapter(tool.string());
    ConversionSpec spec;
    spec.kind = OperationKind::AUDIO_COMPRESS;

    TransformContext context(*workspace_, token_, 10s);
    EXPECT_THROW(adapter.execute(spec, {stagedInput("in.wav", "x.wav")}, context), TransformFailed);
}

TEST_F(FfmpegAdapterTest, SlowToolTimesOut)
{
    auto tool = writeScript(tools_dir_, "ffmpeg", "sleep 30");
    FfmpegAdapter adapter(tool.string());
    ConversionSpec spec;
    spec.kind = OperationKind::AUDIO_COMPRESS;

    TransformContext context(*workspace_, token_, 300ms);
    EXPECT_THROW(adapter.execute(spec, {stagedInput("in.wav", "x.wav")}, context), TransformTimeout);
}

TEST_F(FfmpegAdapterTest, DiagnosticsSummaryIsBounded)
{
    std::string noisy;
    for (int i = 0; i < 200; ++i)
        noisy += "warning line " + std::to_string(i) + "\n";
    auto summary = FfmpegAdapter::summarizeDiagnostics(noisy + "\n\nfatal: bad input\n");

    EXPECT_LE(summary.size(), 603u);
    EXPECT_NE(summary.find("fatal: bad input"), std::string::npos);
    EXPECT_EQ(FfmpegAdapter::summarizeDiagnostics("\n\n"), "");
}

TEST_F(FfmpegAdapterTest, SupportsOnlyAudioAndVideo)
{
    FfmpegAdapter adapter;
    EXPECT_TRUE(adapter.supports(OperationKind::AUDIO_COMPRESS));
    EXPECT_TRUE(adapter.supports(OperationKind::AUDIO_MERGE));
    EXPECT_TRUE(adapter.supports(OperationKind::VIDEO_TRANSCODE));
    EXPECT_FALSE(adapter.supports(OperationKind::IMAGE_RESIZE));
    EXPECT_FALSE(adapter.supports(OperationKind::PDF_MERGE));
}
