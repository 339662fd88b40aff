#include "test_base.hpp"
#include "core/errors.hpp"
#include "core/request_orchestrator.hpp"
#include <spdlog/sinks/ostream_sink.h>
#include <atomic>
#include <mutex>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace
{
    // Adapter that concatenates its inputs, or misbehaves on request
    class ScriptedAdapter : public TransformationAdapter
    {
    public:
        enum class Mode
        {
            CONCAT,
            FAIL,
            HANG,
            THROW_STD
        };

        explicit ScriptedAdapter(Mode mode) : mode_(mode) {}

        std::string name() const override { return "scripted"; }
        bool supports(OperationKind) const override { return true; }

        Artifact execute(const ConversionSpec &spec, const std::vector<StagedAsset> &inputs,
                         const TransformContext &context) override
        {
            ++calls;
            {
                std::lock_guard<std::mutex> lock(record_mutex_);
                last_spec = spec;
                last_inputs = inputs;
            }
            // Hold every call until `rendezvous` of them are running at once
            auto wait_until = std::chrono::steady_clock::now() + 5s;
            while (calls.load() < rendezvous && std::chrono::steady_clock::now() < wait_until)
                std::this_thread::sleep_for(1ms);

            switch (mode_)
            {
            case Mode::FAIL:
                throw TransformFailed("cannot decode " + inputs.front().path.string());
            case Mode::THROW_STD:
                throw std::runtime_error("library blew up");
            case Mode::HANG:
                while (true)
                {
                    context.checkpoint();
                    std::this_thread::sleep_for(5ms);
                }
            case Mode::CONCAT:
                break;
            }

            auto output = context.workspace.resolve("result.bin");
            std::ofstream out(output, std::ios::binary);
            for (const auto &input : inputs)
            {
                std::ifstream in(input.path, std::ios::binary);
                out << in.rdbuf();
            }
            out.close();
            return makeArtifact(output, "application/octet-stream", "result.bin");
        }

        std::atomic<int> calls{0};
        int rendezvous = 0;
        ConversionSpec last_spec;
        std::vector<StagedAsset> last_inputs;

    private:
        Mode mode_;
        std::mutex record_mutex_;
    };

    // Copies the service logger's output into a string while in scope
    class LogCapture
    {
    public:
        LogCapture()
            : logger_(spdlog::get("media_tools")),
              sink_(std::make_shared<spdlog::sinks::ostream_sink_mt>(stream_))
        {
            logger_->sinks().push_back(sink_);
            Logger::init("INFO");
        }

        ~LogCapture()
        {
            Logger::init("WARN");
            logger_->sinks().pop_back();
        }

        std::string text() const { return stream_.str(); }

    private:
        std::ostringstream stream_;
        std::shared_ptr<spdlog::logger> logger_;
        std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink_;
    };

    std::string readAll(const fs::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }
}

class RequestOrchestratorTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        workspaces_ = std::make_unique<WorkspaceManager>(temp_root_);
        stager_ = std::make_unique<AssetStager>(1024);
        limiter_ = std::make_unique<ConcurrencyLimiter>(2, 100ms);
        invoker_ = std::make_unique<TransformInvoker>(10s);
        use(ScriptedAdapter::Mode::CONCAT);
        build();
    }

    void build()
    {
        orchestrator_ = std::make_unique<RequestOrchestrator>(4, *workspaces_, *stager_, *invoker_, *limiter_, registry_);
    }

    void use(ScriptedAdapter::Mode mode)
    {
        adapter_ = std::make_shared<ScriptedAdapter>(mode);
        invoker_->registerAdapter(adapter_);
    }

    static UploadForm formWithFiles(const std::string &field, const std::vector<std::string> &contents)
    {
        UploadForm form;
        int n = 0;
        for (const auto &content : contents)
        {
            UploadedFile file;
            file.field = field;
            file.filename = "upload" + std::to_string(n++) + ".bin";
            file.content = content;
            form.files.push_back(file);
        }
        return form;
    }

    std::unique_ptr<WorkspaceManager> workspaces_;
    std::unique_ptr<AssetStager> stager_;
    std::unique_ptr<ConcurrencyLimiter> limiter_;
    std::unique_ptr<TransformInvoker> invoker_;
    JobRegistry registry_;
    std::shared_ptr<ScriptedAdapter> adapter_;
    std::unique_ptr<RequestOrchestrator> orchestrator_;
};

TEST_F(RequestOrchestratorTest, SuccessfulJobKeepsWorkspaceUntilFinish)
{
    auto form = formWithFiles("audios", {"aaa", "bbb", "ccc"});
    auto job = orchestrator_->execute(OperationKind::AUDIO_MERGE, form, nullptr);

    ASSERT_TRUE(job.workspace);
    EXPECT_TRUE(fs::exists(job.artifact.path));
    EXPECT_EQ(job.artifact.size_bytes, 9u);
    EXPECT_EQ(registry_.snapshot().at(0).state, JobState::STREAMING);
    EXPECT_EQ(limiter_->active(), 0u);

    orchestrator_->finish(job, true);
    EXPECT_EQ(entriesUnderTempRoot(), 0u);
    EXPECT_EQ(registry_.count(), 0u);
    EXPECT_EQ(registry_.completedCount(), 1u);
}

TEST_F(RequestOrchestratorTest, MergeInputsKeepSubmissionOrder)
{
    auto form = formWithFiles("audios", {"1", "2", "3"});
    auto job = orchestrator_->execute(OperationKind::AUDIO_MERGE, form, nullptr);

    std::ifstream in(job.artifact.path);
    std::string merged((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(merged, "123");
    ASSERT_EQ(adapter_->last_inputs.size(), 3u);
    EXPECT_EQ(adapter_->last_inputs[0].ordinal.value_or(-1), 0);
    EXPECT_EQ(adapter_->last_inputs[2].ordinal.value_or(-1), 2);
    orchestrator_->finish(job, true);
}

TEST_F(RequestOrchestratorTest, ValidationFailsBeforeWorkspaceOrTransform)
{
    EXPECT_THROW(orchestrator_->execute(OperationKind::AUDIO_MERGE, formWithFiles("audios", {"only"}), nullptr),
                 ValidationError);
    EXPECT_THROW(orchestrator_->execute(OperationKind::AUDIO_MERGE, formWithFiles("audios", {}), nullptr),
                 ValidationError);
    EXPECT_THROW(orchestrator_->execute(OperationKind::AUDIO_MERGE,
                                        formWithFiles("audios", {"1", "2", "3", "4", "5"}), nullptr),
                 ValidationError);
    EXPECT_THROW(orchestrator_->execute(OperationKind::AUDIO_COMPRESS, formWithFiles("wrong", {"x"}), nullptr),
                 MissingInput);

    EXPECT_EQ(adapter_->calls.load(), 0);
    EXPECT_EQ(entriesUnderTempRoot(), 0u);
    EXPECT_EQ(registry_.count(), 0u);
    EXPECT_EQ(registry_.failedCount(), 4u);
}

TEST_F(RequestOrchestratorTest, OversizedUploadRejectedBeforeStaging)
{
    auto form = formWithFiles("image", {std::string(2048, 'x')});
    form.fields["format"] = "png";
    EXPECT_THROW(orchestrator_->execute(OperationKind::IMAGE_CONVERT, form, nullptr), PayloadTooLarge);
    EXPECT_EQ(adapter_->calls.load(), 0);
    EXPECT_EQ(entriesUnderTempRoot(), 0u);
}

TEST_F(RequestOrchestratorTest, TransformFailureRemovesWorkspaceAndScrubsPaths)
{
    use(ScriptedAdapter::Mode::FAIL);
    auto form = formWithFiles("video", {"frames"});
    try
    {
        orchestrator_->execute(OperationKind::VIDEO_TRANSCODE, form, nullptr);
        FAIL() << "expected TransformFailed";
    }
    catch (const TransformFailed &e)
    {
        EXPECT_EQ(std::string(e.what()).find(temp_root_.string()), std::string::npos);
    }
    EXPECT_EQ(entriesUnderTempRoot(), 0u);
    EXPECT_EQ(registry_.count(), 0u);
}

TEST_F(RequestOrchestratorTest, UnexpectedExceptionBecomesTransformFailed)
{
    use(ScriptedAdapter::Mode::THROW_STD);
    auto form = formWithFiles("pdfs", {"%PDF"});
    EXPECT_THROW(orchestrator_->execute(OperationKind::PDF_MERGE, form, nullptr), TransformFailed);
    EXPECT_EQ(entriesUnderTempRoot(), 0u);
}

TEST_F(RequestOrchestratorTest, TimeoutRemovesWorkspace)
{
    orchestrator_.reset();
    invoker_ = std::make_unique<TransformInvoker>(150ms);
    use(ScriptedAdapter::Mode::HANG);
    build();

    auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(orchestrator_->execute(OperationKind::VIDEO_TRANSCODE, formWithFiles("video", {"v"}), nullptr),
                 TransformTimeout);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
    EXPECT_EQ(entriesUnderTempRoot(), 0u);
    EXPECT_EQ(limiter_->active(), 0u);
}

TEST_F(RequestOrchestratorTest, CancelledJobRemovesWorkspace)
{
    use(ScriptedAdapter::Mode::HANG);
    auto token = std::make_shared<CancellationToken>();
    std::thread canceller([this]()
                          {
        while (registry_.count() == 0 || registry_.snapshot().at(0).state != JobState::TRANSFORMING)
            std::this_thread::sleep_for(5ms);
        registry_.cancelAll("shutdown"); });

    EXPECT_THROW(orchestrator_->execute(OperationKind::VIDEO_TRANSCODE, formWithFiles("video", {"v"}), token),
                 TransformFailed);
    canceller.join();
    EXPECT_EQ(token->reason(), "shutdown");
    EXPECT_EQ(entriesUnderTempRoot(), 0u);
}

TEST_F(RequestOrchestratorTest, AbortedDownloadCountsAsFailure)
{
    auto job = orchestrator_->execute(OperationKind::AUDIO_COMPRESS, formWithFiles("audio", {"pcm"}), nullptr);
    orchestrator_->finish(job, false);
    EXPECT_EQ(entriesUnderTempRoot(), 0u);
    EXPECT_EQ(registry_.failedCount(), 1u);
    EXPECT_EQ(registry_.completedCount(), 0u);
}

TEST_F(RequestOrchestratorTest, BuildSpecAppliesDefaultsAndClamps)
{
    UploadForm form;
    auto compress = orchestrator_->buildSpec(OperationKind::AUDIO_COMPRESS, form);
    EXPECT_EQ(compress.quality, 50);
    EXPECT_EQ(compress.bitrate_kbps, 176);

    form.fields["quality"] = "500";
    EXPECT_EQ(orchestrator_->buildSpec(OperationKind::AUDIO_COMPRESS, form).quality, 100);
    form.fields["quality"] = "abc";
    EXPECT_EQ(orchestrator_->buildSpec(OperationKind::AUDIO_COMPRESS, form).quality, 50);
    form.fields["quality"] = "5";
    EXPECT_EQ(orchestrator_->buildSpec(OperationKind::AUDIO_COMPRESS, form).quality, 10);

    // Zero is treated as absent, not clamped up to the minimum
    form.fields["quality"] = "0";
    auto zero = orchestrator_->buildSpec(OperationKind::AUDIO_COMPRESS, form);
    EXPECT_EQ(zero.quality, 50);
    EXPECT_EQ(zero.bitrate_kbps, 176);

    UploadForm watermark;
    watermark.fields["text"] = "Draft";
    watermark.fields["fontSize"] = "5000";
    watermark.fields["opacity"] = "-2";
    auto spec = orchestrator_->buildSpec(OperationKind::IMAGE_WATERMARK, watermark);
    EXPECT_EQ(spec.font_size, RequestOrchestrator::MAX_FONT_SIZE);
    EXPECT_DOUBLE_EQ(spec.opacity, 0.0);
    EXPECT_EQ(spec.color, (RgbColor{255, 0, 0}));
    EXPECT_EQ(spec.position, WatermarkPosition::CENTER);

    UploadForm video;
    auto transcode = orchestrator_->buildSpec(OperationKind::VIDEO_TRANSCODE, video);
    EXPECT_EQ(transcode.output_format, "mp4");
    EXPECT_EQ(transcode.resolution, "original");
}

TEST_F(RequestOrchestratorTest, BuildSpecRejectsMalformedFields)
{
    UploadForm convert;
    EXPECT_THROW(orchestrator_->buildSpec(OperationKind::IMAGE_CONVERT, convert), MissingInput);

    UploadForm resize;
    resize.fields["width"] = "100";
    EXPECT_THROW(orchestrator_->buildSpec(OperationKind::IMAGE_RESIZE, resize), MissingInput);
    resize.fields["height"] = "0";
    EXPECT_THROW(orchestrator_->buildSpec(OperationKind::IMAGE_RESIZE, resize), ValidationError);
    resize.fields["height"] = "50px";
    EXPECT_THROW(orchestrator_->buildSpec(OperationKind::IMAGE_RESIZE, resize), ValidationError);
    resize.fields["height"] = "50";
    auto spec = orchestrator_->buildSpec(OperationKind::IMAGE_RESIZE, resize);
    EXPECT_EQ(spec.width, 100);
    EXPECT_EQ(spec.height, 50);
    EXPECT_EQ(spec.output_format, "png");

    UploadForm watermark;
    EXPECT_THROW(orchestrator_->buildSpec(OperationKind::IMAGE_WATERMARK, watermark), MissingInput);
    watermark.fields["text"] = "x";
    watermark.fields["position"] = "middle";
    EXPECT_THROW(orchestrator_->buildSpec(OperationKind::IMAGE_WATERMARK, watermark), ValidationError);

    UploadForm video;
    video.fields["format"] = "../mp4";
    EXPECT_THROW(orchestrator_->buildSpec(OperationKind::VIDEO_TRANSCODE, video), ValidationError);
    video.fields["format"] = "WebM";
    video.fields["resolution"] = "huge";
    EXPECT_THROW(orchestrator_->buildSpec(OperationKind::VIDEO_TRANSCODE, video), ValidationError);
    video.fields["resolution"] = "1280x720";
    auto transcode = orchestrator_->buildSpec(OperationKind::VIDEO_TRANSCODE, video);
    EXPECT_EQ(transcode.output_format, "webm");
    EXPECT_EQ(transcode.resolution, "1280x720");
}

TEST_F(RequestOrchestratorTest, BusyLimiterRejectsWithoutWorkspace)
{
    auto first = limiter_->acquire();
    auto second = limiter_->acquire();
    EXPECT_THROW(orchestrator_->execute(OperationKind::AUDIO_COMPRESS, formWithFiles("audio", {"pcm"}), nullptr),
                 ServiceBusy);
    EXPECT_EQ(entriesUnderTempRoot(), 0u);
    EXPECT_EQ(adapter_->calls.load(), 0);
}

TEST_F(RequestOrchestratorTest, MissingFileReportedBeforeMissingFields)
{
    UploadForm empty;
    try
    {
        orchestrator_->execute(OperationKind::IMAGE_RESIZE, empty, nullptr);
        FAIL() << "expected MissingInput";
    }
    catch (const MissingInput &e)
    {
        EXPECT_STREQ(e.what(), "No image uploaded");
        EXPECT_EQ(e.field(), "image");
    }
    EXPECT_EQ(adapter_->calls.load(), 0);
    EXPECT_EQ(entriesUnderTempRoot(), 0u);
}

TEST_F(RequestOrchestratorTest, ConcurrentUploadsWithSameNameStayIsolated)
{
    adapter_->rendezvous = 2;

    auto formWith = [](const std::string &content)
    {
        UploadForm form;
        UploadedFile file;
        file.field = "audio";
        file.filename = "same.wav";
        file.content = content;
        form.files.push_back(file);
        return form;
    };

    CompletedJob first;
    CompletedJob second;
    std::thread a([&]()
                  { EXPECT_NO_THROW(first = orchestrator_->execute(OperationKind::AUDIO_COMPRESS, formWith("AAAA"), nullptr)); });
    std::thread b([&]()
                  { EXPECT_NO_THROW(second = orchestrator_->execute(OperationKind::AUDIO_COMPRESS, formWith("BBBB"), nullptr)); });
    a.join();
    b.join();

    ASSERT_TRUE(first.workspace);
    ASSERT_TRUE(second.workspace);
    EXPECT_EQ(adapter_->calls.load(), 2);
    EXPECT_NE(first.job_id, second.job_id);
    EXPECT_NE(first.workspace->path(), second.workspace->path());
    EXPECT_NE(first.artifact.path, second.artifact.path);
    EXPECT_EQ(readAll(first.artifact.path), "AAAA");
    EXPECT_EQ(readAll(second.artifact.path), "BBBB");
    EXPECT_EQ(workspaces_->countLive(), 2u);

    orchestrator_->finish(first, true);
    orchestrator_->finish(second, true);
    EXPECT_EQ(workspaces_->countLive(), 0u);
    EXPECT_EQ(entriesUnderTempRoot(), 0u);
    EXPECT_EQ(registry_.completedCount(), 2u);
}

TEST_F(RequestOrchestratorTest, TransformLogCarriesRegistryJobId)
{
    CompletedJob job;
    std::string log;
    {
        LogCapture capture;
        job = orchestrator_->execute(OperationKind::AUDIO_COMPRESS, formWithFiles("audio", {"pcm"}), nullptr);
        log = capture.text();
    }

    EXPECT_NE(log.find("Job " + job.job_id + ": scripted finished"), std::string::npos);
    EXPECT_EQ(log.find("Job " + job.workspace->id()), std::string::npos);
    orchestrator_->finish(job, true);
}
