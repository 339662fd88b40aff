#include "core/request_orchestrator.hpp"
#include "core/errors.hpp"
#include "core/transform_params.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace
{
    std::string toLower(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    std::string trim(const std::string &value)
    {
        auto first = value.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";
        auto last = value.find_last_not_of(" \t\r\n");
        return value.substr(first, last - first + 1);
    }

    // Whole-string integer parse; dimensions are not parsed leniently
    bool parseStrictInt(const std::string &value, long &out)
    {
        std::string text = trim(value);
        if (text.empty())
            return false;
        errno = 0;
        char *end = nullptr;
        long parsed = std::strtol(text.c_str(), &end, 10);
        if (errno != 0 || end == text.c_str() || *end != '\0')
            return false;
        out = parsed;
        return true;
    }

    int requireDimension(const UploadForm &form, const std::string &name)
    {
        auto value = form.field(name);
        if (!value)
        {
            throw MissingInput("Missing " + name, name);
        }
        long parsed = 0;
        if (!parseStrictInt(*value, parsed) || parsed <= 0 || parsed > RequestOrchestrator::MAX_IMAGE_DIMENSION)
        {
            throw ValidationError("Invalid " + name + ": expected an integer between 1 and " +
                                  std::to_string(RequestOrchestrator::MAX_IMAGE_DIMENSION));
        }
        return static_cast<int>(parsed);
    }

    const UploadedFile &requireFile(const UploadForm &form, const std::string &field, const std::string &what)
    {
        const UploadedFile *file = form.file(field);
        if (!file)
        {
            throw MissingInput("No " + what + " uploaded", field);
        }
        return *file;
    }
}

RequestOrchestrator::RequestOrchestrator(int max_files_per_request,
                                         WorkspaceManager &workspaces, const AssetStager &stager,
                                         const TransformInvoker &invoker, ConcurrencyLimiter &limiter,
                                         JobRegistry &registry)
    : max_files_per_request_(max_files_per_request),
      workspaces_(workspaces),
      stager_(stager),
      invoker_(invoker),
      limiter_(limiter),
      registry_(registry)
{
}

int RequestOrchestrator::parseIntOr(const std::optional<std::string> &value, int fallback)
{
    if (!value)
        return fallback;
    std::string text = trim(*value);
    errno = 0;
    char *end = nullptr;
    long parsed = std::strtol(text.c_str(), &end, 10);
    if (end == text.c_str() || errno == ERANGE)
        return fallback;
    return static_cast<int>(std::clamp<long>(parsed, -1000000, 1000000));
}

double RequestOrchestrator::parseDoubleOr(const std::optional<std::string> &value, double fallback)
{
    if (!value)
        return fallback;
    std::string text = trim(*value);
    char *end = nullptr;
    double parsed = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || !std::isfinite(parsed))
        return fallback;
    return parsed;
}

ConversionSpec RequestOrchestrator::buildSpec(OperationKind kind, const UploadForm &form) const
{
    ConversionSpec spec;
    spec.kind = kind;

    switch (kind)
    {
    case OperationKind::AUDIO_COMPRESS:
    {
        // Zero counts as unset, like an empty field
        int quality = parseIntOr(form.field("quality"), TransformParams::DEFAULT_QUALITY);
        if (quality == 0)
            quality = TransformParams::DEFAULT_QUALITY;
        spec.quality = TransformParams::clampQuality(quality);
        spec.bitrate_kbps = TransformParams::bitrateForQuality(spec.quality);
        break;
    }

    case OperationKind::AUDIO_MERGE:
    case OperationKind::PDF_MERGE:
        break;

    case OperationKind::IMAGE_CONVERT:
    {
        auto format = form.field("format");
        if (!format)
        {
            throw MissingInput("No target format specified", "format");
        }
        spec.output_format = TransformParams::normalizeImageFormat(trim(*format));
        break;
    }

    case OperationKind::IMAGE_RESIZE:
        spec.width = requireDimension(form, "width");
        spec.height = requireDimension(form, "height");
        spec.output_format = TransformParams::normalizeImageFormat(trim(form.field("format").value_or("png")));
        break;

    case OperationKind::IMAGE_WATERMARK:
    {
        auto text = form.field("text");
        if (!text)
        {
            throw MissingInput("No watermark text provided", "text");
        }
        spec.watermark_text = *text;
        spec.font_size = std::clamp(parseIntOr(form.field("fontSize"), 18), MIN_FONT_SIZE, MAX_FONT_SIZE);
        spec.color = TransformParams::parseHexColor(trim(form.field("color").value_or("#ff0000")));
        spec.opacity = std::clamp(parseDoubleOr(form.field("opacity"), 1.0), 0.0, 1.0);

        auto position_name = form.field("position");
        if (position_name)
        {
            auto position = TransformParams::parseWatermarkPosition(trim(*position_name));
            if (!position)
            {
                throw ValidationError("Invalid position \"" + *position_name +
                                      "\": expected top-left, top-right, bottom-left, bottom-right or center");
            }
            spec.position = *position;
        }
        else
        {
            spec.position = WatermarkPosition::CENTER;
        }
        spec.output_format = "png";
        break;
    }

    case OperationKind::VIDEO_TRANSCODE:
    {
        spec.output_format = toLower(trim(form.field("format").value_or("mp4")));
        if (!TransformParams::isValidContainerFormat(spec.output_format))
        {
            throw ValidationError("Invalid format: expected 1 to 10 letters or digits");
        }
        spec.resolution = trim(form.field("resolution").value_or("original"));
        if (toLower(spec.resolution) == "original")
        {
            spec.resolution = "original";
        }
        else if (!TransformParams::parseResolution(spec.resolution))
        {
            throw ValidationError("Invalid resolution \"" + spec.resolution + "\": expected WIDTHxHEIGHT or original");
        }
        break;
    }
    }

    return spec;
}

std::vector<const UploadedFile *> RequestOrchestrator::selectInputs(OperationKind kind, const UploadForm &form) const
{
    switch (kind)
    {
    case OperationKind::AUDIO_COMPRESS:
        return {&requireFile(form, "audio", "audio")};

    case OperationKind::AUDIO_MERGE:
    {
        auto files = form.filesNamed("audios");
        if (files.size() < 2)
        {
            throw ValidationError("Upload at least 2 audio files");
        }
        if (static_cast<int>(files.size()) > max_files_per_request_)
        {
            throw ValidationError("Upload at most " + std::to_string(max_files_per_request_) + " audio files");
        }
        return files;
    }

    case OperationKind::IMAGE_CONVERT:
    case OperationKind::IMAGE_RESIZE:
    case OperationKind::IMAGE_WATERMARK:
        return {&requireFile(form, "image", "image")};

    case OperationKind::PDF_MERGE:
    {
        auto files = form.filesNamed("pdfs");
        if (files.empty())
        {
            throw MissingInput("No PDFs uploaded", "pdfs");
        }
        if (static_cast<int>(files.size()) > max_files_per_request_)
        {
            throw ValidationError("Upload at most " + std::to_string(max_files_per_request_) + " PDF files");
        }
        return files;
    }

    case OperationKind::VIDEO_TRANSCODE:
        return {&requireFile(form, "video", "video")};
    }
    throw ValidationError("Unsupported operation");
}

CompletedJob RequestOrchestrator::execute(OperationKind kind, const UploadForm &form, CancellationTokenPtr token)
{
    if (!token)
    {
        token = std::make_shared<CancellationToken>();
    }

    const std::string job_id = registry_.add(kind, token);
    Logger::debug("Job " + job_id + ": received " + OperationKinds::getName(kind));

    WorkspaceHandle workspace;
    try
    {
        auto uploads = selectInputs(kind, form);
        ConversionSpec spec = buildSpec(kind, form);
        for (const auto *upload : uploads)
        {
            stager_.checkSize(upload->content.size(), upload->filename);
        }
        registry_.setState(job_id, JobState::VALIDATED);

        auto slot = limiter_.acquire();
        workspace = workspaces_.create();

        const bool ordered = kind == OperationKind::AUDIO_MERGE || kind == OperationKind::PDF_MERGE;
        std::vector<StagedAsset> inputs;
        inputs.reserve(uploads.size());
        for (size_t i = 0; i < uploads.size(); ++i)
        {
            std::optional<int> ordinal;
            if (ordered)
                ordinal = static_cast<int>(i);
            inputs.push_back(stager_.stage(*workspace, uploads[i]->content, uploads[i]->filename, ordinal));
        }
        registry_.setState(job_id, JobState::STAGED);
        Logger::debug("Job " + job_id + ": staged " + std::to_string(inputs.size()) + " input(s) in workspace " +
                      workspace->id());

        registry_.setState(job_id, JobState::TRANSFORMING);
        Artifact artifact = invoker_.invoke(spec, inputs, *workspace, *token, job_id);

        registry_.setState(job_id, JobState::STREAMING);
        Logger::debug("Job " + job_id + ": streaming " + artifact.download_name);

        CompletedJob job;
        job.job_id = job_id;
        job.kind = kind;
        job.workspace = workspace;
        job.artifact = artifact;
        return job;
    }
    catch (const std::exception &e)
    {
        fail(job_id, workspace, e);
        throw;
    }
}

void RequestOrchestrator::fail(const std::string &job_id, const WorkspaceHandle &workspace, const std::exception &error)
{
    registry_.setState(job_id, JobState::FAILED);
    WorkspaceManager::destroy(workspace);
    registry_.remove(job_id);

    const auto *tool_error = dynamic_cast<const ToolError *>(&error);
    if (const auto *missing = dynamic_cast<const MissingInput *>(&error))
    {
        Logger::info("Job " + job_id + ": rejected, missing field '" + missing->field() + "': " + error.what());
    }
    else if (tool_error && tool_error->kind() == ErrorKind::VALIDATION)
    {
        Logger::info("Job " + job_id + ": rejected: " + error.what());
    }
    else
    {
        Logger::warn("Job " + job_id + ": failed (" +
                     (tool_error ? ToolError::kindName(tool_error->kind()) : std::string("unexpected")) + "): " +
                     error.what());
    }
}

void RequestOrchestrator::finish(const CompletedJob &job, bool success)
{
    registry_.setState(job.job_id, success ? JobState::DONE : JobState::FAILED);
    WorkspaceManager::destroy(job.workspace);
    registry_.remove(job.job_id);

    if (success)
    {
        Logger::info("Job " + job.job_id + ": " + OperationKinds::getName(job.kind) + " delivered " +
                     std::to_string(job.artifact.size_bytes) + " bytes");
    }
    else
    {
        Logger::warn("Job " + job.job_id + ": download of " + job.artifact.download_name + " aborted");
    }
}
