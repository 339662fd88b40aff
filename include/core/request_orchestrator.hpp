#pragma once

#include "core/asset_stager.hpp"
#include "core/concurrency_limiter.hpp"
#include "core/conversion_spec.hpp"
#include "core/job_registry.hpp"
#include "core/transform_invoker.hpp"
#include "core/upload_form.hpp"
#include "core/workspace_manager.hpp"
#include <optional>
#include <string>
#include <vector>

/**
 * @brief A job whose artifact is ready to be streamed
 *
 * The workspace stays alive until the streamer releases it; finish() must be
 * called once the download is over.
 */
struct CompletedJob
{
    std::string job_id;
    OperationKind kind = OperationKind::IMAGE_CONVERT;
    WorkspaceHandle workspace;
    Artifact artifact;
};

/**
 * @brief Drives one request through validate, stage, transform
 *
 * Validation runs before a concurrency slot or a workspace is taken. Any
 * failure after the workspace exists destroys it before the error propagates.
 */
class RequestOrchestrator
{
public:
    static constexpr int MAX_IMAGE_DIMENSION = 16384;
    static constexpr int MIN_FONT_SIZE = 1;
    static constexpr int MAX_FONT_SIZE = 1000;

    RequestOrchestrator(int max_files_per_request,
                        WorkspaceManager &workspaces, const AssetStager &stager, const TransformInvoker &invoker,
                        ConcurrencyLimiter &limiter, JobRegistry &registry);

    /**
     * @brief Turn request fields into a ConversionSpec
     * @throws ValidationError (or MissingInput) when required input is absent or malformed
     */
    ConversionSpec buildSpec(OperationKind kind, const UploadForm &form) const;

    /**
     * @brief Uploaded files the operation consumes, in submission order
     * @throws ValidationError (or MissingInput) on a missing file or a wrong file count
     */
    std::vector<const UploadedFile *> selectInputs(OperationKind kind, const UploadForm &form) const;

    /**
     * @brief Run a request up to the point where its artifact can be streamed
     * @param kind Requested operation
     * @param form Parsed upload
     * @param token Cancellation for this request
     * @return Job in state STREAMING
     * @throws ToolError subclasses; the workspace is already gone when they reach the caller
     */
    CompletedJob execute(OperationKind kind, const UploadForm &form, CancellationTokenPtr token);

    // Record the end of a download and drop the job
    void finish(const CompletedJob &job, bool success);

    JobRegistry &registry() { return registry_; }
    WorkspaceManager &workspaces() { return workspaces_; }
    const ConcurrencyLimiter &limiter() const { return limiter_; }

    // Lenient integer parse: leading digits count, anything else yields the fallback
    static int parseIntOr(const std::optional<std::string> &value, int fallback);
    static double parseDoubleOr(const std::optional<std::string> &value, double fallback);

private:
    void fail(const std::string &job_id, const WorkspaceHandle &workspace, const std::exception &error);

    int max_files_per_request_;
    WorkspaceManager &workspaces_;
    const AssetStager &stager_;
    const TransformInvoker &invoker_;
    ConcurrencyLimiter &limiter_;
    JobRegistry &registry_;
};
