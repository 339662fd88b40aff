#pragma once

#include "core/asset_stager.hpp"
#include "core/concurrency_limiter.hpp"
#include "core/job_registry.hpp"
#include "core/request_orchestrator.hpp"
#include "core/service_config.hpp"
#include "core/transform_invoker.hpp"
#include "core/workspace_manager.hpp"
#include <httplib.h>

/**
 * @brief Owns the job pipeline built from one ServiceConfig
 *
 * Registers the ffmpeg, OpenCV and qpdf adapters. Members are declared in
 * dependency order so the orchestrator is destroyed first.
 */
class MediaToolsService
{
public:
    explicit MediaToolsService(const ServiceConfig &config);

    MediaToolsService(const MediaToolsService &) = delete;
    MediaToolsService &operator=(const MediaToolsService &) = delete;

    void installRoutes(httplib::Server &server);

    // Cancel every in-flight job; running child processes are killed
    size_t cancelAll(const std::string &reason);

    WorkspaceManager &workspaces() { return workspaces_; }
    JobRegistry &registry() { return registry_; }

    // Largest multipart body accepted before any handler runs
    uint64_t payloadLimitBytes() const;

private:
    ServiceConfig config_;
    WorkspaceManager workspaces_;
    AssetStager stager_;
    TransformInvoker invoker_;
    ConcurrencyLimiter limiter_;
    JobRegistry registry_;
    RequestOrchestrator orchestrator_;
};
