#include "core/media_tools_service.hpp"
#include "core/ffmpeg_adapter.hpp"
#include "core/image_adapter.hpp"
#include "core/pdf_adapter.hpp"
#include "logging/logger.hpp"
#include "web/route_handlers.hpp"
#include <memory>

namespace
{
    // Room for multipart boundaries and text fields on top of the file bytes
    constexpr uint64_t MULTIPART_OVERHEAD_BYTES = 1024 * 1024;
}

MediaToolsService::MediaToolsService(const ServiceConfig &config)
    : config_(config),
      workspaces_(config.temp_root),
      stager_(config.max_file_size_bytes),
      invoker_(std::chrono::seconds(config.transform_timeout_seconds)),
      limiter_(static_cast<size_t>(config.max_concurrent_jobs), std::chrono::milliseconds(config.queue_wait_ms)),
      orchestrator_(config.max_files_per_request, workspaces_, stager_, invoker_, limiter_, registry_)
{
    invoker_.registerAdapter(std::make_shared<FfmpegAdapter>(config.ffmpeg_path));
    invoker_.registerAdapter(std::make_shared<ImageAdapter>());
    invoker_.registerAdapter(std::make_shared<PdfAdapter>());

    Logger::info("MediaToolsService: temp root " + workspaces_.tempRoot().string() + ", " +
                 std::to_string(config.max_concurrent_jobs) + " concurrent job(s), " +
                 std::to_string(config.transform_timeout_seconds) + "s timeout");
}

void MediaToolsService::installRoutes(httplib::Server &server)
{
    RouteHandlers::setupRoutes(server, orchestrator_, config_);
}

size_t MediaToolsService::cancelAll(const std::string &reason)
{
    return registry_.cancelAll(reason);
}

uint64_t MediaToolsService::payloadLimitBytes() const
{
    return config_.max_file_size_bytes * static_cast<uint64_t>(config_.max_files_per_request) +
           MULTIPART_OVERHEAD_BYTES;
}
