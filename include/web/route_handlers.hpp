#pragma once

#include "core/errors.hpp"
#include "core/request_orchestrator.hpp"
#include "core/service_config.hpp"
#include "core/upload_form.hpp"
#include "logging/logger.hpp"
#include "web/result_streamer.hpp"
#include <chrono>
#include <httplib.h>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

class RouteHandlers
{
public:
    static constexpr const char *LIVENESS_MESSAGE = "Unified Audio, Image, PDF & Video Tools Backend is running";

    static void setupRoutes(httplib::Server &svr, RequestOrchestrator &orchestrator, const ServiceConfig &config)
    {
        // Only limits are published; tool and temp paths stay private
        const json settings = config.toJson();
        const json limits = {{"limits", settings["limits"]}, {"jobs", settings["jobs"]}};

        // Liveness
        svr.Get("/", [](const httplib::Request &, httplib::Response &res)
                { res.set_content(LIVENESS_MESSAGE, "text/plain"); });

        // Job and workspace counters
        svr.Get("/api/status", [&orchestrator, limits](const httplib::Request &req, httplib::Response &res)
                { handleServerStatus(req, res, orchestrator, limits); });

        // Audio
        svr.Post("/audio/compress", [&](const httplib::Request &req, httplib::Response &res)
                 { handleOperation(req, res, orchestrator, OperationKind::AUDIO_COMPRESS); });

        svr.Post("/audio/merge", [&](const httplib::Request &req, httplib::Response &res)
                 { handleOperation(req, res, orchestrator, OperationKind::AUDIO_MERGE); });

        // Image
        svr.Post("/image/convert", [&](const httplib::Request &req, httplib::Response &res)
                 { handleOperation(req, res, orchestrator, OperationKind::IMAGE_CONVERT); });

        svr.Post("/image/watermark", [&](const httplib::Request &req, httplib::Response &res)
                 { handleOperation(req, res, orchestrator, OperationKind::IMAGE_WATERMARK); });

        svr.Post("/image/resize", [&](const httplib::Request &req, httplib::Response &res)
                 { handleOperation(req, res, orchestrator, OperationKind::IMAGE_RESIZE); });

        // PDF
        svr.Post("/pdf/merge", [&](const httplib::Request &req, httplib::Response &res)
                 { handleOperation(req, res, orchestrator, OperationKind::PDF_MERGE); });

        // Video
        svr.Post("/video", [&](const httplib::Request &req, httplib::Response &res)
                 { handleOperation(req, res, orchestrator, OperationKind::VIDEO_TRANSCODE); });

        // httplib answers oversized bodies and unknown routes itself with an empty body
        svr.set_error_handler([](const httplib::Request &, httplib::Response &res)
                              {
            if (!res.body.empty())
                return;
            if (res.status == 413)
                res.set_content("Request body too large", "text/plain");
            else if (res.status == 404)
                res.set_content("Not found", "text/plain"); });
    }

    /**
     * @brief Collect multipart parts and query parameters into an UploadForm
     *
     * Parts without a filename are text fields. Multipart values take
     * precedence over query parameters of the same name.
     */
    static UploadForm buildForm(const httplib::Request &req)
    {
        UploadForm form;
        for (const auto &entry : req.files)
        {
            const auto &part = entry.second;
            if (part.filename.empty())
            {
                form.fields.emplace(part.name, part.content);
                continue;
            }
            UploadedFile file;
            file.field = part.name;
            file.filename = part.filename;
            file.content_type = part.content_type;
            file.content = part.content;
            form.files.push_back(std::move(file));
        }
        for (const auto &param : req.params)
        {
            form.fields.emplace(param.first, param.second);
        }
        return form;
    }

private:
    static void handleOperation(const httplib::Request &req, httplib::Response &res,
                                RequestOrchestrator &orchestrator, OperationKind kind)
    {
        const std::string label = OperationKinds::getFailureLabel(kind);
        Logger::trace("Received " + OperationKinds::getName(kind) + " request");
        try
        {
            UploadForm form = buildForm(req);
            auto token = std::make_shared<CancellationToken>([&req]()
                                                             { return req.is_connection_closed(); });

            CompletedJob job = orchestrator.execute(kind, form, token);
            try
            {
                ResultStreamer::stream(res, job.artifact, job.workspace, [&orchestrator, job](bool success)
                                       { orchestrator.finish(job, success); });
            }
            catch (const std::exception &)
            {
                orchestrator.finish(job, false);
                throw;
            }
        }
        catch (const ToolError &e)
        {
            res.status = e.httpStatus();
            if (e.kind() == ErrorKind::VALIDATION)
                res.set_content(e.what(), "text/plain");
            else
                res.set_content(label + " failed: " + e.what(), "text/plain");
        }
        catch (const std::exception &e)
        {
            Logger::error(label + " error: " + std::string(e.what()));
            res.status = 500;
            res.set_content(label + " failed: " + e.what(), "text/plain");
        }
    }

    static void handleServerStatus(const httplib::Request &, httplib::Response &res, RequestOrchestrator &orchestrator,
                                   const json &limits)
    {
        Logger::trace("Received server status request");
        try
        {
            auto &registry = orchestrator.registry();
            const auto now = std::chrono::system_clock::now();

            json jobs = json::array();
            for (const auto &job : registry.snapshot())
            {
                auto age = std::chrono::duration_cast<std::chrono::milliseconds>(now - job.started).count();
                jobs.push_back({{"id", job.id},
                                {"operation", OperationKinds::getName(job.kind)},
                                {"state", JobRegistry::stateName(job.state)},
                                {"age_ms", age}});
            }

            json response = {
                {"status", "success"},
                {"data", {{"active_jobs", jobs.size()}, {"running_transformations", orchestrator.limiter().active()}, {"max_concurrent_jobs", orchestrator.limiter().capacity()}, {"live_workspaces", orchestrator.workspaces().countLive()}, {"completed_jobs", registry.completedCount()}, {"failed_jobs", registry.failedCount()}, {"config", limits}, {"jobs", jobs}}}};

            res.set_content(response.dump(), "application/json");
        }
        catch (const std::exception &e)
        {
            Logger::error("Server status error: " + std::string(e.what()));
            res.status = 500;
            res.set_content(json{{"error", "Internal server error"}}.dump(), "application/json");
        }
    }
};
