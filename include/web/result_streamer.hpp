#pragma once

#include "core/transformation_adapter.hpp"
#include "core/workspace_manager.hpp"
#include <functional>
#include <httplib.h>
#include <string>

/**
 * @brief Streams an artifact as a download and releases its workspace afterwards
 */
class ResultStreamer
{
public:
    static constexpr size_t CHUNK_SIZE = 64 * 1024;

    // Receives true when every byte was handed to the connection
    using CompletionCallback = std::function<void(bool success)>;

    /**
     * @brief Attach the artifact to a response as a chunked download
     *
     * The workspace is destroyed exactly once when httplib is done with the
     * response, whether the write finished, failed, or the client went away.
     * @param res Response to populate; headers are set here and nowhere else
     * @param artifact File inside `workspace`
     * @param workspace Owner of the artifact
     * @param on_complete Called after the workspace is destroyed
     * @throws ResourceError if the artifact cannot be opened; the workspace is left to the caller then
     */
    static void stream(httplib::Response &res, const Artifact &artifact, WorkspaceHandle workspace,
                       CompletionCallback on_complete);

    static std::string contentDisposition(const std::string &download_name);
};
