#include "web/result_streamer.hpp"
#include "core/errors.hpp"
#include "core/transform_params.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <fstream>
#include <memory>
#include <vector>

std::string ResultStreamer::contentDisposition(const std::string &download_name)
{
    return "attachment; filename=\"" + TransformParams::sanitizeDisplayFilename(download_name) + "\"";
}

void ResultStreamer::stream(httplib::Response &res, const Artifact &artifact, WorkspaceHandle workspace,
                            CompletionCallback on_complete)
{
    auto file = std::make_shared<std::ifstream>(artifact.path, std::ios::binary);
    if (!*file)
    {
        throw ResourceError("Cannot open output for streaming");
    }

    const size_t total = static_cast<size_t>(artifact.size_bytes);
    res.status = 200;
    res.set_header("Content-Disposition", contentDisposition(artifact.download_name));

    res.set_content_provider(
        total, artifact.mime_type,
        [file](size_t offset, size_t length, httplib::DataSink &sink)
        {
            if (static_cast<size_t>(file->tellg()) != offset)
            {
                file->clear();
                file->seekg(static_cast<std::streamoff>(offset));
            }

            std::vector<char> buffer(std::min(length, CHUNK_SIZE));
            file->read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            std::streamsize got = file->gcount();
            if (got <= 0)
            {
                return false;
            }
            return sink.write(buffer.data(), static_cast<size_t>(got));
        },
        [file, workspace, total, on_complete](bool success)
        {
            file->close();
            if (!success)
            {
                Logger::warn("Download of " + std::to_string(total) + " bytes from workspace " + workspace->id() +
                             " did not complete");
            }
            workspace->destroy();
            if (on_complete)
            {
                on_complete(success);
            }
        });
}
