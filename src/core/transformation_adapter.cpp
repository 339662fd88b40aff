#include "core/transformation_adapter.hpp"
#include "core/errors.hpp"
#include <system_error>

void TransformContext::checkpoint() const
{
    if (token.isCancelled())
    {
        std::string reason = token.reason();
        throw TransformFailed("Transformation cancelled" + (reason.empty() ? std::string() : ": " + reason));
    }
    if (std::chrono::steady_clock::now() >= deadline)
    {
        throw TransformTimeout("Transformation exceeded the " +
                               std::to_string(timeout.count()) + "ms time limit");
    }
}

std::chrono::milliseconds TransformContext::remaining() const
{
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

Artifact makeArtifact(const std::filesystem::path &path, const std::string &mime_type,
                      const std::string &download_name)
{
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec || size == 0)
    {
        throw TransformFailed("Transformation produced no output");
    }

    Artifact artifact;
    artifact.path = path;
    artifact.mime_type = mime_type;
    artifact.download_name = download_name;
    artifact.size_bytes = static_cast<uint64_t>(size);
    return artifact;
}
