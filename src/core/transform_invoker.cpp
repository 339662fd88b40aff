#include "core/transform_invoker.hpp"
#include "core/errors.hpp"
#include "logging/logger.hpp"

namespace
{
    void replaceAll(std::string &text, const std::string &from, const std::string &to)
    {
        if (from.empty())
            return;
        size_t pos = 0;
        while ((pos = text.find(from, pos)) != std::string::npos)
        {
            text.replace(pos, from.size(), to);
            pos += to.size();
        }
    }
}

TransformInvoker::TransformInvoker(std::chrono::milliseconds timeout) : timeout_(timeout)
{
}

void TransformInvoker::registerAdapter(std::shared_ptr<TransformationAdapter> adapter)
{
    if (adapter)
    {
        adapters_.push_back(std::move(adapter));
    }
}

std::shared_ptr<TransformationAdapter> TransformInvoker::findAdapter(OperationKind kind) const
{
    for (auto it = adapters_.rbegin(); it != adapters_.rend(); ++it)
    {
        if ((*it)->supports(kind))
            return *it;
    }
    return nullptr;
}

std::string TransformInvoker::scrubPaths(const std::string &message, const std::filesystem::path &workspace_path)
{
    std::string scrubbed = message;
    const std::string workspace = workspace_path.string();
    replaceAll(scrubbed, workspace + "/", "");
    replaceAll(scrubbed, workspace, ".");

    const std::string root = workspace_path.parent_path().string();
    if (!root.empty() && root != "/")
    {
        replaceAll(scrubbed, root + "/", "<tmp>/");
    }
    return scrubbed;
}

Artifact TransformInvoker::invoke(const ConversionSpec &spec, const std::vector<StagedAsset> &inputs,
                                  const Workspace &workspace, const CancellationToken &token,
                                  const std::string &job_id) const
{
    auto adapter = findAdapter(spec.kind);
    if (!adapter)
    {
        throw TransformFailed("No transformation available for " + OperationKinds::getName(spec.kind));
    }

    const auto started = std::chrono::steady_clock::now();
    TransformContext context(workspace, token, timeout_);

    try
    {
        Artifact artifact = adapter->execute(spec, inputs, context);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
        Logger::info("Job " + job_id + ": " + adapter->name() + " finished " +
                     OperationKinds::getName(spec.kind) + " in " + std::to_string(elapsed.count()) + "ms (" +
                     std::to_string(artifact.size_bytes) + " bytes)");
        return artifact;
    }
    catch (const TransformTimeout &e)
    {
        throw TransformTimeout(scrubPaths(e.what(), workspace.path()));
    }
    catch (const TransformFailed &e)
    {
        throw TransformFailed(scrubPaths(e.what(), workspace.path()));
    }
    catch (const ResourceError &e)
    {
        throw ResourceError(scrubPaths(e.what(), workspace.path()));
    }
    catch (const ToolError &)
    {
        throw;
    }
    catch (const std::exception &e)
    {
        throw TransformFailed(scrubPaths(e.what(), workspace.path()));
    }
}
