#pragma once

#include "core/transformation_adapter.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Dispatches a ConversionSpec to the adapter that handles its kind
 *
 * Applies the job timeout and normalizes whatever the adapter throws into a
 * ToolError whose message contains no absolute path of the host.
 */
class TransformInvoker
{
public:
    explicit TransformInvoker(std::chrono::milliseconds timeout);

    // Later registrations win for a kind that several adapters support
    void registerAdapter(std::shared_ptr<TransformationAdapter> adapter);

    /**
     * @brief Run one transformation inside a workspace
     * @param job_id Registry id, used to label log lines
     * @return Artifact located inside the workspace
     * @throws TransformTimeout, TransformFailed, ResourceError
     */
    Artifact invoke(const ConversionSpec &spec, const std::vector<StagedAsset> &inputs,
                    const Workspace &workspace, const CancellationToken &token,
                    const std::string &job_id) const;

    /**
     * @brief Strip absolute paths from a diagnostic message
     *
     * Occurrences of the workspace directory are removed so that only file
     * names inside it remain; other paths under the temp root are masked.
     */
    static std::string scrubPaths(const std::string &message, const std::filesystem::path &workspace_path);

private:
    std::shared_ptr<TransformationAdapter> findAdapter(OperationKind kind) const;

    std::chrono::milliseconds timeout_;
    std::vector<std::shared_ptr<TransformationAdapter>> adapters_;
};
