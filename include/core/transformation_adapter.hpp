#pragma once

#include "core/asset_stager.hpp"
#include "core/cancellation_token.hpp"
#include "core/conversion_spec.hpp"
#include "core/workspace_manager.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief Output file of a transformation, still owned by its workspace
 */
struct Artifact
{
    std::filesystem::path path;
    std::string mime_type;
    std::string download_name;
    uint64_t size_bytes = 0;
};

/**
 * @brief Per-invocation context handed to adapters
 */
struct TransformContext
{
    const Workspace &workspace;
    const CancellationToken &token;
    std::chrono::milliseconds timeout;
    std::chrono::steady_clock::time_point deadline;

    TransformContext(const Workspace &ws, const CancellationToken &tok, std::chrono::milliseconds limit)
        : workspace(ws), token(tok), timeout(limit), deadline(std::chrono::steady_clock::now() + limit) {}

    /**
     * @brief Abort point for in-process work
     * @throws TransformTimeout past the deadline
     * @throws TransformFailed once the token is cancelled
     */
    void checkpoint() const;

    // Time left before the deadline, never negative
    std::chrono::milliseconds remaining() const;
};

/**
 * @brief Uniform contract for one family of media operations
 *
 * Implementations either call a library in-process or drive an external tool.
 * They write their output inside the context's workspace and report failures
 * as ToolError subclasses.
 */
class TransformationAdapter
{
public:
    virtual ~TransformationAdapter() = default;

    virtual std::string name() const = 0;
    virtual bool supports(OperationKind kind) const = 0;

    virtual Artifact execute(const ConversionSpec &spec, const std::vector<StagedAsset> &inputs,
                             const TransformContext &context) = 0;
};

/**
 * @brief Stat a produced output file into an Artifact
 * @throws TransformFailed if the file is missing or empty
 */
Artifact makeArtifact(const std::filesystem::path &path, const std::string &mime_type,
                      const std::string &download_name);
