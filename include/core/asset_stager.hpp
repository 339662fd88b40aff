#pragma once

#include "core/workspace_manager.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

/**
 * @brief An uploaded input persisted inside a workspace
 */
struct StagedAsset
{
    std::filesystem::path path;     // Server generated, always inside the workspace
    std::string display_name;       // Client filename, for response headers only
    std::string extension;          // Sanitized, with leading dot, may be empty
    uint64_t size_bytes = 0;
    std::optional<int> ordinal;     // Submission position for multi-file operations
};

class AssetStager
{
public:
    explicit AssetStager(uint64_t max_file_size_bytes);

    /**
     * @brief Persist an upload into the workspace under a generated name
     * @param workspace Destination workspace
     * @param content Uploaded bytes
     * @param client_filename Filename sent by the client; only its extension is used on disk
     * @param ordinal Submission position; prefixes the file name when set
     * @throws PayloadTooLarge before writing anything if content exceeds the limit
     * @throws ResourceError if the file cannot be written
     */
    StagedAsset stage(const Workspace &workspace, const std::string &content,
                      const std::string &client_filename, std::optional<int> ordinal = std::nullopt) const;

    // @throws PayloadTooLarge if size_bytes exceeds the limit
    void checkSize(uint64_t size_bytes, const std::string &client_filename) const;

    /**
     * @brief Extension of a client filename, lower-cased, or empty if unsafe
     *
     * Only 1-10 ASCII alphanumerics after the last dot are kept.
     */
    static std::string sanitizeExtension(const std::string &client_filename);

private:
    uint64_t max_file_size_bytes_;
};
