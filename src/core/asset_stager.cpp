#include "core/asset_stager.hpp"
#include "core/errors.hpp"
#include "core/random_id.hpp"
#include "logging/logger.hpp"
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

AssetStager::AssetStager(uint64_t max_file_size_bytes)
    : max_file_size_bytes_(max_file_size_bytes)
{
}

std::string AssetStager::sanitizeExtension(const std::string &client_filename)
{
    // Only the final path component can carry an extension
    std::string base = client_filename;
    auto slash = base.find_last_of("/\\");
    if (slash != std::string::npos)
    {
        base = base.substr(slash + 1);
    }

    auto dot = base.find_last_of('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 >= base.size())
    {
        return "";
    }

    std::string ext = base.substr(dot + 1);
    if (ext.size() > 10)
    {
        return "";
    }
    for (char &c : ext)
    {
        if (!std::isalnum(static_cast<unsigned char>(c)))
        {
            return "";
        }
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return "." + ext;
}

void AssetStager::checkSize(uint64_t size_bytes, const std::string &client_filename) const
{
    if (size_bytes > max_file_size_bytes_)
    {
        throw PayloadTooLarge("File \"" + client_filename + "\" is " + std::to_string(size_bytes) +
                              " bytes, limit is " + std::to_string(max_file_size_bytes_) + " bytes");
    }
}

StagedAsset AssetStager::stage(const Workspace &workspace, const std::string &content,
                               const std::string &client_filename, std::optional<int> ordinal) const
{
    checkSize(content.size(), client_filename);

    StagedAsset asset;
    asset.display_name = client_filename;
    asset.extension = sanitizeExtension(client_filename);
    asset.size_bytes = content.size();
    asset.ordinal = ordinal;

    std::ostringstream name;
    if (ordinal)
    {
        name << std::setw(3) << std::setfill('0') << *ordinal << "-";
    }
    name << RandomId::hex(16) << asset.extension;
    asset.path = workspace.resolve(name.str());

    {
        std::ofstream out(asset.path, std::ios::binary | std::ios::trunc);
        if (out.is_open())
        {
            out.write(content.data(), static_cast<std::streamsize>(content.size()));
            out.flush();
        }
        if (!out.good())
        {
            out.close();
            std::error_code ec;
            fs::remove(asset.path, ec);
            throw ResourceError("Failed to write upload into workspace " + workspace.id());
        }
    }

    Logger::debug("Staged " + std::to_string(asset.size_bytes) + " bytes as " +
                  asset.path.filename().string() + " in workspace " + workspace.id());
    return asset;
}
