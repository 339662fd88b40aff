#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief One uploaded file part of a multipart request
 */
struct UploadedFile
{
    std::string field;
    std::string filename;
    std::string content_type;
    std::string content;
};

/**
 * @brief Transport independent view of a parsed upload request
 *
 * Files keep the order in which the client sent them. Text fields hold the
 * first value seen for each name.
 */
struct UploadForm
{
    std::vector<UploadedFile> files;
    std::map<std::string, std::string> fields;

    // First file sent under `field`, or nullptr
    const UploadedFile *file(const std::string &field) const
    {
        for (const auto &f : files)
        {
            if (f.field == field)
                return &f;
        }
        return nullptr;
    }

    std::vector<const UploadedFile *> filesNamed(const std::string &field) const
    {
        std::vector<const UploadedFile *> matching;
        for (const auto &f : files)
        {
            if (f.field == field)
                matching.push_back(&f);
        }
        return matching;
    }

    // Text value, nullopt when absent or blank
    std::optional<std::string> field(const std::string &name) const
    {
        auto it = fields.find(name);
        if (it == fields.end() || it->second.find_first_not_of(" \t\r\n") == std::string::npos)
            return std::nullopt;
        return it->second;
    }
};
