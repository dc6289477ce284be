#include "core/file_descriptor.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <unordered_map>

namespace fs = std::filesystem;

namespace
{
    std::string toLower(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    const std::unordered_map<std::string, std::string> &mimeTable()
    {
        static const std::unordered_map<std::string, std::string> table = {
            {".png", "image/png"},
            {".jpg", "image/jpeg"},
            {".jpeg", "image/jpeg"},
            {".jpe", "image/jpeg"},
            {".gif", "image/gif"},
            {".bmp", "image/bmp"},
            {".webp", "image/webp"},
            {".tif", "image/tiff"},
            {".tiff", "image/tiff"},
            {".svg", "image/svg+xml"},
            {".ico", "image/x-icon"},
            {".pdf", "application/pdf"},
            {".json", "application/json"},
            {".zip", "application/zip"},
            {".txt", "text/plain"},
            {".csv", "text/csv"},
            {".html", "text/html"},
            {".mp4", "video/mp4"},
            {".mov", "video/quicktime"},
            {".mp3", "audio/mpeg"},
            {".wav", "audio/wav"}};
        return table;
    }
}

std::string FileDescriptor::extension() const
{
    size_t dot_pos = name_.find_last_of('.');
    if (dot_pos == std::string::npos || dot_pos + 1 == name_.size())
    {
        return "";
    }
    return toLower(name_.substr(dot_pos));
}

std::string FileDescriptor::category() const
{
    size_t slash_pos = type_.find('/');
    if (slash_pos == std::string::npos)
    {
        return "";
    }
    return toLower(type_.substr(0, slash_pos));
}

bool FileDescriptor::operator==(const FileDescriptor &other) const
{
    return name_ == other.name_ && type_ == other.type_ && size_ == other.size_ &&
           content_ == other.content_;
}

FileDescriptor FileDescriptor::fromPath(const std::string &file_path)
{
    fs::path path(file_path);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
    {
        throw std::runtime_error("Not a regular file: " + file_path);
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
    {
        throw std::runtime_error("Cannot open file: " + file_path);
    }

    auto bytes = std::make_shared<ByteBuffer>(std::istreambuf_iterator<char>(in),
                                              std::istreambuf_iterator<char>());
    if (in.bad())
    {
        throw std::runtime_error("Error reading file: " + file_path);
    }

    std::string name = path.filename().string();
    Logger::debug("Loaded " + name + " (" + std::to_string(bytes->size()) + " bytes)");
    uint64_t size = bytes->size();
    return FileDescriptor(name, guessMimeType(name), size, std::move(bytes));
}

FileDescriptor FileDescriptor::fromBytes(const std::string &name, const std::string &type, ByteBuffer bytes)
{
    uint64_t size = bytes.size();
    return FileDescriptor(name, type, size, std::make_shared<const ByteBuffer>(std::move(bytes)));
}

std::string FileDescriptor::guessMimeType(const std::string &file_name)
{
    size_t dot_pos = file_name.find_last_of('.');
    if (dot_pos != std::string::npos)
    {
        auto it = mimeTable().find(toLower(file_name.substr(dot_pos)));
        if (it != mimeTable().end())
        {
            return it->second;
        }
    }
    return "application/octet-stream";
}
