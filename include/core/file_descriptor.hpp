#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

using ByteBuffer = std::vector<uint8_t>;

/**
 * @brief Shared, immutable byte buffer
 *
 * Handing one of these across the worker boundary moves the handle only;
 * the bytes themselves are never copied.
 */
using SharedBytes = std::shared_ptr<const ByteBuffer>;

/**
 * @brief Immutable handle to a submitted file
 *
 * Holds the file name, declared MIME type, byte size and a reference to the
 * raw content. The content is shared, never owned exclusively, so copies of
 * a descriptor are cheap and all refer to the same bytes.
 */
class FileDescriptor
{
public:
    FileDescriptor() : size_(0) {}
    FileDescriptor(const std::string &name, const std::string &type, uint64_t size,
                   SharedBytes content = nullptr)
        : name_(name), type_(type), size_(size), content_(std::move(content)) {}

    const std::string &name() const { return name_; }
    const std::string &type() const { return type_; }
    uint64_t size() const { return size_; }
    const SharedBytes &content() const { return content_; }
    bool hasContent() const { return content_ != nullptr; }

    /**
     * @brief Lower-cased extension including the leading dot, or "" when the
     * name has none
     */
    std::string extension() const;

    /**
     * @brief Lower-cased MIME category ("image" for "image/png"), or ""
     */
    std::string category() const;

    /**
     * @brief Identity comparison: same metadata and the same content buffer
     */
    bool operator==(const FileDescriptor &other) const;
    bool operator!=(const FileDescriptor &other) const { return !(*this == other); }

    /**
     * @brief Build a descriptor from a file on disk
     * @param file_path Path to a regular file
     * @return Descriptor with the file's bytes loaded once and shared
     * @throws std::runtime_error if the file cannot be read
     */
    static FileDescriptor fromPath(const std::string &file_path);

    /**
     * @brief Build a descriptor over an in-memory buffer
     */
    static FileDescriptor fromBytes(const std::string &name, const std::string &type, ByteBuffer bytes);

    /**
     * @brief Guess a MIME type from a file name's extension
     * @return The MIME type, or "application/octet-stream" when unknown
     */
    static std::string guessMimeType(const std::string &file_name);

private:
    std::string name_;
    std::string type_;
    uint64_t size_;
    SharedBytes content_;
};
