#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/file_descriptor.hpp"

/**
 * @brief Buffer handed across the worker boundary without copying its bytes
 *
 * A view plus a reference to whatever owns the storage: a shared ByteBuffer
 * or any other refcounted holder, such as a decoded image.
 */
class Transferable
{
public:
    Transferable() = default;

    Transferable(SharedBytes bytes)
        : owner_(bytes), data_(bytes ? bytes->data() : nullptr), size_(bytes ? bytes->size() : 0)
    {
    }

    Transferable(std::shared_ptr<const void> owner, const uint8_t *data, size_t size)
        : owner_(std::move(owner)), data_(data), size_(size)
    {
    }

    const uint8_t *data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    explicit operator bool() const { return owner_ != nullptr; }

private:
    std::shared_ptr<const void> owner_;
    const uint8_t *data_ = nullptr;
    size_t size_ = 0;
};

/**
 * @brief Request frame sent from a channel into its context
 */
struct WorkerRequest
{
    std::string id;
    nlohmann::json message;
    std::vector<Transferable> transfer;
};

/**
 * @brief Response frame sent back by the context
 *
 * error is set when the context could not service the request; message is
 * then ignored.
 */
struct WorkerResponse
{
    std::string id;
    nlohmann::json message;
    std::vector<Transferable> transfer;
    std::optional<std::string> error;

    static WorkerResponse reply(const std::string &id, nlohmann::json message,
                                std::vector<Transferable> transfer = {})
    {
        return WorkerResponse{id, std::move(message), std::move(transfer), std::nullopt};
    }

    static WorkerResponse failure(const std::string &id, const std::string &error_message)
    {
        return WorkerResponse{id, nlohmann::json(), {}, error_message};
    }
};
