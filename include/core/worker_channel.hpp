#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/worker_context.hpp"
#include "core/worker_message.hpp"

enum class CallStatus
{
    COMPLETED, // the context replied with a message
    FAILED,    // the context replied with an error frame
    CANCELLED  // the channel was terminated before a reply arrived
};

/**
 * @brief Message and transferred buffers returned by the context
 */
struct WorkerReply
{
    nlohmann::json message;
    std::vector<Transferable> transfer;
};

/**
 * @brief Outcome delivered to a resolver, exactly once per call
 */
struct CallResult
{
    std::string id;
    CallStatus status;
    WorkerReply reply;
    std::string error_message;

    bool success() const { return status == CallStatus::COMPLETED; }
};

using CallResolver = std::function<void(CallResult &&)>;

/**
 * @brief Correlation-id request/response channel to an isolated context
 *
 * Each channel owns exactly one WorkerContext. Calls never block: post()
 * registers a resolver under a fresh correlation id and queues the request.
 * Resolvers run on the context thread when the matching response is routed
 * back, or on the terminating thread with CANCELLED when the channel shuts
 * down first. Either way each resolver fires exactly once, and none fires
 * after terminate() has returned.
 */
class WorkerChannel
{
public:
    /**
     * @brief Spin up a context bootstrapped with the given entry point
     * @param entry_point Handler run on the context thread for every request
     * @param name Label used in log messages
     */
    explicit WorkerChannel(WorkerEntryPoint entry_point, const std::string &name = "worker");
    ~WorkerChannel();

    WorkerChannel(const WorkerChannel &) = delete;
    WorkerChannel &operator=(const WorkerChannel &) = delete;

    static std::unique_ptr<WorkerChannel> create(WorkerEntryPoint entry_point, const std::string &name = "worker");

    /**
     * @brief Issue a call and register its resolver
     * @param message Structured payload
     * @param resolver Invoked exactly once with the outcome
     * @param transfer Buffers moved into the request instead of copied
     * @return The correlation id of the call
     * @throws ChannelTerminatedError if the channel was terminated
     */
    std::string post(nlohmann::json message, CallResolver resolver, std::vector<Transferable> transfer = {});

    /**
     * @brief Issue a call and receive the reply through a future
     *
     * The future throws WorkerCallError when the context answered with an
     * error and AbandonedCallError when the channel was terminated first.
     * @throws ChannelTerminatedError if the channel was terminated
     */
    std::future<WorkerReply> call(nlohmann::json message, std::vector<Transferable> transfer = {});

    /**
     * @brief Destroy the context, releasing its thread and bootstrap
     *
     * Every outstanding call resolves with CANCELLED before this returns.
     * Idempotent. Destroying the channel from inside a resolver is allowed and
     * cancels the remaining calls the same way.
     * @throws std::logic_error when called from a resolver running on the
     * context thread; the channel is left untouched
     */
    void terminate();

    bool isTerminated() const;
    size_t pendingCount() const;
    uint64_t instanceId() const { return instance_id_; }

private:
    std::string nextCorrelationId();
    void routeResponse(WorkerResponse &&response);
    void releaseFromContext();
    void cancelAll(std::unordered_map<std::string, CallResolver> &abandoned);
    static void invoke(const std::string &id, CallResolver &resolver, CallResult &&result);

    const uint64_t instance_id_;
    const std::string name_;
    uint64_t next_sequence_;
    bool terminated_;

    // Guards pending_calls_, next_sequence_, terminated_ and the context pointer
    mutable std::mutex pending_mutex_;
    std::unordered_map<std::string, CallResolver> pending_calls_;
    std::unique_ptr<WorkerContext> context_;

    static std::atomic<uint64_t> next_instance_id_;
};
