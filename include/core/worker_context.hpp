#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include "core/worker_message.hpp"

class WorkerScope;

/**
 * @brief Code run inside the context, once per inbound request
 */
using WorkerEntryPoint = std::function<void(WorkerRequest &&request, WorkerScope &scope)>;

/**
 * @brief Isolated execution context: one dedicated thread draining a request
 * queue through an entry point
 *
 * Constructing the context acquires its thread and bootstrap (the entry
 * point); stop() and the destructor release both. The queue, entry point and
 * sink live in a block shared with the thread, so the context may also be
 * destroyed from inside its own thread: it is then detached, finishes the
 * request in hand and delivers nothing more.
 */
class WorkerContext
{
public:
    using ResponseSink = std::function<void(WorkerResponse &&)>;

    WorkerContext(WorkerEntryPoint entry_point, ResponseSink sink, const std::string &name);
    ~WorkerContext();

    WorkerContext(const WorkerContext &) = delete;
    WorkerContext &operator=(const WorkerContext &) = delete;

    void enqueue(WorkerRequest &&request);

    /**
     * @brief Stop accepting work, drop queued requests and join the thread
     *
     * The request currently being handled runs to completion first.
     * @throws std::logic_error when called from the context thread itself
     */
    void stop();

    /**
     * @brief Stop accepting work and detach the thread without joining it
     *
     * For use from the context thread, where stop() cannot join. Responses
     * posted after this are dropped.
     */
    void release();

    bool isRunning() const;
    bool isContextThread() const;
    size_t queuedCount() const;

private:
    friend class WorkerScope;
    struct State;

    static void run(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
    std::thread thread_;
};

/**
 * @brief The context-side view of the boundary handed to an entry point
 *
 * Replies must be posted from the context thread, either while handling the
 * request or while handling a later one.
 */
class WorkerScope
{
public:
    void postMessage(WorkerResponse response);

private:
    friend class WorkerContext;
    explicit WorkerScope(WorkerContext::State &state) : state_(state) {}

    WorkerContext::State &state_;
};
