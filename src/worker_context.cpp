#include "core/worker_context.hpp"
#include "logging/logger.hpp"
#include <stdexcept>

struct WorkerContext::State
{
    WorkerEntryPoint entry_point;
    ResponseSink sink;
    std::string name;

    std::queue<WorkerRequest> request_queue;
    std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::atomic<bool> should_stop{false};
    std::atomic<bool> running{false};
    std::atomic<std::thread::id> thread_id{std::thread::id()};

    // Stop flag plus queue drop, shared by stop() and release()
    void halt()
    {
        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            should_stop = true;
            std::queue<WorkerRequest> dropped;
            request_queue.swap(dropped);
            if (!dropped.empty())
            {
                Logger::debug("Worker context " + name + " dropped " + std::to_string(dropped.size()) +
                              " queued requests");
            }
        }
        queue_cv.notify_all();
    }

    void deliver(WorkerResponse &&response)
    {
        if (should_stop)
        {
            Logger::debug("Worker context " + name + " stopped, dropping response " + response.id);
            return;
        }
        sink(std::move(response));
    }
};

void WorkerScope::postMessage(WorkerResponse response)
{
    state_.deliver(std::move(response));
}

WorkerContext::WorkerContext(WorkerEntryPoint entry_point, ResponseSink sink, const std::string &name)
    : state_(std::make_shared<State>())
{
    if (!entry_point)
    {
        throw std::invalid_argument("Worker context " + name + " requires an entry point");
    }
    state_->entry_point = std::move(entry_point);
    state_->sink = std::move(sink);
    state_->name = name;
    state_->running = true;
    thread_ = std::thread(&WorkerContext::run, state_);
    state_->thread_id = thread_.get_id();
}

WorkerContext::~WorkerContext()
{
    if (isContextThread())
    {
        release();
    }
    else
    {
        stop();
    }
}

void WorkerContext::enqueue(WorkerRequest &&request)
{
    {
        std::lock_guard<std::mutex> lock(state_->queue_mutex);
        if (state_->should_stop)
        {
            Logger::debug("Worker context " + state_->name + " stopped, dropping request " + request.id);
            return;
        }
        state_->request_queue.push(std::move(request));
    }
    state_->queue_cv.notify_one();
}

void WorkerContext::stop()
{
    if (isContextThread())
    {
        throw std::logic_error("Worker context " + state_->name + " cannot be stopped from its own thread");
    }

    state_->halt();
    if (thread_.joinable())
    {
        thread_.join();
    }

    // Release the bootstrap together with the thread
    state_->entry_point = nullptr;
    state_->running = false;
}

void WorkerContext::release()
{
    state_->halt();
    if (thread_.joinable())
    {
        // The entry point is still on the stack; the shared state frees it once the loop exits
        thread_.detach();
        Logger::debug("Worker context " + state_->name + " released from its own thread");
    }
}

bool WorkerContext::isRunning() const
{
    return state_->running.load();
}

bool WorkerContext::isContextThread() const
{
    return std::this_thread::get_id() == state_->thread_id.load();
}

size_t WorkerContext::queuedCount() const
{
    std::lock_guard<std::mutex> lock(state_->queue_mutex);
    return state_->request_queue.size();
}

void WorkerContext::run(std::shared_ptr<State> state)
{
    state->thread_id = std::this_thread::get_id();
    WorkerScope scope(*state);
    Logger::debug("Worker context " + state->name + " started");

    while (true)
    {
        WorkerRequest request;
        {
            std::unique_lock<std::mutex> lock(state->queue_mutex);
            state->queue_cv.wait(lock, [&state]
                                 { return !state->request_queue.empty() || state->should_stop; });

            if (state->should_stop)
            {
                break;
            }

            request = std::move(state->request_queue.front());
            state->request_queue.pop();
        }

        std::string id = request.id;
        try
        {
            state->entry_point(std::move(request), scope);
        }
        catch (const std::exception &e)
        {
            Logger::error("Worker context " + state->name + " failed on request " + id + ": " + e.what());
            state->deliver(WorkerResponse::failure(id, e.what()));
        }
        catch (...)
        {
            Logger::error("Worker context " + state->name + " failed on request " + id + " with a non-standard exception");
            state->deliver(WorkerResponse::failure(id, "unknown error in worker context"));
        }
    }

    state->running = false;
    Logger::debug("Worker context " + state->name + " stopped");
}
