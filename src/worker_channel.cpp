#include "core/worker_channel.hpp"
#include "core/intake_errors.hpp"
#include "logging/logger.hpp"
#include <stdexcept>

std::atomic<uint64_t> WorkerChannel::next_instance_id_{1};

WorkerChannel::WorkerChannel(WorkerEntryPoint entry_point, const std::string &name)
    : instance_id_(next_instance_id_.fetch_add(1)), name_(name), next_sequence_(0), terminated_(false)
{
    context_ = std::make_unique<WorkerContext>(
        std::move(entry_point),
        [this](WorkerResponse &&response)
        { routeResponse(std::move(response)); },
        name_ + "#" + std::to_string(instance_id_));
    Logger::info("Worker channel " + name_ + "#" + std::to_string(instance_id_) + " created");
}

WorkerChannel::~WorkerChannel()
{
    bool on_context_thread = false;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        on_context_thread = !terminated_ && context_->isContextThread();
    }

    if (on_context_thread)
    {
        // Last owner released inside a resolver: the thread cannot join itself
        releaseFromContext();
    }
    else
    {
        terminate();
    }
}

std::unique_ptr<WorkerChannel> WorkerChannel::create(WorkerEntryPoint entry_point, const std::string &name)
{
    return std::make_unique<WorkerChannel>(std::move(entry_point), name);
}

std::string WorkerChannel::nextCorrelationId()
{
    // Instance id salt plus a per-channel counter: unique for the channel's lifetime
    return "w" + std::to_string(instance_id_) + "-" + std::to_string(next_sequence_++);
}

std::string WorkerChannel::post(nlohmann::json message, CallResolver resolver, std::vector<Transferable> transfer)
{
    std::lock_guard<std::mutex> lock(pending_mutex_);
    if (terminated_)
    {
        throw ChannelTerminatedError("Worker channel " + name_ + "#" + std::to_string(instance_id_) +
                                     " has been terminated");
    }

    std::string id = nextCorrelationId();
    pending_calls_.emplace(id, std::move(resolver));

    // Enqueued under the lock so terminate() cannot release the context in between
    context_->enqueue(WorkerRequest{id, std::move(message), std::move(transfer)});
    Logger::trace("Worker channel issued call " + id);
    return id;
}

std::future<WorkerReply> WorkerChannel::call(nlohmann::json message, std::vector<Transferable> transfer)
{
    auto promise = std::make_shared<std::promise<WorkerReply>>();
    std::future<WorkerReply> future = promise->get_future();

    post(
        std::move(message),
        [promise](CallResult &&result)
        {
            switch (result.status)
            {
            case CallStatus::COMPLETED:
                promise->set_value(std::move(result.reply));
                break;
            case CallStatus::FAILED:
                promise->set_exception(std::make_exception_ptr(WorkerCallError(result.error_message)));
                break;
            case CallStatus::CANCELLED:
                promise->set_exception(std::make_exception_ptr(AbandonedCallError(result.id)));
                break;
            }
        },
        std::move(transfer));

    return future;
}

void WorkerChannel::terminate()
{
    std::unordered_map<std::string, CallResolver> abandoned;
    std::unique_ptr<WorkerContext> context;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (terminated_)
        {
            return;
        }
        if (context_->isContextThread())
        {
            throw std::logic_error("Worker channel " + name_ + "#" + std::to_string(instance_id_) +
                                   " cannot be terminated from one of its own resolvers");
        }
        terminated_ = true;
        abandoned.swap(pending_calls_);
        context = std::move(context_);
    }

    // Joins the context thread: any resolver it was running has returned
    context->stop();
    context.reset();

    cancelAll(abandoned);
}

void WorkerChannel::releaseFromContext()
{
    std::unordered_map<std::string, CallResolver> abandoned;
    std::unique_ptr<WorkerContext> context;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        terminated_ = true;
        abandoned.swap(pending_calls_);
        context = std::move(context_);
    }

    // Detaches instead of joining; nothing the context posts from here on is routed
    context->release();
    context.reset();

    cancelAll(abandoned);
}

void WorkerChannel::cancelAll(std::unordered_map<std::string, CallResolver> &abandoned)
{
    for (auto &entry : abandoned)
    {
        CallResult result{entry.first, CallStatus::CANCELLED, {}, "cancelled by channel termination"};
        invoke(entry.first, entry.second, std::move(result));
    }

    Logger::info("Worker channel " + name_ + "#" + std::to_string(instance_id_) + " terminated, " +
                 std::to_string(abandoned.size()) + " outstanding calls cancelled");
}

bool WorkerChannel::isTerminated() const
{
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return terminated_;
}

size_t WorkerChannel::pendingCount() const
{
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_calls_.size();
}

void WorkerChannel::routeResponse(WorkerResponse &&response)
{
    CallResolver resolver;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_calls_.find(response.id);
        if (it == pending_calls_.end())
        {
            if (terminated_)
                Logger::debug("Worker channel dropped late response " + response.id);
            else
                Logger::warn("Worker channel dropped response with unknown id '" + response.id + "'");
            return;
        }
        resolver = std::move(it->second);
        pending_calls_.erase(it);
    }

    CallResult result;
    result.id = response.id;
    if (response.error)
    {
        result.status = CallStatus::FAILED;
        result.error_message = *response.error;
    }
    else
    {
        result.status = CallStatus::COMPLETED;
        result.reply.message = std::move(response.message);
        result.reply.transfer = std::move(response.transfer);
    }
    invoke(response.id, resolver, std::move(result));
}

void WorkerChannel::invoke(const std::string &id, CallResolver &resolver, CallResult &&result)
{
    if (!resolver)
    {
        return;
    }
    try
    {
        resolver(std::move(result));
    }
    catch (const std::exception &e)
    {
        Logger::error("Resolver for call " + id + " threw: " + std::string(e.what()));
    }
}
