#include "core/intake_event_source.hpp"

uint64_t DirectEventSource::subscribe(IntakeListener listener)
{
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t token = next_token_++;
    listeners_.emplace(token, std::move(listener));
    return token;
}

void DirectEventSource::unsubscribe(uint64_t token)
{
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(token);
}

void DirectEventSource::emit(const IntakeEvent &event)
{
    std::vector<IntakeListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &entry : listeners_)
        {
            listeners.push_back(entry.second);
        }
    }

    for (auto &listener : listeners)
    {
        listener(event);
    }
}

size_t DirectEventSource::listenerCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
}
