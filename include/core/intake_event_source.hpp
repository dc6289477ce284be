#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <vector>
#include "core/file_descriptor.hpp"

enum class IntakeEventType
{
    DRAG_ENTER,
    DRAG_OVER,
    DRAG_LEAVE,
    DROP,
    FILES_SELECTED // file picker
};

struct IntakeEvent
{
    IntakeEventType type;
    std::vector<FileDescriptor> files; // empty for DRAG_LEAVE
};

using IntakeListener = std::function<void(const IntakeEvent &)>;

/**
 * @brief Source of drag-and-drop and file-picker events handed to an intake
 * controller
 */
class IntakeEventSource
{
public:
    virtual ~IntakeEventSource() = default;

    /**
     * @brief Register a listener
     * @return Token for unsubscribe()
     */
    virtual uint64_t subscribe(IntakeListener listener) = 0;
    virtual void unsubscribe(uint64_t token) = 0;
};

/**
 * @brief Event source driven by explicit emit() calls
 *
 * Used by the CLI, which turns its command line into a FILES_SELECTED
 * event, and by tests.
 */
class DirectEventSource : public IntakeEventSource
{
public:
    DirectEventSource() : next_token_(1) {}
    ~DirectEventSource() override = default;

    uint64_t subscribe(IntakeListener listener) override;
    void unsubscribe(uint64_t token) override;

    /**
     * @brief Deliver an event to every listener, on the calling thread
     */
    void emit(const IntakeEvent &event);

    size_t listenerCount() const;

private:
    mutable std::mutex mutex_;
    std::map<uint64_t, IntakeListener> listeners_;
    uint64_t next_token_;
};
