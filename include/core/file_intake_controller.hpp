#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>
#include "core/file_descriptor.hpp"
#include "core/intake_event_source.hpp"
#include "core/validation_engine.hpp"

struct IntakeOptions
{
    ValidationPolicy policy;
    bool disabled = false;
};

/**
 * @brief Notifications emitted by a FileIntakeController
 *
 * Every member is optional. on_drop fires for every drop or selection;
 * on_drop_accepted and on_drop_rejected only when their subset is non-empty.
 */
struct IntakeCallbacks
{
    std::function<void(const std::vector<FileDescriptor> &files,
                       const std::vector<FileDescriptor> &accepted,
                       const std::vector<FileDescriptor> &rejected,
                       const std::vector<ValidationError> &errors)>
        on_drop;
    std::function<void(const std::vector<FileDescriptor> &accepted)> on_drop_accepted;
    std::function<void(const std::vector<FileDescriptor> &rejected)> on_drop_rejected;
    std::function<void()> on_drag_enter;
    std::function<void()> on_drag_over;
    std::function<void()> on_drag_leave;
};

/**
 * @brief Drop zone logic: listens to an injected event source, validates
 * each batch and reports the partition through callbacks
 */
class FileIntakeController
{
public:
    FileIntakeController(IntakeEventSource &source, const IntakeOptions &options, IntakeCallbacks callbacks);
    ~FileIntakeController();

    FileIntakeController(const FileIntakeController &) = delete;
    FileIntakeController &operator=(const FileIntakeController &) = delete;

    void setOptions(const IntakeOptions &options);
    IntakeOptions options() const;

    /**
     * @brief True while a drag over the zone carries at least one file that
     * would be rejected
     */
    bool hasDragError() const;
    bool isDragActive() const;

    /**
     * @brief Validate a batch as if it had been dropped
     * @return The partition; empty when the controller is disabled
     */
    ValidationResult handleFiles(const std::vector<FileDescriptor> &files);

private:
    void onEvent(const IntakeEvent &event);
    void onDragEnter(const std::vector<FileDescriptor> &files);
    void clearDragState();

    IntakeEventSource &source_;
    uint64_t subscription_;
    IntakeCallbacks callbacks_;

    mutable std::mutex mutex_;
    IntakeOptions options_;
    bool drag_active_;
    bool drag_error_;
};
