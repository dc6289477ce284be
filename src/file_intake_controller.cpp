#include "core/file_intake_controller.hpp"
#include "logging/logger.hpp"

FileIntakeController::FileIntakeController(IntakeEventSource &source, const IntakeOptions &options,
                                           IntakeCallbacks callbacks)
    : source_(source), subscription_(0), callbacks_(std::move(callbacks)),
      options_(options), drag_active_(false), drag_error_(false)
{
    subscription_ = source_.subscribe([this](const IntakeEvent &event)
                                      { onEvent(event); });
}

FileIntakeController::~FileIntakeController()
{
    source_.unsubscribe(subscription_);
}

void FileIntakeController::setOptions(const IntakeOptions &options)
{
    std::lock_guard<std::mutex> lock(mutex_);
    options_ = options;
    if (options_.disabled)
    {
        drag_active_ = false;
        drag_error_ = false;
    }
}

IntakeOptions FileIntakeController::options() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return options_;
}

bool FileIntakeController::hasDragError() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return drag_error_;
}

bool FileIntakeController::isDragActive() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return drag_active_;
}

void FileIntakeController::clearDragState()
{
    std::lock_guard<std::mutex> lock(mutex_);
    drag_active_ = false;
    drag_error_ = false;
}

void FileIntakeController::onEvent(const IntakeEvent &event)
{
    if (options().disabled)
    {
        return;
    }

    switch (event.type)
    {
    case IntakeEventType::DRAG_ENTER:
        onDragEnter(event.files);
        break;
    case IntakeEventType::DRAG_OVER:
        if (callbacks_.on_drag_over)
            callbacks_.on_drag_over();
        break;
    case IntakeEventType::DRAG_LEAVE:
        clearDragState();
        if (callbacks_.on_drag_leave)
            callbacks_.on_drag_leave();
        break;
    case IntakeEventType::DROP:
    case IntakeEventType::FILES_SELECTED:
        handleFiles(event.files);
        break;
    }
}

void FileIntakeController::onDragEnter(const std::vector<FileDescriptor> &files)
{
    ValidationPolicy policy = options().policy;
    ValidationResult preview = ValidationEngine::partition(files, policy);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drag_active_ = true;
        drag_error_ = !preview.rejected.empty();
    }
    if (!preview.rejected.empty())
    {
        Logger::debug("Drag carries " + std::to_string(preview.rejected.size()) + " file(s) that would be rejected");
    }

    if (callbacks_.on_drag_enter)
        callbacks_.on_drag_enter();
}

ValidationResult FileIntakeController::handleFiles(const std::vector<FileDescriptor> &files)
{
    clearDragState();
    IntakeOptions options = this->options();

    if (options.disabled)
    {
        Logger::debug("Intake disabled, ignoring " + std::to_string(files.size()) + " file(s)");
        return ValidationResult();
    }

    ValidationResult result = ValidationEngine::partition(files, options.policy);
    Logger::info("Intake received " + std::to_string(files.size()) + " file(s): " +
                 std::to_string(result.accepted.size()) + " accepted, " +
                 std::to_string(result.rejected.size()) + " rejected");

    if (callbacks_.on_drop)
        callbacks_.on_drop(files, result.accepted, result.rejected, result.errors);
    if (!result.accepted.empty() && callbacks_.on_drop_accepted)
        callbacks_.on_drop_accepted(result.accepted);
    if (!result.rejected.empty() && callbacks_.on_drop_rejected)
        callbacks_.on_drop_rejected(result.rejected);

    return result;
}
