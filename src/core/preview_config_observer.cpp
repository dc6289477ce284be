#include "core/preview_config_observer.hpp"
#include "core/preview_sizing_engine.hpp"
#include "poco_config_adapter.hpp"
#include "logging/logger.hpp"
#include <algorithm>

void PreviewConfigObserver::attach(PreviewSizingEngine *engine)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(engines_.begin(), engines_.end(), engine) == engines_.end())
    {
        engines_.push_back(engine);
    }
}

void PreviewConfigObserver::detach(PreviewSizingEngine *engine)
{
    std::lock_guard<std::mutex> lock(mutex_);
    engines_.erase(std::remove(engines_.begin(), engines_.end(), engine), engines_.end());
}

size_t PreviewConfigObserver::attachedCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return engines_.size();
}

void PreviewConfigObserver::onConfigUpdate(const ConfigUpdateEvent &event)
{
    if (!hasPreviewChange(event))
    {
        return;
    }

    PreviewOptions options = PocoConfigAdapter::getInstance().getPreviewOptions();

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto *engine : engines_)
    {
        engine->setOptions(options);
    }
    Logger::debug("Preview options pushed to " + std::to_string(engines_.size()) + " sizing engine(s)");
}

bool PreviewConfigObserver::hasPreviewChange(const ConfigUpdateEvent &event) const
{
    return std::any_of(event.changed_keys.begin(), event.changed_keys.end(), [](const std::string &key)
                       { return key == "configuration" || key.rfind("preview.", 0) == 0; });
}
