#pragma once

#include <mutex>
#include <vector>
#include "config_observer.hpp"

class PreviewSizingEngine;

/**
 * @brief Pushes preview.* configuration changes into attached sizing engines
 *
 * Engines must be detached before they are destroyed.
 */
class PreviewConfigObserver : public ConfigObserver
{
public:
    PreviewConfigObserver() = default;
    ~PreviewConfigObserver() override = default;

    void attach(PreviewSizingEngine *engine);
    void detach(PreviewSizingEngine *engine);
    size_t attachedCount() const;

    /**
     * @brief Handle configuration changes
     * @param event Configuration update event
     */
    void onConfigUpdate(const ConfigUpdateEvent &event) override;

private:
    bool hasPreviewChange(const ConfigUpdateEvent &event) const;

    mutable std::mutex mutex_;
    std::vector<PreviewSizingEngine *> engines_;
};
