#pragma once

#include <string>
#include <vector>

/**
 * @brief Configuration update event
 */
struct ConfigUpdateEvent
{
    std::vector<std::string> changed_keys; // Flattened keys, e.g. "preview.min_height"; "configuration" for a full reload
    std::string source;                    // "api" for updates, "file" for loads
    std::string update_id;                 // Unique per published event
};

/**
 * @brief Observer interface for configuration changes
 */
class ConfigObserver
{
public:
    virtual ~ConfigObserver() = default;
    virtual void onConfigUpdate(const ConfigUpdateEvent &event) = 0;
};
