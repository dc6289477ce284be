#include "core/logger_observer.hpp"
#include "poco_config_adapter.hpp"
#include "logging/logger.hpp"
#include <algorithm>

void LoggerObserver::onConfigUpdate(const ConfigUpdateEvent &event)
{
    if (!hasLogLevelChange(event))
    {
        return;
    }

    std::string new_log_level = PocoConfigAdapter::getInstance().getLogLevel();
    Logger::setLevel(new_log_level);
    Logger::info("Log level set to " + new_log_level);
}

bool LoggerObserver::hasLogLevelChange(const ConfigUpdateEvent &event) const
{
    const auto &keys = event.changed_keys;
    return std::find(keys.begin(), keys.end(), "log_level") != keys.end() ||
           std::find(keys.begin(), keys.end(), "configuration") != keys.end();
}
