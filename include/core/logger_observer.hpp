#pragma once

#include "config_observer.hpp"

/**
 * @brief Applies log_level changes to the Logger
 */
class LoggerObserver : public ConfigObserver
{
public:
    LoggerObserver() = default;
    ~LoggerObserver() override = default;

    void onConfigUpdate(const ConfigUpdateEvent &event) override;

private:
    bool hasLogLevelChange(const ConfigUpdateEvent &event) const;
};
