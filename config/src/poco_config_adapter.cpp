#include "poco_config_adapter.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>

PocoConfigAdapter::PocoConfigAdapter()
    : poco_cfg_(PocoConfigManager::getInstance()), update_counter_(0)
{
    // Try to load configuration from common locations (project and build dirs)
    const std::vector<std::string> candidate_paths = {
        "config/config.json",    // prefer project config first
        "../config/config.json", // running from build/
        "config.json"            // last resort: local working dir
    };

    for (const auto &path : candidate_paths)
    {
        if (poco_cfg_.load(path))
        {
            Logger::info("Configuration loaded from " + path);
            std::lock_guard<std::mutex> lock(path_mutex_);
            loaded_path_ = path;
            return;
        }
    }

    Logger::info("No configuration file found, using defaults");
}

// Configuration getters - delegate to PocoConfigManager
nlohmann::json PocoConfigAdapter::getAll() const
{
    return poco_cfg_.getAll();
}

std::string PocoConfigAdapter::getLogLevel() const
{
    return poco_cfg_.getLogLevel();
}

IntakeOptions PocoConfigAdapter::getIntakeOptions() const
{
    return poco_cfg_.getIntakeOptions();
}

PreviewOptions PocoConfigAdapter::getPreviewOptions() const
{
    return poco_cfg_.getPreviewOptions();
}

void PocoConfigAdapter::setLogLevel(const std::string &level)
{
    if (!Logger::isValidLevel(level))
    {
        throw std::invalid_argument("Invalid log level: " + level);
    }

    poco_cfg_.update({{"log_level", level}});

    // Persist changes to the loaded config file
    persistChanges("log_level");

    ConfigUpdateEvent event;
    event.changed_keys = {"log_level"};
    event.source = "api";
    event.update_id = generateUpdateId();

    publishEvent(event);
}

void PocoConfigAdapter::updateConfig(const std::string &json_config)
{
    nlohmann::json patch;
    try
    {
        patch = nlohmann::json::parse(json_config);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        Logger::error("Failed to update config: " + std::string(e.what()));
        throw std::invalid_argument("Malformed configuration JSON: " + std::string(e.what()));
    }
    if (!patch.is_object())
    {
        throw std::invalid_argument("Configuration update must be a JSON object");
    }

    ConfigUpdateEvent event;
    {
        std::lock_guard<std::mutex> lock(update_mutex_);
        nlohmann::json snapshot = poco_cfg_.getAll();
        poco_cfg_.update(patch);

        if (!poco_cfg_.validateConfig())
        {
            poco_cfg_.replace(snapshot);
            Logger::error("Configuration update rejected, previous values restored");
            throw std::invalid_argument("Configuration update rejected: invalid values");
        }

        collectKeys("", patch, event.changed_keys);
        persistChanges();
    }

    event.source = "api";
    event.update_id = generateUpdateId();
    publishEvent(event);
}

void PocoConfigAdapter::collectKeys(const std::string &prefix, const nlohmann::json &node,
                                    std::vector<std::string> &keys)
{
    if (!node.is_object())
    {
        keys.push_back(prefix);
        return;
    }
    for (auto it = node.begin(); it != node.end(); ++it)
    {
        collectKeys(prefix.empty() ? it.key() : prefix + "." + it.key(), it.value(), keys);
    }
}

// Observer management
void PocoConfigAdapter::subscribe(ConfigObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.push_back(observer);
    Logger::debug("Configuration observer subscribed");
}

void PocoConfigAdapter::unsubscribe(ConfigObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.erase(
        std::remove(observers_.begin(), observers_.end(), observer),
        observers_.end());
    Logger::debug("Configuration observer unsubscribed");
}

// Configuration persistence
bool PocoConfigAdapter::loadConfig(const std::string &file_path)
{
    if (!poco_cfg_.load(file_path))
    {
        Logger::warn("Could not read configuration from " + file_path);
        return false;
    }

    Logger::info("Loaded configuration from " + file_path);
    {
        std::lock_guard<std::mutex> lock(path_mutex_);
        loaded_path_ = file_path;
    }

    ConfigUpdateEvent event;
    event.changed_keys = {"configuration"};
    event.source = "file";
    event.update_id = generateUpdateId();
    publishEvent(event);
    return true;
}

bool PocoConfigAdapter::saveConfig(const std::string &file_path) const
{
    return poco_cfg_.save(file_path);
}

std::string PocoConfigAdapter::loadedPath() const
{
    std::lock_guard<std::mutex> lock(path_mutex_);
    return loaded_path_;
}

// Configuration validation
bool PocoConfigAdapter::validateConfig() const
{
    return poco_cfg_.validateConfig();
}

// Internal methods
void PocoConfigAdapter::publishEvent(const ConfigUpdateEvent &event)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);

    Logger::info("Publishing config update event from " + event.source + " with " +
                 std::to_string(event.changed_keys.size()) + " changes");

    for (auto observer : observers_)
    {
        try
        {
            observer->onConfigUpdate(event);
        }
        catch (const std::exception &e)
        {
            Logger::error("Error in config observer: " + std::string(e.what()));
        }
    }
}

std::string PocoConfigAdapter::generateUpdateId() const
{
    auto now = std::chrono::system_clock::now();
    auto duration = now.time_since_epoch();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
    return "update_" + std::to_string(millis) + "_" + std::to_string(update_counter_.fetch_add(1));
}

void PocoConfigAdapter::persistChanges(const std::string &changed_key)
{
    std::string path = loadedPath();
    if (path.empty())
    {
        Logger::debug("No configuration file loaded, changes kept in memory");
        return;
    }

    if (!poco_cfg_.save(path))
    {
        Logger::error("Failed to persist configuration changes to " + path);
        return;
    }

    Logger::info("Configuration changes persisted to " + path +
                 (changed_key.empty() ? "" : " (key: " + changed_key + ")"));
}
