#pragma once

#include "poco_config_manager.hpp"
#include "core/config_observer.hpp"
#include "core/file_intake_controller.hpp"
#include "core/preview_sizing_engine.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Application-facing configuration: explicit option values built from
 * the Poco-backed store, plus change notification
 */
class PocoConfigAdapter
{
public:
    static PocoConfigAdapter &getInstance()
    {
        static PocoConfigAdapter instance;
        return instance;
    }

    ~PocoConfigAdapter() = default;

    // Configuration getters - delegate to PocoConfigManager
    nlohmann::json getAll() const;
    std::string getLogLevel() const;

    /**
     * @brief Intake options, parsed and checked
     * @throws InvalidFormatError or std::invalid_argument on bad values
     */
    IntakeOptions getIntakeOptions() const;

    /**
     * @brief Preview options, parsed and checked
     * @throws InvalidFormatError or std::invalid_argument on bad values
     */
    PreviewOptions getPreviewOptions() const;

    // Configuration setters with event publishing
    void setLogLevel(const std::string &level);

    /**
     * @brief Apply a JSON patch, e.g. {"preview": {"min_height": 60}}
     *
     * The patch is rejected as a whole when the resulting configuration does
     * not validate; nothing changes and no event is published.
     * @throws std::invalid_argument on malformed JSON or invalid values
     */
    void updateConfig(const std::string &json_config);

    // Configuration file operations
    bool saveConfig(const std::string &file_path) const;
    bool loadConfig(const std::string &file_path);
    std::string loadedPath() const;

    // Configuration validation
    bool validateConfig() const;

    // Observer management
    void subscribe(ConfigObserver *observer);
    void unsubscribe(ConfigObserver *observer);

private:
    PocoConfigAdapter();
    PocoConfigAdapter(const PocoConfigAdapter &) = delete;
    PocoConfigAdapter &operator=(const PocoConfigAdapter &) = delete;

    // Internal methods
    void publishEvent(const ConfigUpdateEvent &event);
    std::string generateUpdateId() const;
    void persistChanges(const std::string &changed_key = "");
    static void collectKeys(const std::string &prefix, const nlohmann::json &node, std::vector<std::string> &keys);

    PocoConfigManager &poco_cfg_;

    mutable std::mutex path_mutex_;
    std::string loaded_path_;

    std::mutex update_mutex_;
    std::mutex observers_mutex_;
    std::vector<ConfigObserver *> observers_;

    mutable std::atomic<uint64_t> update_counter_;
};
