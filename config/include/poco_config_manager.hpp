#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/file_intake_controller.hpp"
#include "core/preview_sizing_engine.hpp"

class PocoConfigManager
{
public:
    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    // Core file operations
    bool load(const std::string &path);
    bool save(const std::string &path) const;
    void update(const nlohmann::json &patch);
    void replace(const nlohmann::json &config);
    nlohmann::json getAll() const;

    // Basic configuration getters
    std::string getString(const std::string &key, const std::string &def = "") const;
    int getInt(const std::string &key, int def = 0) const;
    bool getBool(const std::string &key, bool def = false) const;
    double getDouble(const std::string &key, double def = 0.0) const;

    /**
     * @brief Read a key that has no default
     * @return The value, or std::nullopt when the key is absent or empty
     */
    std::optional<std::string> getOptionalString(const std::string &key) const;
    std::optional<double> getOptionalDouble(const std::string &key) const;

    std::string getLogLevel() const;

    // Intake configuration getters
    std::string getAcceptSpec() const;
    std::optional<std::string> getMinFileSize() const;
    std::optional<std::string> getMaxFileSize() const;
    std::optional<std::string> getMaxTotalFileSize() const;
    bool getAllowMultiple() const;
    bool getIntakeDisabled() const;

    // Preview configuration getters
    bool getAllowImagePreview() const;
    std::optional<std::string> getPreviewMaxFileSize() const;
    std::string getPanelLayout() const;
    std::optional<std::string> getPanelAspectRatio() const;
    double getPreviewMinHeight() const;
    double getPreviewMaxHeight() const;
    std::optional<double> getPreviewFixedHeight() const;
    double getPreviewZoomFactor() const;
    bool getPreviewUpscale() const;

    /**
     * @brief Build the intake option value from the intake.* keys
     * @throws InvalidFormatError for a malformed size bound
     * @throws std::invalid_argument when min exceeds max
     */
    IntakeOptions getIntakeOptions() const;

    /**
     * @brief Build the preview option value from the preview.* keys
     * @throws InvalidFormatError for a malformed size, ratio or layout
     * @throws std::invalid_argument for inconsistent heights or zoom
     */
    PreviewOptions getPreviewOptions() const;

    // Configuration validation
    bool validateConfig() const;
    bool validateIntakeConfig() const;
    bool validatePreviewConfig() const;

    // Utility methods
    void initializeDefaultConfig();
    bool hasKey(const std::string &key) const;

private:
    PocoConfigManager();
    ~PocoConfigManager() = default;
    PocoConfigManager(const PocoConfigManager &) = delete;
    PocoConfigManager &operator=(const PocoConfigManager &) = delete;

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
