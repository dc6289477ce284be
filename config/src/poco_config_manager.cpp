#include "poco_config_manager.hpp"
#include "core/size_constraint_parser.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <fstream>
#include <functional>
#include <sstream>
#include <stdexcept>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
    initializeDefaultConfig();
}

bool PocoConfigManager::load(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(path);
    if (!in.good())
        return false;
    AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
    tmp->load(in);
    cfg_ = tmp;
    return true;
}

bool PocoConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return true;
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void PocoConfigManager::replace(const nlohmann::json &config)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::istringstream in(config.dump());
    AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
    tmp->load(in);
    cfg_ = tmp;
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    // Flatten and set values
    std::function<void(const std::string &, const nlohmann::json &)> apply;
    apply = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                apply(key, it.value());
            }
        }
        else if (node.is_null())
        {
            // null clears an optional setting
            cfg_->setString(prefix, "");
        }
        else if (node.is_boolean())
            cfg_->setBool(prefix, node.get<bool>());
        else if (node.is_number_integer())
            cfg_->setInt(prefix, node.get<int>());
        else if (node.is_number_float())
            cfg_->setDouble(prefix, node.get<double>());
        else if (node.is_string())
            cfg_->setString(prefix, node.get<std::string>());
        else
            cfg_->setString(prefix, node.dump());
    };
    apply("", patch);
}

// Basic configuration getters
std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt(key, def);
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getBool(key, def);
}

double PocoConfigManager::getDouble(const std::string &key, double def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getDouble(key, def);
}

std::optional<std::string> PocoConfigManager::getOptionalString(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cfg_->hasProperty(key))
        return std::nullopt;
    std::string value = cfg_->getString(key);
    if (value.empty())
        return std::nullopt;
    return value;
}

std::optional<double> PocoConfigManager::getOptionalDouble(const std::string &key) const
{
    if (!getOptionalString(key))
        return std::nullopt;
    return getDouble(key);
}

std::string PocoConfigManager::getLogLevel() const
{
    return getString("log_level", "INFO");
}

// Intake configuration getters
std::string PocoConfigManager::getAcceptSpec() const
{
    return getString("intake.accept", "");
}

std::optional<std::string> PocoConfigManager::getMinFileSize() const
{
    return getOptionalString("intake.min_file_size");
}

std::optional<std::string> PocoConfigManager::getMaxFileSize() const
{
    return getOptionalString("intake.max_file_size");
}

std::optional<std::string> PocoConfigManager::getMaxTotalFileSize() const
{
    return getOptionalString("intake.max_total_file_size");
}

bool PocoConfigManager::getAllowMultiple() const
{
    return getBool("intake.allow_multiple", true);
}

bool PocoConfigManager::getIntakeDisabled() const
{
    return getBool("intake.disabled", false);
}

// Preview configuration getters
bool PocoConfigManager::getAllowImagePreview() const
{
    return getBool("preview.allow_image_preview", true);
}

std::optional<std::string> PocoConfigManager::getPreviewMaxFileSize() const
{
    return getOptionalString("preview.max_file_size");
}

std::string PocoConfigManager::getPanelLayout() const
{
    return getString("preview.panel_layout", "integrated");
}

std::optional<std::string> PocoConfigManager::getPanelAspectRatio() const
{
    return getOptionalString("preview.panel_aspect_ratio");
}

double PocoConfigManager::getPreviewMinHeight() const
{
    return getDouble("preview.min_height", 44.0);
}

double PocoConfigManager::getPreviewMaxHeight() const
{
    return getDouble("preview.max_height", 256.0);
}

std::optional<double> PocoConfigManager::getPreviewFixedHeight() const
{
    return getOptionalDouble("preview.fixed_height");
}

double PocoConfigManager::getPreviewZoomFactor() const
{
    return getDouble("preview.zoom_factor", 1.0);
}

bool PocoConfigManager::getPreviewUpscale() const
{
    return getBool("preview.upscale", true);
}

// Option values
IntakeOptions PocoConfigManager::getIntakeOptions() const
{
    IntakeOptions options;
    options.policy.accept = getAcceptSpec();
    options.policy.size = SizeConstraintParser::parseConstraint(getMinFileSize(), getMaxFileSize(),
                                                                getMaxTotalFileSize());
    if (options.policy.size.min && options.policy.size.max && *options.policy.size.min > *options.policy.size.max)
    {
        throw std::invalid_argument("intake.min_file_size exceeds intake.max_file_size");
    }
    options.policy.allow_multiple = getAllowMultiple();
    options.disabled = getIntakeDisabled();
    return options;
}

PreviewOptions PocoConfigManager::getPreviewOptions() const
{
    PreviewOptions options;
    options.allow_image_preview = getAllowImagePreview();
    options.max_file_size = SizeConstraintParser::parseOptional(getPreviewMaxFileSize());
    options.panel_layout = PreviewSizingEngine::parsePanelLayout(getPanelLayout());
    if (auto ratio = getPanelAspectRatio())
        options.aspect_ratio = PreviewSizingEngine::getNumericAspectRatioFromString(*ratio);
    options.min_height = getPreviewMinHeight();
    options.max_height = getPreviewMaxHeight();
    options.fixed_height = getPreviewFixedHeight();
    options.zoom_factor = getPreviewZoomFactor();
    options.upscale = getPreviewUpscale();
    PreviewSizingEngine::validateOptions(options);
    return options;
}

// Configuration validation
bool PocoConfigManager::validateConfig() const
{
    if (!Logger::isValidLevel(getLogLevel()))
    {
        Logger::error("Invalid log_level: " + getLogLevel());
        return false;
    }
    return validateIntakeConfig() && validatePreviewConfig();
}

bool PocoConfigManager::validateIntakeConfig() const
{
    try
    {
        getIntakeOptions();
        return true;
    }
    catch (const std::exception &e)
    {
        Logger::error("Invalid intake configuration: " + std::string(e.what()));
        return false;
    }
}

bool PocoConfigManager::validatePreviewConfig() const
{
    try
    {
        getPreviewOptions();
        return true;
    }
    catch (const std::exception &e)
    {
        Logger::error("Invalid preview configuration: " + std::string(e.what()));
        return false;
    }
}

void PocoConfigManager::initializeDefaultConfig()
{
    std::lock_guard<std::mutex> lock(mutex_);

    cfg_->setString("log_level", "INFO");

    // Intake defaults; size bounds are unset
    cfg_->setString("intake.accept", "");
    cfg_->setBool("intake.allow_multiple", true);
    cfg_->setBool("intake.disabled", false);

    // Preview defaults
    cfg_->setBool("preview.allow_image_preview", true);
    cfg_->setString("preview.panel_layout", "integrated");
    cfg_->setDouble("preview.min_height", 44.0);
    cfg_->setDouble("preview.max_height", 256.0);
    cfg_->setDouble("preview.zoom_factor", 1.0);
    cfg_->setBool("preview.upscale", true);
}

bool PocoConfigManager::hasKey(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        cfg_->getString(key);
        return true;
    }
    catch (const Poco::NotFoundException &)
    {
        return false;
    }
}
