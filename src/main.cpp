#include "core/bitmap_decode_service.hpp"
#include "core/file_descriptor.hpp"
#include "core/file_intake_controller.hpp"
#include "core/intake_event_source.hpp"
#include "core/logger_observer.hpp"
#include "core/preview_config_observer.hpp"
#include "core/preview_sizing_engine.hpp"
#include "core/validation_engine.hpp"
#include "logging/logger.hpp"
#include "poco_config_adapter.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace
{
    constexpr double DEFAULT_CONTAINER_WIDTH = 320.0;
    constexpr auto DECODE_TIMEOUT = std::chrono::seconds(30);

    void printUsage(const char *program)
    {
        std::cout << "File Intake - validate files and size their previews" << std::endl;
        std::cout << "Usage: " << program << " [options] files..." << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config, -c PATH     Load configuration from PATH" << std::endl;
        std::cout << "  --width, -w PX        Preview container width (default 320)" << std::endl;
        std::cout << "  --log-level, -l LVL   TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
        std::cout << "  --help, -h            Show this help message" << std::endl;
    }

    nlohmann::json describe(const FileDescriptor &file)
    {
        return {{"name", file.name()}, {"type", file.type()}, {"size", file.size()}};
    }
}

int main(int argc, char *argv[])
{
    std::string config_path;
    std::string log_level;
    double container_width = DEFAULT_CONTAINER_WIDTH;
    std::vector<std::string> paths;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else if ((arg == "--config" || arg == "-c") && has_value)
        {
            config_path = argv[++i];
        }
        else if ((arg == "--width" || arg == "-w") && has_value)
        {
            try
            {
                container_width = std::stod(argv[++i]);
            }
            catch (const std::exception &)
            {
                std::cerr << "Error: --width expects a number" << std::endl;
                return 1;
            }
        }
        else if ((arg == "--log-level" || arg == "-l") && has_value)
        {
            log_level = argv[++i];
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            std::cerr << "Error: unknown or incomplete option " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
        else
        {
            paths.push_back(arg);
        }
    }

    if (paths.empty())
    {
        printUsage(argv[0]);
        return 1;
    }

    Logger::init(log_level.empty() ? "INFO" : log_level);

    auto &config = PocoConfigAdapter::getInstance();
    if (!config_path.empty() && !config.loadConfig(config_path))
    {
        Logger::error("Cannot load configuration from " + config_path);
        return 1;
    }
    Logger::init(log_level.empty() ? config.getLogLevel() : log_level);

    // Configuration strings fail here, before any file is looked at
    IntakeOptions intake_options;
    PreviewOptions preview_options;
    try
    {
        intake_options = config.getIntakeOptions();
        preview_options = config.getPreviewOptions();
    }
    catch (const std::exception &e)
    {
        Logger::error("Invalid configuration: " + std::string(e.what()));
        return 2;
    }

    auto logger_observer = std::make_unique<LoggerObserver>();
    auto preview_config_observer = std::make_unique<PreviewConfigObserver>();
    config.subscribe(logger_observer.get());
    config.subscribe(preview_config_observer.get());

    nlohmann::json report;
    report["unreadable"] = nlohmann::json::array();

    std::vector<FileDescriptor> files;
    for (const auto &path : paths)
    {
        try
        {
            files.push_back(FileDescriptor::fromPath(path));
        }
        catch (const std::exception &e)
        {
            Logger::warn(e.what());
            report["unreadable"].push_back({{"path", path}, {"reason", e.what()}});
        }
    }

    ValidationResult intake;
    IntakeCallbacks callbacks;
    callbacks.on_drop = [&intake](const std::vector<FileDescriptor> &,
                                  const std::vector<FileDescriptor> &accepted,
                                  const std::vector<FileDescriptor> &rejected,
                                  const std::vector<ValidationError> &errors)
    {
        intake.accepted = accepted;
        intake.rejected = rejected;
        intake.errors = errors;
    };

    DirectEventSource source;
    FileIntakeController controller(source, intake_options, std::move(callbacks));
    source.emit(IntakeEvent{IntakeEventType::FILES_SELECTED, files});

    report["accepted"] = nlohmann::json::array();
    for (const auto &file : intake.accepted)
        report["accepted"].push_back(describe(file));

    report["rejected"] = nlohmann::json::array();
    for (const auto &file : intake.rejected)
        report["rejected"].push_back(describe(file));

    report["errors"] = nlohmann::json::array();
    for (const auto &error : intake.errors)
    {
        report["errors"].push_back({{"file", error.file.name()},
                                    {"kind", ValidationEngine::kindName(error.kind)},
                                    {"detail", error.detail}});
    }

    // One sizing session per accepted file; decodes queue on one worker
    BitmapDecodeService decoder;
    std::vector<std::unique_ptr<PreviewSizingEngine>> engines;
    for (const auto &file : intake.accepted)
    {
        auto engine = std::make_unique<PreviewSizingEngine>(preview_options);
        preview_config_observer->attach(engine.get());
        engine->setContainerWidth(container_width);
        engine->setFile(file, &decoder);
        engines.push_back(std::move(engine));
    }

    report["previews"] = nlohmann::json::array();
    for (size_t i = 0; i < engines.size(); ++i)
    {
        auto &engine = engines[i];
        if (!engine->waitForNaturalSize(DECODE_TIMEOUT))
        {
            Logger::warn("Timed out waiting for the size of " + intake.accepted[i].name());
        }

        PreviewGeometry geometry = engine->geometry();
        nlohmann::json preview = {{"file", intake.accepted[i].name()},
                                  {"allowed", geometry.allowed},
                                  {"height", geometry.height},
                                  {"aspect_ratio", geometry.aspect_ratio},
                                  {"natural", nullptr}};
        if (auto natural = engine->naturalDimensions())
        {
            preview["natural"] = {{"width", natural->width}, {"height", natural->height}};
        }
        report["previews"].push_back(preview);
    }

    decoder.terminate();
    for (auto &engine : engines)
        preview_config_observer->detach(engine.get());
    config.unsubscribe(preview_config_observer.get());
    config.unsubscribe(logger_observer.get());

    std::cout << report.dump(2) << std::endl;
    return 0;
}
