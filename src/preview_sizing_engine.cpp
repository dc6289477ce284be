#include "core/preview_sizing_engine.hpp"
#include "core/bitmap_decode_service.hpp"
#include "core/intake_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <regex>
#include <stdexcept>

bool PreviewOptions::operator==(const PreviewOptions &other) const
{
    return allow_image_preview == other.allow_image_preview &&
           max_file_size == other.max_file_size &&
           panel_layout == other.panel_layout &&
           aspect_ratio == other.aspect_ratio &&
           min_height == other.min_height &&
           max_height == other.max_height &&
           fixed_height == other.fixed_height &&
           zoom_factor == other.zoom_factor &&
           upscale == other.upscale;
}

PreviewSizingEngine::PreviewSizingEngine(const PreviewOptions &options)
    : session_(std::make_shared<Session>())
{
    validateOptions(options);
    session_->options = options;
}

PreviewSizingEngine::~PreviewSizingEngine() = default;

double PreviewSizingEngine::getNumericAspectRatioFromString(const std::string &ratio)
{
    static const std::regex pattern(R"(^\s*(\d+(?:\.\d+)?|\.\d+)\s*:\s*(\d+(?:\.\d+)?|\.\d+)\s*$)");

    std::smatch match;
    if (!std::regex_match(ratio, match, pattern))
    {
        throw InvalidFormatError("aspect ratio", ratio);
    }

    double width = std::strtod(match[1].str().c_str(), nullptr);
    double height = std::strtod(match[2].str().c_str(), nullptr);
    if (width <= 0.0 || height <= 0.0)
    {
        throw InvalidFormatError("aspect ratio", ratio);
    }
    return width / height;
}

PanelLayout PreviewSizingEngine::parsePanelLayout(const std::string &name)
{
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });

    if (lower == "integrated")
        return PanelLayout::INTEGRATED;
    if (lower == "compact")
        return PanelLayout::COMPACT;
    if (lower == "circle")
        return PanelLayout::CIRCLE;
    throw InvalidFormatError("panel layout", name);
}

std::string PreviewSizingEngine::panelLayoutName(PanelLayout layout)
{
    switch (layout)
    {
    case PanelLayout::INTEGRATED:
        return "integrated";
    case PanelLayout::COMPACT:
        return "compact";
    case PanelLayout::CIRCLE:
        return "circle";
    default:
        return "integrated";
    }
}

void PreviewSizingEngine::validateOptions(const PreviewOptions &options)
{
    if (options.min_height < 0.0)
    {
        throw std::invalid_argument("preview min height must not be negative");
    }
    if (options.min_height > options.max_height)
    {
        throw std::invalid_argument("preview min height " + std::to_string(options.min_height) +
                                    " exceeds max height " + std::to_string(options.max_height));
    }
    if (options.zoom_factor <= 0.0)
    {
        throw std::invalid_argument("preview zoom factor must be positive");
    }
    if (options.fixed_height && *options.fixed_height <= 0.0)
    {
        throw std::invalid_argument("preview fixed height must be positive");
    }
    if (options.aspect_ratio && *options.aspect_ratio <= 0.0)
    {
        throw std::invalid_argument("preview aspect ratio must be positive");
    }
}

double PreviewSizingEngine::resolveAspectRatio(const PreviewOptions &options,
                                               const std::optional<ImageDimensions> &natural)
{
    if (options.panel_layout == PanelLayout::CIRCLE)
    {
        return 1.0;
    }
    if (options.aspect_ratio)
    {
        return *options.aspect_ratio;
    }
    if (natural && natural->width > 0 && natural->height > 0)
    {
        return static_cast<double>(natural->width) / natural->height;
    }
    return 1.0;
}

bool PreviewSizingEngine::isPreviewableType(const std::string &mime_type)
{
    return BitmapDecodeService::isDecodable(FileDescriptor("", mime_type, 0));
}

bool PreviewSizingEngine::isPreviewDisallowed(const FileDescriptor &file, const PreviewOptions &options)
{
    return !options.allow_image_preview ||
           (options.max_file_size && file.size() > *options.max_file_size) ||
           !isPreviewableType(file.type());
}

double PreviewSizingEngine::computeHeight(const PreviewOptions &options,
                                          const std::optional<ImageDimensions> &natural,
                                          double container_width)
{
    double aspect_ratio = resolveAspectRatio(options, natural);
    double base_height = options.fixed_height ? *options.fixed_height : container_width / aspect_ratio;

    // Small images are never enlarged unless upscaling is allowed
    if (!options.upscale && natural && natural->height > 0 && natural->height < base_height)
    {
        base_height = natural->height;
    }

    double height = base_height * options.zoom_factor;
    return std::max(options.min_height, std::min(height, options.max_height));
}

PreviewGeometry PreviewSizingEngine::computeGeometry(const FileDescriptor &file,
                                                     const PreviewOptions &options,
                                                     const std::optional<ImageDimensions> &natural,
                                                     double container_width)
{
    PreviewGeometry geometry;
    geometry.aspect_ratio = resolveAspectRatio(options, natural);
    geometry.height = computeHeight(options, natural, container_width);
    geometry.allowed = !isPreviewDisallowed(file, options);
    return geometry;
}

void PreviewSizingEngine::setOptions(const PreviewOptions &options)
{
    validateOptions(options);

    std::lock_guard<std::mutex> lock(session_->mutex);
    if (session_->options != options)
    {
        session_->options = options;
        session_->dirty = true;
    }
}

PreviewOptions PreviewSizingEngine::options() const
{
    std::lock_guard<std::mutex> lock(session_->mutex);
    return session_->options;
}

void PreviewSizingEngine::setContainerWidth(double width)
{
    std::lock_guard<std::mutex> lock(session_->mutex);
    if (session_->container_width != width)
    {
        session_->container_width = width;
        session_->dirty = true;
    }
}

double PreviewSizingEngine::containerWidth() const
{
    std::lock_guard<std::mutex> lock(session_->mutex);
    return session_->container_width;
}

void PreviewSizingEngine::setFile(const FileDescriptor &file, BitmapDecodeService *decoder)
{
    uint64_t generation = 0;
    bool wants_decode = false;
    {
        std::lock_guard<std::mutex> lock(session_->mutex);
        generation = ++session_->generation;
        session_->file = file;
        session_->natural.reset();
        session_->dirty = true;

        // Eligibility is an option and may change later; only the type rules out a natural size
        if (!isPreviewableType(file.type()))
        {
            session_->natural_state = NaturalSizeState::NONE;
        }
        else
        {
            session_->natural_state = NaturalSizeState::PENDING;
            wants_decode = decoder != nullptr;
        }
    }
    session_->natural_cv.notify_all();

    if (!wants_decode)
    {
        return;
    }

    std::weak_ptr<Session> weak_session = session_;
    try
    {
        decoder->decode(file, [weak_session, generation, name = file.name()](DecodeResult &&result)
                        {
                            auto session = weak_session.lock();
                            if (!session)
                            {
                                return;
                            }
                            if (result.success())
                            {
                                applyNaturalSize(*session, generation, NaturalSizeState::KNOWN,
                                                 result.bitmap.dimensions);
                            }
                            else
                            {
                                Logger::debug("No natural size for " + name + ": " + result.error_message);
                                applyNaturalSize(*session, generation, NaturalSizeState::NONE, std::nullopt);
                            }
                        });
    }
    catch (const std::exception &e)
    {
        Logger::warn("Could not start decode of " + file.name() + ": " + std::string(e.what()));
        applyNaturalSize(*session_, generation, NaturalSizeState::NONE, std::nullopt);
    }
}

void PreviewSizingEngine::setNaturalDimensions(const ImageDimensions &dimensions)
{
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(session_->mutex);
        generation = session_->generation;
    }
    applyNaturalSize(*session_, generation, NaturalSizeState::KNOWN, dimensions);
}

void PreviewSizingEngine::applyNaturalSize(Session &session, uint64_t generation,
                                           NaturalSizeState state, std::optional<ImageDimensions> natural)
{
    {
        std::lock_guard<std::mutex> lock(session.mutex);
        if (generation != session.generation)
        {
            Logger::debug("Discarding natural size for a replaced preview file");
            return;
        }
        if (session.natural_state == state && session.natural == natural)
        {
            return;
        }
        session.natural_state = state;
        session.natural = natural;
        session.dirty = true;
    }
    session.natural_cv.notify_all();
}

NaturalSizeState PreviewSizingEngine::naturalSizeState() const
{
    std::lock_guard<std::mutex> lock(session_->mutex);
    return session_->natural_state;
}

std::optional<ImageDimensions> PreviewSizingEngine::naturalDimensions() const
{
    std::lock_guard<std::mutex> lock(session_->mutex);
    return session_->natural;
}

bool PreviewSizingEngine::waitForNaturalSize(std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock(session_->mutex);
    return session_->natural_cv.wait_for(lock, timeout, [this]()
                                         { return session_->natural_state != NaturalSizeState::PENDING; });
}

PreviewGeometry PreviewSizingEngine::geometry()
{
    std::lock_guard<std::mutex> lock(session_->mutex);
    if (session_->dirty)
    {
        session_->cached = computeGeometry(session_->file, session_->options, session_->natural,
                                           session_->container_width);
        session_->dirty = false;
        ++session_->recompute_count;
    }
    return session_->cached;
}

uint64_t PreviewSizingEngine::recomputeCount() const
{
    std::lock_guard<std::mutex> lock(session_->mutex);
    return session_->recompute_count;
}
