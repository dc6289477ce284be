#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "core/file_descriptor.hpp"
#include "core/image_types.hpp"

class BitmapDecodeService;

enum class PanelLayout
{
    INTEGRATED,
    COMPACT,
    CIRCLE
};

/**
 * @brief Sizing and eligibility settings of a preview panel
 *
 * String-valued settings (aspect ratio, size bound, layout) are parsed before
 * they get here; an options value is always well-formed.
 */
struct PreviewOptions
{
    bool allow_image_preview = true;
    std::optional<uint64_t> max_file_size;
    PanelLayout panel_layout = PanelLayout::INTEGRATED;
    std::optional<double> aspect_ratio;
    double min_height = 44.0;
    double max_height = 256.0;
    std::optional<double> fixed_height;
    double zoom_factor = 1.0;
    bool upscale = true;

    bool operator==(const PreviewOptions &other) const;
    bool operator!=(const PreviewOptions &other) const { return !(*this == other); }
};

enum class NaturalSizeState
{
    PENDING, // image file, dimensions not resolved yet
    NONE,    // no file, not an image, or the decode failed
    KNOWN
};

/**
 * @brief Turns natural image dimensions plus layout constraints into a
 * preview height
 *
 * The static functions are the pure computations. An instance is one preview
 * surface's session: inputs are set independently and geometry() recomputes
 * lazily, once per batch of input changes.
 */
class PreviewSizingEngine
{
public:
    explicit PreviewSizingEngine(const PreviewOptions &options = PreviewOptions());
    ~PreviewSizingEngine();

    PreviewSizingEngine(const PreviewSizingEngine &) = delete;
    PreviewSizingEngine &operator=(const PreviewSizingEngine &) = delete;

    /**
     * @brief Parse a "W:H" ratio string into W/H
     * @throws InvalidFormatError unless both sides are positive numbers
     */
    static double getNumericAspectRatioFromString(const std::string &ratio);

    /**
     * @brief Parse "integrated", "compact" or "circle" (case-insensitive)
     * @throws InvalidFormatError for any other name
     */
    static PanelLayout parsePanelLayout(const std::string &name);
    static std::string panelLayoutName(PanelLayout layout);

    /**
     * @brief Check numeric settings for consistency
     * @throws std::invalid_argument when min/max/zoom/fixed height are unusable
     */
    static void validateOptions(const PreviewOptions &options);

    /**
     * @brief Effective panel ratio: 1 for circle panels, else the configured
     * override, else the natural ratio when known, else 1
     */
    static double resolveAspectRatio(const PreviewOptions &options,
                                     const std::optional<ImageDimensions> &natural);

    static bool isPreviewableType(const std::string &mime_type);

    /**
     * @brief True when previews are turned off, the file is above the
     * preview size bound, or its type cannot be previewed
     */
    static bool isPreviewDisallowed(const FileDescriptor &file, const PreviewOptions &options);

    /**
     * @brief Final render height for a panel
     * @param options Sizing settings
     * @param natural Natural image dimensions, if known
     * @param container_width Observed width of the hosting container
     * @return Height clamped to [min_height, max_height]
     */
    static double computeHeight(const PreviewOptions &options,
                                const std::optional<ImageDimensions> &natural,
                                double container_width);

    static PreviewGeometry computeGeometry(const FileDescriptor &file,
                                           const PreviewOptions &options,
                                           const std::optional<ImageDimensions> &natural,
                                           double container_width);

    void setOptions(const PreviewOptions &options);
    PreviewOptions options() const;

    void setContainerWidth(double width);
    double containerWidth() const;

    /**
     * @brief Show a new file in this surface
     *
     * Images of a previewable type are decoded through decoder when one is
     * given, whether or not the current options allow the preview, so the
     * natural size is at hand once they do;
     * without one the natural size stays pending until
     * setNaturalDimensions() supplies it. Results of a decode started for a
     * previously shown file are discarded.
     */
    void setFile(const FileDescriptor &file, BitmapDecodeService *decoder = nullptr);

    /**
     * @brief Supply natural dimensions directly (metadata probe)
     */
    void setNaturalDimensions(const ImageDimensions &dimensions);

    NaturalSizeState naturalSizeState() const;
    std::optional<ImageDimensions> naturalDimensions() const;

    /**
     * @brief Block until the natural size lookup leaves the pending state
     * @return False on timeout
     */
    bool waitForNaturalSize(std::chrono::milliseconds timeout) const;

    /**
     * @brief Current geometry, recomputed only if an input changed since
     * the last call
     */
    PreviewGeometry geometry();

    uint64_t recomputeCount() const;

private:
    struct Session
    {
        mutable std::mutex mutex;
        mutable std::condition_variable natural_cv;

        PreviewOptions options;
        double container_width = 0.0;
        FileDescriptor file;
        uint64_t generation = 0;
        NaturalSizeState natural_state = NaturalSizeState::NONE;
        std::optional<ImageDimensions> natural;

        bool dirty = true;
        PreviewGeometry cached;
        uint64_t recompute_count = 0;
    };

    static void applyNaturalSize(Session &session, uint64_t generation,
                                 NaturalSizeState state, std::optional<ImageDimensions> natural);

    std::shared_ptr<Session> session_;
};
