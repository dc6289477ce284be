#pragma once

#include <cstdint>

/**
 * @brief Natural (undistorted) pixel size of an image
 */
struct ImageDimensions
{
    uint32_t width = 0;
    uint32_t height = 0;

    bool operator==(const ImageDimensions &other) const
    {
        return width == other.width && height == other.height;
    }
    bool operator!=(const ImageDimensions &other) const { return !(*this == other); }
};

/**
 * @brief Final render geometry of a preview panel
 */
struct PreviewGeometry
{
    double height = 0.0;
    double aspect_ratio = 1.0;
    bool allowed = false;
};
