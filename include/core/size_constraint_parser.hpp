#pragma once

#include <cstdint>
#include <optional>
#include <string>

/**
 * @brief Byte bounds applied during validation; unset means unconstrained
 */
struct SizeConstraint
{
    std::optional<uint64_t> min;
    std::optional<uint64_t> max;
    std::optional<uint64_t> max_total;
};

/**
 * @brief Parses human readable size strings such as "512KB" or "1.5MB"
 *
 * Units are B, KB, MB and GB with binary multipliers (1 KB = 1024 B).
 * Parsing happens once per configured bound, never per file.
 */
class SizeConstraintParser
{
public:
    /**
     * @brief Parse a size string into a byte count
     * @param size_string A decimal number immediately followed by B, KB, MB or GB
     * @return Number of bytes, fractional bytes truncated
     * @throws InvalidFormatError if the string does not match the format
     */
    static uint64_t parse(const std::string &size_string);

    /**
     * @brief Parse an optional bound; an absent or empty string stays unset
     */
    static std::optional<uint64_t> parseOptional(const std::optional<std::string> &size_string);

    /**
     * @brief Parse all three bounds at once
     * @throws InvalidFormatError on the first malformed bound
     */
    static SizeConstraint parseConstraint(const std::optional<std::string> &min_size,
                                          const std::optional<std::string> &max_size,
                                          const std::optional<std::string> &max_total_size);

    /**
     * @brief Render a byte count with the largest unit that divides it exactly
     */
    static std::string format(uint64_t bytes);
};
