#include "core/size_constraint_parser.hpp"
#include "core/intake_errors.hpp"
#include <cmath>
#include <cstdlib>
#include <limits>
#include <regex>

namespace
{
    constexpr uint64_t KIB = 1024ULL;
    constexpr uint64_t MIB = 1024ULL * KIB;
    constexpr uint64_t GIB = 1024ULL * MIB;

    uint64_t unitMultiplier(const std::string &unit)
    {
        if (unit == "KB")
            return KIB;
        if (unit == "MB")
            return MIB;
        if (unit == "GB")
            return GIB;
        return 1;
    }
}

uint64_t SizeConstraintParser::parse(const std::string &size_string)
{
    static const std::regex pattern(R"(^((?:\d+(?:\.\d*)?)|(?:\.\d+))(B|KB|MB|GB)$)");

    std::smatch match;
    if (!std::regex_match(size_string, match, pattern))
    {
        throw InvalidFormatError("size", size_string);
    }

    double number = std::strtod(match[1].str().c_str(), nullptr);
    long double bytes = static_cast<long double>(number) * unitMultiplier(match[2].str());
    if (!std::isfinite(static_cast<double>(bytes)) ||
        bytes >= static_cast<long double>(std::numeric_limits<uint64_t>::max()))
    {
        throw InvalidFormatError("size", size_string);
    }
    return static_cast<uint64_t>(std::floor(bytes));
}

std::optional<uint64_t> SizeConstraintParser::parseOptional(const std::optional<std::string> &size_string)
{
    if (!size_string || size_string->empty())
    {
        return std::nullopt;
    }
    return parse(*size_string);
}

SizeConstraint SizeConstraintParser::parseConstraint(const std::optional<std::string> &min_size,
                                                     const std::optional<std::string> &max_size,
                                                     const std::optional<std::string> &max_total_size)
{
    SizeConstraint constraint;
    constraint.min = parseOptional(min_size);
    constraint.max = parseOptional(max_size);
    constraint.max_total = parseOptional(max_total_size);
    return constraint;
}

std::string SizeConstraintParser::format(uint64_t bytes)
{
    if (bytes != 0 && bytes % GIB == 0)
        return std::to_string(bytes / GIB) + "GB";
    if (bytes != 0 && bytes % MIB == 0)
        return std::to_string(bytes / MIB) + "MB";
    if (bytes != 0 && bytes % KIB == 0)
        return std::to_string(bytes / KIB) + "KB";
    return std::to_string(bytes) + "B";
}
