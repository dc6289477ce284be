#include "core/validation_engine.hpp"
#include "core/accept_pattern_matcher.hpp"
#include "logging/logger.hpp"

namespace
{
    struct Verdict
    {
        bool accepted = true;
        ValidationErrorKind kind = ValidationErrorKind::TYPE_REJECTED;
        std::string detail;

        void reject(ValidationErrorKind k, std::string d)
        {
            accepted = false;
            kind = k;
            detail = std::move(d);
        }
    };
}

ValidationResult ValidationEngine::partition(const std::vector<FileDescriptor> &files,
                                             const std::string &accept_spec,
                                             std::optional<uint64_t> min_size,
                                             std::optional<uint64_t> max_size,
                                             std::optional<uint64_t> max_total_size,
                                             bool allow_multiple)
{
    AcceptRule rule = AcceptPatternMatcher::parse(accept_spec);
    std::vector<Verdict> verdicts(files.size());

    // Individual checks: type first, then size bounds
    for (size_t i = 0; i < files.size(); ++i)
    {
        const FileDescriptor &file = files[i];
        if (!AcceptPatternMatcher::matches(file, rule))
        {
            std::string type = file.type().empty() ? "unknown type" : file.type();
            verdicts[i].reject(ValidationErrorKind::TYPE_REJECTED,
                               file.name() + " (" + type + ") does not match accept '" + accept_spec + "'");
        }
        else if (min_size && file.size() < *min_size)
        {
            verdicts[i].reject(ValidationErrorKind::SIZE_TOO_SMALL,
                               file.name() + " is " + std::to_string(file.size()) +
                                   " bytes, minimum is " + SizeConstraintParser::format(*min_size));
        }
        else if (max_size && file.size() > *max_size)
        {
            verdicts[i].reject(ValidationErrorKind::SIZE_TOO_LARGE,
                               file.name() + " is " + std::to_string(file.size()) +
                                   " bytes, maximum is " + SizeConstraintParser::format(*max_size));
        }
    }

    // Cardinality: only the first individually valid file survives
    if (!allow_multiple)
    {
        bool kept_one = false;
        for (size_t i = 0; i < files.size(); ++i)
        {
            if (!verdicts[i].accepted)
                continue;
            if (!kept_one)
            {
                kept_one = true;
                continue;
            }
            verdicts[i].reject(ValidationErrorKind::MULTIPLE_NOT_ALLOWED,
                               files[i].name() + " rejected, only one file may be submitted");
        }
    }

    // Aggregate size: the first file that overflows the budget and every
    // accepted file after it are rejected
    if (max_total_size)
    {
        uint64_t running_total = 0;
        bool overflowed = false;
        for (size_t i = 0; i < files.size(); ++i)
        {
            if (!verdicts[i].accepted)
                continue;
            if (!overflowed && files[i].size() <= *max_total_size - running_total)
            {
                running_total += files[i].size();
                continue;
            }
            overflowed = true;
            verdicts[i].reject(ValidationErrorKind::TOTAL_SIZE_EXCEEDED,
                               files[i].name() + " would exceed the total size limit of " +
                                   SizeConstraintParser::format(*max_total_size) + " (" +
                                   std::to_string(running_total) + " bytes already accepted)");
        }
    }

    ValidationResult result;
    for (size_t i = 0; i < files.size(); ++i)
    {
        if (verdicts[i].accepted)
        {
            result.accepted.push_back(files[i]);
        }
        else
        {
            result.rejected.push_back(files[i]);
            result.errors.push_back({files[i], verdicts[i].kind, std::move(verdicts[i].detail)});
        }
    }

    Logger::debug("Partitioned " + std::to_string(files.size()) + " files: " +
                  std::to_string(result.accepted.size()) + " accepted, " +
                  std::to_string(result.rejected.size()) + " rejected");
    return result;
}

ValidationResult ValidationEngine::partition(const std::vector<FileDescriptor> &files, const ValidationPolicy &policy)
{
    return partition(files, policy.accept, policy.size.min, policy.size.max, policy.size.max_total,
                     policy.allow_multiple);
}

std::string ValidationEngine::kindName(ValidationErrorKind kind)
{
    switch (kind)
    {
    case ValidationErrorKind::TYPE_REJECTED:
        return "TypeRejected";
    case ValidationErrorKind::SIZE_TOO_SMALL:
        return "SizeTooSmall";
    case ValidationErrorKind::SIZE_TOO_LARGE:
        return "SizeTooLarge";
    case ValidationErrorKind::TOTAL_SIZE_EXCEEDED:
        return "TotalSizeExceeded";
    case ValidationErrorKind::MULTIPLE_NOT_ALLOWED:
        return "MultipleNotAllowed";
    }
    return "Unknown";
}
