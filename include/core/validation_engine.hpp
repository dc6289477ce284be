#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/file_descriptor.hpp"
#include "core/size_constraint_parser.hpp"

enum class ValidationErrorKind
{
    TYPE_REJECTED,
    SIZE_TOO_SMALL,
    SIZE_TOO_LARGE,
    TOTAL_SIZE_EXCEEDED,
    MULTIPLE_NOT_ALLOWED
};

/**
 * @brief Why a single file was rejected
 */
struct ValidationError
{
    FileDescriptor file;
    ValidationErrorKind kind;
    std::string detail;
};

/**
 * @brief Outcome of one intake event
 *
 * accepted and rejected are disjoint, together hold every input file, and
 * keep the input order. errors holds one entry per rejected file, in the
 * same order as rejected.
 */
struct ValidationResult
{
    std::vector<FileDescriptor> accepted;
    std::vector<FileDescriptor> rejected;
    std::vector<ValidationError> errors;
};

/**
 * @brief Explicit validation configuration, parsed ahead of time
 */
struct ValidationPolicy
{
    std::string accept;
    SizeConstraint size;
    bool allow_multiple = true;
};

/**
 * @brief Partitions a batch of candidate files into accepted and rejected sets
 *
 * Pure and synchronous: no I/O, no shared state, inputs are never modified.
 */
class ValidationEngine
{
public:
    /**
     * @brief Partition a batch of files
     * @param files Candidate files in submission order
     * @param accept_spec Accept specification (see AcceptPatternMatcher)
     * @param min_size Smallest accepted file size in bytes
     * @param max_size Largest accepted file size in bytes
     * @param max_total_size Largest accepted total size in bytes
     * @param allow_multiple When false only the first valid file is accepted
     * @return The partition with one error per rejected file
     */
    static ValidationResult partition(const std::vector<FileDescriptor> &files,
                                      const std::string &accept_spec,
                                      std::optional<uint64_t> min_size,
                                      std::optional<uint64_t> max_size,
                                      std::optional<uint64_t> max_total_size,
                                      bool allow_multiple);

    static ValidationResult partition(const std::vector<FileDescriptor> &files, const ValidationPolicy &policy);

    static std::string kindName(ValidationErrorKind kind);
};
