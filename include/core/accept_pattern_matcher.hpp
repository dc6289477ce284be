#pragma once

#include <string>
#include <vector>
#include "core/file_descriptor.hpp"

/**
 * @brief One token of an accept specification
 */
struct AcceptToken
{
    enum class Kind
    {
        EXTENSION,     // ".png"
        MIME_TYPE,     // "image/png"
        MIME_CATEGORY, // "image/*"
        MALFORMED      // anything else; never matches
    };

    Kind kind;
    std::string value; // lower-cased; the category name for MIME_CATEGORY
};

/**
 * @brief Parsed accept specification. An empty token set accepts every file.
 */
struct AcceptRule
{
    std::vector<AcceptToken> tokens;

    bool acceptsAll() const { return tokens.empty(); }
};

/**
 * @brief Matches files against a declarative accept specification
 *
 * The specification is a comma separated, case-insensitive list of
 * extensions (".png"), exact MIME types ("image/png") and MIME categories
 * ("image/*"). A file matches when any token matches.
 */
class AcceptPatternMatcher
{
public:
    /**
     * @brief Parse an accept specification into its tokens
     * @param accept_spec Comma separated token list; may be empty
     */
    static AcceptRule parse(const std::string &accept_spec);

    static bool matches(const FileDescriptor &file, const AcceptRule &rule);
    static bool matches(const FileDescriptor &file, const std::string &accept_spec);

private:
    static bool matchesToken(const FileDescriptor &file, const AcceptToken &token);
};
