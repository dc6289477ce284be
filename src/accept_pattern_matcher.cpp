#include "core/accept_pattern_matcher.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace
{
    std::string normalizeToken(const std::string &raw)
    {
        auto begin = std::find_if_not(raw.begin(), raw.end(),
                                      [](unsigned char c)
                                      { return std::isspace(c); });
        auto end = std::find_if_not(raw.rbegin(), raw.rend(),
                                    [](unsigned char c)
                                    { return std::isspace(c); })
                       .base();
        if (begin >= end)
        {
            return "";
        }

        std::string token(begin, end);
        std::transform(token.begin(), token.end(), token.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return token;
    }

    bool endsWith(const std::string &value, const std::string &suffix)
    {
        return value.size() >= suffix.size() &&
               value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
    }
}

AcceptRule AcceptPatternMatcher::parse(const std::string &accept_spec)
{
    AcceptRule rule;
    std::stringstream ss(accept_spec);
    std::string raw;
    while (std::getline(ss, raw, ','))
    {
        std::string token = normalizeToken(raw);
        if (token.empty())
        {
            continue;
        }

        if (token.size() > 1 && token[0] == '.')
        {
            rule.tokens.push_back({AcceptToken::Kind::EXTENSION, token});
            continue;
        }

        size_t slash_pos = token.find('/');
        bool well_formed = slash_pos != std::string::npos && slash_pos > 0 &&
                           slash_pos + 1 < token.size() &&
                           token.find('/', slash_pos + 1) == std::string::npos;
        if (!well_formed)
        {
            Logger::debug("Malformed accept token '" + token + "' will never match");
            rule.tokens.push_back({AcceptToken::Kind::MALFORMED, token});
        }
        else if (token.compare(slash_pos + 1, std::string::npos, "*") == 0)
        {
            rule.tokens.push_back({AcceptToken::Kind::MIME_CATEGORY, token.substr(0, slash_pos)});
        }
        else
        {
            rule.tokens.push_back({AcceptToken::Kind::MIME_TYPE, token});
        }
    }
    return rule;
}

bool AcceptPatternMatcher::matches(const FileDescriptor &file, const AcceptRule &rule)
{
    if (rule.acceptsAll())
    {
        return true;
    }
    return std::any_of(rule.tokens.begin(), rule.tokens.end(),
                       [&file](const AcceptToken &token)
                       { return matchesToken(file, token); });
}

bool AcceptPatternMatcher::matches(const FileDescriptor &file, const std::string &accept_spec)
{
    return matches(file, parse(accept_spec));
}

bool AcceptPatternMatcher::matchesToken(const FileDescriptor &file, const AcceptToken &token)
{
    switch (token.kind)
    {
    case AcceptToken::Kind::EXTENSION:
    {
        std::string name = normalizeToken(file.name());
        // Suffix comparison so multi-part extensions such as ".tar.gz" work
        return endsWith(name, token.value);
    }
    case AcceptToken::Kind::MIME_TYPE:
        return normalizeToken(file.type()) == token.value;
    case AcceptToken::Kind::MIME_CATEGORY:
        return token.value == "*" ? !file.type().empty() : file.category() == token.value;
    case AcceptToken::Kind::MALFORMED:
        return false;
    }
    return false;
}
