#include "reference_parser.hpp"

#include <set>
#include <utility>
#include <stdexcept>

#include <fmt/core.h>

#include "url_tools.hpp"

namespace
{
    // curl options whose value is a header in disguise
    const std::map<std::string, std::string> HEADER_OPTIONS = {
        {"-A", "User-Agent"},
        {"--user-agent", "User-Agent"},
        {"-e", "Referer"},
        {"--referer", "Referer"},
        {"-b", "Cookie"},
        {"--cookie", "Cookie"},
    };

    // curl options that consume the following word
    const std::set<std::string> VALUE_OPTIONS = {
        "-X", "--request", "-d", "--data", "--data-raw", "--data-binary",
        "--data-ascii", "--data-urlencode", "-F", "--form", "--form-string",
        "-T", "--upload-file", "-K", "--config", "-o", "--output", "-u", "--user",
        "-x", "--proxy", "-m", "--max-time", "--connect-timeout", "-w", "--write-out",
        "-E", "--cert", "--key", "--cacert", "--capath", "--resolve", "--connect-to",
        "-r", "--range", "-c", "--cookie-jar", "--retry", "--limit-rate"};

    std::string trim(const std::string &text, const char *characters = " \t\r\n")
    {
        size_t first = text.find_first_not_of(characters);
        if (first == std::string::npos)
        {
            return "";
        }
        size_t last = text.find_last_not_of(characters);
        return text.substr(first, last - first + 1);
    }

    // Header words may still carry quotes when the capture double-quoted them
    std::string stripQuotes(const std::string &text)
    {
        return trim(trim(text), "'\"");
    }
}

PlaylistReference::PlaylistReference(std::string url, HeaderMap headers)
    : url_(std::move(url)), headers_(std::move(headers))
{
    if (!UrlTools::isValidUrl(url_))
    {
        throw std::invalid_argument(fmt::format("Not an http(s) playlist URL: '{}'", url_));
    }
}

bool ReferenceParser::tokenize(const std::string &text, std::vector<std::string> &tokens)
{
    enum class State
    {
        Whitespace,
        Word,
        SingleQuoted,
        DoubleQuoted
    };

    tokens.clear();
    State state = State::Whitespace;
    std::string current;

    for (size_t i = 0; i < text.size(); ++i)
    {
        char ch = text[i];

        switch (state)
        {
        case State::Whitespace:
        case State::Word:
            if (ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r')
            {
                if (state == State::Word)
                {
                    tokens.push_back(current);
                    current.clear();
                }
                state = State::Whitespace;
            }
            else if (ch == '\'')
            {
                state = State::SingleQuoted;
            }
            else if (ch == '"')
            {
                state = State::DoubleQuoted;
            }
            else if (ch == '\\')
            {
                if (i + 1 >= text.size())
                {
                    return false; // Nothing left to escape
                }
                ++i;
                if (text[i] == '\n')
                {
                    // Line continuation: acts as a separator
                    if (state == State::Word)
                    {
                        tokens.push_back(current);
                        current.clear();
                    }
                    state = State::Whitespace;
                    continue;
                }
                current += text[i];
                state = State::Word;
            }
            else
            {
                current += ch;
                state = State::Word;
            }
            break;

        case State::SingleQuoted:
            if (ch == '\'')
            {
                state = State::Word;
            }
            else
            {
                current += ch;
            }
            break;

        case State::DoubleQuoted:
            if (ch == '"')
            {
                state = State::Word;
            }
            else if (ch == '\\' && i + 1 < text.size() &&
                     (text[i + 1] == '"' || text[i + 1] == '\\' || text[i + 1] == '$' ||
                      text[i + 1] == '`' || text[i + 1] == '\n'))
            {
                ++i;
                if (text[i] != '\n')
                {
                    current += text[i];
                }
            }
            else
            {
                current += ch;
            }
            break;
        }
    }

    if (state == State::SingleQuoted || state == State::DoubleQuoted)
    {
        return false; // No closing quotation
    }

    if (state == State::Word)
    {
        tokens.push_back(current);
    }
    return true;
}

CapturedRequest ReferenceParser::parseCapturedRequest(const std::string &command)
{
    CapturedRequest result;

    std::vector<std::string> tokens;
    if (!tokenize(trim(command), tokens))
    {
        diagnostics_.error("Error parsing curl command: unbalanced quotes or trailing escape");
        return result;
    }

    size_t start = (!tokens.empty() && tokens.front() == "curl") ? 1 : 0;

    for (size_t i = start; i < tokens.size(); ++i)
    {
        const std::string &token = tokens[i];

        if (token == "-H" || token == "--header")
        {
            if (i + 1 >= tokens.size())
            {
                diagnostics_.debug("Ignoring {} without a value", token);
                break;
            }
            std::string header = stripQuotes(tokens[++i]);
            size_t colon = header.find(':');
            if (colon == std::string::npos)
            {
                diagnostics_.debug("Ignoring malformed header '{}'", header);
                continue;
            }
            std::string name = trim(header.substr(0, colon));
            if (name.empty())
            {
                continue;
            }
            result.headers[name] = trim(header.substr(colon + 1));
            continue;
        }

        auto headerOption = HEADER_OPTIONS.find(token);
        if (headerOption != HEADER_OPTIONS.end())
        {
            if (i + 1 < tokens.size())
            {
                result.headers[headerOption->second] = stripQuotes(tokens[++i]);
            }
            continue;
        }

        if (token == "--url")
        {
            if (i + 1 < tokens.size() && !result.url)
            {
                result.url = stripQuotes(tokens[i + 1]);
            }
            ++i;
            continue;
        }

        if (VALUE_OPTIONS.count(token) > 0)
        {
            ++i; // Skip the option's value
            continue;
        }

        if (!token.empty() && token.front() == '-')
        {
            continue; // Flag without value (--compressed, -k, ...)
        }

        if (!result.url)
        {
            result.url = token;
        }
    }

    return result;
}

std::optional<PlaylistReference> ReferenceParser::parseReference(const std::string &input, bool capturedMode)
{
    lastError_ = Failure{};

    std::string url;
    HeaderMap headers;

    if (capturedMode)
    {
        CapturedRequest captured = parseCapturedRequest(input);
        if (!captured.url)
        {
            lastError_ = {ErrorKind::InvalidReference, "Could not extract URL from curl command"};
            diagnostics_.error(lastError_.message);
            return std::nullopt;
        }
        url = derivePlaylistUrl(*captured.url);
        headers = std::move(captured.headers);
        diagnostics_.info("Using m3u8 URL: {}", url);
    }
    else
    {
        url = trim(input);
    }

    if (!UrlTools::isValidUrl(url))
    {
        lastError_ = {ErrorKind::InvalidReference,
                      fmt::format("Invalid playlist URL '{}': must be http(s) with a host", url)};
        diagnostics_.error(lastError_.message);
        return std::nullopt;
    }

    return PlaylistReference(url, std::move(headers));
}

std::string ReferenceParser::derivePlaylistUrl(const std::string &url)
{
    size_t marker = url.rfind("/seg-");
    if (marker == std::string::npos)
    {
        return url;
    }
    return url.substr(0, marker);
}
