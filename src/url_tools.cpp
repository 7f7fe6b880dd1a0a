#include "url_tools.hpp"

#include <algorithm>
#include <cctype>

std::optional<UrlTools::Parts> UrlTools::split(const std::string &url)
{
    size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0)
    {
        return std::nullopt;
    }

    Parts parts;
    parts.scheme = url.substr(0, schemeEnd);

    // RFC 3986: scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
    if (!std::isalpha(static_cast<unsigned char>(parts.scheme.front())))
    {
        return std::nullopt;
    }
    for (char ch : parts.scheme)
    {
        if (!std::isalnum(static_cast<unsigned char>(ch)) && ch != '+' && ch != '-' && ch != '.')
        {
            return std::nullopt;
        }
    }
    std::transform(parts.scheme.begin(), parts.scheme.end(), parts.scheme.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    size_t hostStart = schemeEnd + 3;
    size_t hostEnd = url.find_first_of("/?#", hostStart);
    if (hostEnd == std::string::npos)
    {
        parts.host = url.substr(hostStart);
    }
    else
    {
        parts.host = url.substr(hostStart, hostEnd - hostStart);
        parts.path = url.substr(hostEnd);
    }

    return parts;
}

bool UrlTools::isValidUrl(const std::string &url)
{
    for (char ch : url)
    {
        unsigned char uch = static_cast<unsigned char>(ch);
        if (std::isspace(uch) || std::iscntrl(uch))
        {
            return false;
        }
    }

    auto parts = split(url);
    if (!parts)
    {
        return false;
    }

    return (parts->scheme == "http" || parts->scheme == "https") && !parts->host.empty();
}

std::string UrlTools::directoryOf(const std::string &url)
{
    auto parts = split(url);
    if (!parts)
    {
        // Not an absolute URL: plain string arithmetic
        size_t slash = url.rfind('/');
        return slash == std::string::npos ? url : url.substr(0, slash);
    }

    // Only the path part counts; a '/' inside the query must not move the base
    std::string path = parts->path.substr(0, parts->path.find_first_of("?#"));
    size_t slash = path.rfind('/');
    if (slash == std::string::npos)
    {
        return originOf(url);
    }

    return originOf(url) + path.substr(0, slash);
}

std::string UrlTools::originOf(const std::string &url)
{
    auto parts = split(url);
    if (!parts)
    {
        return "";
    }
    return parts->scheme + "://" + parts->host;
}

bool UrlTools::isAbsolute(const std::string &reference)
{
    auto parts = split(reference);
    return parts && (parts->scheme == "http" || parts->scheme == "https");
}

std::string UrlTools::resolve(const std::string &reference,
                              const std::string &directory,
                              const std::string &origin)
{
    if (isAbsolute(reference))
    {
        return reference;
    }

    if (!reference.empty() && reference.front() == '/')
    {
        // Protocol-relative ("//cdn.example.com/x.ts") keeps the origin's scheme
        if (reference.size() > 1 && reference[1] == '/')
        {
            auto parts = split(origin);
            return (parts ? parts->scheme : std::string("https")) + ":" + reference;
        }
        return origin + reference;
    }

    return directory + "/" + reference;
}
