#include "output.hpp"

#include <algorithm>
#include <cctype>

std::string OutputNaming::sanitizeFilename(const std::string &name)
{
    std::string result;
    result.reserve(name.size());

    // Bytes are mapped one by one, so a multibyte character turns into several '_'
    for (char ch : name)
    {
        unsigned char uch = static_cast<unsigned char>(ch);
        if (std::isalnum(uch) || ch == '_' || ch == '-' || ch == '.')
        {
            result += ch;
        }
        else
        {
            result += '_';
        }
    }

    if (result.empty())
    {
        result = "video";
    }
    return result;
}

std::string OutputNaming::mediaFilename(const std::string &name)
{
    std::string filename = sanitizeFilename(name);

    std::string lower = filename;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    const std::string extension = ".mp4";
    if (lower.size() < extension.size() ||
        lower.compare(lower.size() - extension.size(), extension.size(), extension) != 0)
    {
        filename += extension;
    }
    return filename;
}

OutputDescriptor OutputNaming::makeDescriptor(const std::string &name, const std::filesystem::path &directory)
{
    OutputDescriptor descriptor;
    descriptor.directory = std::filesystem::absolute(directory).lexically_normal();
    descriptor.filename = mediaFilename(name);
    return descriptor;
}
