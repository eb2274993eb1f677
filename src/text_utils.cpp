#include "text_utils.hpp"

#include <algorithm>
#include <cctype>

std::string trim(const std::string &text)
{
    size_t first = 0;
    size_t last = text.size();
    while (first < last && std::isspace(static_cast<unsigned char>(text[first])))
    {
        ++first;
    }
    while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1])))
    {
        --last;
    }
    return text.substr(first, last - first);
}

std::string toLower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool endsWithIgnoreCase(const std::string &text, const std::string &suffix)
{
    if (suffix.size() > text.size())
    {
        return false;
    }
    return toLower(text.substr(text.size() - suffix.size())) == toLower(suffix);
}
