#include "core/text_utils.hpp"
#include <algorithm>
#include <cctype>

namespace
{
    // Length of the UTF-8 sequence starting at text[pos], 1 for invalid lead bytes
    size_t sequenceLength(const std::string &text, size_t pos)
    {
        const auto lead = static_cast<unsigned char>(text[pos]);
        size_t length = 1;
        if ((lead & 0xE0) == 0xC0)
            length = 2;
        else if ((lead & 0xF0) == 0xE0)
            length = 3;
        else if ((lead & 0xF8) == 0xF0)
            length = 4;

        if (pos + length > text.size())
            return 1;
        for (size_t i = 1; i < length; ++i)
        {
            if ((static_cast<unsigned char>(text[pos + i]) & 0xC0) != 0x80)
                return 1;
        }
        return length;
    }
}

std::string TextUtils::toLower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string TextUtils::trim(const std::string &text)
{
    const auto first = text.find_first_not_of(" \t\r\n\f\v");
    if (first == std::string::npos)
        return "";
    const auto last = text.find_last_not_of(" \t\r\n\f\v");
    return text.substr(first, last - first + 1);
}

size_t TextUtils::codePointCount(const std::string &text)
{
    size_t count = 0;
    for (size_t pos = 0; pos < text.size(); pos += sequenceLength(text, pos))
        ++count;
    return count;
}

std::string TextUtils::truncateCodePoints(const std::string &text, size_t max_code_points)
{
    size_t pos = 0;
    size_t count = 0;
    while (pos < text.size() && count < max_code_points)
    {
        pos += sequenceLength(text, pos);
        ++count;
    }
    return text.substr(0, pos);
}

std::string TextUtils::truncateDisplayValue(const std::string &value, size_t max_chars)
{
    std::string display = value;
    std::replace(display.begin(), display.end(), '\n', ' ');
    display = trim(display);

    if (codePointCount(display) <= max_chars)
        return display;
    if (max_chars == 0)
        return "";
    return truncateCodePoints(display, max_chars - 1) + "\xE2\x80\xA6"; // U+2026
}

std::string TextUtils::stripNullBytes(const std::string &text)
{
    std::string cleaned = text;
    cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), '\0'), cleaned.end());
    return cleaned;
}
