#pragma once

#include <string>

class TextUtils
{
public:
    static std::string toLower(std::string text);

    static std::string trim(const std::string &text);

    // Number of UTF-8 code points (invalid bytes count as one each)
    static size_t codePointCount(const std::string &text);

    // First max_code_points code points, never splitting a UTF-8 sequence
    static std::string truncateCodePoints(const std::string &text, size_t max_code_points);

    /**
     * @brief Display-safe metadata value
     *
     * Newlines become spaces, surrounding whitespace is trimmed and values
     * longer than max_chars keep max_chars - 1 characters plus an ellipsis.
     */
    static std::string truncateDisplayValue(const std::string &value, size_t max_chars = 100);

    static std::string stripNullBytes(const std::string &text);
};
