#include "Text.hpp"

#include <algorithm>
#include <cctype>

#include "Memory.hpp"

size_t Text::sequenceLength(unsigned char lead) {
    if (lead < 0x80)
        return 1;
    if ((lead >> 5) == 0x6)
        return 2;
    if ((lead >> 4) == 0xE)
        return 3;
    if ((lead >> 3) == 0x1E)
        return 4;
    // stray continuation byte, treat it as its own character
    return 1;
}

size_t Text::codepointCount(std::string_view str) {
    size_t count = 0;
    for (size_t i = 0; i < str.size(); i += sequenceLength(sc<unsigned char>(str[i]))) {
        count++;
    }
    return count;
}

size_t Text::byteOffset(std::string_view str, size_t idx) {
    size_t pos = 0;
    for (size_t i = 0; i < idx && pos < str.size(); ++i) {
        pos += sequenceLength(sc<unsigned char>(str[pos]));
    }
    return std::min(pos, str.size());
}

std::string Text::encode(char32_t cp) {
    std::string out;
    // surrogates aren't scalar values, same as anything past U+10FFFF
    if (cp >= 0xD800 && cp <= 0xDFFF)
        return out;

    if (cp < 0x80)
        out += sc<char>(cp);
    else if (cp < 0x800) {
        out += sc<char>(0xC0 | (cp >> 6));
        out += sc<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += sc<char>(0xE0 | (cp >> 12));
        out += sc<char>(0x80 | ((cp >> 6) & 0x3F));
        out += sc<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x110000) {
        out += sc<char>(0xF0 | (cp >> 18));
        out += sc<char>(0x80 | ((cp >> 12) & 0x3F));
        out += sc<char>(0x80 | ((cp >> 6) & 0x3F));
        out += sc<char>(0x80 | (cp & 0x3F));
    }
    return out;
}

std::string Text::lower(std::string_view str) {
    std::string out{str};
    std::ranges::transform(out, out.begin(), [](unsigned char c) { return sc<char>(std::tolower(c)); });
    return out;
}

bool Text::containsInsensitive(std::string_view haystack, std::string_view needle) {
    return lower(haystack).contains(lower(needle));
}

std::expected<std::vector<std::string>, std::string> Text::shellSplit(std::string_view str) {
    std::vector<std::string> words;
    std::string              current;
    bool                     inWord = false;

    for (size_t i = 0; i < str.size(); ++i) {
        const char C = str[i];

        if (C == ' ' || C == '\t' || C == '\n') {
            if (inWord)
                words.emplace_back(std::move(current));
            current.clear();
            inWord = false;
            continue;
        }

        inWord = true;

        if (C == '\\') {
            if (i + 1 >= str.size())
                return std::unexpected("dangling escape");
            current += str[++i];
            continue;
        }

        if (C == '\'') {
            const auto END = str.find('\'', i + 1);
            if (END == std::string_view::npos)
                return std::unexpected("unterminated single quote");
            current += str.substr(i + 1, END - i - 1);
            i = END;
            continue;
        }

        if (C == '"') {
            size_t j = i + 1;
            for (; j < str.size() && str[j] != '"'; ++j) {
                if (str[j] == '\\' && j + 1 < str.size() && std::string_view{"\"\\$`"}.contains(str[j + 1]))
                    j++;
                current += str[j];
            }
            if (j >= str.size())
                return std::unexpected("unterminated double quote");
            i = j;
            continue;
        }

        current += C;
    }

    if (inWord)
        words.emplace_back(std::move(current));

    return words;
}

std::string Text::shellQuote(std::string_view word) {
    if (!word.empty() && std::ranges::all_of(word, [](unsigned char c) { return std::isalnum(c) || std::string_view{"-_./=:,+@%"}.contains(c); }))
        return std::string{word};

    std::string out = "'";
    for (const char c : word) {
        if (c == '\'')
            out += "'\\''";
        else
            out += c;
    }
    out += "'";
    return out;
}

std::string Text::join(const std::vector<std::string>& parts, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0)
            out += sep;
        out += parts[i];
    }
    return out;
}
