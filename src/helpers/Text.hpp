#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace Text {
    // number of unicode scalar values in a utf-8 string
    size_t                                            codepointCount(std::string_view str);

    // byte offset of the codepoint at `idx`, or str.size() past the end
    size_t                                            byteOffset(std::string_view str, size_t idx);

    // byte length of the utf-8 sequence starting with `lead`
    size_t                                            sequenceLength(unsigned char lead);

    // encode a scalar value as utf-8, empty for surrogates and anything past U+10FFFF
    std::string                                       encode(char32_t cp);

    std::string                                       lower(std::string_view str);
    bool                                              containsInsensitive(std::string_view haystack, std::string_view needle);

    // split a command line with posix shell quoting rules (no expansion)
    std::expected<std::vector<std::string>, std::string> shellSplit(std::string_view str);

    // quote a word so that a posix shell reads it back verbatim
    std::string                                       shellQuote(std::string_view word);

    std::string                                       join(const std::vector<std::string>& parts, std::string_view sep);
}
