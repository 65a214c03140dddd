#pragma once

#include <string>
#include <vector>

namespace codelang {

/**
 * Splits text into the lexical tokens the classifier is trained on.
 *
 * A single is a maximal run of ASCII letters, digits and underscores
 * (a word), or a maximal run of bytes that are neither word characters
 * nor whitespace (a symbol run). Whitespace only separates.
 *
 * The token stream is every single in text order followed by every
 * bigram of adjacent singles, joined with one space.
 */
class Tokenizer {
public:
    // Singles followed by pairs
    std::vector<std::string> tokenize(const std::string& text) const;

    // Word and symbol runs, left to right
    std::vector<std::string> singles(const std::string& text) const;

    // "a b" for every adjacent (a, b) in singles
    std::vector<std::string> pairs(const std::vector<std::string>& singles) const;

    static bool is_word_char(char c);
    static bool is_space_char(char c);
};

}  // namespace codelang
