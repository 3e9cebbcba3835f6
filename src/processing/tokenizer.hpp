#pragma once

/*
    Split a line of text into tokens for word level diffing.

    A token is one of:
      - a run of whitespace (spaces and tabs mixed),
      - a single punctuation character,
      - a run of word characters (letters, digits, '_' and any non-ASCII byte,
        so multi-byte UTF-8 sequences never get split).
*/

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace revdiff {

enum class TokenKind : std::uint8_t {
    Whitespace,
    Punctuation,
    Word,
};

struct Token {
    std::string::size_type start = 0;
    std::string::size_type length = 0;
    std::uint32_t hash = 0;
    TokenKind kind = TokenKind::Word;

    std::string_view
    str_from(std::string_view line) const {
        return line.substr(start, length);
    }
};

bool
is_whitespace(char c);

bool
is_word_char(char c);

std::vector<Token>
tokenize(std::string_view text);

}  // namespace revdiff
