#include "processing/tokenizer.hpp"

#include "util/hash.hpp"

using namespace revdiff;

bool
revdiff::is_whitespace(char c) {
    const char whitespaces[] = " \t\r\n\f\v";
    for (const auto whitespace : whitespaces) {
        if (whitespace != '\0' && whitespace == c) {
            return true;
        }
    }
    return false;
}

bool
revdiff::is_word_char(char c) {
    const auto u = static_cast<unsigned char>(c);
    if (u >= 0x80) {
        return true;
    }
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

std::vector<Token>
revdiff::tokenize(std::string_view text) {
    std::vector<Token> result;

    const auto size = text.size();
    std::size_t seeker = 0;

    while (seeker < size) {
        const auto start_idx = seeker;
        const char c = text[start_idx];
        TokenKind kind = TokenKind::Word;

        if (is_whitespace(c)) {
            while (seeker < size && is_whitespace(text[seeker])) {
                seeker++;
            }
            kind = TokenKind::Whitespace;
        } else if (is_word_char(c)) {
            while (seeker < size && is_word_char(text[seeker])) {
                seeker++;
            }
            kind = TokenKind::Word;
        } else {
            seeker++;
            kind = TokenKind::Punctuation;
        }

        const auto length = seeker - start_idx;
        const auto hash = hash::hash(text.data() + start_idx, length);
        result.push_back({start_idx, length, hash, kind});
    }

    return result;
}
