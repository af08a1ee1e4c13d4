#include "Tokenizer.h"

#include <cstddef>
#include <string_view>
#include <vector>

namespace corpuscount {

size_t WhitespaceWidth(std::string_view s, size_t pos) {
    auto byteAt = [&](size_t i) -> unsigned char { return static_cast<unsigned char>(s[i]); };

    auto c = byteAt(pos);
    if (c == ' ' || (c >= 0x09 && c <= 0x0D)) {
        return 1;
    }

    size_t remaining = s.size() - pos;
    if (c == 0xC2 && remaining >= 2) {
        // U+0085 NEL, U+00A0 NBSP
        auto c1 = byteAt(pos + 1);
        return (c1 == 0x85 || c1 == 0xA0) ? 2 : 0;
    }
    if (remaining < 3) {
        return 0;
    }

    auto c1 = byteAt(pos + 1);
    auto c2 = byteAt(pos + 2);
    switch (c) {
    case 0xE1:
        // U+1680 OGHAM SPACE MARK
        return (c1 == 0x9A && c2 == 0x80) ? 3 : 0;
    case 0xE2:
        if (c1 == 0x80) {
            // U+2000..U+200A, U+2028, U+2029, U+202F
            if ((c2 >= 0x80 && c2 <= 0x8A) || c2 == 0xA8 || c2 == 0xA9 || c2 == 0xAF) {
                return 3;
            }
        } else if (c1 == 0x81 && c2 == 0x9F) {
            // U+205F
            return 3;
        }
        return 0;
    case 0xE3:
        // U+3000 IDEOGRAPHIC SPACE
        return (c1 == 0x80 && c2 == 0x80) ? 3 : 0;
    default:
        return 0;
    }
}

Tokenizer::Tokenizer(std::string_view input) : input_(input) {}

void Tokenizer::SkipWhitespace() {
    while (position_ < input_.size()) {
        auto width = WhitespaceWidth(input_, position_);
        if (width == 0) {
            break;
        }
        position_ += width;
    }
}

bool Tokenizer::Next(std::string_view& token) {
    SkipWhitespace();
    if (position_ >= input_.size()) {
        return false;
    }

    // Lead bytes of whitespace sequences are never UTF-8 continuation bytes, so
    // stepping one byte at a time cannot split a character.
    size_t start = position_;
    while (position_ < input_.size() && WhitespaceWidth(input_, position_) == 0) {
        ++position_;
    }

    token = input_.substr(start, position_ - start);
    return true;
}

std::vector<std::string_view> Tokenize(std::string_view input) {
    std::vector<std::string_view> tokens;
    Tokenizer tokenizer(input);
    std::string_view token;
    while (tokenizer.Next(token)) {
        tokens.push_back(token);
    }
    return tokens;
}

}  // namespace corpuscount
