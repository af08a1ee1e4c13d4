#ifndef COUNT_TOKENIZER_H
#define COUNT_TOKENIZER_H

#include <cstddef>
#include <string_view>
#include <vector>

namespace corpuscount {

/**
 * @brief Returns the byte length of the UTF-8 encoded whitespace character
 * starting at `pos`, or 0 if there is none. Recognizes the Unicode White_Space
 * set: ASCII \t \n \v \f \r and space, U+0085, U+00A0, U+1680, U+2000..U+200A,
 * U+2028, U+2029, U+202F, U+205F and U+3000.
 */
size_t WhitespaceWidth(std::string_view s, size_t pos);

/**
 * Splits text into whitespace-delimited tokens. Tokens are views into the input,
 * which must outlive the tokenizer. Never yields an empty token.
 */
class Tokenizer {
public:
    explicit Tokenizer(std::string_view input);

    /**
     * Stores the next token in `token` and returns true, or returns false once
     * the input is exhausted.
     */
    bool Next(std::string_view& token);

private:
    void SkipWhitespace();

    std::string_view input_;
    size_t position_ = 0;
};

std::vector<std::string_view> Tokenize(std::string_view input);

}  // namespace corpuscount

#endif  // COUNT_TOKENIZER_H
