#include "minischeme/word_splitter.h"
#include "minischeme/error.h"

namespace minischeme {

namespace {

constexpr char kOpen = '(';
constexpr char kClose = ')';

bool isSkipChar(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool isDelimiter(char c) {
    return isSkipChar(c) || c == kOpen || c == kClose;
}

} // namespace

std::vector<std::string> splitWords(std::string_view expression) {
    if (expression.empty()) return {std::string()};

    std::vector<std::string> words;
    std::string word;
    int depth = 0;
    const size_t n = expression.size();

    for (size_t i = 0; i < n; i++) {
        char c = expression[i];

        if (depth == 0) {
            if (isSkipChar(c)) continue;
            if (c == kClose) {
                throw SyntaxError("Imbalanced parentheses");
            }
            word += c;
            if (c == kOpen) {
                depth = 1;
                continue;
            }
            // Atom: ends at the next delimiter or end of input
            if (i + 1 == n || isDelimiter(expression[i + 1])) {
                words.push_back(std::move(word));
                word.clear();
            }
            continue;
        }

        // Inside a group everything is kept verbatim
        word += c;
        if (c == kOpen) {
            depth++;
        } else if (c == kClose) {
            depth--;
            if (depth == 0) {
                if (i + 1 < n && !isSkipChar(expression[i + 1]) && expression[i + 1] != kClose) {
                    throw SyntaxError("Missing separator after " + word);
                }
                words.push_back(std::move(word));
                word.clear();
            }
        }
    }

    if (depth != 0) {
        throw SyntaxError("Imbalanced parentheses");
    }
    return words;
}

std::optional<size_t> findForward(std::string_view text, char target) {
    size_t pos = text.find(target);
    if (pos == std::string_view::npos) return std::nullopt;
    return pos;
}

std::optional<size_t> findBackward(std::string_view text, char target) {
    size_t pos = text.rfind(target);
    if (pos == std::string_view::npos) return std::nullopt;
    return pos;
}

std::string stripParens(std::string_view expression) {
    auto open = findForward(expression, kOpen);
    if (!open) throw SyntaxError("Expecting (");
    auto close = findBackward(expression, kClose);
    if (!close) throw SyntaxError("Expecting )");
    if (*close <= *open) return std::string();
    return std::string(expression.substr(*open + 1, *close - *open - 1));
}

bool isCompound(std::string_view expression) {
    return !expression.empty() && expression.front() == kOpen && expression.back() == kClose;
}

bool isPotentialCompound(std::string_view expression) {
    return findForward(expression, kOpen).has_value() &&
           findBackward(expression, kClose).has_value();
}

} // namespace minischeme
