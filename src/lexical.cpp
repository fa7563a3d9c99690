#include "minischeme/lexical.h"
#include "minischeme/builtins.h"
#include "minischeme/error.h"
#include <cctype>
#include <stdexcept>
#include <string>

namespace minischeme {

static bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

static bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool isNumericLiteral(std::string_view text) {
    if (text.empty() || text == ".") return false;
    int dots = 0;
    for (char c : text) {
        if (c == '.') {
            if (++dots > 1) return false;
        } else if (!isDigit(c)) {
            return false;
        }
    }
    return true;
}

bool isStringLiteral(std::string_view text) {
    if (text.size() < 2) return false;
    return text.front() == '"' && text.back() == '"';
}

bool isPrimitive(std::string_view text) {
    return isNumericLiteral(text) || isStringLiteral(text) || text.empty();
}

bool isValidVariableName(std::string_view name) {
    if (isBuiltinSymbol(name)) return false;
    for (char c : name) {
        if (!isWordChar(c)) return false;
    }
    return true;
}

Value evalNumericLiteral(std::string_view text) {
    if (!isNumericLiteral(text)) {
        throw SyntaxError("Invalid numeric literal: " + std::string(text));
    }
    std::string s(text);
    try {
        if (s.find('.') != std::string::npos) {
            return Value::number(std::stod(s));
        }
        return Value::integer(std::stoll(s));
    } catch (const std::out_of_range&) {
        throw SyntaxError("Numeric literal out of range: " + s);
    }
}

Value evalStringLiteral(std::string_view text) {
    if (!isStringLiteral(text)) {
        throw SyntaxError("Invalid string literal: " + std::string(text));
    }
    return Value::string(std::string(text.substr(1, text.size() - 2)));
}

Value evalPrimitive(std::string_view text) {
    if (text.empty()) return Value::unit();
    if (isNumericLiteral(text)) return evalNumericLiteral(text);
    if (isStringLiteral(text)) return evalStringLiteral(text);
    throw SyntaxError("Invalid primitive expression: " + std::string(text));
}

} // namespace minischeme
