#pragma once

#include "value.h"
#include <string_view>

namespace minischeme {

/// Digits with at most one '.', non-empty, and not a bare ".".
bool isNumericLiteral(std::string_view text);

/// At least two characters, first and last both '"'.
bool isStringLiteral(std::string_view text);

/// Numeric literal, string literal, or the empty string.
bool isPrimitive(std::string_view text);

/// Word characters only (letters, digits, '_') and not a reserved builtin symbol.
bool isValidVariableName(std::string_view name);

/// Float if the literal contains '.', otherwise Int. Throws SyntaxError when
/// the text is not a numeric literal or does not fit the target type.
Value evalNumericLiteral(std::string_view text);

/// Contents between the quotes, verbatim. Throws SyntaxError on a non-string literal.
Value evalStringLiteral(std::string_view text);

/// Unit for "", otherwise a numeric or string literal value.
Value evalPrimitive(std::string_view text);

} // namespace minischeme
