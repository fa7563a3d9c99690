#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace minischeme {

/// Split an expression into its top-level words. Parenthesized groups are
/// kept whole, including their inner whitespace. Empty input yields a single
/// empty word. Throws SyntaxError on unbalanced parentheses or on a compound
/// group glued to the following text.
std::vector<std::string> splitWords(std::string_view expression);

/// Text strictly between the first '(' and the last ')'. Not depth-aware.
/// Throws SyntaxError if either paren is missing.
std::string stripParens(std::string_view expression);

/// Begins with '(' and ends with ')'.
bool isCompound(std::string_view expression);

/// Contains both a '(' and a ')' somewhere.
bool isPotentialCompound(std::string_view expression);

std::optional<size_t> findForward(std::string_view text, char target);
std::optional<size_t> findBackward(std::string_view text, char target);

} // namespace minischeme
