#pragma once

#include "ast.h"
#include <memory>
#include <string_view>

namespace minischeme {

class Parser {
public:
    /// Parse one expression. A compound form becomes an Application (or a
    /// define form); anything else becomes a Sequence of its words.
    static std::unique_ptr<AstNode> parse(std::string_view source);

    /// Parse a single word produced by the word splitter.
    static std::unique_ptr<AstNode> parseWord(std::string_view word);
};

} // namespace minischeme
