#include "minischeme/parser.h"
#include "minischeme/ast.h"
#include "minischeme/word_splitter.h"
#include "minischeme/lexical.h"
#include "minischeme/builtins.h"
#include "minischeme/error.h"
#include <string>
#include <vector>

namespace minischeme {

// -- AST factory functions --

std::unique_ptr<AstNode> makeIntLit(int64_t val) {
    auto n = std::make_unique<AstNode>();
    n->kind = AstNodeKind::IntLit;
    n->intValue = val;
    return n;
}

std::unique_ptr<AstNode> makeFloatLit(double val) {
    auto n = std::make_unique<AstNode>();
    n->kind = AstNodeKind::FloatLit;
    n->floatValue = val;
    return n;
}

std::unique_ptr<AstNode> makeStringLit(std::string val) {
    auto n = std::make_unique<AstNode>();
    n->kind = AstNodeKind::StringLit;
    n->stringValue = std::move(val);
    return n;
}

std::unique_ptr<AstNode> makeUnit() {
    auto n = std::make_unique<AstNode>();
    n->kind = AstNodeKind::Unit;
    return n;
}

std::unique_ptr<AstNode> makeName(std::string name) {
    auto n = std::make_unique<AstNode>();
    n->kind = AstNodeKind::Name;
    n->stringValue = std::move(name);
    return n;
}

std::unique_ptr<AstNode> makeBuiltinRef(std::string symbol) {
    auto n = std::make_unique<AstNode>();
    n->kind = AstNodeKind::Builtin;
    n->stringValue = std::move(symbol);
    return n;
}

std::unique_ptr<AstNode> makeApplication(std::vector<std::unique_ptr<AstNode>> words) {
    auto n = std::make_unique<AstNode>();
    n->kind = AstNodeKind::Application;
    n->children = std::move(words);
    return n;
}

std::unique_ptr<AstNode> makeSequence(std::vector<std::unique_ptr<AstNode>> words) {
    auto n = std::make_unique<AstNode>();
    n->kind = AstNodeKind::Sequence;
    n->children = std::move(words);
    return n;
}

std::unique_ptr<AstNode> makeDefine(std::string name, std::unique_ptr<AstNode> value) {
    auto n = std::make_unique<AstNode>();
    n->kind = AstNodeKind::Define;
    n->stringValue = std::move(name);
    n->children.push_back(std::move(value));
    return n;
}

std::unique_ptr<AstNode> makeDefineFunction(std::string name, std::vector<std::string> params,
                                            std::unique_ptr<AstNode> body) {
    auto n = std::make_unique<AstNode>();
    n->kind = AstNodeKind::DefineFunction;
    n->stringValue = std::move(name);
    n->params = std::move(params);
    n->children.push_back(std::move(body));
    return n;
}

// -- Parsing --

namespace {

std::unique_ptr<AstNode> parseCompound(std::string_view text);

void checkName(const std::string& name) {
    if (name.empty()) {
        throw SyntaxError("The 'define' keyword requires a name");
    }
    if (!isValidVariableName(name)) {
        throw SyntaxError(name + " is not a valid variable name");
    }
}

// (define name value) or (define (name params...) body)
std::unique_ptr<AstNode> parseDefine(const std::vector<std::string>& words) {
    if (words.size() != 3) {
        throw SyntaxError("The 'define' keyword takes two args");
    }
    const std::string& target = words[1];

    if (isCompound(target)) {
        auto pattern = splitWords(stripParens(target));
        if (pattern.empty()) {
            throw SyntaxError("The 'define' keyword requires a name");
        }
        std::string name = pattern[0];
        checkName(name);
        std::vector<std::string> params(pattern.begin() + 1, pattern.end());
        for (auto& p : params) checkName(p);
        // Body stays unevaluated until the closure is called
        return makeDefineFunction(std::move(name), std::move(params), Parser::parseWord(words[2]));
    }

    checkName(target);
    return makeDefine(target, Parser::parseWord(words[2]));
}

std::unique_ptr<AstNode> parseWords(const std::vector<std::string>& words, bool application) {
    if (!words.empty() && words[0] == kDefineSymbol) {
        auto node = parseDefine(words);
        // Outside parentheses the form yields its value but binds nothing
        node->binds = application;
        return node;
    }

    std::vector<std::unique_ptr<AstNode>> children;
    children.reserve(words.size());
    for (auto& w : words) {
        children.push_back(Parser::parseWord(w));
    }

    if (application) return makeApplication(std::move(children));
    if (children.size() == 1) return std::move(children[0]);
    return makeSequence(std::move(children));
}

std::unique_ptr<AstNode> parseCompound(std::string_view text) {
    return parseWords(splitWords(stripParens(text)), true);
}

} // namespace

std::unique_ptr<AstNode> Parser::parse(std::string_view source) {
    // Outer parentheses are stripped textually: "(a) (b)" becomes "a) (b"
    if (isCompound(source)) {
        return parseCompound(source);
    }
    return parseWords(splitWords(source), false);
}

std::unique_ptr<AstNode> Parser::parseWord(std::string_view word) {
    if (word.empty()) return makeUnit();
    if (isCompound(word)) return parseCompound(word);

    if (isNumericLiteral(word)) {
        Value v = evalNumericLiteral(word);
        if (v.isFloat()) return makeFloatLit(v.asFloat());
        return makeIntLit(v.asInt());
    }
    if (isStringLiteral(word)) {
        return makeStringLit(evalStringLiteral(word).asString());
    }
    if (isBuiltinSymbol(word)) {
        return makeBuiltinRef(std::string(word));
    }
    return makeName(std::string(word));
}

} // namespace minischeme
