#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace minischeme {

enum class AstNodeKind {
    IntLit,
    FloatLit,
    StringLit,
    Unit,
    Name,
    Builtin,
    Application,
    Sequence,
    Define,
    DefineFunction,
};

struct AstNode {
    AstNodeKind kind;

    int64_t intValue = 0;
    double floatValue = 0.0;
    std::string stringValue;    // literal text, identifier, builtin symbol or defined name

    std::vector<std::unique_ptr<AstNode>> children;
    std::vector<std::string> params;
    bool binds = true;          // Define/DefineFunction: false outside parentheses
};

// Factory functions
std::unique_ptr<AstNode> makeIntLit(int64_t val);
std::unique_ptr<AstNode> makeFloatLit(double val);
std::unique_ptr<AstNode> makeStringLit(std::string val);
std::unique_ptr<AstNode> makeUnit();
std::unique_ptr<AstNode> makeName(std::string name);
std::unique_ptr<AstNode> makeBuiltinRef(std::string symbol);
std::unique_ptr<AstNode> makeApplication(std::vector<std::unique_ptr<AstNode>> words);
std::unique_ptr<AstNode> makeSequence(std::vector<std::unique_ptr<AstNode>> words);

// Special forms
std::unique_ptr<AstNode> makeDefine(std::string name, std::unique_ptr<AstNode> value);
std::unique_ptr<AstNode> makeDefineFunction(std::string name, std::vector<std::string> params,
                                            std::unique_ptr<AstNode> body);

} // namespace minischeme
