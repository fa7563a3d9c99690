#pragma once

#include "value.h"
#include "environment.h"
#include <memory>
#include <vector>

namespace minischeme {

struct AstNode;

class Evaluator {
public:
    Evaluator() = default;

    Value eval(const AstNode& node, const std::shared_ptr<Environment>& env);

    /// Evaluate a tree rooted at a shared AST. Closures created during
    /// evaluation will hold a reference to this root, keeping the AST alive.
    Value eval(std::shared_ptr<const AstNode> root, const std::shared_ptr<Environment>& env);

    /// Reduce evaluated words to one value: a single word is returned as-is,
    /// a callable head is applied to the rest, otherwise the last word wins.
    Value combine(std::vector<Value> results, const std::shared_ptr<Environment>& env);

    /// Call a closure or builtin with the given arguments.
    Value callFunction(const Value& callable, std::vector<Value> args,
                       const std::shared_ptr<Environment>& env);

    /// Bind parameters in a child of the captured environment (or of
    /// `callerEnv` when nothing was captured) and evaluate the body.
    Value callClosure(const Closure& closure, std::vector<Value> args,
                      const std::shared_ptr<Environment>& callerEnv);

private:
    std::shared_ptr<const AstNode> currentAstRoot_;

    Value evalName(const AstNode& node, const std::shared_ptr<Environment>& env);
    Value evalBuiltin(const AstNode& node);
    Value evalApplication(const AstNode& node, const std::shared_ptr<Environment>& env);
    Value evalSequence(const AstNode& node, const std::shared_ptr<Environment>& env);
    Value evalDefine(const AstNode& node, const std::shared_ptr<Environment>& env);
    Value evalDefineFunction(const AstNode& node, const std::shared_ptr<Environment>& env);

    Value bind(const std::string& name, Value value, const std::shared_ptr<Environment>& env);
};

} // namespace minischeme
