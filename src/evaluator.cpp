#include "minischeme/evaluator.h"
#include "minischeme/ast.h"
#include "minischeme/builtins.h"
#include "minischeme/error.h"
#include "minischeme/native_function.h"
#include <spdlog/spdlog.h>
#include <iterator>

namespace minischeme {

namespace {

// Swaps in the AST root for the duration of a scope, restoring it on unwind
class AstRootGuard {
public:
    AstRootGuard(std::shared_ptr<const AstNode>& slot, std::shared_ptr<const AstNode> root)
        : slot_(slot), saved_(std::move(slot)) {
        slot_ = std::move(root);
    }
    ~AstRootGuard() { slot_ = std::move(saved_); }

    AstRootGuard(const AstRootGuard&) = delete;
    AstRootGuard& operator=(const AstRootGuard&) = delete;

private:
    std::shared_ptr<const AstNode>& slot_;
    std::shared_ptr<const AstNode> saved_;
};

} // namespace

// -- Main dispatch --

Value Evaluator::eval(std::shared_ptr<const AstNode> root, const std::shared_ptr<Environment>& env) {
    const AstNode& node = *root;
    AstRootGuard guard(currentAstRoot_, std::move(root));
    return eval(node, env);
}

Value Evaluator::eval(const AstNode& node, const std::shared_ptr<Environment>& env) {
    switch (node.kind) {
        case AstNodeKind::IntLit:         return Value::integer(node.intValue);
        case AstNodeKind::FloatLit:       return Value::number(node.floatValue);
        case AstNodeKind::StringLit:      return Value::string(node.stringValue);
        case AstNodeKind::Unit:           return Value::unit();
        case AstNodeKind::Name:           return evalName(node, env);
        case AstNodeKind::Builtin:        return evalBuiltin(node);
        case AstNodeKind::Application:    return evalApplication(node, env);
        case AstNodeKind::Sequence:       return evalSequence(node, env);
        case AstNodeKind::Define:         return evalDefine(node, env);
        case AstNodeKind::DefineFunction: return evalDefineFunction(node, env);
    }
    throw SyntaxError("Unknown AST node kind");
}

// -- Words --

Value Evaluator::evalName(const AstNode& node, const std::shared_ptr<Environment>& env) {
    const Value* v = env->lookup(node.stringValue);
    if (v) return *v;
    throw SyntaxError("Name " + node.stringValue + " is not defined!");
}

Value Evaluator::evalBuiltin(const AstNode& node) {
    const Value* fn = BuiltinRegistry::instance().find(node.stringValue);
    if (!fn) throw SyntaxError("Unknown builtin " + node.stringValue);
    return *fn;
}

Value Evaluator::evalApplication(const AstNode& node, const std::shared_ptr<Environment>& env) {
    std::vector<Value> results;
    results.reserve(node.children.size());
    for (auto& child : node.children) {
        results.push_back(eval(*child, env));
    }
    return combine(std::move(results), env);
}

Value Evaluator::evalSequence(const AstNode& node, const std::shared_ptr<Environment>& env) {
    Value last;
    for (auto& child : node.children) {
        last = eval(*child, env);
    }
    return last;
}

// -- define --

Value Evaluator::bind(const std::string& name, Value value, const std::shared_ptr<Environment>& env) {
    const Value* define = BuiltinRegistry::instance().find(kDefineSymbol);
    return callFunction(*define, {Value::string(name), std::move(value)}, env);
}

Value Evaluator::evalDefine(const AstNode& node, const std::shared_ptr<Environment>& env) {
    Value value = eval(*node.children[0], env);
    if (!node.binds) return value;
    return bind(node.stringValue, std::move(value), env);
}

Value Evaluator::evalDefineFunction(const AstNode& node, const std::shared_ptr<Environment>& env) {
    auto closure = std::make_shared<Closure>();
    closure->params = node.params;
    closure->body = node.children[0].get();
    closure->astRoot = currentAstRoot_;
    closure->capturedEnv = env;
    closure->name = node.stringValue;
    if (!node.binds) return Value::closure(std::move(closure));
    return bind(node.stringValue, Value::closure(std::move(closure)), env);
}

// -- Combination and calls --

Value Evaluator::combine(std::vector<Value> results, const std::shared_ptr<Environment>& env) {
    if (results.empty()) return Value::unit();
    if (results.size() == 1) return std::move(results[0]);

    if (results[0].isCallable()) {
        Value op = std::move(results[0]);
        std::vector<Value> args(std::make_move_iterator(results.begin() + 1),
                                std::make_move_iterator(results.end()));
        return callFunction(op, std::move(args), env);
    }
    // Not a call: a bare sequence yields its last value
    return std::move(results.back());
}

Value Evaluator::callFunction(const Value& callable, std::vector<Value> args,
                              const std::shared_ptr<Environment>& env) {
    if (callable.isClosure()) {
        return callClosure(callable.asClosure(), std::move(args), env);
    }
    if (callable.isBuiltin()) {
        return callable.asBuiltin().call(*env, args);
    }
    throw TypeError("Value is not callable: " + callable.typeName());
}

Value Evaluator::callClosure(const Closure& closure, std::vector<Value> args,
                             const std::shared_ptr<Environment>& callerEnv) {
    if (args.size() != closure.params.size()) {
        throw ArityError("Expected " + std::to_string(closure.params.size()) + " args, received " +
                         std::to_string(args.size()));
    }
    if (!closure.body) {
        throw SyntaxError("Function " + closure.name + " has no body");
    }

    // Captured environment if there is one, otherwise the caller's
    auto parent = closure.capturedEnv ? closure.capturedEnv : callerEnv;
    auto callEnv = parent->createChild();
    for (size_t i = 0; i < closure.params.size(); i++) {
        callEnv->define(closure.params[i], std::move(args[i]));
    }
    spdlog::trace("call {} with {} args", closure.name.empty() ? "<fn>" : closure.name,
                  closure.params.size());

    AstRootGuard guard(currentAstRoot_, closure.astRoot);
    return eval(*closure.body, callEnv);
}

} // namespace minischeme
