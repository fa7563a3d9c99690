#include "minischeme/interpreter.h"
#include "minischeme/environment.h"
#include "minischeme/evaluator.h"
#include "minischeme/parser.h"
#include "minischeme/ast.h"
#include <spdlog/spdlog.h>

namespace minischeme {

Value evaluate(std::string_view expression, const std::shared_ptr<Environment>& env) {
    std::shared_ptr<const AstNode> root = Parser::parse(expression);
    Evaluator evaluator;
    return evaluator.eval(std::move(root), env);
}

struct Interpreter::Impl {
    std::shared_ptr<Environment> globalEnv = Environment::createGlobal();
};

Interpreter::Interpreter() : impl_(std::make_unique<Impl>()) {}

Interpreter::~Interpreter() = default;

Value Interpreter::evaluate(std::string_view expression) {
    return minischeme::evaluate(expression, impl_->globalEnv);
}

EvalResult Interpreter::executeCommand(std::string_view expression) {
    spdlog::debug("evaluating '{}'", expression);
    EvalResult result;
    try {
        result.value = evaluate(expression);
        result.success = true;
    } catch (const ScriptError& e) {
        spdlog::debug("{}: {}", e.kind(), e.what());
        result.success = false;
        result.error = e.what();
        result.errorKind = e.kind();
    }
    return result;
}

Value Interpreter::callFunction(const Value& callable, std::vector<Value> args) {
    Evaluator evaluator;
    return evaluator.callFunction(callable, std::move(args), impl_->globalEnv);
}

std::shared_ptr<Environment> Interpreter::globalEnvironment() {
    return impl_->globalEnv;
}

} // namespace minischeme
