#pragma once

#include "value.h"
#include "error.h"
#include <memory>
#include <string>
#include <string_view>

namespace minischeme {

class Environment;

/// Outcome of a non-throwing evaluation.
struct EvalResult {
    bool success = true;
    Value value;
    std::string error;
    std::string errorKind;
};

/// Evaluate one expression in the given environment. Throws ScriptError
/// (SyntaxError, ArityError, TypeError) on failure.
Value evaluate(std::string_view expression, const std::shared_ptr<Environment>& env);

/// A session: one global environment that persists bindings across calls.
class Interpreter {
public:
    Interpreter();
    ~Interpreter();

    /// Throws on error.
    Value evaluate(std::string_view expression);

    /// Never throws a ScriptError; failures are reported in the result.
    EvalResult executeCommand(std::string_view expression);

    /// Call a closure or builtin from C++ in the global environment.
    Value callFunction(const Value& callable, std::vector<Value> args);

    std::shared_ptr<Environment> globalEnvironment();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace minischeme
