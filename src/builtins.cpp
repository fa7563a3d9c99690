#include "minischeme/builtins.h"
#include "minischeme/native_function.h"
#include "minischeme/environment.h"
#include "minischeme/lexical.h"
#include "minischeme/error.h"
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace minischeme {

// ---- Helpers ----

static int64_t checkedInt(char op, int64_t left, int64_t right) {
    int64_t result = 0;
    bool overflow = false;
    switch (op) {
        case '+': overflow = __builtin_add_overflow(left, right, &result); break;
        case '-': overflow = __builtin_sub_overflow(left, right, &result); break;
        case '*': overflow = __builtin_mul_overflow(left, right, &result); break;
    }
    if (overflow) {
        throw TypeError(std::string("Integer overflow in '") + op + "'");
    }
    return result;
}

static Value applyArith(char op, const Value& left, const Value& right) {
    if (!left.isNumeric() || !right.isNumeric()) {
        throw TypeError(std::string("Cannot apply '") + op + "' to " + left.typeName() +
                        " and " + right.typeName());
    }
    bool useFloat = left.isFloat() || right.isFloat();
    switch (op) {
        case '+':
            if (useFloat) return Value::number(left.asNumber() + right.asNumber());
            return Value::integer(checkedInt('+', left.asInt(), right.asInt()));
        case '-':
            if (useFloat) return Value::number(left.asNumber() - right.asNumber());
            return Value::integer(checkedInt('-', left.asInt(), right.asInt()));
        case '*':
            if (useFloat) return Value::number(left.asNumber() * right.asNumber());
            return Value::integer(checkedInt('*', left.asInt(), right.asInt()));
    }
    throw TypeError(std::string("Unknown arithmetic operator '") + op + "'");
}

static Value sum(std::vector<Value>::const_iterator first, std::vector<Value>::const_iterator last) {
    Value total = Value::integer(0);
    for (auto it = first; it != last; ++it) {
        total = applyArith('+', total, *it);
    }
    return total;
}

// ---- Registry ----

BuiltinRegistry::BuiltinRegistry() {
    registerArithmeticBuiltins(*this);
    registerDefineBuiltin(*this);
}

const BuiltinRegistry& BuiltinRegistry::instance() {
    static const BuiltinRegistry registry;
    return registry;
}

const Value* BuiltinRegistry::find(std::string_view symbol) const {
    auto it = entries_.find(std::string(symbol));
    if (it == entries_.end()) return nullptr;
    return &it->second;
}

void BuiltinRegistry::registerFunction(std::string symbol, Value fn) {
    entries_[std::move(symbol)] = std::move(fn);
}

bool isBuiltinSymbol(std::string_view symbol) {
    return BuiltinRegistry::instance().isReserved(symbol);
}

// ---- Arithmetic builtins ----

void registerArithmeticBuiltins(BuiltinRegistry& registry) {
    registry.registerFunction("+", Value::builtin(std::make_shared<SimpleNativeFunction>(
        "+", [](Environment&, const std::vector<Value>& args) -> Value {
            return sum(args.begin(), args.end());
        })));

    // First argument minus the sum of the rest
    registry.registerFunction("-", Value::builtin(std::make_shared<SimpleNativeFunction>(
        "-", [](Environment&, const std::vector<Value>& args) -> Value {
            if (args.empty()) throw ArityError("'-' expects at least 1 argument, received 0");
            return applyArith('-', args[0], sum(args.begin() + 1, args.end()));
        })));

    registry.registerFunction("*", Value::builtin(std::make_shared<SimpleNativeFunction>(
        "*", [](Environment&, const std::vector<Value>& args) -> Value {
            Value product = Value::integer(1);
            for (auto& a : args) {
                product = applyArith('*', product, a);
            }
            return product;
        })));
}

// ---- define ----

void registerDefineBuiltin(BuiltinRegistry& registry) {
    registry.registerFunction(std::string(kDefineSymbol), Value::builtin(std::make_shared<SimpleNativeFunction>(
        std::string(kDefineSymbol), [](Environment& env, const std::vector<Value>& args) -> Value {
            if (args.size() != 2) {
                throw ArityError("Expected 2 args, received " + std::to_string(args.size()));
            }
            if (!args[0].isString()) {
                throw TypeError("define expects a name, got " + args[0].typeName());
            }
            const std::string& name = args[0].asString();
            if (name.empty() || !isValidVariableName(name)) {
                throw SyntaxError(name + " is not a valid variable name");
            }
            spdlog::trace("define {} = {}", name, args[1].toString());
            env.define(name, args[1]);
            return args[1];
        })));
}

} // namespace minischeme
