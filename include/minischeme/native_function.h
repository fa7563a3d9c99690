#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace minischeme {

class Value;
class Environment;

/// A builtin operation bound to a reserved symbol.
/// From the script's perspective it is called like any other function.
class NativeFunction {
public:
    explicit NativeFunction(std::string symbol) : symbol_(std::move(symbol)) {}
    virtual ~NativeFunction() = default;

    /// Invoke with evaluated arguments. `env` is the environment of the call site.
    virtual Value call(Environment& env, const std::vector<Value>& args) = 0;

    const std::string& symbol() const { return symbol_; }

private:
    std::string symbol_;
};

/// Convenience: wrap a std::function as a NativeFunction.
class SimpleNativeFunction : public NativeFunction {
public:
    using Func = std::function<Value(Environment&, const std::vector<Value>&)>;

    SimpleNativeFunction(std::string symbol, Func fn)
        : NativeFunction(std::move(symbol)), fn_(std::move(fn)) {}

    Value call(Environment& env, const std::vector<Value>& args) override {
        return fn_(env, args);
    }

private:
    Func fn_;
};

} // namespace minischeme
