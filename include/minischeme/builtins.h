#pragma once

#include "value.h"
#include <string>
#include <string_view>
#include <unordered_map>

namespace minischeme {

inline constexpr std::string_view kDefineSymbol = "define";

/// Static table of reserved symbols and their native operations.
/// Never stored in an Environment, so user code cannot shadow it.
class BuiltinRegistry {
public:
    static const BuiltinRegistry& instance();

    /// Returns nullptr for a non-reserved symbol.
    const Value* find(std::string_view symbol) const;
    bool isReserved(std::string_view symbol) const { return find(symbol) != nullptr; }

private:
    BuiltinRegistry();

    void registerFunction(std::string symbol, Value fn);
    friend void registerArithmeticBuiltins(BuiltinRegistry& registry);
    friend void registerDefineBuiltin(BuiltinRegistry& registry);

    std::unordered_map<std::string, Value> entries_;
};

/// `+ - *` over Int and Float, promoting to Float when any operand is Float.
void registerArithmeticBuiltins(BuiltinRegistry& registry);

/// `define`: binds (name, value) in the call-site environment and returns value.
void registerDefineBuiltin(BuiltinRegistry& registry);

bool isBuiltinSymbol(std::string_view symbol);

} // namespace minischeme
