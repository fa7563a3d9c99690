#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace minischeme {

class Environment;
class NativeFunction;
struct AstNode;

/// User-defined function: parameter names plus an unevaluated body.
struct Closure {
    std::vector<std::string> params;
    const AstNode* body = nullptr;              // raw pointer into AST
    std::shared_ptr<const AstNode> astRoot;     // keeps AST alive
    std::shared_ptr<Environment> capturedEnv;
    std::string name;                           // empty if anonymous
};

/// The universal value type.
class Value {
public:
    enum class Type : std::size_t {
        Unit = 0,
        Int,
        Float,
        String,
        Builtin,
        Closure
    };

    /// Default constructs unit.
    Value() : data_(std::monostate{}) {}

    // -- Static factories --
    static Value unit();
    static Value integer(int64_t i);
    static Value number(double d);
    static Value string(std::string s);
    static Value builtin(std::shared_ptr<NativeFunction> f);
    static Value closure(std::shared_ptr<minischeme::Closure> c);

    // -- Type queries --
    Type type() const { return static_cast<Type>(data_.index()); }
    bool isUnit() const { return type() == Type::Unit; }
    bool isInt() const { return type() == Type::Int; }
    bool isFloat() const { return type() == Type::Float; }
    bool isNumeric() const { return isInt() || isFloat(); }
    bool isString() const { return type() == Type::String; }
    bool isBuiltin() const { return type() == Type::Builtin; }
    bool isClosure() const { return type() == Type::Closure; }
    bool isCallable() const { return isBuiltin() || isClosure(); }

    // -- Accessors (throw TypeError on type mismatch) --
    int64_t asInt() const;
    double asFloat() const;
    double asNumber() const;  // works for int or float
    const std::string& asString() const;
    NativeFunction& asBuiltin() const;
    const minischeme::Closure& asClosure() const;

    // -- Equality --
    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

    // -- Display --
    std::string toString() const;
    std::string typeName() const;

private:
    using Variant = std::variant<
        std::monostate,                         // Unit
        int64_t,                                // Int
        double,                                 // Float
        std::shared_ptr<std::string>,           // String
        std::shared_ptr<NativeFunction>,        // Builtin
        std::shared_ptr<minischeme::Closure>    // Closure
    >;
    Variant data_;
};

} // namespace minischeme
