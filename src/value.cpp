#include "minischeme/value.h"
#include "minischeme/native_function.h"
#include "minischeme/error.h"
#include <charconv>
#include <system_error>

namespace minischeme {

// -- Value static factories --

Value Value::unit() { return Value(); }

Value Value::integer(int64_t i) {
    Value v;
    v.data_ = i;
    return v;
}

Value Value::number(double d) {
    Value v;
    v.data_ = d;
    return v;
}

Value Value::string(std::string s) {
    Value v;
    v.data_ = std::make_shared<std::string>(std::move(s));
    return v;
}

Value Value::builtin(std::shared_ptr<NativeFunction> f) {
    Value v;
    v.data_ = std::move(f);
    return v;
}

Value Value::closure(std::shared_ptr<Closure> c) {
    Value v;
    v.data_ = std::move(c);
    return v;
}

// -- Accessors --

int64_t Value::asInt() const {
    if (auto* p = std::get_if<int64_t>(&data_)) return *p;
    throw TypeError("Value is not an int, got " + typeName());
}

double Value::asFloat() const {
    if (auto* p = std::get_if<double>(&data_)) return *p;
    throw TypeError("Value is not a float, got " + typeName());
}

double Value::asNumber() const {
    if (auto* p = std::get_if<int64_t>(&data_)) return static_cast<double>(*p);
    if (auto* p = std::get_if<double>(&data_)) return *p;
    throw TypeError("Value is not numeric, got " + typeName());
}

const std::string& Value::asString() const {
    if (auto* p = std::get_if<std::shared_ptr<std::string>>(&data_)) return **p;
    throw TypeError("Value is not a string, got " + typeName());
}

NativeFunction& Value::asBuiltin() const {
    if (auto* p = std::get_if<std::shared_ptr<NativeFunction>>(&data_)) return **p;
    throw TypeError("Value is not a builtin, got " + typeName());
}

const Closure& Value::asClosure() const {
    if (auto* p = std::get_if<std::shared_ptr<Closure>>(&data_)) return **p;
    throw TypeError("Value is not a closure, got " + typeName());
}

// -- Equality --

bool Value::operator==(const Value& other) const {
    if (type() != other.type()) return false;

    switch (type()) {
        case Type::Unit: return true;
        case Type::Int: return asInt() == other.asInt();
        case Type::Float: return asFloat() == other.asFloat();
        case Type::String: return asString() == other.asString();
        // Builtins and closures compared by identity
        case Type::Builtin:
            return std::get<std::shared_ptr<NativeFunction>>(data_).get() ==
                   std::get<std::shared_ptr<NativeFunction>>(other.data_).get();
        case Type::Closure:
            return std::get<std::shared_ptr<Closure>>(data_).get() ==
                   std::get<std::shared_ptr<Closure>>(other.data_).get();
    }
    return false;
}

// -- Display --

std::string Value::typeName() const {
    switch (type()) {
        case Type::Unit: return "unit";
        case Type::Int: return "int";
        case Type::Float: return "float";
        case Type::String: return "string";
        case Type::Builtin: return "builtin";
        case Type::Closure: return "function";
    }
    return "unknown";
}

std::string Value::toString() const {
    switch (type()) {
        case Type::Unit: return "";
        case Type::Int: return std::to_string(asInt());
        case Type::Float: {
            // Shortest text that reads back as the same double
            char buf[32];
            auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), asFloat());
            if (ec != std::errc()) {
                throw TypeError("Cannot display float");
            }
            std::string text(buf, end);
            // Keep floats distinguishable from ints: 5.0, not 5
            if (text.find_first_of(".eE") == std::string::npos &&
                text.find_first_of("ni") == std::string::npos) {
                text += ".0";
            }
            return text;
        }
        case Type::String: return asString();
        case Type::Builtin: return "<builtin:" + asBuiltin().symbol() + ">";
        case Type::Closure: {
            auto& c = asClosure();
            if (c.name.empty()) return "<fn>";
            return "<fn:" + c.name + ">";
        }
    }
    return "<unknown>";
}

} // namespace minischeme
