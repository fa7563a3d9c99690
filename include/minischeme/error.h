#pragma once

#include <stdexcept>
#include <string>

namespace minischeme {

/// Base of every evaluation error. Aborts the current evaluation.
class ScriptError : public std::runtime_error {
public:
    explicit ScriptError(const std::string& message)
        : std::runtime_error(message) {}

    virtual const char* kind() const { return "ScriptError"; }
};

/// Unbalanced parentheses, malformed define, invalid or unbound names,
/// unparsable literals.
class SyntaxError : public ScriptError {
public:
    using ScriptError::ScriptError;
    const char* kind() const override { return "SyntaxError"; }
};

/// A function invoked with an argument count it does not accept.
class ArityError : public ScriptError {
public:
    using ScriptError::ScriptError;
    const char* kind() const override { return "ArityError"; }
};

/// An operation applied to a value of the wrong type.
class TypeError : public ScriptError {
public:
    using ScriptError::ScriptError;
    const char* kind() const override { return "TypeError"; }
};

} // namespace minischeme
