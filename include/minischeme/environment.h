#pragma once

#include "value.h"
#include <memory>
#include <string>
#include <unordered_map>

namespace minischeme {

/// Name-to-value mapping. A global environment has no parent; a call
/// environment is a child of the environment its closure captured.
class Environment : public std::enable_shared_from_this<Environment> {
public:
    static std::shared_ptr<Environment> createGlobal();
    std::shared_ptr<Environment> createChild();

    /// Lookup: walks the parent chain upward. Returns pointer if found, nullptr if not.
    const Value* lookup(const std::string& name) const;

    /// Define: always creates/overwrites in THIS environment.
    void define(const std::string& name, Value value);

    std::shared_ptr<Environment> parent() const { return parent_; }

private:
    explicit Environment(std::shared_ptr<Environment> parent);
    std::shared_ptr<Environment> parent_;
    std::unordered_map<std::string, Value> bindings_;
};

} // namespace minischeme
