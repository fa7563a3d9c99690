#include "minischeme/environment.h"

namespace minischeme {

Environment::Environment(std::shared_ptr<Environment> parent) : parent_(std::move(parent)) {}

std::shared_ptr<Environment> Environment::createGlobal() {
    return std::shared_ptr<Environment>(new Environment(nullptr));
}

std::shared_ptr<Environment> Environment::createChild() {
    return std::shared_ptr<Environment>(new Environment(shared_from_this()));
}

const Value* Environment::lookup(const std::string& name) const {
    auto it = bindings_.find(name);
    if (it != bindings_.end()) return &it->second;
    if (parent_) return parent_->lookup(name);
    return nullptr;
}

void Environment::define(const std::string& name, Value value) {
    bindings_[name] = std::move(value);
}

} // namespace minischeme
