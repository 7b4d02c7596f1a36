// ============================================================
// name_registry.cpp
// ============================================================

#include "name_registry.hpp"

bool NameRegistry::try_reserve(const std::string& name,
                               const std::function<bool(const std::string&)>& blocked) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (names_.count(name)) return false;
    if (blocked && blocked(name)) return false;
    names_.insert(name);
    return true;
}

void NameRegistry::release(const std::string& name) {
    std::lock_guard<std::mutex> lk(mutex_);
    names_.erase(name);
}

bool NameRegistry::is_reserved(const std::string& name) {
    std::lock_guard<std::mutex> lk(mutex_);
    return names_.count(name) != 0;
}

size_t NameRegistry::size() {
    std::lock_guard<std::mutex> lk(mutex_);
    return names_.size();
}
