#pragma once

// ============================================================
// name_registry.hpp -- Destination names held by live sessions
//
// The only state shared between receiver sessions. A session
// reserves its file name before ACK and keeps it until its
// file is committed or discarded, so two sessions never write
// the same destination.
// ============================================================

#include "../common/platform.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <unordered_set>
#include <utility>

class NameRegistry {
public:
    NameRegistry() = default;

    NameRegistry(const NameRegistry&) = delete;
    NameRegistry& operator=(const NameRegistry&) = delete;

    // Atomically check-and-insert. 'blocked' runs inside the critical
    // section and can veto the name (e.g. the file already exists).
    // Returns false if the name is taken or vetoed.
    bool try_reserve(const std::string& name,
                     const std::function<bool(const std::string&)>& blocked = nullptr);

    void release(const std::string& name);

    bool is_reserved(const std::string& name);
    size_t size();

    // RAII handle for a reserved name
    class Guard {
    public:
        Guard(NameRegistry& registry, std::string name)
            : registry_(&registry), name_(std::move(name)) {}
        ~Guard() { if (registry_) registry_->release(name_); }

        Guard(Guard&& other) noexcept
            : registry_(other.registry_), name_(std::move(other.name_)) {
            other.registry_ = nullptr;
        }
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard& operator=(Guard&&) = delete;

        const std::string& name() const { return name_; }

    private:
        NameRegistry* registry_;
        std::string   name_;
    };

private:
    std::mutex                      mutex_;
    std::unordered_set<std::string> names_;
};
