#pragma once

#include <cstddef>
#include <memory>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>

namespace trellis {

// ============================================================================
// Resource registry
//
// Holds at most one value per type, keyed by the value's exact type.
// Lookups re-assert the type and verify it before handing out a pointer,
// so a mismatched type can never be returned.
//
// Usage:
//   resource_registry resources;
//   resources.add(counter{3});
//   if (auto* c = resources.get<counter>()) { ++c->value; }
// ============================================================================

class resource_registry {
public:
    resource_registry() = default;

    // Non-copyable
    resource_registry(const resource_registry&) = delete;
    resource_registry& operator=(const resource_registry&) = delete;

    // Moveable
    resource_registry(resource_registry&&) noexcept = default;
    resource_registry& operator=(resource_registry&&) noexcept = default;

    /// Inserts a resource, replacing any existing resource of the same type.
    template<typename R>
    R& add(R&& res) {
        using U = std::decay_t<R>;
        auto holder = std::make_unique<resource_holder<U>>(std::forward<R>(res));
        U& ref = holder->value;
        resources_[std::type_index(typeid(U))] = std::move(holder);
        return ref;
    }

    /// Constructs a resource in place, replacing any existing resource of the same type.
    template<typename R, typename... Args>
    R& emplace(Args&&... args) {
        auto holder = std::make_unique<resource_holder<R>>(std::in_place, std::forward<Args>(args)...);
        R& ref = holder->value;
        resources_[std::type_index(typeid(R))] = std::move(holder);
        return ref;
    }

    /// Returns the resource of type R, or nullptr if none was added.
    template<typename R>
    R* get() {
        auto it = resources_.find(std::type_index(typeid(R)));
        if (it == resources_.end()) {
            return nullptr;
        }
        auto* holder = dynamic_cast<resource_holder<R>*>(it->second.get());
        return holder ? &holder->value : nullptr;
    }

    template<typename R>
    const R* get() const {
        auto it = resources_.find(std::type_index(typeid(R)));
        if (it == resources_.end()) {
            return nullptr;
        }
        auto* holder = dynamic_cast<const resource_holder<R>*>(it->second.get());
        return holder ? &holder->value : nullptr;
    }

    /// Returns the resource of type R, default-constructing it first if absent.
    template<typename R>
    R& get_or_add() {
        if (auto* existing = get<R>()) {
            return *existing;
        }
        return emplace<R>();
    }

    template<typename R>
    bool has() const {
        return resources_.count(std::type_index(typeid(R))) != 0;
    }

    /// Drops the resource of type R. Returns false if there was none.
    template<typename R>
    bool remove() {
        return resources_.erase(std::type_index(typeid(R))) != 0;
    }

    std::size_t size() const { return resources_.size(); }
    bool empty() const { return resources_.empty(); }

private:
    struct resource_holder_base {
        virtual ~resource_holder_base() = default;
    };

    template<typename R>
    struct resource_holder final : resource_holder_base {
        template<typename V>
        explicit resource_holder(V&& v) : value(std::forward<V>(v)) {}

        template<typename... Args>
        explicit resource_holder(std::in_place_t, Args&&... args) : value(std::forward<Args>(args)...) {}

        R value;
    };

    std::unordered_map<std::type_index, std::unique_ptr<resource_holder_base>> resources_;
};

} // namespace trellis
