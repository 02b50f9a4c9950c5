#pragma once

#include "types.hpp"
#include <memory>
#include <utility>
#include <vector>

namespace resident {

class live_registry;

// ============================================================================
// scope_node - Shared lifetime-tree node for scope and transaction_scope
//
// Holds strong references to its items. The parent link and the registry
// back-reference are weak, so a node never keeps its ancestors or the
// registry alive.
// ============================================================================

template<typename Item, typename Self>
class scope_node {
public:
    using item_type = Item;

    scope_node(const scope_node&) = delete;
    scope_node& operator=(const scope_node&) = delete;

    std::shared_ptr<Self> parent() const { return parent_.lock(); }

    std::shared_ptr<live_registry> registry() const { return registry_.lock(); }

    void push(Item item) { items_.push_back(std::move(item)); }

    size_t size() const noexcept { return items_.size(); }
    bool empty() const noexcept { return items_.empty(); }

    /// Drop every held reference at once.
    void clear() { items_.clear(); }

protected:
    scope_node(std::weak_ptr<Self> parent, std::weak_ptr<live_registry> registry)
        : parent_(std::move(parent)), registry_(std::move(registry)) {}

    ~scope_node() = default;

    std::vector<Item> take() { return std::exchange(items_, {}); }

    std::weak_ptr<Self> parent_;
    std::weak_ptr<live_registry> registry_;
    std::vector<Item> items_;
};

// ============================================================================
// scope - Keeps registered objects resident while it is open
// ============================================================================

class scope : public scope_node<object_ref, scope> {
public:
    /// Runs the registry's remove_scope unless remove() already did.
    ~scope();

    const std::vector<object_ref>& objects() const noexcept { return items_; }

    /// Stop being the registry's current scope (objects stay alive).
    void detach();

    /// Close the scope: detach, release objects, leave the open set.
    void remove();

private:
    friend class live_registry;

    scope(std::weak_ptr<scope> parent, std::weak_ptr<live_registry> registry)
        : scope_node(std::move(parent), std::move(registry)) {}
};

// ============================================================================
// transaction_scope - Records entries written during a transaction
// ============================================================================

class transaction_scope : public scope_node<entry_ptr, transaction_scope> {
public:
    /// Discards the scope; pending entries go to the parent as on commit().
    ~transaction_scope();

    const std::vector<entry_ptr>& entries() const noexcept { return items_; }

    /// Unwind every recorded entry through live_registry::rollback_entries.
    void rollback();

    /// Hand the recorded entries to the enclosing transaction scope (so an
    /// outer rollback still unwinds them) and stop being the current one.
    void commit();

private:
    friend class live_registry;

    transaction_scope(std::weak_ptr<transaction_scope> parent, std::weak_ptr<live_registry> registry)
        : scope_node(std::move(parent), std::move(registry)) {}

    void hand_off_to_parent();
};

} // namespace resident
