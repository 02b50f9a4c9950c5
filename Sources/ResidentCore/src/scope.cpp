#include "resident/scope.hpp"
#include "resident/registry.hpp"
#include "resident/log.hpp"
#include <exception>

namespace resident {

// ============================================================================
// scope
// ============================================================================

scope::~scope() {
    if (auto registry = registry_.lock()) {
        try {
            registry->remove_scope(*this);
        } catch (const std::exception& e) {
            LOG_ERROR("scope", "teardown failed: %s", e.what());
        }
    }
}

void scope::detach() {
    if (auto registry = registry_.lock()) {
        registry->detach_scope(*this);
    }
}

void scope::remove() {
    auto registry = registry_.lock();
    if (!registry) {
        clear();
        return;
    }
    registry_.reset();
    registry->remove_scope(*this);
}

// ============================================================================
// transaction_scope
// ============================================================================

transaction_scope::~transaction_scope() {
    hand_off_to_parent();
    if (auto registry = registry_.lock()) {
        registry->detach_txn(*this);
    }
}

void transaction_scope::rollback() {
    std::vector<entry_ptr> pending = take();
    if (auto registry = registry_.lock()) {
        registry->rollback_entries(pending);
    } else {
        LOG_WARN("transaction_scope", "rollback of %zu entries after the registry was destroyed", pending.size());
    }
}

void transaction_scope::commit() {
    hand_off_to_parent();
    if (auto registry = registry_.lock()) {
        registry->detach_txn(*this);
    }
}

void transaction_scope::hand_off_to_parent() {
    std::vector<entry_ptr> pending = take();
    if (auto parent = parent_.lock()) {
        for (auto& e : pending) {
            parent->push(std::move(e));
        }
    }
}

} // namespace resident
