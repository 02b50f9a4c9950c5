#include "resident/registry.hpp"
#include "resident/log.hpp"
#include <algorithm>
#include <iterator>

namespace resident {

using json = nlohmann::json;

live_registry::live_registry(create_key, configuration config) : config_(std::move(config)) {
    if (config_.verbosity) {
        set_log_level(*config_.verbosity);
    }
    LOG_DEBUG("live_registry", "created (clear_leaks=%d)", config_.clear_leaks);
}

live_registry::~live_registry() {
    LOG_DEBUG("live_registry", "destroyed with %zu record(s), %zu open scope(s)",
              records_.size(), known_scopes_.size());
}

bool live_registry::has_leak_tracker() const noexcept {
    if (auto* cb = std::get_if<leak_callback_t>(&config_.tracker)) {
        return static_cast<bool>(*cb);
    }
    if (auto* tracker = std::get_if<std::shared_ptr<leak_tracker>>(&config_.tracker)) {
        return *tracker != nullptr;
    }
    return false;
}

// ============================================================================
// Scopes
// ============================================================================

std::shared_ptr<scope> live_registry::new_scope() {
    std::shared_ptr<scope> child(new scope(current_scope(), weak_from_this()));

    known_scopes_.emplace(child.get(), child);
    current_scope_ = child.get();

    LOG_DEBUG("live_registry", "opened scope %p (%zu open)", static_cast<void*>(child.get()), known_scopes_.size());
    return child;
}

std::shared_ptr<scope> live_registry::current_scope() const {
    if (!current_scope_) return nullptr;
    auto it = known_scopes_.find(current_scope_);
    return it == known_scopes_.end() ? nullptr : it->second.lock();
}

void live_registry::detach_scope(const scope& s) {
    if (current_scope_ != &s) return;

    auto parent = s.parent_.lock();
    while (parent && known_scopes_.find(parent.get()) == known_scopes_.end()) {
        parent = parent->parent_.lock();
    }
    current_scope_ = parent.get();
}

void live_registry::remove_scope(scope& s) {
    detach_scope(s);

    // Release the scope's references, then reap whatever died with them.
    std::vector<object_ref> released = s.take();
    std::vector<std::weak_ptr<void>> watched(released.begin(), released.end());
    released.clear();

    for (const auto& w : watched) {
        reap_object(w);
    }

    known_scopes_.erase(&s);
    LOG_DEBUG("live_registry", "removed scope %p (%zu released, %zu open)",
              static_cast<void*>(&s), watched.size(), known_scopes_.size());

    if (known_scopes_.empty()) {
        check_leaks();
    }
}

std::shared_ptr<transaction_scope> live_registry::new_txn() {
    std::shared_ptr<transaction_scope> child(new transaction_scope(txn_ref_, weak_from_this()));

    txn_scope_ = child.get();
    txn_ref_ = child;
    return child;
}

void live_registry::detach_txn(transaction_scope& t) {
    if (txn_scope_ != &t) return;

    auto parent = t.parent_.lock();
    txn_scope_ = parent.get();
    txn_ref_ = parent;
}

// ============================================================================
// Registration
// ============================================================================

std::shared_ptr<scope> live_registry::require_scope(const char* op) const {
    auto target = current_scope();
    if (!target) {
        LOG_ERROR("live_registry", "%s: no open live object scope", op);
        throw no_open_scope_error(std::string(op) + ": no open live object scope");
    }
    return target;
}

void live_registry::check_object(const char* op, const object_id_t& id, const object_arg& object) const {
    if (!object) {
        throw invalid_argument_error(std::string(op) + ": object for '" + id + "' is not a reference");
    }
    // Entries handed over as plain object_ref are recognised when the
    // registry already tracks them.
    if (object.is_entry() || entry_guards_.find(object.ref()) != entry_guards_.end()) {
        LOG_ERROR("live_registry", "%s: object for '%s' is an entry", op, id.c_str());
        throw invalid_argument_error(std::string(op) + ": object for '" + id + "' is an entry, not an object");
    }
}

void live_registry::ensure_unregistered(const object_id_t& id, const object_ref& object) {
    auto existing = records_.find(object);
    if (existing != records_.end()) {
        LOG_ERROR("live_registry", "object %p is already registered as '%s'",
                  object.get(), existing->second.info.id.c_str());
        throw already_registered_error("Object is already registered as '" + existing->second.info.id + "'");
    }

    reap_slot(id);
    if (ids_->find(id) != ids_->end()) {
        LOG_ERROR("live_registry", "id '%s' is already taken by another live object", id.c_str());
        throw already_registered_error("An object with the id '" + id + "' is already registered");
    }
}

void live_registry::add_object(scope& target, const object_id_t& id, const object_ref& object, const entry_ptr& e,
                               const registration_options& options) {
    (*ids_)[id] = object;
    target.push(object);

    record rec;
    rec.info.id = id;
    rec.info.entry = e;
    options.apply_to(rec.info);
    rec.guard = slot_guard<object_slots>(ids_, id);

    records_.emplace(object, std::move(rec));
}

void live_registry::register_object(const object_id_t& id, const object_arg& object,
                                    const registration_options& options) {
    auto target = require_scope("register_object");
    check_object("register_object", id, object);
    if (id.empty()) {
        throw invalid_argument_error("register_object: empty id");
    }

    ensure_unregistered(id, object.ref());
    add_object(*target, id, object.ref(), nullptr, options);
}

void live_registry::install_entry(const object_id_t& id, const entry_ptr& e) {
    auto slot = entry_ids_->find(id);
    if (slot != entry_ids_->end()) {
        auto old = entry_guards_.find(slot->second);
        if (old != entry_guards_.end()) {
            old->second.dismiss();
            entry_guards_.erase(old);
        }
        entry_ids_->erase(slot);
    }

    (*entry_ids_)[id] = e;
    entry_guards_.insert_or_assign(std::weak_ptr<entry>(e), slot_guard<entry_slots>(entry_ids_, id));
}

void live_registry::register_entry(const object_id_t& id, const entry_ptr& e) {
    require_scope("register_entry");
    if (!e) {
        throw invalid_argument_error("register_entry: null entry for '" + id + "'");
    }
    install_entry(id, e);
}

void live_registry::register_object_and_entry(const object_id_t& id, const object_arg& object, const entry_ptr& e,
                                              const registration_options& options) {
    auto target = require_scope("register_object_and_entry");
    check_object("register_object_and_entry", id, object);
    if (!e) {
        throw invalid_argument_error("register_object_and_entry: null entry for '" + id + "'");
    }
    if (detail::same_owner(object.ref(), e)) {
        throw invalid_argument_error("register_object_and_entry: object for '" + id + "' is its own entry");
    }

    ensure_unregistered(id, object.ref());
    install_entry(id, e);
    add_object(*target, id, object.ref(), e, options);

    // A pass-through entry wrapping this very object would otherwise keep it
    // alive forever (object -> record -> entry -> object).
    if (e->has_object() && detail::same_owner(e->object(), object.ref())) {
        e->weaken_object();
    }
}

void live_registry::insert(const std::vector<insert_arg>& args) {
    if (args.size() % 2 != 0) {
        throw invalid_argument_error("insert: arguments must be a list of pairs of ids/entries to objects");
    }

    std::vector<insert_pair> pairs;
    pairs.reserve(args.size() / 2);

    for (size_t i = 0; i < args.size(); i += 2) {
        const auto& key = args[i];
        const auto& value = args[i + 1];

        id_or_entry k;
        if (auto* id = std::get_if<object_id_t>(&key)) {
            k = *id;
        } else if (auto* e = std::get_if<entry_ptr>(&key)) {
            k = *e;
        } else {
            throw invalid_argument_error("insert: argument " + std::to_string(i) + " must be an id or an entry");
        }

        if (std::holds_alternative<entry_ptr>(value)) {
            throw invalid_argument_error("insert: argument " + std::to_string(i + 1) + " is an entry, not an object");
        }
        auto* object = std::get_if<object_ref>(&value);
        if (!object || !*object) {
            throw invalid_argument_error("insert: argument " + std::to_string(i + 1) + " is not a reference");
        }

        pairs.emplace_back(std::move(k), *object);
    }

    insert_pairs(pairs);
}

void live_registry::insert_pairs(const std::vector<insert_pair>& pairs) {
    require_scope("insert");

    for (const auto& [key, object] : pairs) {
        if (!object) {
            throw invalid_argument_error("insert: object is not a reference");
        }

        if (auto* e = std::get_if<entry_ptr>(&key)) {
            if (!*e) {
                throw invalid_argument_error("insert: null entry");
            }
            if ((*e)->id().empty()) {
                throw invalid_argument_error("insert: entry has no id");
            }
            register_object_and_entry((*e)->id(), object, *e, registration_options::stored());
        } else {
            const auto& id = std::get<object_id_t>(key);
            if (id.empty()) {
                throw invalid_argument_error("insert: empty id");
            }
            register_object(id, object);
        }
    }
}

void live_registry::insert_entries(const std::vector<entry_ptr>& entries) {
    require_scope("insert_entries");

    for (const auto& e : entries) {
        if (!e) {
            throw invalid_argument_error("insert_entries: non reference entry");
        }
    }

    for (const auto& e : entries) {
        auto slot = ids_->find(e->id());
        if (slot != ids_->end() && !slot->second.expired()) {
            continue;
        }
        install_entry(e->id(), e);
    }
}

void live_registry::update_entry(const object_ref& object, const entry_ptr& e,
                                 const registration_options& options) {
    // Storing outside of any scope is tolerated; nothing is tracked then.
    auto target = current_scope();
    if (!target) {
        LOG_DEBUG("live_registry", "update_entry(%s) without an open scope, ignored", e ? e->id().c_str() : "null");
        return;
    }
    if (!object || !e) {
        throw invalid_argument_error("update_entry: object and entry must both be set");
    }

    const object_id_t id = e->id();
    install_entry(id, e);

    reap_slot(id);
    bool owns_slot = false;
    if (ids_->find(id) == ids_->end()) {
        (*ids_)[id] = object;
        target->push(object);
        owns_slot = true;
    }

    auto rec = records_.find(object);
    if (rec == records_.end()) {
        record fresh;
        fresh.info.id = id;
        if (owns_slot) {
            fresh.guard = slot_guard<object_slots>(ids_, id);
        }
        rec = records_.emplace(object, std::move(fresh)).first;
    } else if (owns_slot && rec->second.info.id == id && !rec->second.guard.is_armed()) {
        rec->second.guard = slot_guard<object_slots>(ids_, id);
    }

    rec->second.info.entry = e;
    options.apply_to(rec->second.info);

    // Remember the entry so a rollback of the enclosing transaction can undo it
    if (auto txn = txn_ref_.lock()) {
        txn->push(e);
    }
}

void live_registry::update_entries(const std::vector<std::pair<object_ref, entry_ptr>>& pairs) {
    for (const auto& [object, e] : pairs) {
        update_entry(object, e, registration_options::stored());
    }
}

void live_registry::rollback_entries(const std::vector<entry_ptr>& entries) {
    for (const auto& e : entries) {
        if (!e) {
            throw invalid_argument_error("rollback_entries: null entry");
        }
    }

    // Newest first: a later write to the same id has to be undone before
    // the earlier one, or the earlier prev() would be overwritten again.
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        const auto& e = *it;
        const object_id_t id = e->id();

        if (const auto& prev = e->prev()) {
            install_entry(id, prev);

            if (auto object = id_to_object(id)) {
                auto rec = records_.find(object);
                if (rec != records_.end()) {
                    rec->second.info.entry = prev;
                }
            }
        } else {
            drop_entry_slot(id);
            drop_object_slot(id);
        }
    }

    LOG_DEBUG("live_registry", "rolled back %zu entries", entries.size());
}

// ============================================================================
// Removal
// ============================================================================

void live_registry::drop_object_slot(const object_id_t& id) {
    auto slot = ids_->find(id);
    if (slot == ids_->end()) return;

    std::weak_ptr<void> current = slot->second;
    auto rec = records_.find(current);
    if (rec != records_.end() && rec->second.info.id == id) {
        records_.erase(rec);
    }
    ids_->erase(id);
}

void live_registry::drop_entry_slot(const object_id_t& id) {
    auto slot = entry_ids_->find(id);
    if (slot == entry_ids_->end()) return;

    std::weak_ptr<entry> current = slot->second;
    auto guard = entry_guards_.find(current);
    if (guard != entry_guards_.end()) {
        entry_guards_.erase(guard);
    }
    entry_ids_->erase(id);
}

void live_registry::remove(const object_ref& object) {
    if (!object) return;

    auto rec = records_.find(object);
    if (rec == records_.end()) return;

    const object_id_t id = rec->second.info.id;
    records_.erase(rec);

    auto slot = ids_->find(id);
    if (slot != ids_->end() && (slot->second.expired() || detail::same_owner(slot->second, object))) {
        ids_->erase(slot);
    }
    drop_entry_slot(id);
}

void live_registry::remove(const object_id_t& id) {
    drop_object_slot(id);
    drop_entry_slot(id);
}

void live_registry::remove(const std::vector<id_or_object>& items) {
    for (const auto& item : items) {
        if (auto* object = std::get_if<object_ref>(&item)) {
            remove(*object);
        } else {
            remove(std::get<object_id_t>(item));
        }
    }
}

// ============================================================================
// Reaping
// ============================================================================

bool live_registry::reap_object(const std::weak_ptr<void>& object) {
    if (!object.expired()) return false;

    auto rec = records_.find(object);
    if (rec == records_.end()) return false;

    std::weak_ptr<entry> last_entry = rec->second.info.entry;
    records_.erase(rec);   // guard erases the id slot
    reap_entry(last_entry);
    return true;
}

void live_registry::reap_entry(const std::weak_ptr<entry>& e) {
    if (!e.expired()) return;

    auto guard = entry_guards_.find(e);
    if (guard != entry_guards_.end()) {
        entry_guards_.erase(guard);   // guard erases the id slot
    }
}

void live_registry::reap_slot(const object_id_t& id) {
    auto slot = ids_->find(id);
    if (slot == ids_->end() || !slot->second.expired()) return;

    std::weak_ptr<void> dead = slot->second;
    reap_object(dead);

    slot = ids_->find(id);
    if (slot != ids_->end() && slot->second.expired()) {
        ids_->erase(slot);
    }
}

size_t live_registry::sweep() {
    size_t reaped = 0;

    for (auto it = records_.begin(); it != records_.end();) {
        if (it->first.expired()) {
            it = records_.erase(it);
            ++reaped;
        } else {
            ++it;
        }
    }

    for (auto it = entry_guards_.begin(); it != entry_guards_.end();) {
        if (it->first.expired()) {
            it = entry_guards_.erase(it);
            ++reaped;
        } else {
            ++it;
        }
    }

    // Slots with no guard left behind (e.g. after a rollback rewired them)
    for (auto it = ids_->begin(); it != ids_->end();) {
        it = it->second.expired() ? ids_->erase(it) : std::next(it);
    }
    for (auto it = entry_ids_->begin(); it != entry_ids_->end();) {
        it = it->second.expired() ? entry_ids_->erase(it) : std::next(it);
    }

    if (reaped > 0) {
        LOG_DEBUG("live_registry", "sweep reaped %zu record(s)", reaped);
    }
    return reaped;
}

// ============================================================================
// Lookups
// ============================================================================

std::optional<object_id_t> live_registry::object_to_id(const object_ref& object) const {
    if (!object) return std::nullopt;
    auto rec = records_.find(object);
    if (rec == records_.end()) return std::nullopt;
    return rec->second.info.id;
}

std::vector<std::optional<object_id_t>> live_registry::objects_to_ids(const std::vector<object_ref>& objects) const {
    std::vector<std::optional<object_id_t>> result;
    result.reserve(objects.size());
    for (const auto& object : objects) {
        result.push_back(object_to_id(object));
    }
    return result;
}

entry_ptr live_registry::object_to_entry(const object_ref& object) const {
    if (!object) return nullptr;
    auto rec = records_.find(object);
    return rec == records_.end() ? nullptr : rec->second.info.entry;
}

std::vector<entry_ptr> live_registry::objects_to_entries(const std::vector<object_ref>& objects) const {
    std::vector<entry_ptr> result;
    result.reserve(objects.size());
    for (const auto& object : objects) {
        result.push_back(object_to_entry(object));
    }
    return result;
}

object_ref live_registry::id_to_object(const object_id_t& id) const {
    auto slot = ids_->find(id);
    return slot == ids_->end() ? nullptr : slot->second.lock();
}

std::vector<object_ref> live_registry::ids_to_objects(const std::vector<object_id_t>& ids) const {
    std::vector<object_ref> result;
    result.reserve(ids.size());
    for (const auto& id : ids) {
        result.push_back(id_to_object(id));
    }
    return result;
}

entry_ptr live_registry::id_to_entry(const object_id_t& id) const {
    auto slot = entry_ids_->find(id);
    return slot == entry_ids_->end() ? nullptr : slot->second.lock();
}

std::vector<entry_ptr> live_registry::ids_to_entries(const std::vector<object_id_t>& ids) const {
    std::vector<entry_ptr> result;
    result.reserve(ids.size());
    for (const auto& id : ids) {
        result.push_back(id_to_entry(id));
    }
    return result;
}

bool live_registry::object_in_storage(const object_ref& object) const {
    if (!object) return false;
    auto rec = records_.find(object);
    return rec != records_.end() && rec->second.info.in_storage;
}

std::optional<object_info> live_registry::object_info_for(const object_ref& object) const {
    if (!object) return std::nullopt;
    auto rec = records_.find(object);
    if (rec == records_.end()) return std::nullopt;
    return rec->second.info;
}

std::vector<object_id_t> live_registry::live_ids() const {
    std::vector<object_id_t> ids;
    for (const auto& [id, object] : *ids_) {
        if (!object.expired()) ids.push_back(id);
    }
    return ids;
}

std::vector<object_ref> live_registry::live_objects() const {
    std::vector<object_ref> objects;
    for (const auto& [id, weak] : *ids_) {
        if (auto object = weak.lock()) objects.push_back(std::move(object));
    }
    return objects;
}

std::vector<object_id_t> live_registry::loaded_ids() const {
    std::vector<object_id_t> ids;
    for (const auto& [id, e] : *entry_ids_) {
        if (!e.expired()) ids.push_back(id);
    }
    return ids;
}

std::vector<entry_ptr> live_registry::live_entries() const {
    std::vector<entry_ptr> entries;
    for (const auto& [id, weak] : *entry_ids_) {
        if (auto e = weak.lock()) entries.push_back(std::move(e));
    }
    return entries;
}

// ============================================================================
// Leaks and reset
// ============================================================================

void live_registry::check_leaks() {
    if (!known_scopes_.empty()) return;

    sweep();

    std::vector<object_ref> still_live = live_objects();
    if (still_live.empty()) return;

    // Immortal objects are expected to outlive every scope
    std::vector<object_ref> leaked;
    for (auto& object : still_live) {
        auto rec = records_.find(object);
        if (rec != records_.end() && rec->second.info.immortal) continue;
        leaked.push_back(object);
    }

    if (!leaked.empty()) {
        LOG_WARN("live_registry", "%zu object(s) still live after the last scope closed", leaked.size());
    }

    if (config_.clear_leaks) {
        clear();
    }

    if (!leaked.empty()) {
        report_leaks(leaked);
    }
}

void live_registry::report_leaks(const std::vector<object_ref>& leaked) {
    // Copy: the tracker may replace itself while running
    leak_tracker_t tracker = config_.tracker;

    if (auto* cb = std::get_if<leak_callback_t>(&tracker)) {
        if (*cb) (*cb)(leaked);
    } else if (auto* obj = std::get_if<std::shared_ptr<leak_tracker>>(&tracker)) {
        if (*obj) (*obj)->leaked_objects(leaked);
    }
}

void live_registry::clear() {
    for (auto& [key, rec] : records_) {
        rec.guard.dismiss();
    }
    for (auto& [key, guard] : entry_guards_) {
        guard.dismiss();
    }

    records_.clear();
    ids_->clear();
    entry_guards_.clear();
    entry_ids_->clear();

    current_scope_ = nullptr;
    known_scopes_.clear();

    LOG_DEBUG("live_registry", "cleared");
}

// ============================================================================
// Diagnostics
// ============================================================================

nlohmann::json live_registry::snapshot() const {
    json j;
    j["openScopes"] = known_scopes_.size();

    size_t txn_depth = 0;
    for (auto t = txn_ref_.lock(); t; t = t->parent()) {
        ++txn_depth;
    }
    j["txnDepth"] = txn_depth;
    j["clearLeaks"] = config_.clear_leaks;

    auto ids = live_ids();
    std::sort(ids.begin(), ids.end());

    json objects = json::array();
    for (const auto& id : ids) {
        json o;
        o["id"] = id;
        auto object = id_to_object(id);
        auto rec = object ? records_.find(object) : records_.end();
        if (rec != records_.end()) {
            o["inStorage"] = rec->second.info.in_storage;
            o["immortal"] = rec->second.info.immortal;
            o["hasEntry"] = rec->second.info.entry != nullptr;
            if (!rec->second.info.extra.empty()) {
                o["extra"] = rec->second.info.extra;
            }
        }
        objects.push_back(o);
    }
    j["objects"] = objects;

    auto entry_ids = loaded_ids();
    std::sort(entry_ids.begin(), entry_ids.end());
    j["entries"] = entry_ids;

    return j;
}

} // namespace resident
