#pragma once

#include "types.hpp"
#include "errors.hpp"
#include "entry.hpp"
#include "guard.hpp"
#include "scope.hpp"
#include "configuration.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace resident {

// ============================================================================
// live_registry - Tracks the live objects of one persistence session
//
// Maps ids to live objects and to their current entries. The maps never own
// what they point at: objects are kept resident by the open scopes, entries
// by the registration records (or by whoever prefetched them). When an
// object dies its record is reaped, and the record's guard erases the
// object's id slot.
//
// Always owned by a std::shared_ptr (only create() can build one) so scopes
// can find their way back to it. Not thread-safe: one owner per instance.
// ============================================================================

class live_registry : public std::enable_shared_from_this<live_registry> {
    struct create_key {
        explicit create_key() = default;
    };

public:
    using object_slots = std::unordered_map<object_id_t, std::weak_ptr<void>>;
    using entry_slots = std::unordered_map<object_id_t, std::weak_ptr<entry>>;

    live_registry(create_key, configuration config);
    ~live_registry();

    live_registry(const live_registry&) = delete;
    live_registry& operator=(const live_registry&) = delete;

    static std::shared_ptr<live_registry> create(configuration config = {}) {
        return std::make_shared<live_registry>(create_key{}, std::move(config));
    }

    // ========================================================================
    // Leak policy
    // ========================================================================

    bool clear_leaks() const noexcept { return config_.clear_leaks; }
    void set_clear_leaks(bool clear) noexcept { config_.clear_leaks = clear; }

    void set_leak_tracker(leak_tracker_t tracker) { config_.tracker = std::move(tracker); }
    void clear_leak_tracker() { config_.tracker = std::monostate{}; }
    bool has_leak_tracker() const noexcept;

    // ========================================================================
    // Scopes
    // ========================================================================

    /// Open a scope nested in the current one and make it current.
    std::shared_ptr<scope> new_scope();

    /// The scope newly registered objects are pushed into (null if none).
    std::shared_ptr<scope> current_scope() const;

    size_t open_scope_count() const noexcept { return known_scopes_.size(); }

    /// If `s` is current, fall back to its nearest ancestor that is still open.
    void detach_scope(const scope& s);

    /// Detach `s`, release its objects, forget it. Runs check_leaks() when it
    /// was the last open scope.
    void remove_scope(scope& s);

    std::shared_ptr<transaction_scope> new_txn();
    std::shared_ptr<transaction_scope> txn_scope() const { return txn_ref_.lock(); }

    // ========================================================================
    // Registration
    // ========================================================================

    /// Entries are not objects: passing one throws invalid_argument_error.
    void register_object(const object_id_t& id, const object_arg& object,
                         const registration_options& options = {});

    void register_entry(const object_id_t& id, const entry_ptr& e);

    void register_object_and_entry(const object_id_t& id, const object_arg& object, const entry_ptr& e,
                                   const registration_options& options = {});

    /// Flat list of key/object pairs, where a key is an id or an entry:
    ///   insert({std::string("a"), object_ref(obj_a), entry_b, object_ref(obj_b)});
    void insert(const std::vector<insert_arg>& args);

    void insert_pairs(const std::vector<insert_pair>& pairs);

    /// Prefetch entries before their objects are inflated. Ids that already
    /// have a live object are skipped.
    void insert_entries(const std::vector<entry_ptr>& entries);

    /// Record that `object` is now stored as `e`. Silently ignored when no
    /// scope is open.
    void update_entry(const object_ref& object, const entry_ptr& e,
                      const registration_options& options = {});

    /// Called after a successful commit; marks every object as in storage.
    void update_entries(const std::vector<std::pair<object_ref, entry_ptr>>& pairs);

    /// Unwind entries, last first. An entry with a prev() rewinds its id to
    /// that version; one without is unregistered entirely.
    void rollback_entries(const std::vector<entry_ptr>& entries);

    void remove(const std::vector<id_or_object>& items);
    void remove(const object_ref& object);
    void remove(const object_id_t& id);

    // ========================================================================
    // Lookups (never throw; absent results are nullopt / null)
    // ========================================================================

    std::optional<object_id_t> object_to_id(const object_ref& object) const;
    std::vector<std::optional<object_id_t>> objects_to_ids(const std::vector<object_ref>& objects) const;

    entry_ptr object_to_entry(const object_ref& object) const;
    std::vector<entry_ptr> objects_to_entries(const std::vector<object_ref>& objects) const;

    object_ref id_to_object(const object_id_t& id) const;
    std::vector<object_ref> ids_to_objects(const std::vector<object_id_t>& ids) const;

    entry_ptr id_to_entry(const object_id_t& id) const;
    std::vector<entry_ptr> ids_to_entries(const std::vector<object_id_t>& ids) const;

    bool object_in_storage(const object_ref& object) const;

    std::optional<object_info> object_info_for(const object_ref& object) const;

    std::vector<object_id_t> live_ids() const;
    std::vector<object_ref> live_objects() const;
    std::vector<object_id_t> loaded_ids() const;
    std::vector<entry_ptr> live_entries() const;

    // ========================================================================
    // Maintenance
    // ========================================================================

    /// Report objects still live after the last scope closed. No-op while
    /// any scope is open.
    void check_leaks();

    /// Forget every object, entry and scope. Guards are dismissed first so
    /// later reclamation does not touch the emptied maps.
    void clear();

    /// Reap records and slots whose referent has died. Returns the number
    /// of records and entries reaped.
    size_t sweep();

    /// Diagnostic dump of the registry state
    nlohmann::json snapshot() const;

private:
    struct record {
        object_info info;
        slot_guard<object_slots> guard;
    };

    using record_table = std::map<std::weak_ptr<void>, record, std::owner_less<>>;
    using entry_guard_table = std::map<std::weak_ptr<entry>, slot_guard<entry_slots>, std::owner_less<>>;

    friend class scope;
    friend class transaction_scope;

    std::shared_ptr<scope> require_scope(const char* op) const;
    void check_object(const char* op, const object_id_t& id, const object_arg& object) const;
    void ensure_unregistered(const object_id_t& id, const object_ref& object);
    void add_object(scope& target, const object_id_t& id, const object_ref& object, const entry_ptr& e,
                    const registration_options& options);
    void install_entry(const object_id_t& id, const entry_ptr& e);

    void drop_object_slot(const object_id_t& id);
    void drop_entry_slot(const object_id_t& id);

    bool reap_object(const std::weak_ptr<void>& object);
    void reap_entry(const std::weak_ptr<entry>& e);
    void reap_slot(const object_id_t& id);

    void detach_txn(transaction_scope& t);
    void report_leaks(const std::vector<object_ref>& leaked);

    configuration config_;

    std::shared_ptr<object_slots> ids_ = std::make_shared<object_slots>();
    std::shared_ptr<entry_slots> entry_ids_ = std::make_shared<entry_slots>();
    record_table records_;
    entry_guard_table entry_guards_;

    // Open scopes, not owned. A scope removes itself before it is freed, so
    // the raw keys never dangle. The raw current/txn pointers are only ever
    // compared; access goes through the weak references.
    std::unordered_map<const scope*, std::weak_ptr<scope>> known_scopes_;
    scope* current_scope_ = nullptr;

    transaction_scope* txn_scope_ = nullptr;
    std::weak_ptr<transaction_scope> txn_ref_;
};

} // namespace resident
