#pragma once

#include "types.hpp"
#include <string>
#include <optional>
#include <memory>
#include <nlohmann/json.hpp>

namespace resident {

// ============================================================================
// entry - Serialized record counterpart of a live object
//
// Produced by the storage layer. Each mutation creates a new entry whose
// prev() is the version it replaced, so a transaction can be unwound by
// walking the chain backwards.
// ============================================================================

class entry {
public:
    entry() = default;

    explicit entry(object_id_t id, nlohmann::json data = nullptr, std::string class_name = {})
        : id_(std::move(id)), class_name_(std::move(class_name)), data_(std::move(data)) {}

    static entry_ptr make(object_id_t id, nlohmann::json data = nullptr, std::string class_name = {}) {
        return std::make_shared<entry>(std::move(id), std::move(data), std::move(class_name));
    }

    /// Entry whose payload is the live object itself (no independent backing value)
    static entry_ptr make_passthrough(object_id_t id, object_ref object, std::string class_name = {});

    /// New version of `previous` carrying `data`; same id, class and flags.
    static entry_ptr revise(const entry_ptr& previous, nlohmann::json data);

    const object_id_t& id() const noexcept { return id_; }
    const std::string& class_name() const noexcept { return class_name_; }

    const nlohmann::json& data() const noexcept { return data_; }
    void set_data(nlohmann::json data) { data_ = std::move(data); }

    const entry_ptr& prev() const noexcept { return prev_; }
    void set_prev(entry_ptr prev) { prev_ = std::move(prev); }

    bool root() const noexcept { return root_; }
    void set_root(bool root) noexcept { root_ = root; }

    bool deleted() const noexcept { return deleted_; }
    void set_deleted(bool deleted) noexcept { deleted_ = deleted; }

    // Pass-through payload

    bool has_object() const noexcept { return object_ != nullptr || !weak_object_.expired(); }

    object_ref object() const { return object_ ? object_ : weak_object_.lock(); }

    /// True after weaken_object(): the entry no longer keeps its payload alive
    bool object_is_weak() const noexcept { return object_ == nullptr && weak_; }

    /// Downgrade the payload reference to a non-owning one.
    void weaken_object() noexcept;

    /// Number of previous versions reachable through prev()
    size_t depth() const noexcept;

    // Serialize to JSON (payload object and prev chain are not serialized)
    std::string to_json() const;

    // Deserialize from JSON; nullopt on malformed input
    static std::optional<entry> from_json(const std::string& json);

private:
    object_id_t id_;
    std::string class_name_;
    nlohmann::json data_;
    entry_ptr prev_;
    bool root_ = false;
    bool deleted_ = false;

    object_ref object_;
    std::weak_ptr<void> weak_object_;
    bool weak_ = false;
};

} // namespace resident
