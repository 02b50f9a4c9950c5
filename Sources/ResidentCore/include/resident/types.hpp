#pragma once

#include <cstdint>
#include <string>
#include <optional>
#include <vector>
#include <memory>
#include <type_traits>
#include <variant>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace resident {

class entry;

// Durable object identifier (produced upstream, opaque to the registry)
using object_id_t = std::string;

// Handle to a materialized domain object. Identity is the shared ownership
// group of the pointer, never the pointee's value.
using object_ref = std::shared_ptr<void>;

using entry_ptr = std::shared_ptr<entry>;

// ============================================================================
// object_arg - Object parameter of the registration entry points
//
// Built implicitly from any std::shared_ptr<T>. Keeps track of whether T was
// an entry, which is lost once the pointer has decayed to object_ref.
// ============================================================================

class object_arg {
public:
    object_arg() = default;
    object_arg(std::nullptr_t) {}

    template<typename T>
    object_arg(std::shared_ptr<T> object)
        : ref_(std::move(object)), is_entry_(std::is_base_of_v<entry, std::remove_cv_t<T>>) {}

    const object_ref& ref() const noexcept { return ref_; }
    bool is_entry() const noexcept { return is_entry_; }

    explicit operator bool() const noexcept { return ref_ != nullptr; }

private:
    object_ref ref_;
    bool is_entry_ = false;
};

// Argument forms accepted by the bulk registry entry points
using id_or_entry = std::variant<object_id_t, entry_ptr>;
using id_or_object = std::variant<object_id_t, object_ref>;
using insert_arg = std::variant<object_id_t, entry_ptr, object_ref>;
using insert_pair = std::pair<id_or_entry, object_arg>;

// ============================================================================
// Per-object registration record (public view)
// ============================================================================

struct object_info {
    object_id_t id;

    /// Entry the object was loaded from or last stored as (may be null)
    entry_ptr entry;

    /// True once the object is known to exist in the backend
    bool in_storage = false;

    /// Immortal objects are never reported as leaked
    bool immortal = false;

    /// Extension fields attached by higher layers
    nlohmann::json extra = nlohmann::json::object();
};

/// Optional fields merged into a registration record. Unset fields leave the
/// record untouched; keys in `extra` overwrite keys already present.
struct registration_options {
    std::optional<bool> in_storage;
    std::optional<bool> immortal;
    nlohmann::json extra = nlohmann::json::object();

    static registration_options stored() {
        registration_options opts;
        opts.in_storage = true;
        return opts;
    }

    static registration_options pinned() {
        registration_options opts;
        opts.immortal = true;
        return opts;
    }

    void apply_to(object_info& info) const {
        if (in_storage) info.in_storage = *in_storage;
        if (immortal) info.immortal = *immortal;
        if (extra.is_object()) {
            for (const auto& item : extra.items()) {
                info.extra[item.key()] = item.value();
            }
        }
    }
};

namespace detail {
    // Two handles name the same object iff they share an ownership group
    template<typename A, typename B>
    bool same_owner(const A& a, const B& b) noexcept {
        return !a.owner_before(b) && !b.owner_before(a);
    }
} // namespace detail

} // namespace resident
