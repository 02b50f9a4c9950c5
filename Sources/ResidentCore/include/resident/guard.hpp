#pragma once

#include <memory>
#include <utility>

namespace resident {

// ============================================================================
// slot_guard - Erases one key from a map when destroyed (move-only)
//
// The guard refers to its map weakly: if the map is gone by the time the
// guard is destroyed, nothing happens. dismiss() disarms it for good.
// ============================================================================

template<typename Map>
class slot_guard {
public:
    using map_type = Map;
    using key_type = typename Map::key_type;

    slot_guard() = default;

    slot_guard(std::weak_ptr<Map> target, key_type key)
        : target_(std::move(target)), key_(std::move(key)), armed_(true) {}

    ~slot_guard() {
        release();
    }

    slot_guard(const slot_guard&) = delete;
    slot_guard& operator=(const slot_guard&) = delete;

    slot_guard(slot_guard&& other) noexcept
        : target_(std::move(other.target_)), key_(std::move(other.key_)), armed_(other.armed_) {
        other.armed_ = false;
    }

    slot_guard& operator=(slot_guard&& other) noexcept {
        if (this != &other) {
            release();
            target_ = std::move(other.target_);
            key_ = std::move(other.key_);
            armed_ = other.armed_;
            other.armed_ = false;
        }
        return *this;
    }

    /// Cancel the cleanup. Safe to call any number of times.
    void dismiss() noexcept { armed_ = false; }

    [[nodiscard]] bool is_armed() const noexcept { return armed_; }

    [[nodiscard]] const key_type& key() const noexcept { return key_; }

private:
    void release() noexcept {
        if (!armed_) return;
        armed_ = false;
        if (auto map = target_.lock()) {
            map->erase(key_);
        }
    }

    std::weak_ptr<Map> target_;
    key_type key_{};
    bool armed_ = false;
};

} // namespace resident
