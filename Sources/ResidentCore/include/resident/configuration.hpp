#pragma once

#include "types.hpp"
#include "log.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace resident {

// ============================================================================
// Leak reporting
// ============================================================================

/// Receives objects that are still live after the last scope closed.
/// Implementations may log them or break the reference cycles holding them.
class leak_tracker {
public:
    virtual ~leak_tracker() = default;
    virtual void leaked_objects(const std::vector<object_ref>& objects) = 0;
};

using leak_callback_t = std::function<void(const std::vector<object_ref>& objects)>;

/// Either nothing, a plain callback, or a tracker object
using leak_tracker_t = std::variant<std::monostate, leak_callback_t, std::shared_ptr<leak_tracker>>;

// ============================================================================
// Configuration for live_registry
// ============================================================================

struct configuration {
    /// When the last scope closes with objects still live, wipe the registry
    /// so stale objects are no longer returned by lookups. This does not
    /// free the leaked memory.
    bool clear_leaks = false;

    /// Invoked with the leaked objects (after clear_leaks has run)
    leak_tracker_t tracker;

    /// Applied to the global log level when the registry is constructed
    std::optional<log_level> verbosity;

    configuration() = default;

    explicit configuration(bool clear) : clear_leaks(clear) {}

    configuration(bool clear, leak_tracker_t t)
        : clear_leaks(clear), tracker(std::move(t)) {}

    /// Parse {"clear_leaks": bool, "log_level": "off|error|warn|info|debug"}.
    /// Unknown keys are ignored. Throws config_error on malformed input.
    static configuration from_json(const std::string& json);
};

/// "off", "error", "warn", "info", "debug"
std::optional<log_level> log_level_from_string(const std::string& name);
const char* to_string(log_level level);

} // namespace resident
