#include "resident/entry.hpp"
#include "resident/log.hpp"

namespace resident {

using json = nlohmann::json;

entry_ptr entry::make_passthrough(object_id_t id, object_ref object, std::string class_name) {
    auto e = std::make_shared<entry>(std::move(id), nullptr, std::move(class_name));
    e->object_ = std::move(object);
    return e;
}

entry_ptr entry::revise(const entry_ptr& previous, nlohmann::json data) {
    auto next = std::make_shared<entry>(previous->id_, std::move(data), previous->class_name_);
    next->root_ = previous->root_;
    next->prev_ = previous;
    return next;
}

void entry::weaken_object() noexcept {
    if (!object_) return;
    weak_object_ = object_;
    object_.reset();
    weak_ = true;
}

size_t entry::depth() const noexcept {
    size_t n = 0;
    for (const entry* e = prev_.get(); e; e = e->prev_.get()) {
        ++n;
    }
    return n;
}

// ============================================================================
// JSON
// ============================================================================

std::string entry::to_json() const {
    json j;
    j["id"] = id_;
    j["class"] = class_name_;
    j["data"] = data_;
    j["root"] = root_;
    j["deleted"] = deleted_;
    j["prevDepth"] = depth();
    j["passthrough"] = has_object() || weak_;
    return j.dump();
}

std::optional<entry> entry::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        if (!j.is_object() || !j.contains("id") || !j["id"].is_string()) {
            return std::nullopt;
        }

        entry e(j["id"].get<std::string>());
        if (e.id_.empty()) {
            return std::nullopt;
        }

        if (j.contains("class") && j["class"].is_string()) {
            e.class_name_ = j["class"].get<std::string>();
        }
        if (j.contains("data")) {
            e.data_ = j["data"];
        }
        if (j.contains("root") && j["root"].is_boolean()) {
            e.root_ = j["root"].get<bool>();
        }
        if (j.contains("deleted") && j["deleted"].is_boolean()) {
            e.deleted_ = j["deleted"].get<bool>();
        }

        return e;
    } catch (const json::exception& ex) {
        LOG_DEBUG("entry", "from_json failed: %s", ex.what());
        return std::nullopt;
    }
}

} // namespace resident
