#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace pulsesync {

// ============================================================================
// Dashboard domain objects
// ============================================================================
//
// Wire form is JSON with camelCase keys (ownerId, isDefault, updatedAt, ...).
// Timestamps are milliseconds since the epoch.

struct widget_position {
    int x = 0;
    int y = 0;
};

struct widget_size {
    int width = 1;
    int height = 1;
};

struct widget {
    std::string id;
    std::string type;
    std::string title;
    widget_position position;
    widget_size size;
    json config = json::object();
};

struct layout_config {
    int columns = 12;
    int rows = 8;
    int gap = 16;
    bool auto_arrange = false;
};

struct dashboard {
    std::string id;
    std::string name;
    std::optional<std::string> description;
    bool is_default = false;
    bool is_public = false;
    std::string owner_id;
    std::vector<widget> widgets;
    layout_config layout;
    std::vector<std::string> tags;
    millis_t created_at = 0;
    millis_t updated_at = 0;
    int64_t version = 0;
};

/// A dashboard before the server has assigned id, timestamps and version.
struct dashboard_draft {
    std::string name;
    std::optional<std::string> description;
    bool is_default = false;
    bool is_public = false;
    std::string owner_id;
    std::vector<widget> widgets;
    layout_config layout;
    std::vector<std::string> tags;
};

/// Partial update; only present fields are applied or sent.
struct dashboard_patch {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<bool> is_default;
    std::optional<bool> is_public;
    std::optional<std::vector<widget>> widgets;
    std::optional<layout_config> layout;
    std::optional<std::vector<std::string>> tags;

    bool empty() const {
        return !name && !description && !is_default && !is_public &&
               !widgets && !layout && !tags;
    }
};

void apply_patch(dashboard& target, const dashboard_patch& patch);

/// The mutable fields of a dashboard as a full patch (used to push local state).
dashboard_patch to_patch(const dashboard& source);

dashboard_draft to_draft(const dashboard& source);

/// Local stand-in for a dashboard that has not reached the server yet.
dashboard make_local_dashboard(const dashboard_draft& draft, std::string id, millis_t now);

void to_json(json& j, const widget& w);
void from_json(const json& j, widget& w);
void to_json(json& j, const layout_config& l);
void from_json(const json& j, layout_config& l);
void to_json(json& j, const dashboard& d);
void from_json(const json& j, dashboard& d);
void to_json(json& j, const dashboard_draft& d);
void from_json(const json& j, dashboard_draft& d);
void to_json(json& j, const dashboard_patch& p);
void from_json(const json& j, dashboard_patch& p);

} // namespace pulsesync

#endif // __cplusplus
