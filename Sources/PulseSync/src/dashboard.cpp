#include "pulsesync/dashboard.hpp"

namespace pulsesync {

namespace {

millis_t timestamp_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return 0;
    return it->get<millis_t>();
}

std::optional<std::string> optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<std::string>();
}

} // anonymous namespace

void apply_patch(dashboard& target, const dashboard_patch& patch) {
    if (patch.name) target.name = *patch.name;
    if (patch.description) target.description = *patch.description;
    if (patch.is_default) target.is_default = *patch.is_default;
    if (patch.is_public) target.is_public = *patch.is_public;
    if (patch.widgets) target.widgets = *patch.widgets;
    if (patch.layout) target.layout = *patch.layout;
    if (patch.tags) target.tags = *patch.tags;
}

dashboard_patch to_patch(const dashboard& source) {
    dashboard_patch patch;
    patch.name = source.name;
    patch.description = source.description;
    patch.is_default = source.is_default;
    patch.is_public = source.is_public;
    patch.widgets = source.widgets;
    patch.layout = source.layout;
    patch.tags = source.tags;
    return patch;
}

dashboard_draft to_draft(const dashboard& source) {
    dashboard_draft draft;
    draft.name = source.name;
    draft.description = source.description;
    draft.is_default = source.is_default;
    draft.is_public = source.is_public;
    draft.owner_id = source.owner_id;
    draft.widgets = source.widgets;
    draft.layout = source.layout;
    draft.tags = source.tags;
    return draft;
}

dashboard make_local_dashboard(const dashboard_draft& draft, std::string id, millis_t now) {
    dashboard d;
    d.id = std::move(id);
    d.name = draft.name;
    d.description = draft.description;
    d.is_default = draft.is_default;
    d.is_public = draft.is_public;
    d.owner_id = draft.owner_id;
    d.widgets = draft.widgets;
    d.layout = draft.layout;
    d.tags = draft.tags;
    d.created_at = now;
    d.updated_at = now;
    d.version = now;
    return d;
}

// ============================================================================
// JSON
// ============================================================================

void to_json(json& j, const widget& w) {
    j = json{
        {"id", w.id},
        {"type", w.type},
        {"title", w.title},
        {"position", {{"x", w.position.x}, {"y", w.position.y}}},
        {"size", {{"width", w.size.width}, {"height", w.size.height}}},
        {"config", w.config}
    };
}

void from_json(const json& j, widget& w) {
    w.id = j.at("id").get<std::string>();
    w.type = j.value("type", std::string());
    w.title = j.value("title", std::string());
    if (auto it = j.find("position"); it != j.end() && it->is_object()) {
        w.position.x = it->value("x", 0);
        w.position.y = it->value("y", 0);
    }
    if (auto it = j.find("size"); it != j.end() && it->is_object()) {
        w.size.width = it->value("width", 1);
        w.size.height = it->value("height", 1);
    }
    w.config = j.value("config", json::object());
}

void to_json(json& j, const layout_config& l) {
    j = json{
        {"columns", l.columns},
        {"rows", l.rows},
        {"gap", l.gap},
        {"autoArrange", l.auto_arrange}
    };
}

void from_json(const json& j, layout_config& l) {
    layout_config defaults;
    l.columns = j.value("columns", defaults.columns);
    l.rows = j.value("rows", defaults.rows);
    l.gap = j.value("gap", defaults.gap);
    l.auto_arrange = j.value("autoArrange", defaults.auto_arrange);
}

void to_json(json& j, const dashboard& d) {
    j = json{
        {"id", d.id},
        {"name", d.name},
        {"isDefault", d.is_default},
        {"isPublic", d.is_public},
        {"ownerId", d.owner_id},
        {"widgets", d.widgets},
        {"layout", d.layout},
        {"tags", d.tags},
        {"createdAt", d.created_at},
        {"updatedAt", d.updated_at},
        {"version", d.version}
    };
    if (d.description) {
        j["description"] = *d.description;
    }
}

void from_json(const json& j, dashboard& d) {
    d.id = j.at("id").get<std::string>();
    d.name = j.at("name").get<std::string>();
    d.description = optional_string(j, "description");
    d.is_default = j.value("isDefault", false);
    d.is_public = j.value("isPublic", false);
    d.owner_id = j.value("ownerId", std::string());
    d.widgets = j.value("widgets", std::vector<widget>{});
    d.layout = j.value("layout", layout_config{});
    d.tags = j.value("tags", std::vector<std::string>{});
    d.created_at = timestamp_field(j, "createdAt");
    d.updated_at = timestamp_field(j, "updatedAt");
    d.version = j.value("version", int64_t{0});
}

void to_json(json& j, const dashboard_draft& d) {
    j = json{
        {"name", d.name},
        {"isDefault", d.is_default},
        {"isPublic", d.is_public},
        {"ownerId", d.owner_id},
        {"widgets", d.widgets},
        {"layout", d.layout},
        {"tags", d.tags}
    };
    if (d.description) {
        j["description"] = *d.description;
    }
}

void from_json(const json& j, dashboard_draft& d) {
    d.name = j.at("name").get<std::string>();
    d.description = optional_string(j, "description");
    d.is_default = j.value("isDefault", false);
    d.is_public = j.value("isPublic", false);
    d.owner_id = j.value("ownerId", std::string());
    d.widgets = j.value("widgets", std::vector<widget>{});
    d.layout = j.value("layout", layout_config{});
    d.tags = j.value("tags", std::vector<std::string>{});
}

void to_json(json& j, const dashboard_patch& p) {
    j = json::object();
    if (p.name) j["name"] = *p.name;
    if (p.description) j["description"] = *p.description;
    if (p.is_default) j["isDefault"] = *p.is_default;
    if (p.is_public) j["isPublic"] = *p.is_public;
    if (p.widgets) j["widgets"] = *p.widgets;
    if (p.layout) j["layout"] = *p.layout;
    if (p.tags) j["tags"] = *p.tags;
}

void from_json(const json& j, dashboard_patch& p) {
    p = dashboard_patch{};
    if (j.contains("name")) p.name = j["name"].get<std::string>();
    p.description = optional_string(j, "description");
    if (j.contains("isDefault")) p.is_default = j["isDefault"].get<bool>();
    if (j.contains("isPublic")) p.is_public = j["isPublic"].get<bool>();
    if (j.contains("widgets")) p.widgets = j["widgets"].get<std::vector<widget>>();
    if (j.contains("layout")) p.layout = j["layout"].get<layout_config>();
    if (j.contains("tags")) p.tags = j["tags"].get<std::vector<std::string>>();
}

} // namespace pulsesync
