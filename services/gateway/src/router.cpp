#include "router.hpp"
#include "util.hpp"

static std::map<std::string, std::string> normalize(const std::map<std::string, std::string>& in) {
    std::map<std::string, std::string> out;
    for (const auto& kv : in) {
        std::string k = to_lower(trim(kv.first));
        std::string v = trim(kv.second);
        if (!k.empty() && !v.empty()) out[k] = v;
    }
    return out;
}

static std::string lookup(const std::map<std::string, std::string>& m, const std::string& key) {
    auto it = m.find(key);
    return it == m.end() ? std::string() : it->second;
}

static std::string meta_string(const nlohmann::json& meta, const char* key) {
    if (!meta.is_object()) return {};
    auto it = meta.find(key);
    if (it == meta.end() || !it->is_string()) return {};
    return trim(it->get<std::string>());
}

RouterConfig RouterConfig::from_env() {
    RouterConfig c;
    c.default_workspace = getenv_or("NOVAAGENT_DEFAULT_WORKSPACE", c.default_workspace);
    c.default_profile = getenv_or("NOVAAGENT_DEFAULT_PROFILE", c.default_profile);
    c.channel_workspaces = parse_kv_list(getenv_or("NOVAAGENT_CHANNEL_WORKSPACES", ""));
    c.channel_profiles = parse_kv_list(getenv_or("NOVAAGENT_CHANNEL_PROFILES", ""));
    return c;
}

GatewayRouter::GatewayRouter(RouterConfig config) : config_(std::move(config)) {
    config_.default_workspace = trim(config_.default_workspace);
    config_.default_profile = trim(config_.default_profile);
    if (config_.default_workspace.empty()) config_.default_workspace = "default";
    if (config_.default_profile.empty()) config_.default_profile = "unleashed_local";
    config_.channel_workspaces = normalize(config_.channel_workspaces);
    config_.channel_profiles = normalize(config_.channel_profiles);
}

RoutingDecision GatewayRouter::route(const std::string& channel) const {
    std::string key = to_lower(trim(channel));
    RoutingDecision d;
    d.workspace_id = lookup(config_.channel_workspaces, key);
    d.profile_name = lookup(config_.channel_profiles, key);
    if (d.workspace_id.empty()) d.workspace_id = config_.default_workspace;
    if (d.profile_name.empty()) d.profile_name = config_.default_profile;
    return d;
}

RoutingDecision GatewayRouter::route(const InboundMessage& message) const {
    RoutingDecision d = route(message.connector);
    std::string ws = meta_string(message.metadata, "workspace_id");
    std::string profile = meta_string(message.metadata, "profile_name");
    if (profile.empty()) profile = meta_string(message.metadata, "policy_profile");
    if (!ws.empty()) d.workspace_id = ws;
    if (!profile.empty()) d.profile_name = profile;
    return d;
}
