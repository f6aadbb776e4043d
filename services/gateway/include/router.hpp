#pragma once
#include "connector.hpp"
#include <map>
#include <string>

struct RouterConfig {
    std::string default_workspace = "default";
    std::string default_profile = "unleashed_local";
    std::map<std::string, std::string> channel_workspaces;
    std::map<std::string, std::string> channel_profiles;

    // NOVAAGENT_DEFAULT_WORKSPACE, NOVAAGENT_DEFAULT_PROFILE,
    // NOVAAGENT_CHANNEL_WORKSPACES / _PROFILES ("chan=value,...").
    static RouterConfig from_env();
};

struct RoutingDecision {
    std::string workspace_id;
    std::string profile_name;
};

class GatewayRouter {
public:
    explicit GatewayRouter(RouterConfig config = RouterConfig());

    RoutingDecision route(const std::string& channel) const;
    // Metadata hints (workspace_id, profile_name / policy_profile) win over
    // the channel maps.
    RoutingDecision route(const InboundMessage& message) const;

private:
    RouterConfig config_;
};
