#include "router.hpp"
#include <cstdlib>
#include <gtest/gtest.h>

TEST(GatewayRouter, DefaultsWhenChannelIsUnmapped) {
    GatewayRouter router;
    auto d = router.route("telegram");
    EXPECT_EQ(d.workspace_id, "default");
    EXPECT_EQ(d.profile_name, "unleashed_local");
}

TEST(GatewayRouter, ChannelMapsAreNormalized) {
    RouterConfig cfg;
    cfg.default_workspace = "home";
    cfg.channel_workspaces = {{" Slack ", "team"}, {"empty", "  "}};
    cfg.channel_profiles = {{"SLACK", "balanced"}};
    GatewayRouter router(cfg);

    auto slack = router.route("  slack");
    EXPECT_EQ(slack.workspace_id, "team");
    EXPECT_EQ(slack.profile_name, "balanced");

    auto empty = router.route("empty");
    EXPECT_EQ(empty.workspace_id, "home");
}

TEST(GatewayRouter, MessageMetadataOverridesChannelMaps) {
    RouterConfig cfg;
    cfg.channel_workspaces = {{"cli", "mapped"}};
    cfg.channel_profiles = {{"cli", "mapped_profile"}};
    GatewayRouter router(cfg);

    InboundMessage m;
    m.connector = "cli";
    EXPECT_EQ(router.route(m).workspace_id, "mapped");

    m.metadata = {{"workspace_id", "hinted"}, {"policy_profile", "strict"}};
    auto d = router.route(m);
    EXPECT_EQ(d.workspace_id, "hinted");
    EXPECT_EQ(d.profile_name, "strict");

    m.metadata["profile_name"] = "explicit";
    EXPECT_EQ(router.route(m).profile_name, "explicit");
}

TEST(GatewayRouter, ConfigFromEnvironment) {
    setenv("NOVAAGENT_DEFAULT_WORKSPACE", "envws", 1);
    setenv("NOVAAGENT_CHANNEL_PROFILES", "discord=fast, matrix=slow", 1);
    GatewayRouter router(RouterConfig::from_env());
    unsetenv("NOVAAGENT_DEFAULT_WORKSPACE");
    unsetenv("NOVAAGENT_CHANNEL_PROFILES");

    EXPECT_EQ(router.route("discord").workspace_id, "envws");
    EXPECT_EQ(router.route("discord").profile_name, "fast");
    EXPECT_EQ(router.route("matrix").profile_name, "slow");
}
