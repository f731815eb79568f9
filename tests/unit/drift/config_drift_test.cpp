#include <gtest/gtest.h>
#include <servherd/drift/config_drift.h>

using namespace servherd;
using namespace servherd::drift;

namespace {

registry::ServerEntry startedWith(const std::string& command, const config::GlobalConfig& cfg,
                                  int port = 3500) {
    registry::ServerEntry e;
    e.id = "id";
    e.name = "brave-otter";
    e.command = command;
    e.port = port;
    e.usedConfigKeys = extractUsedConfigKeys(command, cfg.variables);
    e.configSnapshot = createConfigSnapshot(cfg, e.usedConfigKeys);
    return e;
}

} // namespace

TEST(ConfigDriftTest, UsedKeysCoverBuiltinsRangeProtocolAndCustoms) {
    EnvMap custom{{"api", "api.local"}};
    auto keys = extractUsedConfigKeys(
        "serve --host {{hostname}} --origin {{url}} --api {{api}} --x {{undefined}}", custom);
    EXPECT_EQ(keys, (std::vector<std::string>{"hostname", "portRange", "protocol",
                                              "variables.api"}));
}

TEST(ConfigDriftTest, PortRangeIsAlwaysUsed) {
    EXPECT_EQ(extractUsedConfigKeys("npm start"), (std::vector<std::string>{"portRange"}));
    EXPECT_EQ(extractUsedConfigKeys("npm start --port {{port}}"),
              (std::vector<std::string>{"portRange"}));
}

TEST(ConfigDriftTest, SnapshotCapturesOnlyUsedValues) {
    config::GlobalConfig cfg;
    cfg.hostname = "localhost";
    cfg.httpsCert = "/c.pem";
    auto snap = createConfigSnapshot(cfg, {"hostname", "portRange"});
    EXPECT_EQ(snap.hostname.value_or(""), "localhost");
    EXPECT_EQ(snap.portRangeMin.value_or(0), 3000);
    EXPECT_EQ(snap.portRangeMax.value_or(0), 9999);
    EXPECT_FALSE(snap.httpsCert.has_value());
    EXPECT_FALSE(snap.protocol.has_value());
}

TEST(ConfigDriftTest, UnchangedConfigHasNoDrift) {
    config::GlobalConfig cfg;
    auto entry = startedWith("serve --host {{hostname}} --url {{url}}", cfg);
    auto result = detectDrift(entry, cfg);
    EXPECT_FALSE(result.hasDrift);
    EXPECT_EQ(formatDrift(result), "No config drift");
}

TEST(ConfigDriftTest, HostnameChangeIsDrift) {
    config::GlobalConfig before;
    auto entry = startedWith("serve --host {{hostname}}", before);
    config::GlobalConfig after = before;
    after.hostname = "127.0.0.1";

    auto result = detectDrift(entry, after);
    ASSERT_TRUE(result.hasDrift);
    ASSERT_EQ(result.driftedValues.size(), 1u);
    EXPECT_EQ(result.driftedValues[0].configKey, "hostname");
    EXPECT_EQ(result.driftedValues[0].templateVar, "hostname");
    EXPECT_EQ(formatDrift(result),
              "Config drift detected:\n  hostname: \"0.0.0.0\" → \"127.0.0.1\"");
}

TEST(ConfigDriftTest, UnusedKeyChangeIsNotDrift) {
    config::GlobalConfig before;
    auto entry = startedWith("npm start", before);
    config::GlobalConfig after = before;
    after.hostname = "127.0.0.1";
    after.protocol = Protocol::Https;
    EXPECT_FALSE(detectDrift(entry, after).hasDrift);
}

TEST(ConfigDriftTest, ProtocolChangeFlagged) {
    config::GlobalConfig before;
    auto entry = startedWith("open {{url}}", before);
    config::GlobalConfig after = before;
    after.protocol = Protocol::Https;
    auto result = detectDrift(entry, after);
    EXPECT_TRUE(result.hasDrift);
    EXPECT_TRUE(result.protocolChanged);
    EXPECT_EQ(result.driftedValues[0].templateVar, "url");
}

TEST(ConfigDriftTest, RangeChangeStillContainingPortIsNotDrift) {
    config::GlobalConfig before;
    auto entry = startedWith("npm start", before, 3500);
    config::GlobalConfig after = before;
    after.portRange = {3000, 4000};
    auto result = detectDrift(entry, after);
    EXPECT_FALSE(result.hasDrift);
    EXPECT_FALSE(result.portOutOfRange);
}

TEST(ConfigDriftTest, RangeExcludingPortIsDrift) {
    config::GlobalConfig before;
    auto entry = startedWith("npm start", before, 3500);
    config::GlobalConfig after = before;
    after.portRange = {4000, 4100};
    auto result = detectDrift(entry, after);
    ASSERT_TRUE(result.hasDrift);
    EXPECT_TRUE(result.portOutOfRange);
    EXPECT_EQ(driftDetails(result).front(), "portRange: \"3000-9999\" → \"4000-4100\"");
}

TEST(ConfigDriftTest, CustomVariableChangeAndRemoval) {
    config::GlobalConfig before;
    before.variables["api"] = "v1";
    auto entry = startedWith("serve --api {{api}}", before);

    config::GlobalConfig changed = before;
    changed.variables["api"] = "v2";
    auto result = detectDrift(entry, changed);
    ASSERT_TRUE(result.hasDrift);
    EXPECT_EQ(result.driftedValues[0].configKey, "variables.api");
    EXPECT_EQ(result.driftedValues[0].currentValue.value_or(""), "v2");

    config::GlobalConfig removed = before;
    removed.variables.clear();
    auto gone = detectDrift(entry, removed);
    ASSERT_TRUE(gone.hasDrift);
    EXPECT_FALSE(gone.driftedValues[0].currentValue.has_value());
    EXPECT_EQ(driftDetails(gone).front(), "variables.api: \"v1\" → \"(not set)\"");
}

TEST(ConfigDriftTest, EntryWithoutSnapshotNeverDrifts) {
    config::GlobalConfig cfg;
    auto entry = startedWith("serve --host {{hostname}}", cfg);
    entry.configSnapshot.reset();
    cfg.hostname = "elsewhere";
    EXPECT_FALSE(detectDrift(entry, cfg).hasDrift);
}

TEST(ConfigDriftTest, FindsServersByKeyAndDrift) {
    config::GlobalConfig before;
    auto a = startedWith("serve --host {{hostname}}", before);
    a.name = "a";
    auto b = startedWith("npm start", before);
    b.name = "b";

    auto users = findServersUsingConfigKey({a, b}, "hostname");
    ASSERT_EQ(users.size(), 1u);
    EXPECT_EQ(users[0].name, "a");
    EXPECT_EQ(findServersUsingConfigKey({a, b}, "portRange").size(), 2u);

    config::GlobalConfig after = before;
    after.hostname = "changed";
    auto drifted = findServersWithDrift({a, b}, after);
    ASSERT_EQ(drifted.size(), 1u);
    EXPECT_EQ(drifted[0].server.name, "a");
}
