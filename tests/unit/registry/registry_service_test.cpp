/**
 * Tests for RegistryService - persistence and lookups of managed servers.
 */

#include <gtest/gtest.h>
#include <servherd/registry/registry_service.h>

#include "temp_dir_scope.hpp"

#include <fstream>
#include <regex>

using namespace servherd;
using namespace servherd::registry;
using servherd::test_support::TempDirScope;

namespace {

NewServer server(const std::string& name, const std::string& command, int port,
                 const std::string& cwd = "/proj") {
    NewServer s;
    s.name = name;
    s.command = command;
    s.resolvedCommand = command;
    s.cwd = cwd;
    s.port = port;
    s.hostname = "localhost";
    return s;
}

class RegistryServiceTest : public ::testing::Test {
protected:
    TempDirScope tmp_ = TempDirScope::unique_under("servherd-registry");
    std::filesystem::path path_ = tmp_.path() / "state" / "registry.json";
};

} // namespace

TEST_F(RegistryServiceTest, MissingFileIsEmptyRegistry) {
    RegistryService reg(path_);
    ASSERT_TRUE(reg.load());
    EXPECT_TRUE(reg.servers().empty());
}

TEST_F(RegistryServiceTest, AddAssignsIdentityAndPersists) {
    RegistryService reg(path_);
    ASSERT_TRUE(reg.load());
    auto added = reg.addServer(server("brave-otter", "npm start", 3100));
    ASSERT_TRUE(added) << added.error().message;

    const auto& e = added.value();
    EXPECT_TRUE(std::regex_match(
        e.id, std::regex("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$")));
    EXPECT_EQ(e.processHandle, "servherd-brave-otter");
    EXPECT_FALSE(e.createdAt.empty());

    RegistryService reloaded(path_);
    ASSERT_TRUE(reloaded.load());
    auto found = reloaded.findByName("brave-otter");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, e.id);
    EXPECT_EQ(found->port, 3100);
    EXPECT_EQ(found->url(), "http://localhost:3100");
}

TEST_F(RegistryServiceTest, FileHasVersionedShape) {
    RegistryService reg(path_);
    ASSERT_TRUE(reg.addServer(server("a", "npm start", 3000)));
    std::ifstream in(path_);
    auto j = nlohmann::json::parse(in);
    EXPECT_EQ(j["version"], "1");
    ASSERT_EQ(j["servers"].size(), 1u);
    EXPECT_EQ(j["servers"][0]["name"], "a");
}

TEST_F(RegistryServiceTest, DuplicateNameRejected) {
    RegistryService reg(path_);
    ASSERT_TRUE(reg.addServer(server("a", "npm start", 3000)));
    auto dup = reg.addServer(server("a", "npm test", 3001, "/other"));
    ASSERT_FALSE(dup);
    EXPECT_EQ(dup.error().code, ErrorCode::ServerAlreadyExists);
    EXPECT_EQ(reg.servers().size(), 1u);
}

TEST_F(RegistryServiceTest, CorruptFileResetsToEmpty) {
    std::filesystem::create_directories(path_.parent_path());
    {
        std::ofstream out(path_);
        out << "{ broken";
    }
    RegistryService reg(path_);
    ASSERT_TRUE(reg.load());
    EXPECT_TRUE(reg.servers().empty());
}

TEST_F(RegistryServiceTest, CommandHashMatchIgnoresWhitespace) {
    RegistryService reg(path_);
    ASSERT_TRUE(reg.addServer(server("a", "npm  run   dev", 3000)));
    EXPECT_TRUE(reg.findByCommandHash("/proj", " npm run dev").has_value());
    EXPECT_FALSE(reg.findByCommandHash("/elsewhere", "npm run dev").has_value());
    EXPECT_FALSE(reg.findByCommandHash("/proj", "npm run build").has_value());
}

TEST_F(RegistryServiceTest, CwdAndNameLookupIsScoped) {
    RegistryService reg(path_);
    ASSERT_TRUE(reg.addServer(server("api", "npm start", 3000, "/proj")));
    EXPECT_TRUE(reg.findByCwdAndName("/proj", "api").has_value());
    EXPECT_FALSE(reg.findByCwdAndName("/other", "api").has_value());
}

TEST_F(RegistryServiceTest, UpdateWritesOnlyEngagedFields) {
    RegistryService reg(path_);
    auto added = reg.addServer(server("a", "npm start", 3000));
    ASSERT_TRUE(added);

    ServerUpdate update;
    update.port = 3999;
    update.env = EnvMap{{"NODE_ENV", "development"}};
    auto updated = reg.updateServer(added.value().id, update);
    ASSERT_TRUE(updated);
    EXPECT_EQ(updated.value().port, 3999);
    EXPECT_EQ(updated.value().command, "npm start");
    EXPECT_EQ(updated.value().env.at("NODE_ENV"), "development");

    EXPECT_EQ(reg.updateServer("missing", update).error().code, ErrorCode::ServerNotFound);
}

TEST_F(RegistryServiceTest, RemoveDeletesEntry) {
    RegistryService reg(path_);
    auto added = reg.addServer(server("a", "npm start", 3000));
    ASSERT_TRUE(added);
    ASSERT_TRUE(reg.removeServer(added.value().id));
    EXPECT_FALSE(reg.findByName("a").has_value());
    EXPECT_EQ(reg.removeServer(added.value().id).error().code, ErrorCode::ServerNotFound);

    RegistryService reloaded(path_);
    ASSERT_TRUE(reloaded.load());
    EXPECT_TRUE(reloaded.servers().empty());
}

TEST_F(RegistryServiceTest, ListFiltersCombine) {
    RegistryService reg(path_);
    auto web = server("web", "npx vite --port {{port}}", 3000);
    web.tags = {"frontend"};
    auto docs = server("docs", "npx storybook dev", 3001);
    docs.tags = {"frontend"};
    auto api = server("api", "node server.js", 3002, "/api");
    ASSERT_TRUE(reg.addServer(web));
    ASSERT_TRUE(reg.addServer(docs));
    ASSERT_TRUE(reg.addServer(api));

    ServerFilter byTag;
    byTag.tag = "frontend";
    EXPECT_EQ(reg.list(byTag).size(), 2u);

    ServerFilter byGlob;
    byGlob.cmdGlob = "*{vite,storybook}*";
    EXPECT_EQ(reg.list(byGlob).size(), 2u);

    ServerFilter byCwd;
    byCwd.cwd = "/api";
    ASSERT_EQ(reg.list(byCwd).size(), 1u);
    EXPECT_EQ(reg.list(byCwd)[0].name, "api");

    ServerFilter combined;
    combined.tag = "frontend";
    combined.cmdGlob = "*vite*";
    ASSERT_EQ(reg.list(combined).size(), 1u);
    EXPECT_EQ(reg.list(combined)[0].name, "web");
}

TEST_F(RegistryServiceTest, PortsAndNamesSets) {
    RegistryService reg(path_);
    ASSERT_TRUE(reg.addServer(server("a", "x", 3000)));
    ASSERT_TRUE(reg.addServer(server("b", "y", 3001)));
    EXPECT_EQ(reg.ports(), (std::set<int>{3000, 3001}));
    EXPECT_EQ(reg.names(), (std::set<std::string>{"a", "b"}));
}

TEST(ServerEntryTest, PropertyLookup) {
    ServerEntry e;
    e.name = "api";
    e.port = 4000;
    e.hostname = "localhost";
    e.protocol = Protocol::Https;
    e.env["TOKEN"] = "t";
    EXPECT_EQ(entryProperty(e, "port").value_or(""), "4000");
    EXPECT_EQ(entryProperty(e, "url").value_or(""), "https://localhost:4000");
    EXPECT_EQ(entryProperty(e, "env.TOKEN").value_or(""), "t");
    EXPECT_FALSE(entryProperty(e, "env.MISSING").has_value());
    EXPECT_FALSE(entryProperty(e, "description").has_value());
}

TEST(ServerEntryTest, JsonRoundTripKeepsSnapshot) {
    ServerEntry e;
    e.id = "id-1";
    e.name = "api";
    e.command = "serve {{hostname}}";
    e.resolvedCommand = "serve localhost";
    e.port = 4000;
    e.tags = {"a"};
    e.usedConfigKeys = {"hostname", "portRange"};
    ConfigSnapshot snap;
    snap.hostname = "localhost";
    snap.portRangeMin = 3000;
    snap.portRangeMax = 9999;
    e.configSnapshot = snap;

    nlohmann::json j = e;
    auto back = j.get<ServerEntry>();
    EXPECT_EQ(back.name, "api");
    EXPECT_EQ(back.usedConfigKeys, e.usedConfigKeys);
    ASSERT_TRUE(back.configSnapshot.has_value());
    EXPECT_EQ(*back.configSnapshot, snap);
}
