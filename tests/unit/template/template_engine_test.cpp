/**
 * Tests for the template engine: placeholder rendering, `$` sibling lookups, missing
 * variable reporting and the built-in variable set.
 */

#include <gtest/gtest.h>
#include <servherd/template/template_engine.h>

using namespace servherd;
using namespace servherd::templates;

namespace {

registry::ServerEntry makeServer(const std::string& name, const std::string& cwd, int port) {
    registry::ServerEntry e;
    e.id = "id-" + name;
    e.name = name;
    e.cwd = cwd;
    e.port = port;
    e.hostname = "localhost";
    e.env["API_KEY"] = "secret";
    return e;
}

TemplateContext contextWith(std::vector<registry::ServerEntry> servers,
                            std::optional<std::string> cwd = std::string("/proj")) {
    TemplateContext ctx;
    ctx.cwd = std::move(cwd);
    ctx.lookupServer = [servers = std::move(servers)](const std::string& name,
                                                      const std::string& dir)
        -> std::optional<registry::ServerEntry> {
        for (const auto& s : servers) {
            if (s.name == name && s.cwd == dir)
                return s;
        }
        return std::nullopt;
    };
    return ctx;
}

} // namespace

// ============================================================================
// render()
// ============================================================================

TEST(TemplateEngineTest, SubstitutesKnownVariables) {
    TemplateVariables vars{{"port", "3100"}, {"hostname", "localhost"}};
    EXPECT_EQ(render("vite --host {{hostname}} --port {{port}}", vars),
              "vite --host localhost --port 3100");
}

TEST(TemplateEngineTest, ToleratesWhitespaceInsideBraces) {
    EXPECT_EQ(render("--port {{ port }}", {{"port", "8080"}}), "--port 8080");
}

TEST(TemplateEngineTest, LeavesUnknownVariablesVerbatim) {
    EXPECT_EQ(render("--api {{api}} --port {{port}}", {{"port", "1"}}), "--api {{api}} --port 1");
}

TEST(TemplateEngineTest, UnterminatedPlaceholderIsLiteral) {
    EXPECT_EQ(render("echo {{port", {{"port", "1"}}), "echo {{port");
}

TEST(TemplateEngineTest, RendersEveryEnvValue) {
    auto env = renderEnvTemplates({{"PORT_COPY", "{{port}}"}, {"PLAIN", "x"}}, {{"port", "42"}});
    EXPECT_EQ(env.at("PORT_COPY"), "42");
    EXPECT_EQ(env.at("PLAIN"), "x");
}

// ============================================================================
// `$` lookups
// ============================================================================

TEST(TemplateEngineTest, PositionalLookupUsesContextCwd) {
    auto ctx = contextWith({makeServer("api", "/proj", 4100)});
    EXPECT_EQ(render(R"(--proxy http://localhost:{{$ "api" "port"}})", {}, ctx),
              "--proxy http://localhost:4100");
}

TEST(TemplateEngineTest, HashArgumentsAndExplicitCwd) {
    auto ctx = contextWith({makeServer("api", "/other", 4200)});
    EXPECT_EQ(render(R"({{$ service="api" prop="url" cwd="/other"}})", {}, ctx),
              "http://localhost:4200");
    EXPECT_EQ(render(R"({{$ svc='api' property='env.API_KEY' cwd='/other'}})", {}, ctx),
              "secret");
}

TEST(TemplateEngineTest, LookupOfUnknownServerThrows) {
    auto ctx = contextWith({});
    try {
        render(R"({{$ "ghost" "port"}})", {}, ctx);
        FAIL() << "expected TemplateLookupError";
    } catch (const TemplateLookupError& e) {
        EXPECT_STREQ(e.what(), "Server \"ghost\" not found in /proj");
    }
}

TEST(TemplateEngineTest, LookupOfUnknownPropertyThrows) {
    auto ctx = contextWith({makeServer("api", "/proj", 4100)});
    EXPECT_THROW(render(R"({{$ "api" "colour"}})", {}, ctx), TemplateLookupError);
}

TEST(TemplateEngineTest, LookupNeedsFunctionAndCwd) {
    EXPECT_THROW(render(R"({{$ "api" "port"}})", {}, TemplateContext{}), TemplateLookupError);
    auto noCwd = contextWith({makeServer("api", "/proj", 4100)}, std::nullopt);
    EXPECT_THROW(render(R"({{$ "api" "port"}})", {}, noCwd), TemplateLookupError);
}

TEST(TemplateEngineTest, LookupNeedsServiceAndProperty) {
    auto ctx = contextWith({makeServer("api", "/proj", 4100)});
    EXPECT_THROW(render(R"({{$ prop="port"}})", {}, ctx), TemplateLookupError);
    EXPECT_THROW(render(R"({{$ service="api"}})", {}, ctx), TemplateLookupError);
}

// ============================================================================
// Variable discovery
// ============================================================================

TEST(TemplateEngineTest, ExtractsDistinctNamesInOrder) {
    auto names =
        extractVariableNames(R"({{port}} {{hostname}} {{port}} {{https-cert}} {{$ "a" "b"}})");
    EXPECT_EQ(names, (std::vector<std::string>{"port", "hostname", "https-cert"}));
}

TEST(TemplateEngineTest, MissingVariablesAreClassified) {
    TemplateVariables vars{{"port", "3000"}, {"https-cert", ""}};
    auto missing = findMissingVariables("{{port}} {{https-cert}} {{api}} {{url}}", vars);
    ASSERT_EQ(missing.size(), 3u);

    EXPECT_EQ(missing[0].templateVar, "https-cert");
    EXPECT_FALSE(missing[0].isCustom);
    EXPECT_TRUE(missing[0].configurable);
    EXPECT_EQ(missing[0].configKey.value_or(""), "httpsCert");

    EXPECT_EQ(missing[1].templateVar, "api");
    EXPECT_TRUE(missing[1].isCustom);
    EXPECT_EQ(missing[1].configKey.value_or(""), "variables.api");

    EXPECT_EQ(missing[2].templateVar, "url");
    EXPECT_FALSE(missing[2].configurable);
}

TEST(TemplateEngineTest, MissingVariablesMessageNamesTheFix) {
    TemplateVariables vars{{"port", "3000"}};
    auto text = formatMissingVariablesError(findMissingVariables("{{https-key}} {{api}}", vars));
    EXPECT_NE(
        text.find("{{https-key}} - Set with: servherd config --set httpsKey --value <value>"),
        std::string::npos);
    EXPECT_NE(text.find("{{api}} - Add with: servherd config --add api --value <value>"),
              std::string::npos);
    EXPECT_TRUE(formatMissingVariablesError({}).empty());
}

// ============================================================================
// Built-in variables
// ============================================================================

TEST(TemplateEngineTest, BuiltinsDeriveFromConfig) {
    config::GlobalConfig cfg;
    cfg.hostname = "dev.local";
    cfg.protocol = Protocol::Https;
    cfg.httpsCert = "/c.pem";
    auto vars = getTemplateVariables(cfg, 3456);
    EXPECT_EQ(vars.at("port"), "3456");
    EXPECT_EQ(vars.at("hostname"), "dev.local");
    EXPECT_EQ(vars.at("url"), "https://dev.local:3456");
    EXPECT_EQ(vars.at("https-cert"), "/c.pem");
    EXPECT_EQ(vars.at("https-key"), "");
}

TEST(TemplateEngineTest, ExplicitProtocolAndHostnameWin) {
    config::GlobalConfig cfg;
    auto vars = getTemplateVariables(cfg, 80, Protocol::Https, std::string("example.test"));
    EXPECT_EQ(vars.at("url"), "https://example.test:80");
}

TEST(TemplateEngineTest, BuiltinsShadowCustomVariables) {
    config::GlobalConfig cfg;
    cfg.variables["api"] = "api.local";
    cfg.variables["port"] = "1";
    auto vars = getTemplateVariables(cfg, 3000);
    EXPECT_EQ(vars.at("api"), "api.local");
    EXPECT_EQ(vars.at("port"), "3000");
}

// ============================================================================
// parseEnvStrings()
// ============================================================================

TEST(TemplateEngineTest, ParsesEnvOnFirstEquals) {
    auto env = parseEnvStrings({"URL=http://x?a=b", "EMPTY="});
    ASSERT_TRUE(env);
    EXPECT_EQ(env.value().at("URL"), "http://x?a=b");
    EXPECT_EQ(env.value().at("EMPTY"), "");
}

TEST(TemplateEngineTest, RejectsMalformedEnvStrings) {
    auto noEquals = parseEnvStrings({"NOVALUE"});
    ASSERT_FALSE(noEquals);
    EXPECT_EQ(noEquals.error().message,
              "Invalid environment variable format: \"NOVALUE\". Expected KEY=VALUE format.");

    auto emptyKey = parseEnvStrings({"=x"});
    ASSERT_FALSE(emptyKey);
    EXPECT_NE(emptyKey.error().message.find("Key cannot be empty"), std::string::npos);
}
