#include <gtest/gtest.h>

#include <yamler/Document.h>
#include <yamler/core/Pattern.h>

using namespace yamler;

namespace {

const char* app_text =
    "app:\n"
    "  name: myapp\n"
    "  version: 1.0\n"
    "  settings:\n"
    "    debug: true\n"
    "    timeout: 30\n"
    "    database:\n"
    "      host: localhost\n"
    "      port: 5432\n"
    "config:\n"
    "  development:\n"
    "    debug: true\n"
    "    name: dev-app\n"
    "  production:\n"
    "    debug: false\n"
    "    name: prod-app\n"
    "servers:\n"
    "  - name: server1\n"
    "    host: host1\n"
    "  - name: server2\n"
    "    host: host2\n";

} // namespace

TEST(Pattern, Matches) {
    EXPECT_TRUE(Pattern{"app.name"}.matches("app.name"));
    EXPECT_TRUE(Pattern{"app.*"}.matches("app.name"));
    EXPECT_FALSE(Pattern{"app.*"}.matches("app.settings.debug"));
    EXPECT_TRUE(Pattern{"app.**"}.matches("app.settings.debug"));
    EXPECT_TRUE(Pattern{"**.debug"}.matches("app.settings.debug"));
    EXPECT_TRUE(Pattern{"**.debug"}.matches("config.development.debug"));
    EXPECT_FALSE(Pattern{"config.*"}.matches("app.name"));
    EXPECT_TRUE(Pattern{"**.value"}.matches("very.deep.nested.value"));
    EXPECT_TRUE(Pattern{"very.**.value"}.matches("very.deep.nested.value"));
    EXPECT_FALSE(Pattern{"very.deep.*"}.matches("very.deep.nested.value"));
    EXPECT_TRUE(Pattern{"very.deep.**"}.matches("very.deep.nested.value"));
}

TEST(Pattern, MatchesIndexes) {
    EXPECT_TRUE(Pattern{"servers.*.name"}.matches("servers[0].name"));
    EXPECT_FALSE(Pattern{"servers.*"}.matches("servers[0].name"));
    EXPECT_TRUE(Pattern{"servers[*].name"}.matches("servers[1].name"));
    EXPECT_FALSE(Pattern{"servers[*]"}.matches("servers.name"));
    EXPECT_TRUE(Pattern{"servers[1]"}.matches("servers[1]"));
    EXPECT_FALSE(Pattern{"servers[1]"}.matches("servers[0]"));
    EXPECT_TRUE(Pattern{"[*].name"}.matches("[3].name"));
}

TEST(Pattern, RecursiveMatchesNothingBetween) {
    EXPECT_TRUE(Pattern{"a.**.b"}.matches("a.b"));
    EXPECT_TRUE(Pattern{"**"}.matches(""));
    EXPECT_TRUE(Pattern{"**"}.matches("a[0].b"));
}

TEST(Pattern, Errors) {
    EXPECT_THROW(Pattern{"app.na*"}, InvalidPattern);
    EXPECT_THROW(Pattern{"app..name"}, InvalidPath);
    EXPECT_THROW(Pattern{"app[x]"}, InvalidPath);
}

TEST(Pattern, FilterByPattern) {
    std::map<String, Value> data;
    data["app.name"] = "myapp";
    data["app.version"] = "1.0";
    data["app.settings.debug"] = true;
    data["config.development.debug"] = true;
    data["config.production.debug"] = false;
    data["servers[0].name"] = "server1";
    data["not..a.path"] = 1;

    auto app = filter_by_pattern(data, "app.*");
    ASSERT_EQ(app.size(), 2);
    EXPECT_EQ(app.at("app.name"), "myapp");
    EXPECT_EQ(app.at("app.version"), "1.0");

    auto debug = filter_by_pattern(data, "**.debug");
    ASSERT_EQ(debug.size(), 3);
    EXPECT_EQ(debug.at("config.production.debug"), false);

    auto names = filter_by_pattern(data, "servers[*].name");
    ASSERT_EQ(names.size(), 1);
}

TEST(Wildcard, GetAllSingle) {
    auto doc = Document::load(app_text);
    auto result = doc.get_all("app.*");
    ASSERT_EQ(result.size(), 3);
    EXPECT_EQ(result.at("app.name"), "myapp");
    EXPECT_EQ(result.at("app.version"), 1.0);

    auto& settings = result.at("app.settings").as<Map>();
    EXPECT_EQ(settings.at("timeout"), 30);
    EXPECT_EQ(settings.at("database").as<Map>().at("port"), 5432);
}

TEST(Wildcard, GetAllRecursive) {
    auto doc = Document::load(app_text);
    auto result = doc.get_all("**.debug");
    ASSERT_EQ(result.size(), 3);
    EXPECT_EQ(result.at("app.settings.debug"), true);
    EXPECT_EQ(result.at("config.development.debug"), true);
    EXPECT_EQ(result.at("config.production.debug"), false);
}

TEST(Wildcard, GetAllNested) {
    auto doc = Document::load(app_text);
    auto result = doc.get_all("config.*.name");
    ASSERT_EQ(result.size(), 2);
    EXPECT_EQ(result.at("config.development.name"), "dev-app");
    EXPECT_EQ(result.at("config.production.name"), "prod-app");
}

TEST(Wildcard, GetAllSequence) {
    auto doc = Document::load(app_text);
    auto result = doc.get_all("servers[*]");
    ASSERT_EQ(result.size(), 2);
    EXPECT_EQ(result.at("servers[1]").as<Map>().at("host"), "host2");

    auto names = doc.get_all("servers.*.name");
    ASSERT_EQ(names.size(), 2);
    EXPECT_EQ(names.at("servers[0].name"), "server1");
}

TEST(Wildcard, GetAllExactAndMissing) {
    auto doc = Document::load(app_text);
    auto exact = doc.get_all("app.name");
    ASSERT_EQ(exact.size(), 1);
    EXPECT_EQ(exact.at("app.name"), "myapp");
    EXPECT_TRUE(doc.get_all("nothing.*").empty());
}

TEST(Wildcard, SetAll) {
    String text =
        "config:\n"
        "  development:\n"
        "    debug: true\n"
        "    timeout: 30\n"
        "  production:\n"
        "    debug: false # off in prod\n"
        "    timeout: 60\n";

    auto doc = Document::load(text);
    doc.set_all("config.*.debug", "enabled");
    EXPECT_EQ(doc.to_string(),
        "config:\n"
        "  development:\n"
        "    debug: enabled\n"
        "    timeout: 30\n"
        "  production:\n"
        "    debug: enabled # off in prod\n"
        "    timeout: 60\n");

    doc = Document::load(text);
    doc.set_all("config.*.timeout", 45);
    EXPECT_EQ(doc.get_all("**.timeout").size(), 2);
    for (auto& [path, value] : doc.get_all("**.timeout"))
        EXPECT_EQ(value, 45) << path;
}

TEST(Wildcard, SetAllSkipsNestedMatches) {
    auto doc = Document::load("config:\n  a: 1\n  b: 2\nother: 3\n");
    doc.set_all("config.**", "x");
    EXPECT_EQ(doc.to_string(), "config: x\nother: 3\n");
}

TEST(Wildcard, SetAllNoMatch) {
    auto doc = Document::load("a: 1\n");
    doc.set_all("b.*", 2);
    EXPECT_EQ(doc.to_string(), "a: 1\n");
}

TEST(Wildcard, SetAllFailureRestores) {
    auto doc = Document::load("a: 1 # one\nb: 2\n");
    EXPECT_THROW(doc.set_all("**", 5), TypeMismatch);
    EXPECT_EQ(doc.to_string(), "a: 1 # one\nb: 2\n");
}

TEST(Wildcard, GetKeys) {
    auto doc = Document::load(app_text);
    EXPECT_EQ(doc.get_keys("**.debug"),
              (std::vector<String>{"app.settings.debug", "config.development.debug", "config.production.debug"}));
    EXPECT_EQ(doc.get_keys("app.*"), (std::vector<String>{"app.name", "app.settings", "app.version"}));
    EXPECT_EQ(doc.get_keys("servers[*].host"), (std::vector<String>{"servers[0].host", "servers[1].host"}));
}

TEST(Wildcard, GetPaths) {
    auto doc = Document::load(
        "app:\n"
        "  name: myapp\n"
        "  settings:\n"
        "    debug: true\n"
        "config:\n"
        "  timeout: 30\n"
        "list: [a]\n");
    EXPECT_EQ(doc.get_paths(), (std::vector<String>{
        "app", "app.name", "app.settings", "app.settings.debug",
        "config", "config.timeout", "list", "list[0]"}));
    EXPECT_TRUE(Document{}.get_paths().empty());
}
