#include <gtest/gtest.h>

#include <filesystem>

#include <yamler/Document.h>
#include <yamler/schema/Rule.h>
#include <yamler/schema/validate.h>
#include <yamler/support/file.h>

using namespace yamler;

namespace {

const char* service_schema =
    "type: map\n"
    "required: [name, port]\n"
    "additionalProperties: false\n"
    "properties:\n"
    "  name:\n"
    "    type: string\n"
    "    minLength: 2\n"
    "    pattern: '^[a-z][a-z0-9-]*$'\n"
    "  port:\n"
    "    type: int\n"
    "    minimum: 1\n"
    "    maximum: 10\n"
    "  env:\n"
    "    type: string\n"
    "    enum: [dev, prod]\n"
    "  ratio:\n"
    "    type: float\n"
    "    exclusiveMaximum: 1\n"
    "  debug:\n"
    "    type: bool\n"
    "  owner:\n"
    "    type: string\n"
    "    nullable: true\n"
    "  tags:\n"
    "    type: array\n"
    "    maxItems: 3\n"
    "    uniqueItems: true\n"
    "    items:\n"
    "      type: string\n"
    "  extra:\n"
    "    type: any\n";

String outcome(const String& text, const schema::Rule& rule) {
    try {
        Document::load(text).validate(rule);
    } catch (const Error& error) {
        return String{error.code_name()};
    }
    return "valid";
}

String failing_path(const String& text, const schema::Rule& rule) {
    try {
        Document::load(text).validate(rule);
    } catch (const Error& error) {
        return error.path();
    }
    return "valid";
}

} // namespace

TEST(Schema, Load) {
    auto rule = schema::load(service_schema);
    EXPECT_EQ(rule.type, "map");
    EXPECT_EQ(rule.required, (std::vector<String>{"name", "port"}));
    ASSERT_TRUE(rule.additional_properties);
    EXPECT_FALSE(*rule.additional_properties);
    ASSERT_EQ(rule.properties.size(), 8);
    EXPECT_EQ(rule.properties.begin()->first, "name");

    auto& port = *rule.properties.at("port");
    EXPECT_EQ(*port.maximum, 10.0);
    EXPECT_EQ(rule.properties.at("tags")->items->type, "string");
    EXPECT_TRUE(rule.properties.at("owner")->nullable);
}

TEST(Schema, LoadErrors) {
    EXPECT_THROW(schema::load("[1, 2]\n"), NotAMapping);
    EXPECT_THROW(schema::load("type: string\nminLength: abc\n"), TypeMismatch);
    EXPECT_THROW(schema::load("type: map\nproperties: [a]\n"), NotAMapping);
    EXPECT_NO_THROW(schema::load("type: string\ndescription: ignored\n"));
}

TEST(Schema, LoadFile) {
    auto fpath = std::filesystem::temp_directory_path() / "yamler_test_schema.yaml";
    write_file(fpath, service_schema);
    auto rule = schema::load_file(fpath);
    EXPECT_EQ(rule.properties.size(), 8);
    std::filesystem::remove(fpath);
}

TEST(Schema, Valid) {
    auto rule = schema::load(service_schema);
    auto doc = Document::load(
        "name: web-1\n"
        "port: 10\n"
        "env: prod\n"
        "ratio: 0.5\n"
        "debug: false\n"
        "owner: null\n"
        "tags: [a, b]\n"
        "extra:\n"
        "  anything: [1, {x: y}]\n");
    auto before = doc.to_string();
    EXPECT_NO_THROW(doc.validate(rule));
    EXPECT_EQ(doc.to_string(), before);
}

TEST(Schema, RequiredFieldMissing) {
    auto rule = schema::load(service_schema);
    EXPECT_EQ(outcome("name: web\n", rule), "RequiredFieldMissing");
    EXPECT_EQ(failing_path("name: web\n", rule), "");

    auto nested = schema::load(
        "type: map\n"
        "properties:\n"
        "  server:\n"
        "    type: map\n"
        "    required: [port]\n");
    EXPECT_EQ(failing_path("server:\n  host: x\n", nested), "server");
    EXPECT_EQ(failing_path("other: 1\n", nested), "valid");
}

TEST(Schema, Bounds) {
    auto rule = schema::load(service_schema);
    EXPECT_EQ(outcome("name: web\nport: 10\n", rule), "valid");
    EXPECT_EQ(outcome("name: web\nport: 11\n", rule), "ConstraintViolation");
    EXPECT_EQ(outcome("name: web\nport: 0\n", rule), "ConstraintViolation");
    EXPECT_EQ(failing_path("name: web\nport: 11\n", rule), "port");
    EXPECT_EQ(outcome("name: web\nport: 1\nratio: 1.0\n", rule), "ConstraintViolation");
    EXPECT_EQ(outcome("name: web\nport: 1\nratio: 0.99\n", rule), "valid");
}

TEST(Schema, TypeMismatch) {
    auto rule = schema::load(service_schema);
    EXPECT_EQ(outcome("name: web\nport: \"8\"\n", rule), "TypeMismatch");
    EXPECT_EQ(outcome("name: 12\nport: 8\n", rule), "TypeMismatch");
    EXPECT_EQ(outcome("name: web\nport: 8\ndebug: yes\n", rule), "TypeMismatch");
    EXPECT_EQ(outcome("name: web\nport: 8\ntags: a\n", rule), "TypeMismatch");
    EXPECT_EQ(outcome("- a\n", rule), "TypeMismatch");
}

TEST(Schema, FloatAcceptsInt) {
    auto rule = schema::load("type: float\nminimum: 0\n");
    auto doc = Document::load("a: 1\nb: 2.5\nc: x\n");
    EXPECT_NO_THROW(schema::validate("a"_path.lookup(doc.root()), rule));
    EXPECT_NO_THROW(schema::validate("b"_path.lookup(doc.root()), rule));
    EXPECT_THROW(schema::validate("c"_path.lookup(doc.root()), rule), TypeMismatch);
}

TEST(Schema, StringLengthAndPattern) {
    auto rule = schema::load(service_schema);
    EXPECT_EQ(outcome("name: w\nport: 1\n", rule), "ConstraintViolation");
    EXPECT_EQ(outcome("name: Web\nport: 1\n", rule), "ConstraintViolation");
    EXPECT_EQ(failing_path("name: Web\nport: 1\n", rule), "name");
}

TEST(Schema, InvalidPattern) {
    auto rule = schema::load("type: string\npattern: '[a-'\n");
    auto doc = Document::load("a: abc\n");
    EXPECT_THROW(schema::validate("a"_path.lookup(doc.root()), rule), InvalidPattern);
}

TEST(Schema, Enum) {
    auto rule = schema::load(service_schema);
    EXPECT_EQ(outcome("name: web\nport: 1\nenv: dev\n", rule), "valid");
    EXPECT_EQ(outcome("name: web\nport: 1\nenv: test\n", rule), "EnumViolation");

    auto numbers = schema::load("type: int\nenum: [1, 2]\n");
    auto doc = Document::load("a: 2\nb: 3\n");
    EXPECT_NO_THROW(schema::validate("a"_path.lookup(doc.root()), numbers));
    EXPECT_THROW(schema::validate("b"_path.lookup(doc.root()), numbers), EnumViolation);
}

TEST(Schema, AdditionalProperties) {
    auto rule = schema::load(service_schema);
    EXPECT_EQ(outcome("name: web\nport: 1\nunknown: x\n", rule), "AdditionalPropertyNotAllowed");

    auto open = schema::load("type: map\nproperties:\n  a:\n    type: int\n");
    EXPECT_EQ(outcome("a: 1\nb: x\n", open), "valid");
}

TEST(Schema, Arrays) {
    auto rule = schema::load(service_schema);
    EXPECT_EQ(outcome("name: web\nport: 1\ntags: [a, b, a]\n", rule), "ConstraintViolation");
    EXPECT_EQ(outcome("name: web\nport: 1\ntags: [a, b, c, d]\n", rule), "ConstraintViolation");
    EXPECT_EQ(outcome("name: web\nport: 1\ntags: [a, 2]\n", rule), "TypeMismatch");
    EXPECT_EQ(failing_path("name: web\nport: 1\ntags: [a, 2]\n", rule), "tags[1]");

    auto mixed = schema::load("type: array\nuniqueItems: true\nminItems: 1\n");
    auto doc = Document::load("a: [1, \"1\"]\nb: []\n");
    EXPECT_NO_THROW(schema::validate("a"_path.lookup(doc.root()), mixed));
    EXPECT_THROW(schema::validate("b"_path.lookup(doc.root()), mixed), ConstraintViolation);
}

TEST(Schema, Nullable) {
    auto rule = schema::load(service_schema);
    EXPECT_EQ(outcome("name: web\nport: 1\nowner: ~\n", rule), "valid");
    EXPECT_EQ(outcome("name: web\nport: 1\nenv: null\n", rule), "TypeMismatch");
}

TEST(Schema, UnsupportedType) {
    schema::Rule rule;
    rule.type = "date";
    auto doc = Document::load("a: 1\n");
    EXPECT_THROW(doc.validate(rule), UnsupportedType);
}

TEST(Schema, ProgrammaticRule) {
    schema::Rule rule;
    rule.type = "map";
    rule.required.push_back("port");
    auto port = std::make_shared<schema::Rule>();
    port->type = "int";
    port->maximum = 10;
    rule.properties.insert_or_assign("port", port);

    EXPECT_EQ(outcome("port: 10\n", rule), "valid");
    EXPECT_EQ(outcome("port: 11\n", rule), "ConstraintViolation");
    EXPECT_EQ(outcome("host: x\n", rule), "RequiredFieldMissing");
}
