#include <gtest/gtest.h>

#include <yamler/parser/yaml.h>
#include <yamler/serializer/yaml.h>

using namespace yamler;

namespace {

String round_trip(const StringView& text) {
    auto tree = yaml::parse(text);
    return yaml::emit(tree.root, tree.prologue, tree.epilogue);
}

} // namespace

TEST(Yaml, ResolvePlainScalars) {
    EXPECT_EQ(yaml::resolve(""), Node::NUL);
    EXPECT_EQ(yaml::resolve("~"), Node::NUL);
    EXPECT_EQ(yaml::resolve("Null"), Node::NUL);
    EXPECT_EQ(yaml::resolve("TRUE"), Node::BOOL);
    EXPECT_EQ(yaml::resolve("false"), Node::BOOL);
    EXPECT_EQ(yaml::resolve("yes"), Node::STR);
    EXPECT_EQ(yaml::resolve("42"), Node::INT);
    EXPECT_EQ(yaml::resolve("-7"), Node::INT);
    EXPECT_EQ(yaml::resolve("0x1F"), Node::INT);
    EXPECT_EQ(yaml::resolve("1.5"), Node::FLOAT);
    EXPECT_EQ(yaml::resolve("1e3"), Node::FLOAT);
    EXPECT_EQ(yaml::resolve(".inf"), Node::FLOAT);
    EXPECT_EQ(yaml::resolve("-.inf"), Node::FLOAT);
    EXPECT_EQ(yaml::resolve(".nan"), Node::FLOAT);
    EXPECT_EQ(yaml::resolve("1.0.0"), Node::STR);
    EXPECT_EQ(yaml::resolve("-"), Node::STR);
    EXPECT_EQ(yaml::resolve("localhost"), Node::STR);
}

TEST(Yaml, ParseSimpleMapping) {
    auto tree = yaml::parse("name: test\nport: 8080\n");
    auto& root = tree.root;
    ASSERT_TRUE(root.is_mapping());
    ASSERT_EQ(root.size(), 2);
    EXPECT_EQ(root.key_at(0).value, "name");
    EXPECT_EQ(root.value_at(0).value, "test");
    EXPECT_EQ(root.value_at(0).tag, Node::STR);
    EXPECT_EQ(root.value_at(1).tag, Node::INT);
}

TEST(Yaml, ParseComments) {
    auto tree = yaml::parse("# head\nname: test # line\n");
    auto& key = tree.root.key_at(0);
    auto& value = tree.root.value_at(0);
    EXPECT_EQ(key.head, "# head\n");
    EXPECT_EQ(value.line, "# line");
    EXPECT_EQ(value.layout.gap, " ");
}

TEST(Yaml, ParseNestedSequence) {
    auto tree = yaml::parse("items:\n  - a\n  - b: 1\n    c: 2\n");
    auto& items = *tree.root.find("items");
    ASSERT_TRUE(items.is_sequence());
    EXPECT_EQ(items.style, Node::BLOCK);
    ASSERT_EQ(items.children.size(), 2);
    EXPECT_EQ(items.children[0].value, "a");
    ASSERT_TRUE(items.children[1].is_mapping());
    EXPECT_EQ(items.children[1].size(), 2);
}

TEST(Yaml, ParseSequenceAtParentIndent) {
    auto tree = yaml::parse("items:\n- a\n- b\nnext: 1\n");
    EXPECT_EQ(tree.root.find("items")->children.size(), 2);
    EXPECT_NE(tree.root.find("next"), nullptr);
}

TEST(Yaml, ParseFlowCollections) {
    auto tree = yaml::parse("a: [1, 'two', {x: 3}]\nb: {k: v, empty: }\n");
    auto& a = *tree.root.find("a");
    ASSERT_TRUE(a.is_sequence());
    EXPECT_EQ(a.style, Node::FLOW);
    EXPECT_EQ(a.children[1].value, "two");
    EXPECT_TRUE(a.children[2].is_mapping());
    auto& b = *tree.root.find("b");
    EXPECT_EQ(b.size(), 2);
    EXPECT_TRUE(b.value_at(1).is_null());
}

TEST(Yaml, ParseQuotedScalars) {
    auto tree = yaml::parse("a: \"tab\\there\\u00e9\"\nb: 'it''s'\nc: \"folded\n  line\"\n");
    EXPECT_EQ(tree.root.find("a")->value, "tab\there\xc3\xa9");
    EXPECT_EQ(tree.root.find("a")->scalar_style, Node::DOUBLE_QUOTED);
    EXPECT_EQ(tree.root.find("b")->value, "it's");
    EXPECT_EQ(tree.root.find("c")->value, "folded line");
}

TEST(Yaml, ParseQuotedNumberIsString) {
    auto tree = yaml::parse("version: \"1.0\"\n");
    EXPECT_EQ(tree.root.find("version")->tag, Node::STR);
}

TEST(Yaml, ParseMultiLinePlain) {
    auto tree = yaml::parse("text: first\n  second\n\n  third\nnext: 1\n");
    EXPECT_EQ(tree.root.find("text")->value, "first second\nthird");
}

TEST(Yaml, ParseLiteralBlock) {
    auto tree = yaml::parse("script: |\n  echo one\n\n  echo two\nnext: 1\n");
    auto& script = *tree.root.find("script");
    EXPECT_EQ(script.scalar_style, Node::LITERAL);
    EXPECT_EQ(script.value, "echo one\n\necho two\n");
}

TEST(Yaml, ParseBlockChomping) {
    auto tree = yaml::parse("strip: |-\n  text\nkeep: |+\n  text\n\nfold: >\n  a\n  b\n\n  c\n");
    EXPECT_EQ(tree.root.find("strip")->value, "text");
    EXPECT_EQ(tree.root.find("keep")->value, "text\n\n");
    EXPECT_EQ(tree.root.find("fold")->value, "a b\nc\n");
}

TEST(Yaml, ParseAnchorsAndTags) {
    auto tree = yaml::parse("base: &base\n  a: 1\nref: *base\nnum: !!str 42\n");
    auto& base = *tree.root.find("base");
    EXPECT_EQ(base.anchor, "base");
    EXPECT_TRUE(tree.root.find("ref")->is_alias());
    EXPECT_EQ(tree.root.find("ref")->value, "base");
    auto& num = *tree.root.find("num");
    EXPECT_EQ(num.type_tag, "!!str");
    EXPECT_EQ(num.tag, Node::STR);
}

TEST(Yaml, ParseArrayRoot) {
    auto tree = yaml::parse("- name: a\n- name: b\n");
    ASSERT_TRUE(tree.root.is_sequence());
    EXPECT_EQ(tree.root.children.size(), 2);
}

TEST(Yaml, ParseEmptyDocument) {
    auto tree = yaml::parse("# only a comment\n");
    EXPECT_TRUE(tree.root.is_mapping());
    EXPECT_EQ(tree.root.size(), 0);
    EXPECT_EQ(yaml::emit(tree.root), "# only a comment\n");
}

TEST(Yaml, DetectIndent) {
    EXPECT_EQ(yaml::parse("a:\n    b: 1\n").indent, 4);
    EXPECT_EQ(yaml::parse("a:\n  b: 1\n").indent, 2);
    EXPECT_EQ(yaml::parse("a: 1\n").indent, 2);
    EXPECT_EQ(yaml::parse("a:\n   b: 1\n").indent, 2);

    yaml::Options options;
    options.default_indent = 4;
    EXPECT_EQ(yaml::parse("a: 1\n", options).indent, 4);
}

TEST(Yaml, RejectTabs) {
    EXPECT_THROW(yaml::parse("a:\n\tb: 1\n"), UnsupportedIndentation);
    try {
        yaml::parse("a:\n\tb: 1\n");
        FAIL();
    } catch (const Error& error) {
        EXPECT_EQ(error.code(), ErrorCode::UNSUPPORTED_INDENTATION);
    }
}

TEST(Yaml, RejectMalformed) {
    EXPECT_THROW(yaml::parse("a: [1, 2\n"), ParseError);
    EXPECT_THROW(yaml::parse("a: \"open\n"), ParseError);
    EXPECT_THROW(yaml::parse("a: 1\n  b: 2\n"), ParseError);
    EXPECT_THROW(yaml::parse("just a scalar\n"), ParseError);
    EXPECT_THROW(yaml::parse("a: 1\n---\nb: 2\n"), ParseError);
    EXPECT_THROW(yaml::parse("? complex\n: key\n"), ParseError);
    EXPECT_THROW(yaml::parse("a: b: c\n"), ParseError);
}

TEST(Yaml, ParseErrorLocation) {
    try {
        yaml::parse("a: 1\nb: [1,\n");
        FAIL();
    } catch (const ParseError& error) {
        EXPECT_EQ(error.code(), ErrorCode::PARSE_ERROR);
        EXPECT_EQ(error.location.line, 2);
        EXPECT_EQ(error.location.column, 4);
    }
}

TEST(Yaml, RoundTripComments) {
    String text =
        "# Header comment\n"
        "\n"
        "app:\n"
        "  name: myapp # inline\n"
        "  # before port\n"
        "  port: 8080\n"
        "\n"
        "  tags: [a, b,  c]   # flow\n"
        "list:\n"
        "  - one\n"
        "  - two: 2\n"
        "    three: 3\n"
        "  -   spaced\n"
        "# trailing\n";
    EXPECT_EQ(round_trip(text), text);
}

TEST(Yaml, RoundTripScalars) {
    String text =
        "plain: hello world\n"
        "double: \"a \\\"quoted\\\" value\"\n"
        "single: 'it''s'\n"
        "int: 0x1F\n"
        "float: 1.50\n"
        "bool: True\n"
        "null1: ~\n"
        "null2:\n"
        "multi: first\n"
        "  second\n";
    EXPECT_EQ(round_trip(text), text);
}

TEST(Yaml, RoundTripBlockScalars) {
    String text =
        "script: |\n"
        "  echo hello\n"
        "\n"
        "  echo world\n"
        "folded: >- # note\n"
        "  some folded\n"
        "  text\n"
        "keep: |+\n"
        "  kept\n"
        "\n"
        "next: value\n";
    EXPECT_EQ(round_trip(text), text);
}

TEST(Yaml, RoundTripFlowCollections) {
    String text =
        "a: [1, 2, 3]\n"
        "b: {x: 1, y: [true, false]}\n"
        "c: []\n"
        "d: {}\n"
        "e: [ spaced , items, ]\n"
        "f: [\n"
        "  one, # first\n"
        "  two\n"
        "]\n";
    EXPECT_EQ(round_trip(text), text);
}

TEST(Yaml, RoundTripAnchorsAndTags) {
    String text =
        "base: &base\n"
        "  a: 1\n"
        "ref: *base\n"
        "tagged: !!str 42\n"
        "both: &b !custom value\n";
    EXPECT_EQ(round_trip(text), text);
}

TEST(Yaml, RoundTripArrayRoot) {
    String text =
        "# servers\n"
        "- name: a\n"
        "  vars:\n"
        "    max_clients: 100\n"
        "- name: b # second\n"
        "  vars:\n"
        "    max_clients: 200\n";
    EXPECT_EQ(round_trip(text), text);
}

TEST(Yaml, RoundTripNestedSequences) {
    String text =
        "matrix:\n"
        "  - - 1\n"
        "    - 2\n"
        "  -\n"
        "    - 3\n"
        "  - []\n";
    EXPECT_EQ(round_trip(text), text);
}

TEST(Yaml, RoundTripFourSpaceIndent) {
    String text =
        "config:\n"
        "    app:\n"
        "        name: myapp\n"
        "        version: 1.0\n"
        "    db:\n"
        "        host: localhost\n";
    EXPECT_EQ(round_trip(text), text);
}

TEST(Yaml, RoundTripValueOnNextLine) {
    String text =
        "key:\n"
        "  long value on the next line\n"
        "other: x\n";
    EXPECT_EQ(round_trip(text), text);
}

TEST(Yaml, RoundTripDocumentMarkers) {
    String text =
        "%YAML 1.2\n"
        "---\n"
        "a: 1\n"
        "...\n";
    auto tree = yaml::parse(text);
    EXPECT_EQ(tree.prologue, "%YAML 1.2\n---\n");
    EXPECT_EQ(tree.epilogue, "...\n");
    EXPECT_EQ(round_trip(text), text);
}

TEST(Yaml, EmitAddsFinalNewline) {
    EXPECT_EQ(round_trip("a: 1"), "a: 1\n");
}

TEST(Yaml, ToFlow) {
    auto tree = yaml::parse("a:\n  - 1\n  - x y\n  - 'a, b'\nb: {c: null}\n");
    EXPECT_EQ(yaml::to_flow(tree.root), "{a: [1, x y, \"a, b\"], b: {c: null}}");
}
