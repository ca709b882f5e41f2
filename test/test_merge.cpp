#include <gtest/gtest.h>

#include <yamler/Document.h>

using namespace yamler;

TEST(Merge, KeepsBaseComments) {
    auto base = Document::load("name: test # Original name\n");
    base.merge(Document::load("name: new-name\n"));
    EXPECT_EQ(base.to_string(), "name: new-name # Original name\n");
}

TEST(Merge, DonorCommentFillsEmptySlot) {
    auto base = Document::load("a: 1\nb: 2 # kept\n");
    base.merge(Document::load("a: 10 # from donor\nb: 20 # dropped\n"));
    EXPECT_EQ(base.to_string(), "a: 10 # from donor\nb: 20 # kept\n");
}

TEST(Merge, NewKeysAppendedInDonorOrder) {
    auto base = Document::load("a: 1\nb: 2\n");
    base.merge(Document::load("c: 3\nb: 20\nd: 4\n"));
    EXPECT_EQ(base.to_string(), "a: 1\nb: 20\nc: 3\nd: 4\n");
}

TEST(Merge, Nested) {
    auto base = Document::load("server:\n  host: a # primary\n  port: 80\n");
    base.merge(Document::load("server:\n  port: 8080\n  tls: true\n"));
    EXPECT_EQ(base.to_string(), "server:\n  host: a # primary\n  port: 8080\n  tls: true\n");
    EXPECT_EQ(base.get("server.port"), 8080);
}

TEST(Merge, NewSubtreeUsesBaseIndent) {
    auto base = Document::load("a: 1\n");
    base.merge(Document::load("db:\n    host: x\n    port: 5\n"));
    EXPECT_EQ(base.to_string(), "a: 1\ndb:\n  host: x\n  port: 5\n");
}

TEST(Merge, NewKeyKeepsHeadComment) {
    auto base = Document::load("a: 1\n");
    base.merge(Document::load("# database\ndb: 1\n"));
    EXPECT_EQ(base.to_string(), "a: 1\n# database\ndb: 1\n");
}

TEST(Merge, SequenceIsReplaced) {
    auto base = Document::load("list: [1, 2] # nums\n");
    base.merge(Document::load("list: [3]\n"));
    EXPECT_EQ(base.to_string(), "list: [3] # nums\n");
    EXPECT_EQ(base.get("list"), (List{3}));
}

TEST(Merge, SequenceKeepsBaseStyle) {
    auto base = Document::load("list:\n  - a\n  - b\n");
    base.merge(Document::load("list: [c]\n"));
    EXPECT_EQ(base.to_string(), "list:\n  - c\n");
}

TEST(Merge, ScalarReplacedByMapping) {
    auto base = Document::load("a: 1\nb: 2\n");
    base.merge(Document::load("a:\n  x: 1\n"));
    EXPECT_EQ(base.to_string(), "a:\n  x: 1\nb: 2\n");
}

TEST(Merge, EmptyDocumentIsIdentity) {
    String text = "a: 1 # one\nb:\n  c: [1, 2]\n";
    auto base = Document::load(text);
    base.merge(Document{});
    EXPECT_EQ(base.to_string(), text);

    Document empty;
    empty.merge(Document::load("a: 1\nb:\n  c: 2\n"));
    EXPECT_EQ(empty.to_string(), "a: 1\nb:\n  c: 2\n");
}

TEST(Merge, DonorIsUnchanged) {
    auto base = Document::load("a: 1\n");
    auto donor = Document::load("a: 2\nb:\n  c: 3\n");
    auto before = donor.to_string();
    base.merge(donor);
    base.set("b.c", 4);
    EXPECT_EQ(donor.to_string(), before);
}

TEST(Merge, NilDocument) {
    auto base = Document::load("a: 1\n");
    const Document* none = nullptr;
    EXPECT_THROW(base.merge(none), NilDocument);
    EXPECT_THROW(base.merge_at("a", none), NilDocument);

    try {
        base.merge(none);
        FAIL();
    } catch (const Error& error) {
        EXPECT_EQ(error.code(), ErrorCode::NIL_DOCUMENT);
    }
    EXPECT_EQ(base.to_string(), "a: 1\n");
}

TEST(Merge, MergeAt) {
    auto base = Document::load("app:\n  name: x\n");
    auto donor = Document::load("debug: true\n");
    base.merge_at("app", donor);
    EXPECT_EQ(base.to_string(), "app:\n  name: x\n  debug: true\n");

    base.merge_at("new.section", donor);
    EXPECT_EQ(base.get("new.section.debug"), true);

    base.merge_at("", Document::load("top: 1\n"));
    EXPECT_EQ(base.get("top"), 1);
}

TEST(Merge, MergeAtReplacesScalar) {
    auto base = Document::load("a: 1\nb: 2\n");
    base.merge_at("a", Document::load("debug: true\n"));
    EXPECT_EQ(base.to_string(), "a:\n  debug: true\nb: 2\n");
}

TEST(Merge, MergeAtInvalidPath) {
    auto base = Document::load("list: [1]\n");
    auto donor = Document::load("a: 1\n");
    EXPECT_THROW(base.merge_at("list.key", donor), NotAMapping);
    EXPECT_EQ(base.to_string(), "list: [1]\n");
}
