#include <gtest/gtest.h>
#include "../validation.h"
#include <qb/json.h>
#include <stdexcept>

using namespace qb::validation;

class FieldPathTest : public ::testing::Test {
protected:
    qb::json document;

    void SetUp() override {
        document = qb::json::parse(R"({
            "user": {"name": "Alice", "address": {"city": "Paris"}, "nickname": null},
            "items": [
                {"name": "apple", "price": 1.5},
                {"name": "pear"},
                {"price": 3}
            ],
            "matrix": [[1, 2], [3]],
            "tags": ["a", "b"]
        })");
    }
};

TEST_F(FieldPathTest, ParsesDottedAndBracketedSegments) {
    FieldPath path("items[*].price");
    ASSERT_EQ(path.segments().size(), 3u);
    EXPECT_EQ(path.segments()[0].kind, PathSegment::Kind::Key);
    EXPECT_EQ(path.segments()[0].key, "items");
    EXPECT_EQ(path.segments()[1].kind, PathSegment::Kind::Wildcard);
    EXPECT_EQ(path.segments()[2].key, "price");
    EXPECT_TRUE(path.has_wildcard());

    FieldPath indexed("matrix[0][1]");
    ASSERT_EQ(indexed.segments().size(), 3u);
    EXPECT_EQ(indexed.segments()[1].kind, PathSegment::Kind::Index);
    EXPECT_EQ(indexed.segments()[1].index, 0u);
    EXPECT_EQ(indexed.segments()[2].index, 1u);
    EXPECT_FALSE(indexed.has_wildcard());

    FieldPath leading("[2].id");
    ASSERT_EQ(leading.segments().size(), 2u);
    EXPECT_EQ(leading.segments()[0].kind, PathSegment::Kind::Index);

    FieldPath root("");
    EXPECT_TRUE(root.is_root());
}

TEST_F(FieldPathTest, RejectsMalformedPaths) {
    EXPECT_THROW(FieldPath("user..name"), std::invalid_argument);
    EXPECT_THROW(FieldPath("user."), std::invalid_argument);
    EXPECT_THROW(FieldPath(".user"), std::invalid_argument);
    EXPECT_THROW(FieldPath("items[abc]"), std::invalid_argument);
    EXPECT_THROW(FieldPath("items[1"), std::invalid_argument);
    EXPECT_THROW(FieldPath("items]"), std::invalid_argument);
    EXPECT_THROW(FieldPath("items[]"), std::invalid_argument);
    EXPECT_THROW(FieldPath("items[0]name"), std::invalid_argument);
}

TEST_F(FieldPathTest, ToStringAndJoin) {
    EXPECT_EQ(FieldPath::to_string(FieldPath::parse("a.b[3].c[*]")), "a.b[3].c[*]");
    EXPECT_EQ(FieldPath::join("", "name"), "name");
    EXPECT_EQ(FieldPath::join("user", "name"), "user.name");
    EXPECT_EQ(FieldPath::join("items", "[0].name"), "items[0].name");
    EXPECT_EQ(FieldPath::join("user", ""), "user");
}

TEST_F(FieldPathTest, NonWildcardPathResolvesToOneLocation) {
    auto locations = FieldPath("user.address.city").resolve(document);
    ASSERT_EQ(locations.size(), 1u);
    ASSERT_TRUE(locations[0].defined());
    EXPECT_EQ(*locations[0].value, "Paris");
    EXPECT_EQ(locations[0].path, "user.address.city");
    ASSERT_NE(locations[0].parent, nullptr);
    EXPECT_TRUE(locations[0].parent->contains("city"));
    EXPECT_FALSE(locations[0].array_context.has_value());
}

TEST_F(FieldPathTest, MissingFinalKeyIsAnUndefinedLocation) {
    auto locations = FieldPath("user.email").resolve(document);
    ASSERT_EQ(locations.size(), 1u);
    EXPECT_FALSE(locations[0].defined());
    EXPECT_EQ(locations[0].path, "user.email");
    ASSERT_NE(locations[0].parent, nullptr);
    EXPECT_EQ(*locations[0].parent, document["user"]);
}

TEST_F(FieldPathTest, MissingOrNullIntermediateYieldsNoLocation) {
    EXPECT_TRUE(FieldPath("account.id").resolve(document).empty());
    EXPECT_TRUE(FieldPath("user.nickname.first").resolve(document).empty());
    EXPECT_TRUE(FieldPath("user.name.first").resolve(document).empty());
    EXPECT_NO_THROW(FieldPath("a.b.c.d").resolve(qb::json(nullptr)));
    EXPECT_TRUE(FieldPath("a.b.c.d").resolve(qb::json(nullptr)).empty());
}

TEST_F(FieldPathTest, NullValueAtFinalSegmentIsDefined) {
    auto locations = FieldPath("user.nickname").resolve(document);
    ASSERT_EQ(locations.size(), 1u);
    ASSERT_TRUE(locations[0].defined());
    EXPECT_TRUE(locations[0].value->is_null());
}

TEST_F(FieldPathTest, WildcardFansOutOncePerElement) {
    auto locations = FieldPath("items[*].name").resolve(document);
    ASSERT_EQ(locations.size(), 3u);
    for (std::size_t i = 0; i < locations.size(); ++i) {
        ASSERT_TRUE(locations[i].array_context.has_value());
        EXPECT_EQ(locations[i].array_context->index, i);
        EXPECT_EQ(*locations[i].array_context->item, document["items"][i]);
        EXPECT_EQ(*locations[i].array_context->array, document["items"]);
        EXPECT_EQ(locations[i].path, "items[" + std::to_string(i) + "].name");
        ASSERT_EQ(locations[i].indices.size(), 1u);
        EXPECT_EQ(locations[i].indices[0], i);
    }
    EXPECT_TRUE(locations[0].defined());
    EXPECT_TRUE(locations[1].defined());
    EXPECT_FALSE(locations[2].defined());
}

TEST_F(FieldPathTest, WildcardOverNonArrayYieldsNothing) {
    EXPECT_TRUE(FieldPath("user[*].name").resolve(document).empty());
    EXPECT_TRUE(FieldPath("missing[*].name").resolve(document).empty());
}

TEST_F(FieldPathTest, NestedWildcardsAreCartesian) {
    auto locations = FieldPath("matrix[*][*]").resolve(document);
    ASSERT_EQ(locations.size(), 3u);
    EXPECT_EQ(locations[0].path, "matrix[0][0]");
    EXPECT_EQ(locations[1].path, "matrix[0][1]");
    EXPECT_EQ(locations[2].path, "matrix[1][0]");
    EXPECT_EQ(*locations[2].value, 3);
    ASSERT_EQ(locations[2].indices.size(), 2u);
    EXPECT_EQ(locations[2].indices[0], 1u);
    EXPECT_EQ(locations[2].indices[1], 0u);
    // innermost array
    EXPECT_EQ(*locations[2].array_context->array, document["matrix"][1]);
}

TEST_F(FieldPathTest, LiteralIndexIsAFixedFork) {
    auto locations = FieldPath("tags[1]").resolve(document);
    ASSERT_EQ(locations.size(), 1u);
    EXPECT_EQ(*locations[0].value, "b");
    EXPECT_EQ(locations[0].array_context->index, 1u);

    EXPECT_TRUE(FieldPath("tags[5]").resolve(document).empty());
}

TEST_F(FieldPathTest, RootPathResolvesToDocument) {
    auto locations = FieldPath("").resolve(document);
    ASSERT_EQ(locations.size(), 1u);
    EXPECT_EQ(locations[0].value, &document);
    EXPECT_EQ(locations[0].parent, nullptr);
    EXPECT_EQ(locations[0].path, "");
}

TEST_F(FieldPathTest, UnresolvedKeepsTemplatePath) {
    FieldPath path("account.owner.id");
    auto location = path.unresolved();
    EXPECT_FALSE(location.defined());
    EXPECT_EQ(location.parent, nullptr);
    EXPECT_EQ(location.path, "account.owner.id");
}

TEST_F(FieldPathTest, FindAndSetValue) {
    const qb::json *found = find_value(document, FieldPath::parse("items[0].price"));
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(*found, 1.5);
    EXPECT_EQ(find_value(document, FieldPath::parse("items[9].price")), nullptr);
    EXPECT_EQ(find_value(document, FieldPath::parse("items[*].price")), nullptr);

    qb::json output = qb::json::object();
    EXPECT_TRUE(set_value(output, FieldPath::parse("profile.name"), "Bob"));
    EXPECT_EQ(output["profile"]["name"], "Bob");

    EXPECT_TRUE(set_value(output, FieldPath::parse("list[2]"), 7));
    ASSERT_EQ(output["list"].size(), 3u);
    EXPECT_TRUE(output["list"][0].is_null());
    EXPECT_EQ(output["list"][2], 7);

    EXPECT_FALSE(set_value(output, FieldPath::parse("profile.name.first"), "x"));
    EXPECT_EQ(output["profile"]["name"], "Bob");
}
