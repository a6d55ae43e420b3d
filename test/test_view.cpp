#include <gtest/gtest.h>

#include <jref/core/View.h>

#include "documents.h"

using namespace jref;

namespace {

View as_view(const Entry& entry) {
    return std::get<View>(entry);
}

Object as_object(const Entry& entry) {
    return std::get<Object>(entry);
}

} // namespace

class ViewTest : public ::testing::Test
{
  protected:
    void SetUp() override {
        store.register_loader(documents.loader());
        documents.add("A", R"({
            "title": "A",
            "foo": {"type": "string"},
            "r": {"$ref": "B#/bar"},
            "s": {"$ref": "B#/bar/type"},
            "list": [1, {"$ref": "#/foo"}, [true]],
            "a/b": {"c~d": "escaped"},
            "odd": {"$ref": 7, "x": 1}
        })");
        documents.add("B", R"({"bar": {"type": "integer", "items": [{"$ref": "#/bar"}]}})");
    }

    MemoryDocuments documents;
    DocumentStore store;
    Resolver resolver{store};
};

TEST_F(ViewTest, ConstructMap) {
    View view{resolver, Address::parse("A")};
    EXPECT_TRUE(view.is_map());
    EXPECT_EQ(view.size(), 7UL);
    EXPECT_EQ(view.address(), Address::parse("A#/"));
}

TEST_F(ViewTest, EmptyKey) {
    documents.add("E", R"({"": {"x": 1}, "y": 2})");
    View view{resolver, Address::parse("E")};
    auto child = as_view(view.get(""));
    EXPECT_EQ(as_object(child.get("x")), 1);
    EXPECT_EQ(child.address(), (Address{"E", {""}}));
    EXPECT_NE(child.address(), view.address());
    EXPECT_EQ(resolver.get(Address{"E", {"", "x"}}), 1);
}

TEST_F(ViewTest, ConstructList) {
    View view{resolver, Address::parse("A#/list"), View::LIST};
    EXPECT_TRUE(view.is_list());
    EXPECT_EQ(view.size(), 3UL);
}

TEST_F(ViewTest, ConstructWrongKind) {
    EXPECT_THROW((View{resolver, Address::parse("A#/list"), View::MAP}), ConstructionTypeError);
    try {
        View view{resolver, Address::parse("A#/title")};
        FAIL();
    } catch (const ConstructionTypeError& error) {
        EXPECT_NE(String{error.what()}.find("string"), String::npos);
    }
}

TEST_F(ViewTest, ConstructThroughReference) {
    View view{resolver, Address::parse("A#/r")};
    EXPECT_EQ(view.address(), Address::parse("B#/bar"));
    EXPECT_EQ(as_object(view.get("type")), "integer");
}

TEST_F(ViewTest, GetScalar) {
    View view{resolver, Address::parse("A")};
    EXPECT_EQ(as_object(view.get("title")), "A");
}

TEST_F(ViewTest, GetNestedMap) {
    View view{resolver, Address::parse("A")};
    auto foo = as_view(view.get("foo"));
    EXPECT_TRUE(foo.is_map());
    EXPECT_EQ(foo.address(), Address::parse("A#/foo"));
    EXPECT_EQ(as_object(foo.get("type")), "string");
}

TEST_F(ViewTest, GetFollowsReference) {
    View view{resolver, Address::parse("A")};
    auto r = view.get("r");
    ASSERT_TRUE(std::holds_alternative<View>(r));
    EXPECT_EQ(as_view(r).address(), Address::parse("B#/bar"));
    EXPECT_EQ(as_object(as_view(r).get("type")), "integer");
}

TEST_F(ViewTest, ReferenceToScalarIsNotWrapped) {
    View view{resolver, Address::parse("A")};
    auto s = view.get("s");
    ASSERT_TRUE(std::holds_alternative<Object>(s));
    EXPECT_EQ(as_object(s), "integer");
}

TEST_F(ViewTest, NonStringRefIsPlainMap) {
    View view{resolver, Address::parse("A")};
    auto odd = as_view(view.get("odd"));
    EXPECT_EQ(as_object(odd.get("$ref")), 7);
    EXPECT_EQ(as_object(odd.get("x")), 1);
}

TEST_F(ViewTest, ListChildren) {
    View view{resolver, Address::parse("A#/list")};
    EXPECT_EQ(as_object(view.get(0)), 1);
    EXPECT_EQ(as_view(view.get(1)).address(), Address::parse("A#/foo"));
    EXPECT_TRUE(as_view(view.get(2)).is_list());
    EXPECT_EQ(as_view(view.get(2)).address(), Address::parse("A#/list/2"));
    EXPECT_EQ(as_object(view.get("0")), 1);
}

TEST_F(ViewTest, ListNonIntegerSegment) {
    View view{resolver, Address::parse("A#/list")};
    EXPECT_THROW(view.get("first"), PointerResolutionError);
    EXPECT_THROW(view.get("1:2"), PointerResolutionError);
    EXPECT_THROW(view.get(-1), PointerResolutionError);
    EXPECT_THROW(view.get(3), PointerResolutionError);
}

TEST_F(ViewTest, MapMissingKey) {
    View view{resolver, Address::parse("A")};
    EXPECT_FALSE(view.contains("nope"));
    EXPECT_THROW(view.get("nope"), PointerResolutionError);
    EXPECT_THROW(view.get(0), PointerResolutionError);
}

TEST_F(ViewTest, EscapedKeyRetrievable) {
    View view{resolver, Address::parse("A")};
    auto ab = as_view(view.get("a/b"));
    EXPECT_EQ(ab.address().to_str(), "A#/a~1b");
    EXPECT_EQ(as_object(ab.get("c~d")), "escaped");

    View direct{resolver, Address::parse(ab.address().to_str())};
    EXPECT_EQ(as_object(direct.get("c~d")), "escaped");
    EXPECT_EQ(resolver.get(Address::parse("A#/a~1b/c~0d")), "escaped");
}

TEST_F(ViewTest, Contains) {
    View view{resolver, Address::parse("A")};
    EXPECT_TRUE(view.contains("r"));
    View list{resolver, Address::parse("A#/list")};
    EXPECT_TRUE(list.contains("2"));
    EXPECT_FALSE(list.contains("3"));
    EXPECT_FALSE(list.contains("x"));
}

TEST_F(ViewTest, KeysItemsValues) {
    View view{resolver, Address::parse("B#/bar")};
    EXPECT_EQ(view.keys(), (KeyList{"type", "items"}));

    auto items = view.items();
    ASSERT_EQ(items.size(), 2UL);
    EXPECT_EQ(items[0].first, "type");
    EXPECT_EQ(as_object(items[0].second), "integer");
    EXPECT_TRUE(as_view(items[1].second).is_list());

    View list{resolver, Address::parse("A#/list")};
    auto values = list.values();
    ASSERT_EQ(values.size(), 3UL);
    EXPECT_EQ(as_object(values[0]), 1);
}

TEST_F(ViewTest, RawKeepsReferences) {
    View view{resolver, Address::parse("A")};
    EXPECT_EQ(view.raw().get("r"), R"({"$ref": "B#/bar"})"_json);
    EXPECT_NE(view.to_json().find("$ref"), String::npos);
}

TEST_F(ViewTest, Expand) {
    View view{resolver, Address::parse("A#/list")};
    EXPECT_EQ(view.expand(), R"([1, {"type": "string"}, [true]])"_json);
}

TEST_F(ViewTest, ExpandCycle) {
    View view{resolver, Address::parse("B#/bar")};
    EXPECT_THROW(view.expand(), ReferenceParseError);
}

TEST_F(ViewTest, EqualityComparesContent) {
    View view{resolver, Address::parse("A#/foo")};
    View same{resolver, Address::parse("A#/list/1")};
    EXPECT_TRUE(view == same);
    EXPECT_TRUE(view == R"({"type": "string"})"_json);
    EXPECT_FALSE(view == R"({"type": "integer"})"_json);
}

TEST_F(ViewTest, FromAddress) {
    auto scalar = View::from_address(resolver, Address::parse("A#/title"));
    EXPECT_EQ(as_object(scalar), "A");
    auto list = View::from_address(resolver, Address::parse("A#/list"));
    EXPECT_TRUE(as_view(list).is_list());
}

TEST_F(ViewTest, ChildrenUseCachedNode) {
    View view{resolver, Address::parse("A")};
    auto cached = resolver.cache_size();
    view.get("foo");
    view.get("list");
    EXPECT_EQ(resolver.cache_size(), cached);
}

TEST_F(ViewTest, FilesystemDocuments) {
    DocumentStore files;
    Resolver file_resolver{files};
    View person{file_resolver, Address::parse(JREF_TEST_DATA "/schemas/person.json")};
    auto home = as_view(as_view(person.get("properties")).get("home"));
    EXPECT_EQ(home.address().document_id(), JREF_TEST_DATA "/schemas/common/address.json");

    auto properties = as_view(home.get("properties"));
    auto resident = as_view(properties.get("resident"));
    EXPECT_EQ(as_object(resident.get("type")), "string");
    EXPECT_EQ(resident.address().to_str(), JREF_TEST_DATA "/schemas/person.json#/properties/name");
}
