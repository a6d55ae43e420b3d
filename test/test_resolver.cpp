#include <gtest/gtest.h>

#include <jref/core/Resolver.h>
#include <jref/support/logging.h>

#include <string_view>
#include <vector>

#include "documents.h"

using namespace jref;

class ResolverTest : public ::testing::Test
{
  protected:
    void SetUp() override {
        store.register_loader(documents.loader());
    }

    MemoryDocuments documents;
    DocumentStore store;
};

TEST_F(ResolverTest, ResolvePlainPath) {
    documents.add("a", R"({"x": {"y": [10, 20, {"z": "deep"}]}})");
    Resolver resolver{store};
    EXPECT_EQ(resolver.get(Address::parse("a#/x/y/1")), 20);
    EXPECT_EQ(resolver.get(Address::parse("a#/x/y/2/z")), "deep");
}

TEST_F(ResolverTest, ResolveRootIsWholeDocument) {
    documents.add("a", R"({"x": 1})");
    Resolver resolver{store};
    auto resolved = resolver.resolve(Address::parse("a"));
    EXPECT_TRUE(resolved.value.is(store.load("a")));
    EXPECT_EQ(resolved.address, Address::parse("a#/"));
}

TEST_F(ResolverTest, ResolveCrossDocumentReference) {
    documents.add("A", R"({"foo": {"type": "string"}, "r": {"$ref": "B#/bar"}})");
    documents.add("B", R"({"bar": {"type": "integer"}})");
    Resolver resolver{store};
    auto resolved = resolver.resolve(Address::parse("A#/r"));
    EXPECT_EQ(resolved.value, R"({"type": "integer"})"_json);
    EXPECT_EQ(resolved.address, Address::parse("B#/bar"));
}

TEST_F(ResolverTest, ResolveThroughReferenceWithRemainingPath) {
    documents.add("A", R"({"r": {"$ref": "B#/bar"}})");
    documents.add("B", R"({"bar": {"type": "integer", "enum": [1, 2]}})");
    Resolver resolver{store};
    auto resolved = resolver.resolve(Address::parse("A#/r/enum/1"));
    EXPECT_EQ(resolved.value, 2);
    EXPECT_EQ(resolved.address, Address::parse("B#/bar/enum/1"));
}

TEST_F(ResolverTest, ResolveChainedReferences) {
    documents.add("A", R"({"a": {"$ref": "#/b"}, "b": {"$ref": "#/c"}, "c": {"leaf": true}})");
    Resolver resolver{store};
    auto resolved = resolver.resolve(Address::parse("A#/a/leaf"));
    EXPECT_EQ(resolved.value, true);
    EXPECT_EQ(resolved.address, Address::parse("A#/c/leaf"));
}

TEST_F(ResolverTest, ResolveRootLevelReference) {
    documents.add("A", R"({"$ref": "B#/defs"})");
    documents.add("B", R"({"defs": {"x": 1}})");
    Resolver resolver{store};
    EXPECT_EQ(resolver.get(Address::parse("A#/x")), 1);
    EXPECT_EQ(resolver.resolve(Address::parse("A")).address, Address::parse("B#/defs"));
}

TEST_F(ResolverTest, ResolveRelativeDocument) {
    documents.add("dir/a.json", R"({"r": {"$ref": "sub/b.json#/v"}})");
    documents.add("dir/sub/b.json", R"({"v": "found"})");
    Resolver resolver{store};
    EXPECT_EQ(resolver.get(Address::parse("dir/a.json#/r")), "found");
}

TEST_F(ResolverTest, NonStringRefIsNotAReference) {
    documents.add("a", R"({"x": {"$ref": 7, "y": 1}})");
    Resolver resolver{store};
    EXPECT_EQ(resolver.get(Address::parse("a#/x/y")), 1);
    EXPECT_EQ(resolver.get(Address::parse("a#/x/$ref")), 7);
}

TEST_F(ResolverTest, ResolveEscapedSegments) {
    documents.add("a", R"({"a/b": {"c~d": 1}})");
    Resolver resolver{store};
    EXPECT_EQ(resolver.get(Address::parse("a#/a~1b/c~0d")), 1);
}

TEST_F(ResolverTest, ResolveLiteralKeyWithSpace) {
    documents.add("a", R"({"with space": 1, "100%": 2})");
    Resolver resolver{store};
    EXPECT_EQ(resolver.get(Address{"a", {"with space"}}), 1);
    EXPECT_EQ(resolver.get(Address{"a", {"100%"}}), 2);
}

TEST_F(ResolverTest, ResolvePercentDecodedFallback) {
    documents.add("a", R"({"with space": 1})");
    Resolver resolver{store};
    EXPECT_EQ(resolver.get(Address::parse("a#/with%20space")), 1);
}

TEST_F(ResolverTest, ResolvedAddressUsesStoredKey) {
    documents.add("a", R"({"with space": {"list": [1, 2]}})");
    Resolver resolver{store};
    auto resolved = resolver.resolve(Address::parse("a#/with%20space"));
    EXPECT_EQ(resolved.address, (Address{"a", {"with space"}}));

    resolved = resolver.resolve(Address::parse("a#/with%20space/list/01"));
    EXPECT_EQ(resolved.address, (Address{"a", {"with space", "list", "1"}}));
    EXPECT_EQ(resolved.value, 2);
}

TEST_F(ResolverTest, MissingKey) {
    documents.add("a", R"({"x": {"y": 1}})");
    Resolver resolver{store};
    try {
        resolver.resolve(Address::parse("a#/x/nope"));
        FAIL();
    } catch (const PointerResolutionError& error) {
        String message{error.what()};
        EXPECT_NE(message.find("a#/x/nope"), String::npos);
        EXPECT_NE(message.find("'nope'"), String::npos);
    }
}

TEST_F(ResolverTest, NotAnArrayIndex) {
    documents.add("a", R"({"list": [1, 2]})");
    Resolver resolver{store};
    try {
        resolver.resolve(Address::parse("a#/list/first"));
        FAIL();
    } catch (const PointerResolutionError& error) {
        EXPECT_NE(String{error.what()}.find("not an array index"), String::npos);
    }
    EXPECT_THROW(resolver.resolve(Address::parse("a#/list/-1")), PointerResolutionError);
    EXPECT_THROW(resolver.resolve(Address::parse("a#/list/2")), PointerResolutionError);
}

TEST_F(ResolverTest, IndexIntoScalar) {
    documents.add("a", R"({"x": 1})");
    Resolver resolver{store};
    EXPECT_THROW(resolver.resolve(Address::parse("a#/x/y")), PointerResolutionError);
}

TEST_F(ResolverTest, DefaultValue) {
    documents.add("a", R"({"x": {"y": 1}, "r": {"$ref": "#/x"}})");
    Resolver resolver{store};
    auto resolved = resolver.resolve(Address::parse("a#/x/nope"), "fallback");
    EXPECT_EQ(resolved.value, "fallback");
    EXPECT_EQ(resolved.address, Address::parse("a#/x/nope"));

    EXPECT_EQ(resolver.resolve(Address::parse("a#/r/nope"), nil).value, nil);
    EXPECT_EQ(resolver.resolve(Address::parse("a#/x/y"), nil).value, 1);
}

TEST_F(ResolverTest, DefaultValueIsNotCached) {
    documents.add("a", R"({"x": 1})");
    Resolver resolver{store};
    resolver.resolve(Address::parse("a#/nope"), 0);
    EXPECT_EQ(resolver.cache_size(), 0UL);
    EXPECT_THROW(resolver.resolve(Address::parse("a#/nope")), PointerResolutionError);
}

TEST_F(ResolverTest, DefaultDoesNotHideLoadErrors) {
    Resolver resolver{store};
    EXPECT_THROW(resolver.resolve(Address::parse("missing/doc.json#/x"), nil), DocumentParseError);
}

TEST_F(ResolverTest, LoadErrorNamesAddress) {
    Resolver resolver{store};
    try {
        resolver.resolve(Address::parse("missing/doc.json#/x"));
        FAIL();
    } catch (const DocumentParseError& error) {
        EXPECT_NE(String{error.what()}.find("Failed to load base document of missing/doc.json#/x"), String::npos);
    }
}

TEST_F(ResolverTest, MemoizedAndLoadedOnce) {
    documents.add("A", R"({"r": {"$ref": "B#/bar"}, "s": {"$ref": "B#/bar"}})");
    documents.add("B", R"({"bar": {"type": "integer"}})");
    Resolver resolver{store};

    auto first = resolver.resolve(Address::parse("A#/r"));
    auto second = resolver.resolve(Address::parse("A#/r"));
    EXPECT_EQ(first.value, second.value);
    EXPECT_TRUE(first.value.is(second.value));

    resolver.resolve(Address::parse("A#/s"));
    EXPECT_EQ(documents.load_count("A"), 1);
    EXPECT_EQ(documents.load_count("B"), 1);
}

TEST_F(ResolverTest, CacheClear) {
    documents.add("a", R"({"x": 1})");
    Resolver resolver{store};
    resolver.resolve(Address::parse("a#/x"));
    EXPECT_EQ(resolver.cache_size(), 1UL);
    resolver.cache_clear();
    EXPECT_EQ(resolver.cache_size(), 0UL);
    EXPECT_EQ(resolver.get(Address::parse("a#/x")), 1);
    EXPECT_EQ(documents.load_count("a"), 1);
}

TEST_F(ResolverTest, CacheDisabled) {
    documents.add("a", R"({"x": 1})");
    Resolver resolver{store, Resolver::Options{.cache = false}};
    resolver.resolve(Address::parse("a#/x"));
    EXPECT_EQ(resolver.cache_size(), 0UL);
}

TEST_F(ResolverTest, ImmediateSelfReference) {
    documents.add("a", R"({"definitions": {"foo": {"$ref": "#/definitions/foo"}}})");
    Resolver resolver{store};
    EXPECT_THROW(resolver.resolve(Address::parse("a#/definitions/foo")), ReferenceParseError);
}

TEST_F(ResolverTest, MultiHopCycle) {
    documents.add("A", R"({"x": {"$ref": "B#/y"}})");
    documents.add("B", R"({"y": {"$ref": "A#/x"}})");
    Resolver resolver{store};
    EXPECT_THROW(resolver.resolve(Address::parse("A#/x")), ReferenceParseError);
    EXPECT_EQ(resolver.cache_size(), 0UL);
}

TEST_F(ResolverTest, CycleIsLogged) {
    documents.add("A", R"({"x": {"$ref": "B#/y"}})");
    documents.add("B", R"({"y": {"$ref": "A#/x"}})");

    std::vector<String> warnings;
    log::set_sink([&warnings] (log::Level level, std::string_view, int, std::string_view message) {
        if (level == log::WARNING) warnings.emplace_back(message);
    });

    Resolver resolver{store};
    EXPECT_THROW(resolver.resolve(Address::parse("A#/x")), ReferenceParseError);

    log::set_level(log::ERROR);
    EXPECT_THROW(resolver.resolve(Address::parse("B#/y")), ReferenceParseError);
    log::set_level(log::WARNING);
    log::set_sink({});

    ASSERT_EQ(warnings.size(), 1UL);
    EXPECT_NE(warnings[0].find("A#/x"), String::npos);
}

TEST_F(ResolverTest, GrowingReferenceChain) {
    documents.add("A", R"({"a": {"$ref": "#/a/b"}})");
    Resolver resolver{store};
    EXPECT_THROW(resolver.resolve(Address::parse("A#/a")), ReferenceParseError);
}

TEST_F(ResolverTest, ToLast) {
    documents.add("a", R"({"x": {"y": [1, 2]}})");
    Resolver resolver{store};
    auto [parent, key] = resolver.to_last(Address::parse("a#/x/y"));
    EXPECT_EQ(parent, R"({"y": [1, 2]})"_json);
    EXPECT_EQ(key, "y");

    auto [root, root_key] = resolver.to_last(Address::parse("a"));
    EXPECT_TRUE(root.is_map());
    EXPECT_EQ(root_key, "");
}

TEST_F(ResolverTest, StoreAccessor) {
    Resolver resolver{store};
    EXPECT_EQ(&resolver.store(), &store);
}

TEST(DefaultResolver, IsPerThreadInstance) {
    auto& resolver = default_resolver();
    EXPECT_EQ(&resolver, &default_resolver());
    EXPECT_EQ(resolver.store().loader_count(), 0UL);
}
