#include <gtest/gtest.h>

#include <cmath>

#include <jref/jref.h>
#include <jref/yaml.h>

using namespace jref;

TEST(Yaml, ParseScalars) {
    auto doc = yaml::parse(R"(
n: ~
t: true
f: False
i: -42
u: 18446744073709551615
o: 0o17
h: 0xff
x: 2.5
e: 1e3
inf: -.inf
s: hello
q: "42"
)");
    EXPECT_TRUE(doc.get("n") == nil);
    EXPECT_EQ(doc.get("t"), true);
    EXPECT_EQ(doc.get("f"), false);
    EXPECT_EQ(doc.get("i").as<Int>(), -42);
    EXPECT_EQ(doc.get("u").as<UInt>(), 18446744073709551615ULL);
    EXPECT_EQ(doc.get("o"), 15);
    EXPECT_EQ(doc.get("h"), 255);
    EXPECT_EQ(doc.get("x").as<Float>(), 2.5);
    EXPECT_EQ(doc.get("e").as<Float>(), 1000.0);
    EXPECT_TRUE(std::isinf(doc.get("inf").as<Float>()));
    EXPECT_EQ(doc.get("s"), "hello");
    EXPECT_EQ(doc.get("q"), "42");
}

TEST(Yaml, ParseContainers) {
    auto doc = yaml::parse(R"(
z: 1
a:
  - x
  - {k: v}
m:
  $ref: '#/z'
)");
    EXPECT_EQ(doc.keys(), (KeyList{"z", "a", "m"}));
    EXPECT_EQ(doc.get("a").get(1).get("k"), "v");
    EXPECT_EQ(doc.get("m").get("$ref"), "#/z");
}

TEST(Yaml, ParseJson) {
    auto doc = yaml::parse(R"({"a": [1, 2], "b": {"c": null}})");
    EXPECT_EQ(doc, R"({"a": [1, 2], "b": {"c": null}})"_json);
}

TEST(Yaml, ParseError) {
    EXPECT_THROW(yaml::parse("a: [1, 2"), parse::SyntaxError);
}

TEST(Yaml, NonScalarKey) {
    EXPECT_THROW(yaml::parse("? [1, 2]\n: x\n"), parse::SyntaxError);
}

TEST(Yaml, DefaultStoreLoadsYaml) {
    DocumentStore store;
    Resolver resolver{store};

    View pet{resolver, Address::parse(JREF_TEST_DATA "/schemas/pet.yaml")};
    EXPECT_EQ(std::get<Object>(pet.get("title")), "Pet");

    auto properties = std::get<View>(pet.get("properties"));
    auto owner = std::get<View>(properties.get("owner"));
    EXPECT_EQ(owner.address().to_str(), JREF_TEST_DATA "/schemas/person.json#/properties/name");

    auto result = materialize(pet);
    EXPECT_EQ(result.get("properties").get("owner"), R"({"type": "string"})"_json);
    EXPECT_EQ(result.get("properties").get("legs").get("default"), 4);
}

TEST(Yaml, DefaultDecoderIsYaml) {
    DefaultLoader loader;
    EXPECT_EQ(loader.decode("schema", "a: 1\n"), R"({"a": 1})"_json);
    EXPECT_EQ(loader.decode("schema", "[1, 2]"), R"([1, 2])"_json);
    EXPECT_EQ(loader.decode("schema.yml", "- x\n"), R"(["x"])"_json);
    EXPECT_THROW(loader.decode("schema.json", "a: 1\n"), parse::SyntaxError);
}

TEST(Yaml, ConfigureRestoresYaml) {
    DefaultLoader loader;
    auto json_decoder = [] (const String& text) { return json::parse(text); };
    loader.associate(".yaml", json_decoder);
    loader.set_default_decoder(json_decoder);
    EXPECT_THROW(loader.decode("schema", "a: 1\n"), parse::SyntaxError);

    yaml::configure(loader);
    EXPECT_EQ(loader.decode("schema", "a: 1\n"), R"({"a": 1})"_json);
    EXPECT_EQ(loader.decode("pet.yaml", "a: 1\n"), R"({"a": 1})"_json);
}
