/**
 * @file test_resolver.cpp
 * @brief Tests for the Directive Resolver (GoogleTest)
 *
 * Validates RULES R1-R5 and merge-key folding M1-M4 from Resolver.hpp
 */

#include <gtest/gtest.h>
#include "overlay/Errors.hpp"
#include "overlay/Loader.hpp"
#include "overlay/Merge.hpp"
#include "overlay/Resolver.hpp"

using namespace overlay;

namespace {
Resolution resolve_text(const std::string& yaml) {
    return resolve_directives(parse_yaml(yaml));
}
}

// ============================================================================
// Basics
// ============================================================================

TEST(Resolver, EmptyDocumentHasNoTree) {
    Resolution r = resolve_text("");
    EXPECT_FALSE(r.tree.has_value());
    EXPECT_TRUE(r.resets.empty());
    EXPECT_TRUE(r.overrides.empty());
}

TEST(Resolver, PlainTreeIsTyped) {
    Resolution r = resolve_text(
        "services:\n"
        "  test:\n"
        "    image: foo\n"
        "    command: echo hello\n"
        "    init: true\n"
        "    scale: 2\n"
        "    label: \"2\"\n"
        "    entrypoint: ~\n");

    ASSERT_TRUE(r.tree.has_value());
    const Value& t = (*r.tree)["services"]["test"];
    EXPECT_EQ(t["image"], "foo");
    EXPECT_EQ(t["command"], "echo hello");
    EXPECT_EQ(t["init"], true);
    EXPECT_EQ(t["scale"], 2);
    EXPECT_EQ(t["label"], "2");
    EXPECT_TRUE(t.contains("entrypoint"));
    EXPECT_TRUE(t["entrypoint"].is_null());
}

TEST(Resolver, HandBuiltDocument) {
    Document doc("manual");
    Node* root = doc.make_mapping();
    Node* one = doc.make_scalar("1");
    one->anchor = "x";
    root->entries.emplace_back("a", one);
    root->entries.emplace_back("b", doc.make_alias(one));
    doc.set_root(root);

    Resolution r = resolve_directives(doc);
    EXPECT_EQ(*r.tree, (Value{{"a", 1}, {"b", 1}}));
}

TEST(Resolver, InputGraphIsNotModified) {
    Document doc = parse_yaml(
        "base: &b\n"
        "  image: alpine\n"
        "app:\n"
        "  <<: *b\n"
        "  ports: [80]\n");
    const std::size_t nodes = doc.node_count();
    const std::size_t root_entries = doc.root()->entries.size();

    Resolution first = resolve_directives(doc);
    Resolution second = resolve_directives(doc);

    EXPECT_EQ(*first.tree, *second.tree);
    EXPECT_EQ(doc.node_count(), nodes);
    EXPECT_EQ(doc.root()->entries.size(), root_entries);
}

// ============================================================================
// RULE R1/R2: aliases
// ============================================================================

TEST(ResolverAlias, AliasCopiesTargetValue) {
    Resolution r = resolve_text(
        "x-env: &env\n"
        "  A: 1\n"
        "service:\n"
        "  environment: *env\n");

    EXPECT_EQ((*r.tree)["service"]["environment"], (Value{{"A", 1}}));
    EXPECT_EQ((*r.tree)["x-env"], (Value{{"A", 1}}));
}

TEST(ResolverAlias, SequenceAliasIsFlattened) {
    Resolution r = resolve_text(
        "x-app:\n"
        "  volumes: &app-volumes\n"
        "    - /data/app:/app/data\n"
        "services:\n"
        "  app:\n"
        "    image: myapp:latest\n"
        "    volumes:\n"
        "      - *app-volumes\n"
        "      - /logs/app:/app/logs\n");

    const Value& volumes = (*r.tree)["services"]["app"]["volumes"];
    ASSERT_TRUE(volumes.is_array());
    EXPECT_EQ(volumes, (Value{"/data/app:/app/data", "/logs/app:/app/logs"}));
    EXPECT_EQ((*r.tree)["x-app"]["volumes"], (Value{"/data/app:/app/data"}));
}

TEST(ResolverAlias, NestedSequenceAliasesAreSplicedRecursively) {
    Resolution r = resolve_text(
        "a: &a [1]\n"
        "b: &b [*a, 2]\n"
        "c: [*b, 3]\n");

    EXPECT_EQ((*r.tree)["b"], (Value{1, 2}));
    EXPECT_EQ((*r.tree)["c"], (Value{1, 2, 3}));
}

TEST(ResolverAlias, ResetInsideSplicedSequenceUsesSlot) {
    Resolution r = resolve_text(
        "base: &base [a, !reset b]\n"
        "list: [*base, c]\n");

    EXPECT_EQ((*r.tree)["list"], (Value{"a", "c"}));
    EXPECT_EQ(r.resets.count(Path::parse("list[1]")), 1u);
    EXPECT_EQ(r.resets.count(Path::parse("base[1]")), 1u);
}

TEST(ResolverAlias, LiteralNestedSequenceIsKept) {
    Resolution r = resolve_text(
        "matrix:\n"
        "  - [1, 2]\n"
        "  - [3]\n");

    EXPECT_EQ((*r.tree)["matrix"], Value::parse("[[1, 2], [3]]"));
}

TEST(ResolverAlias, DirectivesApplyAtPointOfUse) {
    Resolution r = resolve_text(
        "x-ports: &ports !override\n"
        "  - 80\n"
        "web:\n"
        "  ports: *ports\n");

    EXPECT_EQ(r.overrides.count(Path::parse("x-ports")), 1u);
    EXPECT_EQ(r.overrides.count(Path::parse("web.ports")), 1u);
    EXPECT_EQ((*r.tree)["web"]["ports"], (Value{80}));
}

// ============================================================================
// RULE R4/R5: directives
// ============================================================================

TEST(ResolverDirective, ResetDropsKeyAndRecordsPath) {
    Resolution r = resolve_text(
        "networks:\n"
        "  test: !reset {}\n"
        "  other: {}\n");

    EXPECT_FALSE((*r.tree)["networks"].contains("test"));
    EXPECT_TRUE((*r.tree)["networks"].contains("other"));
    ASSERT_EQ(r.resets.size(), 1u);
    EXPECT_EQ(r.resets.begin()->render(), "networks.test");
}

TEST(ResolverDirective, ResetScalarAndEmpty) {
    Resolution r = resolve_text(
        "a: !reset 1\n"
        "b: !reset\n"
        "c: 3\n");

    EXPECT_EQ(*r.tree, (Value{{"c", 3}}));
    EXPECT_EQ(r.resets.count(Path::parse("a")), 1u);
    EXPECT_EQ(r.resets.count(Path::parse("b")), 1u);
}

TEST(ResolverDirective, ResetSequenceElement) {
    Resolution r = resolve_text(
        "ports:\n"
        "  - 80\n"
        "  - !reset 443\n"
        "  - 8080\n");

    EXPECT_EQ((*r.tree)["ports"], (Value{80, 8080}));
    EXPECT_EQ(r.resets.count(Path::parse("ports[1]")), 1u);

    // Merged on its own, the element that moved into [1] survives
    MergeEngine engine;
    engine.fold(r);
    EXPECT_EQ(engine.finish().tree["ports"], (Value{80, 8080}));
}

TEST(ResolverDirective, AdjacentResetElementsRecordTheirOwnSlots) {
    Resolution r = resolve_text("x: [!reset a, !reset b, c]\n");

    EXPECT_EQ((*r.tree)["x"], (Value{"c"}));
    EXPECT_EQ(r.resets, (PathSet{Path::parse("x[0]"), Path::parse("x[1]")}));
}

TEST(ResolverDirective, ResetRootHasNoTree) {
    Resolution r = resolve_text("--- !reset {key: value}\n");
    EXPECT_FALSE(r.tree.has_value());
    EXPECT_EQ(r.resets.count(Path()), 1u);
}

TEST(ResolverDirective, OverridePassesValueThrough) {
    Resolution r = resolve_text(
        "networks:\n"
        "  test: !override\n"
        "    name: replaced\n");

    EXPECT_EQ((*r.tree)["networks"]["test"], (Value{{"name", "replaced"}}));
    ASSERT_EQ(r.overrides.size(), 1u);
    EXPECT_EQ(r.overrides.begin()->render(), "networks.test");
    EXPECT_TRUE(r.resets.empty());
}

TEST(ResolverDirective, ResultIsDirectiveFree) {
    Resolution r = resolve_text(
        "a: !override {x: 1}\n"
        "b: !reset [1]\n"
        "c: !custom text\n");

    EXPECT_EQ(*r.tree, (Value{{"a", {{"x", 1}}}, {"c", "text"}}));
}

TEST(ResolverDirective, TaggedScalarErrorCarriesPath) {
    try {
        resolve_text("svc:\n  port: !!int abc\n");
        FAIL() << "Expected TypeError";
    } catch (const TypeError& e) {
        EXPECT_EQ(e.path(), "svc.port");
        EXPECT_EQ(e.expected(), "int");
    }
}

// ============================================================================
// RULE R3 / M1-M4: merge keys
// ============================================================================

TEST(ResolverMergeKey, FieldsAreAdded) {
    Resolution r = resolve_text(
        "x-base: &base\n"
        "  image: alpine\n"
        "  restart: always\n"
        "svc:\n"
        "  <<: *base\n"
        "  ports: [80]\n");

    const Value& svc = (*r.tree)["svc"];
    EXPECT_EQ(svc["image"], "alpine");
    EXPECT_EQ(svc["restart"], "always");
    EXPECT_EQ(svc["ports"], (Value{80}));
    EXPECT_FALSE(svc.contains("<<"));
}

TEST(ResolverMergeKey, MergeSourceScalarWins) {
    // Merged-in scalars take precedence over local ones
    Resolution r = resolve_text(
        "x-app: &app-volumes\n"
        "  image: alpine\n"
        "  volumes:\n"
        "    - /data/app:/app/data\n"
        "services:\n"
        "  app:\n"
        "    image: python\n"
        "    <<: *app-volumes\n"
        "    volumes:\n"
        "      - /logs/app:/app/logs\n");

    const Value& app = (*r.tree)["services"]["app"];
    EXPECT_EQ(app["image"], "alpine");
    EXPECT_EQ(app["volumes"], (Value{"/logs/app:/app/logs", "/data/app:/app/data"}));
}

TEST(ResolverMergeKey, SequenceAppendSkipsDuplicates) {
    Resolution r = resolve_text(
        "x-m: &m\n"
        "  list: [b, d, a, e]\n"
        "f:\n"
        "  list: [a, b, c]\n"
        "  <<: *m\n");

    EXPECT_EQ((*r.tree)["f"]["list"], (Value{"a", "b", "c", "d", "e"}));
}

TEST(ResolverMergeKey, MappingConflictsAreLeftAlone) {
    Resolution r = resolve_text(
        "x-m: &m\n"
        "  logging: {driver: syslog, opts: 1}\n"
        "  ports: [80]\n"
        "svc:\n"
        "  <<: *m\n"
        "  logging: {driver: json-file}\n"
        "  ports: none\n");

    const Value& svc = (*r.tree)["svc"];
    EXPECT_EQ(svc["logging"], (Value{{"driver", "json-file"}}));
    EXPECT_EQ(svc["ports"], "none");
}

TEST(ResolverMergeKey, SequenceOfSources) {
    Resolution r = resolve_text(
        "x-a: &a {one: 1, shared: a}\n"
        "x-b: &b {two: 2, shared: b}\n"
        "svc:\n"
        "  <<: [*a, *b]\n"
        "  shared: local\n");

    const Value& svc = (*r.tree)["svc"];
    EXPECT_EQ(svc["one"], 1);
    EXPECT_EQ(svc["two"], 2);
    // Sources fold in order, each overwriting scalars
    EXPECT_EQ(svc["shared"], "b");
}

TEST(ResolverMergeKey, OverrideInsideSourceRecordedAtPointOfUse) {
    Resolution r = resolve_text(
        "services:\n"
        "  base:\n"
        "    configs:\n"
        "      - source: credentials\n"
        "        target: /credentials/file1\n"
        "  x: &x\n"
        "    extends:\n"
        "      base\n"
        "    configs: !override\n"
        "      - source: credentials\n"
        "        target: /literally-anywhere-else\n"
        "  y:\n"
        "    <<: *x\n"
        "configs:\n"
        "  credentials:\n"
        "    content: |\n"
        "      dummy value\n");

    const Value& t = *r.tree;
    Value expected_configs = Value::parse(
        R"([{"source": "credentials", "target": "/literally-anywhere-else"}])");
    EXPECT_EQ(t["services"]["x"]["configs"], expected_configs);
    EXPECT_EQ(t["services"]["y"]["configs"], expected_configs);
    EXPECT_EQ(t["services"]["y"]["extends"], "base");
    EXPECT_EQ(t["configs"]["credentials"]["content"], "dummy value\n");

    EXPECT_EQ(r.overrides.count(Path::parse("services.x.configs")), 1u);
    EXPECT_EQ(r.overrides.count(Path::parse("services.y.configs")), 1u);
}

TEST(ResolverMergeKey, ScalarSourceIsTypeError) {
    try {
        resolve_text("svc:\n  <<: nope\n");
        FAIL() << "Expected TypeError";
    } catch (const TypeError& e) {
        EXPECT_EQ(e.path(), "svc");
        EXPECT_EQ(e.actual(), "string");
    }
}

TEST(FoldMergeSource, RulesOnValues) {
    Value fields = {
        {"scalar", "local"},
        {"list", {1, 2}},
        {"map", {{"k", "local"}}},
        {"mismatch", {1}}
    };
    Value source = {
        {"scalar", "merged"},
        {"list", {2, 3}},
        {"map", {{"k", "merged"}, {"extra", true}}},
        {"mismatch", "text"},
        {"added", 9}
    };

    fold_merge_source(fields, source);

    EXPECT_EQ(fields["scalar"], "merged");
    EXPECT_EQ(fields["list"], (Value{1, 2, 3}));
    EXPECT_EQ(fields["map"], (Value{{"k", "local"}}));
    EXPECT_EQ(fields["mismatch"], (Value{1}));
    EXPECT_EQ(fields["added"], 9);
}
