#include <memory>
#include <string>

#include <catch2/catch.hpp>

#include "config_tree.hh"
#include "scrub.hh"

using namespace docmod;

namespace {

// Artifact whose build counts how often it ran
ConfigTree counted_artifact(int& builds, const std::string& name = std::string()) {
    return ConfigTree(Artifact(
        [&builds]() {
            ++builds;
            return std::string("/store/built");
        },
        name));
}

}  // namespace

TEST_CASE("scrub replaces a tagged package with its placeholder") {
    int builds = 0;
    const ConfigTree input = ConfigTree::map({
        {"pkgs", ConfigTree::map({
            {"foo", counted_artifact(builds, "pkgs.foo")},
            {"bar", "text"},
        })},
    });

    const ConfigTree expected = ConfigTree::map({
        {"pkgs", ConfigTree::map({
            {"foo", "${pkgs.foo}"},
            {"bar", "text"},
        })},
    });

    REQUIRE(scrub(input) == expected);
    REQUIRE(builds == 0);
}

TEST_CASE("artifacts without an intrinsic name are named after their position") {
    int builds = 0;
    const ConfigTree input = ConfigTree::map({
        {"a", ConfigTree::map({{"b", ConfigTree::map({{"c", counted_artifact(builds)}})}})},
    });

    const ConfigTree output = scrub(input);

    REQUIRE(get_string(output, "a.b.c") == "${a.b.c}");
}

TEST_CASE("an intrinsic name wins over the tree position") {
    int builds = 0;
    const ConfigTree input = ConfigTree::map({
        {"services", ConfigTree::map({{"foo", ConfigTree::map({{"package", counted_artifact(builds, "pkgs.foo")}})}})},
    });

    REQUIRE(get_string(scrub(input), "services.foo.package") == "${pkgs.foo}");
}

TEST_CASE("scrub preserves the shape of everything that is not an artifact") {
    int builds = 0;
    const ConfigTree input = ConfigTree::map({
        {"empty", ConfigTree::map()},
        {"flag", false},
        {"count", 3},
        {"ratio", 0.5},
        {"none", nullptr},
        {"words", ConfigTree::list({"x", "y"})},
        {"nested", ConfigTree::map({{"deeper", ConfigTree::map({{"leaf", "v"}})}})},
        {"pkg", counted_artifact(builds)},
    });

    const ConfigTree output = scrub(input);

    REQUIRE(output.as_map().size() == input.as_map().size());
    REQUIRE(find(output, "empty")->is_map());
    REQUIRE(find(output, "empty")->as_map().empty());
    REQUIRE(*find(output, "flag") == ConfigTree(false));
    REQUIRE(*find(output, "count") == ConfigTree(3));
    REQUIRE(*find(output, "ratio") == ConfigTree(0.5));
    REQUIRE(find(output, "none")->is_null());
    REQUIRE(*find(output, "words") == ConfigTree::list({"x", "y"}));
    REQUIRE(get_string(output, "nested.deeper.leaf") == "v");
    REQUIRE(get_string(output, "pkg") == "${pkg}");
    REQUIRE(builds == 0);
}

TEST_CASE("artifacts inside lists are scrubbed with indexed paths") {
    int builds = 0;
    const ConfigTree input = ConfigTree::map({
        {"environment", ConfigTree::map({
            {"systemPackages", ConfigTree::list({counted_artifact(builds, "pkgs.hello"), counted_artifact(builds)})},
        })},
    });

    const ConfigTree output = scrub(input);

    REQUIRE(*find(output, "environment.systemPackages") ==
            ConfigTree::list({"${pkgs.hello}", "${environment.systemPackages[1]}"}));
    REQUIRE(builds == 0);
}

TEST_CASE("an artifact at the root is replaced wholesale") {
    int builds = 0;
    REQUIRE(scrub(counted_artifact(builds, "pkgs.root")) == ConfigTree("${pkgs.root}"));

    // Nothing to name it by
    REQUIRE_THROWS_AS(scrub(counted_artifact(builds)), StructuralError);
    REQUIRE(builds == 0);
}

TEST_CASE("placeholders are terminal values and scrubbing twice changes nothing") {
    int builds = 0;
    const ConfigTree input = ConfigTree::map({
        {"pkgs", ConfigTree::map({{"foo", counted_artifact(builds)}, {"bar", "${already.there}"}})},
    });

    const ConfigTree once = scrub(input);
    const ConfigTree twice = scrub(once);

    REQUIRE(twice == once);
    REQUIRE(get_string(once, "pkgs.bar") == "${already.there}");
}

TEST_CASE("scrub_derivations prefixes attribute paths") {
    int builds = 0;
    const ConfigTree pkg_set = ConfigTree::map({
        {"hello", counted_artifact(builds)},
        {"python3Packages", ConfigTree::map({{"requests", counted_artifact(builds)}})},
        {"lib", ConfigTree::map({{"version", "24.05"}})},
    });

    const ConfigTree output = scrub_derivations("pkgs", pkg_set);

    REQUIRE(get_string(output, "hello") == "${pkgs.hello}");
    REQUIRE(get_string(output, "python3Packages.requests") == "${pkgs.python3Packages.requests}");
    REQUIRE(get_string(output, "lib.version") == "24.05");
}

TEST_CASE("a custom predicate decides what counts as an artifact") {
    // Maps tagged type = derivation, named by their own "name" entry
    const ArtifactPredicate is_derivation = [](const ConfigTree& node) {
        return node.is_map() && get_string(node, "type") == "derivation";
    };
    const ArtifactNamer by_name = [](const ConfigTree& node, const std::string&) {
        return get_string(node, "name");
    };

    const ConfigTree input = ConfigTree::map({
        {"tools", ConfigTree::map({
            {"texinfo", ConfigTree::map({{"type", "derivation"}, {"name", "texinfo-7.0"}})},
            {"notes", ConfigTree::map({{"type", "text"}})},
        })},
    });

    const ConfigTree output = scrub(input, is_derivation, by_name);

    REQUIRE(get_string(output, "tools.texinfo") == "${texinfo-7.0}");
    REQUIRE(get_string(output, "tools.notes.type") == "text");
}

TEST_CASE("a map that contains itself is a structural error") {
    auto looping = std::make_shared<ConfigMap>();
    looping->set("name", "loop");
    looping->set("self", ConfigTree(looping));
    const ConfigTree root = ConfigTree::map({{"outer", ConfigTree(looping)}});

    REQUIRE_THROWS_AS(scrub(root), StructuralError);
    REQUIRE_THROWS_WITH(scrub(root), Catch::Contains("outer.self"));

    // Break the reference cycle so the map can be released
    looping->erase("self");
}

TEST_CASE("a subtree shared by two parents is not a cycle") {
    int builds = 0;
    const ConfigTree shared = ConfigTree::map({{"pkg", counted_artifact(builds)}});
    const ConfigTree root = ConfigTree::map({{"left", shared}, {"right", shared}});

    const ConfigTree output = scrub(root);

    REQUIRE(get_string(output, "left.pkg") == "${left.pkg}");
    REQUIRE(get_string(output, "right.pkg") == "${right.pkg}");
}
