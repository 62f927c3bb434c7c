#include <catch2/catch_test_macros.hpp>
#include <set>
#include <string>

#include "libwnedit/id_generator.hpp"

TEST_CASE("IdGenerator produces lexicon-prefixed ids", "[id_generator]") {
    libwnedit::IdGenerator ids;
    const auto id = ids.next("ex", "dog", "n", {});

    REQUIRE(id.rfind("ex-dog-", 0) == 0);
    REQUIRE(id.size() == std::string("ex-dog-").size() + 8 + 2);
    REQUIRE(id.substr(id.size() - 2) == "-n");
}

TEST_CASE("IdGenerator is reproducible for a seed", "[id_generator]") {
    libwnedit::IdGenerator first(7);
    libwnedit::IdGenerator second(7);
    REQUIRE(first.next("ex", "synset", "n", {}) == second.next("ex", "synset", "n", {}));

    second.reseed(7);
    libwnedit::IdGenerator third(7);
    REQUIRE(second.next("ex", "a", "", {}) == third.next("ex", "a", "", {}));
}

TEST_CASE("IdGenerator skips taken ids", "[id_generator]") {
    libwnedit::IdGenerator probe(11);
    const auto blocked = probe.next("ex", "synset", "n", {});

    libwnedit::IdGenerator ids(11);
    const auto id = ids.next("ex", "synset", "n", [&](const std::string& candidate) { return candidate == blocked; });
    REQUIRE(id != blocked);
    REQUIRE(id.rfind("ex-synset-", 0) == 0);
}

TEST_CASE("IdGenerator falls back to a placeholder lexicon prefix", "[id_generator]") {
    libwnedit::IdGenerator ids;
    REQUIRE(ids.next("", "x", "", {}).rfind("custom-x-", 0) == 0);
}

TEST_CASE("sanitize_id_component replaces characters outside XML ids", "[id_generator]") {
    REQUIRE(libwnedit::sanitize_id_component("ice cream") == "ice_cream");
    REQUIRE(libwnedit::sanitize_id_component("rock'n'roll") == "rock_n_roll");
    REQUIRE(libwnedit::sanitize_id_component("well-being_2.0") == "well-being_2.0");
}

TEST_CASE("first_free_id appends a counter when the base is taken", "[id_generator]") {
    std::set<std::string> taken{"ex-dog-n-ex-s1", "ex-dog-n-ex-s1-2"};
    auto is_taken = [&](const std::string& id) { return taken.count(id) > 0; };

    REQUIRE(libwnedit::first_free_id("ex-cat-n-ex-s1", is_taken) == "ex-cat-n-ex-s1");
    REQUIRE(libwnedit::first_free_id("ex-dog-n-ex-s1", is_taken) == "ex-dog-n-ex-s1-3");
}
