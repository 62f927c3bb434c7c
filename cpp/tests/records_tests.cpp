#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_exception.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "libwnedit/errors.hpp"
#include "libwnedit/records.hpp"

using Catch::Matchers::ContainsSubstring;

TEST_CASE("validate_pos accepts every standard tag", "[records]") {
    for (const auto& pos : libwnedit::standard_vocabulary()->parts_of_speech()) {
        REQUIRE_NOTHROW(libwnedit::validate_pos(pos));
    }
}

TEST_CASE("validate_pos lists the allowed tags in its message", "[records]") {
    REQUIRE_THROWS_MATCHES(libwnedit::validate_pos("noun"),
                           libwnedit::InvalidShapeError,
                           Catch::Matchers::Message(
                               "Invalid part of speech: 'noun'. Must be one of: n, v, a, r, s, t, c, p, x, u"));
    REQUIRE_THROWS_WITH(libwnedit::validate_pos("", "synset part of speech"),
                        ContainsSubstring("Invalid synset part of speech: ''"));
}

TEST_CASE("validate_count accepts integers and numeric strings", "[records]") {
    REQUIRE(libwnedit::validate_count(std::int64_t{0}) == 0);
    REQUIRE(libwnedit::validate_count(std::int64_t{42}) == 42);
    REQUIRE(libwnedit::validate_count("17") == 17);
    REQUIRE(libwnedit::validate_count(" 8 ") == 8);
}

TEST_CASE("validate_count rejects negative and non-numeric values", "[records]") {
    REQUIRE_THROWS_AS(libwnedit::validate_count(std::int64_t{-1}), libwnedit::InvalidShapeError);
    REQUIRE_THROWS_AS(libwnedit::validate_count("-3"), libwnedit::InvalidShapeError);
    REQUIRE_THROWS_AS(libwnedit::validate_count("abc"), libwnedit::InvalidShapeError);
    REQUIRE_THROWS_AS(libwnedit::validate_count("4.5"), libwnedit::InvalidShapeError);
    REQUIRE_THROWS_AS(libwnedit::validate_count(""), libwnedit::InvalidShapeError);
}

TEST_CASE("validate_adjposition and validate_lmf_version check their vocabularies", "[records]") {
    REQUIRE_NOTHROW(libwnedit::validate_adjposition("ip"));
    REQUIRE_THROWS_WITH(libwnedit::validate_adjposition("post"),
                        ContainsSubstring("Must be one of: a, ip, p"));

    REQUIRE_NOTHROW(libwnedit::validate_lmf_version("1.0"));
    REQUIRE_NOTHROW(libwnedit::validate_lmf_version("1.4"));
    REQUIRE_THROWS_AS(libwnedit::validate_lmf_version("2.0"), libwnedit::InvalidShapeError);
}

TEST_CASE("Invalid shape errors are invalid_argument", "[records]") {
    REQUIRE_THROWS_AS(libwnedit::validate_pos("z"), std::invalid_argument);
}

TEST_CASE("make_synset validates its part of speech and id", "[records]") {
    auto synset = libwnedit::make_synset("ex-s1", "n", "i123", {libwnedit::make_definition("a dog")});
    REQUIRE(synset.id == "ex-s1");
    REQUIRE(synset.pos == "n");
    REQUIRE(synset.ili == "i123");
    REQUIRE(synset.definitions.size() == 1);
    REQUIRE(synset.lexicalized);

    REQUIRE_THROWS_AS(libwnedit::make_synset("ex-s2", "q"), libwnedit::InvalidShapeError);
    REQUIRE_THROWS_AS(libwnedit::make_synset("", "n"), libwnedit::InvalidShapeError);
}

TEST_CASE("make_sense requires an id and synset and checks adjposition and counts", "[records]") {
    auto sense = libwnedit::make_sense("ex-e1-s1", "ex-s1");
    REQUIRE(sense.lexicalized);
    REQUIRE(sense.adjposition.empty());

    REQUIRE_THROWS_AS(libwnedit::make_sense("", "ex-s1"), libwnedit::InvalidShapeError);
    REQUIRE_THROWS_AS(libwnedit::make_sense("ex-e1-s1", ""), libwnedit::InvalidShapeError);
    REQUIRE_THROWS_AS(libwnedit::make_sense("ex-e1-s1", "ex-s1", {}, {}, {}, "middle"),
                      libwnedit::InvalidShapeError);
    REQUIRE_THROWS_AS(libwnedit::make_sense("ex-e1-s1", "ex-s1", {}, {}, {libwnedit::Count{-2, {}}}),
                      libwnedit::InvalidShapeError);
}

TEST_CASE("make_lexical_entry and make_lemma require a written form", "[records]") {
    auto lemma = libwnedit::make_lemma("dog", "n");
    auto entry = libwnedit::make_lexical_entry("ex-dog-n", lemma, {libwnedit::make_form("dogs")});
    REQUIRE(entry.lemma.written_form == "dog");
    REQUIRE(entry.forms.front().written_form == "dogs");
    REQUIRE(entry.senses.empty());

    REQUIRE_THROWS_AS(libwnedit::make_lemma("", "n"), libwnedit::InvalidShapeError);
    REQUIRE_THROWS_AS(libwnedit::make_lemma("dog", "noun"), libwnedit::InvalidShapeError);
    REQUIRE_THROWS_AS(libwnedit::make_lexical_entry("", lemma), libwnedit::InvalidShapeError);
    REQUIRE_THROWS_AS(libwnedit::make_form(""), libwnedit::InvalidShapeError);
}

TEST_CASE("make_lexicon and make_lexical_resource check required fields", "[records]") {
    auto lexicon = libwnedit::make_lexicon("ex", "Example", "en", "a@b.org", "CC-BY", "1.0");
    REQUIRE(lexicon.entries.empty());
    REQUIRE(lexicon.synsets.empty());

    auto resource = libwnedit::make_lexical_resource({lexicon});
    REQUIRE(resource.lmf_version == libwnedit::kDefaultLmfVersion);
    REQUIRE(resource.lexicons.size() == 1);

    REQUIRE_THROWS_AS(libwnedit::make_lexicon("", "Example", "en", "a@b.org", "CC-BY", "1.0"),
                      libwnedit::InvalidShapeError);
    REQUIRE_THROWS_AS(libwnedit::make_lexicon("ex", "Example", "en", "a@b.org", "CC-BY", ""),
                      libwnedit::InvalidShapeError);
    REQUIRE_THROWS_AS(libwnedit::make_lexical_resource({lexicon}, "0.9"), libwnedit::InvalidShapeError);
}

TEST_CASE("make_relation, make_count and make_syntactic_behaviour", "[records]") {
    auto relation = libwnedit::make_relation("ex-s2", "hypernym", {{"dc:source", "manual"}});
    REQUIRE(relation.target == "ex-s2");
    REQUIRE(relation.meta.at("dc:source") == "manual");
    REQUIRE_THROWS_AS(libwnedit::make_relation("", "hypernym"), libwnedit::InvalidShapeError);
    REQUIRE_THROWS_AS(libwnedit::make_relation("ex-s2", ""), libwnedit::InvalidShapeError);

    REQUIRE(libwnedit::make_count("12").value == 12);
    REQUIRE_THROWS_AS(libwnedit::make_count(std::int64_t{-1}), libwnedit::InvalidShapeError);

    auto frame = libwnedit::make_syntactic_behaviour("Somebody ----s", {"ex-e1-s1"}, "ex-frame-1");
    REQUIRE(frame.senses.size() == 1);
    REQUIRE_THROWS_AS(libwnedit::make_syntactic_behaviour(""), libwnedit::InvalidShapeError);
}

TEST_CASE("make_pronunciation defaults to phonemic", "[records]") {
    auto pronunciation = libwnedit::make_pronunciation("dɒɡ", "GB");
    REQUIRE(pronunciation.phonemic);
    REQUIRE(pronunciation.variety == "GB");
    REQUIRE_THROWS_AS(libwnedit::make_pronunciation(""), libwnedit::InvalidShapeError);
}

TEST_CASE("is_adjective_pos covers head and satellite adjectives", "[records]") {
    REQUIRE(libwnedit::is_adjective_pos("a"));
    REQUIRE(libwnedit::is_adjective_pos("s"));
    REQUIRE_FALSE(libwnedit::is_adjective_pos("n"));
}
