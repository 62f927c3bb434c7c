#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <iterator>
#include <string>

#include "libwnedit/lexicon_index.hpp"
#include "libwnedit/records.hpp"

namespace {
libwnedit::Lexicon sample_lexicon() {
    auto lexicon = libwnedit::make_lexicon("ex", "Example", "en", "a@b.org", "CC-BY", "1.0");
    lexicon.synsets.push_back(libwnedit::make_synset("ex-s1", "n"));
    lexicon.synsets.push_back(libwnedit::make_synset("ex-s2", "v"));
    lexicon.entries.push_back(libwnedit::make_lexical_entry(
        "ex-run-n", libwnedit::make_lemma("run", "n"), {}, {libwnedit::make_sense("ex-run-n-s1", "ex-s1")}));
    lexicon.entries.push_back(libwnedit::make_lexical_entry(
        "ex-run-v", libwnedit::make_lemma("run", "v"), {}, {libwnedit::make_sense("ex-run-v-s2", "ex-s2")}));
    return lexicon;
}
}  // namespace

TEST_CASE("LexiconIndex rebuild covers every record", "[lexicon_index]") {
    auto lexicon = sample_lexicon();
    libwnedit::LexiconIndex index;
    index.rebuild(lexicon);

    REQUIRE(index.entry_count() == 2);
    REQUIRE(index.sense_count() == 2);
    REQUIRE(index.synset_count() == 2);
    REQUIRE(index.entry("ex-run-n") == &lexicon.entries.front());
    REQUIRE(index.synset("ex-s2") == &lexicon.synsets.back());
    REQUIRE(index.sense("ex-run-v-s2") == &lexicon.entries.back().senses.front());
    REQUIRE(index.sense_owner("ex-run-v-s2") == &lexicon.entries.back());
    REQUIRE(index.entry("missing") == nullptr);
    REQUIRE(index.sense("missing") == nullptr);
    REQUIRE(index.audit(lexicon).empty());
}

TEST_CASE("LexiconIndex looks up lemmas with an optional part of speech", "[lexicon_index]") {
    auto lexicon = sample_lexicon();
    libwnedit::LexiconIndex index;
    index.rebuild(lexicon);

    REQUIRE(index.entries_by_lemma("run").size() == 2);
    auto verbs = index.entries_by_lemma("run", "v");
    REQUIRE(verbs.size() == 1);
    REQUIRE(verbs.front()->id == "ex-run-v");
    REQUIRE(index.entries_by_lemma("walk").empty());
}

TEST_CASE("LexiconIndex tracks incremental updates", "[lexicon_index]") {
    auto lexicon = sample_lexicon();
    libwnedit::LexiconIndex index;
    index.rebuild(lexicon);

    auto synset = lexicon.synsets.insert(lexicon.synsets.end(), libwnedit::make_synset("ex-s3", "n"));
    index.on_synset_added(synset);
    auto entry = lexicon.entries.insert(lexicon.entries.end(),
                                        libwnedit::make_lexical_entry("ex-walk-n", libwnedit::make_lemma("walk", "n")));
    index.on_entry_added(entry);
    entry->senses.push_back(libwnedit::make_sense("ex-walk-n-s3", "ex-s3"));
    index.on_sense_added(*entry, 0);
    REQUIRE(index.audit(lexicon).empty());
    REQUIRE(index.sense("ex-walk-n-s3")->synset == "ex-s3");

    // Removing the first sense of an entry shifts the rest.
    entry->senses.push_back(libwnedit::make_sense("ex-walk-n-s1", "ex-s1"));
    index.on_sense_added(*entry, 1);
    index.on_sense_removed("ex-walk-n-s3");
    entry->senses.erase(entry->senses.begin());
    index.reindex_senses(*entry);
    REQUIRE(index.audit(lexicon).empty());
    REQUIRE(index.sense("ex-walk-n-s1") == &entry->senses.front());

    index.on_entry_removed(*entry);
    lexicon.entries.erase(entry);
    index.on_synset_removed("ex-s3");
    lexicon.synsets.erase(synset);
    REQUIRE(index.audit(lexicon).empty());
    REQUIRE_FALSE(index.contains_entry("ex-walk-n"));
    REQUIRE_FALSE(index.contains_sense("ex-walk-n-s1"));
    REQUIRE(index.entries_by_lemma("walk").empty());
}

TEST_CASE("LexiconIndex audit reports records the index missed", "[lexicon_index]") {
    auto lexicon = sample_lexicon();
    libwnedit::LexiconIndex index;
    index.rebuild(lexicon);

    lexicon.synsets.push_back(libwnedit::make_synset("ex-s9", "n"));
    lexicon.entries.front().senses.push_back(libwnedit::make_sense("ex-run-n-s9", "ex-s9"));

    auto problems = index.audit(lexicon);
    REQUIRE_FALSE(problems.empty());
    REQUIRE(std::find(problems.begin(), problems.end(), "synset missing from id index: ex-s9") != problems.end());
    REQUIRE(std::find(problems.begin(), problems.end(), "sense missing from id index: ex-run-n-s9") !=
            problems.end());
}

TEST_CASE("LexiconIndex positions refer to the stored records", "[lexicon_index]") {
    auto lexicon = sample_lexicon();
    libwnedit::LexiconIndex index;
    index.rebuild(lexicon);

    auto position = index.entry_position("ex-run-v");
    REQUIRE(position.has_value());
    REQUIRE(*position == std::next(lexicon.entries.begin()));
    REQUIRE_FALSE(index.synset_position("missing").has_value());

    index.clear();
    REQUIRE(index.entry_count() == 0);
    REQUIRE(index.sense_count() == 0);
    REQUIRE(index.synset_count() == 0);
}
