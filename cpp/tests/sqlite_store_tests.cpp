#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <filesystem>
#include <string>
#include <vector>

#include "libwnedit/errors.hpp"
#include "libwnedit/lmf_codec.hpp"
#include "libwnedit/records.hpp"
#include "libwnedit/sqlite_store.hpp"
#include "libwnedit/store_schema.hpp"

using Catch::Matchers::ContainsSubstring;

namespace {
libwnedit::LexicalResource sample_resource(const std::string& version = "1.0") {
    auto lexicon = libwnedit::make_lexicon("ex", "Example", "en", "a@b.org", "CC-BY", version, "https://example.org",
                                           "", {{"dc:publisher", "Example Press"}});
    lexicon.logo = "https://example.org/logo.png";

    auto canine = libwnedit::make_synset("ex-1", "n", "i46360", {libwnedit::make_definition("a domesticated canine")},
                                         {libwnedit::make_example("a loyal dog")});
    canine.ili_definition = libwnedit::make_definition("a member of the genus Canis");
    canine.lexfile = "noun.animal";
    canine.relations.push_back(libwnedit::make_relation("ex-2", "hypernym", {{"confidenceScore", "0.9"}}));
    lexicon.synsets.push_back(canine);
    lexicon.synsets.push_back(libwnedit::make_synset(
        "ex-2", "n", "", {libwnedit::make_definition("a warm-blooded animal", "en", "ex-mammal-n-2")}));

    auto lemma = libwnedit::make_lemma("dog", "n", "", {libwnedit::Tag{"common", "register"}});
    lemma.pronunciations.push_back(libwnedit::make_pronunciation("dɒɡ", "GB", "", false));
    auto form = libwnedit::make_form("dogs");
    form.id = "ex-dog-n-dogs";
    auto sense = libwnedit::make_sense("ex-dog-n-1", "ex-1", {libwnedit::make_relation("ex-mammal-n-2", "derivation")},
                                       {libwnedit::make_example("The dog barked.")}, {libwnedit::make_count(12)});
    sense.subcat = {"ex-frame-1"};
    auto dog = libwnedit::make_lexical_entry("ex-dog-n", lemma, {form}, {sense});
    dog.syntactic_behaviours.push_back(libwnedit::make_syntactic_behaviour("Somebody ----s", {"ex-dog-n-1"}));
    lexicon.entries.push_back(dog);
    lexicon.entries.push_back(libwnedit::make_lexical_entry("ex-mammal-n", libwnedit::make_lemma("mammal", "n"), {},
                                                            {libwnedit::make_sense("ex-mammal-n-2", "ex-2")}));
    lexicon.frames.push_back(libwnedit::make_syntactic_behaviour("Something ----s", {}, "ex-frame-1"));

    return libwnedit::make_lexical_resource({lexicon});
}
}  // namespace

TEST_CASE("LexiconLocator parses specifiers", "[sqlite_store]") {
    REQUIRE(libwnedit::LexiconLocator::parse("ex") == libwnedit::LexiconLocator{"ex", ""});
    REQUIRE(libwnedit::LexiconLocator::parse("ex:1.0") == libwnedit::LexiconLocator{"ex", "1.0"});
    REQUIRE(libwnedit::LexiconLocator::parse("ex:*") == libwnedit::LexiconLocator{"ex", ""});
    REQUIRE(libwnedit::LexiconLocator::parse("ex:1.0").to_string() == "ex:1.0");
    REQUIRE_THROWS_AS(libwnedit::LexiconLocator::parse(":1.0"), libwnedit::InvalidShapeError);
}

TEST_CASE("Store metadata and id lists survive encoding", "[sqlite_store]") {
    libwnedit::Metadata meta{{"dc:source", "a b"}, {"note", ""}};
    REQUIRE(libwnedit::decode_metadata(libwnedit::encode_metadata(meta)) == meta);
    REQUIRE(libwnedit::decode_metadata("").empty());
    REQUIRE_THROWS_AS(libwnedit::decode_metadata("broken"), libwnedit::BackingStoreError);

    REQUIRE(libwnedit::encode_id_list({"a", "b"}) == "a b");
    REQUIRE(libwnedit::decode_id_list(" a  b ") == std::vector<std::string>{"a", "b"});
}

TEST_CASE("choose_lexicon_version resolves versions", "[sqlite_store]") {
    REQUIRE(libwnedit::choose_lexicon_version({"ex", "2.0"}, {"1.0", "2.0"}) == 1);
    REQUIRE(libwnedit::choose_lexicon_version({"ex", ""}, {"1.0"}) == 0);
    REQUIRE_THROWS_AS(libwnedit::choose_lexicon_version({"ex", ""}, {"1.0", "2.0"}), libwnedit::AmbiguousMatchError);
    REQUIRE_THROWS_AS(libwnedit::choose_lexicon_version({"ex", "3.0"}, {"1.0"}), libwnedit::NotFoundError);
    REQUIRE_THROWS_AS(libwnedit::choose_lexicon_version({"ex", ""}, {}), libwnedit::NotFoundError);
}

TEST_CASE("SqliteStore creates its schema", "[sqlite_store]") {
    libwnedit::SqliteStore store;
    REQUIRE(store.schema_version() == libwnedit::kStoreSchemaVersion);
    REQUIRE(store.lexicons().empty());
    REQUIRE(store.path() == ":memory:");
}

TEST_CASE("SqliteStore commit and read_lexicon preserve every field", "[sqlite_store]") {
    libwnedit::SqliteStore store;
    const auto resource = sample_resource();
    store.commit(resource);

    REQUIRE(store.lexicons() == std::vector<std::string>{"ex:1.0"});
    REQUIRE(store.read_lexicon({"ex", ""}) == resource);
    REQUIRE(store.read_lexicon({"ex", "1.0"}) == resource);
}

TEST_CASE("SqliteStore exports WN-LMF that parses back to the stored lexicon", "[sqlite_store]") {
    libwnedit::SqliteStore store;
    const auto resource = sample_resource();
    store.commit(resource);

    libwnedit::LmfCodec codec;
    REQUIRE(codec.parse(store.export_lexicon({"ex", ""}, "")) == resource);

    const auto downgraded = store.export_lexicon({"ex", ""}, "1.0");
    REQUIRE_THAT(downgraded, ContainsSubstring("WN-LMF-1.0.dtd"));
    REQUIRE_THROWS_AS(store.export_lexicon({"ex", ""}, "9.9"), libwnedit::InvalidShapeError);
    REQUIRE_THROWS_AS(store.export_lexicon({"missing", ""}, ""), libwnedit::NotFoundError);
}

TEST_CASE("SqliteStore rejects a duplicate lexicon without partial writes", "[sqlite_store]") {
    libwnedit::SqliteStore store;
    store.commit(sample_resource("1.0"));

    auto batch = sample_resource("2.0");
    batch.lexicons.push_back(sample_resource("1.0").lexicons.front());
    REQUIRE_THROWS_WITH(store.commit(batch), ContainsSubstring("Lexicon already added: ex:1.0"));
    REQUIRE(store.lexicons() == std::vector<std::string>{"ex:1.0"});
}

TEST_CASE("SqliteStore rejects senses pointing outside the lexicon", "[sqlite_store]") {
    libwnedit::SqliteStore store;
    auto resource = sample_resource();
    resource.lexicons.front().entries.front().senses.front().synset = "ex-404";

    REQUIRE_THROWS_AS(store.commit(resource), libwnedit::BackingStoreError);
    REQUIRE(store.lexicons().empty());
}

TEST_CASE("SqliteStore resolves and removes versions", "[sqlite_store]") {
    libwnedit::SqliteStore store;
    store.commit(sample_resource("1.0"));
    store.commit(sample_resource("2.0"));
    store.commit(libwnedit::make_lexical_resource(
        {libwnedit::make_lexicon("other", "Other", "de", "a@b.org", "CC-BY", "1.0")}));

    REQUIRE_THROWS_AS(store.read_lexicon({"ex", ""}), libwnedit::AmbiguousMatchError);
    REQUIRE(store.read_lexicon({"ex", "2.0"}).lexicons.front().version == "2.0");

    REQUIRE(store.remove("ex:1.0") == 1);
    REQUIRE(store.lexicons() == std::vector<std::string>{"ex:2.0", "other:1.0"});
    REQUIRE(store.remove("ex:*") == 1);
    REQUIRE(store.lexicons() == std::vector<std::string>{"other:1.0"});
    REQUIRE_THROWS_AS(store.remove("ex:*"), libwnedit::NotFoundError);
    REQUIRE_THROWS_AS(store.remove("ex"), libwnedit::NotFoundError);

    // Child rows go with their lexicon.
    auto rows = store.select("SELECT COUNT(*) FROM senses", {});
    REQUIRE(rows.rows.front().front() == std::string("0"));
}

TEST_CASE("SqliteStore select binds parameters and reports columns", "[sqlite_store]") {
    libwnedit::SqliteStore store;
    store.commit(sample_resource());

    auto result = store.select("SELECT id, pos FROM synsets WHERE id = ?", {"ex-2"});
    REQUIRE(result.columns == std::vector<std::string>{"id", "pos"});
    REQUIRE(result.rows.size() == 1);
    REQUIRE(result.rows.front()[1] == std::string("n"));

    auto nulls = store.select("SELECT entry_rowid FROM syntactic_behaviours WHERE id = ?", {"ex-frame-1"});
    REQUIRE(nulls.rows.size() == 1);
    REQUIRE_FALSE(nulls.rows.front().front().has_value());
}

TEST_CASE("SqliteStore maps schema and engine failures", "[sqlite_store]") {
    libwnedit::SqliteStore store;
    REQUIRE_THROWS_AS(store.select("SELECT * FROM no_such_table", {}), libwnedit::SchemaMismatchError);
    REQUIRE_THROWS_AS(store.select("SELECT nope FROM synsets", {}), libwnedit::SchemaMismatchError);
    REQUIRE_THROWS_AS(store.execute("THIS IS NOT SQL"), libwnedit::BackingStoreError);

    try {
        (void)store.select("SELECT * FROM no_such_table", {});
        FAIL("expected a schema mismatch");
    } catch (const libwnedit::SchemaMismatchError& error) {
        REQUIRE(error.reason() == libwnedit::SchemaMismatchError::Reason::MissingSchemaElement);
    }
}

TEST_CASE("SqliteStore persists to a file", "[sqlite_store]") {
    const auto path = std::filesystem::temp_directory_path() / "libwnedit_store_test.db";
    std::filesystem::remove(path);
    {
        libwnedit::SqliteStore store(path.string());
        store.commit(sample_resource());
    }
    {
        libwnedit::SqliteStore store(path.string());
        REQUIRE(store.lexicons() == std::vector<std::string>{"ex:1.0"});
        REQUIRE(store.read_lexicon({"ex", ""}) == sample_resource());
    }
    std::filesystem::remove(path);
}
