#include <catch2/catch_test_macros.hpp>

#include "libwnedit/errors.hpp"
#include "libwnedit/metadata_negotiator.hpp"
#include "libwnedit/records.hpp"

TEST_CASE("MetadataNegotiator uses defaults for a new lexicon", "[metadata_negotiator]") {
    libwnedit::MetadataNegotiator negotiator;
    libwnedit::MetadataOverrides overrides;
    overrides.id = "ex";

    auto resolved = negotiator.resolve(nullptr, {}, overrides);
    REQUIRE(resolved.id == "ex");
    REQUIRE(resolved.label == "ex");
    REQUIRE(resolved.language == "en");
    REQUIRE(resolved.email == "user@example.com");
    REQUIRE(resolved.license == "https://creativecommons.org/licenses/by/4.0/");
    REQUIRE(resolved.version == "1.0");
    REQUIRE(resolved.url.empty());
    REQUIRE(resolved.read_lmf_version == "1.4");
    REQUIRE(resolved.write_lmf_version == "1.4");
}

TEST_CASE("MetadataNegotiator prefers loaded values over defaults", "[metadata_negotiator]") {
    auto loaded = libwnedit::make_lexicon("oewn", "Open English WordNet", "en-GB", "o@e.org", "MIT", "2024",
                                          "https://en-word.net");
    libwnedit::MetadataNegotiator negotiator;

    auto resolved = negotiator.resolve(&loaded, "1.1", {});
    REQUIRE(resolved.id == "oewn");
    REQUIRE(resolved.label == "Open English WordNet");
    REQUIRE(resolved.language == "en-GB");
    REQUIRE(resolved.license == "MIT");
    REQUIRE(resolved.version == "2024");
    REQUIRE(resolved.url == "https://en-word.net");
    REQUIRE(resolved.read_lmf_version == "1.1");
    REQUIRE(resolved.write_lmf_version == "1.1");
}

TEST_CASE("MetadataNegotiator resolves each field independently", "[metadata_negotiator]") {
    auto loaded = libwnedit::make_lexicon("oewn", "", "en-GB", "", "MIT", "2024");
    libwnedit::LexiconDefaults defaults;
    defaults.email = "editor@example.org";
    libwnedit::MetadataNegotiator negotiator(defaults);

    libwnedit::MetadataOverrides overrides;
    overrides.version = "2025";
    overrides.lmf_version = "1.3";

    auto resolved = negotiator.resolve(&loaded, "1.0", overrides);
    REQUIRE(resolved.version == "2025");              // override
    REQUIRE(resolved.license == "MIT");               // loaded
    REQUIRE(resolved.email == "editor@example.org");  // default
    REQUIRE(resolved.label == "oewn");                // falls back to the id
    REQUIRE(resolved.read_lmf_version == "1.0");
    REQUIRE(resolved.write_lmf_version == "1.3");
}

TEST_CASE("MetadataNegotiator rejects unsupported write versions", "[metadata_negotiator]") {
    libwnedit::MetadataNegotiator negotiator;
    libwnedit::MetadataOverrides overrides;
    overrides.id = "ex";
    overrides.lmf_version = "3.0";
    REQUIRE_THROWS_AS(negotiator.resolve(nullptr, {}, overrides), libwnedit::InvalidShapeError);
}

TEST_CASE("MetadataNegotiator apply writes identity fields", "[metadata_negotiator]") {
    auto lexicon = libwnedit::make_lexicon("old", "Old", "en", "a@b.org", "CC-BY", "1.0");
    libwnedit::MetadataNegotiator negotiator;
    libwnedit::MetadataOverrides overrides;
    overrides.id = "new";
    overrides.citation = "Someone (2024)";

    libwnedit::MetadataNegotiator::apply(negotiator.resolve(&lexicon, "1.4", overrides), lexicon);
    REQUIRE(lexicon.id == "new");
    REQUIRE(lexicon.label == "Old");
    REQUIRE(lexicon.citation == "Someone (2024)");
}
