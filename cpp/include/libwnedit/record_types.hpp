#pragma once

#include <cstdint>
#include <list>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace libwnedit {

// Dublin-Core style attributes (dc:source, confidenceScore, note, ...).
using Metadata = std::map<std::string, std::string>;

struct Tag {
    std::string text;
    std::string category;

    bool operator==(const Tag&) const = default;
};

struct Pronunciation {
    std::string text;
    std::string variety;
    std::string notation;
    bool phonemic{true};
    std::string audio;

    bool operator==(const Pronunciation&) const = default;
};

struct Lemma {
    std::string written_form;
    std::string pos;
    std::string script;
    std::vector<Pronunciation> pronunciations;
    std::vector<Tag> tags;

    bool operator==(const Lemma&) const = default;
};

struct Form {
    std::string written_form;
    std::string id;
    std::string script;
    std::vector<Pronunciation> pronunciations;
    std::vector<Tag> tags;

    bool operator==(const Form&) const = default;
};

struct Definition {
    std::string text;
    std::string language;
    std::string source_sense;
    Metadata meta;

    bool operator==(const Definition&) const = default;
};

struct Example {
    std::string text;
    std::string language;
    Metadata meta;

    bool operator==(const Example&) const = default;
};

struct Count {
    std::int64_t value{0};
    Metadata meta;

    bool operator==(const Count&) const = default;
};

// Used for both synset and sense relations; the owning record is the source.
struct Relation {
    std::string target;
    std::string type;
    Metadata meta;

    bool operator==(const Relation&) const = default;
};

struct SyntacticBehaviour {
    std::string id;
    std::string frame;
    std::vector<std::string> senses;

    bool operator==(const SyntacticBehaviour&) const = default;
};

struct Sense {
    std::string id;
    std::string synset;
    std::vector<Relation> relations;
    std::vector<Example> examples;
    std::vector<Count> counts;
    std::string adjposition;
    std::vector<std::string> subcat;
    bool lexicalized{true};
    Metadata meta;

    bool operator==(const Sense&) const = default;
};

struct LexicalEntry {
    std::string id;
    Lemma lemma;
    std::vector<Form> forms;
    std::vector<Sense> senses;
    std::vector<SyntacticBehaviour> syntactic_behaviours;
    Metadata meta;

    bool operator==(const LexicalEntry&) const = default;
};

struct Synset {
    std::string id;
    std::string pos;
    std::string ili;  // empty when the synset has no interlingual identifier
    std::optional<Definition> ili_definition;
    std::vector<Definition> definitions;
    std::vector<Example> examples;
    std::vector<Relation> relations;
    std::string lexfile;
    bool lexicalized{true};
    Metadata meta;

    bool operator==(const Synset&) const = default;
};

// Entries and synsets live in lists so that index iterators stay valid across
// insertions and removals while document order is preserved.
using EntryList = std::list<LexicalEntry>;
using SynsetList = std::list<Synset>;

struct Lexicon {
    std::string id;
    std::string label;
    std::string language;
    std::string email;
    std::string license;
    std::string version;
    std::string url;
    std::string citation;
    std::string logo;
    EntryList entries;
    SynsetList synsets;
    std::vector<SyntacticBehaviour> frames;
    Metadata meta;

    bool operator==(const Lexicon&) const = default;
};

struct LexicalResource {
    std::string lmf_version;
    std::vector<Lexicon> lexicons;

    bool operator==(const LexicalResource&) const = default;
};

struct LexiconStats {
    std::size_t synsets{0};
    std::size_t entries{0};
    std::size_t senses{0};

    bool operator==(const LexiconStats&) const = default;
};

}  // namespace libwnedit
