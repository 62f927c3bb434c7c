#include "libwnedit/records.hpp"

#include "libwnedit/errors.hpp"

#include <algorithm>
#include <charconv>
#include <utility>

namespace libwnedit {

namespace {
[[nodiscard]] std::string join(const std::vector<std::string>& values) {
    std::string joined;
    for (const auto& value : values) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += value;
    }
    return joined;
}

void require_non_empty(const std::string& value, const char* what) {
    if (value.empty()) {
        throw InvalidShapeError(std::string(what) + " must be non-empty");
    }
}

[[nodiscard]] std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}
}  // namespace

const std::vector<std::string>& supported_lmf_versions() {
    static const std::vector<std::string> versions = {"1.0", "1.1", "1.2", "1.3", "1.4"};
    return versions;
}

void validate_pos(const std::string& pos, const std::string& context, const Vocabulary& vocabulary) {
    if (!vocabulary.is_part_of_speech(pos)) {
        throw InvalidShapeError("Invalid " + context + ": '" + pos + "'. Must be one of: " +
                                join(vocabulary.parts_of_speech()));
    }
}

std::int64_t validate_count(std::int64_t value) {
    if (value < 0) {
        throw InvalidShapeError("Invalid count value: " + std::to_string(value) + ". Must be non-negative");
    }
    return value;
}

std::int64_t validate_count(const std::string& value) {
    const std::string text = trim(value);
    std::int64_t parsed = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (text.empty() || ec != std::errc{} || ptr != end) {
        throw InvalidShapeError("Invalid count value: '" + value + "'. Must be an integer");
    }
    return validate_count(parsed);
}

void validate_adjposition(const std::string& adjposition, const Vocabulary& vocabulary) {
    if (!vocabulary.is_adjposition(adjposition)) {
        throw InvalidShapeError("Invalid adjposition: '" + adjposition + "'. Must be one of: " +
                                join(vocabulary.adjpositions()));
    }
}

void validate_lmf_version(const std::string& lmf_version) {
    const auto& versions = supported_lmf_versions();
    if (std::find(versions.begin(), versions.end(), lmf_version) == versions.end()) {
        throw InvalidShapeError("Unsupported WN-LMF version: '" + lmf_version + "'. Must be one of: " +
                                join(versions));
    }
}

LexicalResource make_lexical_resource(std::vector<Lexicon> lexicons, std::string lmf_version) {
    validate_lmf_version(lmf_version);
    return LexicalResource{std::move(lmf_version), std::move(lexicons)};
}

Lexicon make_lexicon(std::string id,
                     std::string label,
                     std::string language,
                     std::string email,
                     std::string license,
                     std::string version,
                     std::string url,
                     std::string citation,
                     Metadata meta) {
    require_non_empty(id, "lexicon id");
    require_non_empty(version, "lexicon version");
    Lexicon lexicon;
    lexicon.id = std::move(id);
    lexicon.label = std::move(label);
    lexicon.language = std::move(language);
    lexicon.email = std::move(email);
    lexicon.license = std::move(license);
    lexicon.version = std::move(version);
    lexicon.url = std::move(url);
    lexicon.citation = std::move(citation);
    lexicon.meta = std::move(meta);
    return lexicon;
}

LexicalEntry make_lexical_entry(std::string id,
                                Lemma lemma,
                                std::vector<Form> forms,
                                std::vector<Sense> senses,
                                Metadata meta) {
    require_non_empty(id, "entry id");
    require_non_empty(lemma.written_form, "lemma written form");
    LexicalEntry entry;
    entry.id = std::move(id);
    entry.lemma = std::move(lemma);
    entry.forms = std::move(forms);
    entry.senses = std::move(senses);
    entry.meta = std::move(meta);
    return entry;
}

Lemma make_lemma(std::string written_form,
                 std::string pos,
                 std::string script,
                 std::vector<Tag> tags,
                 const Vocabulary& vocabulary) {
    require_non_empty(written_form, "lemma written form");
    validate_pos(pos, "part of speech", vocabulary);
    Lemma lemma;
    lemma.written_form = std::move(written_form);
    lemma.pos = std::move(pos);
    lemma.script = std::move(script);
    lemma.tags = std::move(tags);
    return lemma;
}

Form make_form(std::string written_form, std::string script, std::vector<Tag> tags) {
    require_non_empty(written_form, "form written form");
    Form form;
    form.written_form = std::move(written_form);
    form.script = std::move(script);
    form.tags = std::move(tags);
    return form;
}

Pronunciation make_pronunciation(std::string text,
                                 std::string variety,
                                 std::string notation,
                                 bool phonemic,
                                 std::string audio) {
    require_non_empty(text, "pronunciation");
    return Pronunciation{std::move(text), std::move(variety), std::move(notation), phonemic, std::move(audio)};
}

Sense make_sense(std::string id,
                 std::string synset,
                 std::vector<Relation> relations,
                 std::vector<Example> examples,
                 std::vector<Count> counts,
                 std::string adjposition,
                 Metadata meta,
                 const Vocabulary& vocabulary) {
    require_non_empty(id, "sense id");
    require_non_empty(synset, "sense synset");
    if (!adjposition.empty()) {
        validate_adjposition(adjposition, vocabulary);
    }
    for (const auto& count : counts) {
        (void)validate_count(count.value);
    }
    Sense sense;
    sense.id = std::move(id);
    sense.synset = std::move(synset);
    sense.relations = std::move(relations);
    sense.examples = std::move(examples);
    sense.counts = std::move(counts);
    sense.adjposition = std::move(adjposition);
    sense.meta = std::move(meta);
    return sense;
}

Synset make_synset(std::string id,
                   std::string pos,
                   std::string ili,
                   std::vector<Definition> definitions,
                   std::vector<Example> examples,
                   std::vector<Relation> relations,
                   Metadata meta,
                   const Vocabulary& vocabulary) {
    require_non_empty(id, "synset id");
    validate_pos(pos, "synset part of speech", vocabulary);
    Synset synset;
    synset.id = std::move(id);
    synset.pos = std::move(pos);
    synset.ili = std::move(ili);
    synset.definitions = std::move(definitions);
    synset.examples = std::move(examples);
    synset.relations = std::move(relations);
    synset.meta = std::move(meta);
    return synset;
}

Definition make_definition(std::string text, std::string language, std::string source_sense, Metadata meta) {
    return Definition{std::move(text), std::move(language), std::move(source_sense), std::move(meta)};
}

Example make_example(std::string text, std::string language, Metadata meta) {
    return Example{std::move(text), std::move(language), std::move(meta)};
}

Count make_count(std::int64_t value, Metadata meta) {
    return Count{validate_count(value), std::move(meta)};
}

Count make_count(const std::string& value, Metadata meta) {
    return Count{validate_count(value), std::move(meta)};
}

Relation make_relation(std::string target, std::string type, Metadata meta) {
    require_non_empty(target, "relation target");
    require_non_empty(type, "relation type");
    return Relation{std::move(target), std::move(type), std::move(meta)};
}

SyntacticBehaviour make_syntactic_behaviour(std::string frame, std::vector<std::string> senses, std::string id) {
    require_non_empty(frame, "subcategorization frame");
    return SyntacticBehaviour{std::move(id), std::move(frame), std::move(senses)};
}

}  // namespace libwnedit
