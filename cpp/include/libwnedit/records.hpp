#pragma once

#include "libwnedit/record_types.hpp"
#include "libwnedit/vocabulary.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace libwnedit {

inline constexpr const char* kDefaultLmfVersion = "1.4";

[[nodiscard]] const std::vector<std::string>& supported_lmf_versions();

// Throws InvalidShapeError naming `context`, e.g. "Invalid part of speech: 'x'. Must be one of: n, v, ...".
void validate_pos(const std::string& pos,
                  const std::string& context = "part of speech",
                  const Vocabulary& vocabulary = *standard_vocabulary());

[[nodiscard]] std::int64_t validate_count(std::int64_t value);

[[nodiscard]] std::int64_t validate_count(const std::string& value);

void validate_adjposition(const std::string& adjposition, const Vocabulary& vocabulary = *standard_vocabulary());

void validate_lmf_version(const std::string& lmf_version);

[[nodiscard]] LexicalResource make_lexical_resource(std::vector<Lexicon> lexicons,
                                                    std::string lmf_version = kDefaultLmfVersion);

[[nodiscard]] Lexicon make_lexicon(std::string id,
                                   std::string label,
                                   std::string language,
                                   std::string email,
                                   std::string license,
                                   std::string version,
                                   std::string url = {},
                                   std::string citation = {},
                                   Metadata meta = {});

[[nodiscard]] LexicalEntry make_lexical_entry(std::string id,
                                              Lemma lemma,
                                              std::vector<Form> forms = {},
                                              std::vector<Sense> senses = {},
                                              Metadata meta = {});

[[nodiscard]] Lemma make_lemma(std::string written_form,
                               std::string pos,
                               std::string script = {},
                               std::vector<Tag> tags = {},
                               const Vocabulary& vocabulary = *standard_vocabulary());

[[nodiscard]] Form make_form(std::string written_form, std::string script = {}, std::vector<Tag> tags = {});

[[nodiscard]] Pronunciation make_pronunciation(std::string text,
                                               std::string variety = {},
                                               std::string notation = {},
                                               bool phonemic = true,
                                               std::string audio = {});

[[nodiscard]] Sense make_sense(std::string id,
                               std::string synset,
                               std::vector<Relation> relations = {},
                               std::vector<Example> examples = {},
                               std::vector<Count> counts = {},
                               std::string adjposition = {},
                               Metadata meta = {},
                               const Vocabulary& vocabulary = *standard_vocabulary());

[[nodiscard]] Synset make_synset(std::string id,
                                 std::string pos,
                                 std::string ili = {},
                                 std::vector<Definition> definitions = {},
                                 std::vector<Example> examples = {},
                                 std::vector<Relation> relations = {},
                                 Metadata meta = {},
                                 const Vocabulary& vocabulary = *standard_vocabulary());

[[nodiscard]] Definition make_definition(std::string text,
                                         std::string language = {},
                                         std::string source_sense = {},
                                         Metadata meta = {});

[[nodiscard]] Example make_example(std::string text, std::string language = {}, Metadata meta = {});

[[nodiscard]] Count make_count(std::int64_t value, Metadata meta = {});

[[nodiscard]] Count make_count(const std::string& value, Metadata meta = {});

[[nodiscard]] Relation make_relation(std::string target, std::string type, Metadata meta = {});

[[nodiscard]] SyntacticBehaviour make_syntactic_behaviour(std::string frame,
                                                          std::vector<std::string> senses = {},
                                                          std::string id = {});

}  // namespace libwnedit
