#include "libwnedit/lexicon_editor.hpp"

#include "libwnedit/errors.hpp"
#include "libwnedit/lmf_codec.hpp"
#include "libwnedit/records.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace libwnedit {

namespace {
[[nodiscard]] std::string describe_relation(const std::string& source,
                                            const std::string& type,
                                            const std::string& target) {
    return source + " -" + type + "-> " + target;
}

template <typename Predicate>
void erase_first(std::vector<Relation>& relations, Predicate predicate, const std::string& description) {
    auto it = std::find_if(relations.begin(), relations.end(), predicate);
    if (it == relations.end()) {
        throw NotFoundError("Relation not found: " + description);
    }
    relations.erase(it);
}
}  // namespace

LexiconEditor::LexiconEditor(LexicalResource resource, const std::string& read_lmf_version, EditorOptions options)
    : resource_(std::move(resource)),
      read_lmf_version_(read_lmf_version),
      options_(std::move(options)),
      ids_(options_.id_seed) {
    if (!options_.vocabulary) {
        throw std::invalid_argument("editor requires a vocabulary");
    }
    if (resource_.lexicons.empty()) {
        throw InvalidShapeError("No lexicons found in resource");
    }
    index_.rebuild(active());
}

LexiconEditor LexiconEditor::create_new(const std::string& lexicon_id,
                                        const MetadataOverrides& metadata,
                                        EditorOptions options) {
    if (lexicon_id.empty()) {
        throw InvalidShapeError("lexicon_id is required");
    }
    MetadataOverrides overrides = metadata;
    overrides.id = lexicon_id;
    const NegotiatedMetadata resolved = MetadataNegotiator(options.defaults).resolve(nullptr, {}, overrides);

    std::vector<Lexicon> lexicons;
    lexicons.push_back(make_lexicon(resolved.id,
                                    resolved.label,
                                    resolved.language,
                                    resolved.email,
                                    resolved.license,
                                    resolved.version,
                                    resolved.url,
                                    resolved.citation));
    return LexiconEditor(make_lexical_resource(std::move(lexicons), resolved.write_lmf_version),
                         resolved.read_lmf_version,
                         std::move(options));
}

LexiconEditor LexiconEditor::adopt(LexicalResource resource, const MetadataOverrides& overrides, EditorOptions options) {
    if (resource.lexicons.empty()) {
        throw InvalidShapeError("No lexicons found in resource");
    }
    Lexicon& lexicon = resource.lexicons.front();
    const NegotiatedMetadata resolved =
        MetadataNegotiator(options.defaults).resolve(&lexicon, resource.lmf_version, overrides);
    if (resolved.id.empty()) {
        throw InvalidShapeError("lexicon_id is required");
    }
    MetadataNegotiator::apply(resolved, lexicon);
    resource.lmf_version = resolved.write_lmf_version;
    return LexiconEditor(std::move(resource), resolved.read_lmf_version, std::move(options));
}

LexiconEditor LexiconEditor::from_resource(LexicalResource resource,
                                           const MetadataOverrides& overrides,
                                           EditorOptions options) {
    return adopt(std::move(resource), overrides, std::move(options));
}

LexiconEditor LexiconEditor::load_file(const std::filesystem::path& path,
                                       const MetadataOverrides& overrides,
                                       EditorOptions options) {
    LexicalResource resource = LmfCodec(options.vocabulary).load_file(path);
    return adopt(std::move(resource), overrides, std::move(options));
}

LexiconEditor LexiconEditor::open(const BackingStore& store,
                                  const std::string& specifier,
                                  const MetadataOverrides& overrides,
                                  EditorOptions options,
                                  LoaderOptions loader_options) {
    const DualPathLoader loader(options.vocabulary, loader_options);
    LoadResult loaded = loader.load(store, LexiconLocator::parse(specifier));
    LexiconEditor editor = adopt(std::move(loaded.resource), overrides, std::move(options));
    editor.load_path_ = loaded.path;
    return editor;
}

const Synset& LexiconEditor::create_synset(const std::string& pos,
                                           const std::vector<std::string>& definitions,
                                           const std::vector<std::string>& examples,
                                           const std::vector<std::string>& words,
                                           const std::string& ili,
                                           const std::string& synset_id) {
    validate_pos(pos, "synset part of speech", *options_.vocabulary);
    if (!synset_id.empty() && id_taken(synset_id)) {
        throw InvalidShapeError("Duplicate id: '" + synset_id + "'");
    }
    // Every word is resolved before anything is created.
    for (const auto& word : words) {
        if (word.empty()) {
            throw InvalidShapeError("lemma written form must be non-empty");
        }
        (void)resolve_entry(word, pos);
    }

    Synset synset = make_synset(synset_id.empty() ? generate_id("synset", pos) : synset_id,
                                pos,
                                ili,
                                make_definitions(definitions),
                                make_examples(examples),
                                {},
                                {},
                                *options_.vocabulary);
    auto& synsets = active().synsets;
    auto position = synsets.insert(synsets.end(), std::move(synset));
    index_.on_synset_added(position);

    for (const auto& word : words) {
        LexicalEntry* entry = resolve_entry(word, pos);
        if (entry == nullptr) {
            entry = &insert_entry(word, pos, {}, {});
        }
        attach_sense(*entry, *position);
    }
    return *position;
}

const Synset& LexiconEditor::modify_synset(const std::string& synset_id, const SynsetChanges& changes) {
    Synset& synset = require_synset(synset_id);

    std::vector<Definition> definitions =
        changes.replace_definitions ? make_definitions(*changes.replace_definitions) : synset.definitions;
    for (auto& definition : make_definitions(changes.add_definitions)) {
        definitions.push_back(std::move(definition));
    }
    std::vector<Example> examples =
        changes.replace_examples ? make_examples(*changes.replace_examples) : synset.examples;
    for (auto& example : make_examples(changes.add_examples)) {
        examples.push_back(std::move(example));
    }

    synset.definitions = std::move(definitions);
    synset.examples = std::move(examples);
    if (changes.ili) {
        synset.ili = *changes.ili;
    }
    if (changes.lexfile) {
        synset.lexfile = *changes.lexfile;
    }
    return synset;
}

void LexiconEditor::remove_synset(const std::string& synset_id) {
    const std::string target = synset_id;
    auto position = index_.synset_position(target);
    if (!position) {
        throw NotFoundError("Synset not found: " + target);
    }

    std::unordered_set<std::string> removed{target};
    auto points_at_target = [&target](const Sense& sense) { return sense.synset == target; };
    for (auto& entry : active().entries) {
        const auto before = entry.senses.size();
        for (const auto& sense : entry.senses) {
            if (points_at_target(sense)) {
                removed.insert(sense.id);
                index_.on_sense_removed(sense.id);
            }
        }
        std::erase_if(entry.senses, points_at_target);
        if (entry.senses.size() != before) {
            index_.reindex_senses(entry);
        }
    }
    index_.on_synset_removed(target);
    active().synsets.erase(*position);
    purge_references(removed);
}

RelationResult LexiconEditor::add_synset_relation(const std::string& source_id,
                                                  const std::string& target_id,
                                                  const std::string& relation_type,
                                                  bool validate) {
    Synset& source = require_synset(source_id);
    if (!index_.contains_synset(target_id)) {
        throw NotFoundError("Target synset not found: " + target_id);
    }
    Relation relation = make_relation(target_id, relation_type);
    auto warning = check_relation_type(relation_type,
                                       RelationKind::SynsetToSynset,
                                       *options_.vocabulary,
                                       !validate || !options_.validate_relations);
    source.relations.push_back(relation);
    return RelationResult{std::move(relation), std::move(warning)};
}

RelationResult LexiconEditor::add_sense_relation(const std::string& source_sense_id,
                                                 const std::string& target_id,
                                                 const std::string& relation_type,
                                                 bool validate) {
    Sense& source = require_sense(source_sense_id);
    RelationKind kind = RelationKind::SenseToSense;
    if (index_.contains_sense(target_id)) {
        kind = RelationKind::SenseToSense;
    } else if (index_.contains_synset(target_id)) {
        kind = RelationKind::SenseToSynset;
    } else {
        throw NotFoundError("Target not found: " + target_id);
    }
    Relation relation = make_relation(target_id, relation_type);
    auto warning =
        check_relation_type(relation_type, kind, *options_.vocabulary, !validate || !options_.validate_relations);
    source.relations.push_back(relation);
    return RelationResult{std::move(relation), std::move(warning)};
}

void LexiconEditor::remove_synset_relation(const std::string& source_id,
                                           const std::string& target_id,
                                           const std::string& relation_type) {
    Synset& source = require_synset(source_id);
    erase_first(
        source.relations,
        [&](const Relation& relation) { return relation.target == target_id && relation.type == relation_type; },
        describe_relation(source_id, relation_type, target_id));
}

void LexiconEditor::remove_sense_relation(const std::string& source_sense_id,
                                          const std::string& target_id,
                                          const std::string& relation_type) {
    Sense& source = require_sense(source_sense_id);
    erase_first(
        source.relations,
        [&](const Relation& relation) { return relation.target == target_id && relation.type == relation_type; },
        describe_relation(source_sense_id, relation_type, target_id));
}

const LexicalEntry& LexiconEditor::create_entry(const std::string& lemma,
                                                const std::string& pos,
                                                const std::vector<std::string>& forms,
                                                const std::string& entry_id) {
    if (!entry_id.empty() && id_taken(entry_id)) {
        throw InvalidShapeError("Duplicate id: '" + entry_id + "'");
    }
    return insert_entry(lemma, pos, forms, entry_id);
}

const LexicalEntry& LexiconEditor::add_word_to_synset(const std::string& synset_id,
                                                      const std::string& lemma,
                                                      const std::optional<std::string>& pos) {
    const Synset& synset = require_synset(synset_id);
    if (lemma.empty()) {
        throw InvalidShapeError("lemma written form must be non-empty");
    }
    if (pos && !pos->empty()) {
        validate_pos(*pos, "part of speech", *options_.vocabulary);
    }
    const std::string entry_pos = pos && !pos->empty() ? *pos : synset.pos;
    LexicalEntry* entry = resolve_entry(lemma, entry_pos);
    if (entry == nullptr) {
        entry = &insert_entry(lemma, entry_pos, {}, {});
    }
    return attach_sense(*entry, synset);
}

std::vector<const LexicalEntry*> LexiconEditor::find_entries(const std::string& lemma, const std::string& pos) const {
    const auto matches = index_.entries_by_lemma(lemma, pos);
    return {matches.begin(), matches.end()};
}

void LexiconEditor::remove_entry(const std::string& entry_id) {
    const std::string target = entry_id;
    auto position = index_.entry_position(target);
    if (!position) {
        throw NotFoundError("Entry not found: " + target);
    }
    std::unordered_set<std::string> removed{target};
    for (const auto& sense : (*position)->senses) {
        removed.insert(sense.id);
    }
    index_.on_entry_removed(**position);
    active().entries.erase(*position);
    purge_references(removed);
}

void LexiconEditor::remove_sense(const std::string& sense_id) {
    const std::string target = sense_id;
    LexicalEntry* owner = index_.sense_owner(target);
    if (owner == nullptr) {
        throw NotFoundError("Sense not found: " + target);
    }
    index_.on_sense_removed(target);
    std::erase_if(owner->senses, [&target](const Sense& sense) { return sense.id == target; });
    index_.reindex_senses(*owner);
    purge_references({target});
}

const Sense& LexiconEditor::add_count(const std::string& sense_id, std::int64_t value) {
    Sense& sense = require_sense(sense_id);
    sense.counts.push_back(make_count(value));
    return sense;
}

const Sense& LexiconEditor::set_adjposition(const std::string& sense_id, const std::string& adjposition) {
    Sense& sense = require_sense(sense_id);
    const LexicalEntry* owner = index_.sense_owner(sense_id);
    if (!is_adjective_pos(owner->lemma.pos)) {
        throw InvalidShapeError("adjposition applies only to adjective senses; '" + sense_id +
                                "' belongs to an entry with part of speech '" + owner->lemma.pos + "'");
    }
    validate_adjposition(adjposition, *options_.vocabulary);
    sense.adjposition = adjposition;
    return sense;
}

const Synset* LexiconEditor::get_synset(const std::string& id) const noexcept {
    return index_.synset(id);
}

const LexicalEntry* LexiconEditor::get_entry(const std::string& id) const noexcept {
    return index_.entry(id);
}

const Sense* LexiconEditor::get_sense(const std::string& id) const noexcept {
    return index_.sense(id);
}

void LexiconEditor::set_id(const std::string& lexicon_id) {
    if (lexicon_id.empty()) {
        throw InvalidShapeError("lexicon id must be non-empty");
    }
    active().id = lexicon_id;
}

void LexiconEditor::set_label(const std::string& label) {
    active().label = label;
}

void LexiconEditor::set_version(const std::string& version) {
    if (version.empty()) {
        throw InvalidShapeError("lexicon version must be non-empty");
    }
    active().version = version;
}

void LexiconEditor::set_email(const std::string& email) {
    active().email = email;
}

void LexiconEditor::set_license(const std::string& license) {
    active().license = license;
}

void LexiconEditor::set_url(const std::string& url) {
    active().url = url;
}

void LexiconEditor::set_citation(const std::string& citation) {
    active().citation = citation;
}

void LexiconEditor::update_metadata(const MetadataOverrides& update) {
    // Checked up front so a bad value leaves every field untouched.
    if (update.id && update.id->empty()) {
        throw InvalidShapeError("lexicon id must be non-empty");
    }
    if (update.version && update.version->empty()) {
        throw InvalidShapeError("lexicon version must be non-empty");
    }
    if (update.lmf_version) {
        validate_lmf_version(*update.lmf_version);
    }

    Lexicon& lexicon = active();
    if (update.id) {
        lexicon.id = *update.id;
    }
    if (update.label) {
        lexicon.label = *update.label;
    }
    if (update.language) {
        lexicon.language = *update.language;
    }
    if (update.email) {
        lexicon.email = *update.email;
    }
    if (update.license) {
        lexicon.license = *update.license;
    }
    if (update.version) {
        lexicon.version = *update.version;
    }
    if (update.url) {
        lexicon.url = *update.url;
    }
    if (update.citation) {
        lexicon.citation = *update.citation;
    }
    if (update.lmf_version) {
        resource_.lmf_version = *update.lmf_version;
    }
}

NegotiatedMetadata LexiconEditor::metadata() const {
    const Lexicon& current = lexicon();
    return NegotiatedMetadata{current.id,
                              current.label,
                              current.language,
                              current.email,
                              current.license,
                              current.version,
                              current.url,
                              current.citation,
                              read_lmf_version_,
                              resource_.lmf_version};
}

void LexiconEditor::set_lmf_version(const std::string& lmf_version) {
    validate_lmf_version(lmf_version);
    resource_.lmf_version = lmf_version;
}

LexiconStats LexiconEditor::stats() const noexcept {
    return LexiconStats{index_.synset_count(), index_.entry_count(), index_.sense_count()};
}

std::vector<Complaint> LexiconEditor::validate() const {
    return run_validator();
}

std::vector<std::string> LexiconEditor::check_integrity() const {
    std::vector<std::string> problems = index_.audit(lexicon());
    for (const auto& entry : lexicon().entries) {
        if (entry.senses.empty()) {
            problems.push_back("entry without senses: " + entry.id);
        }
        for (const auto& sense : entry.senses) {
            if (!index_.contains_synset(sense.synset)) {
                problems.push_back("sense " + sense.id + " references missing synset " + sense.synset);
            }
            for (const auto& relation : sense.relations) {
                if (!index_.contains_sense(relation.target) && !index_.contains_synset(relation.target)) {
                    problems.push_back("dangling relation " +
                                       describe_relation(sense.id, relation.type, relation.target));
                }
            }
        }
    }
    for (const auto& synset : lexicon().synsets) {
        for (const auto& relation : synset.relations) {
            if (!index_.contains_synset(relation.target)) {
                problems.push_back("dangling relation " +
                                   describe_relation(synset.id, relation.type, relation.target));
            }
        }
    }
    return problems;
}

std::string LexiconEditor::to_xml() const {
    return LmfCodec(options_.vocabulary).serialize(resource_);
}

std::vector<Complaint> LexiconEditor::export_to(const std::filesystem::path& path, bool validate_first) const {
    std::vector<Complaint> complaints;
    require_integrity();
    if (validate_first) {
        complaints = run_validator();
    }
    LmfCodec(options_.vocabulary).dump_file(resource_, path);
    return complaints;
}

std::vector<Complaint> LexiconEditor::commit(CommitSink& sink, bool validate_first) const {
    std::vector<Complaint> complaints;
    require_integrity();
    if (validate_first) {
        complaints = run_validator();
    }
    sink.commit(resource_);
    return complaints;
}

void LexiconEditor::require_integrity() const {
    const auto problems = check_integrity();
    if (problems.empty()) {
        return;
    }
    std::string message = "Lexicon " + lexicon().id + " violates " + std::to_string(problems.size()) +
                          " integrity check(s): " + problems.front();
    if (problems.size() > 1) {
        message += "; ...";
    }
    throw InvalidShapeError(message);
}

Synset& LexiconEditor::require_synset(const std::string& id) const {
    Synset* synset = index_.synset(id);
    if (synset == nullptr) {
        throw NotFoundError("Synset not found: " + id);
    }
    return *synset;
}

Sense& LexiconEditor::require_sense(const std::string& id) const {
    Sense* sense = index_.sense(id);
    if (sense == nullptr) {
        throw NotFoundError("Sense not found: " + id);
    }
    return *sense;
}

std::string LexiconEditor::generate_id(const std::string& prefix, const std::string& suffix) {
    return ids_.next(lexicon().id, prefix, suffix, [this](const std::string& id) { return id_taken(id); });
}

bool LexiconEditor::id_taken(const std::string& id) const noexcept {
    return index_.contains_entry(id) || index_.contains_sense(id) || index_.contains_synset(id);
}

LexicalEntry* LexiconEditor::resolve_entry(const std::string& lemma, const std::optional<std::string>& pos) const {
    const std::string wanted_pos = pos.value_or(std::string{});
    const auto matches = index_.entries_by_lemma(lemma, wanted_pos);
    if (matches.size() > 1) {
        std::string message = "Lemma '" + lemma + "' matches " + std::to_string(matches.size()) + " entries";
        if (!wanted_pos.empty()) {
            message += " with part of speech '" + wanted_pos + "'";
        } else {
            message += "; give a part of speech";
        }
        throw AmbiguousMatchError(message);
    }
    return matches.empty() ? nullptr : matches.front();
}

LexicalEntry& LexiconEditor::insert_entry(const std::string& lemma,
                                          const std::string& pos,
                                          const std::vector<std::string>& forms,
                                          const std::string& entry_id) {
    Lemma head = make_lemma(lemma, pos, {}, {}, *options_.vocabulary);
    std::vector<Form> variants;
    variants.reserve(forms.size());
    for (const auto& form : forms) {
        variants.push_back(make_form(form));
    }
    LexicalEntry entry = make_lexical_entry(entry_id.empty() ? generate_id(lemma, pos) : entry_id,
                                            std::move(head),
                                            std::move(variants));
    auto& entries = active().entries;
    auto position = entries.insert(entries.end(), std::move(entry));
    index_.on_entry_added(position);
    return *position;
}

LexicalEntry& LexiconEditor::attach_sense(LexicalEntry& entry, const Synset& synset) {
    for (const auto& sense : entry.senses) {
        if (sense.synset == synset.id) {
            return entry;
        }
    }
    std::string sense_id =
        first_free_id(entry.id + "-" + synset.id, [this](const std::string& id) { return id_taken(id); });
    entry.senses.push_back(make_sense(std::move(sense_id), synset.id, {}, {}, {}, {}, {}, *options_.vocabulary));
    index_.on_sense_added(entry, entry.senses.size() - 1);
    return entry;
}

std::vector<Definition> LexiconEditor::make_definitions(const std::vector<std::string>& texts) const {
    std::vector<Definition> definitions;
    definitions.reserve(texts.size());
    for (const auto& text : texts) {
        definitions.push_back(make_definition(text));
    }
    return definitions;
}

std::vector<Example> LexiconEditor::make_examples(const std::vector<std::string>& texts) const {
    std::vector<Example> examples;
    examples.reserve(texts.size());
    for (const auto& text : texts) {
        examples.push_back(make_example(text));
    }
    return examples;
}

void LexiconEditor::purge_references(const std::unordered_set<std::string>& removed_ids) {
    auto dangling = [&removed_ids](const Relation& relation) { return removed_ids.contains(relation.target); };
    auto removed = [&removed_ids](const std::string& id) { return removed_ids.contains(id); };

    Lexicon& current = active();
    for (auto& synset : current.synsets) {
        std::erase_if(synset.relations, dangling);
        for (auto& definition : synset.definitions) {
            if (removed(definition.source_sense)) {
                definition.source_sense.clear();
            }
        }
    }
    for (auto& entry : current.entries) {
        for (auto& sense : entry.senses) {
            std::erase_if(sense.relations, dangling);
        }
        for (auto& behaviour : entry.syntactic_behaviours) {
            std::erase_if(behaviour.senses, removed);
        }
    }
    for (auto& frame : current.frames) {
        std::erase_if(frame.senses, removed);
    }
    sweep_orphaned_entries();
}

void LexiconEditor::sweep_orphaned_entries() {
    auto& entries = active().entries;
    for (auto it = entries.begin(); it != entries.end();) {
        if (it->senses.empty()) {
            index_.on_entry_removed(*it);
            it = entries.erase(it);
        } else {
            ++it;
        }
    }
}

std::vector<Complaint> LexiconEditor::run_validator() const {
    if (!options_.validator) {
        return {};
    }
    return options_.validator->validate(lexicon());
}

}  // namespace libwnedit
