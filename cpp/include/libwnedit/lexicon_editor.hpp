#pragma once

#include "libwnedit/backing_store.hpp"
#include "libwnedit/dual_path_loader.hpp"
#include "libwnedit/id_generator.hpp"
#include "libwnedit/lexicon_index.hpp"
#include "libwnedit/metadata_negotiator.hpp"
#include "libwnedit/record_types.hpp"
#include "libwnedit/relation_validator.hpp"
#include "libwnedit/structural_validator.hpp"
#include "libwnedit/vocabulary.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace libwnedit {

struct EditorOptions {
    std::shared_ptr<const Vocabulary> vocabulary{standard_vocabulary()};
    bool validate_relations{true};
    std::shared_ptr<const ValidationOracle> validator;  // null: validation unavailable
    std::uint64_t id_seed{IdGenerator::kDefaultSeed};
    LexiconDefaults defaults;
};

// Field updates for modify_synset. Additions are appended after replacements.
struct SynsetChanges {
    std::optional<std::vector<std::string>> replace_definitions;
    std::vector<std::string> add_definitions;
    std::optional<std::vector<std::string>> replace_examples;
    std::vector<std::string> add_examples;
    std::optional<std::string> ili;
    std::optional<std::string> lexfile;
};

struct RelationResult {
    Relation relation;
    std::optional<ValidationWarning> warning;

    [[nodiscard]] bool has_warning() const noexcept { return warning.has_value(); }
};

// Edits the first lexicon of a resource in place.
//
// Every mutation validates its inputs before touching any record and keeps
// the lexicon index exactly in step with the records. Removals cascade:
// senses pointing at a removed synset go with it, relations pointing at any
// removed sense or synset are dropped, and entries left without senses are
// swept. Not safe for concurrent use; callers serialize access.
class LexiconEditor {
public:
    [[nodiscard]] static LexiconEditor create_new(const std::string& lexicon_id,
                                                  const MetadataOverrides& metadata = {},
                                                  EditorOptions options = {});

    [[nodiscard]] static LexiconEditor from_resource(LexicalResource resource,
                                                     const MetadataOverrides& overrides = {},
                                                     EditorOptions options = {});

    [[nodiscard]] static LexiconEditor load_file(const std::filesystem::path& path,
                                                 const MetadataOverrides& overrides = {},
                                                 EditorOptions options = {});

    // `specifier` is "id" or "id:version".
    [[nodiscard]] static LexiconEditor open(const BackingStore& store,
                                            const std::string& specifier,
                                            const MetadataOverrides& overrides = {},
                                            EditorOptions options = {},
                                            LoaderOptions loader_options = {});

    LexiconEditor(LexiconEditor&&) noexcept = default;
    LexiconEditor& operator=(LexiconEditor&&) noexcept = default;
    LexiconEditor(const LexiconEditor&) = delete;
    LexiconEditor& operator=(const LexiconEditor&) = delete;

    // Synsets

    const Synset& create_synset(const std::string& pos,
                                const std::vector<std::string>& definitions = {},
                                const std::vector<std::string>& examples = {},
                                const std::vector<std::string>& words = {},
                                const std::string& ili = {},
                                const std::string& synset_id = {});

    const Synset& modify_synset(const std::string& synset_id, const SynsetChanges& changes);

    void remove_synset(const std::string& synset_id);

    // Relations

    RelationResult add_synset_relation(const std::string& source_id,
                                       const std::string& target_id,
                                       const std::string& relation_type,
                                       bool validate = true);

    // `target_id` may name a sense or a synset.
    RelationResult add_sense_relation(const std::string& source_sense_id,
                                      const std::string& target_id,
                                      const std::string& relation_type,
                                      bool validate = true);

    void remove_synset_relation(const std::string& source_id,
                                const std::string& target_id,
                                const std::string& relation_type);

    void remove_sense_relation(const std::string& source_sense_id,
                               const std::string& target_id,
                               const std::string& relation_type);

    // Entries and senses

    const LexicalEntry& create_entry(const std::string& lemma,
                                     const std::string& pos,
                                     const std::vector<std::string>& forms = {},
                                     const std::string& entry_id = {});

    // Reuses the single entry matching `lemma` and `pos`, or creates one when
    // none matches. `pos` defaults to the synset's part of speech. Several
    // matches raise AmbiguousMatchError. An entry already holding a sense for
    // the synset is returned unchanged.
    const LexicalEntry& add_word_to_synset(const std::string& synset_id,
                                           const std::string& lemma,
                                           const std::optional<std::string>& pos = std::nullopt);

    [[nodiscard]] std::vector<const LexicalEntry*> find_entries(const std::string& lemma,
                                                                const std::string& pos = {}) const;

    void remove_entry(const std::string& entry_id);

    void remove_sense(const std::string& sense_id);

    const Sense& add_count(const std::string& sense_id, std::int64_t value);

    // Only for senses of adjective entries.
    const Sense& set_adjposition(const std::string& sense_id, const std::string& adjposition);

    // Lookups, null when absent

    [[nodiscard]] const Synset* get_synset(const std::string& id) const noexcept;

    [[nodiscard]] const LexicalEntry* get_entry(const std::string& id) const noexcept;

    [[nodiscard]] const Sense* get_sense(const std::string& id) const noexcept;

    // Lexicon metadata

    // Renames the lexicon. Record ids keep their old prefix.
    void set_id(const std::string& lexicon_id);

    void set_label(const std::string& label);

    void set_version(const std::string& version);

    void set_email(const std::string& email);

    void set_license(const std::string& license);

    void set_url(const std::string& url);

    void set_citation(const std::string& citation);

    // Applies every field present in `update`.
    void update_metadata(const MetadataOverrides& update);

    [[nodiscard]] NegotiatedMetadata metadata() const;

    void set_lmf_version(const std::string& lmf_version);

    [[nodiscard]] const std::string& read_lmf_version() const noexcept { return read_lmf_version_; }

    [[nodiscard]] const std::string& write_lmf_version() const noexcept { return resource_.lmf_version; }

    // Snapshot and checks

    [[nodiscard]] const LexicalResource& resource() const noexcept { return resource_; }

    [[nodiscard]] const Lexicon& lexicon() const noexcept { return resource_.lexicons.front(); }

    [[nodiscard]] LexiconStats stats() const noexcept;

    [[nodiscard]] bool can_validate() const noexcept { return options_.validator != nullptr; }

    // Complaints from the configured validator; empty when none is configured.
    [[nodiscard]] std::vector<Complaint> validate() const;

    // Index consistency plus the referential invariants; empty when all hold.
    [[nodiscard]] std::vector<std::string> check_integrity() const;

    // Which loader path produced the initial records, when loaded from a store.
    [[nodiscard]] const std::optional<LoadPath>& load_path() const noexcept { return load_path_; }

    // Export and commit

    [[nodiscard]] std::string to_xml() const;

    // Both refuse a lexicon failing check_integrity() with InvalidShapeError.
    // With `validate_first`, the validator's complaints are returned; they
    // never prevent the export.
    std::vector<Complaint> export_to(const std::filesystem::path& path, bool validate_first = false) const;

    std::vector<Complaint> commit(CommitSink& sink, bool validate_first = false) const;

private:
    LexiconEditor(LexicalResource resource, const std::string& read_lmf_version, EditorOptions options);

    [[nodiscard]] static LexiconEditor adopt(LexicalResource resource,
                                             const MetadataOverrides& overrides,
                                             EditorOptions options);

    Lexicon& active() noexcept { return resource_.lexicons.front(); }

    Synset& require_synset(const std::string& id) const;
    Sense& require_sense(const std::string& id) const;

    [[nodiscard]] std::string generate_id(const std::string& prefix, const std::string& suffix);
    [[nodiscard]] bool id_taken(const std::string& id) const noexcept;

    // Returns the entry `lemma` resolves to, or null when a new one is needed.
    [[nodiscard]] LexicalEntry* resolve_entry(const std::string& lemma, const std::optional<std::string>& pos) const;

    LexicalEntry& insert_entry(const std::string& lemma,
                               const std::string& pos,
                               const std::vector<std::string>& forms,
                               const std::string& entry_id);
    LexicalEntry& attach_sense(LexicalEntry& entry, const Synset& synset);

    [[nodiscard]] std::vector<Definition> make_definitions(const std::vector<std::string>& texts) const;
    [[nodiscard]] std::vector<Example> make_examples(const std::vector<std::string>& texts) const;

    // Drops every relation, frame reference and source-sense link that names
    // one of `removed_ids`, then removes entries left without senses.
    void purge_references(const std::unordered_set<std::string>& removed_ids);
    void sweep_orphaned_entries();

    [[nodiscard]] std::vector<Complaint> run_validator() const;
    void require_integrity() const;

    LexicalResource resource_;
    std::string read_lmf_version_;
    EditorOptions options_;
    LexiconIndex index_;
    IdGenerator ids_;
    std::optional<LoadPath> load_path_;
};

}  // namespace libwnedit
