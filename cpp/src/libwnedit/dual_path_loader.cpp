#include "libwnedit/dual_path_loader.hpp"

#include "libwnedit/errors.hpp"
#include "libwnedit/lmf_codec.hpp"
#include "libwnedit/records.hpp"
#include "libwnedit/store_schema.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace libwnedit {

namespace {
// Every query binds the lexicon rowid except the first, which binds the id.
constexpr const char* kLexiconsSql =
    "SELECT rowid, id, version, label, language, email, license, url, citation, logo, lmf_version, metadata "
    "FROM lexicons WHERE id = ? ORDER BY rowid";
constexpr const char* kEntriesSql =
    "SELECT rowid, id, pos, metadata FROM entries WHERE lexicon_rowid = ? ORDER BY position";
constexpr const char* kFormsSql =
    "SELECT f.rowid, f.entry_rowid, f.id, f.form, f.script, f.rank "
    "FROM forms f JOIN entries e ON e.rowid = f.entry_rowid "
    "WHERE e.lexicon_rowid = ? ORDER BY f.entry_rowid, f.rank";
constexpr const char* kPronunciationsSql =
    "SELECT p.form_rowid, p.value, p.variety, p.notation, p.phonemic, p.audio "
    "FROM pronunciations p JOIN forms f ON f.rowid = p.form_rowid JOIN entries e ON e.rowid = f.entry_rowid "
    "WHERE e.lexicon_rowid = ? ORDER BY p.form_rowid, p.position";
constexpr const char* kTagsSql =
    "SELECT t.form_rowid, t.tag, t.category "
    "FROM tags t JOIN forms f ON f.rowid = t.form_rowid JOIN entries e ON e.rowid = f.entry_rowid "
    "WHERE e.lexicon_rowid = ? ORDER BY t.form_rowid, t.position";
constexpr const char* kSensesSql =
    "SELECT s.rowid, s.entry_rowid, s.id, ss.id, s.adjposition, s.subcat, s.lexicalized, s.metadata "
    "FROM senses s JOIN entries e ON e.rowid = s.entry_rowid JOIN synsets ss ON ss.rowid = s.synset_rowid "
    "WHERE e.lexicon_rowid = ? ORDER BY s.entry_rowid, s.position";
constexpr const char* kSenseRelationsSql =
    "SELECT r.source_rowid, r.target_id, r.type, r.metadata "
    "FROM sense_relations r JOIN senses s ON s.rowid = r.source_rowid JOIN entries e ON e.rowid = s.entry_rowid "
    "WHERE e.lexicon_rowid = ? ORDER BY r.source_rowid, r.position";
constexpr const char* kSenseExamplesSql =
    "SELECT x.sense_rowid, x.example, x.language, x.metadata "
    "FROM sense_examples x JOIN senses s ON s.rowid = x.sense_rowid JOIN entries e ON e.rowid = s.entry_rowid "
    "WHERE e.lexicon_rowid = ? ORDER BY x.sense_rowid, x.position";
constexpr const char* kCountsSql =
    "SELECT c.sense_rowid, c.count, c.metadata "
    "FROM counts c JOIN senses s ON s.rowid = c.sense_rowid JOIN entries e ON e.rowid = s.entry_rowid "
    "WHERE e.lexicon_rowid = ? ORDER BY c.sense_rowid, c.position";
constexpr const char* kSynsetsSql =
    "SELECT rowid, id, pos, ili, lexfile, lexicalized, metadata "
    "FROM synsets WHERE lexicon_rowid = ? ORDER BY position";
constexpr const char* kDefinitionsSql =
    "SELECT d.synset_rowid, d.definition, d.language, d.source_sense, d.is_ili, d.metadata "
    "FROM definitions d JOIN synsets ss ON ss.rowid = d.synset_rowid "
    "WHERE ss.lexicon_rowid = ? ORDER BY d.synset_rowid, d.position";
constexpr const char* kSynsetExamplesSql =
    "SELECT x.synset_rowid, x.example, x.language, x.metadata "
    "FROM synset_examples x JOIN synsets ss ON ss.rowid = x.synset_rowid "
    "WHERE ss.lexicon_rowid = ? ORDER BY x.synset_rowid, x.position";
constexpr const char* kSynsetRelationsSql =
    "SELECT r.source_rowid, r.target_id, r.type, r.metadata "
    "FROM synset_relations r JOIN synsets ss ON ss.rowid = r.source_rowid "
    "WHERE ss.lexicon_rowid = ? ORDER BY r.source_rowid, r.position";
constexpr const char* kBehavioursSql =
    "SELECT entry_rowid, id, frame, senses FROM syntactic_behaviours "
    "WHERE lexicon_rowid = ? ORDER BY position";

template <typename T>
using Groups = std::unordered_map<std::string, std::vector<T>>;

[[nodiscard]] std::vector<Row> fetch(const BackingStore& store,
                                     const char* sql,
                                     std::size_t columns,
                                     const std::vector<std::string>& params) {
    RowSet result = store.select(sql, params);
    if (result.columns.size() != columns) {
        throw SchemaMismatchError(SchemaMismatchError::Reason::MissingSchemaElement,
                                  "bulk query returned " + std::to_string(result.columns.size()) +
                                      " columns, expected " + std::to_string(columns));
    }
    return std::move(result.rows);
}

[[nodiscard]] std::string value(const Row& row, std::size_t column) {
    return row.at(column).value_or(std::string{});
}

[[nodiscard]] bool flag(const Row& row, std::size_t column) {
    return value(row, column) != "0";
}

template <typename T>
[[nodiscard]] std::vector<T> take(Groups<T>& groups, const std::string& key) {
    auto it = groups.find(key);
    if (it == groups.end()) {
        return {};
    }
    return std::move(it->second);
}

[[nodiscard]] Groups<Relation> fetch_relations(const BackingStore& store,
                                               const char* sql,
                                               const std::vector<std::string>& key) {
    Groups<Relation> relations;
    for (const auto& row : fetch(store, sql, 4, key)) {
        relations[value(row, 0)].push_back(
            make_relation(value(row, 1), value(row, 2), decode_metadata(value(row, 3))));
    }
    return relations;
}

[[nodiscard]] Groups<Example> fetch_examples(const BackingStore& store,
                                             const char* sql,
                                             const std::vector<std::string>& key) {
    Groups<Example> examples;
    for (const auto& row : fetch(store, sql, 4, key)) {
        examples[value(row, 0)].push_back(make_example(value(row, 1), value(row, 2), decode_metadata(value(row, 3))));
    }
    return examples;
}
}  // namespace

DualPathLoader::DualPathLoader(std::shared_ptr<const Vocabulary> vocabulary, LoaderOptions options)
    : vocabulary_(std::move(vocabulary)), options_(options) {
    if (!vocabulary_) {
        throw std::invalid_argument("loader requires a vocabulary");
    }
}

LoadResult DualPathLoader::load(const BackingStore& store, const LexiconLocator& locator) const {
    std::string reason = "bulk load disabled";
    if (options_.allow_fast_path) {
        try {
            return LoadResult{load_fast(store, locator), LoadPath::Fast, {}};
        } catch (const SchemaMismatchError& error) {
            reason = error.what();
        } catch (const BackingStoreError& error) {
            reason = error.what();
        }
        std::cerr << "libwnedit: bulk load of " << locator.to_string() << " failed (" << reason
                  << "); reloading through export\n";
    }
    return LoadResult{load_via_export(store, locator), LoadPath::Fallback, reason};
}

LexicalResource DualPathLoader::load_fast(const BackingStore& store, const LexiconLocator& locator) const {
    const std::string schema = store.schema_version();
    if (schema != kStoreSchemaVersion) {
        throw SchemaMismatchError(SchemaMismatchError::Reason::VersionMismatch,
                                  "store schema version '" + schema + "', bulk loader reads '" +
                                      kStoreSchemaVersion + "'");
    }

    const auto lexicon_rows = fetch(store, kLexiconsSql, 12, {locator.id});
    std::vector<std::string> versions;
    for (const auto& row : lexicon_rows) {
        versions.push_back(value(row, 2));
    }
    const Row& header = lexicon_rows[choose_lexicon_version(locator, versions)];
    const std::vector<std::string> key{value(header, 0)};

    // Children are grouped by owner rowid before their owners are built.
    Groups<Pronunciation> pronunciations;
    for (const auto& row : fetch(store, kPronunciationsSql, 6, key)) {
        pronunciations[value(row, 0)].push_back(
            make_pronunciation(value(row, 1), value(row, 2), value(row, 3), flag(row, 4), value(row, 5)));
    }
    Groups<Tag> tags;
    for (const auto& row : fetch(store, kTagsSql, 3, key)) {
        tags[value(row, 0)].push_back(Tag{value(row, 1), value(row, 2)});
    }
    Groups<Relation> sense_relations = fetch_relations(store, kSenseRelationsSql, key);
    Groups<Example> sense_examples = fetch_examples(store, kSenseExamplesSql, key);
    Groups<Count> counts;
    for (const auto& row : fetch(store, kCountsSql, 3, key)) {
        counts[value(row, 0)].push_back(make_count(value(row, 1), decode_metadata(value(row, 2))));
    }
    Groups<Relation> synset_relations = fetch_relations(store, kSynsetRelationsSql, key);
    Groups<Example> synset_examples = fetch_examples(store, kSynsetExamplesSql, key);
    Groups<Definition> definitions;
    std::unordered_map<std::string, Definition> ili_definitions;
    for (const auto& row : fetch(store, kDefinitionsSql, 6, key)) {
        Definition definition =
            make_definition(value(row, 1), value(row, 2), value(row, 3), decode_metadata(value(row, 5)));
        if (flag(row, 4)) {
            ili_definitions.insert_or_assign(value(row, 0), std::move(definition));
        } else {
            definitions[value(row, 0)].push_back(std::move(definition));
        }
    }
    Groups<SyntacticBehaviour> behaviours;
    std::vector<SyntacticBehaviour> frames;
    for (const auto& row : fetch(store, kBehavioursSql, 4, key)) {
        SyntacticBehaviour behaviour =
            make_syntactic_behaviour(value(row, 2), decode_id_list(value(row, 3)), value(row, 1));
        if (row.at(0)) {
            behaviours[*row.at(0)].push_back(std::move(behaviour));
        } else {
            frames.push_back(std::move(behaviour));
        }
    }

    Groups<Sense> senses;
    for (const auto& row : fetch(store, kSensesSql, 8, key)) {
        const std::string rowid = value(row, 0);
        Sense sense = make_sense(value(row, 2),
                                 value(row, 3),
                                 take(sense_relations, rowid),
                                 take(sense_examples, rowid),
                                 take(counts, rowid),
                                 value(row, 4),
                                 decode_metadata(value(row, 7)),
                                 *vocabulary_);
        sense.subcat = decode_id_list(value(row, 5));
        sense.lexicalized = flag(row, 6);
        senses[value(row, 1)].push_back(std::move(sense));
    }

    std::unordered_map<std::string, std::string> entry_pos;
    const auto entry_rows = fetch(store, kEntriesSql, 4, key);
    for (const auto& row : entry_rows) {
        entry_pos.emplace(value(row, 0), value(row, 2));
    }
    std::unordered_map<std::string, Lemma> lemmas;
    Groups<Form> forms;
    for (const auto& row : fetch(store, kFormsSql, 6, key)) {
        const std::string form_rowid = value(row, 0);
        const std::string entry_rowid = value(row, 1);
        if (value(row, 5) == "0") {
            auto pos = entry_pos.find(entry_rowid);
            Lemma lemma = make_lemma(value(row, 3),
                                     pos == entry_pos.end() ? std::string{} : pos->second,
                                     value(row, 4),
                                     take(tags, form_rowid),
                                     *vocabulary_);
            lemma.pronunciations = take(pronunciations, form_rowid);
            lemmas.insert_or_assign(entry_rowid, std::move(lemma));
        } else {
            Form form = make_form(value(row, 3), value(row, 4), take(tags, form_rowid));
            form.id = value(row, 2);
            form.pronunciations = take(pronunciations, form_rowid);
            forms[entry_rowid].push_back(std::move(form));
        }
    }

    Lexicon lexicon = make_lexicon(value(header, 1),
                                   value(header, 3),
                                   value(header, 4),
                                   value(header, 5),
                                   value(header, 6),
                                   value(header, 2),
                                   value(header, 7),
                                   value(header, 8),
                                   decode_metadata(value(header, 11)));
    lexicon.logo = value(header, 9);

    for (const auto& row : entry_rows) {
        const std::string rowid = value(row, 0);
        auto lemma = lemmas.find(rowid);
        if (lemma == lemmas.end()) {
            throw BackingStoreError("entry without lemma: " + value(row, 1));
        }
        LexicalEntry entry = make_lexical_entry(value(row, 1),
                                                std::move(lemma->second),
                                                take(forms, rowid),
                                                take(senses, rowid),
                                                decode_metadata(value(row, 3)));
        entry.syntactic_behaviours = take(behaviours, rowid);
        lexicon.entries.push_back(std::move(entry));
    }

    for (const auto& row : fetch(store, kSynsetsSql, 7, key)) {
        const std::string rowid = value(row, 0);
        Synset synset = make_synset(value(row, 1),
                                    value(row, 2),
                                    value(row, 3),
                                    take(definitions, rowid),
                                    take(synset_examples, rowid),
                                    take(synset_relations, rowid),
                                    decode_metadata(value(row, 6)),
                                    *vocabulary_);
        if (auto ili = ili_definitions.find(rowid); ili != ili_definitions.end()) {
            synset.ili_definition = std::move(ili->second);
        }
        synset.lexfile = value(row, 4);
        synset.lexicalized = flag(row, 5);
        lexicon.synsets.push_back(std::move(synset));
    }
    lexicon.frames = std::move(frames);
    restrict_to_lmf_version(lexicon, value(header, 10));

    std::vector<Lexicon> lexicons;
    lexicons.push_back(std::move(lexicon));
    return make_lexical_resource(std::move(lexicons), value(header, 10));
}

LexicalResource DualPathLoader::load_via_export(const BackingStore& store, const LexiconLocator& locator) const {
    return LmfCodec(vocabulary_).parse(store.export_lexicon(locator, {}));
}

const char* to_string(LoadPath path) noexcept {
    switch (path) {
        case LoadPath::Fast:
            return "fast";
        case LoadPath::Fallback:
            return "fallback";
    }
    return "unknown";
}

}  // namespace libwnedit
