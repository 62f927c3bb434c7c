#include "libwnedit/sqlite_store.hpp"

#include "libwnedit/errors.hpp"
#include "libwnedit/lmf_codec.hpp"
#include "libwnedit/records.hpp"
#include "libwnedit/store_schema.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace libwnedit {

namespace {
constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS meta (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS lexicons (
    rowid INTEGER PRIMARY KEY,
    id TEXT NOT NULL,
    version TEXT NOT NULL,
    label TEXT NOT NULL,
    language TEXT NOT NULL,
    email TEXT NOT NULL,
    license TEXT NOT NULL,
    url TEXT,
    citation TEXT,
    logo TEXT,
    lmf_version TEXT NOT NULL,
    metadata TEXT,
    UNIQUE (id, version)
);
CREATE TABLE IF NOT EXISTS entries (
    rowid INTEGER PRIMARY KEY,
    id TEXT NOT NULL,
    lexicon_rowid INTEGER NOT NULL REFERENCES lexicons (rowid) ON DELETE CASCADE,
    pos TEXT NOT NULL,
    position INTEGER NOT NULL,
    metadata TEXT
);
CREATE TABLE IF NOT EXISTS forms (
    rowid INTEGER PRIMARY KEY,
    id TEXT,
    entry_rowid INTEGER NOT NULL REFERENCES entries (rowid) ON DELETE CASCADE,
    form TEXT NOT NULL,
    script TEXT,
    rank INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS pronunciations (
    form_rowid INTEGER NOT NULL REFERENCES forms (rowid) ON DELETE CASCADE,
    value TEXT NOT NULL,
    variety TEXT,
    notation TEXT,
    phonemic INTEGER NOT NULL,
    audio TEXT,
    position INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS tags (
    form_rowid INTEGER NOT NULL REFERENCES forms (rowid) ON DELETE CASCADE,
    tag TEXT NOT NULL,
    category TEXT NOT NULL,
    position INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS synsets (
    rowid INTEGER PRIMARY KEY,
    id TEXT NOT NULL,
    lexicon_rowid INTEGER NOT NULL REFERENCES lexicons (rowid) ON DELETE CASCADE,
    pos TEXT NOT NULL,
    ili TEXT,
    lexfile TEXT,
    lexicalized INTEGER NOT NULL,
    position INTEGER NOT NULL,
    metadata TEXT
);
CREATE TABLE IF NOT EXISTS definitions (
    synset_rowid INTEGER NOT NULL REFERENCES synsets (rowid) ON DELETE CASCADE,
    definition TEXT NOT NULL,
    language TEXT,
    source_sense TEXT,
    is_ili INTEGER NOT NULL,
    position INTEGER NOT NULL,
    metadata TEXT
);
CREATE TABLE IF NOT EXISTS synset_examples (
    synset_rowid INTEGER NOT NULL REFERENCES synsets (rowid) ON DELETE CASCADE,
    example TEXT NOT NULL,
    language TEXT,
    position INTEGER NOT NULL,
    metadata TEXT
);
CREATE TABLE IF NOT EXISTS synset_relations (
    source_rowid INTEGER NOT NULL REFERENCES synsets (rowid) ON DELETE CASCADE,
    target_id TEXT NOT NULL,
    type TEXT NOT NULL,
    position INTEGER NOT NULL,
    metadata TEXT
);
CREATE TABLE IF NOT EXISTS senses (
    rowid INTEGER PRIMARY KEY,
    id TEXT NOT NULL,
    entry_rowid INTEGER NOT NULL REFERENCES entries (rowid) ON DELETE CASCADE,
    synset_rowid INTEGER NOT NULL REFERENCES synsets (rowid) ON DELETE CASCADE,
    adjposition TEXT,
    subcat TEXT,
    lexicalized INTEGER NOT NULL,
    position INTEGER NOT NULL,
    metadata TEXT
);
CREATE TABLE IF NOT EXISTS sense_relations (
    source_rowid INTEGER NOT NULL REFERENCES senses (rowid) ON DELETE CASCADE,
    target_id TEXT NOT NULL,
    type TEXT NOT NULL,
    position INTEGER NOT NULL,
    metadata TEXT
);
CREATE TABLE IF NOT EXISTS sense_examples (
    sense_rowid INTEGER NOT NULL REFERENCES senses (rowid) ON DELETE CASCADE,
    example TEXT NOT NULL,
    language TEXT,
    position INTEGER NOT NULL,
    metadata TEXT
);
CREATE TABLE IF NOT EXISTS counts (
    sense_rowid INTEGER NOT NULL REFERENCES senses (rowid) ON DELETE CASCADE,
    count INTEGER NOT NULL,
    position INTEGER NOT NULL,
    metadata TEXT
);
CREATE TABLE IF NOT EXISTS syntactic_behaviours (
    id TEXT,
    lexicon_rowid INTEGER NOT NULL REFERENCES lexicons (rowid) ON DELETE CASCADE,
    entry_rowid INTEGER REFERENCES entries (rowid) ON DELETE CASCADE,
    frame TEXT NOT NULL,
    senses TEXT,
    position INTEGER NOT NULL
);
)sql";

[[noreturn]] void raise_error(const std::string& context, const std::string& detail, int code) {
    const std::string message = context + ": " + detail;
    if (detail.find("no such table") != std::string::npos || detail.find("no such column") != std::string::npos) {
        throw SchemaMismatchError(SchemaMismatchError::Reason::MissingSchemaElement, message);
    }
    throw BackingStoreError(message, code);
}

[[noreturn]] void raise_error(sqlite3* db, int code, const std::string& context) {
    raise_error(context, db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(code), code);
}

void exec(sqlite3* db, const std::string& sql) {
    char* error = nullptr;
    const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &error);
    if (rc != SQLITE_OK) {
        const std::string detail = error != nullptr ? error : sqlite3_errstr(rc);
        sqlite3_free(error);
        raise_error("statement failed", detail, rc);
    }
}

class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        const int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
        if (rc != SQLITE_OK) {
            sqlite3_finalize(stmt_);
            raise_error(db, rc, "could not prepare query");
        }
    }

    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int index, const std::string& value) {
        check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
        return *this;
    }

    Statement& bind(int index, std::int64_t value) {
        check(sqlite3_bind_int64(stmt_, index, value));
        return *this;
    }

    Statement& bind_null(int index) {
        check(sqlite3_bind_null(stmt_, index));
        return *this;
    }

    // True while a row is available.
    bool step() {
        const int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc != SQLITE_DONE) {
            raise_error(db_, rc, "query failed");
        }
        return false;
    }

    // Runs to completion and leaves the statement ready for new bindings.
    void execute() {
        while (step()) {
        }
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    [[nodiscard]] std::string text(int column) const {
        const auto* value = sqlite3_column_text(stmt_, column);
        if (value == nullptr) {
            return {};
        }
        return std::string(reinterpret_cast<const char*>(value), sqlite3_column_bytes(stmt_, column));
    }

    [[nodiscard]] Cell cell(int column) const {
        if (sqlite3_column_type(stmt_, column) == SQLITE_NULL) {
            return std::nullopt;
        }
        return text(column);
    }

    [[nodiscard]] std::int64_t integer(int column) const { return sqlite3_column_int64(stmt_, column); }

    [[nodiscard]] int column_count() const { return sqlite3_column_count(stmt_); }

    [[nodiscard]] std::string column_name(int column) const { return sqlite3_column_name(stmt_, column); }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            raise_error(db_, rc, "could not bind parameter");
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_{nullptr};
};

class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) { exec(db_, "BEGIN"); }

    ~Transaction() {
        if (!finished_ && sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
            std::cerr << "libwnedit: rollback failed: " << sqlite3_errmsg(db_) << '\n';
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        exec(db_, "COMMIT");
        finished_ = true;
    }

private:
    sqlite3* db_;
    bool finished_{false};
};

struct LexiconRow {
    std::int64_t rowid{0};
    std::string lmf_version;
};

[[nodiscard]] LexiconRow resolve_lexicon(sqlite3* db, const LexiconLocator& locator) {
    Statement query(db, "SELECT rowid, version, lmf_version FROM lexicons WHERE id = ? ORDER BY rowid");
    query.bind(1, locator.id);
    std::vector<LexiconRow> rows;
    std::vector<std::string> versions;
    while (query.step()) {
        rows.push_back({query.integer(0), query.text(2)});
        versions.push_back(query.text(1));
    }
    return rows[choose_lexicon_version(locator, versions)];
}

[[nodiscard]] std::vector<Relation> read_relations(sqlite3* db, const char* sql, std::int64_t owner) {
    Statement query(db, sql);
    query.bind(1, owner);
    std::vector<Relation> relations;
    while (query.step()) {
        relations.push_back(make_relation(query.text(0), query.text(1), decode_metadata(query.text(2))));
    }
    return relations;
}

[[nodiscard]] std::vector<Example> read_examples(sqlite3* db, const char* sql, std::int64_t owner) {
    Statement query(db, sql);
    query.bind(1, owner);
    std::vector<Example> examples;
    while (query.step()) {
        examples.push_back(make_example(query.text(0), query.text(1), decode_metadata(query.text(2))));
    }
    return examples;
}

[[nodiscard]] std::vector<SyntacticBehaviour> read_behaviours(Statement& query) {
    std::vector<SyntacticBehaviour> behaviours;
    while (query.step()) {
        behaviours.push_back(make_syntactic_behaviour(query.text(1), decode_id_list(query.text(2)), query.text(0)));
    }
    return behaviours;
}

class RecordReader {
public:
    RecordReader(sqlite3* db, const Vocabulary& vocabulary) : db_(db), vocabulary_(vocabulary) {}

    [[nodiscard]] Lexicon read(std::int64_t lexicon_rowid) const {
        Statement header(db_,
                         "SELECT id, label, language, email, license, version, url, citation, logo, metadata "
                         "FROM lexicons WHERE rowid = ?");
        header.bind(1, lexicon_rowid);
        if (!header.step()) {
            throw NotFoundError("Lexicon row missing: " + std::to_string(lexicon_rowid));
        }
        Lexicon lexicon = make_lexicon(header.text(0),
                                       header.text(1),
                                       header.text(2),
                                       header.text(3),
                                       header.text(4),
                                       header.text(5),
                                       header.text(6),
                                       header.text(7),
                                       decode_metadata(header.text(9)));
        lexicon.logo = header.text(8);

        Statement entries(db_, "SELECT rowid, id, pos, metadata FROM entries WHERE lexicon_rowid = ? ORDER BY position");
        entries.bind(1, lexicon_rowid);
        while (entries.step()) {
            lexicon.entries.push_back(
                read_entry(entries.integer(0), entries.text(1), entries.text(2), decode_metadata(entries.text(3))));
        }

        Statement synsets(db_,
                          "SELECT rowid, id, pos, ili, lexfile, lexicalized, metadata "
                          "FROM synsets WHERE lexicon_rowid = ? ORDER BY position");
        synsets.bind(1, lexicon_rowid);
        while (synsets.step()) {
            lexicon.synsets.push_back(read_synset(synsets));
        }

        Statement frames(db_,
                         "SELECT id, frame, senses FROM syntactic_behaviours "
                         "WHERE lexicon_rowid = ? AND entry_rowid IS NULL ORDER BY position");
        frames.bind(1, lexicon_rowid);
        lexicon.frames = read_behaviours(frames);
        return lexicon;
    }

private:
    [[nodiscard]] LexicalEntry read_entry(std::int64_t rowid,
                                          const std::string& id,
                                          const std::string& pos,
                                          Metadata meta) const {
        Statement forms(db_, "SELECT rowid, id, form, script, rank FROM forms WHERE entry_rowid = ? ORDER BY rank");
        forms.bind(1, rowid);
        std::optional<Lemma> lemma;
        std::vector<Form> variants;
        while (forms.step()) {
            const std::int64_t form_rowid = forms.integer(0);
            if (forms.integer(4) == 0) {
                lemma = make_lemma(forms.text(2), pos, forms.text(3), read_tags(form_rowid), vocabulary_);
                lemma->pronunciations = read_pronunciations(form_rowid);
            } else {
                Form form = make_form(forms.text(2), forms.text(3), read_tags(form_rowid));
                form.id = forms.text(1);
                form.pronunciations = read_pronunciations(form_rowid);
                variants.push_back(std::move(form));
            }
        }
        if (!lemma) {
            throw BackingStoreError("entry without lemma: " + id);
        }

        Statement senses(db_,
                         "SELECT s.rowid, s.id, ss.id, s.adjposition, s.subcat, s.lexicalized, s.metadata "
                         "FROM senses s JOIN synsets ss ON ss.rowid = s.synset_rowid "
                         "WHERE s.entry_rowid = ? ORDER BY s.position");
        senses.bind(1, rowid);
        std::vector<Sense> records;
        while (senses.step()) {
            records.push_back(read_sense(senses));
        }

        LexicalEntry entry =
            make_lexical_entry(id, std::move(*lemma), std::move(variants), std::move(records), std::move(meta));
        Statement behaviours(db_,
                             "SELECT id, frame, senses FROM syntactic_behaviours "
                             "WHERE entry_rowid = ? ORDER BY position");
        behaviours.bind(1, rowid);
        entry.syntactic_behaviours = read_behaviours(behaviours);
        return entry;
    }

    [[nodiscard]] Sense read_sense(Statement& row) const {
        const std::int64_t rowid = row.integer(0);
        Statement counts(db_, "SELECT count, metadata FROM counts WHERE sense_rowid = ? ORDER BY position");
        counts.bind(1, rowid);
        std::vector<Count> values;
        while (counts.step()) {
            values.push_back(make_count(counts.integer(0), decode_metadata(counts.text(1))));
        }
        Sense sense = make_sense(
            row.text(1),
            row.text(2),
            read_relations(db_,
                           "SELECT target_id, type, metadata FROM sense_relations "
                           "WHERE source_rowid = ? ORDER BY position",
                           rowid),
            read_examples(db_,
                          "SELECT example, language, metadata FROM sense_examples "
                          "WHERE sense_rowid = ? ORDER BY position",
                          rowid),
            std::move(values),
            row.text(3),
            decode_metadata(row.text(6)),
            vocabulary_);
        sense.subcat = decode_id_list(row.text(4));
        sense.lexicalized = row.integer(5) != 0;
        return sense;
    }

    [[nodiscard]] Synset read_synset(Statement& row) const {
        const std::int64_t rowid = row.integer(0);
        Statement definitions(db_,
                              "SELECT definition, language, source_sense, is_ili, metadata "
                              "FROM definitions WHERE synset_rowid = ? ORDER BY position");
        definitions.bind(1, rowid);
        std::vector<Definition> texts;
        std::optional<Definition> ili_definition;
        while (definitions.step()) {
            Definition definition = make_definition(definitions.text(0),
                                                    definitions.text(1),
                                                    definitions.text(2),
                                                    decode_metadata(definitions.text(4)));
            if (definitions.integer(3) != 0) {
                ili_definition = std::move(definition);
            } else {
                texts.push_back(std::move(definition));
            }
        }
        Synset synset = make_synset(
            row.text(1),
            row.text(2),
            row.text(3),
            std::move(texts),
            read_examples(db_,
                          "SELECT example, language, metadata FROM synset_examples "
                          "WHERE synset_rowid = ? ORDER BY position",
                          rowid),
            read_relations(db_,
                           "SELECT target_id, type, metadata FROM synset_relations "
                           "WHERE source_rowid = ? ORDER BY position",
                           rowid),
            decode_metadata(row.text(6)),
            vocabulary_);
        synset.ili_definition = std::move(ili_definition);
        synset.lexfile = row.text(4);
        synset.lexicalized = row.integer(5) != 0;
        return synset;
    }

    [[nodiscard]] std::vector<Pronunciation> read_pronunciations(std::int64_t form_rowid) const {
        Statement query(db_,
                        "SELECT value, variety, notation, phonemic, audio FROM pronunciations "
                        "WHERE form_rowid = ? ORDER BY position");
        query.bind(1, form_rowid);
        std::vector<Pronunciation> pronunciations;
        while (query.step()) {
            pronunciations.push_back(
                make_pronunciation(query.text(0), query.text(1), query.text(2), query.integer(3) != 0, query.text(4)));
        }
        return pronunciations;
    }

    [[nodiscard]] std::vector<Tag> read_tags(std::int64_t form_rowid) const {
        Statement query(db_, "SELECT tag, category FROM tags WHERE form_rowid = ? ORDER BY position");
        query.bind(1, form_rowid);
        std::vector<Tag> tags;
        while (query.step()) {
            tags.push_back(Tag{query.text(0), query.text(1)});
        }
        return tags;
    }

    sqlite3* db_;
    const Vocabulary& vocabulary_;
};

// Prepared inserts reused for every record of one commit.
struct Inserts {
    explicit Inserts(sqlite3* db)
        : lexicon(db,
                  "INSERT INTO lexicons (id, version, label, language, email, license, url, citation, logo, "
                  "lmf_version, metadata) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)"),
          entry(db, "INSERT INTO entries (id, lexicon_rowid, pos, position, metadata) VALUES (?, ?, ?, ?, ?)"),
          form(db, "INSERT INTO forms (id, entry_rowid, form, script, rank) VALUES (?, ?, ?, ?, ?)"),
          pronunciation(db,
                        "INSERT INTO pronunciations (form_rowid, value, variety, notation, phonemic, audio, position) "
                        "VALUES (?, ?, ?, ?, ?, ?, ?)"),
          tag(db, "INSERT INTO tags (form_rowid, tag, category, position) VALUES (?, ?, ?, ?)"),
          synset(db,
                 "INSERT INTO synsets (id, lexicon_rowid, pos, ili, lexfile, lexicalized, position, metadata) "
                 "VALUES (?, ?, ?, ?, ?, ?, ?, ?)"),
          definition(db,
                     "INSERT INTO definitions (synset_rowid, definition, language, source_sense, is_ili, position, "
                     "metadata) VALUES (?, ?, ?, ?, ?, ?, ?)"),
          synset_example(db,
                         "INSERT INTO synset_examples (synset_rowid, example, language, position, metadata) "
                         "VALUES (?, ?, ?, ?, ?)"),
          synset_relation(db,
                          "INSERT INTO synset_relations (source_rowid, target_id, type, position, metadata) "
                          "VALUES (?, ?, ?, ?, ?)"),
          sense(db,
                "INSERT INTO senses (id, entry_rowid, synset_rowid, adjposition, subcat, lexicalized, position, "
                "metadata) VALUES (?, ?, ?, ?, ?, ?, ?, ?)"),
          sense_relation(db,
                         "INSERT INTO sense_relations (source_rowid, target_id, type, position, metadata) "
                         "VALUES (?, ?, ?, ?, ?)"),
          sense_example(db,
                        "INSERT INTO sense_examples (sense_rowid, example, language, position, metadata) "
                        "VALUES (?, ?, ?, ?, ?)"),
          count(db, "INSERT INTO counts (sense_rowid, count, position, metadata) VALUES (?, ?, ?, ?)"),
          behaviour(db,
                    "INSERT INTO syntactic_behaviours (id, lexicon_rowid, entry_rowid, frame, senses, position) "
                    "VALUES (?, ?, ?, ?, ?, ?)") {}

    Statement lexicon;
    Statement entry;
    Statement form;
    Statement pronunciation;
    Statement tag;
    Statement synset;
    Statement definition;
    Statement synset_example;
    Statement synset_relation;
    Statement sense;
    Statement sense_relation;
    Statement sense_example;
    Statement count;
    Statement behaviour;
};

void insert_relations(Statement& insert, std::int64_t owner, const std::vector<Relation>& relations) {
    std::int64_t position = 0;
    for (const auto& relation : relations) {
        insert.bind(1, owner)
            .bind(2, relation.target)
            .bind(3, relation.type)
            .bind(4, position++)
            .bind(5, encode_metadata(relation.meta));
        insert.execute();
    }
}

void insert_examples(Statement& insert, std::int64_t owner, const std::vector<Example>& examples) {
    std::int64_t position = 0;
    for (const auto& example : examples) {
        insert.bind(1, owner)
            .bind(2, example.text)
            .bind(3, example.language)
            .bind(4, position++)
            .bind(5, encode_metadata(example.meta));
        insert.execute();
    }
}

void insert_behaviours(Statement& insert,
                       std::int64_t lexicon_rowid,
                       std::optional<std::int64_t> entry_rowid,
                       const std::vector<SyntacticBehaviour>& behaviours) {
    std::int64_t position = 0;
    for (const auto& behaviour : behaviours) {
        insert.bind(1, behaviour.id).bind(2, lexicon_rowid);
        if (entry_rowid) {
            insert.bind(3, *entry_rowid);
        } else {
            insert.bind_null(3);
        }
        insert.bind(4, behaviour.frame).bind(5, encode_id_list(behaviour.senses)).bind(6, position++);
        insert.execute();
    }
}
}  // namespace

SqliteStore::SqliteStore(const std::string& path, std::shared_ptr<const Vocabulary> vocabulary)
    : path_(path), vocabulary_(std::move(vocabulary)) {
    if (!vocabulary_) {
        throw std::invalid_argument("store requires a vocabulary");
    }
    const int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        const std::string detail = db_ != nullptr ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        throw BackingStoreError("could not open " + path + ": " + detail, rc);
    }
    try {
        exec(db_, "PRAGMA foreign_keys = ON");
        exec(db_, kSchema);
        exec(db_, std::string("INSERT OR IGNORE INTO meta (key, value) VALUES ('schema_version', '") +
                      kStoreSchemaVersion + "')");
    } catch (const std::exception&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteStore::~SqliteStore() {
    if (sqlite3_close(db_) != SQLITE_OK) {
        std::cerr << "libwnedit: could not close " << path_ << ": " << sqlite3_errmsg(db_) << '\n';
    }
}

std::string SqliteStore::schema_version() const {
    Statement query(db_, "SELECT value FROM meta WHERE key = 'schema_version'");
    if (!query.step()) {
        throw SchemaMismatchError(SchemaMismatchError::Reason::MissingSchemaElement, "schema version is not recorded");
    }
    return query.text(0);
}

RowSet SqliteStore::select(const std::string& sql, const std::vector<std::string>& params) const {
    Statement query(db_, sql);
    for (std::size_t i = 0; i < params.size(); ++i) {
        query.bind(static_cast<int>(i + 1), params[i]);
    }
    RowSet result;
    for (int c = 0; c < query.column_count(); ++c) {
        result.columns.push_back(query.column_name(c));
    }
    while (query.step()) {
        Row row;
        row.reserve(result.columns.size());
        for (int c = 0; c < query.column_count(); ++c) {
            row.push_back(query.cell(c));
        }
        result.rows.push_back(std::move(row));
    }
    return result;
}

LexicalResource SqliteStore::read_lexicon(const LexiconLocator& locator) const {
    const LexiconRow row = resolve_lexicon(db_, locator);
    std::vector<Lexicon> lexicons;
    lexicons.push_back(RecordReader(db_, *vocabulary_).read(row.rowid));
    return make_lexical_resource(std::move(lexicons), row.lmf_version);
}

std::string SqliteStore::export_lexicon(const LexiconLocator& locator, const std::string& lmf_version) const {
    LexicalResource resource = read_lexicon(locator);
    if (!lmf_version.empty()) {
        validate_lmf_version(lmf_version);
        resource.lmf_version = lmf_version;
    }
    return LmfCodec(vocabulary_).serialize(resource);
}

void SqliteStore::commit(const LexicalResource& resource) {
    validate_lmf_version(resource.lmf_version);
    Transaction transaction(db_);
    for (const auto& lexicon : resource.lexicons) {
        insert_lexicon(lexicon, resource.lmf_version);
    }
    transaction.commit();
}

void SqliteStore::insert_lexicon(const Lexicon& lexicon, const std::string& lmf_version) {
    {
        Statement existing(db_, "SELECT 1 FROM lexicons WHERE id = ? AND version = ?");
        existing.bind(1, lexicon.id).bind(2, lexicon.version);
        if (existing.step()) {
            throw BackingStoreError("Lexicon already added: " + lexicon.id + ":" + lexicon.version);
        }
    }
    std::unordered_set<std::string> synset_ids;
    for (const auto& synset : lexicon.synsets) {
        synset_ids.insert(synset.id);
    }
    for (const auto& entry : lexicon.entries) {
        for (const auto& sense : entry.senses) {
            if (!synset_ids.contains(sense.synset)) {
                throw BackingStoreError("Rejected snapshot: sense '" + sense.id + "' references missing synset '" +
                                        sense.synset + "'");
            }
        }
    }

    Inserts insert(db_);
    insert.lexicon.bind(1, lexicon.id)
        .bind(2, lexicon.version)
        .bind(3, lexicon.label)
        .bind(4, lexicon.language)
        .bind(5, lexicon.email)
        .bind(6, lexicon.license)
        .bind(7, lexicon.url)
        .bind(8, lexicon.citation)
        .bind(9, lexicon.logo)
        .bind(10, lmf_version)
        .bind(11, encode_metadata(lexicon.meta));
    insert.lexicon.execute();
    const std::int64_t lexicon_rowid = sqlite3_last_insert_rowid(db_);

    std::unordered_map<std::string, std::int64_t> synset_rows;
    std::int64_t synset_position = 0;
    for (const auto& synset : lexicon.synsets) {
        insert.synset.bind(1, synset.id)
            .bind(2, lexicon_rowid)
            .bind(3, synset.pos)
            .bind(4, synset.ili)
            .bind(5, synset.lexfile)
            .bind(6, std::int64_t{synset.lexicalized ? 1 : 0})
            .bind(7, synset_position++)
            .bind(8, encode_metadata(synset.meta));
        insert.synset.execute();
        const std::int64_t synset_rowid = sqlite3_last_insert_rowid(db_);
        synset_rows.emplace(synset.id, synset_rowid);

        std::int64_t position = 0;
        auto insert_definition = [&](const Definition& definition, bool is_ili) {
            insert.definition.bind(1, synset_rowid)
                .bind(2, definition.text)
                .bind(3, definition.language)
                .bind(4, definition.source_sense)
                .bind(5, std::int64_t{is_ili ? 1 : 0})
                .bind(6, position++)
                .bind(7, encode_metadata(definition.meta));
            insert.definition.execute();
        };
        for (const auto& definition : synset.definitions) {
            insert_definition(definition, false);
        }
        if (synset.ili_definition) {
            insert_definition(*synset.ili_definition, true);
        }
        insert_examples(insert.synset_example, synset_rowid, synset.examples);
        insert_relations(insert.synset_relation, synset_rowid, synset.relations);
    }

    std::int64_t entry_position = 0;
    for (const auto& entry : lexicon.entries) {
        insert.entry.bind(1, entry.id)
            .bind(2, lexicon_rowid)
            .bind(3, entry.lemma.pos)
            .bind(4, entry_position++)
            .bind(5, encode_metadata(entry.meta));
        insert.entry.execute();
        const std::int64_t entry_rowid = sqlite3_last_insert_rowid(db_);

        auto insert_form = [&](const std::string& id,
                               const std::string& written_form,
                               const std::string& script,
                               std::int64_t rank,
                               const std::vector<Pronunciation>& pronunciations,
                               const std::vector<Tag>& tags) {
            insert.form.bind(1, id).bind(2, entry_rowid).bind(3, written_form).bind(4, script).bind(5, rank);
            insert.form.execute();
            const std::int64_t form_rowid = sqlite3_last_insert_rowid(db_);
            std::int64_t position = 0;
            for (const auto& pronunciation : pronunciations) {
                insert.pronunciation.bind(1, form_rowid)
                    .bind(2, pronunciation.text)
                    .bind(3, pronunciation.variety)
                    .bind(4, pronunciation.notation)
                    .bind(5, std::int64_t{pronunciation.phonemic ? 1 : 0})
                    .bind(6, pronunciation.audio)
                    .bind(7, position++);
                insert.pronunciation.execute();
            }
            position = 0;
            for (const auto& tag : tags) {
                insert.tag.bind(1, form_rowid).bind(2, tag.text).bind(3, tag.category).bind(4, position++);
                insert.tag.execute();
            }
        };
        insert_form({}, entry.lemma.written_form, entry.lemma.script, 0, entry.lemma.pronunciations, entry.lemma.tags);
        std::int64_t rank = 1;
        for (const auto& form : entry.forms) {
            insert_form(form.id, form.written_form, form.script, rank++, form.pronunciations, form.tags);
        }

        std::int64_t sense_position = 0;
        for (const auto& sense : entry.senses) {
            insert.sense.bind(1, sense.id)
                .bind(2, entry_rowid)
                .bind(3, synset_rows.at(sense.synset))
                .bind(4, sense.adjposition)
                .bind(5, encode_id_list(sense.subcat))
                .bind(6, std::int64_t{sense.lexicalized ? 1 : 0})
                .bind(7, sense_position++)
                .bind(8, encode_metadata(sense.meta));
            insert.sense.execute();
            const std::int64_t sense_rowid = sqlite3_last_insert_rowid(db_);
            insert_relations(insert.sense_relation, sense_rowid, sense.relations);
            insert_examples(insert.sense_example, sense_rowid, sense.examples);
            std::int64_t position = 0;
            for (const auto& count : sense.counts) {
                insert.count.bind(1, sense_rowid)
                    .bind(2, count.value)
                    .bind(3, position++)
                    .bind(4, encode_metadata(count.meta));
                insert.count.execute();
            }
        }
        insert_behaviours(insert.behaviour, lexicon_rowid, entry_rowid, entry.syntactic_behaviours);
    }
    insert_behaviours(insert.behaviour, lexicon_rowid, std::nullopt, lexicon.frames);
}

std::vector<std::string> SqliteStore::lexicons() const {
    Statement query(db_, "SELECT id, version FROM lexicons ORDER BY rowid");
    std::vector<std::string> specifiers;
    while (query.step()) {
        specifiers.push_back(query.text(0) + ":" + query.text(1));
    }
    return specifiers;
}

std::size_t SqliteStore::remove(const std::string& specifier) {
    const LexiconLocator locator = LexiconLocator::parse(specifier);
    Transaction transaction(db_);
    if (specifier.ends_with(":*")) {
        Statement erase(db_, "DELETE FROM lexicons WHERE id = ?");
        erase.bind(1, locator.id);
        erase.execute();
    } else {
        const LexiconRow row = resolve_lexicon(db_, locator);
        Statement erase(db_, "DELETE FROM lexicons WHERE rowid = ?");
        erase.bind(1, row.rowid);
        erase.execute();
    }
    const auto removed = static_cast<std::size_t>(sqlite3_changes(db_));
    if (removed == 0) {
        throw NotFoundError("Lexicon not found: " + specifier);
    }
    transaction.commit();
    return removed;
}

void SqliteStore::execute(const std::string& sql) {
    exec(db_, sql);
}

}  // namespace libwnedit
