#pragma once

#include "libwnedit/backing_store.hpp"
#include "libwnedit/vocabulary.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

struct sqlite3;

namespace libwnedit {

// Lexicon database on SQLite. Creates the schema (version kStoreSchemaVersion)
// when it is absent. ":memory:" opens a private in-memory database.
class SqliteStore final : public BackingStore, public CommitSink {
public:
    explicit SqliteStore(const std::string& path = ":memory:",
                         std::shared_ptr<const Vocabulary> vocabulary = standard_vocabulary());

    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    [[nodiscard]] std::string schema_version() const override;

    [[nodiscard]] RowSet select(const std::string& sql, const std::vector<std::string>& params) const override;

    // Reads the lexicon record by record and serializes it as WN-LMF.
    [[nodiscard]] std::string export_lexicon(const LexiconLocator& locator,
                                             const std::string& lmf_version) const override;

    // Adds every lexicon of `resource` in one transaction. Rejects a lexicon
    // whose id:version is already present or whose senses name synsets the
    // lexicon does not contain; nothing is written in that case.
    void commit(const LexicalResource& resource) override;

    [[nodiscard]] LexicalResource read_lexicon(const LexiconLocator& locator) const;

    // "id:version" for every stored lexicon, in insertion order.
    [[nodiscard]] std::vector<std::string> lexicons() const;

    // Removes the lexicon named by `specifier`; "id:*" removes every version.
    // Returns the number of lexicons removed.
    std::size_t remove(const std::string& specifier);

    // Runs raw SQL, for schema administration.
    void execute(const std::string& sql);

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    void insert_lexicon(const Lexicon& lexicon, const std::string& lmf_version);

    sqlite3* db_{nullptr};
    std::string path_;
    std::shared_ptr<const Vocabulary> vocabulary_;
};

}  // namespace libwnedit
