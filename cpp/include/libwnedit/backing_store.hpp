#pragma once

#include "libwnedit/record_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace libwnedit {

// "id" or "id:version". An empty version matches any version of the lexicon.
struct LexiconLocator {
    std::string id;
    std::string version;

    [[nodiscard]] static LexiconLocator parse(const std::string& specifier);

    [[nodiscard]] std::string to_string() const;

    bool operator==(const LexiconLocator&) const = default;
};

using Cell = std::optional<std::string>;  // nullopt for SQL NULL
using Row = std::vector<Cell>;

struct RowSet {
    std::vector<std::string> columns;
    std::vector<Row> rows;
};

// Read side of a persistent lexicon store. Both operations are side-effect free.
class BackingStore {
public:
    virtual ~BackingStore() = default;

    // Version tag of the physical schema served by `select`.
    // The default throws SchemaMismatchError (missing interface).
    [[nodiscard]] virtual std::string schema_version() const;

    // Bulk query against the physical schema; `params` bind to `?` in order.
    // The default throws SchemaMismatchError (missing interface).
    [[nodiscard]] virtual RowSet select(const std::string& sql, const std::vector<std::string>& params) const;

    // WN-LMF text for the located lexicon. An empty `lmf_version` exports with
    // the version the lexicon was added with.
    [[nodiscard]] virtual std::string export_lexicon(const LexiconLocator& locator,
                                                     const std::string& lmf_version) const = 0;
};

// Accepts a complete snapshot for persistence; may reject but never repairs it.
class CommitSink {
public:
    virtual ~CommitSink() = default;

    virtual void commit(const LexicalResource& resource) = 0;
};

}  // namespace libwnedit
