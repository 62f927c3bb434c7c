#pragma once

#include "libwnedit/backing_store.hpp"
#include "libwnedit/record_types.hpp"
#include "libwnedit/vocabulary.hpp"

#include <memory>
#include <string>

namespace libwnedit {

struct LoaderOptions {
    bool allow_fast_path{true};
};

enum class LoadPath {
    Fast,
    Fallback
};

struct LoadResult {
    LexicalResource resource;
    LoadPath path{LoadPath::Fast};
    std::string fallback_reason;  // empty when the fast path succeeded
};

// Reconstructs one stored lexicon. The bulk path reads the store's physical
// schema with a fixed number of queries; when the store reports a schema it
// does not recognize (SchemaMismatchError) or fails (BackingStoreError), the
// lexicon is exported as WN-LMF and parsed instead. Any other exception
// propagates. Both paths build records through the make_* contracts.
class DualPathLoader {
public:
    explicit DualPathLoader(std::shared_ptr<const Vocabulary> vocabulary = standard_vocabulary(),
                            LoaderOptions options = {});

    [[nodiscard]] LoadResult load(const BackingStore& store, const LexiconLocator& locator) const;

    [[nodiscard]] LexicalResource load_fast(const BackingStore& store, const LexiconLocator& locator) const;

    [[nodiscard]] LexicalResource load_via_export(const BackingStore& store, const LexiconLocator& locator) const;

    [[nodiscard]] const LoaderOptions& options() const noexcept { return options_; }

private:
    std::shared_ptr<const Vocabulary> vocabulary_;
    LoaderOptions options_;
};

[[nodiscard]] const char* to_string(LoadPath path) noexcept;

}  // namespace libwnedit
