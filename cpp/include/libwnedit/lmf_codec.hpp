#pragma once

#include "libwnedit/record_types.hpp"
#include "libwnedit/vocabulary.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace libwnedit {

// WN-LMF XML reader and writer (schema versions 1.0 through 1.4).
// Records are built through the make_* contracts, so a parsed document is
// shape-checked the same way as records created by the editor.
class LmfCodec {
public:
    explicit LmfCodec(std::shared_ptr<const Vocabulary> vocabulary = standard_vocabulary());

    [[nodiscard]] LexicalResource parse(std::string_view xml) const;

    [[nodiscard]] LexicalResource load_file(const std::filesystem::path& path) const;

    // Deterministic output: fixed attribute order, two-space indentation.
    // Features newer than `resource.lmf_version` are omitted.
    [[nodiscard]] std::string serialize(const LexicalResource& resource) const;

    void dump_file(const LexicalResource& resource, const std::filesystem::path& path) const;

private:
    std::shared_ptr<const Vocabulary> vocabulary_;
};

// Clears the fields WN-LMF `lmf_version` cannot express: below 1.1 these are
// pronunciations, lexfile, logo, lexicon-level frames, subcat and
// syntactic behaviour ids. The writer and the bulk loader both apply it.
void restrict_to_lmf_version(Lexicon& lexicon, const std::string& lmf_version);

[[nodiscard]] std::string lmf_doctype(const std::string& lmf_version);

}  // namespace libwnedit
