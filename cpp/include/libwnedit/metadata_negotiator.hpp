#pragma once

#include "libwnedit/record_types.hpp"

#include <optional>
#include <string>

namespace libwnedit {

struct LexiconDefaults {
    std::string language{"en"};
    std::string email{"user@example.com"};
    std::string license{"https://creativecommons.org/licenses/by/4.0/"};
    std::string version{"1.0"};
    std::string lmf_version{"1.4"};
};

struct MetadataOverrides {
    std::optional<std::string> id;
    std::optional<std::string> label;
    std::optional<std::string> language;
    std::optional<std::string> email;
    std::optional<std::string> license;
    std::optional<std::string> version;
    std::optional<std::string> url;
    std::optional<std::string> citation;
    std::optional<std::string> lmf_version;  // version to write on export
};

struct NegotiatedMetadata {
    std::string id;
    std::string label;
    std::string language;
    std::string email;
    std::string license;
    std::string version;
    std::string url;
    std::string citation;
    std::string read_lmf_version;
    std::string write_lmf_version;
};

// Resolves identity and version fields with the precedence
// caller override > loaded value > built-in default, independently per field.
class MetadataNegotiator {
public:
    explicit MetadataNegotiator(LexiconDefaults defaults = {});

    // `loaded` is null for a new lexicon; `loaded_lmf_version` is the version
    // the source was read with (empty when nothing was read).
    [[nodiscard]] NegotiatedMetadata resolve(const Lexicon* loaded,
                                             const std::string& loaded_lmf_version,
                                             const MetadataOverrides& overrides) const;

    // Writes the resolved identity fields onto `lexicon`.
    static void apply(const NegotiatedMetadata& metadata, Lexicon& lexicon);

private:
    LexiconDefaults defaults_;
};

}  // namespace libwnedit
