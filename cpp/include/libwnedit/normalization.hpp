#pragma once

#include "libwnedit/record_types.hpp"

#include <string>
#include <string_view>

namespace libwnedit {

// Trims and collapses every run of whitespace to a single space.
[[nodiscard]] std::string normalize_text(std::string_view text);

// Applies normalize_text to free-text fields (definitions, examples,
// ILI definitions, citations). Order of repeatable children is kept.
[[nodiscard]] LexicalResource normalize(LexicalResource resource);

[[nodiscard]] bool equivalent(const LexicalResource& lhs, const LexicalResource& rhs);

// Path of the first record that differs after normalization, e.g.
// "lexicons[0].synsets[2]"; empty when the resources are equivalent.
[[nodiscard]] std::string first_difference(const LexicalResource& lhs, const LexicalResource& rhs);

}  // namespace libwnedit
