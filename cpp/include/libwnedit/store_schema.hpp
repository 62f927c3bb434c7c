#pragma once

#include "libwnedit/backing_store.hpp"
#include "libwnedit/record_types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace libwnedit {

// Physical schema version written by SqliteStore and read by the bulk loader.
inline constexpr const char* kStoreSchemaVersion = "1";

// Record metadata is stored in one text column per row as key/value pairs
// separated by ASCII unit (0x1f) and record (0x1e) separators, which cannot
// occur in XML text.
[[nodiscard]] std::string encode_metadata(const Metadata& meta);

[[nodiscard]] Metadata decode_metadata(const std::string& encoded);

// Space-separated id lists (subcat frames, syntactic behaviour senses).
[[nodiscard]] std::string encode_id_list(const std::vector<std::string>& ids);

[[nodiscard]] std::vector<std::string> decode_id_list(const std::string& encoded);

// Picks the row whose version matches `locator` among the versions stored
// for `locator.id`. Throws NotFoundError when nothing matches and
// AmbiguousMatchError when no version was given and several exist.
[[nodiscard]] std::size_t choose_lexicon_version(const LexiconLocator& locator,
                                                 const std::vector<std::string>& versions);

}  // namespace libwnedit
