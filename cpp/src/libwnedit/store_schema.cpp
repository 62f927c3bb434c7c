#include "libwnedit/store_schema.hpp"

#include "libwnedit/errors.hpp"

#include <sstream>

namespace libwnedit {

namespace {
constexpr char kUnitSeparator = '\x1f';
constexpr char kRecordSeparator = '\x1e';
}  // namespace

std::string encode_metadata(const Metadata& meta) {
    std::string encoded;
    for (const auto& [key, value] : meta) {
        if (!encoded.empty()) {
            encoded.push_back(kRecordSeparator);
        }
        encoded += key;
        encoded.push_back(kUnitSeparator);
        encoded += value;
    }
    return encoded;
}

Metadata decode_metadata(const std::string& encoded) {
    Metadata meta;
    std::size_t start = 0;
    while (start < encoded.size()) {
        auto end = encoded.find(kRecordSeparator, start);
        if (end == std::string::npos) {
            end = encoded.size();
        }
        const std::string pair = encoded.substr(start, end - start);
        const auto split = pair.find(kUnitSeparator);
        if (split == std::string::npos) {
            throw BackingStoreError("corrupt metadata column: '" + pair + "'");
        }
        meta.emplace(pair.substr(0, split), pair.substr(split + 1));
        start = end + 1;
    }
    return meta;
}

std::string encode_id_list(const std::vector<std::string>& ids) {
    std::string encoded;
    for (const auto& id : ids) {
        if (!encoded.empty()) {
            encoded.push_back(' ');
        }
        encoded += id;
    }
    return encoded;
}

std::vector<std::string> decode_id_list(const std::string& encoded) {
    std::vector<std::string> ids;
    std::istringstream stream(encoded);
    std::string id;
    while (stream >> id) {
        ids.push_back(id);
    }
    return ids;
}

std::size_t choose_lexicon_version(const LexiconLocator& locator, const std::vector<std::string>& versions) {
    if (!locator.version.empty()) {
        for (std::size_t i = 0; i < versions.size(); ++i) {
            if (versions[i] == locator.version) {
                return i;
            }
        }
        throw NotFoundError("Lexicon not found: " + locator.to_string());
    }
    if (versions.empty()) {
        throw NotFoundError("Lexicon not found: " + locator.to_string());
    }
    if (versions.size() > 1) {
        throw AmbiguousMatchError("Lexicon specifier '" + locator.id + "' matches " +
                                  std::to_string(versions.size()) + " versions; use id:version");
    }
    return 0;
}

}  // namespace libwnedit
