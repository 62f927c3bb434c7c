#include "libwnedit/metadata_negotiator.hpp"

#include "libwnedit/records.hpp"

#include <utility>

namespace libwnedit {

namespace {
[[nodiscard]] std::string pick(const std::optional<std::string>& override_value,
                               const std::string* loaded_value,
                               const std::string& fallback) {
    if (override_value) {
        return *override_value;
    }
    if (loaded_value != nullptr && !loaded_value->empty()) {
        return *loaded_value;
    }
    return fallback;
}
}  // namespace

MetadataNegotiator::MetadataNegotiator(LexiconDefaults defaults) : defaults_(std::move(defaults)) {}

NegotiatedMetadata MetadataNegotiator::resolve(const Lexicon* loaded,
                                               const std::string& loaded_lmf_version,
                                               const MetadataOverrides& overrides) const {
    NegotiatedMetadata resolved;
    resolved.id = pick(overrides.id, loaded ? &loaded->id : nullptr, {});
    // An unlabeled lexicon is labeled with its id.
    resolved.label = pick(overrides.label, loaded ? &loaded->label : nullptr, resolved.id);
    resolved.language = pick(overrides.language, loaded ? &loaded->language : nullptr, defaults_.language);
    resolved.email = pick(overrides.email, loaded ? &loaded->email : nullptr, defaults_.email);
    resolved.license = pick(overrides.license, loaded ? &loaded->license : nullptr, defaults_.license);
    resolved.version = pick(overrides.version, loaded ? &loaded->version : nullptr, defaults_.version);
    resolved.url = pick(overrides.url, loaded ? &loaded->url : nullptr, {});
    resolved.citation = pick(overrides.citation, loaded ? &loaded->citation : nullptr, {});

    resolved.read_lmf_version = loaded_lmf_version.empty() ? defaults_.lmf_version : loaded_lmf_version;
    resolved.write_lmf_version = overrides.lmf_version ? *overrides.lmf_version : resolved.read_lmf_version;
    validate_lmf_version(resolved.write_lmf_version);
    return resolved;
}

void MetadataNegotiator::apply(const NegotiatedMetadata& metadata, Lexicon& lexicon) {
    lexicon.id = metadata.id;
    lexicon.label = metadata.label;
    lexicon.language = metadata.language;
    lexicon.email = metadata.email;
    lexicon.license = metadata.license;
    lexicon.version = metadata.version;
    lexicon.url = metadata.url;
    lexicon.citation = metadata.citation;
}

}  // namespace libwnedit
