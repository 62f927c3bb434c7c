#include "libwnedit/backing_store.hpp"

#include "libwnedit/errors.hpp"

namespace libwnedit {

LexiconLocator LexiconLocator::parse(const std::string& specifier) {
    LexiconLocator locator;
    const auto colon = specifier.find(':');
    if (colon == std::string::npos) {
        locator.id = specifier;
    } else {
        locator.id = specifier.substr(0, colon);
        locator.version = specifier.substr(colon + 1);
        if (locator.version == "*") {
            locator.version.clear();
        }
    }
    if (locator.id.empty()) {
        throw InvalidShapeError("Invalid lexicon specifier: '" + specifier + "'");
    }
    return locator;
}

std::string LexiconLocator::to_string() const {
    return version.empty() ? id : id + ":" + version;
}

std::string BackingStore::schema_version() const {
    throw SchemaMismatchError(SchemaMismatchError::Reason::MissingInterface,
                              "backing store does not report a schema version");
}

RowSet BackingStore::select(const std::string& /*sql*/, const std::vector<std::string>& /*params*/) const {
    throw SchemaMismatchError(SchemaMismatchError::Reason::MissingInterface,
                              "backing store does not provide bulk queries");
}

}  // namespace libwnedit
