#include "libwnedit/relation_validator.hpp"

namespace libwnedit {

RelationTypeStatus classify_relation_type(const std::string& type,
                                          RelationKind kind,
                                          const Vocabulary& vocabulary) {
    bool known = false;
    switch (kind) {
        case RelationKind::SynsetToSynset:
            known = vocabulary.is_synset_relation(type);
            break;
        case RelationKind::SenseToSense:
            known = vocabulary.is_sense_relation(type);
            break;
        case RelationKind::SenseToSynset:
            known = vocabulary.is_sense_synset_relation(type);
            break;
    }
    return known ? RelationTypeStatus::Known : RelationTypeStatus::Unknown;
}

std::optional<ValidationWarning> check_relation_type(const std::string& type,
                                                     RelationKind kind,
                                                     const Vocabulary& vocabulary,
                                                     bool skip) {
    if (skip || classify_relation_type(type, kind, vocabulary) == RelationTypeStatus::Known) {
        return std::nullopt;
    }
    return ValidationWarning{type, kind, "Unknown " + std::string(to_string(kind)) + " relation type: '" + type + "'"};
}

const char* to_string(RelationKind kind) noexcept {
    switch (kind) {
        case RelationKind::SynsetToSynset:
            return "synset";
        case RelationKind::SenseToSense:
            return "sense";
        case RelationKind::SenseToSynset:
            return "sense-synset";
    }
    return "unknown";
}

}  // namespace libwnedit
