#pragma once

#include "libwnedit/vocabulary.hpp"

#include <optional>
#include <string>

namespace libwnedit {

enum class RelationKind {
    SynsetToSynset,
    SenseToSense,
    SenseToSynset
};

enum class RelationTypeStatus {
    Known,
    Unknown
};

struct ValidationWarning {
    std::string relation_type;
    RelationKind kind;
    std::string message;

    bool operator==(const ValidationWarning&) const = default;
};

[[nodiscard]] RelationTypeStatus classify_relation_type(const std::string& type,
                                                        RelationKind kind,
                                                        const Vocabulary& vocabulary);

// Returns a warning for an unknown type; never throws for the type itself.
// With `skip` set the vocabulary is not consulted and no warning is produced.
[[nodiscard]] std::optional<ValidationWarning> check_relation_type(const std::string& type,
                                                                   RelationKind kind,
                                                                   const Vocabulary& vocabulary,
                                                                   bool skip = false);

[[nodiscard]] const char* to_string(RelationKind kind) noexcept;

}  // namespace libwnedit
