#include "libwnedit/structural_validator.hpp"

#include "libwnedit/normalization.hpp"
#include "libwnedit/relation_validator.hpp"

#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace libwnedit {

namespace {
[[nodiscard]] bool compatible_pos(const std::string& entry_pos, const std::string& synset_pos) {
    if (entry_pos == synset_pos) {
        return true;
    }
    return is_adjective_pos(entry_pos) && is_adjective_pos(synset_pos);
}
}  // namespace

StructuralValidator::StructuralValidator(std::shared_ptr<const Vocabulary> vocabulary)
    : vocabulary_(std::move(vocabulary)) {
    if (!vocabulary_) {
        throw std::invalid_argument("validator requires a vocabulary");
    }
}

std::vector<Complaint> StructuralValidator::validate(const Lexicon& lexicon) const {
    std::vector<Complaint> complaints;
    std::unordered_set<std::string> seen_ids;
    std::unordered_set<std::string> sense_ids;
    std::unordered_map<std::string, const Synset*> synsets;

    auto note_id = [&](const std::string& id) {
        if (id.empty()) {
            return;
        }
        if (!seen_ids.insert(id).second) {
            complaints.push_back({"E101", id, "Duplicate id: '" + id + "'"});
        }
    };

    for (const auto& entry : lexicon.entries) {
        note_id(entry.id);
        for (const auto& form : entry.forms) {
            note_id(form.id);
        }
        for (const auto& sense : entry.senses) {
            note_id(sense.id);
            sense_ids.insert(sense.id);
        }
    }
    for (const auto& synset : lexicon.synsets) {
        note_id(synset.id);
        synsets.emplace(synset.id, &synset);
    }
    for (const auto& frame : lexicon.frames) {
        note_id(frame.id);
    }

    for (const auto& entry : lexicon.entries) {
        if (entry.senses.empty()) {
            complaints.push_back({"W501", entry.id, "Entry has no senses: '" + entry.id + "'"});
        }
        for (const auto& sense : entry.senses) {
            auto synset = synsets.find(sense.synset);
            if (synset == synsets.end()) {
                complaints.push_back({"E202", sense.id, "Sense references missing synset: '" + sense.synset + "'"});
            } else if (!compatible_pos(entry.lemma.pos, synset->second->pos)) {
                complaints.push_back({"W502", sense.id,
                                      "Sense part of speech '" + entry.lemma.pos + "' differs from synset '" +
                                          sense.synset + "' part of speech '" + synset->second->pos + "'"});
            }
            for (const auto& relation : sense.relations) {
                RelationKind kind = RelationKind::SenseToSense;
                if (sense_ids.contains(relation.target)) {
                    kind = RelationKind::SenseToSense;
                } else if (synsets.contains(relation.target)) {
                    kind = RelationKind::SenseToSynset;
                } else {
                    complaints.push_back({"E201", sense.id, "Relation target missing: '" + relation.target + "'"});
                    continue;
                }
                if (auto warning = check_relation_type(relation.type, kind, *vocabulary_)) {
                    complaints.push_back({"W204", sense.id, warning->message});
                }
            }
            for (const auto& example : sense.examples) {
                if (normalize_text(example.text).empty()) {
                    complaints.push_back({"W306", sense.id, "Blank example"});
                }
            }
        }
    }

    std::unordered_map<std::string, std::string> definition_owner;
    for (const auto& synset : lexicon.synsets) {
        for (const auto& relation : synset.relations) {
            if (!synsets.contains(relation.target)) {
                complaints.push_back({"E201", synset.id, "Relation target missing: '" + relation.target + "'"});
                continue;
            }
            if (auto warning = check_relation_type(relation.type, RelationKind::SynsetToSynset, *vocabulary_)) {
                complaints.push_back({"W204", synset.id, warning->message});
            }
        }
        for (const auto& definition : synset.definitions) {
            const std::string text = normalize_text(definition.text);
            if (text.empty()) {
                complaints.push_back({"W305", synset.id, "Blank definition"});
                continue;
            }
            auto [owner, inserted] = definition_owner.emplace(text, synset.id);
            if (!inserted && owner->second != synset.id) {
                complaints.push_back({"W307", synset.id, "Definition repeated from synset '" + owner->second + "'"});
            }
        }
        for (const auto& example : synset.examples) {
            if (normalize_text(example.text).empty()) {
                complaints.push_back({"W306", synset.id, "Blank example"});
            }
        }
    }
    return complaints;
}

}  // namespace libwnedit
