#include "libwnedit/vocabulary.hpp"

#include <algorithm>

namespace libwnedit {

namespace {
const std::vector<std::string> kPartsOfSpeech = {"n", "v", "a", "r", "s", "t", "c", "p", "x", "u"};

const std::vector<std::string> kAdjpositions = {"a", "ip", "p"};

const std::vector<std::string> kSynsetRelations = {
    "agent", "also", "attribute", "be_in_state", "causes", "classified_by", "classifies",
    "co_agent_instrument", "co_agent_patient", "co_agent_result", "co_instrument_agent",
    "co_instrument_patient", "co_instrument_result", "co_patient_agent", "co_patient_instrument",
    "co_result_agent", "co_result_instrument", "co_role", "direction", "domain_region",
    "domain_topic", "exemplifies", "entails", "eq_synonym", "has_domain_region",
    "has_domain_topic", "is_exemplified_by", "holo_location", "holo_member", "holo_part",
    "holo_portion", "holo_substance", "holonym", "hypernym", "hyponym", "in_manner",
    "instance_hypernym", "instance_hyponym", "instrument", "involved", "involved_agent",
    "involved_direction", "involved_instrument", "involved_location", "involved_patient",
    "involved_result", "involved_source_direction", "involved_target_direction", "is_caused_by",
    "is_entailed_by", "location", "manner_of", "mero_location", "mero_member", "mero_part",
    "mero_portion", "mero_substance", "meronym", "similar", "other", "patient", "restricted_by",
    "restricts", "result", "role", "source_direction", "state_of", "target_direction", "subevent",
    "is_subevent_of", "antonym", "feminine", "has_feminine", "masculine", "has_masculine",
    "young", "has_young", "diminutive", "has_diminutive", "augmentative", "has_augmentative",
    "anto_gradable", "anto_simple", "anto_converse", "ir_synonym"};

const std::vector<std::string> kSenseRelations = {
    "antonym", "also", "participle", "pertainym", "derivation", "domain_topic",
    "has_domain_topic", "domain_region", "has_domain_region", "exemplifies", "is_exemplified_by",
    "similar", "other", "feminine", "has_feminine", "masculine", "has_masculine", "young",
    "has_young", "diminutive", "has_diminutive", "augmentative", "has_augmentative",
    "anto_gradable", "anto_simple", "anto_converse", "simple_aspect_ip", "secondary_aspect_ip",
    "simple_aspect_pi", "secondary_aspect_pi", "metaphor", "has_metaphor", "metonym",
    "has_metonym", "agent", "material", "event", "instrument", "location", "by_means_of",
    "undergoer", "property", "result", "state", "uses", "destination", "body_part", "vehicle"};

const std::vector<std::string> kSenseSynsetRelations = {"other", "domain_topic", "domain_region", "exemplifies"};
}  // namespace

StandardVocabulary::StandardVocabulary()
    : parts_of_speech_(kPartsOfSpeech),
      adjpositions_(kAdjpositions),
      synset_relations_(kSynsetRelations.begin(), kSynsetRelations.end()),
      sense_relations_(kSenseRelations.begin(), kSenseRelations.end()),
      sense_synset_relations_(kSenseSynsetRelations.begin(), kSenseSynsetRelations.end()) {}

bool StandardVocabulary::is_part_of_speech(const std::string& tag) const {
    return std::find(parts_of_speech_.begin(), parts_of_speech_.end(), tag) != parts_of_speech_.end();
}

bool StandardVocabulary::is_adjposition(const std::string& tag) const {
    return std::find(adjpositions_.begin(), adjpositions_.end(), tag) != adjpositions_.end();
}

bool StandardVocabulary::is_synset_relation(const std::string& type) const {
    return synset_relations_.contains(type);
}

bool StandardVocabulary::is_sense_relation(const std::string& type) const {
    return sense_relations_.contains(type);
}

bool StandardVocabulary::is_sense_synset_relation(const std::string& type) const {
    return sense_synset_relations_.contains(type);
}

std::vector<std::string> StandardVocabulary::parts_of_speech() const {
    return parts_of_speech_;
}

std::vector<std::string> StandardVocabulary::adjpositions() const {
    return adjpositions_;
}

std::shared_ptr<const Vocabulary> standard_vocabulary() {
    static const std::shared_ptr<const Vocabulary> instance = std::make_shared<StandardVocabulary>();
    return instance;
}

bool is_adjective_pos(const std::string& pos) noexcept {
    return pos == "a" || pos == "s";
}

}  // namespace libwnedit
