#pragma once

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace libwnedit {

class Vocabulary {
public:
    virtual ~Vocabulary() = default;

    [[nodiscard]] virtual bool is_part_of_speech(const std::string& tag) const = 0;

    [[nodiscard]] virtual bool is_adjposition(const std::string& tag) const = 0;

    [[nodiscard]] virtual bool is_synset_relation(const std::string& type) const = 0;

    [[nodiscard]] virtual bool is_sense_relation(const std::string& type) const = 0;

    // Sense relations whose target is a synset rather than a sense.
    [[nodiscard]] virtual bool is_sense_synset_relation(const std::string& type) const = 0;

    // Listing order is used in error messages.
    [[nodiscard]] virtual std::vector<std::string> parts_of_speech() const = 0;

    [[nodiscard]] virtual std::vector<std::string> adjpositions() const = 0;
};

// The WN-LMF 1.4 tag sets.
class StandardVocabulary final : public Vocabulary {
public:
    StandardVocabulary();

    [[nodiscard]] bool is_part_of_speech(const std::string& tag) const override;

    [[nodiscard]] bool is_adjposition(const std::string& tag) const override;

    [[nodiscard]] bool is_synset_relation(const std::string& type) const override;

    [[nodiscard]] bool is_sense_relation(const std::string& type) const override;

    [[nodiscard]] bool is_sense_synset_relation(const std::string& type) const override;

    [[nodiscard]] std::vector<std::string> parts_of_speech() const override;

    [[nodiscard]] std::vector<std::string> adjpositions() const override;

private:
    std::vector<std::string> parts_of_speech_;
    std::vector<std::string> adjpositions_;
    std::unordered_set<std::string> synset_relations_;
    std::unordered_set<std::string> sense_relations_;
    std::unordered_set<std::string> sense_synset_relations_;
};

[[nodiscard]] std::shared_ptr<const Vocabulary> standard_vocabulary();

[[nodiscard]] bool is_adjective_pos(const std::string& pos) noexcept;

}  // namespace libwnedit
