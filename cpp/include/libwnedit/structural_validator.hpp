#pragma once

#include "libwnedit/record_types.hpp"
#include "libwnedit/vocabulary.hpp"

#include <memory>
#include <string>
#include <vector>

namespace libwnedit {

struct Complaint {
    std::string code;  // E* for errors, W* for warnings
    std::string id;    // offending record
    std::string message;

    [[nodiscard]] bool is_error() const noexcept { return !code.empty() && code.front() == 'E'; }

    bool operator==(const Complaint&) const = default;
};

// Advisory checker over a full lexicon snapshot.
class ValidationOracle {
public:
    virtual ~ValidationOracle() = default;

    [[nodiscard]] virtual std::vector<Complaint> validate(const Lexicon& lexicon) const = 0;
};

// Built-in checks:
//   E101 duplicate id              E201 relation target missing
//   E202 sense synset missing      W204 unknown relation type
//   W305 blank definition          W306 blank example
//   W307 repeated definition       W501 entry without senses
//   W502 sense part of speech differs from its synset
class StructuralValidator final : public ValidationOracle {
public:
    explicit StructuralValidator(std::shared_ptr<const Vocabulary> vocabulary = standard_vocabulary());

    [[nodiscard]] std::vector<Complaint> validate(const Lexicon& lexicon) const override;

private:
    std::shared_ptr<const Vocabulary> vocabulary_;
};

}  // namespace libwnedit
