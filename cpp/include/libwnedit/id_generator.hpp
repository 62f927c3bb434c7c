#pragma once

#include <cstdint>
#include <functional>
#include <random>
#include <string>

namespace libwnedit {

using IdTakenPredicate = std::function<bool(const std::string&)>;

// Produces ids of the form `<lexicon>-<prefix>-<8 hex digits>[-<suffix>]`.
// The sequence is reproducible for a given seed.
class IdGenerator {
public:
    static constexpr std::uint64_t kDefaultSeed = 0x5eed5eedULL;

    explicit IdGenerator(std::uint64_t seed = kDefaultSeed);

    [[nodiscard]] std::string next(const std::string& lexicon_id,
                                   const std::string& prefix,
                                   const std::string& suffix,
                                   const IdTakenPredicate& taken);

    void reseed(std::uint64_t seed);

private:
    std::mt19937_64 engine_;
};

// Replaces characters that are not allowed in an XML ID with '_'.
[[nodiscard]] std::string sanitize_id_component(const std::string& value);

// `base` if free, otherwise `base-2`, `base-3`, ...
[[nodiscard]] std::string first_free_id(const std::string& base, const IdTakenPredicate& taken);

}  // namespace libwnedit
