#include "libwnedit/id_generator.hpp"

#include <cctype>
#include <cstdio>

namespace libwnedit {

namespace {
[[nodiscard]] bool is_id_char(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c >= 0x80;
}
}  // namespace

IdGenerator::IdGenerator(std::uint64_t seed) : engine_(seed) {}

std::string IdGenerator::next(const std::string& lexicon_id,
                              const std::string& prefix,
                              const std::string& suffix,
                              const IdTakenPredicate& taken) {
    const std::string head = (lexicon_id.empty() ? std::string("custom") : lexicon_id) + "-" +
                             sanitize_id_component(prefix) + "-";
    for (;;) {
        char hex[9];
        std::snprintf(hex, sizeof(hex), "%08x", static_cast<unsigned>(engine_() & 0xffffffffULL));
        std::string candidate = head + hex;
        if (!suffix.empty()) {
            candidate += "-" + sanitize_id_component(suffix);
        }
        if (!taken || !taken(candidate)) {
            return candidate;
        }
    }
}

void IdGenerator::reseed(std::uint64_t seed) {
    engine_.seed(seed);
}

std::string sanitize_id_component(const std::string& value) {
    std::string cleaned;
    cleaned.reserve(value.size());
    for (unsigned char c : value) {
        cleaned.push_back(is_id_char(c) ? static_cast<char>(c) : '_');
    }
    return cleaned;
}

std::string first_free_id(const std::string& base, const IdTakenPredicate& taken) {
    if (!taken || !taken(base)) {
        return base;
    }
    for (int n = 2;; ++n) {
        std::string candidate = base + "-" + std::to_string(n);
        if (!taken(candidate)) {
            return candidate;
        }
    }
}

}  // namespace libwnedit
