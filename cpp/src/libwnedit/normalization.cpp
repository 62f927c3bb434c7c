#include "libwnedit/normalization.hpp"

#include <cctype>

namespace libwnedit {

namespace {
void normalize_examples(std::vector<Example>& examples) {
    for (auto& example : examples) {
        example.text = normalize_text(example.text);
    }
}

template <typename Container>
[[nodiscard]] std::string compare_sequences(const Container& lhs, const Container& rhs, const std::string& path) {
    if (lhs.size() != rhs.size()) {
        return path + ".size";
    }
    std::size_t i = 0;
    for (auto left = lhs.begin(), right = rhs.begin(); left != lhs.end(); ++left, ++right, ++i) {
        if (!(*left == *right)) {
            return path + "[" + std::to_string(i) + "]";
        }
    }
    return {};
}
}  // namespace

std::string normalize_text(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    bool pending_space = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result.push_back(' ');
            pending_space = false;
        }
        result.push_back(c);
    }
    return result;
}

LexicalResource normalize(LexicalResource resource) {
    for (auto& lexicon : resource.lexicons) {
        lexicon.citation = normalize_text(lexicon.citation);
        for (auto& entry : lexicon.entries) {
            for (auto& sense : entry.senses) {
                normalize_examples(sense.examples);
            }
        }
        for (auto& synset : lexicon.synsets) {
            for (auto& definition : synset.definitions) {
                definition.text = normalize_text(definition.text);
            }
            if (synset.ili_definition) {
                synset.ili_definition->text = normalize_text(synset.ili_definition->text);
            }
            normalize_examples(synset.examples);
        }
    }
    return resource;
}

bool equivalent(const LexicalResource& lhs, const LexicalResource& rhs) {
    return normalize(lhs) == normalize(rhs);
}

std::string first_difference(const LexicalResource& lhs, const LexicalResource& rhs) {
    const LexicalResource a = normalize(lhs);
    const LexicalResource b = normalize(rhs);
    if (a.lmf_version != b.lmf_version) {
        return "lmf_version";
    }
    if (a.lexicons.size() != b.lexicons.size()) {
        return "lexicons.size";
    }
    for (std::size_t i = 0; i < a.lexicons.size(); ++i) {
        const Lexicon& left = a.lexicons[i];
        const Lexicon& right = b.lexicons[i];
        const std::string path = "lexicons[" + std::to_string(i) + "]";
        if (auto diff = compare_sequences(left.entries, right.entries, path + ".entries"); !diff.empty()) {
            return diff;
        }
        if (auto diff = compare_sequences(left.synsets, right.synsets, path + ".synsets"); !diff.empty()) {
            return diff;
        }
        if (auto diff = compare_sequences(left.frames, right.frames, path + ".frames"); !diff.empty()) {
            return diff;
        }
        if (!(left == right)) {
            return path;
        }
    }
    return {};
}

}  // namespace libwnedit
