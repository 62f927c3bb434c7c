#pragma once

#include "libwnedit/record_types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace libwnedit {

struct SenseSlot {
    LexicalEntry* entry{nullptr};
    std::size_t position{0};
};

// Derived lookup structures over one Lexicon. Iterators refer into the
// lexicon's entry and synset lists, so the index must be rebuilt whenever the
// lexicon object itself is replaced.
class LexiconIndex {
public:
    LexiconIndex() = default;

    void rebuild(Lexicon& lexicon);

    void clear() noexcept;

    void on_entry_added(EntryList::iterator entry);

    void on_entry_removed(const LexicalEntry& entry);

    void on_sense_added(LexicalEntry& entry, std::size_t position);

    void on_sense_removed(const std::string& sense_id);

    // Refreshes sense positions after senses were erased from `entry`.
    void reindex_senses(LexicalEntry& entry);

    void on_synset_added(SynsetList::iterator synset);

    void on_synset_removed(const std::string& synset_id);

    [[nodiscard]] LexicalEntry* entry(const std::string& id) const noexcept;

    [[nodiscard]] Synset* synset(const std::string& id) const noexcept;

    [[nodiscard]] Sense* sense(const std::string& id) const noexcept;

    [[nodiscard]] LexicalEntry* sense_owner(const std::string& sense_id) const noexcept;

    [[nodiscard]] std::optional<EntryList::iterator> entry_position(const std::string& id) const;

    [[nodiscard]] std::optional<SynsetList::iterator> synset_position(const std::string& id) const;

    // Entries in insertion order; an empty `pos` matches every part of speech.
    [[nodiscard]] std::vector<LexicalEntry*> entries_by_lemma(const std::string& lemma,
                                                              const std::string& pos = {}) const;

    [[nodiscard]] bool contains_entry(const std::string& id) const noexcept;

    [[nodiscard]] bool contains_sense(const std::string& id) const noexcept;

    [[nodiscard]] bool contains_synset(const std::string& id) const noexcept;

    [[nodiscard]] std::size_t entry_count() const noexcept;

    [[nodiscard]] std::size_t sense_count() const noexcept;

    [[nodiscard]] std::size_t synset_count() const noexcept;

    // Differences between the index and `lexicon`; empty when they agree exactly.
    [[nodiscard]] std::vector<std::string> audit(const Lexicon& lexicon) const;

private:
    std::unordered_map<std::string, EntryList::iterator> entry_by_id_;
    std::unordered_map<std::string, std::vector<LexicalEntry*>> entries_by_lemma_;
    std::unordered_map<std::string, SenseSlot> sense_by_id_;
    std::unordered_map<std::string, SynsetList::iterator> synset_by_id_;
};

}  // namespace libwnedit
