#include "libwnedit/lexicon_index.hpp"

#include <algorithm>

namespace libwnedit {

void LexiconIndex::rebuild(Lexicon& lexicon) {
    clear();
    entry_by_id_.reserve(lexicon.entries.size());
    synset_by_id_.reserve(lexicon.synsets.size());
    for (auto it = lexicon.entries.begin(); it != lexicon.entries.end(); ++it) {
        on_entry_added(it);
    }
    for (auto it = lexicon.synsets.begin(); it != lexicon.synsets.end(); ++it) {
        on_synset_added(it);
    }
}

void LexiconIndex::clear() noexcept {
    entry_by_id_.clear();
    entries_by_lemma_.clear();
    sense_by_id_.clear();
    synset_by_id_.clear();
}

void LexiconIndex::on_entry_added(EntryList::iterator entry) {
    entry_by_id_.emplace(entry->id, entry);
    entries_by_lemma_[entry->lemma.written_form].push_back(&*entry);
    for (std::size_t i = 0; i < entry->senses.size(); ++i) {
        on_sense_added(*entry, i);
    }
}

void LexiconIndex::on_entry_removed(const LexicalEntry& entry) {
    for (const auto& sense : entry.senses) {
        on_sense_removed(sense.id);
    }
    auto it = entries_by_lemma_.find(entry.lemma.written_form);
    if (it != entries_by_lemma_.end()) {
        auto& bucket = it->second;
        bucket.erase(std::remove(bucket.begin(), bucket.end(), &entry), bucket.end());
        if (bucket.empty()) {
            entries_by_lemma_.erase(it);
        }
    }
    entry_by_id_.erase(entry.id);
}

void LexiconIndex::on_sense_added(LexicalEntry& entry, std::size_t position) {
    sense_by_id_.insert_or_assign(entry.senses[position].id, SenseSlot{&entry, position});
}

void LexiconIndex::on_sense_removed(const std::string& sense_id) {
    sense_by_id_.erase(sense_id);
}

void LexiconIndex::reindex_senses(LexicalEntry& entry) {
    for (std::size_t i = 0; i < entry.senses.size(); ++i) {
        on_sense_added(entry, i);
    }
}

void LexiconIndex::on_synset_added(SynsetList::iterator synset) {
    synset_by_id_.emplace(synset->id, synset);
}

void LexiconIndex::on_synset_removed(const std::string& synset_id) {
    synset_by_id_.erase(synset_id);
}

LexicalEntry* LexiconIndex::entry(const std::string& id) const noexcept {
    auto it = entry_by_id_.find(id);
    return it == entry_by_id_.end() ? nullptr : &*it->second;
}

Synset* LexiconIndex::synset(const std::string& id) const noexcept {
    auto it = synset_by_id_.find(id);
    return it == synset_by_id_.end() ? nullptr : &*it->second;
}

Sense* LexiconIndex::sense(const std::string& id) const noexcept {
    auto it = sense_by_id_.find(id);
    if (it == sense_by_id_.end()) {
        return nullptr;
    }
    return &it->second.entry->senses[it->second.position];
}

LexicalEntry* LexiconIndex::sense_owner(const std::string& sense_id) const noexcept {
    auto it = sense_by_id_.find(sense_id);
    return it == sense_by_id_.end() ? nullptr : it->second.entry;
}

std::optional<EntryList::iterator> LexiconIndex::entry_position(const std::string& id) const {
    auto it = entry_by_id_.find(id);
    if (it == entry_by_id_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<SynsetList::iterator> LexiconIndex::synset_position(const std::string& id) const {
    auto it = synset_by_id_.find(id);
    if (it == synset_by_id_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<LexicalEntry*> LexiconIndex::entries_by_lemma(const std::string& lemma, const std::string& pos) const {
    std::vector<LexicalEntry*> matches;
    auto it = entries_by_lemma_.find(lemma);
    if (it == entries_by_lemma_.end()) {
        return matches;
    }
    for (auto* entry : it->second) {
        if (pos.empty() || entry->lemma.pos == pos) {
            matches.push_back(entry);
        }
    }
    return matches;
}

bool LexiconIndex::contains_entry(const std::string& id) const noexcept {
    return entry_by_id_.contains(id);
}

bool LexiconIndex::contains_sense(const std::string& id) const noexcept {
    return sense_by_id_.contains(id);
}

bool LexiconIndex::contains_synset(const std::string& id) const noexcept {
    return synset_by_id_.contains(id);
}

std::size_t LexiconIndex::entry_count() const noexcept {
    return entry_by_id_.size();
}

std::size_t LexiconIndex::sense_count() const noexcept {
    return sense_by_id_.size();
}

std::size_t LexiconIndex::synset_count() const noexcept {
    return synset_by_id_.size();
}

std::vector<std::string> LexiconIndex::audit(const Lexicon& lexicon) const {
    std::vector<std::string> problems;
    std::size_t sense_total = 0;
    std::size_t lemma_total = 0;

    for (const auto& entry : lexicon.entries) {
        auto it = entry_by_id_.find(entry.id);
        if (it == entry_by_id_.end() || &*it->second != &entry) {
            problems.push_back("entry missing from id index: " + entry.id);
        }
        auto bucket = entries_by_lemma_.find(entry.lemma.written_form);
        if (bucket == entries_by_lemma_.end() ||
            std::find(bucket->second.begin(), bucket->second.end(), &entry) == bucket->second.end()) {
            problems.push_back("entry missing from lemma index: " + entry.id);
        }
        for (std::size_t i = 0; i < entry.senses.size(); ++i) {
            auto slot = sense_by_id_.find(entry.senses[i].id);
            if (slot == sense_by_id_.end()) {
                problems.push_back("sense missing from id index: " + entry.senses[i].id);
            } else if (slot->second.entry != &entry || slot->second.position != i) {
                problems.push_back("sense index points to wrong record: " + entry.senses[i].id);
            }
        }
        sense_total += entry.senses.size();
    }
    for (const auto& synset : lexicon.synsets) {
        auto it = synset_by_id_.find(synset.id);
        if (it == synset_by_id_.end() || &*it->second != &synset) {
            problems.push_back("synset missing from id index: " + synset.id);
        }
    }
    for (const auto& [lemma, bucket] : entries_by_lemma_) {
        lemma_total += bucket.size();
    }

    if (entry_by_id_.size() != lexicon.entries.size()) {
        problems.push_back("entry id index holds stale records");
    }
    if (lemma_total != lexicon.entries.size()) {
        problems.push_back("lemma index holds stale records");
    }
    if (sense_by_id_.size() != sense_total) {
        problems.push_back("sense id index holds stale records");
    }
    if (synset_by_id_.size() != lexicon.synsets.size()) {
        problems.push_back("synset id index holds stale records");
    }
    return problems;
}

}  // namespace libwnedit
