#include "libwnedit/lmf_codec.hpp"

#include "libwnedit/errors.hpp"
#include "libwnedit/records.hpp"

#include <pugixml.hpp>

#include <sstream>
#include <stdexcept>
#include <utility>

namespace libwnedit {

namespace {
constexpr const char* kDublinCoreNamespace = "https://globalwordnet.github.io/schemas/dc/";
constexpr unsigned kParseOptions = pugi::parse_default | pugi::parse_doctype;

[[nodiscard]] bool is_meta_attribute(const std::string& name) {
    return name.starts_with("dc:") || name == "status" || name == "note" || name == "confidenceScore";
}

[[nodiscard]] bool at_least(const std::string& lmf_version, const char* minimum) {
    return lmf_version >= minimum;
}

[[nodiscard]] std::string attr(const pugi::xml_node& node, const char* name) {
    return node.attribute(name).value();
}

[[nodiscard]] Metadata read_meta(const pugi::xml_node& node) {
    Metadata meta;
    for (auto attribute : node.attributes()) {
        std::string name = attribute.name();
        if (is_meta_attribute(name)) {
            meta.emplace(std::move(name), attribute.value());
        }
    }
    return meta;
}

[[nodiscard]] std::vector<std::string> split_ids(const std::string& value) {
    std::vector<std::string> ids;
    std::istringstream stream(value);
    std::string id;
    while (stream >> id) {
        ids.push_back(id);
    }
    return ids;
}

[[nodiscard]] std::string join_ids(const std::vector<std::string>& ids) {
    std::string joined;
    for (const auto& id : ids) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += id;
    }
    return joined;
}

[[nodiscard]] std::string version_from_doctype(const pugi::xml_document& doc) {
    for (auto node : doc.children()) {
        if (node.type() != pugi::node_doctype) {
            continue;
        }
        const std::string value = node.value();
        const auto start = value.find("WN-LMF-");
        const auto end = value.find(".dtd", start);
        if (start == std::string::npos || end == std::string::npos) {
            break;
        }
        return value.substr(start + 7, end - start - 7);
    }
    throw InvalidShapeError("Unrecognized WN-LMF document type");
}

[[nodiscard]] std::vector<Pronunciation> read_pronunciations(const pugi::xml_node& node) {
    std::vector<Pronunciation> pronunciations;
    for (auto child : node.children("Pronunciation")) {
        pronunciations.push_back(make_pronunciation(child.text().get(),
                                                    attr(child, "variety"),
                                                    attr(child, "notation"),
                                                    attr(child, "phonemic") != "false",
                                                    attr(child, "audio")));
    }
    return pronunciations;
}

[[nodiscard]] std::vector<Tag> read_tags(const pugi::xml_node& node) {
    std::vector<Tag> tags;
    for (auto child : node.children("Tag")) {
        tags.push_back(Tag{child.text().get(), attr(child, "category")});
    }
    return tags;
}

[[nodiscard]] std::vector<Example> read_examples(const pugi::xml_node& node) {
    std::vector<Example> examples;
    for (auto child : node.children("Example")) {
        examples.push_back(make_example(child.text().get(), attr(child, "language"), read_meta(child)));
    }
    return examples;
}

[[nodiscard]] std::vector<Relation> read_relations(const pugi::xml_node& node, const char* element) {
    std::vector<Relation> relations;
    for (auto child : node.children(element)) {
        relations.push_back(make_relation(attr(child, "target"), attr(child, "relType"), read_meta(child)));
    }
    return relations;
}

[[nodiscard]] SyntacticBehaviour read_syntactic_behaviour(const pugi::xml_node& node) {
    return make_syntactic_behaviour(attr(node, "subcategorizationFrame"),
                                    split_ids(attr(node, "senses")),
                                    attr(node, "id"));
}

class DocumentReader {
public:
    explicit DocumentReader(const Vocabulary& vocabulary) : vocabulary_(vocabulary) {}

    [[nodiscard]] LexicalResource read(const pugi::xml_document& doc) const {
        const std::string lmf_version = version_from_doctype(doc);
        auto root = doc.child("LexicalResource");
        if (!root) {
            throw InvalidShapeError("Missing LexicalResource element");
        }
        std::vector<Lexicon> lexicons;
        for (auto node : root.children("Lexicon")) {
            lexicons.push_back(read_lexicon(node));
        }
        return make_lexical_resource(std::move(lexicons), lmf_version);
    }

private:
    [[nodiscard]] Lexicon read_lexicon(const pugi::xml_node& node) const {
        Lexicon lexicon = make_lexicon(attr(node, "id"),
                                       attr(node, "label"),
                                       attr(node, "language"),
                                       attr(node, "email"),
                                       attr(node, "license"),
                                       attr(node, "version"),
                                       attr(node, "url"),
                                       attr(node, "citation"),
                                       read_meta(node));
        lexicon.logo = attr(node, "logo");
        for (auto child : node.children("LexicalEntry")) {
            lexicon.entries.push_back(read_entry(child));
        }
        for (auto child : node.children("Synset")) {
            lexicon.synsets.push_back(read_synset(child));
        }
        for (auto child : node.children("SyntacticBehaviour")) {
            lexicon.frames.push_back(read_syntactic_behaviour(child));
        }
        return lexicon;
    }

    [[nodiscard]] LexicalEntry read_entry(const pugi::xml_node& node) const {
        auto lemma_node = node.child("Lemma");
        if (!lemma_node) {
            throw InvalidShapeError("Lexical entry without lemma: '" + attr(node, "id") + "'");
        }
        Lemma lemma = make_lemma(attr(lemma_node, "writtenForm"),
                                 attr(lemma_node, "partOfSpeech"),
                                 attr(lemma_node, "script"),
                                 read_tags(lemma_node),
                                 vocabulary_);
        lemma.pronunciations = read_pronunciations(lemma_node);

        std::vector<Form> forms;
        for (auto child : node.children("Form")) {
            Form form = make_form(attr(child, "writtenForm"), attr(child, "script"), read_tags(child));
            form.id = attr(child, "id");
            form.pronunciations = read_pronunciations(child);
            forms.push_back(std::move(form));
        }

        std::vector<Sense> senses;
        for (auto child : node.children("Sense")) {
            senses.push_back(read_sense(child));
        }

        LexicalEntry entry = make_lexical_entry(attr(node, "id"),
                                                std::move(lemma),
                                                std::move(forms),
                                                std::move(senses),
                                                read_meta(node));
        for (auto child : node.children("SyntacticBehaviour")) {
            entry.syntactic_behaviours.push_back(read_syntactic_behaviour(child));
        }
        return entry;
    }

    [[nodiscard]] Sense read_sense(const pugi::xml_node& node) const {
        std::vector<Count> counts;
        for (auto child : node.children("Count")) {
            counts.push_back(make_count(std::string(child.text().get()), read_meta(child)));
        }
        Sense sense = make_sense(attr(node, "id"),
                                 attr(node, "synset"),
                                 read_relations(node, "SenseRelation"),
                                 read_examples(node),
                                 std::move(counts),
                                 attr(node, "adjposition"),
                                 read_meta(node),
                                 vocabulary_);
        sense.subcat = split_ids(attr(node, "subcat"));
        sense.lexicalized = attr(node, "lexicalized") != "false";
        return sense;
    }

    [[nodiscard]] Synset read_synset(const pugi::xml_node& node) const {
        std::vector<Definition> definitions;
        for (auto child : node.children("Definition")) {
            definitions.push_back(make_definition(child.text().get(),
                                                  attr(child, "language"),
                                                  attr(child, "sourceSense"),
                                                  read_meta(child)));
        }
        Synset synset = make_synset(attr(node, "id"),
                                    attr(node, "partOfSpeech"),
                                    attr(node, "ili"),
                                    std::move(definitions),
                                    read_examples(node),
                                    read_relations(node, "SynsetRelation"),
                                    read_meta(node),
                                    vocabulary_);
        if (auto ili_definition = node.child("ILIDefinition")) {
            synset.ili_definition = make_definition(ili_definition.text().get(), {}, {}, read_meta(ili_definition));
        }
        synset.lexfile = attr(node, "lexfile");
        synset.lexicalized = attr(node, "lexicalized") != "false";
        return synset;
    }

    const Vocabulary& vocabulary_;
};

void set_attr(pugi::xml_node& node, const char* name, const std::string& value) {
    node.append_attribute(name) = value.c_str();
}

void set_optional_attr(pugi::xml_node& node, const char* name, const std::string& value) {
    if (!value.empty()) {
        set_attr(node, name, value);
    }
}

void write_meta(pugi::xml_node& node, const Metadata& meta) {
    for (const auto& [key, value] : meta) {
        set_attr(node, key.c_str(), value);
    }
}

pugi::xml_node append_text(pugi::xml_node& parent, const char* name, const std::string& text) {
    auto node = parent.append_child(name);
    node.text().set(text.c_str());
    return node;
}

class DocumentWriter {
public:
    explicit DocumentWriter(std::string lmf_version) : lmf_version_(std::move(lmf_version)) {}

    void write(const LexicalResource& resource, pugi::xml_document& doc) const {
        auto declaration = doc.append_child(pugi::node_declaration);
        declaration.append_attribute("version") = "1.0";
        declaration.append_attribute("encoding") = "UTF-8";
        auto doctype = doc.append_child(pugi::node_doctype);
        doctype.set_value(lmf_doctype(lmf_version_).c_str());

        auto root = doc.append_child("LexicalResource");
        root.append_attribute("xmlns:dc") = kDublinCoreNamespace;
        for (const auto& lexicon : resource.lexicons) {
            Lexicon expressible = lexicon;
            restrict_to_lmf_version(expressible, lmf_version_);
            write_lexicon(root, expressible);
        }
    }

private:
    void write_lexicon(pugi::xml_node& parent, const Lexicon& lexicon) const {
        auto node = parent.append_child("Lexicon");
        set_attr(node, "id", lexicon.id);
        set_attr(node, "label", lexicon.label);
        set_attr(node, "language", lexicon.language);
        set_attr(node, "email", lexicon.email);
        set_attr(node, "license", lexicon.license);
        set_attr(node, "version", lexicon.version);
        set_optional_attr(node, "url", lexicon.url);
        set_optional_attr(node, "citation", lexicon.citation);
        set_optional_attr(node, "logo", lexicon.logo);
        write_meta(node, lexicon.meta);

        for (const auto& entry : lexicon.entries) {
            write_entry(node, entry);
        }
        for (const auto& synset : lexicon.synsets) {
            write_synset(node, synset);
        }
        for (const auto& frame : lexicon.frames) {
            write_syntactic_behaviour(node, frame);
        }
    }

    static void write_pronunciations(pugi::xml_node& node, const std::vector<Pronunciation>& pronunciations) {
        for (const auto& pronunciation : pronunciations) {
            auto child = append_text(node, "Pronunciation", pronunciation.text);
            set_optional_attr(child, "variety", pronunciation.variety);
            set_optional_attr(child, "notation", pronunciation.notation);
            if (!pronunciation.phonemic) {
                set_attr(child, "phonemic", "false");
            }
            set_optional_attr(child, "audio", pronunciation.audio);
        }
    }

    static void write_tags(pugi::xml_node& node, const std::vector<Tag>& tags) {
        for (const auto& tag : tags) {
            auto child = append_text(node, "Tag", tag.text);
            set_attr(child, "category", tag.category);
        }
    }

    static void write_examples(pugi::xml_node& node, const std::vector<Example>& examples) {
        for (const auto& example : examples) {
            auto child = append_text(node, "Example", example.text);
            set_optional_attr(child, "language", example.language);
            write_meta(child, example.meta);
        }
    }

    static void write_relations(pugi::xml_node& node, const char* element, const std::vector<Relation>& relations) {
        for (const auto& relation : relations) {
            auto child = node.append_child(element);
            set_attr(child, "target", relation.target);
            set_attr(child, "relType", relation.type);
            write_meta(child, relation.meta);
        }
    }

    static void write_syntactic_behaviour(pugi::xml_node& parent, const SyntacticBehaviour& behaviour) {
        auto node = parent.append_child("SyntacticBehaviour");
        set_optional_attr(node, "id", behaviour.id);
        set_attr(node, "subcategorizationFrame", behaviour.frame);
        set_optional_attr(node, "senses", join_ids(behaviour.senses));
    }

    void write_entry(pugi::xml_node& parent, const LexicalEntry& entry) const {
        auto node = parent.append_child("LexicalEntry");
        set_attr(node, "id", entry.id);
        write_meta(node, entry.meta);

        auto lemma = node.append_child("Lemma");
        set_attr(lemma, "writtenForm", entry.lemma.written_form);
        set_attr(lemma, "partOfSpeech", entry.lemma.pos);
        set_optional_attr(lemma, "script", entry.lemma.script);
        write_pronunciations(lemma, entry.lemma.pronunciations);
        write_tags(lemma, entry.lemma.tags);

        for (const auto& form : entry.forms) {
            auto child = node.append_child("Form");
            set_optional_attr(child, "id", form.id);
            set_attr(child, "writtenForm", form.written_form);
            set_optional_attr(child, "script", form.script);
            write_pronunciations(child, form.pronunciations);
            write_tags(child, form.tags);
        }
        for (const auto& sense : entry.senses) {
            write_sense(node, sense);
        }
        for (const auto& behaviour : entry.syntactic_behaviours) {
            write_syntactic_behaviour(node, behaviour);
        }
    }

    void write_sense(pugi::xml_node& parent, const Sense& sense) const {
        auto node = parent.append_child("Sense");
        set_attr(node, "id", sense.id);
        set_attr(node, "synset", sense.synset);
        if (!sense.lexicalized) {
            set_attr(node, "lexicalized", "false");
        }
        set_optional_attr(node, "adjposition", sense.adjposition);
        set_optional_attr(node, "subcat", join_ids(sense.subcat));
        write_meta(node, sense.meta);

        write_relations(node, "SenseRelation", sense.relations);
        write_examples(node, sense.examples);
        for (const auto& count : sense.counts) {
            auto child = append_text(node, "Count", std::to_string(count.value));
            write_meta(child, count.meta);
        }
    }

    void write_synset(pugi::xml_node& parent, const Synset& synset) const {
        auto node = parent.append_child("Synset");
        set_attr(node, "id", synset.id);
        set_attr(node, "ili", synset.ili);
        set_attr(node, "partOfSpeech", synset.pos);
        if (!synset.lexicalized) {
            set_attr(node, "lexicalized", "false");
        }
        set_optional_attr(node, "lexfile", synset.lexfile);
        write_meta(node, synset.meta);

        for (const auto& definition : synset.definitions) {
            auto child = append_text(node, "Definition", definition.text);
            set_optional_attr(child, "language", definition.language);
            set_optional_attr(child, "sourceSense", definition.source_sense);
            write_meta(child, definition.meta);
        }
        if (synset.ili_definition) {
            auto child = append_text(node, "ILIDefinition", synset.ili_definition->text);
            write_meta(child, synset.ili_definition->meta);
        }
        write_examples(node, synset.examples);
        write_relations(node, "SynsetRelation", synset.relations);
    }

    std::string lmf_version_;
};

void check_parse(const pugi::xml_parse_result& result, const std::string& source) {
    if (!result) {
        throw InvalidShapeError("Malformed WN-LMF document " + source + ": " + result.description() +
                                " at offset " + std::to_string(result.offset));
    }
}
}  // namespace

void restrict_to_lmf_version(Lexicon& lexicon, const std::string& lmf_version) {
    if (at_least(lmf_version, "1.1")) {
        return;
    }
    lexicon.logo.clear();
    lexicon.frames.clear();
    for (auto& entry : lexicon.entries) {
        entry.lemma.pronunciations.clear();
        for (auto& form : entry.forms) {
            form.pronunciations.clear();
        }
        for (auto& sense : entry.senses) {
            sense.subcat.clear();
        }
        for (auto& behaviour : entry.syntactic_behaviours) {
            behaviour.id.clear();
        }
    }
    for (auto& synset : lexicon.synsets) {
        synset.lexfile.clear();
    }
}

std::string lmf_doctype(const std::string& lmf_version) {
    return "LexicalResource SYSTEM \"http://globalwordnet.github.io/schemas/WN-LMF-" + lmf_version + ".dtd\"";
}

LmfCodec::LmfCodec(std::shared_ptr<const Vocabulary> vocabulary) : vocabulary_(std::move(vocabulary)) {
    if (!vocabulary_) {
        throw std::invalid_argument("codec requires a vocabulary");
    }
}

LexicalResource LmfCodec::parse(std::string_view xml) const {
    pugi::xml_document doc;
    check_parse(doc.load_buffer(xml.data(), xml.size(), kParseOptions), "(buffer)");
    return DocumentReader(*vocabulary_).read(doc);
}

LexicalResource LmfCodec::load_file(const std::filesystem::path& path) const {
    if (!std::filesystem::exists(path)) {
        throw NotFoundError("File not found: " + path.string());
    }
    pugi::xml_document doc;
    check_parse(doc.load_file(path.c_str(), kParseOptions), path.string());
    return DocumentReader(*vocabulary_).read(doc);
}

std::string LmfCodec::serialize(const LexicalResource& resource) const {
    validate_lmf_version(resource.lmf_version);
    pugi::xml_document doc;
    DocumentWriter(resource.lmf_version).write(resource, doc);
    std::ostringstream out;
    doc.save(out, "  ", pugi::format_default, pugi::encoding_utf8);
    return out.str();
}

void LmfCodec::dump_file(const LexicalResource& resource, const std::filesystem::path& path) const {
    validate_lmf_version(resource.lmf_version);
    pugi::xml_document doc;
    DocumentWriter(resource.lmf_version).write(resource, doc);
    if (!doc.save_file(path.c_str(), "  ", pugi::format_default, pugi::encoding_utf8)) {
        throw std::runtime_error("could not write " + path.string());
    }
}

}  // namespace libwnedit
