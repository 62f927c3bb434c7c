#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "libwnedit/errors.hpp"
#include "libwnedit/lexicon_editor.hpp"
#include "libwnedit/lmf_codec.hpp"
#include "libwnedit/normalization.hpp"
#include "libwnedit/records.hpp"
#include "libwnedit/sqlite_store.hpp"

#include <memory>

namespace py = pybind11;
using namespace libwnedit;

PYBIND11_MODULE(_libwnedit, m) {
    m.doc() = "libwnedit python bindings";

    py::register_exception<NotFoundError>(m, "NotFoundError", PyExc_LookupError);
    py::register_exception<InvalidShapeError>(m, "InvalidShapeError", PyExc_ValueError);
    py::register_exception<AmbiguousMatchError>(m, "AmbiguousMatchError", PyExc_ValueError);
    py::register_exception<SchemaMismatchError>(m, "SchemaMismatchError", PyExc_RuntimeError);
    py::register_exception<BackingStoreError>(m, "BackingStoreError", PyExc_RuntimeError);

    py::enum_<RelationKind>(m, "RelationKind")
        .value("SynsetToSynset", RelationKind::SynsetToSynset)
        .value("SenseToSense", RelationKind::SenseToSense)
        .value("SenseToSynset", RelationKind::SenseToSynset)
        .export_values();

    py::enum_<LoadPath>(m, "LoadPath")
        .value("Fast", LoadPath::Fast)
        .value("Fallback", LoadPath::Fallback)
        .export_values();

    // Records

    py::class_<Tag>(m, "Tag")
        .def(py::init<>())
        .def_readwrite("text", &Tag::text)
        .def_readwrite("category", &Tag::category);

    py::class_<Pronunciation>(m, "Pronunciation")
        .def(py::init<>())
        .def_readwrite("text", &Pronunciation::text)
        .def_readwrite("variety", &Pronunciation::variety)
        .def_readwrite("notation", &Pronunciation::notation)
        .def_readwrite("phonemic", &Pronunciation::phonemic)
        .def_readwrite("audio", &Pronunciation::audio);

    py::class_<Lemma>(m, "Lemma")
        .def(py::init<>())
        .def_readwrite("written_form", &Lemma::written_form)
        .def_readwrite("pos", &Lemma::pos)
        .def_readwrite("script", &Lemma::script)
        .def_readwrite("pronunciations", &Lemma::pronunciations)
        .def_readwrite("tags", &Lemma::tags);

    py::class_<Form>(m, "Form")
        .def(py::init<>())
        .def_readwrite("written_form", &Form::written_form)
        .def_readwrite("id", &Form::id)
        .def_readwrite("script", &Form::script)
        .def_readwrite("pronunciations", &Form::pronunciations)
        .def_readwrite("tags", &Form::tags);

    py::class_<Definition>(m, "Definition")
        .def(py::init<>())
        .def_readwrite("text", &Definition::text)
        .def_readwrite("language", &Definition::language)
        .def_readwrite("source_sense", &Definition::source_sense)
        .def_readwrite("meta", &Definition::meta);

    py::class_<Example>(m, "Example")
        .def(py::init<>())
        .def_readwrite("text", &Example::text)
        .def_readwrite("language", &Example::language)
        .def_readwrite("meta", &Example::meta);

    py::class_<Count>(m, "Count")
        .def(py::init<>())
        .def_readwrite("value", &Count::value)
        .def_readwrite("meta", &Count::meta);

    py::class_<Relation>(m, "Relation")
        .def(py::init<>())
        .def_readwrite("target", &Relation::target)
        .def_readwrite("type", &Relation::type)
        .def_readwrite("meta", &Relation::meta);

    py::class_<SyntacticBehaviour>(m, "SyntacticBehaviour")
        .def(py::init<>())
        .def_readwrite("id", &SyntacticBehaviour::id)
        .def_readwrite("frame", &SyntacticBehaviour::frame)
        .def_readwrite("senses", &SyntacticBehaviour::senses);

    py::class_<Sense>(m, "Sense")
        .def(py::init<>())
        .def_readwrite("id", &Sense::id)
        .def_readwrite("synset", &Sense::synset)
        .def_readwrite("relations", &Sense::relations)
        .def_readwrite("examples", &Sense::examples)
        .def_readwrite("counts", &Sense::counts)
        .def_readwrite("adjposition", &Sense::adjposition)
        .def_readwrite("subcat", &Sense::subcat)
        .def_readwrite("lexicalized", &Sense::lexicalized)
        .def_readwrite("meta", &Sense::meta);

    py::class_<LexicalEntry>(m, "LexicalEntry")
        .def(py::init<>())
        .def_readwrite("id", &LexicalEntry::id)
        .def_readwrite("lemma", &LexicalEntry::lemma)
        .def_readwrite("forms", &LexicalEntry::forms)
        .def_readwrite("senses", &LexicalEntry::senses)
        .def_readwrite("syntactic_behaviours", &LexicalEntry::syntactic_behaviours)
        .def_readwrite("meta", &LexicalEntry::meta);

    py::class_<Synset>(m, "Synset")
        .def(py::init<>())
        .def_readwrite("id", &Synset::id)
        .def_readwrite("pos", &Synset::pos)
        .def_readwrite("ili", &Synset::ili)
        .def_readwrite("ili_definition", &Synset::ili_definition)
        .def_readwrite("definitions", &Synset::definitions)
        .def_readwrite("examples", &Synset::examples)
        .def_readwrite("relations", &Synset::relations)
        .def_readwrite("lexfile", &Synset::lexfile)
        .def_readwrite("lexicalized", &Synset::lexicalized)
        .def_readwrite("meta", &Synset::meta);

    py::class_<Lexicon>(m, "Lexicon")
        .def(py::init<>())
        .def_readwrite("id", &Lexicon::id)
        .def_readwrite("label", &Lexicon::label)
        .def_readwrite("language", &Lexicon::language)
        .def_readwrite("email", &Lexicon::email)
        .def_readwrite("license", &Lexicon::license)
        .def_readwrite("version", &Lexicon::version)
        .def_readwrite("url", &Lexicon::url)
        .def_readwrite("citation", &Lexicon::citation)
        .def_readwrite("logo", &Lexicon::logo)
        .def_readwrite("entries", &Lexicon::entries)
        .def_readwrite("synsets", &Lexicon::synsets)
        .def_readwrite("frames", &Lexicon::frames)
        .def_readwrite("meta", &Lexicon::meta);

    py::class_<LexicalResource>(m, "LexicalResource")
        .def(py::init<>())
        .def_readwrite("lmf_version", &LexicalResource::lmf_version)
        .def_readwrite("lexicons", &LexicalResource::lexicons)
        .def("__eq__", [](const LexicalResource& lhs, const LexicalResource& rhs) { return lhs == rhs; });

    py::class_<LexiconStats>(m, "LexiconStats")
        .def_readonly("synsets", &LexiconStats::synsets)
        .def_readonly("entries", &LexiconStats::entries)
        .def_readonly("senses", &LexiconStats::senses);

    m.def("validate_pos", [](const std::string& pos) { validate_pos(pos); }, py::arg("pos"));
    m.def("validate_count", py::overload_cast<const std::string&>(&validate_count), py::arg("value"));
    m.def("equivalent", &equivalent, py::arg("lhs"), py::arg("rhs"));

    // Editor configuration and results

    py::class_<ValidationWarning>(m, "ValidationWarning")
        .def_readonly("relation_type", &ValidationWarning::relation_type)
        .def_readonly("kind", &ValidationWarning::kind)
        .def_readonly("message", &ValidationWarning::message);

    py::class_<RelationResult>(m, "RelationResult")
        .def_readonly("relation", &RelationResult::relation)
        .def_readonly("warning", &RelationResult::warning)
        .def("has_warning", &RelationResult::has_warning);

    py::class_<Complaint>(m, "Complaint")
        .def_readonly("code", &Complaint::code)
        .def_readonly("id", &Complaint::id)
        .def_readonly("message", &Complaint::message)
        .def("is_error", &Complaint::is_error);

    py::class_<LexiconDefaults>(m, "LexiconDefaults")
        .def(py::init<>())
        .def_readwrite("language", &LexiconDefaults::language)
        .def_readwrite("email", &LexiconDefaults::email)
        .def_readwrite("license", &LexiconDefaults::license)
        .def_readwrite("version", &LexiconDefaults::version)
        .def_readwrite("lmf_version", &LexiconDefaults::lmf_version);

    py::class_<MetadataOverrides>(m, "MetadataOverrides")
        .def(py::init<>())
        .def_readwrite("id", &MetadataOverrides::id)
        .def_readwrite("label", &MetadataOverrides::label)
        .def_readwrite("language", &MetadataOverrides::language)
        .def_readwrite("email", &MetadataOverrides::email)
        .def_readwrite("license", &MetadataOverrides::license)
        .def_readwrite("version", &MetadataOverrides::version)
        .def_readwrite("url", &MetadataOverrides::url)
        .def_readwrite("citation", &MetadataOverrides::citation)
        .def_readwrite("lmf_version", &MetadataOverrides::lmf_version);

    py::class_<NegotiatedMetadata>(m, "NegotiatedMetadata")
        .def_readonly("id", &NegotiatedMetadata::id)
        .def_readonly("label", &NegotiatedMetadata::label)
        .def_readonly("language", &NegotiatedMetadata::language)
        .def_readonly("email", &NegotiatedMetadata::email)
        .def_readonly("license", &NegotiatedMetadata::license)
        .def_readonly("version", &NegotiatedMetadata::version)
        .def_readonly("url", &NegotiatedMetadata::url)
        .def_readonly("citation", &NegotiatedMetadata::citation)
        .def_readonly("read_lmf_version", &NegotiatedMetadata::read_lmf_version)
        .def_readonly("write_lmf_version", &NegotiatedMetadata::write_lmf_version);

    py::class_<EditorOptions>(m, "EditorOptions")
        .def(py::init<>())
        .def_readwrite("validate_relations", &EditorOptions::validate_relations)
        .def_readwrite("id_seed", &EditorOptions::id_seed)
        .def_readwrite("defaults", &EditorOptions::defaults)
        .def_property(
            "structural_validation",
            [](const EditorOptions& options) { return options.validator != nullptr; },
            [](EditorOptions& options, bool enabled) {
                options.validator = enabled ? std::make_shared<StructuralValidator>(options.vocabulary) : nullptr;
            });

    py::class_<LoaderOptions>(m, "LoaderOptions")
        .def(py::init<>())
        .def_readwrite("allow_fast_path", &LoaderOptions::allow_fast_path);

    py::class_<SynsetChanges>(m, "SynsetChanges")
        .def(py::init<>())
        .def_readwrite("replace_definitions", &SynsetChanges::replace_definitions)
        .def_readwrite("add_definitions", &SynsetChanges::add_definitions)
        .def_readwrite("replace_examples", &SynsetChanges::replace_examples)
        .def_readwrite("add_examples", &SynsetChanges::add_examples)
        .def_readwrite("ili", &SynsetChanges::ili)
        .def_readwrite("lexfile", &SynsetChanges::lexfile);

    // Collaborators

    py::class_<BackingStore>(m, "BackingStore");
    py::class_<CommitSink>(m, "CommitSink");

    py::class_<SqliteStore, BackingStore, CommitSink>(m, "SqliteStore")
        .def(py::init([](const std::string& path) { return std::make_unique<SqliteStore>(path); }),
             py::arg("path") = ":memory:")
        .def("schema_version", &SqliteStore::schema_version)
        .def("export_lexicon",
             [](const SqliteStore& store, const std::string& specifier, const std::string& lmf_version) {
                 return store.export_lexicon(LexiconLocator::parse(specifier), lmf_version);
             },
             py::arg("specifier"), py::arg("lmf_version") = "")
        .def("commit", &SqliteStore::commit, py::arg("resource"))
        .def("lexicons", &SqliteStore::lexicons)
        .def("remove", &SqliteStore::remove, py::arg("specifier"))
        .def("execute", &SqliteStore::execute, py::arg("sql"));

    py::class_<LmfCodec>(m, "LmfCodec")
        .def(py::init<>())
        .def("parse", [](const LmfCodec& codec, const std::string& xml) { return codec.parse(xml); }, py::arg("xml"))
        .def("load_file", [](const LmfCodec& codec, const std::string& path) { return codec.load_file(path); },
             py::arg("path"))
        .def("serialize", &LmfCodec::serialize, py::arg("resource"))
        .def("dump_file",
             [](const LmfCodec& codec, const LexicalResource& resource, const std::string& path) {
                 codec.dump_file(resource, path);
             },
             py::arg("resource"), py::arg("path"));

    // Editor

    py::class_<LexiconEditor>(m, "LexiconEditor")
        .def_static("create_new", &LexiconEditor::create_new,
                    py::arg("lexicon_id"), py::arg("metadata") = MetadataOverrides{},
                    py::arg("options") = EditorOptions{})
        .def_static("from_resource", &LexiconEditor::from_resource,
                    py::arg("resource"), py::arg("overrides") = MetadataOverrides{},
                    py::arg("options") = EditorOptions{})
        .def_static("load_file",
                    [](const std::string& path, const MetadataOverrides& overrides, EditorOptions options) {
                        return LexiconEditor::load_file(path, overrides, std::move(options));
                    },
                    py::arg("path"), py::arg("overrides") = MetadataOverrides{},
                    py::arg("options") = EditorOptions{})
        .def_static("open", &LexiconEditor::open,
                    py::arg("store"), py::arg("specifier"), py::arg("overrides") = MetadataOverrides{},
                    py::arg("options") = EditorOptions{}, py::arg("loader_options") = LoaderOptions{})
        .def("create_synset", &LexiconEditor::create_synset,
             py::arg("pos"), py::arg("definitions") = std::vector<std::string>{},
             py::arg("examples") = std::vector<std::string>{}, py::arg("words") = std::vector<std::string>{},
             py::arg("ili") = "", py::arg("synset_id") = "",
             py::return_value_policy::copy)
        .def("modify_synset", &LexiconEditor::modify_synset, py::arg("synset_id"), py::arg("changes"),
             py::return_value_policy::copy)
        .def("remove_synset", &LexiconEditor::remove_synset, py::arg("synset_id"))
        .def("add_synset_relation", &LexiconEditor::add_synset_relation,
             py::arg("source_id"), py::arg("target_id"), py::arg("relation_type"), py::arg("validate") = true)
        .def("add_sense_relation", &LexiconEditor::add_sense_relation,
             py::arg("source_sense_id"), py::arg("target_id"), py::arg("relation_type"), py::arg("validate") = true)
        .def("remove_synset_relation", &LexiconEditor::remove_synset_relation,
             py::arg("source_id"), py::arg("target_id"), py::arg("relation_type"))
        .def("remove_sense_relation", &LexiconEditor::remove_sense_relation,
             py::arg("source_sense_id"), py::arg("target_id"), py::arg("relation_type"))
        .def("create_entry", &LexiconEditor::create_entry,
             py::arg("lemma"), py::arg("pos"), py::arg("forms") = std::vector<std::string>{},
             py::arg("entry_id") = "", py::return_value_policy::copy)
        .def("add_word_to_synset", &LexiconEditor::add_word_to_synset,
             py::arg("synset_id"), py::arg("lemma"), py::arg("pos") = py::none(),
             py::return_value_policy::copy)
        .def("find_entries", &LexiconEditor::find_entries, py::arg("lemma"), py::arg("pos") = "",
             py::return_value_policy::copy)
        .def("remove_entry", &LexiconEditor::remove_entry, py::arg("entry_id"))
        .def("remove_sense", &LexiconEditor::remove_sense, py::arg("sense_id"))
        .def("add_count", &LexiconEditor::add_count, py::arg("sense_id"), py::arg("value"),
             py::return_value_policy::copy)
        .def("set_adjposition", &LexiconEditor::set_adjposition, py::arg("sense_id"), py::arg("adjposition"),
             py::return_value_policy::copy)
        .def("get_synset", &LexiconEditor::get_synset, py::arg("id"), py::return_value_policy::copy)
        .def("get_entry", &LexiconEditor::get_entry, py::arg("id"), py::return_value_policy::copy)
        .def("get_sense", &LexiconEditor::get_sense, py::arg("id"), py::return_value_policy::copy)
        .def("set_id", &LexiconEditor::set_id)
        .def("set_label", &LexiconEditor::set_label)
        .def("set_version", &LexiconEditor::set_version)
        .def("set_email", &LexiconEditor::set_email)
        .def("set_license", &LexiconEditor::set_license)
        .def("set_url", &LexiconEditor::set_url)
        .def("set_citation", &LexiconEditor::set_citation)
        .def("update_metadata", &LexiconEditor::update_metadata)
        .def("metadata", &LexiconEditor::metadata)
        .def("set_lmf_version", &LexiconEditor::set_lmf_version)
        .def("resource", &LexiconEditor::resource, py::return_value_policy::copy)
        .def("stats", &LexiconEditor::stats)
        .def("can_validate", &LexiconEditor::can_validate)
        .def("validate", &LexiconEditor::validate)
        .def("check_integrity", &LexiconEditor::check_integrity)
        .def("to_xml", &LexiconEditor::to_xml)
        .def("export_to",
             [](const LexiconEditor& editor, const std::string& path, bool validate_first) {
                 return editor.export_to(path, validate_first);
             },
             py::arg("path"), py::arg("validate_first") = false)
        .def("commit", &LexiconEditor::commit, py::arg("sink"), py::arg("validate_first") = false);
}
