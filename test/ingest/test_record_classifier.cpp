#include <catch2/catch_test_macros.hpp>

#include <kingraph/ingest/record_classifier.hpp>

using namespace kingraph;

namespace {

RawRecord WithFields(nlohmann::json fields, std::vector<std::string> tags = {}) {
    RawRecord record;
    record.path = "Notes/record.md";
    record.fields = std::move(fields);
    record.tags = std::move(tags);
    return record;
}

} // anonymous namespace

TEST_CASE("RecordClassifier: cr_type decides", "[classifier]") {
    AliasResolver resolver;
    RecordClassifier classifier(resolver);

    CHECK(classifier.Classify(WithFields({{"cr_type", "person"}})) == RecordKind::Person);
    CHECK(classifier.Classify(WithFields({{"cr_type", "Event"}})) == RecordKind::Event);
    CHECK(classifier.Classify(WithFields({{"cr_type", "source"}, {"cr_id", "S-1"}})) ==
          RecordKind::Source);
}

TEST_CASE("RecordClassifier: cr_type beats legacy type", "[classifier]") {
    AliasResolver resolver;
    RecordClassifier classifier(resolver);
    CHECK(classifier.Classify(WithFields({{"cr_type", "place"}, {"type", "person"}})) ==
          RecordKind::Place);
    CHECK(classifier.Classify(WithFields({{"type", "organization"}})) ==
          RecordKind::Organization);
}

TEST_CASE("RecordClassifier: note type synonyms", "[classifier]") {
    EngineConfig config;
    config.value_aliases["note_type"] = {{"npc", "person"}};
    AliasResolver resolver(config);
    RecordClassifier classifier(resolver);

    CHECK(classifier.Classify(WithFields({{"cr_type", "character"}})) == RecordKind::Person);
    CHECK(classifier.Classify(WithFields({{"cr_type", "NPC"}})) == RecordKind::Person);
    CHECK(classifier.Classify(WithFields({{"cr_type", "guild"}})) == RecordKind::Organization);
}

TEST_CASE("RecordClassifier: tags", "[classifier]") {
    AliasResolver resolver;
    RecordClassifier classifier(resolver);

    CHECK(classifier.Classify(WithFields(nlohmann::json::object(), {"#person"})) ==
          RecordKind::Person);
    CHECK(classifier.Classify(WithFields(nlohmann::json::object(), {"genealogy/people"})) ==
          RecordKind::Person);
    CHECK(classifier.Classify(WithFields(nlohmann::json::object(), {"todo", "#timeline"})) ==
          RecordKind::Timeline);
}

TEST_CASE("RecordClassifier: identity key without type is a person", "[classifier]") {
    AliasResolver resolver;
    RecordClassifier classifier(resolver);

    CHECK(classifier.Classify(WithFields({{"cr_id", "I-1"}})) == RecordKind::Person);
    CHECK(classifier.Classify(WithFields({{"cr_type", "recipe"}, {"cr_id", "I-1"}})) ==
          RecordKind::Person);
    CHECK(classifier.Classify(WithFields({{"title", "Shopping"}})) == RecordKind::Unknown);
}

TEST_CASE("RecordKindFromNoteType / RecordKindName", "[classifier]") {
    CHECK(RecordKindFromNoteType("schema") == RecordKind::Schema);
    CHECK_FALSE(RecordKindFromNoteType("Person").has_value());
    CHECK(std::string(RecordKindName(RecordKind::Map)) == "map");
}
