#pragma once

#include <kingraph/core/result.hpp>
#include <kingraph/ingest/alias_resolver.hpp>
#include <kingraph/ingest/i_link_index.hpp>
#include <kingraph/ingest/i_record_classifier.hpp>
#include <kingraph/ingest/raw_record.hpp>
#include <kingraph/model/person_node.hpp>
#include <kingraph/model/relationship_types.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace kingraph {

// Why a record did not become a person node.
struct ExtractionSkip {
    RecordKind kind = RecordKind::Unknown;
    std::string reason;
};

// ---------------------------------------------------------------------------
// RecordExtractor: turns one raw record into a PersonNode.
//
// Relationship references are merged per field in this order:
//   1. direct identity keys from `<field>_id`;
//   2. textual references from `<field>`, resolved through the link index
//      (unresolved ones are dropped);
//   3. generic declarations: flat fields named after a relationship type id
//      (plus `<type>_id`) and the legacy `relationships` list. Only types
//      that are included on family trees and mapped contribute.
// Import artifacts are filtered from every relationship field.
//
// The extractor holds references to its collaborators; they must outlive it.
// ---------------------------------------------------------------------------
class RecordExtractor {
public:
    RecordExtractor(const AliasResolver& resolver,
                    const RelationshipTypeRegistry& registry,
                    const IRecordClassifier& classifier,
                    const ILinkIndex& link_index);

    [[nodiscard]] Result<PersonNode, ExtractionSkip> Extract(const RawRecord& record) const;

    // Identity keys a non-person record (source, event, ...) cites through
    // its `person`/`persons` fields.
    [[nodiscard]] std::vector<std::string> CitedPeople(const RawRecord& record) const;

private:
    // Targets of `field`: `<field>_id` values, then resolved `<field>` values.
    [[nodiscard]] std::vector<std::string> CollectIds(const RawRecord& record,
                                                      const std::string& field) const;

    // Resolve one textual reference; nullopt when unresolved or an artifact.
    [[nodiscard]] std::optional<std::string> ResolveReference(
        const RawRecord& record, std::string_view field, const std::string& text) const;

    void ExtractSpouses(const RawRecord& record, PersonNode& node) const;
    void ExtractGenericDeclarations(const RawRecord& record, PersonNode& node) const;
    void ApplyMapping(const RawRecord& record, const RelationshipTypeDef& type,
                      const std::string& target, PersonNode& node) const;
    std::vector<std::string>& ChildListFor(const RelationshipTypeDef& type,
                                           PersonNode& node) const;

    const AliasResolver& resolver_;
    const RelationshipTypeRegistry& registry_;
    const IRecordClassifier& classifier_;
    const ILinkIndex& link_index_;
};

} // namespace kingraph
