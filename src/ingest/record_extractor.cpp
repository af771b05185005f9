#include <kingraph/ingest/record_extractor.hpp>

#include <kingraph/core/log.hpp>
#include <kingraph/core/text.hpp>

#include <algorithm>
#include <set>

namespace kingraph {

namespace {

constexpr const char* kComponent = "RecordExtractor";

// Scalars and lists of scalars flattened to text; empty entries dropped.
std::vector<std::string> ListValues(const nlohmann::json* value) {
    std::vector<std::string> out;
    if (value == nullptr) {
        return out;
    }
    auto push = [&out](const nlohmann::json& item) {
        auto text = ScalarText(item);
        if (text && !text->empty()) {
            out.push_back(std::move(*text));
        }
    };
    if (value->is_array()) {
        for (const auto& item : *value) {
            push(item);
        }
    } else {
        push(*value);
    }
    return out;
}

std::optional<bool> ParseBool(const nlohmann::json* value) {
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_boolean()) {
        return value->get<bool>();
    }
    auto text = ScalarText(*value);
    if (!text) {
        return std::nullopt;
    }
    auto lowered = ToLower(*text);
    if (lowered == "true" || lowered == "yes" || lowered == "1") return true;
    if (lowered == "false" || lowered == "no" || lowered == "0") return false;
    return std::nullopt;
}

// Ordinal N of "spouseN" or "spouseN_id"; 0 for any other key.
int SpouseOrdinal(std::string_view key) {
    constexpr std::string_view kPrefix = "spouse";
    if (key.size() <= kPrefix.size() || key.substr(0, kPrefix.size()) != kPrefix) {
        return 0;
    }
    size_t i = kPrefix.size();
    int ordinal = 0;
    size_t digits = 0;
    while (i < key.size() && key[i] >= '0' && key[i] <= '9' && digits < 6) {
        ordinal = ordinal * 10 + (key[i] - '0');
        ++i;
        ++digits;
    }
    if (digits == 0) {
        return 0;
    }
    auto rest = key.substr(i);
    return (rest.empty() || rest == "_id") ? ordinal : 0;
}

bool Contains(const std::vector<std::string>& list, const std::string& id) {
    return std::find(list.begin(), list.end(), id) != list.end();
}

// Fields read by the canonical extraction; generic declarations with the
// same id would only repeat them.
bool IsCanonicalRelationshipField(const std::string& type_id) {
    return type_id == "spouse" || type_id == "parents" || type_id == "children" ||
           type_id == "adopted_child";
}

// Built-in type that maps onto a structural list without needing an override.
bool IsDefaultTypeFor(FamilyGraphMapping mapping, const std::string& type_id) {
    return (mapping == FamilyGraphMapping::Parent && type_id == "parents") ||
           (mapping == FamilyGraphMapping::Spouse && type_id == "spouse");
}

} // anonymous namespace

RecordExtractor::RecordExtractor(const AliasResolver& resolver,
                                 const RelationshipTypeRegistry& registry,
                                 const IRecordClassifier& classifier,
                                 const ILinkIndex& link_index)
    : resolver_(resolver),
      registry_(registry),
      classifier_(classifier),
      link_index_(link_index) {}

// ---------------------------------------------------------------------------
// Reference resolution
// ---------------------------------------------------------------------------

std::optional<std::string> RecordExtractor::ResolveReference(
    const RawRecord& record, std::string_view field, const std::string& text) const {
    auto id = link_index_.Resolve(text);
    if (!id) {
        LogDebug(kComponent, record.path + ": unresolved reference '" + text +
                             "' in field '" + std::string(field) + "'");
        return std::nullopt;
    }
    return id;
}

std::vector<std::string> RecordExtractor::CollectIds(const RawRecord& record,
                                                     const std::string& field) const {
    std::vector<std::string> out;
    auto accept = [&](const std::string& id) {
        if (IsImportArtifact(id)) {
            LogDebug(kComponent, record.path + ": dropping import artifact '" + id +
                                 "' in field '" + field + "'");
            return;
        }
        AppendUnique(out, id);
    };

    for (const auto& id : ListValues(resolver_.ResolveField(record.fields, field + "_id"))) {
        accept(id);
    }
    for (const auto& text : ListValues(resolver_.ResolveField(record.fields, field))) {
        // A bare artifact handle is never a link.
        if (IsImportArtifact(StripWikilink(text))) {
            accept(StripWikilink(text));
            continue;
        }
        if (auto id = ResolveReference(record, field, text)) {
            accept(*id);
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// Extract
// ---------------------------------------------------------------------------

Result<PersonNode, ExtractionSkip> RecordExtractor::Extract(const RawRecord& record) const {
    auto kind = classifier_.Classify(record);
    if (kind != RecordKind::Person) {
        return Result<PersonNode, ExtractionSkip>::Err(
            ExtractionSkip{kind, std::string("record is a ") + RecordKindName(kind) + " note"});
    }

    auto id = resolver_.ResolveString(record.fields, "cr_id");
    if (!id) {
        return Result<PersonNode, ExtractionSkip>::Err(
            ExtractionSkip{kind, "missing identity key (cr_id)"});
    }

    const auto& f = record.fields;
    PersonNode node;
    node.id = *id;
    node.name = resolver_.ResolveString(f, "name").value_or(Basename(record.path));

    auto first_of = [&](const char* canonical, const char* legacy) {
        auto value = resolver_.ResolveString(f, canonical);
        return value ? value : resolver_.ResolveString(f, legacy);
    };
    node.birth_date = first_of("born", "birth_date");
    node.death_date = first_of("died", "death_date");
    node.birth_place = resolver_.ResolveString(f, "birth_place");
    node.death_place = resolver_.ResolveString(f, "death_place");
    node.burial_place = resolver_.ResolveString(f, "burial_place");
    node.occupation = resolver_.ResolveString(f, "occupation");
    if (auto raw_sex = first_of("sex", "gender")) {
        node.sex = SexFromCode(resolver_.ResolveValue(ValueDomain::Sex, *raw_sex));
    }
    node.living_override = ParseBool(resolver_.ResolveField(f, "cr_living"));
    node.group_name = resolver_.ResolveString(f, "group_name");
    node.collection = resolver_.ResolveString(f, "collection");
    node.universe = resolver_.ResolveString(f, "universe");

    // -- Single-valued slots: the first target wins --
    auto single = [&](const char* field, std::optional<std::string>& slot) {
        auto ids = CollectIds(record, field);
        if (ids.empty()) {
            return;
        }
        slot = ids.front();
        if (ids.size() > 1) {
            LogDebug(kComponent, record.path + ": field '" + field + "' names " +
                                 std::to_string(ids.size()) + " targets, keeping '" +
                                 ids.front() + "'");
        }
    };
    single("father", node.father);
    single("mother", node.mother);
    single("adoptive_father", node.adoptive_father);
    single("adoptive_mother", node.adoptive_mother);

    // -- Lists --
    auto merge = [&](const char* field, std::vector<std::string>& list) {
        for (const auto& target : CollectIds(record, field)) {
            AppendUnique(list, target);
        }
    };
    merge("parents", node.parents);
    merge("stepfather", node.step_fathers);
    merge("stepmother", node.step_mothers);
    merge("adoptive_parents", node.adoptive_parents);
    merge("adoptive_parent", node.adoptive_parents);
    merge("adopted_children", node.adopted_children);
    merge("adopted_child", node.adopted_children);
    for (const char* field : {"children", "child", "son", "daughter"}) {
        merge(field, node.children);
    }

    ExtractSpouses(record, node);
    ExtractGenericDeclarations(record, node);

    return Result<PersonNode, ExtractionSkip>::Ok(std::move(node));
}

// ---------------------------------------------------------------------------
// Spouses: plain `spouse` plus indexed `spouseN` with marriage metadata.
// ---------------------------------------------------------------------------

void RecordExtractor::ExtractSpouses(const RawRecord& record, PersonNode& node) const {
    const auto& f = record.fields;

    std::set<int> ordinals;
    if (f.is_object()) {
        for (auto it = f.begin(); it != f.end(); ++it) {
            if (int n = SpouseOrdinal(it.key()); n > 0) {
                ordinals.insert(n);
            }
        }
    }

    for (int n : ordinals) {
        const auto prefix = "spouse" + std::to_string(n);
        for (const auto& partner : CollectIds(record, prefix)) {
            if (node.HasSpouse(partner)) {
                continue;
            }
            SpouseRelation relation;
            relation.partner_id = partner;
            relation.ordinal = n;
            relation.marriage_date = resolver_.ResolveString(f, prefix + "_marriage_date");
            relation.divorce_date = resolver_.ResolveString(f, prefix + "_divorce_date");
            relation.location = resolver_.ResolveString(f, prefix + "_marriage_location");
            auto status_text = resolver_.ResolveString(f, prefix + "_marriage_status");
            auto status = status_text ? ParseMarriageStatus(*status_text) : std::nullopt;
            if (status) {
                relation.status = *status;
            } else if (relation.divorce_date) {
                relation.status = MarriageStatus::Divorced;
            }
            if (status_text && !status) {
                LogDebug(kComponent, record.path + ": unknown marriage status '" +
                                     *status_text + "'");
            }
            node.spouses.push_back(std::move(relation));
        }
    }

    for (const auto& partner : CollectIds(record, "spouse")) {
        if (!node.HasSpouse(partner)) {
            SpouseRelation relation;
            relation.partner_id = partner;
            node.spouses.push_back(std::move(relation));
        }
    }
}

// ---------------------------------------------------------------------------
// Generic relationship declarations
// ---------------------------------------------------------------------------

void RecordExtractor::ExtractGenericDeclarations(const RawRecord& record,
                                                 PersonNode& node) const {
    for (const auto& type : registry_.FamilyTreeTypes()) {
        if (IsCanonicalRelationshipField(type.id)) {
            continue;
        }
        for (const auto& target : CollectIds(record, type.id)) {
            ApplyMapping(record, type, target, node);
        }
    }

    const auto* legacy = resolver_.ResolveField(record.fields, "relationships");
    if (legacy == nullptr || !legacy->is_array()) {
        return;
    }
    for (const auto& entry : *legacy) {
        if (!entry.is_object()) {
            continue;
        }
        auto type_id = entry.contains("type") ? ScalarText(entry["type"]) : std::nullopt;
        if (!type_id) {
            continue;
        }
        const auto* type = registry_.Find(*type_id);
        if (type == nullptr || !type->FeedsFamilyGraph()) {
            LogDebug(kComponent, record.path + ": relationship type '" + *type_id +
                                 "' does not feed the family graph");
            continue;
        }

        std::optional<std::string> target;
        if (entry.contains("target_id")) {
            target = ScalarText(entry["target_id"]);
        }
        if ((!target || target->empty()) && entry.contains("target")) {
            if (auto text = ScalarText(entry["target"]); text && !text->empty()) {
                target = ResolveReference(record, "relationships", *text);
            }
        }
        if (!target || target->empty()) {
            continue;
        }
        if (IsImportArtifact(*target)) {
            LogDebug(kComponent, record.path + ": dropping import artifact '" + *target +
                                 "' in field 'relationships'");
            continue;
        }
        ApplyMapping(record, *type, *target, node);
    }
}

// A child-mapped type lands in the list matching the mapping of its inverse
// type: step, adoptive, foster and guardian links never read as biological
// children.
std::vector<std::string>& RecordExtractor::ChildListFor(const RelationshipTypeDef& type,
                                                        PersonNode& node) const {
    if (type.id == "adopted_child") {
        return node.adopted_children;
    }
    const auto* inverse = type.inverse ? registry_.Find(*type.inverse) : nullptr;
    if (inverse == nullptr || !inverse->family_graph_mapping) {
        return node.children;
    }
    switch (*inverse->family_graph_mapping) {
        case FamilyGraphMapping::StepParent:     return node.step_children;
        case FamilyGraphMapping::AdoptiveParent: return node.adopted_children;
        case FamilyGraphMapping::FosterParent:   return node.foster_children;
        case FamilyGraphMapping::Guardian:       return node.wards;
        default:                                 return node.children;
    }
}

void RecordExtractor::ApplyMapping(const RawRecord& record, const RelationshipTypeDef& type,
                                   const std::string& target, PersonNode& node) const {
    const auto mapping = *type.family_graph_mapping;
    const bool keep_override = !IsDefaultTypeFor(mapping, type.id);

    auto add_parent = [&]() {
        if (node.father == target || node.mother == target || Contains(node.parents, target)) {
            return;
        }
        node.parents.push_back(target);
        if (keep_override) {
            node.relationship_type_overrides.emplace(target, type.id);
        }
    };

    // First writer wins: an occupied slot keeps its target and the new
    // declaration is demoted to the gender-neutral parent list.
    auto fill_slot = [&](std::optional<std::string>& slot, const char* slot_name) {
        if (!slot) {
            slot = target;
            node.relationship_type_overrides.emplace(target, type.id);
            return;
        }
        if (*slot == target) {
            return;
        }
        LogDebug(kComponent, record.path + ": " + slot_name + " slot already holds '" +
                             *slot + "'; '" + target + "' from '" + type.id +
                             "' recorded as a parent");
        add_parent();
    };

    switch (mapping) {
        case FamilyGraphMapping::Parent:
            add_parent();
            break;
        case FamilyGraphMapping::Father:
            fill_slot(node.father, "father");
            break;
        case FamilyGraphMapping::Mother:
            fill_slot(node.mother, "mother");
            break;
        case FamilyGraphMapping::Spouse:
            if (!node.HasSpouse(target)) {
                SpouseRelation relation;
                relation.partner_id = target;
                node.spouses.push_back(std::move(relation));
                if (keep_override) {
                    node.relationship_type_overrides.emplace(target, type.id);
                }
            }
            break;
        case FamilyGraphMapping::Child:
            AppendUnique(ChildListFor(type, node), target);
            break;
        case FamilyGraphMapping::StepParent:
            if (!Contains(node.step_fathers, target) && !Contains(node.step_mothers, target)) {
                AppendUnique(node.step_parents, target);
            }
            break;
        case FamilyGraphMapping::AdoptiveParent:
            if (node.adoptive_father != target && node.adoptive_mother != target) {
                AppendUnique(node.adoptive_parents, target);
            }
            break;
        case FamilyGraphMapping::FosterParent:
            AppendUnique(node.foster_parents, target);
            break;
        case FamilyGraphMapping::Guardian:
            AppendUnique(node.guardians, target);
            break;
    }
}

// ---------------------------------------------------------------------------
// CitedPeople
// ---------------------------------------------------------------------------

std::vector<std::string> RecordExtractor::CitedPeople(const RawRecord& record) const {
    std::vector<std::string> out;
    for (const char* field : {"person", "persons"}) {
        for (const auto& id : CollectIds(record, field)) {
            AppendUnique(out, id);
        }
    }
    return out;
}

} // namespace kingraph
