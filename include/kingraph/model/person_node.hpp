#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kingraph {

// ---------------------------------------------------------------------------
// Sex: canonical sex marker after value-alias resolution.
// A present but unmappable value is stored as Unknown.
// ---------------------------------------------------------------------------
enum class Sex {
    Male,       // "M"
    Female,     // "F"
    Nonbinary,  // "X" (nonbinary / intersex)
    Unknown,    // "U"
};

const char* SexCode(Sex sex);

// Parse a canonical code ("M", "F", "X", "U"). Anything else is Unknown.
Sex SexFromCode(std::string_view code);

// ---------------------------------------------------------------------------
// MarriageStatus: status of a spouse relation.
// ---------------------------------------------------------------------------
enum class MarriageStatus {
    Current,
    Divorced,
    Widowed,
    Separated,
    Annulled,
};

const char* MarriageStatusName(MarriageStatus status);
std::optional<MarriageStatus> ParseMarriageStatus(std::string_view value);

// ---------------------------------------------------------------------------
// SpouseRelation: one entry of a person's spouse list.
// `ordinal` is the N of an indexed "spouseN" declaration (0 when the spouse
// came from an unindexed field) and orders spouses for display.
// ---------------------------------------------------------------------------
struct SpouseRelation {
    std::string partner_id;
    std::optional<std::string> marriage_date;
    std::optional<std::string> divorce_date;
    MarriageStatus status = MarriageStatus::Current;
    std::optional<std::string> location;
    int ordinal = 0;
};

// ---------------------------------------------------------------------------
// PersonNode: one person in a graph snapshot.
//
// All relationship attributes hold identity keys of other nodes. After a
// build every key resolves to a node of the same snapshot.
// ---------------------------------------------------------------------------
struct PersonNode {
    std::string id;
    std::string name;

    std::optional<std::string> birth_date;
    std::optional<std::string> death_date;
    std::optional<std::string> birth_place;
    std::optional<std::string> death_place;
    std::optional<std::string> burial_place;
    std::optional<std::string> occupation;
    std::optional<Sex> sex;
    std::optional<bool> living_override;

    std::optional<std::string> father;
    std::optional<std::string> mother;
    std::vector<std::string> parents;
    std::vector<std::string> step_fathers;
    std::vector<std::string> step_mothers;
    std::vector<std::string> step_parents;
    std::optional<std::string> adoptive_father;
    std::optional<std::string> adoptive_mother;
    std::vector<std::string> adoptive_parents;
    std::vector<std::string> adopted_children;
    std::vector<std::string> foster_parents;
    std::vector<std::string> guardians;
    std::vector<SpouseRelation> spouses;
    std::vector<std::string> children;  // biological only

    // Inverse side of the step, foster and guardian links. Kept in step with
    // the child's own lists by the graph builder.
    std::vector<std::string> step_children;
    std::vector<std::string> foster_children;
    std::vector<std::string> wards;

    // Target id -> id of the relationship type that produced the edge.
    // Only kept for parent and spouse edges supplied by a non-default type.
    std::map<std::string, std::string> relationship_type_overrides;

    std::optional<std::string> group_name;
    std::optional<std::string> collection;
    std::optional<std::string> universe;

    int evidence_count = 0;
    std::optional<double> research_coverage;
    std::optional<int> research_conflicts;

    // Father, mother and gender-neutral parents, in that order, deduplicated.
    [[nodiscard]] std::vector<std::string> BiologicalParents() const;

    // Adoptive father, adoptive mother and gender-neutral adoptive parents.
    [[nodiscard]] std::vector<std::string> AllAdoptiveParents() const;

    // Step-fathers, step-mothers and gender-neutral step-parents.
    [[nodiscard]] std::vector<std::string> AllStepParents() const;

    [[nodiscard]] std::vector<std::string> SpouseIds() const;

    [[nodiscard]] bool HasSpouse(std::string_view partner_id) const;

    // Living status: the override wins, otherwise a birth date without a
    // death date.
    [[nodiscard]] bool IsLiving() const;
};

// Append `id` unless already present. Returns true when appended.
bool AppendUnique(std::vector<std::string>& list, const std::string& id);

} // namespace kingraph
