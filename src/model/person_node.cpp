#include <kingraph/model/person_node.hpp>

#include <kingraph/core/text.hpp>

#include <algorithm>

namespace kingraph {

const char* SexCode(Sex sex) {
    switch (sex) {
        case Sex::Male:      return "M";
        case Sex::Female:    return "F";
        case Sex::Nonbinary: return "X";
        case Sex::Unknown:   return "U";
    }
    return "U";
}

Sex SexFromCode(std::string_view code) {
    if (code == "M") return Sex::Male;
    if (code == "F") return Sex::Female;
    if (code == "X") return Sex::Nonbinary;
    return Sex::Unknown;
}

const char* MarriageStatusName(MarriageStatus status) {
    switch (status) {
        case MarriageStatus::Current:   return "current";
        case MarriageStatus::Divorced:  return "divorced";
        case MarriageStatus::Widowed:   return "widowed";
        case MarriageStatus::Separated: return "separated";
        case MarriageStatus::Annulled:  return "annulled";
    }
    return "current";
}

std::optional<MarriageStatus> ParseMarriageStatus(std::string_view value) {
    auto lowered = ToLower(Trim(value));
    if (lowered == "current" || lowered == "married") return MarriageStatus::Current;
    if (lowered == "divorced") return MarriageStatus::Divorced;
    if (lowered == "widowed") return MarriageStatus::Widowed;
    if (lowered == "separated") return MarriageStatus::Separated;
    if (lowered == "annulled") return MarriageStatus::Annulled;
    return std::nullopt;
}

bool AppendUnique(std::vector<std::string>& list, const std::string& id) {
    if (std::find(list.begin(), list.end(), id) != list.end()) {
        return false;
    }
    list.push_back(id);
    return true;
}

std::vector<std::string> PersonNode::BiologicalParents() const {
    std::vector<std::string> out;
    if (father) AppendUnique(out, *father);
    if (mother) AppendUnique(out, *mother);
    for (const auto& p : parents) AppendUnique(out, p);
    return out;
}

std::vector<std::string> PersonNode::AllAdoptiveParents() const {
    std::vector<std::string> out;
    if (adoptive_father) AppendUnique(out, *adoptive_father);
    if (adoptive_mother) AppendUnique(out, *adoptive_mother);
    for (const auto& p : adoptive_parents) AppendUnique(out, p);
    return out;
}

std::vector<std::string> PersonNode::AllStepParents() const {
    std::vector<std::string> out;
    for (const auto& p : step_fathers) AppendUnique(out, p);
    for (const auto& p : step_mothers) AppendUnique(out, p);
    for (const auto& p : step_parents) AppendUnique(out, p);
    return out;
}

std::vector<std::string> PersonNode::SpouseIds() const {
    std::vector<std::string> out;
    out.reserve(spouses.size());
    for (const auto& s : spouses) {
        AppendUnique(out, s.partner_id);
    }
    return out;
}

bool PersonNode::HasSpouse(std::string_view partner_id) const {
    return std::any_of(spouses.begin(), spouses.end(),
                       [&](const SpouseRelation& s) { return s.partner_id == partner_id; });
}

bool PersonNode::IsLiving() const {
    if (living_override) {
        return *living_override;
    }
    return birth_date.has_value() && !death_date.has_value();
}

} // namespace kingraph
