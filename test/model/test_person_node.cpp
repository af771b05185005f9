#include <catch2/catch_test_macros.hpp>

#include <kingraph/model/person_node.hpp>

#include <string>
#include <vector>

using namespace kingraph;

// ===========================================================================
// Sex / MarriageStatus
// ===========================================================================

TEST_CASE("Sex: codes round-trip, anything else is Unknown", "[model][sex]") {
    CHECK(std::string(SexCode(Sex::Female)) == "F");
    CHECK(SexFromCode("M") == Sex::Male);
    CHECK(SexFromCode("X") == Sex::Nonbinary);
    CHECK(SexFromCode("male") == Sex::Unknown);
    CHECK(SexFromCode("") == Sex::Unknown);
}

TEST_CASE("ParseMarriageStatus: accepts married as current", "[model][spouse]") {
    CHECK(ParseMarriageStatus("married") == MarriageStatus::Current);
    CHECK(ParseMarriageStatus(" Divorced ") == MarriageStatus::Divorced);
    CHECK(ParseMarriageStatus("annulled") == MarriageStatus::Annulled);
    CHECK_FALSE(ParseMarriageStatus("eloped").has_value());
    CHECK(std::string(MarriageStatusName(MarriageStatus::Widowed)) == "widowed");
}

// ===========================================================================
// PersonNode helpers
// ===========================================================================

TEST_CASE("PersonNode: BiologicalParents merges slots and list", "[model][person]") {
    PersonNode node;
    node.father = "F";
    node.mother = "M";
    node.parents = {"F", "P"};
    CHECK(node.BiologicalParents() == std::vector<std::string>{"F", "M", "P"});
}

TEST_CASE("PersonNode: step and adoptive parent views", "[model][person]") {
    PersonNode node;
    node.step_fathers = {"SF"};
    node.step_mothers = {"SM"};
    node.step_parents = {"SP", "SF"};
    node.adoptive_mother = "AM";
    node.adoptive_parents = {"AP"};

    CHECK(node.AllStepParents() == std::vector<std::string>{"SF", "SM", "SP"});
    CHECK(node.AllAdoptiveParents() == std::vector<std::string>{"AM", "AP"});
    CHECK(node.BiologicalParents().empty());
}

TEST_CASE("PersonNode: spouse lookup", "[model][person]") {
    PersonNode node;
    SpouseRelation first;
    first.partner_id = "S1";
    first.ordinal = 1;
    SpouseRelation second;
    second.partner_id = "S2";
    second.status = MarriageStatus::Divorced;
    node.spouses = {first, second};

    CHECK(node.SpouseIds() == std::vector<std::string>{"S1", "S2"});
    CHECK(node.HasSpouse("S2"));
    CHECK_FALSE(node.HasSpouse("S3"));
}

TEST_CASE("PersonNode: IsLiving", "[model][person]") {
    PersonNode node;
    CHECK_FALSE(node.IsLiving());

    node.birth_date = "1990-04-01";
    CHECK(node.IsLiving());

    node.death_date = "2020";
    CHECK_FALSE(node.IsLiving());

    node.living_override = true;
    CHECK(node.IsLiving());
}

TEST_CASE("AppendUnique: appends once", "[model]") {
    std::vector<std::string> list;
    CHECK(AppendUnique(list, "A"));
    CHECK_FALSE(AppendUnique(list, "A"));
    CHECK(AppendUnique(list, "B"));
    CHECK(list == std::vector<std::string>{"A", "B"});
}
