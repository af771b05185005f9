#pragma once

#include <kingraph/ingest/i_research_tracker.hpp>

#include <map>
#include <string>

namespace kingraph::testing {

// MockResearchTracker: canned scores per person id.
class MockResearchTracker : public IResearchTracker {
public:
    void Set(const std::string& id, double coverage, int conflicts) {
        scores_[id] = ResearchScores{coverage, conflicts};
    }

    [[nodiscard]] std::optional<ResearchScores> ScoresFor(
        const std::string& person_id) const override {
        auto it = scores_.find(person_id);
        if (it == scores_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    std::map<std::string, ResearchScores> scores_;
};

} // namespace kingraph::testing
