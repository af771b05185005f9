#pragma once

#include <optional>
#include <string>

namespace kingraph {

struct ResearchScores {
    double coverage = 0.0;  // 0..100
    int conflicts = 0;
};

// ---------------------------------------------------------------------------
// IResearchTracker: optional collaborator that scores how well each person
// is researched. Scores are copied onto nodes at build time.
// ---------------------------------------------------------------------------
class IResearchTracker {
public:
    virtual ~IResearchTracker() = default;

    IResearchTracker(const IResearchTracker&) = delete;
    IResearchTracker& operator=(const IResearchTracker&) = delete;
    IResearchTracker(IResearchTracker&&) = delete;
    IResearchTracker& operator=(IResearchTracker&&) = delete;

    [[nodiscard]] virtual std::optional<ResearchScores> ScoresFor(
        const std::string& person_id) const = 0;

protected:
    IResearchTracker() = default;
};

} // namespace kingraph
