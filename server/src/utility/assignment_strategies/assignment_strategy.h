#pragma once

#include <memory>
#include <string>
#include <vector>
#include <optional>

#include "matching_objects.h"

struct AssignmentResult {
    Marriage marriage;
    MatchingStrategyType strategy_used = MatchingStrategyType::STABLE;
    bool shadow_used = false;

    //sum of calculatePairScore() over every eligible matched pair (shadow pairs included)
    double total_score = 0;

    //only set by LocalSearchMatcher
    double initial_local_search_score = 0;
    double final_local_search_score = 0;
    int swaps_applied = 0;
    int passes_run = 0;
    std::vector<double> applied_swap_gains;
};

//A single way of turning a round's submissions into a Marriage. Every user inside input.submissions
// will have an entry inside the returned marriage (std::nullopt when unmatched). The shadow only has
// an entry when it was paired.
class AssignmentStrategy {
public:

    explicit AssignmentStrategy(const MatchingConfiguration& _config) : config(_config) {}

    AssignmentStrategy(const AssignmentStrategy& copy) = delete;

    AssignmentStrategy& operator=(const AssignmentStrategy& rhs) = delete;

    virtual ~AssignmentStrategy() = default;

    virtual AssignmentResult assign(const MatchingInput& input) = 0;

    [[nodiscard]] virtual MatchingStrategyType type() const = 0;

protected:
    const MatchingConfiguration config;
};

//Two sided deferred acceptance. Users are split by their answer to their own primary question, side A
// proposes and side B holds its best proposal. The shadow is added to the smaller side when the sides
// are not equal. The result has no blocking pair with respect to the preference lists built by
// buildPreferenceLists().
class StableMatcher final : public AssignmentStrategy {
public:
    explicit StableMatcher(const MatchingConfiguration& _config) : AssignmentStrategy(_config) {}

    AssignmentResult assign(const MatchingInput& input) override;

    [[nodiscard]] MatchingStrategyType type() const override {
        return MatchingStrategyType::STABLE;
    }
};

//Greedy initial matching over the symmetric pair scores followed by pairwise swap improvement
// until a pass finds no improving swap or config.local_search_max_passes is reached. The result
// is a local optimum only.
class LocalSearchMatcher final : public AssignmentStrategy {
public:
    explicit LocalSearchMatcher(const MatchingConfiguration& _config) : AssignmentStrategy(_config) {}

    AssignmentResult assign(const MatchingInput& input) override;

    [[nodiscard]] MatchingStrategyType type() const override {
        return MatchingStrategyType::LOCAL_SEARCH;
    }
};

struct PrimaryQuestionPartition {
    std::vector<UserId> side_a;
    std::vector<UserId> side_b;
};

//OPTION_A answers to the user's own primary question go to side_a, OPTION_B answers go to side_b.
// Users that have not answered their primary question are placed on whichever side is smaller at the
// time (side_a on ties), users are processed in ascending id order.
PrimaryQuestionPartition partitionByPrimaryQuestion(const Submissions& submissions);

//returns StableMatcher or LocalSearchMatcher, when config.strategy_type is AUTOMATIC the population
// size and the partition skew decide
std::unique_ptr<AssignmentStrategy> selectAssignmentStrategy(
        const MatchingConfiguration& config,
        const Submissions& submissions
);

//returns a description of the first broken invariant found or std::nullopt if the marriage is valid
//checks no user is matched to itself, every id is part of the population (or the shadow), every non-shadow
// partner points back and no user is the partner of more than one user
std::optional<std::string> findMarriageInvariantViolation(
        const Marriage& marriage,
        const Submissions& submissions,
        UserId shadow_user_id
);

double calculateMarriageTotalScore(
        const Marriage& marriage,
        const MatchingInput& input,
        const MatchingConfiguration& config
);
