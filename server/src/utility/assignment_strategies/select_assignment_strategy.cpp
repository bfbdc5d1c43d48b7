#include <cstdlib>

#include "assignment_strategy.h"

std::unique_ptr<AssignmentStrategy> selectAssignmentStrategy(
        const MatchingConfiguration& config,
        const Submissions& submissions
) {
    switch (config.strategy_type) {
        case MatchingStrategyType::STABLE:
            return std::make_unique<StableMatcher>(config);
        case MatchingStrategyType::LOCAL_SEARCH:
            return std::make_unique<LocalSearchMatcher>(config);
        case MatchingStrategyType::AUTOMATIC:
            break;
    }

    if (submissions.size() > config.local_search_population_threshold) {
        return std::make_unique<LocalSearchMatcher>(config);
    }

    const PrimaryQuestionPartition partition = partitionByPrimaryQuestion(submissions);
    const size_t total = partition.side_a.size() + partition.side_b.size();

    if (total > 0) {
        const double difference = std::abs(
                static_cast<double>(partition.side_a.size()) - static_cast<double>(partition.side_b.size())
        );

        //a two sided split this uneven leaves most of the larger side unmatched
        if (difference / static_cast<double>(total) > config.local_search_skew_threshold) {
            return std::make_unique<LocalSearchMatcher>(config);
        }
    }

    return std::make_unique<StableMatcher>(config);
}
