#include "matching_objects.h"

#include "matching_values.h"

std::string matchingStrategyTypeToString(MatchingStrategyType strategy_type) {
    switch (strategy_type) {
        case MatchingStrategyType::STABLE:
            return "stable";
        case MatchingStrategyType::LOCAL_SEARCH:
            return "local_search";
        case MatchingStrategyType::AUTOMATIC:
            return "automatic";
    }

    return "{Unknown Value}";
}

std::optional<MatchingStrategyType> matchingStrategyTypeFromString(const std::string& strategy_name) {
    if (strategy_name == "stable") {
        return MatchingStrategyType::STABLE;
    } else if (strategy_name == "local_search") {
        return MatchingStrategyType::LOCAL_SEARCH;
    } else if (strategy_name == "automatic") {
        return MatchingStrategyType::AUTOMATIC;
    }

    return std::nullopt;
}

MatchingConfiguration::MatchingConfiguration() :
        matching_interval(matching_values::TIME_BETWEEN_MATCHING_ROUNDS),
        failed_round_back_off(matching_values::TIME_BETWEEN_FAILED_ROUND_RETRIES),
        recency_window_days(matching_values::RECENCY_EXCLUSION_WINDOW_DAYS),
        minimum_shared_answers(matching_values::MINIMUM_SHARED_ANSWERS),
        shadow_candidate_threshold(matching_values::SHADOW_CANDIDATE_THRESHOLD),
        strategy_type(matchingStrategyTypeFromString(matching_values::DEFAULT_STRATEGY_NAME).value_or(MatchingStrategyType::AUTOMATIC)),
        local_search_population_threshold(matching_values::LOCAL_SEARCH_POPULATION_THRESHOLD),
        local_search_skew_threshold(matching_values::LOCAL_SEARCH_SKEW_THRESHOLD),
        local_search_max_passes(matching_values::LOCAL_SEARCH_MAX_PASSES),
        shadow_user_id(matching_values::SHADOW_USER_ID),
        shadow_seed(matching_values::SHADOW_SEED) {}
