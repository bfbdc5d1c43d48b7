#pragma once

#include <chrono>
#include <string>

namespace matching_values {

    //time between the start of one completed matching round and the next round being allowed to begin
#ifdef CM_TESTING
    inline const std::chrono::milliseconds TIME_BETWEEN_MATCHING_ROUNDS = std::chrono::milliseconds{60L * 1000L};
#else
    inline const std::chrono::milliseconds TIME_BETWEEN_MATCHING_ROUNDS = std::chrono::milliseconds{24L * 60L * 60L * 1000L};
#endif

    //after a round fails the trigger will wait this long before attempting another round, lastCompletedAt is NOT advanced
    inline const std::chrono::milliseconds TIME_BETWEEN_FAILED_ROUND_RETRIES = std::chrono::milliseconds{5L * 60L * 1000L};

    //users matched together within this many days will not be paired again
    inline const int RECENCY_EXCLUSION_WINDOW_DAYS = 28;

    //the minimum number of questions two users must both have answered for the pair to be eligible; NOTE: never set below 1
    inline const int MINIMUM_SHARED_ANSWERS = 1;

    //the shadow is appended to the end of a preference list unless the list already holds at least this many real candidates
    inline const size_t SHADOW_CANDIDATE_THRESHOLD = 64;

    //users must have answered at least this many questions (or all of them) to be part of a round
    inline const int MINIMUM_ANSWERS_FOR_ELIGIBILITY = 10;

    //used when strategy is AUTOMATIC; local search is selected when the population is larger than this
    inline const size_t LOCAL_SEARCH_POPULATION_THRESHOLD = 2000;

    //used when strategy is AUTOMATIC; local search is selected when |sideA - sideB|/(sideA + sideB) is larger than this
    inline const double LOCAL_SEARCH_SKEW_THRESHOLD = 0.5;

    //maximum number of full passes over all committed pairs the local search will run
    inline const int LOCAL_SEARCH_MAX_PASSES = 1000;

    //a swap must improve the pair sum by more than this to be applied
    inline const double LOCAL_SEARCH_MINIMUM_IMPROVEMENT = 1e-12;

    //the reserved identity of the synthetic filler participant; it has no administrative meaning
    inline const long long SHADOW_USER_ID = -1;

    //xor'd with the round start time to seed the shadow answer roll
    inline const unsigned long long SHADOW_SEED = 0x5eed5ad0ULL;

    inline const std::string DEFAULT_STRATEGY_NAME = "automatic";
}
