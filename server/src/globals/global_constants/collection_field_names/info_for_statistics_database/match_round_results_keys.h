#pragma once

#include <string>

//keys for (INFO_FOR_STATISTICS_DATABASE_NAME) (MATCH_ROUND_RESULTS_COLLECTION_NAME)
namespace match_round_results_keys {

    inline const std::string ROUND_START_TIME = "sTm"; //mongoDB Date
    inline const std::string ROUND_DURATION = "dUr"; //int64; milliseconds
    inline const std::string STRATEGY_USED = "sTr"; //string; result of matchingStrategyTypeToString()
    inline const std::string NUMBER_PARTICIPANTS = "nPa"; //int64; real users only
    inline const std::string NUMBER_PAIRS = "nPr"; //int64; shadow pair included
    inline const std::string NUMBER_UNMATCHED = "nUn"; //int64
    inline const std::string SHADOW_USED = "sHu"; //bool
    inline const std::string TOTAL_SCORE = "tSc"; //double
    inline const std::string SWAPS_APPLIED = "sWa"; //int32; always 0 for the stable strategy
    inline const std::string SUCCESSFUL = "sCs"; //bool; false if the marriage was never persisted

}
