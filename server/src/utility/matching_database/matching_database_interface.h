#pragma once

#include <chrono>
#include <optional>

#include "matching_objects.h"

struct CurrentMatch {
    UserId partner_id = 0;
    std::chrono::milliseconds matched_on{-1};
};

//Everything a matching round reads from or writes to storage. Every function that returns bool returns
// false when the operation could not be completed, the error has already been stored in that case and the
// output parameters are left in an unspecified (but valid) state.
class MatchingDatabaseInterface {
public:

    virtual ~MatchingDatabaseInterface() = default;

    //Eligible users only, the shadow is never included.
    virtual bool fetchSubmissions(Submissions& submissions) = 0;

    virtual bool fetchQuestionBank(QuestionBank& question_bank) = 0;

    //For every user, the partners they were matched with inside the window ending at current_timestamp.
    virtual bool fetchRecencyExclusion(
            int window_days,
            const std::chrono::milliseconds& current_timestamp,
            RecencyExclusion& recency_exclusion
    ) = 0;

    //Writes both directions of every pair inside marriage with matched_on as the timestamp. Either every row
    // is written or none are.
    virtual bool persistMarriage(
            const Marriage& marriage,
            const std::chrono::milliseconds& matched_on
    ) = 0;

    //Creates the shadow user document if it does not exist yet.
    virtual bool ensureShadowUser(UserId shadow_user_id) = 0;

    //Statistics only, failures are stored and otherwise ignored.
    virtual void saveMatchRoundResult(const MatchRoundResult& result) = 0;

    //The most recent match of user_id with matched_on >= since. current_match is std::nullopt if there is none.
    virtual bool fetchCurrentMatch(
            UserId user_id,
            const std::chrono::milliseconds& since,
            std::optional<CurrentMatch>& current_match
    ) = 0;
};
