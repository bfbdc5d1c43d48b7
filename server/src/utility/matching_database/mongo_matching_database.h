#pragma once

#include "matching_database_interface.h"

//MatchingDatabaseInterface stored inside MongoDB through mongocxx_client_pool.
//Layout is described by user_account_keys, aorb_question_keys, matched_users_keys and
// match_round_results_keys.
class MongoMatchingDatabase final : public MatchingDatabaseInterface {
public:

    //matches involving shadow_user_id are never part of the recency exclusion
    MongoMatchingDatabase(
            UserId _shadow_user_id,
            int _minimum_answers_for_eligibility
    ) : shadow_user_id(_shadow_user_id),
        minimum_answers_for_eligibility(_minimum_answers_for_eligibility) {}

    bool fetchSubmissions(Submissions& submissions) override;

    bool fetchQuestionBank(QuestionBank& question_bank) override;

    bool fetchRecencyExclusion(
            int window_days,
            const std::chrono::milliseconds& current_timestamp,
            RecencyExclusion& recency_exclusion
    ) override;

    bool persistMarriage(
            const Marriage& marriage,
            const std::chrono::milliseconds& matched_on
    ) override;

    bool ensureShadowUser(UserId shadow_id) override;

    void saveMatchRoundResult(const MatchRoundResult& result) override;

    bool fetchCurrentMatch(
            UserId user_id,
            const std::chrono::milliseconds& since,
            std::optional<CurrentMatch>& current_match
    ) override;

private:
    const UserId shadow_user_id;
    const int minimum_answers_for_eligibility;
};
