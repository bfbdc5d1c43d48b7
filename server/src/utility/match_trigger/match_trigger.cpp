#include <memory>
#include <iostream>
#include <optional>

#include "match_trigger.h"
#include "shadow_profile.h"
#include "store_mongoDB_error_and_exception.h"

namespace {

    //returns the round to IDLE when the round goes out of scope, whatever path it took
    class CompleteRoundOnDestruction {
    public:
        CompleteRoundOnDestruction(
                MatchState& _match_state,
                const std::chrono::milliseconds& _round_start_time
        ) : match_state(_match_state),
            round_start_time(_round_start_time) {}

        CompleteRoundOnDestruction(const CompleteRoundOnDestruction& copy) = delete;

        CompleteRoundOnDestruction& operator=(const CompleteRoundOnDestruction& rhs) = delete;

        ~CompleteRoundOnDestruction() {
            match_state.completeRound(round_start_time, successful);
        }

        bool successful = false;

    private:
        MatchState& match_state;
        const std::chrono::milliseconds round_start_time;
    };

}

bool MatchTrigger::checkAndTrigger(const std::chrono::milliseconds& current_timestamp) {

    if (!match_state.tryBeginRound(current_timestamp, config.matching_interval, config.failed_round_back_off)) {
        return false;
    }

    try {
        thread_pool.submit(
            [this, current_timestamp]() {
                runMatchingRound(current_timestamp);
            }
        );
    } catch (const std::exception& e) {
        //the round never started, it still has to leave RUNNING
        match_state.completeRound(current_timestamp, false);

        storeMongoDBErrorAndException(
                __LINE__, __FILE__,
                std::optional<std::string>(e.what()), std::string("Failed to submit matching round to thread pool.")
        );
        return false;
    }

    return true;
}

MatchStateSnapshot MatchTrigger::currentStatus() {
    return match_state.snapshot();
}

void MatchTrigger::runMatchingRound(const std::chrono::milliseconds& round_start_time) {

    CompleteRoundOnDestruction complete_round(match_state, round_start_time);

#ifndef _RELEASE
    std::cout << "Starting matching round at " << getDateTimeStringFromTimestamp(round_start_time) << ".\n";
#endif

    const auto steady_start = std::chrono::steady_clock::now();

    MatchRoundResult round_result;
    round_result.round_start_time = round_start_time;
    round_result.strategy_used = config.strategy_type;

    try {
        complete_round.successful = executeMatchingRound(round_start_time, round_result);
    } catch (const std::exception& e) {
        complete_round.successful = false;

        storeMongoDBErrorAndException(
                __LINE__, __FILE__,
                std::optional<std::string>(e.what()), std::string("Exception thrown while running matching round."),
                "round_start_time", (long long) round_start_time.count()
        );
    }

    round_result.successful = complete_round.successful;
    round_result.round_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - steady_start);

    database.saveMatchRoundResult(round_result);

#ifndef _RELEASE
    std::cout << "Finished matching round successful: " << (round_result.successful ? "true" : "false")
              << " strategy: " << matchingStrategyTypeToString(round_result.strategy_used)
              << " pairs: " << round_result.number_pairs
              << " unmatched: " << round_result.number_unmatched
              << " duration: " << round_result.round_duration.count() << "ms\n";
#endif
}

bool MatchTrigger::executeMatchingRound(
        const std::chrono::milliseconds& round_start_time,
        MatchRoundResult& result
) {

    QuestionBank question_bank;
    Submissions submissions;
    RecencyExclusion recency_exclusion;

    //errors are stored by the database functions
    if (!database.fetchQuestionBank(question_bank)
        || !database.fetchSubmissions(submissions)
        || !database.fetchRecencyExclusion(config.recency_window_days, round_start_time, recency_exclusion)) {
        return false;
    }

    const Submission shadow_submission = rollShadowProfile(
            question_bank,
            generateShadowSeed(config.shadow_seed, round_start_time)
    );

    const MatchingInput input{
        submissions,
        recency_exclusion,
        question_bank,
        shadow_submission
    };

    std::unique_ptr<AssignmentStrategy> strategy = selectAssignmentStrategy(config, submissions);
    result.strategy_used = strategy->type();

    const AssignmentResult assignment = strategy->assign(input);

    fillMatchRoundResult(assignment, submissions, config.shadow_user_id, result);

    const std::optional<std::string> violation = findMarriageInvariantViolation(
            assignment.marriage,
            submissions,
            config.shadow_user_id
    );

    if (violation) {
        storeMongoDBErrorWithStackTrace(
                __LINE__, __FILE__,
                "Matching strategy '" + matchingStrategyTypeToString(strategy->type())
                + "' produced an invalid marriage, nothing was persisted.\n" + *violation
        );
        return false;
    }

    return database.persistMarriage(assignment.marriage, round_start_time);
}

void fillMatchRoundResult(
        const AssignmentResult& assignment,
        const Submissions& submissions,
        const UserId shadow_user_id,
        MatchRoundResult& result
) {
    result.strategy_used = assignment.strategy_used;
    result.number_participants = submissions.size();
    result.number_pairs = 0;
    result.number_unmatched = 0;
    result.shadow_used = assignment.shadow_used;
    result.total_score = assignment.total_score;
    result.swaps_applied = assignment.swaps_applied;

    for (const auto& [user_id, partner] : assignment.marriage) {
        if (user_id == shadow_user_id) {
            continue;
        }

        if (!partner) {
            result.number_unmatched++;
        } else if (*partner == shadow_user_id || user_id < *partner) {
            result.number_pairs++;
        }
    }
}
