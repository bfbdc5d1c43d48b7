#pragma once

#include <chrono>
#include <utility>

#include "match_state.h"
#include "matching_objects.h"
#include "matching_database_interface.h"
#include "assignment_strategy.h"
#include "thread_pool.h"

//Decides when a matching round starts and runs it on the passed thread pool.
//checkAndTrigger() is expected to be called from every inbound request, it only takes the MatchState
// mutex for the check-and-set. The round itself (fetch, assign, validate, persist) runs on thread_pool and
// always returns match_state to IDLE when it finishes, successful or not.
//NOTE: match_state, database and thread_pool must outlive this object and thread_pool must be stopped
// before this object is destroyed.
class MatchTrigger {
public:

    MatchTrigger(
            MatchState& _match_state,
            MatchingDatabaseInterface& _database,
            ThreadPool& _thread_pool,
            MatchingConfiguration _config
    ) : match_state(_match_state),
        database(_database),
        thread_pool(_thread_pool),
        config(std::move(_config)) {}

    MatchTrigger(const MatchTrigger& copy) = delete;

    MatchTrigger& operator=(const MatchTrigger& rhs) = delete;

    //Returns true if this call moved the state to RUNNING and submitted a round. Concurrent calls while a
    // round is due will see exactly one true.
    bool checkAndTrigger(const std::chrono::milliseconds& current_timestamp);

    MatchStateSnapshot currentStatus();

    [[nodiscard]] const MatchingConfiguration& getConfig() const {
        return config;
    }

private:

    //Runs on the thread pool. round_start_time is the timestamp passed to checkAndTrigger().
    void runMatchingRound(const std::chrono::milliseconds& round_start_time);

    //Returns true only if the marriage was persisted. result is filled in as far as the round got.
    bool executeMatchingRound(
            const std::chrono::milliseconds& round_start_time,
            MatchRoundResult& result
    );

    MatchState& match_state;
    MatchingDatabaseInterface& database;
    ThreadPool& thread_pool;
    const MatchingConfiguration config;
};

//Fills in the round statistics from a finished assignment.
void fillMatchRoundResult(
        const AssignmentResult& assignment,
        const Submissions& submissions,
        UserId shadow_user_id,
        MatchRoundResult& result
);
