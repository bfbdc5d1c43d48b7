#pragma once

#include <mutex>
#include <chrono>
#include <string>
#include <optional>

enum class MatchRoundStatus {
    IDLE,
    RUNNING
};

std::string matchRoundStatusToString(MatchRoundStatus status);

struct MatchStateSnapshot {
    MatchRoundStatus status = MatchRoundStatus::IDLE;
    std::optional<std::chrono::milliseconds> last_completed_at;
    std::optional<std::chrono::milliseconds> last_failed_at;
};

//The single process wide status of the matching rounds. Constructed once inside main() and passed by
// reference to everything that needs it. Every read and write goes through the same mutex so the
// (status, timestamp) pair is never seen half updated.
class MatchState {
public:

    MatchState() = default;

    MatchState(const MatchState& copy) = delete;

    MatchState(MatchState&& move) = delete;

    MatchState& operator=(const MatchState& rhs) = delete;

    //Atomically moves IDLE -> RUNNING if a round is due. A round is due when the status is IDLE, the
    // last completed round started at least matching_interval ago (or no round has completed) and the
    // last failed round (if any) was at least failed_round_back_off ago.
    //Returns true if this call performed the transition.
    bool tryBeginRound(
            const std::chrono::milliseconds& current_timestamp,
            const std::chrono::milliseconds& matching_interval,
            const std::chrono::milliseconds& failed_round_back_off
    );

    //RUNNING -> IDLE. On success last_completed_at is set to round_start_time, on failure
    // last_failed_at is set to round_start_time and last_completed_at is left alone.
    void completeRound(
            const std::chrono::milliseconds& round_start_time,
            bool successful
    );

    MatchStateSnapshot snapshot();

private:
    std::mutex state_mutex;

    MatchRoundStatus status = MatchRoundStatus::IDLE;
    std::optional<std::chrono::milliseconds> last_completed_at;
    std::optional<std::chrono::milliseconds> last_failed_at;
};
