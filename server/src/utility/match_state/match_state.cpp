#include "match_state.h"

std::string matchRoundStatusToString(MatchRoundStatus status) {
    switch (status) {
        case MatchRoundStatus::IDLE:
            return "IDLE";
        case MatchRoundStatus::RUNNING:
            return "RUNNING";
    }

    return "{Unknown Value}";
}

bool MatchState::tryBeginRound(
        const std::chrono::milliseconds& current_timestamp,
        const std::chrono::milliseconds& matching_interval,
        const std::chrono::milliseconds& failed_round_back_off
) {
    std::scoped_lock<std::mutex> lock(state_mutex);

    if (status != MatchRoundStatus::IDLE) {
        return false;
    }

    if (last_completed_at && current_timestamp - *last_completed_at < matching_interval) {
        return false;
    }

    if (last_failed_at && current_timestamp - *last_failed_at < failed_round_back_off) {
        return false;
    }

    status = MatchRoundStatus::RUNNING;
    return true;
}

void MatchState::completeRound(
        const std::chrono::milliseconds& round_start_time,
        bool successful
) {
    std::scoped_lock<std::mutex> lock(state_mutex);

    if (successful) {
        last_completed_at = round_start_time;
        last_failed_at.reset();
    } else {
        last_failed_at = round_start_time;
    }

    status = MatchRoundStatus::IDLE;
}

MatchStateSnapshot MatchState::snapshot() {
    std::scoped_lock<std::mutex> lock(state_mutex);
    return MatchStateSnapshot{status, last_completed_at, last_failed_at};
}
