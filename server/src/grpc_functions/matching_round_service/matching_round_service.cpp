#include <iostream>
#include <optional>

#include "matching_round_service.h"
#include "handle_function_operation_exception.h"
#include "utility_general_functions.h"

grpc::Status MatchingRoundServiceImpl::RetrieveMatchStatusRPC(
        grpc::ServerContext*,
        const matching_round::RetrieveMatchStatusRequest*,
        matching_round::RetrieveMatchStatusResponse* response
) {

#ifndef _RELEASE
    std::cout << "Starting Retrieve Match Status...\n";
#endif // _RELEASE

    retrieveMatchStatusImplementation(match_trigger, getCurrentTimestamp(), response);

    return grpc::Status::OK;
}

grpc::Status MatchingRoundServiceImpl::RequestCurrentMatchRPC(
        grpc::ServerContext*,
        const matching_round::RequestCurrentMatchRequest* request,
        matching_round::RequestCurrentMatchResponse* response
) {

#ifndef _RELEASE
    std::cout << "Starting Request Current Match...\n";
#endif // _RELEASE

    const std::chrono::milliseconds current_timestamp = getCurrentTimestamp();

    handleFunctionOperationException(
            [&] {
                requestCurrentMatchImplementation(match_trigger, database, current_timestamp, request, response);
            },
            [&] {
                response->Clear();
                response->set_return_status(matching_round::RequestCurrentMatchResponse::DATABASE_DOWN);
            },
            [&] {
                response->Clear();
                response->set_return_status(matching_round::RequestCurrentMatchResponse::SERVER_ERROR);
            },
            __LINE__, __FILE__, request
    );

    return grpc::Status::OK;
}

void retrieveMatchStatusImplementation(
        MatchTrigger& match_trigger,
        const std::chrono::milliseconds& current_timestamp,
        matching_round::RetrieveMatchStatusResponse* response
) {

    match_trigger.checkAndTrigger(current_timestamp);

    const MatchStateSnapshot snapshot = match_trigger.currentStatus();

    response->set_status(
            snapshot.status == MatchRoundStatus::RUNNING ?
                matching_round::MATCH_ROUND_STATUS_RUNNING :
                matching_round::MATCH_ROUND_STATUS_IDLE
    );
    response->set_last_completed_at(snapshot.last_completed_at ? snapshot.last_completed_at->count() : -1);
    response->set_last_failed_at(snapshot.last_failed_at ? snapshot.last_failed_at->count() : -1);
}

void requestCurrentMatchImplementation(
        MatchTrigger& match_trigger,
        MatchingDatabaseInterface& database,
        const std::chrono::milliseconds& current_timestamp,
        const matching_round::RequestCurrentMatchRequest* request,
        matching_round::RequestCurrentMatchResponse* response
) {

    match_trigger.checkAndTrigger(current_timestamp);

    const MatchingConfiguration& config = match_trigger.getConfig();
    const std::chrono::milliseconds window_start =
            current_timestamp - std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::days{config.recency_window_days});

    std::optional<CurrentMatch> current_match;

    if (!database.fetchCurrentMatch(request->user_id(), window_start, current_match)) {
        //error was already stored
        response->set_return_status(matching_round::RequestCurrentMatchResponse::SERVER_ERROR);
        return;
    }

    if (!current_match) {
        response->set_return_status(matching_round::RequestCurrentMatchResponse::NO_MATCH);
        return;
    }

    response->set_partner_id(current_match->partner_id);
    response->set_partner_is_shadow(current_match->partner_id == config.shadow_user_id);
    response->set_matched_on(current_match->matched_on.count());
    response->set_return_status(matching_round::RequestCurrentMatchResponse::SUCCESS);
}
