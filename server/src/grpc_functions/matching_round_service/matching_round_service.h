#pragma once

#include <grpcpp/grpcpp.h>

#include <MatchingRound.grpc.pb.h>

#include "match_trigger.h"
#include "matching_database_interface.h"

//Synchronous gRPC service. Every rpc calls MatchTrigger::checkAndTrigger() before doing anything else, this
// is how matching rounds are started.
class MatchingRoundServiceImpl final : public matching_round::MatchingRoundService::Service {
public:

    MatchingRoundServiceImpl(
            MatchTrigger& _match_trigger,
            MatchingDatabaseInterface& _database
    ) : match_trigger(_match_trigger),
        database(_database) {}

    grpc::Status RetrieveMatchStatusRPC(
            grpc::ServerContext* context,
            const matching_round::RetrieveMatchStatusRequest* request,
            matching_round::RetrieveMatchStatusResponse* response
    ) override;

    grpc::Status RequestCurrentMatchRPC(
            grpc::ServerContext* context,
            const matching_round::RequestCurrentMatchRequest* request,
            matching_round::RequestCurrentMatchResponse* response
    ) override;

private:
    MatchTrigger& match_trigger;
    MatchingDatabaseInterface& database;
};

//Separated from the service so it can be called without a grpc::ServerContext.
void retrieveMatchStatusImplementation(
        MatchTrigger& match_trigger,
        const std::chrono::milliseconds& current_timestamp,
        matching_round::RetrieveMatchStatusResponse* response
);

void requestCurrentMatchImplementation(
        MatchTrigger& match_trigger,
        MatchingDatabaseInterface& database,
        const std::chrono::milliseconds& current_timestamp,
        const matching_round::RequestCurrentMatchRequest* request,
        matching_round::RequestCurrentMatchResponse* response
);
