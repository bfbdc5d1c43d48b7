#include <csignal>
#include <thread>
#include <iostream>

#include <mongocxx/instance.hpp>
#include <grpcpp/grpcpp.h>

#include <assert_macro.h>
#include <connection_pool_global_variable.h>

#include "server_initialization_functions.h"
#include "store_mongoDB_error_and_exception.h"
#include "general_values.h"
#include "matching_values.h"
#include "match_state.h"
#include "match_trigger.h"
#include "thread_pool.h"
#include "mongo_matching_database.h"
#include "matching_round_service.h"

namespace {

    //SIGINT and SIGTERM are blocked for every thread and received here instead
    void waitForShutdownSignal(grpc::Server* server) {
        sigset_t signal_set;
        sigemptyset(&signal_set);
        sigaddset(&signal_set, SIGINT);
        sigaddset(&signal_set, SIGTERM);

        int received_signal = 0;
        sigwait(&signal_set, &received_signal);

        std::cout << "Received signal " << received_signal << ", shutting down server.\n";

        server->Shutdown(
                std::chrono::system_clock::now() + general_values::TIME_TO_WAIT_FOR_SERVER_SHUTDOWN
        );
    }

}

//Process Entry Point
int main() {
#ifdef CM_TESTING
    std::cout << "CM_TESTING IS STILL ENABLED, THIS CHANGES SOME GLOBAL CONSTANTS!\n";
#endif // CM_TESTING

    //Make sure environment variables have been set.
    assert_msg(
            general_values::ERROR_LOG_OUTPUT != ENVIRONMENT_VARIABLE_FAILED + "ErrorLog.txt",
            std::string("Environment variable ERROR_LOG_OUTPUT_DIRECTORY_CLASH_MATCH has not been set. Please set it inside /etc/environment.")
    );

#ifdef _RELEASE
    assert_msg(
            general_values::MONGODB_URI_STRING != ENVIRONMENT_VARIABLE_FAILED,
            std::string("Environment variable MONGODB_URI_CLASH_MATCH has not been set. Please set it inside /etc/environment.")
    );
#endif

    logErrorToFile("Server initializing.");

    MatchingConfiguration matching_configuration;
    std::string configuration_error;

    const bool configuration_valid = applyEnvironmentOverrides(matching_configuration, configuration_error);
    assert_msg(configuration_valid, configuration_error);

    //must be blocked before any other thread is started so that every thread inherits the mask
    sigset_t signal_set;
    sigemptyset(&signal_set);
    sigaddset(&signal_set, SIGINT);
    sigaddset(&signal_set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signal_set, nullptr);

    //runs matching rounds, gRPC uses its own threads for the synchronous server
    ThreadPool matching_thread_pool;

    //must be called once before any other mongocxx function and destroyed last
    mongocxx::instance mongo_cpp_instance{};
    mongocxx_client_pool.init();

    MongoMatchingDatabase matching_database(
            matching_configuration.shadow_user_id,
            matching_values::MINIMUM_ANSWERS_FOR_ELIGIBILITY
    );

    //indexing must come before database docs to enforce unique indexing
    setupMongoDBIndexing();
    setupMandatoryDatabaseDocs(matching_database, matching_configuration.shadow_user_id);

    MatchState match_state;
    MatchTrigger match_trigger(
            match_state,
            matching_database,
            matching_thread_pool,
            matching_configuration
    );

    MatchingRoundServiceImpl matching_round_service(match_trigger, matching_database);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(general_values::SERVER_ADDRESS, grpc::InsecureServerCredentials());
    builder.RegisterService(&matching_round_service);

    std::unique_ptr<grpc::Server> server = builder.BuildAndStart();

    assert_msg(
            server != nullptr,
            "Failed to start server on " + general_values::SERVER_ADDRESS + "."
    );

    std::cout << general_values::APP_NAME << " server listening on " << general_values::SERVER_ADDRESS
              << " using strategy " << matchingStrategyTypeToString(matching_configuration.strategy_type) << ".\n";

    //a round is due as soon as the server starts
    match_trigger.checkAndTrigger(getCurrentTimestamp());

    std::jthread shutdown_thread(waitForShutdownSignal, server.get());

    server->Wait();

    //rounds reference match_trigger, they must finish before it goes out of scope
    matching_thread_pool.stop_pool();

    logErrorToFile("Server shut down.");

    return 0;
}
