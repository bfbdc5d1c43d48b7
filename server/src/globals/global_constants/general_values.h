#pragma once

#include <string>
#include <chrono>
#include "get_environment_variable.h"

namespace general_values {

    inline const std::string APP_NAME = "ClashMatch";

    //if an error fails to be stored inside the database (or any error really) it will be written to this file
    inline const std::string ERROR_LOG_OUTPUT = get_environment_variable("ERROR_LOG_OUTPUT_DIRECTORY_CLASH_MATCH") + "ErrorLog.txt";

    inline const std::string MONGODB_URI_STRING = get_environment_variable("MONGODB_URI_CLASH_MATCH");

    //in the form address:port
    inline const std::string SERVER_ADDRESS = get_environment_variable_or_default("CLASH_MATCH_SERVER_ADDRESS", "0.0.0.0:50051");

    //optional overrides for MatchingConfiguration
    inline const std::string MATCHING_STRATEGY_ENVIRONMENT_VARIABLE = "CLASH_MATCH_STRATEGY";
    inline const std::string MATCHING_INTERVAL_ENVIRONMENT_VARIABLE = "CLASH_MATCH_INTERVAL_SECONDS";

    //time the server waits for in-flight calls when shutting down
    inline const std::chrono::milliseconds TIME_TO_WAIT_FOR_SERVER_SHUTDOWN = std::chrono::milliseconds{10L * 1000L};

    //protobuf debug strings longer than this are not stored with errors
    inline const size_t MAXIMUM_NUMBER_ALLOWED_BYTES_ERROR_MESSAGE = 10000;
}
