#pragma once

#include <string>

//mongoDB (ERRORS_DATABASE_NAME) (FRESH_ERRORS_COLLECTION_NAME)
namespace fresh_errors_keys {
    inline const std::string ERROR_ORIGIN = "eO"; //int32; follows ErrorOriginType enum inside ErrorOriginEnum.proto
    inline const std::string ERROR_URGENCY = "eU"; //int32; follows ErrorUrgencyLevel enum inside ErrorOriginEnum.proto
    inline const std::string VERSION_NUMBER = "vN"; //int32; version number (should be greater than 0)
    inline const std::string FILE_NAME = "fN"; //string; file name where error occurred
    inline const std::string LINE_NUMBER = "lN"; //int32; line number where error occurred
    inline const std::string STACK_TRACE = "sT"; //string; empty unless the error was stored with a stack trace
    inline const std::string TIMESTAMP_STORED = "tS"; //mongoDB Date; timestamp error was stored
    inline const std::string ERROR_MESSAGE = "eM"; //string; error message
}
