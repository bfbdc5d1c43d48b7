#pragma once

#include <string>
#include <sstream>
#include <optional>
#include <iostream>

#include <bsoncxx/oid.hpp>
#include <bsoncxx/document/view.hpp>

#include "utility_general_functions.h"

//appends a value of type string
[[maybe_unused]] inline void
appendErrorBasicMongoDbDocument(std::stringstream& error_message,
                                const std::string& key, const std::string& value) {
    if (!key.empty()) {
        error_message
            << key << ": " << value << '\n';
    }
}

//appends a value of type const char*, string literals passed as values end up here
[[maybe_unused]] inline void
appendErrorBasicMongoDbDocument(std::stringstream& error_message,
                                const std::string& key, const char* value) {
    if (!key.empty()) {
        error_message
            << key << ": " << (value == nullptr ? "null" : value) << '\n';
    }
}

//appends a value of type document::view
[[maybe_unused]] inline void
appendErrorBasicMongoDbDocument(std::stringstream& error_message,
                                const std::string& key, const bsoncxx::document::view& value) {
    if (!key.empty()) {
        error_message
            << key << '\n' << makePrettyJson(value) << '\n';
    }
}

//appends a value of type oid
[[maybe_unused]] inline void
appendErrorBasicMongoDbDocument(std::stringstream& error_message,
                                const std::string& key, const bsoncxx::oid& value) {
    if (!key.empty()) {
        error_message
            << key << ": " << value.to_string() << '\n';
    }
}

//appends a value of type long long (user ids)
[[maybe_unused]] inline void
appendErrorBasicMongoDbDocument(std::stringstream& error_message,
                                const std::string& key, long long value) {
    if (!key.empty()) {
        error_message
            << key << ": " << value << '\n';
    }
}

//appends a value of type int
[[maybe_unused]] inline void
appendErrorBasicMongoDbDocument(std::stringstream& error_message,
                                const std::string& key, int value) {
    if (!key.empty()) {
        error_message
            << key << ": " << value << '\n';
    }
}

//appends a value of type char, this is the type of the unused parameters
[[maybe_unused]] inline void
appendErrorBasicMongoDbDocument(std::stringstream& error_message,
                                const std::string& key, char value) {
    if (!key.empty()) {
        error_message
            << key << ": " << value << '\n';
    }
}

//appends to the file at general_values::ERROR_LOG_OUTPUT, a timestamp is prepended
void logErrorToFile(const std::string& error_message);

//Inserts the error into FRESH_ERRORS_COLLECTION_NAME unless (file_name, line_number) has been registered inside
// HANDLED_ERRORS_LIST_COLLECTION_NAME for the current version. The error is also written to the error log file.
//Never throws mongocxx exceptions, it is regularly called from inside catch blocks.
void storeErrorDocument(
        int line_number,
        const std::string& file_name,
        const std::string& error_message,
        const std::string& stack_trace
);

//primary error logging function, stores errors along with up to 5 other optional fields
//SUPPORTED TYPES
//std::string, const char*, long long, int, bsoncxx::oid, bsoncxx::document::view
template<typename T = char, typename U = char, typename V = char, typename W = char, typename X = char>
void storeMongoDBErrorAndException(
        const int line_number, const std::string& file_name,
        const std::optional<std::string>& exception_message, const std::string& error_message,
        const std::string& first_key = "", const T first = 0,
        const std::string& second_key = "", const U second = 0,
        const std::string& third_key = "", const V third = 0,
        const std::string& fourth_key = "", const W fourth = 0,
        const std::string& fifth_key = "", const X fifth = 0
) {

    std::stringstream final_error_message;

    appendErrorBasicMongoDbDocument(final_error_message, first_key, first);
    appendErrorBasicMongoDbDocument(final_error_message, second_key, second);
    appendErrorBasicMongoDbDocument(final_error_message, third_key, third);
    appendErrorBasicMongoDbDocument(final_error_message, fourth_key, fourth);
    appendErrorBasicMongoDbDocument(final_error_message, fifth_key, fifth);

    if (exception_message) {
        final_error_message
                << "Exception Message: " << exception_message.value() << '\n';
    }

    final_error_message
            << "ERROR:\n" << error_message;

    storeErrorDocument(line_number, file_name, final_error_message.str(), "");
}

//Same as storeMongoDBErrorAndException() except a stack trace of the calling thread is stored with the error.
//NOTE: generating the trace is slow, only use this for errors that should never happen (broken invariants).
void storeMongoDBErrorWithStackTrace(
        int line_number,
        const std::string& file_name,
        const std::string& error_message
);
