#pragma once

#include <string>
#include <functional>

#include <google/protobuf/message.h>

//Runs runFunction and stores any exception it throws.
//mongocxx::operation_exception calls setDatabaseDown, any other std::exception calls setError. When
// debug_response is set its debug string is stored alongside the error.
void handleFunctionOperationException(
        const std::function<void()>& runFunction,
        const std::function<void()>& setDatabaseDown,
        const std::function<void()>& setError,
        int line_number,
        const std::string& file_name,
        const ::google::protobuf::Message* debug_response = nullptr
);
