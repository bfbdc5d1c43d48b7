#include <mongocxx/exception/operation_exception.hpp>

#include "handle_function_operation_exception.h"
#include "build_debug_string_response.h"
#include "store_mongoDB_error_and_exception.h"

void handleFunctionOperationException(
        const std::function<void()>& runFunction,
        const std::function<void()>& setDatabaseDown,
        const std::function<void()>& setError,
        const int line_number,
        const std::string& file_name,
        const ::google::protobuf::Message* debug_response
) {

    try {
        runFunction();
    } catch (const mongocxx::operation_exception& e) {

        const std::string error_string =
                "mongocxx::operation_exception occurred.\n" + buildDebugStringResponse(debug_response);

        std::string raw_server_error = "raw_server_error Does not exist";

        if (e.raw_server_error()) {
            raw_server_error = makePrettyJson(e.raw_server_error()->view());
        }

        storeMongoDBErrorAndException(
                line_number, file_name,
                std::optional<std::string>(e.what()), error_string,
                "raw_server_error", raw_server_error,
                "error_code_value", std::to_string(e.code().value())
        );

        setDatabaseDown();
    } catch (const std::exception& e) {
        const std::string error_string = "std::exception occurred.\n" + buildDebugStringResponse(debug_response);

        storeMongoDBErrorAndException(
                line_number, file_name,
                std::optional<std::string>(e.what()), error_string
        );

        setError();
    }
}
