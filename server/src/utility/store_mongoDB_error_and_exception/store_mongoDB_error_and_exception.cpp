#include <mongocxx/client.hpp>
#include <mongocxx/database.hpp>
#include <mongocxx/collection.hpp>
#include <mongocxx/exception/exception.hpp>

#include <bsoncxx/builder/stream/document.hpp>
#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>

#include <boost/stacktrace.hpp>

#include <ErrorOriginEnum.pb.h>
#include <connection_pool_global_variable.h>

#include "store_mongoDB_error_and_exception.h"
#include "database_names.h"
#include "collection_names.h"
#include "fresh_errors_keys.h"
#include "handled_errors_list_keys.h"
#include "version_number.h"

void storeErrorDocument(
        const int line_number,
        const std::string& file_name,
        const std::string& error_message,
        const std::string& stack_trace
) {

    bsoncxx::builder::basic::document insert_document{};

    insert_document.append(
            bsoncxx::builder::basic::kvp(fresh_errors_keys::ERROR_ORIGIN, ErrorOriginType::ERROR_ORIGIN_MATCHING_SERVER),
            bsoncxx::builder::basic::kvp(fresh_errors_keys::ERROR_URGENCY, ErrorUrgencyLevel::ERROR_URGENCY_LEVEL_UNKNOWN),
            bsoncxx::builder::basic::kvp(fresh_errors_keys::VERSION_NUMBER, (int) version_number::SERVER_CURRENT_VERSION_NUMBER),
            bsoncxx::builder::basic::kvp(fresh_errors_keys::FILE_NAME, file_name),
            bsoncxx::builder::basic::kvp(fresh_errors_keys::LINE_NUMBER, line_number),
            bsoncxx::builder::basic::kvp(fresh_errors_keys::STACK_TRACE, stack_trace),
            bsoncxx::builder::basic::kvp(fresh_errors_keys::TIMESTAMP_STORED, bsoncxx::types::b_date{getCurrentTimestamp()}),
            bsoncxx::builder::basic::kvp(fresh_errors_keys::ERROR_MESSAGE, error_message)
    );

#ifndef _RELEASE
    std::cout << "Printing Error:\n" << makePrettyJson(insert_document.view()) << '\n';
#endif

    //It is important here that mongocxx::exception is caught and NOT just logic_error. This function is
    // run inside catch blocks (handleFunctionOperationException() is an example).
    try {
        mongocxx::pool::entry mongocxx_pool_entry = mongocxx_client_pool.acquire();
        mongocxx::client& mongo_cpp_client = *mongocxx_pool_entry;

        mongocxx::database errors_db = mongo_cpp_client[database_names::ERRORS_DATABASE_NAME];
        mongocxx::collection fresh_errors_collection = errors_db[collection_names::FRESH_ERRORS_COLLECTION_NAME];
        mongocxx::collection handled_errors_list_collection = errors_db[collection_names::HANDLED_ERRORS_LIST_COLLECTION_NAME];

        mongocxx::options::find opts;
        opts.projection(
                bsoncxx::builder::stream::document{}
                    << "_id" << 1
                << bsoncxx::builder::stream::finalize
        );

        const auto handled_error = handled_errors_list_collection.find_one(
                bsoncxx::builder::stream::document{}
                    << handled_errors_list_keys::ERROR_ORIGIN << ErrorOriginType::ERROR_ORIGIN_MATCHING_SERVER
                    << handled_errors_list_keys::VERSION_NUMBER << (int) version_number::SERVER_CURRENT_VERSION_NUMBER
                    << handled_errors_list_keys::FILE_NAME << file_name
                    << handled_errors_list_keys::LINE_NUMBER << line_number
                << bsoncxx::builder::stream::finalize,
                opts
        );

        if (handled_error) { //error has been set to handled
            return;
        }

        fresh_errors_collection.insert_one(insert_document.view());
    }
    catch (const mongocxx::exception& e) {
        std::stringstream exception_string;

        exception_string
                << "line: " << __LINE__
                << " file: " << __FILE__
                << "\nexception message: " << e.what()
                << "\nERROR:\n" << "Failed to store error inside the database.\n";

#ifndef _RELEASE
        std::cout << exception_string.str();
#endif

        logErrorToFile(exception_string.str());
    }

    logErrorToFile(makePrettyJson(insert_document.view()) + "\n");
}

void storeMongoDBErrorWithStackTrace(
        const int line_number,
        const std::string& file_name,
        const std::string& error_message
) {
    storeErrorDocument(
            line_number,
            file_name,
            "ERROR:\n" + error_message,
            boost::stacktrace::to_string(boost::stacktrace::stacktrace())
    );
}
