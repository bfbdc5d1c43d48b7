#include <iostream>

#include <mongocxx/client.hpp>
#include <mongocxx/database.hpp>
#include <mongocxx/collection.hpp>
#include <mongocxx/options/index.hpp>

#include <bsoncxx/builder/stream/document.hpp>

#include <connection_pool_global_variable.h>

#include "server_initialization_functions.h"
#include "database_names.h"
#include "collection_names.h"
#include "user_account_keys.h"
#include "matched_users_keys.h"
#include "match_round_results_keys.h"
#include "fresh_errors_keys.h"
#include "handled_errors_list_keys.h"

//mongoDB
using bsoncxx::builder::stream::document;
using bsoncxx::builder::stream::finalize;

void setupMongoDBIndexing() {

    mongocxx::pool::entry mongocxx_pool_entry = mongocxx_client_pool.acquire();
    mongocxx::client& mongo_cpp_client = *mongocxx_pool_entry;

    mongocxx::database accounts_db = mongo_cpp_client[database_names::ACCOUNTS_DATABASE_NAME];
    mongocxx::database errors_db = mongo_cpp_client[database_names::ERRORS_DATABASE_NAME];
    mongocxx::database statistics_db = mongo_cpp_client[database_names::INFO_FOR_STATISTICS_DATABASE_NAME];

    mongocxx::collection user_accounts_collection = accounts_db[collection_names::USER_ACCOUNTS_COLLECTION_NAME];
    mongocxx::collection matched_users_collection = accounts_db[collection_names::MATCHED_USERS_COLLECTION_NAME];
    //aorb questions are always read in full, accessed by _id otherwise

    mongocxx::collection fresh_errors_collection = errors_db[collection_names::FRESH_ERRORS_COLLECTION_NAME];
    mongocxx::collection handled_errors_list_collection = errors_db[collection_names::HANDLED_ERRORS_LIST_COLLECTION_NAME];

    mongocxx::collection match_round_results_collection = statistics_db[collection_names::MATCH_ROUND_RESULTS_COLLECTION_NAME];

    mongocxx::options::index background_index{};
    //setting up the index in the background so servers can be started without blocking the collections
    background_index.background(true);

    mongocxx::options::index unique_index{};
    unique_index.unique(true);
    unique_index.background(true);

    std::cout << "Started setting up database indexing.\n";

    //Simple indexing rules
    //1 First, add those fields against which Equality queries are run.
    //2 The next fields to be indexed should reflect the Sort order of the query.
    //3 The last fields represent the Range of data to be accessed.

    user_accounts_collection.create_index(
        document{}
            << user_account_keys::IS_SHADOW << 1
        << finalize,
        background_index
    );

    //used by fetchCurrentMatch()
    matched_users_collection.create_index(
        document{}
            << matched_users_keys::USER_ID << 1
            << matched_users_keys::MATCHED_ON << -1
        << finalize,
        background_index
    );

    //used by fetchRecencyExclusion()
    matched_users_collection.create_index(
        document{}
            << matched_users_keys::MATCHED_ON << 1
        << finalize,
        background_index
    );

    //a pair can only be stored once per round
    matched_users_collection.create_index(
        document{}
            << matched_users_keys::USER_ID << 1
            << matched_users_keys::PARTNER_ID << 1
            << matched_users_keys::MATCHED_ON << 1
        << finalize,
        unique_index
    );

    fresh_errors_collection.create_index(
        document{}
            << fresh_errors_keys::TIMESTAMP_STORED << -1
        << finalize,
        background_index
    );

    handled_errors_list_collection.create_index(
        document{}
            << handled_errors_list_keys::ERROR_ORIGIN << 1
            << handled_errors_list_keys::VERSION_NUMBER << 1
            << handled_errors_list_keys::FILE_NAME << 1
            << handled_errors_list_keys::LINE_NUMBER << 1
        << finalize,
        unique_index
    );

    match_round_results_collection.create_index(
        document{}
            << match_round_results_keys::ROUND_START_TIME << -1
        << finalize,
        background_index
    );

    std::cout << "Finished setting up database indexing.\n";
}
