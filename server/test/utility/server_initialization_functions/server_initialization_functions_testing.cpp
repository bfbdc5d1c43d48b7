#include <mongocxx/client.hpp>
#include <mongocxx/database.hpp>
#include <mongocxx/collection.hpp>

#include <bsoncxx/builder/stream/document.hpp>

#include "gtest/gtest.h"

#include <connection_pool_global_variable.h>

#include "server_initialization_functions.h"
#include "mongo_matching_database.h"
#include "clear_database_for_testing.h"
#include "matching_values.h"
#include "database_names.h"
#include "collection_names.h"
#include "user_account_keys.h"

//mongoDB
using bsoncxx::builder::stream::document;
using bsoncxx::builder::stream::finalize;

class ServerInitializationFunctionsTesting : public ::testing::Test {
protected:

    mongocxx::pool::entry mongocxx_pool_entry = mongocxx_client_pool.acquire();
    mongocxx::client& mongo_cpp_client = *mongocxx_pool_entry;

    mongocxx::database accounts_db = mongo_cpp_client[database_names::ACCOUNTS_DATABASE_NAME];
    mongocxx::collection user_accounts_collection = accounts_db[collection_names::USER_ACCOUNTS_COLLECTION_NAME];

    void SetUp() override {
        ASSERT_TRUE(clearDatabaseAndGlobalsForTesting());
    }

    void TearDown() override {
        clearDatabaseAndGlobalsForTesting();
    }
};

TEST_F(ServerInitializationFunctionsTesting, setupMongoDBIndexing_canRunTwice) {
    //already run inside main()
    setupMongoDBIndexing();

    mongocxx::collection matched_users_collection = accounts_db[collection_names::MATCHED_USERS_COLLECTION_NAME];

    int number_indexes = 0;
    for ([[maybe_unused]] const auto& index : matched_users_collection.list_indexes()) {
        number_indexes++;
    }

    //_id plus the created indexes
    EXPECT_GT(number_indexes, 1);
}

TEST_F(ServerInitializationFunctionsTesting, setupMandatoryDatabaseDocs_createsShadow) {
    MongoMatchingDatabase database(matching_values::SHADOW_USER_ID, matching_values::MINIMUM_ANSWERS_FOR_ELIGIBILITY);

    setupMandatoryDatabaseDocs(database, matching_values::SHADOW_USER_ID);
    setupMandatoryDatabaseDocs(database, matching_values::SHADOW_USER_ID);

    EXPECT_EQ(
        user_accounts_collection.count_documents(
            document{}
                << "_id" << bsoncxx::types::b_int64{matching_values::SHADOW_USER_ID}
                << user_account_keys::IS_SHADOW << true
            << finalize
        ),
        1
    );
}
