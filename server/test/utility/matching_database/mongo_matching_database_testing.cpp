#include <vector>
#include <utility>

#include <mongocxx/client.hpp>
#include <mongocxx/database.hpp>
#include <mongocxx/collection.hpp>

#include <bsoncxx/builder/stream/document.hpp>
#include <bsoncxx/builder/basic/array.hpp>

#include "gtest/gtest.h"

#include <connection_pool_global_variable.h>

#include "mongo_matching_database.h"
#include "clear_database_for_testing.h"
#include "matching_values.h"
#include "database_names.h"
#include "collection_names.h"
#include "user_account_keys.h"
#include "aorb_question_keys.h"
#include "matched_users_keys.h"
#include "fresh_errors_keys.h"
#include "match_round_results_keys.h"
#include "utility_general_functions.h"

//mongoDB
using bsoncxx::builder::stream::close_array;
using bsoncxx::builder::stream::close_document;
using bsoncxx::builder::stream::document;
using bsoncxx::builder::stream::finalize;
using bsoncxx::builder::stream::open_array;
using bsoncxx::builder::stream::open_document;

class MongoMatchingDatabaseTesting : public ::testing::Test {
protected:

    const UserId shadow_user_id = matching_values::SHADOW_USER_ID;
    const int minimum_answers = 2;

    MongoMatchingDatabase database{shadow_user_id, minimum_answers};

    mongocxx::pool::entry mongocxx_pool_entry = mongocxx_client_pool.acquire();
    mongocxx::client& mongo_cpp_client = *mongocxx_pool_entry;

    mongocxx::database accounts_db = mongo_cpp_client[database_names::ACCOUNTS_DATABASE_NAME];
    mongocxx::collection user_accounts_collection = accounts_db[collection_names::USER_ACCOUNTS_COLLECTION_NAME];
    mongocxx::collection aorb_questions_collection = accounts_db[collection_names::AORB_QUESTIONS_COLLECTION_NAME];
    mongocxx::collection matched_users_collection = accounts_db[collection_names::MATCHED_USERS_COLLECTION_NAME];

    mongocxx::database errors_db = mongo_cpp_client[database_names::ERRORS_DATABASE_NAME];
    mongocxx::collection fresh_errors_collection = errors_db[collection_names::FRESH_ERRORS_COLLECTION_NAME];

    const std::chrono::milliseconds current_timestamp = getCurrentTimestamp();

    void SetUp() override {
        ASSERT_TRUE(clearDatabaseAndGlobalsForTesting());
    }

    void TearDown() override {
        clearDatabaseAndGlobalsForTesting();
    }

    void insertQuestion(AorbId aorb_id, double mean) {
        aorb_questions_collection.insert_one(
            document{}
                << "_id" << aorb_id
                << aorb_question_keys::CONTEXT << "context"
                << aorb_question_keys::OPTION_A << "option a"
                << aorb_question_keys::OPTION_B << "option b"
                << aorb_question_keys::MEAN << mean
            << finalize
        );
    }

    //answers are stored using the AorbAnswer values
    void insertUser(
            UserId user_id,
            AorbId primary_aorb_id,
            int scheme,
            const std::vector<std::pair<AorbId, int>>& answers
    ) {
        bsoncxx::builder::basic::array answers_array_builder;
        for (const auto& [aorb_id, answer] : answers) {
            answers_array_builder.append(
                document{}
                    << user_account_keys::answers::AORB_ID << aorb_id
                    << user_account_keys::answers::ANSWER << answer
                    << user_account_keys::answers::ANSWERED_ON << bsoncxx::types::b_date{current_timestamp}
                << finalize
            );
        }

        const bsoncxx::document::value user_doc = document{}
                << "_id" << bsoncxx::types::b_int64{user_id}
                << user_account_keys::PRIMARY_AORB_ID << primary_aorb_id
                << user_account_keys::ASSOCIATION_SCHEME << scheme
                << user_account_keys::ANSWERS << answers_array_builder
                << user_account_keys::TIME_CREATED << bsoncxx::types::b_date{current_timestamp}
            << finalize;

        user_accounts_collection.insert_one(user_doc.view());
    }

    void insertMatchedRow(UserId user_id, UserId partner_id, const std::chrono::milliseconds& matched_on) {
        matched_users_collection.insert_one(
            document{}
                << matched_users_keys::USER_ID << bsoncxx::types::b_int64{user_id}
                << matched_users_keys::PARTNER_ID << bsoncxx::types::b_int64{partner_id}
                << matched_users_keys::MATCHED_ON << bsoncxx::types::b_date{matched_on}
            << finalize
        );
    }
};

TEST_F(MongoMatchingDatabaseTesting, fetchQuestionBank) {
    insertQuestion(1, 0.25);
    insertQuestion(2, 0.5);

    QuestionBank question_bank;
    ASSERT_TRUE(database.fetchQuestionBank(question_bank));

    ASSERT_EQ(question_bank.size(), 2);
    EXPECT_EQ(question_bank.at(1).id, 1);
    EXPECT_EQ(question_bank.at(1).option_a, "option a");
    EXPECT_EQ(question_bank.at(1).option_b, "option b");
    EXPECT_DOUBLE_EQ(question_bank.at(1).mean, 0.25);
    EXPECT_DOUBLE_EQ(question_bank.at(2).mean, 0.5);
}

TEST_F(MongoMatchingDatabaseTesting, fetchQuestionBank_meanClamped) {
    insertQuestion(1, 1.5);

    QuestionBank question_bank;
    ASSERT_TRUE(database.fetchQuestionBank(question_bank));

    EXPECT_DOUBLE_EQ(question_bank.at(1).mean, 1.0);
    EXPECT_EQ(fresh_errors_collection.count_documents(document{} << finalize), 1);
}

TEST_F(MongoMatchingDatabaseTesting, fetchQuestionBank_malformedQuestionFails) {
    aorb_questions_collection.insert_one(
        document{}
            << "_id" << 1
            << aorb_question_keys::OPTION_A << "option a"
        << finalize
    );

    QuestionBank question_bank;
    EXPECT_FALSE(database.fetchQuestionBank(question_bank));
    EXPECT_GE(fresh_errors_collection.count_documents(document{} << finalize), 1);
}

TEST_F(MongoMatchingDatabaseTesting, fetchSubmissions) {
    for (AorbId aorb_id = 1; aorb_id <= 3; ++aorb_id) {
        insertQuestion(aorb_id, 0.5);
    }

    insertUser(1, 2, (int) AssociationScheme::SEEK_SIMILAR, {{1, 0}, {2, 1}, {3, 255}});
    insertUser(2, 1, (int) AssociationScheme::SEEK_COMPLEMENTARY, {{1, 1}, {2, 1}, {3, 0}});

    Submissions submissions;
    ASSERT_TRUE(database.fetchSubmissions(submissions));

    ASSERT_EQ(submissions.size(), 2);

    const Submission& first = submissions.at(1);
    EXPECT_EQ(first.primary_aorb_id, 2);
    EXPECT_EQ(first.scheme, AssociationScheme::SEEK_SIMILAR);
    EXPECT_EQ(first.answers.at(1), AorbAnswer::OPTION_A);
    EXPECT_EQ(first.answers.at(2), AorbAnswer::OPTION_B);
    EXPECT_EQ(first.answers.at(3), AorbAnswer::UNANSWERED);

    EXPECT_EQ(submissions.at(2).scheme, AssociationScheme::SEEK_COMPLEMENTARY);
}

TEST_F(MongoMatchingDatabaseTesting, fetchSubmissions_eligibility) {
    for (AorbId aorb_id = 1; aorb_id <= 3; ++aorb_id) {
        insertQuestion(aorb_id, 0.5);
    }

    //below the minimum
    insertUser(1, 1, 0, {{1, 0}, {2, 255}});
    //exactly the minimum
    insertUser(2, 1, 0, {{1, 0}, {2, 1}});
    //invalid stored answers count as unanswered
    insertUser(3, 1, 0, {{1, 0}, {2, 7}});

    Submissions submissions;
    ASSERT_TRUE(database.fetchSubmissions(submissions));

    ASSERT_EQ(submissions.size(), 1);
    EXPECT_TRUE(submissions.contains(2));
}

TEST_F(MongoMatchingDatabaseTesting, fetchSubmissions_everyQuestionAnsweredIsEligible) {
    insertQuestion(1, 0.5);

    //the bank only holds one question, so one answer is enough
    insertUser(1, 1, 0, {{1, 0}});

    Submissions submissions;
    ASSERT_TRUE(database.fetchSubmissions(submissions));

    EXPECT_TRUE(submissions.contains(1));
}

TEST_F(MongoMatchingDatabaseTesting, fetchSubmissions_shadowAndMalformedSkipped) {
    for (AorbId aorb_id = 1; aorb_id <= 3; ++aorb_id) {
        insertQuestion(aorb_id, 0.5);
    }

    ASSERT_TRUE(database.ensureShadowUser(shadow_user_id));

    insertUser(1, 1, 0, {{1, 0}, {2, 1}});
    //invalid scheme
    insertUser(2, 1, 5, {{1, 0}, {2, 1}});
    //missing primary question
    user_accounts_collection.insert_one(
        document{}
            << "_id" << bsoncxx::types::b_int64{3}
            << user_account_keys::ASSOCIATION_SCHEME << 0
            << user_account_keys::ANSWERS << open_array << close_array
        << finalize
    );

    Submissions submissions;
    ASSERT_TRUE(database.fetchSubmissions(submissions));

    ASSERT_EQ(submissions.size(), 1);
    EXPECT_TRUE(submissions.contains(1));
    EXPECT_FALSE(submissions.contains(shadow_user_id));

    EXPECT_GE(fresh_errors_collection.count_documents(document{} << finalize), 2);
}

TEST_F(MongoMatchingDatabaseTesting, ensureShadowUser_idempotent) {
    ASSERT_TRUE(database.ensureShadowUser(shadow_user_id));
    ASSERT_TRUE(database.ensureShadowUser(shadow_user_id));

    EXPECT_EQ(user_accounts_collection.count_documents(document{} << finalize), 1);

    const auto shadow_doc = user_accounts_collection.find_one(
        document{}
            << "_id" << bsoncxx::types::b_int64{shadow_user_id}
        << finalize
    );

    ASSERT_TRUE(shadow_doc);
    EXPECT_TRUE(shadow_doc->view()[user_account_keys::IS_SHADOW].get_bool().value);
}

TEST_F(MongoMatchingDatabaseTesting, fetchRecencyExclusion) {
    const std::chrono::milliseconds inside_window = current_timestamp - std::chrono::days{3};
    const std::chrono::milliseconds outside_window = current_timestamp - std::chrono::days{40};

    insertMatchedRow(1, 2, inside_window);
    insertMatchedRow(2, 1, inside_window);
    insertMatchedRow(3, 4, outside_window);
    insertMatchedRow(4, 3, outside_window);
    insertMatchedRow(5, shadow_user_id, inside_window);
    insertMatchedRow(shadow_user_id, 5, inside_window);

    RecencyExclusion recency_exclusion;
    ASSERT_TRUE(database.fetchRecencyExclusion(28, current_timestamp, recency_exclusion));

    RecencyExclusion expected;
    expected[1].insert(2);
    expected[2].insert(1);

    EXPECT_EQ(recency_exclusion, expected);
}

TEST_F(MongoMatchingDatabaseTesting, persistMarriage_oneRowPerMatchedUser) {
    const Marriage marriage{
            {1, 2},
            {2, 1},
            {3, shadow_user_id},
            {shadow_user_id, 3},
            {4, std::nullopt}
    };

    ASSERT_TRUE(database.persistMarriage(marriage, current_timestamp));

    EXPECT_EQ(matched_users_collection.count_documents(document{} << finalize), 4);
    EXPECT_EQ(
        matched_users_collection.count_documents(
            document{}
                << matched_users_keys::USER_ID << bsoncxx::types::b_int64{4}
            << finalize
        ),
        0
    );

    //persisted matches show up in the next round's exclusion
    RecencyExclusion recency_exclusion;
    ASSERT_TRUE(database.fetchRecencyExclusion(28, current_timestamp + std::chrono::milliseconds{1}, recency_exclusion));
    EXPECT_TRUE(recency_exclusion[1].contains(2));
    EXPECT_TRUE(recency_exclusion[2].contains(1));
    EXPECT_FALSE(recency_exclusion.contains(3));
}

TEST_F(MongoMatchingDatabaseTesting, persistMarriage_duplicateRollsBackEverything) {
    insertMatchedRow(2, 1, current_timestamp);

    const Marriage marriage{
            {1, 2},
            {2, 1},
            {3, 4},
            {4, 3}
    };

    //(2, 1, current_timestamp) violates the unique index, none of the rows may be stored
    EXPECT_FALSE(database.persistMarriage(marriage, current_timestamp));
    EXPECT_EQ(matched_users_collection.count_documents(document{} << finalize), 1);
}

TEST_F(MongoMatchingDatabaseTesting, persistMarriage_emptyMarriage) {
    EXPECT_TRUE(database.persistMarriage(Marriage{{1, std::nullopt}}, current_timestamp));
    EXPECT_EQ(matched_users_collection.count_documents(document{} << finalize), 0);
}

TEST_F(MongoMatchingDatabaseTesting, fetchCurrentMatch) {
    insertMatchedRow(1, 2, current_timestamp - std::chrono::days{10});
    insertMatchedRow(1, shadow_user_id, current_timestamp - std::chrono::days{2});
    insertMatchedRow(5, 6, current_timestamp - std::chrono::days{40});

    std::optional<CurrentMatch> current_match;
    ASSERT_TRUE(database.fetchCurrentMatch(1, current_timestamp - std::chrono::days{28}, current_match));

    ASSERT_TRUE(current_match);
    EXPECT_EQ(current_match->partner_id, shadow_user_id);
    EXPECT_EQ(current_match->matched_on, current_timestamp - std::chrono::days{2});

    ASSERT_TRUE(database.fetchCurrentMatch(5, current_timestamp - std::chrono::days{28}, current_match));
    EXPECT_FALSE(current_match);
}

TEST_F(MongoMatchingDatabaseTesting, saveMatchRoundResult) {
    MatchRoundResult result;
    result.round_start_time = current_timestamp;
    result.round_duration = std::chrono::milliseconds{120};
    result.strategy_used = MatchingStrategyType::LOCAL_SEARCH;
    result.number_participants = 9;
    result.number_pairs = 5;
    result.number_unmatched = 0;
    result.shadow_used = true;
    result.total_score = 1.25;
    result.swaps_applied = 2;
    result.successful = true;

    database.saveMatchRoundResult(result);

    mongocxx::database statistics_db = mongo_cpp_client[database_names::INFO_FOR_STATISTICS_DATABASE_NAME];
    mongocxx::collection results_collection = statistics_db[collection_names::MATCH_ROUND_RESULTS_COLLECTION_NAME];

    const auto result_doc = results_collection.find_one(document{} << finalize);
    ASSERT_TRUE(result_doc);

    const bsoncxx::document::view result_view = result_doc->view();
    EXPECT_EQ(result_view[match_round_results_keys::ROUND_START_TIME].get_date().value, current_timestamp);
    EXPECT_EQ(result_view[match_round_results_keys::ROUND_DURATION].get_int64().value, 120);
    EXPECT_EQ(std::string{result_view[match_round_results_keys::STRATEGY_USED].get_string().value}, "local_search");
    EXPECT_EQ(result_view[match_round_results_keys::NUMBER_PAIRS].get_int64().value, 5);
    EXPECT_TRUE(result_view[match_round_results_keys::SHADOW_USED].get_bool().value);
    EXPECT_DOUBLE_EQ(result_view[match_round_results_keys::TOTAL_SCORE].get_double().value, 1.25);
    EXPECT_EQ(result_view[match_round_results_keys::SWAPS_APPLIED].get_int32().value, 2);
    EXPECT_TRUE(result_view[match_round_results_keys::SUCCESSFUL].get_bool().value);
}
