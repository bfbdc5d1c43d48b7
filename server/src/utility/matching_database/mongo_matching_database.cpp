#include <vector>
#include <optional>
#include <algorithm>
#include <stdexcept>

#include <mongocxx/client.hpp>
#include <mongocxx/database.hpp>
#include <mongocxx/collection.hpp>
#include <mongocxx/client_session.hpp>
#include <mongocxx/exception/exception.hpp>

#include <bsoncxx/builder/stream/document.hpp>

#include <connection_pool_global_variable.h>

#include "mongo_matching_database.h"
#include "store_mongoDB_error_and_exception.h"
#include "extract_data_from_bsoncxx.h"
#include "database_names.h"
#include "collection_names.h"
#include "user_account_keys.h"
#include "aorb_question_keys.h"
#include "matched_users_keys.h"
#include "match_round_results_keys.h"

//mongoDB
using bsoncxx::builder::stream::close_array;
using bsoncxx::builder::stream::close_document;
using bsoncxx::builder::stream::document;
using bsoncxx::builder::stream::finalize;
using bsoncxx::builder::stream::open_array;
using bsoncxx::builder::stream::open_document;

namespace {

    AorbAnswer convertStoredAnswer(const int stored_answer) {
        switch (stored_answer) {
            case (int) AorbAnswer::OPTION_A:
                return AorbAnswer::OPTION_A;
            case (int) AorbAnswer::OPTION_B:
                return AorbAnswer::OPTION_B;
            default:
                return AorbAnswer::UNANSWERED;
        }
    }

    //throws ErrorExtractingFromBsoncxx if the document is malformed
    std::pair<UserId, Submission> extractSubmission(
            const bsoncxx::document::view& user_doc,
            int& number_answered
    ) {
        const DocumentLocation location{
            database_names::ACCOUNTS_DATABASE_NAME,
            collection_names::USER_ACCOUNTS_COLLECTION_NAME
        };

        const UserId user_id = extractFromBsoncxx_k_int64(user_doc, "_id", location);
        const AorbId primary_aorb_id = extractFromBsoncxx_k_int32(user_doc, user_account_keys::PRIMARY_AORB_ID, location);
        const int stored_scheme = extractFromBsoncxx_k_int32(user_doc, user_account_keys::ASSOCIATION_SCHEME, location);

        if (stored_scheme != (int) AssociationScheme::SEEK_SIMILAR
            && stored_scheme != (int) AssociationScheme::SEEK_COMPLEMENTARY) {
            storeMongoDBErrorAndException(
                    __LINE__, __FILE__,
                    std::optional<std::string>(), std::string("Invalid association scheme stored for user."),
                    "user_id", user_id,
                    "stored_scheme", stored_scheme
            );

            throw ErrorExtractingFromBsoncxx("Invalid association scheme " + std::to_string(stored_scheme) + ".");
        }

        AnswerVector answers;
        number_answered = 0;

        const bsoncxx::array::view answers_array = extractFromBsoncxx_k_array(user_doc, user_account_keys::ANSWERS, location);
        for (const auto& answer_element : answers_array) {
            const bsoncxx::document::view answer_doc = extractFromBsoncxxArrayElement_k_document(answer_element, location);

            const AorbId aorb_id = extractFromBsoncxx_k_int32(answer_doc, user_account_keys::answers::AORB_ID, location);
            const AorbAnswer answer = convertStoredAnswer(
                    extractFromBsoncxx_k_int32(answer_doc, user_account_keys::answers::ANSWER, location)
            );

            answers[aorb_id] = answer;
            if (answer != AorbAnswer::UNANSWERED) {
                number_answered++;
            }
        }

        return {
            user_id,
            Submission{
                std::move(answers),
                primary_aorb_id,
                static_cast<AssociationScheme>(stored_scheme)
            }
        };
    }

}

bool MongoMatchingDatabase::fetchSubmissions(Submissions& submissions) {

    submissions.clear();

    try {
        mongocxx::pool::entry mongocxx_pool_entry = mongocxx_client_pool.acquire();
        mongocxx::client& mongo_cpp_client = *mongocxx_pool_entry;

        mongocxx::database accounts_db = mongo_cpp_client[database_names::ACCOUNTS_DATABASE_NAME];
        mongocxx::collection user_accounts_collection = accounts_db[collection_names::USER_ACCOUNTS_COLLECTION_NAME];
        mongocxx::collection aorb_questions_collection = accounts_db[collection_names::AORB_QUESTIONS_COLLECTION_NAME];

        const auto number_questions = aorb_questions_collection.count_documents(document{} << finalize);

        mongocxx::options::find opts;
        opts.projection(
            document{}
                << "_id" << 1
                << user_account_keys::PRIMARY_AORB_ID << 1
                << user_account_keys::ASSOCIATION_SCHEME << 1
                << user_account_keys::ANSWERS << 1
            << finalize
        );

        mongocxx::cursor users_cursor = user_accounts_collection.find(
            document{}
                << user_account_keys::IS_SHADOW << open_document
                    << "$ne" << true
                << close_document
            << finalize,
            opts
        );

        for (const bsoncxx::document::view& user_doc : users_cursor) {
            try {
                int number_answered = 0;
                auto [user_id, submission] = extractSubmission(user_doc, number_answered);

                if (user_id == shadow_user_id) {
                    continue;
                }

                //users that have answered every question are eligible even if the bank is small
                if (number_answered >= minimum_answers_for_eligibility
                    || (number_questions > 0 && number_answered >= number_questions)) {
                    submissions.insert({user_id, std::move(submission)});
                }
            } catch (const ErrorExtractingFromBsoncxx&) {
                //error was already stored, the user sits out this round
                continue;
            }
        }
    } catch (const mongocxx::exception& e) {
        storeMongoDBErrorAndException(
                __LINE__, __FILE__,
                std::optional<std::string>(e.what()), std::string("Failed to fetch submissions."),
                "database", database_names::ACCOUNTS_DATABASE_NAME,
                "collection", collection_names::USER_ACCOUNTS_COLLECTION_NAME
        );
        return false;
    }

    return true;
}

bool MongoMatchingDatabase::fetchQuestionBank(QuestionBank& question_bank) {

    question_bank.clear();

    const DocumentLocation location{
        database_names::ACCOUNTS_DATABASE_NAME,
        collection_names::AORB_QUESTIONS_COLLECTION_NAME
    };

    try {
        mongocxx::pool::entry mongocxx_pool_entry = mongocxx_client_pool.acquire();
        mongocxx::client& mongo_cpp_client = *mongocxx_pool_entry;

        mongocxx::database accounts_db = mongo_cpp_client[database_names::ACCOUNTS_DATABASE_NAME];
        mongocxx::collection aorb_questions_collection = accounts_db[collection_names::AORB_QUESTIONS_COLLECTION_NAME];

        mongocxx::cursor questions_cursor = aorb_questions_collection.find(document{} << finalize);

        for (const bsoncxx::document::view& question_doc : questions_cursor) {
            AorbQuestion question;
            question.id = extractFromBsoncxx_k_int32(question_doc, "_id", location);
            question.option_a = extractFromBsoncxx_k_utf8(question_doc, aorb_question_keys::OPTION_A, location);
            question.option_b = extractFromBsoncxx_k_utf8(question_doc, aorb_question_keys::OPTION_B, location);
            question.mean = extractFromBsoncxx_k_double(question_doc, aorb_question_keys::MEAN, location);

            if (question.mean < 0.0 || 1.0 < question.mean) {
                storeMongoDBErrorAndException(
                        __LINE__, __FILE__,
                        std::optional<std::string>(), std::string("Question mean is outside of [0, 1], it will be clamped."),
                        "aorb_id", question.id,
                        "mean", std::to_string(question.mean)
                );
                question.mean = std::clamp(question.mean, 0.0, 1.0);
            }

            question_bank.insert({question.id, std::move(question)});
        }
    } catch (const ErrorExtractingFromBsoncxx&) {
        //error was already stored, a round should not run with part of the bank
        return false;
    } catch (const mongocxx::exception& e) {
        storeMongoDBErrorAndException(
                __LINE__, __FILE__,
                std::optional<std::string>(e.what()), std::string("Failed to fetch question bank."),
                "database", database_names::ACCOUNTS_DATABASE_NAME,
                "collection", collection_names::AORB_QUESTIONS_COLLECTION_NAME
        );
        return false;
    }

    return true;
}

bool MongoMatchingDatabase::fetchRecencyExclusion(
        const int window_days,
        const std::chrono::milliseconds& current_timestamp,
        RecencyExclusion& recency_exclusion
) {

    recency_exclusion.clear();

    const DocumentLocation location{
        database_names::ACCOUNTS_DATABASE_NAME,
        collection_names::MATCHED_USERS_COLLECTION_NAME
    };

    const std::chrono::milliseconds window_start =
            current_timestamp - std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::days{window_days});

    try {
        mongocxx::pool::entry mongocxx_pool_entry = mongocxx_client_pool.acquire();
        mongocxx::client& mongo_cpp_client = *mongocxx_pool_entry;

        mongocxx::database accounts_db = mongo_cpp_client[database_names::ACCOUNTS_DATABASE_NAME];
        mongocxx::collection matched_users_collection = accounts_db[collection_names::MATCHED_USERS_COLLECTION_NAME];

        mongocxx::cursor matched_cursor = matched_users_collection.find(
            document{}
                << matched_users_keys::MATCHED_ON << open_document
                    << "$gte" << bsoncxx::types::b_date{window_start}
                << close_document
            << finalize
        );

        for (const bsoncxx::document::view& matched_doc : matched_cursor) {
            const UserId user_id = extractFromBsoncxx_k_int64(matched_doc, matched_users_keys::USER_ID, location);
            const UserId partner_id = extractFromBsoncxx_k_int64(matched_doc, matched_users_keys::PARTNER_ID, location);

            if (user_id == shadow_user_id || partner_id == shadow_user_id) {
                continue;
            }

            recency_exclusion[user_id].insert(partner_id);
        }
    } catch (const ErrorExtractingFromBsoncxx&) {
        //a missing exclusion could re-match a recent pair
        return false;
    } catch (const mongocxx::exception& e) {
        storeMongoDBErrorAndException(
                __LINE__, __FILE__,
                std::optional<std::string>(e.what()), std::string("Failed to fetch recency exclusion."),
                "database", database_names::ACCOUNTS_DATABASE_NAME,
                "collection", collection_names::MATCHED_USERS_COLLECTION_NAME
        );
        return false;
    }

    return true;
}

bool MongoMatchingDatabase::persistMarriage(
        const Marriage& marriage,
        const std::chrono::milliseconds& matched_on
) {

    std::vector<bsoncxx::document::value> matched_docs;
    for (const auto& [user_id, partner] : marriage) {
        if (partner) {
            matched_docs.emplace_back(
                document{}
                    << matched_users_keys::USER_ID << bsoncxx::types::b_int64{user_id}
                    << matched_users_keys::PARTNER_ID << bsoncxx::types::b_int64{*partner}
                    << matched_users_keys::MATCHED_ON << bsoncxx::types::b_date{matched_on}
                << finalize
            );
        }
    }

    if (matched_docs.empty()) {
        return true;
    }

    try {
        mongocxx::pool::entry mongocxx_pool_entry = mongocxx_client_pool.acquire();
        mongocxx::client& mongo_cpp_client = *mongocxx_pool_entry;

        mongocxx::database accounts_db = mongo_cpp_client[database_names::ACCOUNTS_DATABASE_NAME];
        mongocxx::collection matched_users_collection = accounts_db[collection_names::MATCHED_USERS_COLLECTION_NAME];

        mongocxx::client_session::with_transaction_cb transaction_callback = [&](mongocxx::client_session* callback_session) {
            auto insert_result = matched_users_collection.insert_many(*callback_session, matched_docs);

            if (!insert_result || insert_result->inserted_count() != (int32_t) matched_docs.size()) {
                //throwing aborts the transaction, nothing from this round may be visible
                throw std::runtime_error("Transaction did not insert every matched document.");
            }
        };

        mongocxx::client_session session = mongo_cpp_client.start_session();

        //client_session::with_transaction_cb uses the callback API for mongodb. This means that it will automatically
        // retry on transient transaction errors and unknown commit results.
        session.with_transaction(transaction_callback);
    } catch (const mongocxx::exception& e) {
        storeMongoDBErrorAndException(
                __LINE__, __FILE__,
                std::optional<std::string>(e.what()), std::string("Failed to persist marriage, no matches were stored."),
                "database", database_names::ACCOUNTS_DATABASE_NAME,
                "collection", collection_names::MATCHED_USERS_COLLECTION_NAME,
                "number_documents", (long long) matched_docs.size()
        );
        return false;
    } catch (const std::runtime_error& e) {
        storeMongoDBErrorAndException(
                __LINE__, __FILE__,
                std::optional<std::string>(e.what()), std::string("Transaction aborted, no matches were stored."),
                "number_documents", (long long) matched_docs.size()
        );
        return false;
    }

    return true;
}

bool MongoMatchingDatabase::ensureShadowUser(const UserId shadow_id) {

    try {
        mongocxx::pool::entry mongocxx_pool_entry = mongocxx_client_pool.acquire();
        mongocxx::client& mongo_cpp_client = *mongocxx_pool_entry;

        mongocxx::database accounts_db = mongo_cpp_client[database_names::ACCOUNTS_DATABASE_NAME];
        mongocxx::collection user_accounts_collection = accounts_db[collection_names::USER_ACCOUNTS_COLLECTION_NAME];

        mongocxx::options::update opts;
        opts.upsert(true);

        //the answers of the shadow are rolled at the start of every round and never stored
        user_accounts_collection.update_one(
            document{}
                << "_id" << bsoncxx::types::b_int64{shadow_id}
            << finalize,
            document{}
                << "$set" << open_document
                    << user_account_keys::IS_SHADOW << true
                << close_document
                << "$setOnInsert" << open_document
                    << user_account_keys::PRIMARY_AORB_ID << 0
                    << user_account_keys::ASSOCIATION_SCHEME << (int) AssociationScheme::SEEK_SIMILAR
                    << user_account_keys::ANSWERS << open_array << close_array
                    << user_account_keys::TIME_CREATED << bsoncxx::types::b_date{getCurrentTimestamp()}
                << close_document
            << finalize,
            opts
        );
    } catch (const mongocxx::exception& e) {
        storeMongoDBErrorAndException(
                __LINE__, __FILE__,
                std::optional<std::string>(e.what()), std::string("Failed to upsert shadow user."),
                "shadow_id", shadow_id
        );
        return false;
    }

    return true;
}

void MongoMatchingDatabase::saveMatchRoundResult(const MatchRoundResult& result) {

    try {
        mongocxx::pool::entry mongocxx_pool_entry = mongocxx_client_pool.acquire();
        mongocxx::client& mongo_cpp_client = *mongocxx_pool_entry;

        mongocxx::database statistics_db = mongo_cpp_client[database_names::INFO_FOR_STATISTICS_DATABASE_NAME];
        mongocxx::collection match_round_results_collection = statistics_db[collection_names::MATCH_ROUND_RESULTS_COLLECTION_NAME];

        match_round_results_collection.insert_one(
            document{}
                << match_round_results_keys::ROUND_START_TIME << bsoncxx::types::b_date{result.round_start_time}
                << match_round_results_keys::ROUND_DURATION << bsoncxx::types::b_int64{result.round_duration.count()}
                << match_round_results_keys::STRATEGY_USED << matchingStrategyTypeToString(result.strategy_used)
                << match_round_results_keys::NUMBER_PARTICIPANTS << bsoncxx::types::b_int64{(int64_t) result.number_participants}
                << match_round_results_keys::NUMBER_PAIRS << bsoncxx::types::b_int64{(int64_t) result.number_pairs}
                << match_round_results_keys::NUMBER_UNMATCHED << bsoncxx::types::b_int64{(int64_t) result.number_unmatched}
                << match_round_results_keys::SHADOW_USED << result.shadow_used
                << match_round_results_keys::TOTAL_SCORE << result.total_score
                << match_round_results_keys::SWAPS_APPLIED << result.swaps_applied
                << match_round_results_keys::SUCCESSFUL << result.successful
            << finalize
        );
    } catch (const mongocxx::exception& e) {
        storeMongoDBErrorAndException(
                __LINE__, __FILE__,
                std::optional<std::string>(e.what()), std::string("Failed to store match round result."),
                "database", database_names::INFO_FOR_STATISTICS_DATABASE_NAME,
                "collection", collection_names::MATCH_ROUND_RESULTS_COLLECTION_NAME
        );
    }
}

bool MongoMatchingDatabase::fetchCurrentMatch(
        const UserId user_id,
        const std::chrono::milliseconds& since,
        std::optional<CurrentMatch>& current_match
) {

    current_match.reset();

    const DocumentLocation location{
        database_names::ACCOUNTS_DATABASE_NAME,
        collection_names::MATCHED_USERS_COLLECTION_NAME
    };

    try {
        mongocxx::pool::entry mongocxx_pool_entry = mongocxx_client_pool.acquire();
        mongocxx::client& mongo_cpp_client = *mongocxx_pool_entry;

        mongocxx::database accounts_db = mongo_cpp_client[database_names::ACCOUNTS_DATABASE_NAME];
        mongocxx::collection matched_users_collection = accounts_db[collection_names::MATCHED_USERS_COLLECTION_NAME];

        mongocxx::options::find opts;
        opts.sort(
            document{}
                << matched_users_keys::MATCHED_ON << -1
            << finalize
        );

        const auto matched_doc = matched_users_collection.find_one(
            document{}
                << matched_users_keys::USER_ID << bsoncxx::types::b_int64{user_id}
                << matched_users_keys::MATCHED_ON << open_document
                    << "$gte" << bsoncxx::types::b_date{since}
                << close_document
            << finalize,
            opts
        );

        if (matched_doc) {
            const bsoncxx::document::view matched_view = matched_doc->view();
            current_match = CurrentMatch{
                extractFromBsoncxx_k_int64(matched_view, matched_users_keys::PARTNER_ID, location),
                extractFromBsoncxx_k_date(matched_view, matched_users_keys::MATCHED_ON, location).value
            };
        }
    } catch (const ErrorExtractingFromBsoncxx&) {
        current_match.reset();
        return false;
    } catch (const mongocxx::exception& e) {
        storeMongoDBErrorAndException(
                __LINE__, __FILE__,
                std::optional<std::string>(e.what()), std::string("Failed to fetch current match."),
                "user_id", user_id
        );
        return false;
    }

    return true;
}
