#pragma once

#include <string>

namespace collection_names {

    //mongoDB (ACCOUNTS_DATABASE_NAME) collections
    inline const std::string USER_ACCOUNTS_COLLECTION_NAME = "user_accounts";
    inline const std::string AORB_QUESTIONS_COLLECTION_NAME = "aorb_questions"; //question bank, means are maintained outside the server
    inline const std::string MATCHED_USERS_COLLECTION_NAME = "matched_users"; //two documents per match, never updated

    //mongoDB (ERRORS_DATABASE_NAME) collections
    inline const std::string FRESH_ERRORS_COLLECTION_NAME = "FreshErrors";
    inline const std::string HANDLED_ERRORS_LIST_COLLECTION_NAME = "HandledErrorsList";

    //mongoDB (INFO_FOR_STATISTICS_DATABASE_NAME) collections
    inline const std::string MATCH_ROUND_RESULTS_COLLECTION_NAME = "MatchRoundResults"; //one document for every round that was started

}
