#pragma once

#include <string>

//keys for (ACCOUNTS_DATABASE_NAME) (MATCHED_USERS_COLLECTION_NAME)
//NOTE: each match is stored as two documents (user, partner) and (partner, user) sharing a MATCHED_ON value
namespace matched_users_keys {

    inline const std::string USER_ID = "uId"; //int64
    inline const std::string PARTNER_ID = "pId"; //int64; may be the shadow user id
    inline const std::string MATCHED_ON = "mOn"; //mongoDB Date; start time of the round that created the match

}
