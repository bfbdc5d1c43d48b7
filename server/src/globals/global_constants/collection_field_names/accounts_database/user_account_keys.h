#pragma once

#include <string>

//keys for (ACCOUNTS_DATABASE_NAME) (USER_ACCOUNTS_COLLECTION_NAME)
namespace user_account_keys {

    //NOTE: _id is the int64 user id used everywhere inside matching
    inline const std::string PRIMARY_AORB_ID = "pAi"; //int32; the question used to split users into the two sides of a round
    inline const std::string ASSOCIATION_SCHEME = "aSs"; //int32; follows AssociationScheme inside matching_objects.h
    inline const std::string ANSWERS = "aNs"; //array of documents; one document for each question the user has seen, documents use the keys inside answers namespace below
    inline const std::string IS_SHADOW = "iSh"; //bool or does not exist; true only for the synthetic matching participant, it is never selected by fetchSubmissions()
    inline const std::string TIME_CREATED = "dCt"; //mongoDB Date

    namespace answers {
        inline const std::string AORB_ID = "aI"; //int32; _id of the question inside AORB_QUESTIONS_COLLECTION_NAME
        inline const std::string ANSWER = "aN"; //int32; follows AorbAnswer inside matching_objects.h
        inline const std::string ANSWERED_ON = "aO"; //mongoDB Date
    }

}
