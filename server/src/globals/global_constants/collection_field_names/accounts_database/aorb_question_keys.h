#pragma once

#include <string>

//keys for (ACCOUNTS_DATABASE_NAME) (AORB_QUESTIONS_COLLECTION_NAME)
namespace aorb_question_keys {

    //NOTE: _id is the int32 question id
    inline const std::string CONTEXT = "cTx"; //string; text shown above the two options
    inline const std::string OPTION_A = "oPa"; //string
    inline const std::string OPTION_B = "oPb"; //string
    inline const std::string MEAN = "mEa"; //double; fraction of answers that chose OPTION_B, the server only reads this value

}
