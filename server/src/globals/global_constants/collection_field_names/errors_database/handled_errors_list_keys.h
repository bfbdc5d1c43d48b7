#pragma once

#include <string>

//mongoDB (ERRORS_DATABASE_NAME) (HANDLED_ERRORS_LIST_COLLECTION_NAME)
//NOTE: errors matching a document here are no longer stored
namespace handled_errors_list_keys {
    inline const std::string ERROR_ORIGIN = "eO"; //int32; follows ErrorOriginType enum inside ErrorOriginEnum.proto
    inline const std::string VERSION_NUMBER = "vN"; //int32
    inline const std::string FILE_NAME = "fN"; //string
    inline const std::string LINE_NUMBER = "lN"; //int32
    inline const std::string DESCRIPTION = "dE"; //string or does not exist; short description of why the error no longer matters
}
