#pragma once

#include <string>

namespace database_names {

#ifdef CM_TESTING
    inline const std::string ACCOUNTS_DATABASE_NAME = "TestingClashAccounts";
#else
    inline const std::string ACCOUNTS_DATABASE_NAME = "ClashAccounts";
#endif

#ifdef CM_TESTING
    inline const std::string ERRORS_DATABASE_NAME = "TestingClashERRORS";
#else
    inline const std::string ERRORS_DATABASE_NAME = "ClashERRORS";
#endif

#ifdef CM_TESTING
    inline const std::string INFO_FOR_STATISTICS_DATABASE_NAME = "TestingClashInfoForStatistics";
#else
    inline const std::string INFO_FOR_STATISTICS_DATABASE_NAME = "ClashInfoForStatistics";
#endif

}
