#pragma once

#include <iostream>
#include <cstdlib>

//Only used for startup preconditions (environment variables, mandatory documents). Anything that can go
// wrong while the server is running must be stored with storeMongoDBErrorAndException() instead.
#define assert_msg(condition, message)\
(!(condition)) ?\
(std::cerr << "Startup check failed: (" << #condition << ")"\
<< "\nFunction: " << __FUNCTION__\
<< "\nFile: " << __FILE__ << ':' << __LINE__\
<< '\n' << (message) << '\n', std::abort(), 0) : 1
