#pragma once

#include <string>

#ifdef _RELEASE
#include "general_values.h"
#endif

namespace mongodb_values {

#ifdef _RELEASE
    inline const std::string URI_STRING = general_values::MONGODB_URI_STRING;
#else
    //Local replica set, transactions require a replica set.
    inline const std::string URI_STRING =
            "mongodb://localhost:27017,localhost:27018,localhost:27019/?replicaSet=testReplicaSet&maxPoolSize=200&retryWrites=true&w=majority";
#endif

}
