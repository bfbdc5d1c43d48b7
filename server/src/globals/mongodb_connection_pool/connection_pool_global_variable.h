#pragma once

#include <memory>

#include <mongocxx/pool.hpp>
#include <mongocxx/uri.hpp>

#include "mongodb_values.h"

class MongoClientPoolWrapper {
public:
    mongocxx::pool::entry acquire() {
        return mongocxx_client_pool->acquire();
    }

    //The pool cannot be created until mongocxx::instance has been started, so
    // main() (or the test entry point) is expected to call init() once afterwards.
    void init() {
        mongocxx_client_pool = std::make_unique<mongocxx::pool>(mongocxx::uri{mongodb_values::URI_STRING});
    }

private:
    std::unique_ptr<mongocxx::pool> mongocxx_client_pool = nullptr;
};

inline MongoClientPoolWrapper mongocxx_client_pool;
