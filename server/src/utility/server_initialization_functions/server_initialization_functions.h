#pragma once

#include "matching_objects.h"
#include "matching_database_interface.h"

//runs create_index on all indexing to be done
void setupMongoDBIndexing();

//set up any mandatory documents in the database, the server will not start if this fails
void setupMandatoryDatabaseDocs(
        MatchingDatabaseInterface& database,
        UserId shadow_user_id
);
