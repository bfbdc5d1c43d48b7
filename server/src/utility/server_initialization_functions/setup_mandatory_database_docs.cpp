#include <string>

#include "server_initialization_functions.h"
#include "assert_macro.h"

void setupMandatoryDatabaseDocs(
        MatchingDatabaseInterface& database,
        const UserId shadow_user_id
) {
    //the shadow must exist before any round runs
    const bool shadow_user_exists = database.ensureShadowUser(shadow_user_id);

    assert_msg(
            shadow_user_exists,
            "Failed to create the shadow user " + std::to_string(shadow_user_id) + ", the error was stored."
    );
}
