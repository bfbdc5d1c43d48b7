#include <charconv>

#include "matching_objects.h"
#include "general_values.h"
#include "get_environment_variable.h"

bool applyEnvironmentOverrides(
        MatchingConfiguration& config,
        std::string& error_message
) {

    MatchingConfiguration updated_config = config;

    const std::string strategy_name = get_environment_variable(
            general_values::MATCHING_STRATEGY_ENVIRONMENT_VARIABLE.c_str()
    );

    if (strategy_name != ENVIRONMENT_VARIABLE_FAILED) {
        const std::optional<MatchingStrategyType> strategy_type = matchingStrategyTypeFromString(strategy_name);
        if (!strategy_type) {
            error_message = general_values::MATCHING_STRATEGY_ENVIRONMENT_VARIABLE + " is set to '" + strategy_name
                            + "', expected one of 'stable', 'local_search' or 'automatic'.";
            return false;
        }
        updated_config.strategy_type = *strategy_type;
    }

    const std::string interval_string = get_environment_variable(
            general_values::MATCHING_INTERVAL_ENVIRONMENT_VARIABLE.c_str()
    );

    if (interval_string != ENVIRONMENT_VARIABLE_FAILED) {
        long long interval_seconds = 0;
        const char* end = interval_string.data() + interval_string.size();
        const auto [ptr, ec] = std::from_chars(interval_string.data(), end, interval_seconds);

        if (ec != std::errc() || ptr != end || interval_seconds <= 0) {
            error_message = general_values::MATCHING_INTERVAL_ENVIRONMENT_VARIABLE + " is set to '" + interval_string
                            + "', expected a positive number of seconds.";
            return false;
        }
        updated_config.matching_interval = std::chrono::seconds{interval_seconds};
    }

    config = updated_config;
    return true;
}
