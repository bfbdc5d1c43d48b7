#pragma once

#include <string>
#include <cstdlib>

inline const std::string ENVIRONMENT_VARIABLE_FAILED = "ENVIRONMENT_VARIABLE_FAILED";

//returns ENVIRONMENT_VARIABLE_FAILED if the variable is not set
inline std::string get_environment_variable(const char* name) {
    const char* value = std::getenv(name);
    return value == nullptr ? ENVIRONMENT_VARIABLE_FAILED : std::string(value);
}

//returns default_value if the variable is not set or is empty
inline std::string get_environment_variable_or_default(const char* name, const std::string& default_value) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return default_value;
    }
    return {value};
}
