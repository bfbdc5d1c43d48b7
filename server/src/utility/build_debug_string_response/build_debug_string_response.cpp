#include "build_debug_string_response.h"
#include "general_values.h"

std::string buildDebugStringResponse(const ::google::protobuf::Message* debug_response) {
    if (debug_response == nullptr) {
        return "Response pointer not set.";
    }

    const size_t debug_response_size = debug_response->ByteSizeLong();

    if (debug_response_size == 0) {
        return "Response debug string is empty.";
    } else if (debug_response_size >= general_values::MAXIMUM_NUMBER_ALLOWED_BYTES_ERROR_MESSAGE) {
        return "Response debug string too long.";
    }

    return debug_response->DebugString();
}
