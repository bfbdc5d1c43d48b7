#pragma once

#include <string>

#include <google/protobuf/message.h>

//returns a printable version of the response for error messages
std::string buildDebugStringResponse(const ::google::protobuf::Message* debug_response);
