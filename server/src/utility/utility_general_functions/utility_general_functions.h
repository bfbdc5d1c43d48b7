#pragma once

#include <chrono>
#include <string>

#include <bsoncxx/types.hpp>
#include <bsoncxx/document/view.hpp>
#include <bsoncxx/document/element.hpp>

inline std::chrono::milliseconds getCurrentTimestamp() {
    //NOTE: C++ 20 gives a guarantee that time_since_epoch is relative to the UNIX epoch.
    return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch());
}

//formatted as mm/dd/yyyy hh:mm:ss in local time
std::string getDateTimeStringFromTimestamp(const std::chrono::milliseconds& timestamp);

std::string convertBsonTypeToString(const bsoncxx::type& type);

//relaxed extended json on a single line, never throws
std::string documentViewToJson(const bsoncxx::document::view& view);

//multi line indented json, used when printing and storing errors
std::string makePrettyJson(const bsoncxx::document::view& document_view);

//stores an error for an element that either does not exist or is not of the expected type
void logElementError(
        int line_number,
        const std::string& file_name,
        const bsoncxx::document::element& error_element,
        const bsoncxx::document::view& document_view,
        const bsoncxx::type& type,
        const std::string& key,
        const std::string& database_name,
        const std::string& collection_name
);
