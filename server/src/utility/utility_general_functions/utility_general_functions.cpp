#include <ctime>
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <optional>

#include <bsoncxx/json.hpp>

#include "utility_general_functions.h"
#include "store_mongoDB_error_and_exception.h"

std::string getDateTimeStringFromTimestamp(const std::chrono::milliseconds& timestamp) {

    const time_t time_object = timestamp.count() / 1000;

    tm date_time{};
    localtime_r(&time_object, &date_time);

    std::ostringstream oss;
    oss << std::put_time(&date_time, "%m/%d/%Y %H:%M:%S");
    return oss.str();
}

std::string convertBsonTypeToString(const bsoncxx::type& type) {
    return bsoncxx::to_string(type);
}

std::string documentViewToJson(const bsoncxx::document::view& view) {

    if (view.data() == nullptr) {
        return "{null}";
    }

    if (view.empty()) {
        return "{ }";
    }

    try {
        return bsoncxx::to_json(view, bsoncxx::ExtendedJsonMode::k_relaxed);
    } catch (const std::exception& e) {
        std::string ret = "{\"Exception\":\"Exception when running documentViewToJson()\n";
        ret += e.what();
        ret += "\"}";
        return ret;
    }
}

std::string makePrettyJson(const bsoncxx::document::view& document_view) {

    const std::string ugly_string = documentViewToJson(document_view);

    //adjust to desired spaces of indentation
    const int INDENT_NUMBER = 4;

    std::string pretty_string;
    pretty_string.reserve(ugly_string.size() * 2);

    int indent = 0;
    bool inside_string = false;

    auto new_line = [&]() {
        pretty_string.push_back('\n');
        pretty_string.append(INDENT_NUMBER * std::max(indent, 0), ' ');
    };

    for (size_t i = 0; i < ugly_string.size(); ++i) {
        const char c = ugly_string[i];

        if (inside_string) {
            pretty_string.push_back(c);
            if (c == '\\' && i + 1 < ugly_string.size()) {
                pretty_string.push_back(ugly_string[++i]);
            } else if (c == '"') {
                inside_string = false;
            }
            continue;
        }

        switch (c) {
            case '"':
                inside_string = true;
                pretty_string.push_back(c);
                break;
            case '{':
            case '[':
                pretty_string.push_back(c);
                indent++;
                new_line();
                break;
            case '}':
            case ']':
                indent--;
                new_line();
                pretty_string.push_back(c);
                break;
            case ',':
                pretty_string.push_back(c);
                new_line();
                break;
            case ' ':
                //whitespace outside of strings is regenerated
                if (!pretty_string.empty() && pretty_string.back() == ':') {
                    pretty_string.push_back(' ');
                }
                break;
            default:
                pretty_string.push_back(c);
                break;
        }
    }

    return pretty_string;
}

void logElementError(
        const int line_number,
        const std::string& file_name,
        const bsoncxx::document::element& error_element,
        const bsoncxx::document::view& document_view,
        const bsoncxx::type& type,
        const std::string& key,
        const std::string& database_name,
        const std::string& collection_name
) {

    std::string error_string;

    if (error_element) { //element exists but the type does not match
        error_string = "the element '" + key + "' inside the '"
                       + database_name + "' '" + collection_name + "' document is not type '"
                       + convertBsonTypeToString(type) + "', it is type '"
                       + convertBsonTypeToString(error_element.type()) + "'";
    } else { //element does not exist
        error_string = "the element '" + key + "' does not exist in the '"
                       + database_name + "' '" + collection_name + "' document";
    }

    storeMongoDBErrorAndException(
            line_number, file_name,
            std::optional<std::string>(), error_string,
            "failedDocument", document_view
    );
}
