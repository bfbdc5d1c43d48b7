#include <optional>

#include "extract_data_from_bsoncxx.h"
#include "utility_general_functions.h"
#include "store_mongoDB_error_and_exception.h"

namespace {

    //returns the element if it exists with the expected type, otherwise stores the error and throws
    bsoncxx::document::element extractElementOfType(
            const bsoncxx::document::view& doc_view,
            const std::string& key,
            const bsoncxx::type& type,
            const DocumentLocation& location
    ) {
        auto element = doc_view[key];
        if (element && element.type() == type) {
            return element;
        }

        logElementError(__LINE__, __FILE__, element,
                        doc_view, type, key,
                        location.database_name, location.collection_name);

        throw ErrorExtractingFromBsoncxx("Error extracting value " + key + " from " + location.collection_name + ".");
    }

}

double extractFromBsoncxx_k_double(
        const bsoncxx::document::view& doc_view, const std::string& key, const DocumentLocation& location
) {
    return extractElementOfType(doc_view, key, bsoncxx::type::k_double, location).get_double().value;
}

std::string extractFromBsoncxx_k_utf8(
        const bsoncxx::document::view& doc_view, const std::string& key, const DocumentLocation& location
) {
    return std::string{extractElementOfType(doc_view, key, bsoncxx::type::k_utf8, location).get_string().value};
}

bsoncxx::array::view extractFromBsoncxx_k_array(
        const bsoncxx::document::view& doc_view, const std::string& key, const DocumentLocation& location
) {
    return extractElementOfType(doc_view, key, bsoncxx::type::k_array, location).get_array().value;
}

bsoncxx::types::b_date extractFromBsoncxx_k_date(
        const bsoncxx::document::view& doc_view, const std::string& key, const DocumentLocation& location
) {
    return extractElementOfType(doc_view, key, bsoncxx::type::k_date, location).get_date();
}

int extractFromBsoncxx_k_int32(
        const bsoncxx::document::view& doc_view, const std::string& key, const DocumentLocation& location
) {
    return extractElementOfType(doc_view, key, bsoncxx::type::k_int32, location).get_int32().value;
}

long long extractFromBsoncxx_k_int64(
        const bsoncxx::document::view& doc_view, const std::string& key, const DocumentLocation& location
) {
    return extractElementOfType(doc_view, key, bsoncxx::type::k_int64, location).get_int64().value;
}

bsoncxx::document::view extractFromBsoncxxArrayElement_k_document(
        const bsoncxx::array::element& arr_element, const DocumentLocation& location
) {
    if (arr_element && arr_element.type() == bsoncxx::type::k_document) {
        return arr_element.get_document().value;
    }

    const std::string error_string = "an array element inside the '" + location.database_name + "' '"
                                     + location.collection_name + "' collection is not type document, it is type '"
                                     + (arr_element ? convertBsonTypeToString(arr_element.type()) : "does not exist")
                                     + "'";

    storeMongoDBErrorAndException(
            __LINE__, __FILE__,
            std::optional<std::string>(), error_string
    );

    throw ErrorExtractingFromBsoncxx("Error extracting document from array inside " + location.collection_name + ".");
}
