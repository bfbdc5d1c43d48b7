#pragma once

#include <string>
#include <utility>

#include <bsoncxx/types.hpp>
#include <bsoncxx/document/view.hpp>
#include <bsoncxx/array/view.hpp>
#include <bsoncxx/array/element.hpp>

struct ErrorExtractingFromBsoncxx : public std::exception {

    explicit ErrorExtractingFromBsoncxx(std::string error_string) : error_string(std::move(error_string)) {}

    [[nodiscard]] const char* what() const noexcept override {
        return error_string.c_str();
    }

private:
    std::string error_string;
};

//Where the document being extracted from was stored, only used when storing errors.
struct DocumentLocation {
    const std::string& database_name;
    const std::string& collection_name;
};

//Each function returns the value stored under key. If the key does not exist or the stored value has a
// different type the error is stored and ErrorExtractingFromBsoncxx is thrown.

double extractFromBsoncxx_k_double(
        const bsoncxx::document::view& doc_view, const std::string& key, const DocumentLocation& location
);

std::string extractFromBsoncxx_k_utf8(
        const bsoncxx::document::view& doc_view, const std::string& key, const DocumentLocation& location
);

bsoncxx::array::view extractFromBsoncxx_k_array(
        const bsoncxx::document::view& doc_view, const std::string& key, const DocumentLocation& location
);

bsoncxx::types::b_date extractFromBsoncxx_k_date(
        const bsoncxx::document::view& doc_view, const std::string& key, const DocumentLocation& location
);

int extractFromBsoncxx_k_int32(
        const bsoncxx::document::view& doc_view, const std::string& key, const DocumentLocation& location
);

long long extractFromBsoncxx_k_int64(
        const bsoncxx::document::view& doc_view, const std::string& key, const DocumentLocation& location
);

bsoncxx::document::view extractFromBsoncxxArrayElement_k_document(
        const bsoncxx::array::element& arr_element, const DocumentLocation& location
);
