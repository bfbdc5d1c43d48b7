#include <fstream>

#include "store_mongoDB_error_and_exception.h"
#include "file_io_mutex_lock.h"
#include "general_values.h"

void logErrorToFile(const std::string& error_message) {

    const std::string current_timestamp_string = getDateTimeStringFromTimestamp(getCurrentTimestamp());

    //I/O is not thread safe
    std::scoped_lock<std::mutex> lock(mutex_file_io_lock);
    std::ofstream file_output_stream(general_values::ERROR_LOG_OUTPUT, std::ios_base::app);

    if (file_output_stream) {
        file_output_stream << "\n[" << current_timestamp_string << "] " << error_message;
    } else {
        std::cout << "Failed to open file " << general_values::ERROR_LOG_OUTPUT << '\n';
    }
}
