#pragma once

#include <mutex>

//guards every write to general_values::ERROR_LOG_OUTPUT
inline std::mutex mutex_file_io_lock;
