#pragma once
#include <stdexcept>
#include <string>
#include <system_error>

namespace qstats {

// Input path missing, not a regular file, or unreadable.
struct file_access_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Results file could not be opened for append or written.
struct output_write_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Text for an errno captured right after a failed open/write.
inline std::string errno_reason(int err) {
    return err ? std::error_code(err, std::generic_category()).message() : std::string("unknown error");
}

}
