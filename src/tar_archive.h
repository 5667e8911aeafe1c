#pragma once

#include <ctime>
#include <string>
#include <sys/types.h>

namespace contestrun {

// Build an in-memory POSIX ustar archive holding one regular file. This is
// the body Docker's archive endpoint expects when injecting source.
// Throws std::invalid_argument if the name does not fit a ustar header.
std::string make_single_file_tar(const std::string& name,
                                 const std::string& content,
                                 mode_t mode = 0644,
                                 std::time_t mtime = 0);

} // namespace contestrun
