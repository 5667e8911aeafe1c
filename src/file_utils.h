#pragma once

#include <string>
#include <sys/types.h>

namespace contestrun {

class FileUtils {
public:
    // Hash utilities (worker fingerprints)
    static std::string sha256_string(const std::string& data);
    static std::string bytes_to_hex(const unsigned char* data, size_t len);

    // Write file content with the given permission bits, replacing any
    // existing file. Returns false on any I/O error.
    static bool write_file(const std::string& filepath, const std::string& content, mode_t mode);

    // Read whole file; returns false if it cannot be opened
    static bool read_file(const std::string& filepath, std::string& content);

    static bool exists(const std::string& filepath);
};

} // namespace contestrun
