#include "file_utils.h"
#include <openssl/sha.h>
#include <sys/stat.h>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace contestrun {

std::string FileUtils::bytes_to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string FileUtils::sha256_string(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);
    return bytes_to_hex(hash, SHA256_DIGEST_LENGTH);
}

bool FileUtils::write_file(const std::string& filepath, const std::string& content, mode_t mode) {
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::path parent = fs::path(filepath).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            return false;
        }
    }

    {
        std::ofstream out(filepath, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out.write(content.data(), content.size());
        if (!out) {
            return false;
        }
    }

    return chmod(filepath.c_str(), mode) == 0;
}

bool FileUtils::read_file(const std::string& filepath, std::string& content) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    content.assign((std::istreambuf_iterator<char>(file)),
                   std::istreambuf_iterator<char>());
    return true;
}

bool FileUtils::exists(const std::string& filepath) {
    std::error_code ec;
    return std::filesystem::exists(filepath, ec);
}

} // namespace contestrun
