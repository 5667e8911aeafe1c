#include "tar_archive.h"
#include <cstdio>
#include <cstring>
#include <stdexcept>

namespace contestrun {

namespace {

constexpr size_t BLOCK_SIZE = 512;
constexpr size_t NAME_FIELD = 100;

// Header field offsets (POSIX.1-1988 ustar)
constexpr size_t OFF_NAME = 0;
constexpr size_t OFF_MODE = 100;
constexpr size_t OFF_UID = 108;
constexpr size_t OFF_GID = 116;
constexpr size_t OFF_SIZE = 124;
constexpr size_t OFF_MTIME = 136;
constexpr size_t OFF_CHKSUM = 148;
constexpr size_t OFF_TYPEFLAG = 156;
constexpr size_t OFF_MAGIC = 257;
constexpr size_t OFF_VERSION = 263;

// Zero-padded octal, NUL-terminated, filling width bytes
void write_octal(char* field, size_t width, unsigned long long value) {
    std::snprintf(field, width, "%0*llo", static_cast<int>(width - 1), value);
}

} // namespace

std::string make_single_file_tar(const std::string& name,
                                 const std::string& content,
                                 mode_t mode,
                                 std::time_t mtime) {
    if (name.empty() || name.size() >= NAME_FIELD) {
        throw std::invalid_argument("tar entry name must be 1-99 bytes: " + name);
    }

    char header[BLOCK_SIZE];
    std::memset(header, 0, sizeof(header));

    std::memcpy(header + OFF_NAME, name.data(), name.size());
    write_octal(header + OFF_MODE, 8, mode & 07777);
    write_octal(header + OFF_UID, 8, 0);
    write_octal(header + OFF_GID, 8, 0);
    write_octal(header + OFF_SIZE, 12, content.size());
    write_octal(header + OFF_MTIME, 12, static_cast<unsigned long long>(mtime));
    header[OFF_TYPEFLAG] = '0';
    std::memcpy(header + OFF_MAGIC, "ustar", 6);
    std::memcpy(header + OFF_VERSION, "00", 2);

    // Checksum is computed with its own field filled with spaces
    std::memset(header + OFF_CHKSUM, ' ', 8);
    unsigned int checksum = 0;
    for (size_t i = 0; i < BLOCK_SIZE; ++i) {
        checksum += static_cast<unsigned char>(header[i]);
    }
    std::snprintf(header + OFF_CHKSUM, 7, "%06o", checksum);
    header[OFF_CHKSUM + 6] = '\0';
    header[OFF_CHKSUM + 7] = ' ';

    std::string archive(header, BLOCK_SIZE);
    archive += content;

    size_t padding = (BLOCK_SIZE - content.size() % BLOCK_SIZE) % BLOCK_SIZE;
    archive.append(padding, '\0');

    // End-of-archive marker: two zero blocks
    archive.append(2 * BLOCK_SIZE, '\0');
    return archive;
}

} // namespace contestrun
