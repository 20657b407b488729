#ifndef SFT_UTILS_FILE_SOURCE_HPP
#define SFT_UTILS_FILE_SOURCE_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include "transfer/transfer_types.hpp"

namespace sft {
namespace utils {

class FileSourceError : public std::runtime_error {
public:
  explicit FileSourceError(const std::string& message)
    : std::runtime_error("File source error: " + message) {}
};

// Reads a regular file into memory, name is the final path component
transfer::PendingFile load_pending_file(const std::filesystem::path& path,
                                        std::size_t max_size = crypto::KeyedCipher::DEFAULT_MAX_PLAINTEXT_SIZE);

// Extension based, falls back to application/octet-stream
std::string guess_mime_type(const std::filesystem::path& path);

// Reduces a peer supplied name to a bare file name, throws on empty, "." or ".."
std::string sanitize_file_name(const std::string& name);

// Writes the file into directory (created if missing) and returns the full path
std::filesystem::path save_received_file(const transfer::ReceivedFile& file,
                                         const std::filesystem::path& directory);

} // namespace utils
} // namespace sft

#endif // SFT_UTILS_FILE_SOURCE_HPP
