#include "utils/file_source.hpp"
#include "crypto/integrity_hasher.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <unordered_map>
#include <boost/log/trivial.hpp>

namespace sft {
namespace utils {

//==============================================
// LOADING
//==============================================

transfer::PendingFile load_pending_file(const std::filesystem::path& path, std::size_t max_size) {
  BOOST_LOG_TRIVIAL(info) << "File source: Loading " << path.string();

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    BOOST_LOG_TRIVIAL(error) << "File source: Not a regular file: " << path.string();
    throw FileSourceError("Not a regular file: " + path.string());
  }

  const std::uintmax_t file_size = std::filesystem::file_size(path, ec);
  if (ec) {
    throw FileSourceError("Cannot stat " + path.string() + ": " + ec.message());
  }
  if (file_size > max_size) {
    BOOST_LOG_TRIVIAL(error) << "File source: " << path.string() << " is " << file_size
                             << " bytes, limit is " << max_size;
    throw FileSourceError("File too large: " + path.string());
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw FileSourceError("Failed to open file: " + path.string());
  }

  transfer::PendingFile pending;
  pending.name = path.filename().string();
  pending.mime_type = guess_mime_type(path);
  pending.contents.resize(static_cast<std::size_t>(file_size));

  if (file_size > 0 &&
      !file.read(reinterpret_cast<char*>(pending.contents.data()), static_cast<std::streamsize>(file_size))) {
    throw FileSourceError("Failed to read file: " + path.string());
  }

  BOOST_LOG_TRIVIAL(info) << "File source: Loaded " << pending.contents.size() << " bytes as "
                          << pending.mime_type;
  return pending;
}

std::string guess_mime_type(const std::filesystem::path& path) {
  static const std::unordered_map<std::string, std::string> mime_types = {
    {".txt", "text/plain"},
    {".md", "text/markdown"},
    {".csv", "text/csv"},
    {".html", "text/html"},
    {".htm", "text/html"},
    {".json", "application/json"},
    {".xml", "application/xml"},
    {".pdf", "application/pdf"},
    {".zip", "application/zip"},
    {".gz", "application/gzip"},
    {".png", "image/png"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif", "image/gif"},
    {".svg", "image/svg+xml"},
    {".mp3", "audio/mpeg"},
    {".mp4", "video/mp4"}
  };

  std::string extension = path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  auto it = mime_types.find(extension);
  return it != mime_types.end() ? it->second : "application/octet-stream";
}

//==============================================
// SAVING
//==============================================

std::string sanitize_file_name(const std::string& name) {
  // Peers on other platforms may use either separator
  std::string normalized = name;
  std::replace(normalized.begin(), normalized.end(), '\\', '/');

  const std::string base = std::filesystem::path(normalized).filename().string();
  if (base.empty() || base == "." || base == "..") {
    BOOST_LOG_TRIVIAL(error) << "File source: Rejecting file name: '" << name << "'";
    throw FileSourceError("Invalid file name: '" + name + "'");
  }
  return base;
}

std::filesystem::path save_received_file(const transfer::ReceivedFile& file,
                                         const std::filesystem::path& directory) {
  const std::filesystem::path target = directory / sanitize_file_name(file.name);
  BOOST_LOG_TRIVIAL(info) << "File source: Saving " << file.contents.size() << " bytes to " << target.string();

  std::error_code ec;
  std::filesystem::create_directories(directory, ec);
  if (ec) {
    throw FileSourceError("Failed to create directory " + directory.string() + ": " + ec.message());
  }

  {
    std::ofstream output(target, std::ios::binary | std::ios::trunc);
    if (!output) {
      throw FileSourceError("Failed to create file: " + target.string());
    }
    if (!file.contents.empty() &&
        !output.write(reinterpret_cast<const char*>(file.contents.data()),
                      static_cast<std::streamsize>(file.contents.size()))) {
      throw FileSourceError("Failed to write file: " + target.string());
    }
  }

  // Re-read what landed on disk and log its fingerprint
  std::ifstream written(target, std::ios::binary);
  if (!written) {
    throw FileSourceError("Failed to reopen file: " + target.string());
  }
  BOOST_LOG_TRIVIAL(info) << "File source: Saved " << target.filename().string() << " sha256="
                          << crypto::IntegrityHasher::to_hex(crypto::IntegrityHasher::digest(written));
  return target;
}

} // namespace utils
} // namespace sft
