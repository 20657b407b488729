#ifndef SFT_NETWORK_CODEC_HPP
#define SFT_NETWORK_CODEC_HPP

#include <array>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>
#include <boost/endian/conversion.hpp>
#include "network/message.hpp"
#include "network/network_error.hpp"

namespace sft {
namespace network {

// Binary wire format, all integers big-endian:
//   magic "SFT1" | u16 type length | type
//   file-incoming only: u32 name | u32 mime | u64 size | u16 key | u16 hash | u64 data
class Codec {
public:
  static constexpr std::array<char, 4> MAGIC = {'S', 'F', 'T', '1'};
  static constexpr std::size_t MAX_TEXT_FIELD = 64 * 1024;
  // Allocation step when the stream cannot report how many bytes remain
  static constexpr std::size_t READ_CHUNK_SIZE = 64 * 1024;
  static constexpr uint64_t DEFAULT_MAX_FRAME_SIZE = uint64_t{2} * 1024 * 1024 * 1024 + 64 * 1024;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Codec(uint64_t max_frame_size = DEFAULT_MAX_FRAME_SIZE);


  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Serializes a message to an output stream, returns bytes written
  std::size_t serialize(const Message& message, std::ostream& output) const;
  // Throws ProtocolError on anything that is not a well-formed frame
  Message deserialize(std::istream& input) const;

  std::vector<uint8_t> encode(const Message& message) const;
  Message decode(const std::vector<uint8_t>& frame) const;


  // ---- GETTERS ----
  uint64_t max_frame_size() const { return max_frame_size_; }

private:
  // ---- PARAMETERS ----
  uint64_t max_frame_size_;


  // ---- STREAM OPERATIONS ----
  static void write_bytes(std::ostream& output, const void* data, std::size_t size);
  static void read_bytes(std::istream& input, void* data, std::size_t size);

  template <typename T>
  static void write_integer(std::ostream& output, T value) {
    T network_value = boost::endian::native_to_big(value);
    write_bytes(output, &network_value, sizeof(network_value));
  }

  template <typename T>
  static T read_integer(std::istream& input) {
    T network_value;
    read_bytes(input, &network_value, sizeof(network_value));
    return boost::endian::big_to_native(network_value);
  }

  // Length-prefixed fields, returns bytes written including the prefix
  template <typename LengthT>
  static std::size_t write_field(std::ostream& output, const void* data, std::size_t size);
  template <typename LengthT>
  std::string read_text(std::istream& input, const char* field) const;
  // Reads exactly length bytes, never allocating more than the input holds
  template <typename Container>
  static void read_sized(std::istream& input, Container& output, uint64_t length);

  std::size_t write_file_data(std::ostream& output, const FileData& file_data) const;
  FileData read_file_data(std::istream& input) const;
};

} // namespace network
} // namespace sft

#endif // SFT_NETWORK_CODEC_HPP
