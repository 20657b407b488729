#include "network/codec.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <limits>
#include <sstream>
#include <streambuf>

namespace sft {
namespace network {

namespace {

// Read-only stream buffer over an existing frame, avoids copying the payload
class FrameBuffer : public std::streambuf {
public:
  explicit FrameBuffer(const std::vector<uint8_t>& frame) {
    char* begin = const_cast<char*>(reinterpret_cast<const char*>(frame.data()));
    setg(begin, begin, begin + frame.size());
  }
};

} // namespace

Codec::Codec(uint64_t max_frame_size)
  : max_frame_size_(max_frame_size) {
  BOOST_LOG_TRIVIAL(debug) << "Codec: Initializing Codec with max frame size: " << max_frame_size_;
}

//==============================================
// SERIALIZATION
//==============================================

std::size_t Codec::serialize(const Message& message, std::ostream& output) const {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid output stream state";
    throw std::runtime_error("Codec: Invalid output stream");
  }

  const std::string type = message_type(message);
  if (type.size() > std::numeric_limits<uint16_t>::max()) {
    throw ProtocolError("Message type tag too long");
  }

  std::size_t total_bytes = 0;

  BOOST_LOG_TRIVIAL(debug) << "Codec: Serializing message of type: " << type;

  write_bytes(output, MAGIC.data(), MAGIC.size());
  total_bytes += MAGIC.size();

  total_bytes += write_field<uint16_t>(output, type.data(), type.size());

  if (const auto* incoming = std::get_if<FileIncoming>(&message)) {
    total_bytes += write_file_data(output, incoming->file_data);
  }

  output.flush();
  BOOST_LOG_TRIVIAL(debug) << "Codec: Serialization complete. Total bytes written: " << total_bytes;
  return total_bytes;
}

std::size_t Codec::write_file_data(std::ostream& output, const FileData& file_data) const {
  if (file_data.name.size() > MAX_TEXT_FIELD || file_data.mime_type.size() > MAX_TEXT_FIELD) {
    throw ProtocolError("File name or MIME type too long");
  }
  if (file_data.key.size() > std::numeric_limits<uint16_t>::max()) {
    throw ProtocolError("Key field too long");
  }
  if (file_data.data.size() > max_frame_size_) {
    throw ProtocolError("Ciphertext exceeds maximum frame size");
  }

  std::size_t total_bytes = 0;
  total_bytes += write_field<uint32_t>(output, file_data.name.data(), file_data.name.size());
  total_bytes += write_field<uint32_t>(output, file_data.mime_type.data(), file_data.mime_type.size());

  write_integer<uint64_t>(output, file_data.size);
  total_bytes += sizeof(uint64_t);

  total_bytes += write_field<uint16_t>(output, file_data.key.data(), file_data.key.size());
  total_bytes += write_field<uint16_t>(output, file_data.hash.data(), file_data.hash.size());
  total_bytes += write_field<uint64_t>(output, file_data.data.data(), file_data.data.size());

  BOOST_LOG_TRIVIAL(debug) << "Codec: Wrote file data for " << file_data.name
                           << " (" << file_data.data.size() << " bytes of ciphertext)";
  return total_bytes;
}

std::vector<uint8_t> Codec::encode(const Message& message) const {
  std::ostringstream output(std::ios::binary);
  serialize(message, output);
  const std::string bytes = output.str();
  return std::vector<uint8_t>(bytes.begin(), bytes.end());
}

//==============================================
// DESERIALIZATION
//==============================================

Message Codec::deserialize(std::istream& input) const {
  if (!input.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid input stream state";
    throw ProtocolError("Invalid input stream");
  }

  std::array<char, MAGIC.size()> magic;
  read_bytes(input, magic.data(), magic.size());
  if (magic != MAGIC) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Frame does not start with protocol magic";
    throw ProtocolError("Bad frame magic");
  }

  std::string type = read_text<uint16_t>(input, "type");
  BOOST_LOG_TRIVIAL(debug) << "Codec: Read message type: " << type;

  if (type != FILE_INCOMING_TYPE) {
    // Payloads of other message types are not ours to interpret
    input.ignore(std::numeric_limits<std::streamsize>::max());
    return Unrecognized{std::move(type)};
  }

  FileIncoming incoming{read_file_data(input)};

  if (input.peek() != std::char_traits<char>::eof()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Trailing bytes after file data";
    throw ProtocolError("Trailing bytes after file data");
  }

  BOOST_LOG_TRIVIAL(debug) << "Codec: Deserialized file data for " << incoming.file_data.name;
  return incoming;
}

FileData Codec::read_file_data(std::istream& input) const {
  FileData file_data;
  file_data.name = read_text<uint32_t>(input, "name");
  file_data.mime_type = read_text<uint32_t>(input, "mime type");
  file_data.size = read_integer<uint64_t>(input);

  auto key_length = read_integer<uint16_t>(input);
  read_sized(input, file_data.key, key_length);

  auto hash_length = read_integer<uint16_t>(input);
  if (hash_length != file_data.hash.size()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid digest length: " << hash_length;
    throw ProtocolError("Invalid digest length");
  }
  read_bytes(input, file_data.hash.data(), file_data.hash.size());

  auto data_length = read_integer<uint64_t>(input);
  if (data_length > max_frame_size_) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Ciphertext length " << data_length << " exceeds frame limit";
    throw ProtocolError("Ciphertext exceeds maximum frame size");
  }
  read_sized(input, file_data.data, data_length);

  return file_data;
}

Message Codec::decode(const std::vector<uint8_t>& frame) const {
  FrameBuffer buffer(frame);
  std::istream input(&buffer);
  return deserialize(input);
}

//==============================================
// STREAM OPERATIONS
//==============================================

template <typename LengthT>
std::size_t Codec::write_field(std::ostream& output, const void* data, std::size_t size) {
  write_integer<LengthT>(output, static_cast<LengthT>(size));
  if (size > 0) {
    write_bytes(output, data, size);
  }
  return sizeof(LengthT) + size;
}

template <typename LengthT>
std::string Codec::read_text(std::istream& input, const char* field) const {
  auto length = read_integer<LengthT>(input);
  if (length > MAX_TEXT_FIELD) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Field " << field << " too long: " << length;
    throw ProtocolError(std::string("Field too long: ") + field);
  }
  std::string text;
  read_sized(input, text, length);
  return text;
}

template <typename Container>
void Codec::read_sized(std::istream& input, Container& output, uint64_t length) {
  output.clear();

  // Frame buffers report exactly what is left, so a declared length that
  // cannot fit is refused before anything is allocated
  const std::streamsize available = input.rdbuf()->in_avail();
  if (available >= 0 && static_cast<uint64_t>(available) >= length) {
    output.resize(static_cast<std::size_t>(length));
    read_bytes(input, output.data(), output.size());
    return;
  }

  // Otherwise grow only as bytes actually arrive
  while (output.size() < length) {
    const std::size_t offset = output.size();
    const std::size_t chunk = static_cast<std::size_t>(
      std::min<uint64_t>(READ_CHUNK_SIZE, length - offset));
    output.resize(offset + chunk);
    read_bytes(input, output.data() + offset, chunk);
  }
}

void Codec::write_bytes(std::ostream& output, const void* data, std::size_t size) {
  if (!output.write(static_cast<const char*>(data), static_cast<std::streamsize>(size))) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to write " << size << " bytes to output stream";
    throw std::runtime_error("Codec: Failed to write to output stream");
  }
}

void Codec::read_bytes(std::istream& input, void* data, std::size_t size) {
  if (size == 0) {
    return;
  }
  if (!input.read(static_cast<char*>(data), static_cast<std::streamsize>(size))) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to read " << size << " bytes from input stream";
    throw ProtocolError("Truncated frame");
  }
}

} // namespace network
} // namespace sft
