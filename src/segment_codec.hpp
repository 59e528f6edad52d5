#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "utils.hpp"

using EncryptionKey = std::vector<unsigned char>;

// Immutable unit of transport. segment_id is the SHA-256 of the bytes that
// were posted (after compression/encryption); checksum is the SHA-256 of the
// original plaintext slice.
struct SegmentRecord {
  std::string segment_id;
  std::string file_id;
  uint32_t sequence_index = 0;
  uint64_t raw_size = 0;
  uint64_t packed_size = 0;
  bool compressed = false;
  bool encrypted = false;
  std::string checksum;
  std::vector<std::string> article_message_ids;
  int pack_slot = -1; // index inside a combined article, -1 when posted alone
};

void to_json(nlohmann::json& j, const SegmentRecord& s);
void from_json(const nlohmann::json& j, SegmentRecord& s);

struct CodecOptions {
  std::size_t segment_size = 768000;
  double compression_threshold_ratio = 0.9;
  std::size_t compression_sample_bytes = 64 * 1024;
  int compression_level = 6;
};

enum class CompressionMode { Never, Auto, Always };

struct EncodedSegment {
  SegmentRecord record;
  Bytes payload;
};

// Deterministic file <-> segment transforms. Every inverse step fails closed
// with IntegrityError; nothing here touches the network.
class SegmentCodec {
public:
  static constexpr uint32_t kPackMagic = 0x504e5355; // "USNP" little endian
  static constexpr std::size_t kKeySize = 32;
  static constexpr std::size_t kNonceSize = 12;
  static constexpr std::size_t kTagSize = 16;

  explicit SegmentCodec(CodecOptions options = {});

  const CodecOptions& options() const { return options_; }

  std::vector<Bytes> segment(const Bytes& file_bytes) const;
  static std::vector<Bytes> segment(const Bytes& file_bytes, std::size_t target_segment_size);

  // Length-prefixed framing: magic, count, then (u32 length, bytes) per entry.
  static Bytes pack(const std::vector<Bytes>& segments);
  static std::vector<Bytes> unpack(const Bytes& payload);
  static std::size_t pack_overhead(std::size_t segment_count);

  struct CompressionResult {
    Bytes data;
    double ratio = 1.0; // compressed / original
  };

  CompressionResult compress(const Bytes& chunk) const;
  static Bytes decompress(const Bytes& data, std::size_t expected_size);
  bool should_compress(const Bytes& chunk) const;

  static EncryptionKey generate_key();
  static Bytes encrypt(const Bytes& chunk, const EncryptionKey& key);
  static Bytes decrypt(const Bytes& ciphertext, const EncryptionKey& key);

  static std::string checksum(const Bytes& bytes);

  EncodedSegment encode(const Bytes& chunk,
                        const std::string& file_id,
                        uint32_t sequence_index,
                        CompressionMode mode,
                        const EncryptionKey* key) const;

  Bytes decode(const SegmentRecord& record,
               const Bytes& payload,
               const EncryptionKey* key) const;

private:
  CodecOptions options_;
};

// Reads a file one segment at a time with the same boundaries as
// SegmentCodec::segment, hashing the content on the way through.
class FileSegmentReader {
public:
  FileSegmentReader(const std::filesystem::path& path, std::size_t segment_size);

  // Fills `chunk` with the next segment; false at end of file.
  bool next(Bytes& chunk);

  uint64_t bytes_read() const { return bytes_read_; }
  // SHA-256 of everything read. Only valid once next() returned false.
  const std::string& content_hash() const { return content_hash_; }

private:
  std::filesystem::path path_;
  std::ifstream in_;
  std::size_t segment_size_;
  Sha256Stream hash_;
  uint64_t bytes_read_ = 0;
  std::string content_hash_;
  bool done_ = false;
};
