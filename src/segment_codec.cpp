#include "segment_codec.hpp"

#include <openssl/evp.h>
#include <zlib.h>

#include <algorithm>
#include <cstring>
#include <memory>
#include <stdexcept>

#include "transfer_errors.hpp"

namespace {

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

CipherCtx make_cipher_ctx() {
  CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
  if(!ctx) throw std::runtime_error("EVP_CIPHER_CTX_new failed");
  return ctx;
}

void put_u32(Bytes& out, uint32_t value) {
  for(int i = 0; i < 4; ++i) {
    out.push_back(static_cast<char>((value >> (8 * i)) & 0xff));
  }
}

uint32_t get_u32(const Bytes& in, std::size_t offset) {
  uint32_t value = 0;
  for(int i = 0; i < 4; ++i) {
    value |= static_cast<uint32_t>(static_cast<unsigned char>(in[offset + i])) << (8 * i);
  }
  return value;
}

Bytes zlib_compress(const Bytes& chunk, int level) {
  uLongf bound = compressBound(static_cast<uLong>(chunk.size()));
  Bytes out(bound);
  int rc = compress2(reinterpret_cast<Bytef*>(out.data()), &bound,
                     reinterpret_cast<const Bytef*>(chunk.data()),
                     static_cast<uLong>(chunk.size()), level);
  if(rc != Z_OK) {
    throw std::runtime_error("zlib compress2 failed: " + std::to_string(rc));
  }
  out.resize(bound);
  return out;
}

} // namespace

void to_json(nlohmann::json& j, const SegmentRecord& s) {
  j = nlohmann::json{
    {"segment_id", s.segment_id},
    {"file_id", s.file_id},
    {"sequence_index", s.sequence_index},
    {"raw_size", s.raw_size},
    {"packed_size", s.packed_size},
    {"compressed", s.compressed},
    {"encrypted", s.encrypted},
    {"checksum", s.checksum},
    {"article_message_ids", s.article_message_ids},
    {"pack_slot", s.pack_slot}
  };
}

void from_json(const nlohmann::json& j, SegmentRecord& s) {
  s.segment_id = j.at("segment_id").get<std::string>();
  s.file_id = j.at("file_id").get<std::string>();
  s.sequence_index = j.at("sequence_index").get<uint32_t>();
  s.raw_size = j.at("raw_size").get<uint64_t>();
  s.packed_size = j.at("packed_size").get<uint64_t>();
  s.compressed = j.at("compressed").get<bool>();
  s.encrypted = j.at("encrypted").get<bool>();
  s.checksum = j.at("checksum").get<std::string>();
  s.article_message_ids = j.at("article_message_ids").get<std::vector<std::string>>();
  s.pack_slot = j.value("pack_slot", -1);
}

SegmentCodec::SegmentCodec(CodecOptions options)
  : options_(std::move(options)) {
  if(options_.segment_size == 0) {
    throw std::invalid_argument("segment_size must be positive");
  }
}

std::vector<Bytes> SegmentCodec::segment(const Bytes& file_bytes) const {
  return segment(file_bytes, options_.segment_size);
}

std::vector<Bytes> SegmentCodec::segment(const Bytes& file_bytes, std::size_t target_segment_size) {
  if(target_segment_size == 0) {
    throw std::invalid_argument("target_segment_size must be positive");
  }
  std::vector<Bytes> chunks;
  chunks.reserve((file_bytes.size() + target_segment_size - 1) / target_segment_size);
  for(std::size_t offset = 0; offset < file_bytes.size(); offset += target_segment_size) {
    auto end = std::min(file_bytes.size(), offset + target_segment_size);
    chunks.emplace_back(file_bytes.begin() + static_cast<std::ptrdiff_t>(offset),
                        file_bytes.begin() + static_cast<std::ptrdiff_t>(end));
  }
  return chunks;
}

FileSegmentReader::FileSegmentReader(const std::filesystem::path& path, std::size_t segment_size)
  : path_(path), in_(path, std::ios::binary), segment_size_(segment_size) {
  if(segment_size_ == 0) throw std::invalid_argument("segment_size must be positive");
  if(!in_) throw std::runtime_error("unable to open " + path.string());
}

bool FileSegmentReader::next(Bytes& chunk) {
  chunk.clear();
  if(done_) return false;
  chunk.resize(segment_size_);
  in_.read(chunk.data(), static_cast<std::streamsize>(segment_size_));
  auto got = static_cast<std::size_t>(in_.gcount());
  if(in_.bad()) throw std::runtime_error("read error on " + path_.string());
  chunk.resize(got);
  if(got > 0) {
    hash_.update(chunk.data(), got);
    bytes_read_ += got;
  }
  if(got < segment_size_ || in_.peek() == std::ifstream::traits_type::eof()) {
    done_ = true;
    content_hash_ = hash_.final_hex();
  }
  return got > 0;
}

std::size_t SegmentCodec::pack_overhead(std::size_t segment_count) {
  return 8 + 4 * segment_count;
}

Bytes SegmentCodec::pack(const std::vector<Bytes>& segments) {
  std::size_t total = pack_overhead(segments.size());
  for(const auto& s : segments) total += s.size();

  Bytes out;
  out.reserve(total);
  put_u32(out, kPackMagic);
  put_u32(out, static_cast<uint32_t>(segments.size()));
  for(const auto& s : segments) {
    if(s.size() > UINT32_MAX) {
      throw std::invalid_argument("segment too large to pack");
    }
    put_u32(out, static_cast<uint32_t>(s.size()));
    out.insert(out.end(), s.begin(), s.end());
  }
  return out;
}

std::vector<Bytes> SegmentCodec::unpack(const Bytes& payload) {
  if(payload.size() < 8 || get_u32(payload, 0) != kPackMagic) {
    throw IntegrityError("packed article has no valid frame header");
  }
  const uint32_t count = get_u32(payload, 4);
  std::vector<Bytes> out;
  std::size_t offset = 8;
  for(uint32_t i = 0; i < count; ++i) {
    if(payload.size() - offset < 4) {
      throw IntegrityError("packed article truncated in frame " + std::to_string(i));
    }
    const uint32_t len = get_u32(payload, offset);
    offset += 4;
    if(payload.size() - offset < len) {
      throw IntegrityError("packed frame " + std::to_string(i) + " overruns payload");
    }
    out.emplace_back(payload.begin() + static_cast<std::ptrdiff_t>(offset),
                     payload.begin() + static_cast<std::ptrdiff_t>(offset + len));
    offset += len;
  }
  if(offset != payload.size()) {
    throw IntegrityError("packed article has trailing bytes");
  }
  return out;
}

SegmentCodec::CompressionResult SegmentCodec::compress(const Bytes& chunk) const {
  CompressionResult result;
  result.data = zlib_compress(chunk, options_.compression_level);
  result.ratio = chunk.empty()
    ? 1.0
    : static_cast<double>(result.data.size()) / static_cast<double>(chunk.size());
  return result;
}

Bytes SegmentCodec::decompress(const Bytes& data, std::size_t expected_size) {
  Bytes out(expected_size);
  uLongf out_len = static_cast<uLongf>(expected_size);
  int rc = uncompress(reinterpret_cast<Bytef*>(out.data()), &out_len,
                      reinterpret_cast<const Bytef*>(data.data()),
                      static_cast<uLong>(data.size()));
  if(rc != Z_OK || out_len != expected_size) {
    throw IntegrityError("decompression failed (zlib rc " + std::to_string(rc) + ")");
  }
  return out;
}

bool SegmentCodec::should_compress(const Bytes& chunk) const {
  if(chunk.empty()) return false;
  const std::size_t sample_len = std::min(chunk.size(), std::max<std::size_t>(1, options_.compression_sample_bytes));
  Bytes sample(chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(sample_len));
  // Level 1 keeps the probe cheap; the real pass uses compression_level.
  auto probe = zlib_compress(sample, 1);
  double ratio = static_cast<double>(probe.size()) / static_cast<double>(sample.size());
  return ratio < options_.compression_threshold_ratio;
}

EncryptionKey SegmentCodec::generate_key() {
  return random_bytes(kKeySize);
}

Bytes SegmentCodec::encrypt(const Bytes& chunk, const EncryptionKey& key) {
  if(key.size() != kKeySize) {
    throw std::invalid_argument("encryption key must be 32 bytes");
  }
  auto nonce = random_bytes(kNonceSize);
  auto ctx = make_cipher_ctx();
  if(EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
     EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1 ||
     EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
    throw std::runtime_error("AES-GCM init failed");
  }

  Bytes out(kNonceSize + chunk.size() + kTagSize);
  std::memcpy(out.data(), nonce.data(), kNonceSize);
  auto* cipher_out = reinterpret_cast<unsigned char*>(out.data() + kNonceSize);
  int len = 0;
  if(!chunk.empty() &&
     EVP_EncryptUpdate(ctx.get(), cipher_out, &len,
                       reinterpret_cast<const unsigned char*>(chunk.data()),
                       static_cast<int>(chunk.size())) != 1) {
    throw std::runtime_error("AES-GCM update failed");
  }
  int final_len = 0;
  if(EVP_EncryptFinal_ex(ctx.get(), cipher_out + len, &final_len) != 1) {
    throw std::runtime_error("AES-GCM final failed");
  }
  auto* tag_out = reinterpret_cast<unsigned char*>(out.data() + kNonceSize + chunk.size());
  if(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize), tag_out) != 1) {
    throw std::runtime_error("AES-GCM tag extraction failed");
  }
  return out;
}

Bytes SegmentCodec::decrypt(const Bytes& ciphertext, const EncryptionKey& key) {
  if(key.size() != kKeySize) {
    throw IntegrityError("decryption key must be 32 bytes");
  }
  if(ciphertext.size() < kNonceSize + kTagSize) {
    throw IntegrityError("ciphertext shorter than nonce and tag");
  }
  const std::size_t body_len = ciphertext.size() - kNonceSize - kTagSize;
  const auto* nonce = reinterpret_cast<const unsigned char*>(ciphertext.data());
  const auto* body = nonce + kNonceSize;
  std::vector<unsigned char> tag(body + body_len, body + body_len + kTagSize);

  auto ctx = make_cipher_ctx();
  if(EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
     EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1 ||
     EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) != 1) {
    throw std::runtime_error("AES-GCM init failed");
  }

  Bytes out(body_len);
  int len = 0;
  if(body_len > 0 &&
     EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(out.data()), &len,
                       body, static_cast<int>(body_len)) != 1) {
    throw IntegrityError("AES-GCM decrypt update failed");
  }
  if(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize), tag.data()) != 1) {
    throw std::runtime_error("AES-GCM set tag failed");
  }
  int final_len = 0;
  if(EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(out.data()) + len, &final_len) <= 0) {
    throw IntegrityError("AES-GCM authentication failed");
  }
  return out;
}

std::string SegmentCodec::checksum(const Bytes& bytes) {
  return sha256_hex(bytes);
}

EncodedSegment SegmentCodec::encode(const Bytes& chunk,
                                    const std::string& file_id,
                                    uint32_t sequence_index,
                                    CompressionMode mode,
                                    const EncryptionKey* key) const {
  EncodedSegment out;
  out.record.file_id = file_id;
  out.record.sequence_index = sequence_index;
  out.record.raw_size = chunk.size();
  out.record.checksum = checksum(chunk);

  bool apply_compression = false;
  switch(mode) {
    case CompressionMode::Never: apply_compression = false; break;
    case CompressionMode::Auto: apply_compression = should_compress(chunk); break;
    case CompressionMode::Always: apply_compression = true; break;
  }

  Bytes body;
  if(apply_compression) {
    auto compressed = compress(chunk);
    if(mode == CompressionMode::Always || compressed.data.size() < chunk.size()) {
      body = std::move(compressed.data);
      out.record.compressed = true;
    } else {
      body = chunk;
    }
  } else {
    body = chunk;
  }

  if(key) {
    body = encrypt(body, *key);
    out.record.encrypted = true;
  }

  out.record.packed_size = body.size();
  out.record.segment_id = checksum(body);
  out.payload = std::move(body);
  return out;
}

Bytes SegmentCodec::decode(const SegmentRecord& record,
                           const Bytes& payload,
                           const EncryptionKey* key) const {
  if(payload.size() != record.packed_size || checksum(payload) != record.segment_id) {
    throw IntegrityError("segment " + record.segment_id + " content hash mismatch");
  }

  Bytes body = payload;
  if(record.encrypted) {
    if(!key) {
      throw IntegrityError("segment " + record.segment_id + " is encrypted but no key is available");
    }
    body = decrypt(body, *key);
  }
  if(record.compressed) {
    body = decompress(body, static_cast<std::size_t>(record.raw_size));
  }
  if(body.size() != record.raw_size || checksum(body) != record.checksum) {
    throw IntegrityError("segment " + record.segment_id + " plaintext checksum mismatch");
  }
  return body;
}
