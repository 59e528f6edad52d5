#include "segment_codec.hpp"
#include "test_runner_utils.hpp"
#include "transfer_errors.hpp"
#include "yenc.hpp"

#include <iostream>

namespace usenetsync::test {
namespace {

template<typename Fn>
bool throws_integrity(Fn&& fn) {
  try {
    fn();
  } catch(const IntegrityError&) {
    return true;
  }
  return false;
}

Bytes concat(const std::vector<Bytes>& parts) {
  Bytes out;
  for(const auto& p : parts) out.insert(out.end(), p.begin(), p.end());
  return out;
}

bool test_segment_split_and_join(TestContext& ctx) {
  CodecOptions opts;
  opts.segment_size = 1000;
  SegmentCodec codec(opts);
  auto data = random_payload(2500);
  auto chunks = codec.segment(data);
  if(chunks.size() != 3) {
    if(ctx.verbose) std::cout << "    expected 3 chunks, got " << chunks.size() << "\n";
    return false;
  }
  if(chunks[0].size() != 1000 || chunks[1].size() != 1000 || chunks[2].size() != 500) return false;
  if(concat(chunks) != data) return false;

  // Exact multiple: no trailing empty segment.
  if(codec.segment(random_payload(2000)).size() != 2) return false;
  return codec.segment(Bytes{}).empty();
}

bool test_file_reader_matches_segment(TestContext& ctx) {
  ScratchDir dir("reader");
  for(std::size_t size : {std::size_t{0}, std::size_t{999}, std::size_t{3000}, std::size_t{4321}}) {
    auto data = random_payload(size);
    auto path = dir / ("f" + std::to_string(size));
    write_file(path, data);
    auto expected = SegmentCodec::segment(data, 1000);

    FileSegmentReader reader(path, 1000);
    std::vector<Bytes> chunks;
    Bytes chunk;
    while(reader.next(chunk)) chunks.push_back(chunk);
    if(chunks != expected || reader.bytes_read() != size || reader.content_hash() != sha256_hex(data)) {
      if(ctx.verbose) {
        std::cout << "    size " << size << ": " << chunks.size() << " chunk(s), expected "
                  << expected.size() << "\n";
      }
      return false;
    }
    if(reader.next(chunk) || !chunk.empty()) return false;
  }
  return true;
}

bool test_pack_unpack(TestContext&) {
  std::vector<Bytes> parts = {random_payload(10), Bytes{}, random_payload(300), repeated_payload(7, 'z')};
  auto packed = SegmentCodec::pack(parts);
  std::size_t expected = SegmentCodec::pack_overhead(parts.size()) + 10 + 300 + 7;
  if(packed.size() != expected) return false;
  if(SegmentCodec::unpack(packed) != parts) return false;

  auto truncated = packed;
  truncated.resize(truncated.size() - 3);
  if(!throws_integrity([&]{ SegmentCodec::unpack(truncated); })) return false;

  auto trailing = packed;
  trailing.push_back('!');
  if(!throws_integrity([&]{ SegmentCodec::unpack(trailing); })) return false;

  return throws_integrity([&]{ SegmentCodec::unpack(random_payload(16)); });
}

bool test_compression_heuristic(TestContext& ctx) {
  SegmentCodec codec;
  bool random_rejected = !codec.should_compress(random_payload(128 * 1024));
  bool repeated_accepted = codec.should_compress(repeated_payload(1024 * 1024));
  if(ctx.verbose) {
    std::cout << "    random rejected=" << random_rejected
              << " repeated accepted=" << repeated_accepted << "\n";
  }
  if(!random_rejected || !repeated_accepted) return false;

  auto result = codec.compress(repeated_payload(1024 * 1024));
  if(result.ratio >= 0.01) return false;
  return SegmentCodec::decompress(result.data, 1024 * 1024) == repeated_payload(1024 * 1024);
}

bool test_encode_decode_modes(TestContext&) {
  SegmentCodec codec;
  auto key = SegmentCodec::generate_key();
  if(key.size() != SegmentCodec::kKeySize) return false;

  const std::vector<Bytes> inputs = {random_payload(5000), repeated_payload(50000, 'q'), Bytes{'x'}};
  const CompressionMode modes[] = {CompressionMode::Never, CompressionMode::Auto, CompressionMode::Always};
  for(const auto& input : inputs) {
    for(auto mode : modes) {
      for(const EncryptionKey* k : {static_cast<const EncryptionKey*>(nullptr), &key}) {
        auto enc = codec.encode(input, "file-1", 4, mode, k);
        if(enc.record.raw_size != input.size()) return false;
        if(enc.record.packed_size != enc.payload.size()) return false;
        if(enc.record.checksum != SegmentCodec::checksum(input)) return false;
        if(enc.record.segment_id != SegmentCodec::checksum(enc.payload)) return false;
        if(enc.record.encrypted != (k != nullptr)) return false;
        if(mode == CompressionMode::Never && enc.record.compressed) return false;
        if(mode == CompressionMode::Always && !enc.record.compressed) return false;
        if(codec.decode(enc.record, enc.payload, k) != input) return false;
      }
    }
  }
  return true;
}

bool test_decode_rejects_tampering(TestContext&) {
  SegmentCodec codec;
  auto key = SegmentCodec::generate_key();
  auto enc = codec.encode(random_payload(4096), "file-2", 0, CompressionMode::Auto, &key);

  auto flipped = enc.payload;
  flipped[flipped.size() / 2] ^= 0x01;
  if(!throws_integrity([&]{ codec.decode(enc.record, flipped, &key); })) return false;

  // Record forged to match the flipped bytes still fails authentication.
  auto forged = enc.record;
  forged.segment_id = SegmentCodec::checksum(flipped);
  if(!throws_integrity([&]{ codec.decode(forged, flipped, &key); })) return false;

  auto other_key = SegmentCodec::generate_key();
  if(!throws_integrity([&]{ codec.decode(enc.record, enc.payload, &other_key); })) return false;
  if(!throws_integrity([&]{ codec.decode(enc.record, enc.payload, nullptr); })) return false;

  auto short_payload = enc.payload;
  short_payload.pop_back();
  return throws_integrity([&]{ codec.decode(enc.record, short_payload, &key); });
}

bool test_segment_record_json(TestContext&) {
  SegmentRecord rec;
  rec.segment_id = "abc";
  rec.file_id = "f";
  rec.sequence_index = 9;
  rec.raw_size = 100;
  rec.packed_size = 80;
  rec.compressed = true;
  rec.encrypted = true;
  rec.checksum = "def";
  rec.article_message_ids = {"<a@x>", "<b@x>"};
  rec.pack_slot = 2;
  nlohmann::json j = rec;
  auto back = j.get<SegmentRecord>();
  return back.segment_id == rec.segment_id && back.sequence_index == 9 &&
         back.article_message_ids == rec.article_message_ids && back.pack_slot == 2 &&
         back.compressed && back.encrypted && back.packed_size == 80;
}

bool test_yenc_all_byte_values(TestContext&) {
  Bytes data;
  for(int round = 0; round < 3; ++round) {
    for(int b = 0; b < 256; ++b) data.push_back(static_cast<char>(b));
  }
  auto body = yenc_encode(data, "all.bin");
  if(body.find("=ybegin") != 0) return false;
  if(body.find("=yend size=" + std::to_string(data.size())) == std::string::npos) return false;

  // Encoded lines never start with '.' unescaped and never carry bare NUL/CR/LF.
  std::size_t pos = 0;
  while((pos = body.find("\r\n", pos)) != std::string::npos) {
    pos += 2;
    if(pos < body.size() && body[pos] == '.') return false;
  }
  if(body.find('\0') != std::string::npos) return false;

  return yenc_decode(body) == data;
}

bool test_yenc_detects_corruption(TestContext&) {
  auto data = random_payload(3000);
  auto body = yenc_encode(data, "c.bin", 64);
  if(yenc_decode("junk before\r\n" + body) != data) return false;

  auto damaged = body;
  auto mid = damaged.find("\r\n") + 10;
  damaged[mid] = damaged[mid] == 'A' ? 'B' : 'A';
  if(!throws_integrity([&]{ yenc_decode(damaged); })) return false;

  auto no_end = body.substr(0, body.find("=yend"));
  if(!throws_integrity([&]{ yenc_decode(no_end); })) return false;
  return throws_integrity([&]{ yenc_decode("no markers at all"); });
}

bool test_crc32_known_value(TestContext&) {
  std::string text = "123456789";
  return crc32_of(Bytes(text.begin(), text.end())) == 0xCBF43926u;
}

} // namespace

void add_codec_tests(std::vector<TestCase>& tests) {
  tests.push_back({"segment_split_and_join", test_segment_split_and_join});
  tests.push_back({"file_reader_matches_segment", test_file_reader_matches_segment});
  tests.push_back({"pack_unpack", test_pack_unpack});
  tests.push_back({"compression_heuristic", test_compression_heuristic});
  tests.push_back({"encode_decode_modes", test_encode_decode_modes});
  tests.push_back({"decode_rejects_tampering", test_decode_rejects_tampering});
  tests.push_back({"segment_record_json", test_segment_record_json});
  tests.push_back({"yenc_all_byte_values", test_yenc_all_byte_values});
  tests.push_back({"yenc_detects_corruption", test_yenc_detects_corruption});
  tests.push_back({"crc32_known_value", test_crc32_known_value});
}

} // namespace usenetsync::test
