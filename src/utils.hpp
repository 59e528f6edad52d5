#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

using Bytes = std::vector<char>;
using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> bytes_from_hex(const std::string& hex);

std::vector<unsigned char> sha256_bytes(const char* data, std::size_t size);
std::string sha256_hex(const std::string& data);
std::string sha256_hex(const Bytes& data);
std::string sha256_file_hex(const std::filesystem::path& path);

// Incremental SHA-256 over data fed in pieces.
class Sha256Stream {
public:
    Sha256Stream();
    ~Sha256Stream();
    Sha256Stream(const Sha256Stream&) = delete;
    Sha256Stream& operator=(const Sha256Stream&) = delete;

    void update(const char* data, std::size_t size);
    std::string final_hex();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Cryptographically random bytes from OpenSSL; throws on RNG failure.
std::vector<unsigned char> random_bytes(std::size_t count);
std::string random_hex(std::size_t byte_count);

std::string format_timestamp(Timestamp tp);
Timestamp parse_timestamp(const std::string& text);
