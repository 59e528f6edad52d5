#include "utils.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> bytes_from_hex(const std::string& hex){
    if(hex.size() % 2 != 0) throw std::invalid_argument("odd-length hex string");
    auto nibble = [](char c) -> int {
        if(c >= '0' && c <= '9') return c - '0';
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if(c >= 'a' && c <= 'f') return c - 'a' + 10;
        throw std::invalid_argument("invalid hex digit");
    };
    std::vector<unsigned char> out;
    out.reserve(hex.size() / 2);
    for(std::size_t i = 0; i < hex.size(); i += 2){
        out.push_back(static_cast<unsigned char>((nibble(hex[i]) << 4) | nibble(hex[i + 1])));
    }
    return out;
}

std::vector<unsigned char> sha256_bytes(const char* data, std::size_t size){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(data), size, out.data());
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data.data(), data.size()));
}

std::string sha256_hex(const Bytes& data){
    return hex_from_bytes(sha256_bytes(data.data(), data.size()));
}

struct Sha256Stream::Impl {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx{EVP_MD_CTX_new(), &EVP_MD_CTX_free};
};

Sha256Stream::Sha256Stream() : impl_(std::make_unique<Impl>()) {
    if(!impl_->ctx || EVP_DigestInit_ex(impl_->ctx.get(), EVP_sha256(), nullptr) != 1){
        throw std::runtime_error("sha256 init failed");
    }
}

Sha256Stream::~Sha256Stream() = default;

void Sha256Stream::update(const char* data, std::size_t size){
    if(size > 0 && EVP_DigestUpdate(impl_->ctx.get(), data, size) != 1){
        throw std::runtime_error("sha256 update failed");
    }
}

std::string Sha256Stream::final_hex(){
    std::vector<unsigned char> digest(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if(EVP_DigestFinal_ex(impl_->ctx.get(), digest.data(), &len) != 1){
        throw std::runtime_error("sha256 final failed");
    }
    digest.resize(len);
    return hex_from_bytes(digest);
}

std::string sha256_file_hex(const std::filesystem::path& path){
    std::ifstream in(path, std::ios::binary);
    if(!in) throw std::runtime_error("unable to open " + path.string());

    Sha256Stream hash;
    std::vector<char> buf(64 * 1024);
    while(in){
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto got = in.gcount();
        if(got > 0) hash.update(buf.data(), static_cast<std::size_t>(got));
    }
    if(in.bad()) throw std::runtime_error("read error on " + path.string());
    return hash.final_hex();
}

std::vector<unsigned char> random_bytes(std::size_t count){
    std::vector<unsigned char> out(count);
    if(count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1){
        throw std::runtime_error("RAND_bytes failed");
    }
    return out;
}

std::string random_hex(std::size_t byte_count){
    return hex_from_bytes(random_bytes(byte_count));
}

std::string format_timestamp(Timestamp tp){
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
    std::time_t t = Clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

Timestamp parse_timestamp(const std::string& text){
    if(text.empty()) return Timestamp{};
    std::tm tm{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if(iss.fail()) throw std::invalid_argument("bad timestamp '" + text + "'");
    int millis = 0;
    if(iss.peek() == '.'){
        iss.get();
        iss >> millis;
    }
    auto tp = Clock::from_time_t(timegm(&tm));
    return tp + std::chrono::milliseconds(millis);
}
