#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "utils.hpp"

inline constexpr std::size_t kYencLineLength = 128;

// Article body for one payload: =ybegin line, encoded data, =yend line with
// size and crc32. Lines end in CRLF.
std::string yenc_encode(const Bytes& data,
                        const std::string& name,
                        std::size_t line_length = kYencLineLength);

// Inverse of yenc_encode. Text outside the =ybegin/=yend block is ignored.
// Throws IntegrityError when markers are missing or the size/crc32 trailer
// does not match the decoded bytes.
Bytes yenc_decode(const std::string& body);

uint32_t crc32_of(const Bytes& data);
