#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

#include "ulidkit/core/uint128.hpp"

namespace ulidkit::core::base32 {

// Length of a text-encoded ULID
inline constexpr std::size_t kUlidLength = 26;

// Crockford's Base32 alphabet: no I, L, O or U
inline constexpr std::string_view kAlphabet = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

// Lookup table marker for bytes outside the alphabet
inline constexpr std::uint8_t kNoValue = 0xFF;

namespace detail {

constexpr std::array<std::uint8_t, 256> buildLookup() {
  std::array<std::uint8_t, 256> table{};
  for (auto& entry : table) {
    entry = kNoValue;
  }
  for (std::size_t i = 0; i < kAlphabet.size(); ++i) {
    const auto c = static_cast<unsigned char>(kAlphabet[i]);
    table[c] = static_cast<std::uint8_t>(i);
    if (c >= 'A' && c <= 'Z') {
      table[c + ('a' - 'A')] = static_cast<std::uint8_t>(i);
    }
  }
  return table;
}

}  // namespace detail

// Byte -> 5-bit digit, or kNoValue. Accepts both cases.
inline constexpr std::array<std::uint8_t, 256> kLookup = detail::buildLookup();

// Errors raised while encoding into a caller-supplied buffer
enum class EncodeError {
  kBufferTooSmall
};

// Errors raised while decoding text
enum class DecodeError {
  kInvalidLength,
  kInvalidChar
};

std::string_view describe(EncodeError error);
std::string_view describe(DecodeError error);

// Lift a decode failure into the application error model
Error toError(DecodeError error, std::string_view input);

// Encode into a fixed array. Always succeeds.
void encodeToArray(Uint128 value, std::array<char, kUlidLength>& buffer) noexcept;

// Encode into a caller buffer of at least kUlidLength bytes.
// Returns the number of bytes written; no terminator is appended.
std::expected<std::size_t, EncodeError> encodeTo(Uint128 value, std::span<char> buffer) noexcept;

// Encode to the canonical uppercase 26-character form
std::string encode(Uint128 value);

// Decode a 26-character string, case-insensitive.
// A leading digit above 7 does not fit in 128 bits; its high bits are
// shifted out rather than rejected. See hasCanonicalLeadingChar().
std::expected<Uint128, DecodeError> decode(std::string_view encoded) noexcept;

// True if the first character of `encoded` is one of 0-7, i.e. the
// decoded value is exact. Does not check length or the other characters.
bool hasCanonicalLeadingChar(std::string_view encoded) noexcept;

}  // namespace ulidkit::core::base32
