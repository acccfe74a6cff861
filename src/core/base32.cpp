#include "ulidkit/core/base32.hpp"

namespace ulidkit::core::base32 {

namespace {

constexpr unsigned kBitsPerChar = 5;
constexpr std::uint64_t kCharMask = 0x1F;

// Largest digit that keeps 26 characters within 128 bits (130 - 128 = 2 spare bits)
constexpr std::uint8_t kMaxLeadingDigit = 7;

}  // namespace

std::string_view describe(EncodeError error) {
  switch (error) {
    case EncodeError::kBufferTooSmall:
      return "buffer too small";
  }
  return "unknown encode error";
}

std::string_view describe(DecodeError error) {
  switch (error) {
    case DecodeError::kInvalidLength:
      return "invalid length";
    case DecodeError::kInvalidChar:
      return "invalid character";
  }
  return "unknown decode error";
}

Error toError(DecodeError error, std::string_view input) {
  return Error::forUser(ErrorCode::kParseError,
                        "Invalid ULID '" + std::string(input) + "': " + std::string(describe(error)));
}

void encodeToArray(Uint128 value, std::array<char, kUlidLength>& buffer) noexcept {
  for (std::size_t i = 0; i < kUlidLength; ++i) {
    buffer[kUlidLength - 1 - i] = kAlphabet[value.low & kCharMask];
    value = value >> kBitsPerChar;
  }
}

std::expected<std::size_t, EncodeError> encodeTo(Uint128 value, std::span<char> buffer) noexcept {
  if (buffer.size() < kUlidLength) {
    return std::unexpected(EncodeError::kBufferTooSmall);
  }

  std::array<char, kUlidLength> encoded;
  encodeToArray(value, encoded);
  for (std::size_t i = 0; i < kUlidLength; ++i) {
    buffer[i] = encoded[i];
  }

  return kUlidLength;
}

std::string encode(Uint128 value) {
  std::array<char, kUlidLength> buffer;
  encodeToArray(value, buffer);
  return std::string(buffer.begin(), buffer.end());
}

std::expected<Uint128, DecodeError> decode(std::string_view encoded) noexcept {
  if (encoded.size() != kUlidLength) {
    return std::unexpected(DecodeError::kInvalidLength);
  }

  Uint128 value;
  for (char c : encoded) {
    const std::uint8_t digit = kLookup[static_cast<unsigned char>(c)];
    if (digit == kNoValue) {
      return std::unexpected(DecodeError::kInvalidChar);
    }
    value = (value << kBitsPerChar) | Uint128::fromU64(digit);
  }

  return value;
}

bool hasCanonicalLeadingChar(std::string_view encoded) noexcept {
  if (encoded.empty()) {
    return false;
  }
  const std::uint8_t digit = kLookup[static_cast<unsigned char>(encoded.front())];
  return digit != kNoValue && digit <= kMaxLeadingDigit;
}

}  // namespace ulidkit::core::base32
