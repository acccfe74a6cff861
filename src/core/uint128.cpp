#include "ulidkit/core/uint128.hpp"

namespace ulidkit::core {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";
constexpr size_t kMaxHexDigits = 32;

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

std::string Uint128::toHex() const {
  std::string result(kMaxHexDigits, '0');

  Uint128 value = *this;
  for (size_t i = 0; i < kMaxHexDigits; ++i) {
    result[kMaxHexDigits - 1 - i] = kHexDigits[value.low & 0xF];
    value = value >> 4;
  }

  return result;
}

Result<Uint128> Uint128::fromHex(std::string_view text) {
  std::string_view digits = text;
  if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
    digits.remove_prefix(2);
  }

  if (digits.empty() || digits.size() > kMaxHexDigits) {
    return makeErrorResult<Uint128>(ErrorCode::kParseError,
                                    "Expected 1-32 hex digits: " + std::string(text));
  }

  Uint128 value;
  for (char c : digits) {
    int digit = hexValue(c);
    if (digit < 0) {
      return makeErrorResult<Uint128>(ErrorCode::kParseError,
                                      "Invalid hex digit in: " + std::string(text));
    }
    value = (value << 4) | Uint128::fromU64(static_cast<std::uint64_t>(digit));
  }

  return value;
}

}  // namespace ulidkit::core
