#pragma once

#include <string>
#include <string_view>
#include <wirebind/core/types.h>
#include <wirebind/protocol/binding.h>

namespace wirebind::encoding {

// Standard alphabet with '=' padding
std::string base64Encode(ByteSpan bytes);

// Strict decode: length must be a multiple of 4, padding only at the end
Result<ByteVector> base64Decode(std::string_view text);

/**
 * @brief Percent-encode everything outside the RFC 3986 unreserved set
 * @param keepSlash leave '/' untouched (greedy path labels)
 */
std::string urlEncode(std::string_view text, bool keepSlash = false);

Result<std::string> formatTimestamp(TimePoint tp, TimestampFormat format);
Result<TimePoint> parseTimestamp(std::string_view text, TimestampFormat format);

// Shortest round-trip text for a finite double
Result<std::string> formatDouble(double value);

ByteVector toBytes(std::string_view text);
std::string toString(ByteSpan bytes);

} // namespace wirebind::encoding
