#pragma once
#include <cstddef>
#include <string>

namespace usb_audio {

// Lowercase hex MD5 of data, truncated to length characters.
// Returns an empty string when the digest cannot be computed.
std::string shortDigest(const std::string& data, size_t length);

// Nanoseconds since the epoch from the high-resolution clock, as text.
std::string highResolutionStamp();

}
