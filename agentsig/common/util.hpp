#ifndef AGENTSIG_UTIL_HEADER
#define AGENTSIG_UTIL_HEADER

#include "types.hpp"

#include <string_view>

namespace agentsig {

/// accepts padded and unpadded input, returns empty on invalid input
byte_vector decode_base64(std::string_view);
std::string encode_base64(const_span, bool pad = false);

/// lowercase hex without separators
std::string encode_hex(const_span);

inline void u32ton(std::uint32_t v, std::byte* out) {
	out[0] = std::byte((v >> 24) & 0xff);
	out[1] = std::byte((v >> 16) & 0xff);
	out[2] = std::byte((v >> 8) & 0xff);
	out[3] = std::byte(v & 0xff);
}

inline std::uint32_t ntou32(std::byte const* in) {
	return (std::to_integer<std::uint32_t>(in[0]) << 24)
		| (std::to_integer<std::uint32_t>(in[1]) << 16)
		| (std::to_integer<std::uint32_t>(in[2]) << 8)
		| (std::to_integer<std::uint32_t>(in[3]));
}

// as per rfc4251 the unsigned mpint can have leading 0 byte, this removes that if present
inline const_mpint_span to_umpint(const_span mpint) {
	while(!mpint.empty() && mpint[0] == std::byte{0x0}) {
		mpint = mpint.subspan(1);
	}
	return const_mpint_span{mpint};
}

inline const_mpint_span to_umpint(std::string_view mpint) {
	return to_umpint(to_span(mpint));
}

}

#endif
