
#include "util.hpp"

namespace agentsig {

static char const base64_alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
static char const base64_pad = '=';
static char const hex_digits[] = "0123456789abcdef";

static int base64_value(char c) {
	if(c >= 'A' && c <= 'Z') return c - 'A';
	if(c >= 'a' && c <= 'z') return c - 'a' + 26;
	if(c >= '0' && c <= '9') return c - '0' + 52;
	if(c == '+') return 62;
	if(c == '/') return 63;
	return -1;
}

byte_vector decode_base64(std::string_view s) {
	// padding is optional, but if present the input must be full quads
	if(s.size() % 4 == 0) {
		for(int i = 0; i != 2 && !s.empty() && s.back() == base64_pad; ++i) {
			s.remove_suffix(1);
		}
	}

	// single char cannot encode a byte
	if(s.size() % 4 == 1) {
		return {};
	}

	byte_vector res;
	res.reserve(s.size() * 3 / 4);

	std::uint32_t acc{};
	int bits{};
	for(char c : s) {
		int v = base64_value(c);
		if(v < 0) {
			return {};
		}
		acc = (acc << 6) | std::uint32_t(v);
		bits += 6;
		if(bits >= 8) {
			bits -= 8;
			res.push_back(std::byte((acc >> bits) & 0xff));
		}
	}

	return res;
}

std::string encode_base64(const_span s, bool pad) {
	std::string res;
	res.reserve(((s.size()+2)/3)*4);

	std::uint32_t acc{};
	int bits{};
	for(auto b : s) {
		acc = (acc << 8) | std::to_integer<std::uint32_t>(b);
		bits += 8;
		while(bits >= 6) {
			bits -= 6;
			res += base64_alphabet[(acc >> bits) & 0x3f];
		}
	}

	if(bits) {
		res += base64_alphabet[(acc << (6 - bits)) & 0x3f];
	}

	if(pad) {
		while(res.size() % 4) {
			res += base64_pad;
		}
	}

	return res;
}

std::string encode_hex(const_span s) {
	std::string res;
	res.reserve(s.size()*2);
	for(auto b : s) {
		auto v = std::to_integer<std::uint8_t>(b);
		res += hex_digits[v >> 4];
		res += hex_digits[v & 0x0f];
	}
	return res;
}

}
