#ifndef AGENTSIG_CRYPTO_IDS_HEADER
#define AGENTSIG_CRYPTO_IDS_HEADER

#include <cstddef>
#include <string_view>

namespace agentsig {

template<typename Tag> struct type_tag {};

enum class key_type {
	unknown = 0,
	ssh_rsa,
	ssh_ed25519,
	ecdsa_sha2_nistp256,
	ecdsa_sha2_nistp384,
	ecdsa_sha2_nistp521
};

std::string_view to_string(key_type);
key_type from_string(type_tag<key_type>, std::string_view);

key_type from_curve_name(std::string_view);

// size of the field elements of the curve in bytes, zero for non-ecdsa types
std::size_t ecdsa_field_size(key_type);

enum class hash_type {
	unknown = 0,
	md5,
	sha1,
	sha2_256,
	sha2_384,
	sha2_512
};

std::string_view to_string(hash_type);

// the hash used with ecdsa signatures of given key type (rfc5656 section 6.2.1)
hash_type ecdsa_hash_type(key_type);

}

#endif
