#ifndef AGENTSIG_SIGNER_HTTP_SIGNATURE_HEADER
#define AGENTSIG_SIGNER_HTTP_SIGNATURE_HEADER

#include "agentsig/common/types.hpp"
#include "agentsig/crypto/ids.hpp"

#include <string>
#include <variant>

namespace agentsig {

enum class signature_family {
	unknown = 0,
	rsa,
	ecdsa,
	dsa,
	ed25519
};

std::string_view to_string(signature_family);

/// family of the signature format name the agent returned
signature_family key_format_to_family(std::string_view format);

struct rsa_signature {
	byte_vector blob;

	/// padded base64 of the signature
	std::string to_string() const;
	std::string_view signature_type() const;
};

struct ecdsa_signature {
	key_type curve{};
	// unsigned big-endian integers without leading zeroes
	byte_vector r;
	byte_vector s;

	/// padded base64 of DER encoded SEQUENCE { INTEGER r, INTEGER s }
	std::string to_string() const;
	std::string_view signature_type() const;
};

using http_auth_signature = std::variant<rsa_signature, ecdsa_signature>;

/// decode agent signature, throws signer_error (signer_unsupported_algorithm or signer_signature_decode_error)
http_auth_signature decode_signature(std::string_view format, const_span blob);

/// DER SEQUENCE of two INTEGERs, r and s as unsigned big-endian
byte_vector der_encode_ecdsa_signature(const_span r, const_span s);

struct normalised_signature {
	std::string text;
	std::string algorithm;
};

/// decode agent signature and give the text and algorithm label used in the HTTP signature header
normalised_signature normalise_signature(std::string_view format, const_span blob);

}

#endif
