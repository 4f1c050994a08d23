#ifndef AGENTSIG_FINGERPRINT_HEADER
#define AGENTSIG_FINGERPRINT_HEADER

#include "agentsig/crypto/crypto_context.hpp"

#include <string>
#include <string_view>

namespace agentsig {

/// sha256 digest of the public key wire encoding as unpadded base64, empty on failure
std::string sha256_fingerprint(const_span key_blob, crypto_context const&, crypto_call_context const&);

/// md5 digest of the public key wire encoding as lowercase hex without separators, empty on failure
std::string md5_fingerprint(const_span key_blob, crypto_context const&, crypto_call_context const&);

/// "SHA256:" followed by the digest with colon between every pair of characters
std::string format_fingerprint(std::string_view sha256_digest);

/// strip "MD5:" or "SHA256:" prefix and remove all colons
std::string normalise_fingerprint(std::string_view fingerprint);

}

#endif
