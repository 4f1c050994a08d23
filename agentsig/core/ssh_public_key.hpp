#ifndef AGENTSIG_SSH_PUBLIC_KEY_HEADER
#define AGENTSIG_SSH_PUBLIC_KEY_HEADER

#include "agentsig/crypto/crypto_context.hpp"
#include "agentsig/crypto/public_key.hpp"
#include <memory>

namespace agentsig {

/** \brief SSH Public Key that is used for signature checking
 */
class ssh_public_key {
public:
	ssh_public_key() = default;
	ssh_public_key(std::shared_ptr<public_key>);

	key_type type() const;
	bool valid() const;

	/// signature_format is the signature algorithm name (e.g. rsa-sha2-256) and blob the signature data as given by agent
	bool verify(const_span msg, std::string_view signature_format, const_span blob) const;

private:
	std::shared_ptr<public_key> key_impl_;
};

/// loads rsa and ecdsa keys, other key types give invalid key
ssh_public_key load_ssh_public_key(const_span data, crypto_context const&, crypto_call_context const&);

}

#endif
