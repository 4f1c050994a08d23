
#include "crypto_context.hpp"

namespace agentsig::nettle {

std::shared_ptr<agentsig::public_key> create_public_key(public_key_data const&, crypto_call_context const&);
std::unique_ptr<agentsig::hash> create_hash(hash_type, crypto_call_context const&);

crypto_context create_nettle_context() {
	return crypto_context{
			create_public_key,
			create_hash
		};
}

}
