
#include "crypto_context.hpp"
#include "agentsig/crypto/nettle/crypto_context.hpp"

namespace agentsig {

crypto_context default_crypto_context() {
	return nettle::create_nettle_context();
}

}
