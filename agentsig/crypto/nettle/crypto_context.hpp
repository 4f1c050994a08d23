#ifndef AGENTSIG_CRYPTO_NETTLE_CRYPTO_CONTEXT_HEADER
#define AGENTSIG_CRYPTO_NETTLE_CRYPTO_CONTEXT_HEADER

#include "agentsig/crypto/crypto_context.hpp"

namespace agentsig::nettle {

crypto_context create_nettle_context();

}

#endif
