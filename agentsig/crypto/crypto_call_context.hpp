#ifndef AGENTSIG_CRYPTO_CRYPTO_CALL_CONTEXT_HEADER
#define AGENTSIG_CRYPTO_CRYPTO_CALL_CONTEXT_HEADER

#include "agentsig/common/types.hpp"
#include "agentsig/common/logger.hpp"

namespace agentsig {

/// Context that is passed to crypto construct functions
struct crypto_call_context {
	logger& log;
};

}

#endif
