
#ifndef AGENTSIG_TEST_CRYPTO_HEADER
#define AGENTSIG_TEST_CRYPTO_HEADER

#include "log.hpp"
#include "agentsig/crypto/crypto_context.hpp"

namespace agentsig::test {

struct crypto_test_context : crypto_context {
	crypto_test_context(logger& log = test_log(), crypto_context cc = default_crypto_context())
	: crypto_context(std::move(cc))
	, call{log}
	{
	}

	crypto_call_context call;
};

}

#endif
