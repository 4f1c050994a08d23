#ifndef AGENTSIG_CRYPTO_CRYPTO_CONTEXT_HEADER
#define AGENTSIG_CRYPTO_CRYPTO_CONTEXT_HEADER

#include "ids.hpp"
#include "crypto_call_context.hpp"
#include "public_key.hpp"
#include "hash.hpp"

#include <functional>
#include <memory>

namespace agentsig {

template<typename Impl, typename... ExtraParams>
using ctor = std::function<std::unique_ptr<Impl> (ExtraParams const&..., crypto_call_context const&)>;

template<typename Impl, typename... ExtraParams>
using shared_ctor = std::function<std::shared_ptr<Impl> (ExtraParams const&..., crypto_call_context const&)>;

/// Context that is used to construct all crypto objects
struct crypto_context {
	/// construct public key from public key data (derived class to give the data which has the key type, the data is copied)
	shared_ctor<public_key, public_key_data> construct_public_key{};
	/// construct hash algorithm
	ctor<hash, hash_type> construct_hash{};
};

crypto_context default_crypto_context();

}

#endif
