
#include "agentsig/crypto/crypto_call_context.hpp"
#include "agentsig/crypto/ids.hpp"
#include "agentsig/crypto/hash.hpp"
#include <algorithm>
#include <memory>

#include <nettle/md5.h>
#include <nettle/sha1.h>
#include <nettle/sha2.h>

namespace agentsig::nettle {

/// all nettle hashes share the same init/update/digest shape, only the context type and functions differ
template<typename Ctx, std::size_t DigestSize
	, void (*Init)(Ctx*)
	, void (*Update)(Ctx*, std::size_t, std::uint8_t const*)
	, void (*Digest)(Ctx*, std::size_t, std::uint8_t*)>
class digest_hash : public hash {
public:
	digest_hash()
	: hash(DigestSize)
	{
		Init(&ctx_);
	}

	void process(const_span in) override {
		Update(&ctx_, in.size(), to_uint8_ptr(in));
	}

	void digest(span out) override {
		AGENTSIG_ASSERT(out.size() >= DigestSize, "invalid out buffer size");
		std::size_t size = std::min<std::size_t>(DigestSize, out.size());
		Digest(&ctx_, size, to_uint8_ptr(out));
	}

private:
	Ctx ctx_;
};

using md5_hash = digest_hash<md5_ctx, MD5_DIGEST_SIZE, nettle_md5_init, nettle_md5_update, nettle_md5_digest>;
using sha1_hash = digest_hash<sha1_ctx, SHA1_DIGEST_SIZE, nettle_sha1_init, nettle_sha1_update, nettle_sha1_digest>;
using sha2_256_hash = digest_hash<sha256_ctx, SHA256_DIGEST_SIZE, nettle_sha256_init, nettle_sha256_update, nettle_sha256_digest>;
using sha2_384_hash = digest_hash<sha512_ctx, SHA384_DIGEST_SIZE, nettle_sha384_init, nettle_sha512_update, nettle_sha384_digest>;
using sha2_512_hash = digest_hash<sha512_ctx, SHA512_DIGEST_SIZE, nettle_sha512_init, nettle_sha512_update, nettle_sha512_digest>;

std::unique_ptr<agentsig::hash> create_hash(hash_type t, crypto_call_context const& call) {
	using enum hash_type;
	if(t == md5) {
		return std::make_unique<md5_hash>();
	} else if(t == sha1) {
		return std::make_unique<sha1_hash>();
	} else if(t == sha2_256) {
		return std::make_unique<sha2_256_hash>();
	} else if(t == sha2_384) {
		return std::make_unique<sha2_384_hash>();
	} else if(t == sha2_512) {
		return std::make_unique<sha2_512_hash>();
	}
	call.log.log(logger::debug, "Unsupported hash type: {}", to_string(t));
	return nullptr;
}

}
