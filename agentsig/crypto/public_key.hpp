#ifndef AGENTSIG_CRYPTO_PUBLIC_KEY_HEADER
#define AGENTSIG_CRYPTO_PUBLIC_KEY_HEADER

#include "ids.hpp"
#include "agentsig/common/types.hpp"

namespace agentsig {

struct public_key_data {
	virtual key_type type() const = 0;
protected:
	~public_key_data() = default;
};

class public_key {
public:
	virtual ~public_key() = default;

	virtual key_type type() const = 0;

	/** \brief verify signature of msg
	 *
	 *  rsa:     signature is the raw PKCS#1 v1.5 signature, hash selects the digest (sha1, sha2_256 or sha2_512)
	 *  ecdsa:   signature is r followed by s, both padded to the curve field size, hash is ignored (fixed by the curve)
	 */
	virtual bool verify(const_span msg, const_span signature, hash_type hash) const = 0;
};

struct rsa_public_key_data : public_key_data {
	rsa_public_key_data() = default;
	rsa_public_key_data(const_mpint_span e, const_mpint_span n)
	: e(e)
	, n(n)
	{
	}

	const_mpint_span e;
	const_mpint_span n;

	key_type type() const override {
		return key_type::ssh_rsa;
	}
};

struct ecdsa_public_key_data : public_key_data {
	ecdsa_public_key_data(key_type t, const_span ecc_point = {})
	: ecdsa_type(t)
	, ecc_point(ecc_point)
	{
	}

	key_type ecdsa_type;

	// the public key encoded from an elliptic curve point into an octet string (https://www.secg.org/sec1-v2.pdf)
	const_span ecc_point;

	key_type type() const override {
		return ecdsa_type;
	}
};

}

#endif
