
#include "nettle_helper.hpp"
#include "agentsig/crypto/crypto_call_context.hpp"
#include "agentsig/crypto/public_key.hpp"
#include "agentsig/crypto/ids.hpp"
#include <memory>

#include <nettle/bignum.h>
#include <nettle/ecdsa.h>
#include <nettle/dsa.h>
#include <nettle/rsa.h>
#include <nettle/sha1.h>
#include <nettle/sha2.h>
#include <nettle/ecc-curve.h>

namespace agentsig::nettle {

class rsa_public_key : public public_key {
public:
	rsa_public_key(rsa_public_key_data const& d)
	{
		nettle_rsa_public_key_init(&public_key_);
		nettle_mpz_set_str_256_u(public_key_.e, d.e.data.size(), to_uint8_ptr(d.e.data));
		nettle_mpz_set_str_256_u(public_key_.n, d.n.data.size(), to_uint8_ptr(d.n.data));
		is_valid_ = nettle_rsa_public_key_prepare(&public_key_) == 1;
	}

	~rsa_public_key() {
		nettle_rsa_public_key_clear(&public_key_);
	}

	rsa_public_key(rsa_public_key const&) = delete;
	rsa_public_key& operator=(rsa_public_key const&) = delete;

	bool valid() const {
		return is_valid_;
	}

	key_type type() const override {
		return key_type::ssh_rsa;
	}

	bool verify(const_span in, const_span signature, hash_type hash) const override {
		integer sig(signature);

		bool res = false;
		if(hash == hash_type::sha1) {
			sha1_ctx ctx;
			nettle_sha1_init(&ctx);
			nettle_sha1_update(&ctx, in.size(), to_uint8_ptr(in));
			res = nettle_rsa_sha1_verify(&public_key_, &ctx, sig) == 1;
		} else if(hash == hash_type::sha2_256) {
			sha256_ctx ctx;
			nettle_sha256_init(&ctx);
			nettle_sha256_update(&ctx, in.size(), to_uint8_ptr(in));
			res = nettle_rsa_sha256_verify(&public_key_, &ctx, sig) == 1;
		} else if(hash == hash_type::sha2_512) {
			sha512_ctx ctx;
			nettle_sha512_init(&ctx);
			nettle_sha512_update(&ctx, in.size(), to_uint8_ptr(in));
			res = nettle_rsa_sha512_verify(&public_key_, &ctx, sig) == 1;
		}
		return res;
	}

private:
	bool is_valid_{};
	::rsa_public_key public_key_;
};


static ecc_curve const* to_nettle_curve(key_type t) {
	using enum key_type;
	if(t == ecdsa_sha2_nistp256) return nettle_get_secp_256r1();
	if(t == ecdsa_sha2_nistp384) return nettle_get_secp_384r1();
	if(t == ecdsa_sha2_nistp521) return nettle_get_secp_521r1();
	return nullptr;
}

static byte_vector ecdsa_digest(key_type t, const_span msg) {
	byte_vector out;
	if(ecdsa_hash_type(t) == hash_type::sha2_256) {
		sha256_ctx ctx;
		out.resize(SHA256_DIGEST_SIZE);
		nettle_sha256_init(&ctx);
		nettle_sha256_update(&ctx, msg.size(), to_uint8_ptr(msg));
		nettle_sha256_digest(&ctx, out.size(), to_uint8_ptr(out));
	} else if(ecdsa_hash_type(t) == hash_type::sha2_384) {
		sha512_ctx ctx;
		out.resize(SHA384_DIGEST_SIZE);
		nettle_sha384_init(&ctx);
		nettle_sha512_update(&ctx, msg.size(), to_uint8_ptr(msg));
		nettle_sha384_digest(&ctx, out.size(), to_uint8_ptr(out));
	} else if(ecdsa_hash_type(t) == hash_type::sha2_512) {
		sha512_ctx ctx;
		out.resize(SHA512_DIGEST_SIZE);
		nettle_sha512_init(&ctx);
		nettle_sha512_update(&ctx, msg.size(), to_uint8_ptr(msg));
		nettle_sha512_digest(&ctx, out.size(), to_uint8_ptr(out));
	}
	return out;
}

class ecdsa_public_key : public public_key {
public:
	ecdsa_public_key(ecdsa_public_key_data const& d, crypto_call_context const& call)
	: type_(d.ecdsa_type)
	{
		std::size_t const field = ecdsa_field_size(type_);
		auto curve = to_nettle_curve(type_);
		if(!curve) {
			call.log.log(logger::debug_trace, "Unsupported ecdsa curve");
			return;
		}
		ecc_point_init(&ecc_point_, curve);
		initialised_ = true;

		// see the size is correct and it is uncompressed ecc point, otherwise don't bother
		if(d.ecc_point.size() == 1+2*field && d.ecc_point[0] == std::byte{0x04}) {
			integer x(d.ecc_point.subspan(1, field));
			integer y(d.ecc_point.subspan(1+field, field));
			is_valid_ = nettle_ecc_point_set(&ecc_point_, x, y) == 1;
		} else {
			call.log.log(logger::debug_trace, "Invalid ecc point for ecdsa public key");
		}
	}

	~ecdsa_public_key() {
		if(initialised_) {
			ecc_point_clear(&ecc_point_);
		}
	}

	ecdsa_public_key(ecdsa_public_key const&) = delete;
	ecdsa_public_key& operator=(ecdsa_public_key const&) = delete;

	bool valid() const {
		return is_valid_;
	}

	key_type type() const override {
		return type_;
	}

	bool verify(const_span msg, const_span signature, hash_type) const override {
		std::size_t const field = ecdsa_field_size(type_);
		if(signature.size() != 2*field) {
			return false;
		}

		auto digest = ecdsa_digest(type_, msg);

		dsa_signature sig;
		nettle_dsa_signature_init(&sig);
		nettle_mpz_set_str_256_u(sig.r, field, to_uint8_ptr(signature));
		nettle_mpz_set_str_256_u(sig.s, field, to_uint8_ptr(signature)+field);
		bool res = nettle_ecdsa_verify(&ecc_point_, digest.size(), to_uint8_ptr(digest), &sig) == 1;
		nettle_dsa_signature_clear(&sig);
		return res;
	}

private:
	bool initialised_{};
	bool is_valid_{};
	key_type type_;
	ecc_point ecc_point_;
};


std::shared_ptr<agentsig::public_key> create_public_key(public_key_data const& d, crypto_call_context const& call) {
	using enum key_type;
	auto t = d.type();
	if(t == ssh_rsa) {
		auto key = std::make_shared<rsa_public_key>(static_cast<rsa_public_key_data const&>(d));
		if(key->valid()) {
			return key;
		}
	} else if(t == ecdsa_sha2_nistp256 || t == ecdsa_sha2_nistp384 || t == ecdsa_sha2_nistp521) {
		auto key = std::make_shared<ecdsa_public_key>(static_cast<ecdsa_public_key_data const&>(d), call);
		if(key->valid()) {
			return key;
		}
	}
	return nullptr;
}

}
