
#include "ssh_public_key.hpp"
#include "agentsig/common/binary_util.hpp"

#include <algorithm>

namespace agentsig {

ssh_public_key::ssh_public_key(std::shared_ptr<public_key> pkey)
: key_impl_(std::move(pkey))
{
}

key_type ssh_public_key::type() const {
	return key_impl_ ? key_impl_->type() : key_type::unknown;
}

bool ssh_public_key::valid() const {
	return static_cast<bool>(key_impl_);
}

// converts "mpint r, mpint s" to r and s padded to the field size and concatenated
static byte_vector ecdsa_sig(const_span payload, std::size_t field) {
	ssh_bf_reader r(payload);
	const_mpint_span p1, p2;
	if(!r.read(p1) || !r.read(p2) || r.size_left() != 0) {
		return {};
	}
	if(p1.sign == const_mpint_span::signed_t || p2.sign == const_mpint_span::signed_t) {
		return {};
	}
	if(p1.data.size() > field || p2.data.size() > field) {
		return {};
	}
	byte_vector sig(2*field);
	std::copy(p1.data.begin(), p1.data.end(), sig.begin() + (field - p1.data.size()));
	std::copy(p2.data.begin(), p2.data.end(), sig.begin() + (2*field - p2.data.size()));
	return sig;
}

static hash_type rsa_signature_hash(std::string_view format) {
	if(format == "ssh-rsa") return hash_type::sha1;
	if(format == "rsa-sha2-256") return hash_type::sha2_256;
	if(format == "rsa-sha2-512") return hash_type::sha2_512;
	return hash_type::unknown;
}

bool ssh_public_key::verify(const_span msg, std::string_view format, const_span blob) const {
	using enum key_type;
	auto t = type();
	if(t == unknown) {
		return false;
	}

	if(t == ssh_rsa) {
		auto hash = rsa_signature_hash(format);
		return hash != hash_type::unknown && key_impl_->verify(msg, blob, hash);
	}

	if(format != to_string(t)) {
		return false;
	}

	auto sig = ecdsa_sig(blob, ecdsa_field_size(t));
	return !sig.empty() && key_impl_->verify(msg, sig, ecdsa_hash_type(t));
}

static ssh_public_key load_rsa_public_key(ssh_bf_reader& r, crypto_context const& crypto, crypto_call_context const& call) {
	call.log.log(logger::debug_trace, "Loading ssh rsa public key");
	std::string_view e, n;
	if(r.read(e) && r.read(n)) {
		return ssh_public_key(crypto.construct_public_key(rsa_public_key_data{to_umpint(e), to_umpint(n)}, call));
	} else {
		call.log.log(logger::debug_trace, "Failed to read ssh rsa public key");
	}
	return {};
}

static ssh_public_key load_ecdsa_public_key(ssh_bf_reader& r, key_type type, crypto_context const& crypto, crypto_call_context const& call) {
	call.log.log(logger::debug_trace, "Loading ssh ecdsa public key");
	std::string_view curve, ecc_point;
	if(r.read(curve) && r.read(ecc_point)) {
		if(from_curve_name(curve) == type) {
			return ssh_public_key(crypto.construct_public_key(
				ecdsa_public_key_data{type, to_span(ecc_point)}, call));
		} else {
			call.log.log(logger::debug_trace, "Invalid ecdsa public key, curve {} does not match key type", curve);
		}
	} else {
		call.log.log(logger::debug_trace, "Failed to read ssh ecdsa public key");
	}
	return {};
}

ssh_public_key load_ssh_public_key(const_span data, crypto_context const& crypto, crypto_call_context const& call) {
	using enum key_type;
	ssh_bf_reader r(data);
	std::string_view type_name;
	if(r.read(type_name)) {
		auto type = from_string(type_tag<key_type>{}, type_name);
		if(type == ssh_rsa) {
			return load_rsa_public_key(r, crypto, call);
		} else if(type == ecdsa_sha2_nistp256 || type == ecdsa_sha2_nistp384 || type == ecdsa_sha2_nistp521) {
			return load_ecdsa_public_key(r, type, crypto, call);
		} else {
			call.log.log(logger::debug_trace, "Unsupported public key type: {}", type_name);
		}
	}
	return {};
}

}
