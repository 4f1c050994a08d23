
#include "http_signature.hpp"
#include "agentsig/common/binary_util.hpp"
#include "agentsig/common/errors.hpp"
#include "agentsig/common/util.hpp"

namespace agentsig {

std::string_view to_string(signature_family f) {
	using enum signature_family;
	switch(f) {
		case rsa: return "rsa";
		case ecdsa: return "ecdsa";
		case dsa: return "dsa";
		case ed25519: return "ed25519";
		case unknown: break;
	}
	return "unknown";
}

signature_family key_format_to_family(std::string_view format) {
	using enum signature_family;
	if(format == "ssh-rsa" || format == "rsa-sha2-256" || format == "rsa-sha2-512") {
		return rsa;
	}
	if(format == "ecdsa-sha2-nistp256" || format == "ecdsa-sha2-nistp384" || format == "ecdsa-sha2-nistp521") {
		return ecdsa;
	}
	if(format == "ssh-dss") {
		return dsa;
	}
	if(format == "ssh-ed25519") {
		return ed25519;
	}
	return unknown;
}

std::string rsa_signature::to_string() const {
	return encode_base64(blob, true);
}

std::string_view rsa_signature::signature_type() const {
	return "rsa-sha256";
}

std::string ecdsa_signature::to_string() const {
	return encode_base64(der_encode_ecdsa_signature(r, s), true);
}

std::string_view ecdsa_signature::signature_type() const {
	using enum key_type;
	switch(curve) {
		case ecdsa_sha2_nistp256: return "ecdsa-sha256";
		case ecdsa_sha2_nistp384: return "ecdsa-sha384";
		case ecdsa_sha2_nistp521: return "ecdsa-sha512";
		default: break;
	}
	return {};
}

static void der_write_length(byte_vector& out, std::size_t len) {
	if(len < 0x80) {
		out.push_back(std::byte(len));
	} else if(len <= 0xff) {
		out.push_back(std::byte{0x81});
		out.push_back(std::byte(len));
	} else {
		AGENTSIG_ASSERT(len <= 0xffff, "DER length too big");
		out.push_back(std::byte{0x82});
		out.push_back(std::byte((len >> 8) & 0xff));
		out.push_back(std::byte(len & 0xff));
	}
}

static byte_vector der_integer(const_span v) {
	while(!v.empty() && v[0] == std::byte{0x0}) {
		v = v.subspan(1);
	}

	bool const pad = v.empty() || (std::to_integer<std::uint8_t>(v[0]) & 0x80);

	byte_vector res;
	res.push_back(std::byte{0x02});
	der_write_length(res, v.size() + (pad ? 1 : 0));
	if(pad) {
		res.push_back(std::byte{0x0});
	}
	res.insert(res.end(), v.begin(), v.end());
	return res;
}

byte_vector der_encode_ecdsa_signature(const_span r, const_span s) {
	byte_vector ir = der_integer(r);
	byte_vector is = der_integer(s);

	byte_vector res;
	res.push_back(std::byte{0x30});
	der_write_length(res, ir.size() + is.size());
	res.insert(res.end(), ir.begin(), ir.end());
	res.insert(res.end(), is.begin(), is.end());
	return res;
}

static rsa_signature decode_rsa_signature(std::string_view format, const_span blob) {
	if(blob.empty()) {
		throw signer_error(signer_signature_decode_error, "Empty " + std::string(format) + " signature");
	}
	return rsa_signature{byte_vector(blob.begin(), blob.end())};
}

// "mpint r, mpint s" (rfc5656 section 3.1.2)
static ecdsa_signature decode_ecdsa_signature(std::string_view format, const_span blob) {
	key_type curve = from_string(type_tag<key_type>{}, format);
	std::size_t const field = ecdsa_field_size(curve);

	ssh_bf_reader reader(blob);
	const_mpint_span r, s;
	if(!reader.read(r) || !reader.read(s) || reader.size_left() != 0) {
		throw signer_error(signer_signature_decode_error, "Failed to parse " + std::string(format) + " signature");
	}

	if(r.sign == const_mpint_span::signed_t || s.sign == const_mpint_span::signed_t) {
		throw signer_error(signer_signature_decode_error, "Negative integer in " + std::string(format) + " signature");
	}

	r = to_umpint(r.data);
	s = to_umpint(s.data);
	if(r.data.empty() || s.data.empty() || r.data.size() > field || s.data.size() > field) {
		throw signer_error(signer_signature_decode_error, "Invalid integer size in " + std::string(format) + " signature");
	}

	return ecdsa_signature{curve, byte_vector(r.data.begin(), r.data.end()), byte_vector(s.data.begin(), s.data.end())};
}

http_auth_signature decode_signature(std::string_view format, const_span blob) {
	switch(key_format_to_family(format)) {
		case signature_family::rsa:
			return decode_rsa_signature(format, blob);
		case signature_family::ecdsa:
			return decode_ecdsa_signature(format, blob);
		default:
			break;
	}
	throw signer_error(signer_unsupported_algorithm, "Unsupported signature algorithm: " + std::string(format));
}

normalised_signature normalise_signature(std::string_view format, const_span blob) {
	return std::visit(
		[](auto const& sig) {
			return normalised_signature{sig.to_string(), std::string(sig.signature_type())};
		}, decode_signature(format, blob));
}

}
