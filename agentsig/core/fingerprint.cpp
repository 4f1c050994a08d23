
#include "fingerprint.hpp"
#include "agentsig/common/util.hpp"

namespace agentsig {

static byte_vector digest_of(hash_type type, const_span blob, crypto_context const& crypto, crypto_call_context const& call) {
	byte_vector res;
	auto h = crypto.construct_hash(type, call);
	if(h) {
		h->process(blob);
		res = h->digest();
	} else {
		call.log.log(logger::error, "Failed to construct {} hash", to_string(type));
	}
	return res;
}

std::string sha256_fingerprint(const_span key_blob, crypto_context const& crypto, crypto_call_context const& call) {
	auto d = digest_of(hash_type::sha2_256, key_blob, crypto, call);
	return d.empty() ? std::string() : encode_base64(d);
}

std::string md5_fingerprint(const_span key_blob, crypto_context const& crypto, crypto_call_context const& call) {
	auto d = digest_of(hash_type::md5, key_blob, crypto, call);
	return d.empty() ? std::string() : encode_hex(d);
}

std::string format_fingerprint(std::string_view digest) {
	std::string res = "SHA256:";
	for(std::size_t i = 0; i < digest.size(); i += 2) {
		if(i) {
			res += ':';
		}
		res += digest.substr(i, 2);
	}
	return res;
}

std::string normalise_fingerprint(std::string_view fingerprint) {
	if(fingerprint.starts_with("MD5:")) {
		fingerprint.remove_prefix(4);
	}
	if(fingerprint.starts_with("SHA256:")) {
		fingerprint.remove_prefix(7);
	}

	std::string res;
	res.reserve(fingerprint.size());
	for(char c : fingerprint) {
		if(c != ':') {
			res += c;
		}
	}
	return res;
}

}
