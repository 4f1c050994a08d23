#include "ids.hpp"

namespace agentsig {

std::string_view to_string(key_type t) {
	using enum key_type;
	if(t == ssh_rsa) return "ssh-rsa";
	if(t == ssh_ed25519) return "ssh-ed25519";
	if(t == ecdsa_sha2_nistp256) return "ecdsa-sha2-nistp256";
	if(t == ecdsa_sha2_nistp384) return "ecdsa-sha2-nistp384";
	if(t == ecdsa_sha2_nistp521) return "ecdsa-sha2-nistp521";
	return "unknown";
}

key_type from_string(type_tag<key_type>, std::string_view s) {
	using enum key_type;
	if(s == "ssh-rsa") return ssh_rsa;
	if(s == "ssh-ed25519") return ssh_ed25519;
	if(s == "ecdsa-sha2-nistp256") return ecdsa_sha2_nistp256;
	if(s == "ecdsa-sha2-nistp384") return ecdsa_sha2_nistp384;
	if(s == "ecdsa-sha2-nistp521") return ecdsa_sha2_nistp521;
	return unknown;
}

key_type from_curve_name(std::string_view s) {
	using enum key_type;
	if(s == "nistp256") return ecdsa_sha2_nistp256;
	if(s == "nistp384") return ecdsa_sha2_nistp384;
	if(s == "nistp521") return ecdsa_sha2_nistp521;
	return unknown;
}

std::size_t ecdsa_field_size(key_type t) {
	using enum key_type;
	if(t == ecdsa_sha2_nistp256) return 32;
	if(t == ecdsa_sha2_nistp384) return 48;
	if(t == ecdsa_sha2_nistp521) return 66;
	return 0;
}

std::string_view to_string(hash_type t) {
	using enum hash_type;
	if(t == md5) return "md5";
	if(t == sha1) return "sha1";
	if(t == sha2_256) return "sha256";
	if(t == sha2_384) return "sha384";
	if(t == sha2_512) return "sha512";
	return "unknown";
}

hash_type ecdsa_hash_type(key_type t) {
	using enum key_type;
	if(t == ecdsa_sha2_nistp256) return hash_type::sha2_256;
	if(t == ecdsa_sha2_nistp384) return hash_type::sha2_384;
	if(t == ecdsa_sha2_nistp521) return hash_type::sha2_512;
	return hash_type::unknown;
}

}
