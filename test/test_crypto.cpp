#include "crypto.hpp"
#include "keys.hpp"
#include "agentsig/core/fingerprint.hpp"
#include "agentsig/core/ssh_public_key.hpp"
#include <catch2/catch.hpp>

namespace agentsig::test {

test_key const all_keys[] = { rsa_key, p256_key, p384_key, p521_key, ed25519_key };
std::size_t const all_key_count = sizeof(all_keys)/sizeof(*all_keys);

// keys that can be loaded for signature verification
test_key const verify_keys[] = { rsa_key, p256_key, p384_key, p521_key };
key_type const verify_key_types[] = { key_type::ssh_rsa, key_type::ecdsa_sha2_nistp256, key_type::ecdsa_sha2_nistp384, key_type::ecdsa_sha2_nistp521 };
std::size_t const verify_key_count = sizeof(verify_keys)/sizeof(*verify_keys);

TEST_CASE("hash", "[unit][crypto]") {
	crypto_test_context ctx;

	struct {
		hash_type type;
		std::string_view digest;
	} const tests[] = {
		{hash_type::md5, "900150983cd24fb0d6963f7d28e17f72"},
		{hash_type::sha1, "a9993e364706816aba3e25717850c26c9cd0d89d"},
		{hash_type::sha2_256, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"},
		{hash_type::sha2_384, "cb00753f45a35e8bb5a03d699ac65007272c32ab0eded1631a8b605a43ff5bed8086072ba1e7cc2358baeca134c825a7"},
		{hash_type::sha2_512, "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f"}
	};

	for(auto&& t : tests) {
		CAPTURE(to_string(t.type));
		auto h = ctx.construct_hash(t.type, ctx.call);
		REQUIRE(h);
		h->process(to_span("a"));
		h->process(to_span("bc"));
		CHECK(encode_hex(h->digest()) == t.digest);
	}

	CHECK(!ctx.construct_hash(hash_type::unknown, ctx.call));
}

TEST_CASE("ssh public key", "[unit][crypto]") {
	auto i = GENERATE(range(std::size_t(0), verify_key_count));
	auto const& k = verify_keys[i];
	CAPTURE(k.comment);

	crypto_test_context ctx;

	auto pub = load_ssh_public_key(decode_base64(k.blob), ctx, ctx.call);
	REQUIRE(pub.valid());
	CHECK(pub.type() == verify_key_types[i]);
}

TEST_CASE("ed25519 key is not loaded for verification", "[unit][crypto]") {
	crypto_test_context ctx;

	auto pub = load_ssh_public_key(decode_base64(ed25519_key.blob), ctx, ctx.call);
	CHECK(!pub.valid());
	CHECK(pub.type() == key_type::unknown);
	CHECK(!pub.verify(to_span(date_message), ed25519_key.signature_format, decode_base64(ed25519_key.date_signature)));
}

TEST_CASE("key fingerprints", "[unit][crypto]") {
	auto i = GENERATE(range(std::size_t(0), all_key_count));
	auto const& k = all_keys[i];
	CAPTURE(k.comment);

	crypto_test_context ctx;
	auto blob = decode_base64(k.blob);

	CHECK(md5_fingerprint(blob, ctx, ctx.call) == k.md5);
	CHECK(sha256_fingerprint(blob, ctx, ctx.call) == k.sha256);
}

TEST_CASE("verify agent signatures", "[unit][crypto]") {
	auto i = GENERATE(range(std::size_t(0), verify_key_count));
	auto const& k = verify_keys[i];
	CAPTURE(k.comment);

	crypto_test_context ctx;

	auto pub = load_ssh_public_key(decode_base64(k.blob), ctx, ctx.call);
	REQUIRE(pub.valid());

	CHECK(pub.verify(to_span(date_message), k.signature_format, decode_base64(k.date_signature)));
	CHECK(pub.verify(to_span("HelloWorld"), k.signature_format, decode_base64(k.probe_signature)));

	// wrong message
	CHECK(!pub.verify(to_span("HelloWorld"), k.signature_format, decode_base64(k.date_signature)));
	// wrong format
	CHECK(!pub.verify(to_span(date_message), "ssh-dss", decode_base64(k.date_signature)));
	// garbage
	CHECK(!pub.verify(to_span(date_message), k.signature_format, to_span("garbage")));
}

TEST_CASE("verify rsa signature with other hash", "[unit][crypto]") {
	crypto_test_context ctx;

	auto pub = load_ssh_public_key(decode_base64(rsa_key.blob), ctx, ctx.call);
	REQUIRE(pub.valid());

	// signature was made with sha256
	CHECK(!pub.verify(to_span(date_message), "ssh-rsa", decode_base64(rsa_key.date_signature)));
	CHECK(!pub.verify(to_span(date_message), "rsa-sha2-512", decode_base64(rsa_key.date_signature)));
}

TEST_CASE("invalid ssh public key", "[unit][crypto]") {
	crypto_test_context ctx;

	CHECK(!load_ssh_public_key({}, ctx, ctx.call).valid());
	CHECK(!load_ssh_public_key(to_span(std::string_view("\0\0\0\x07ssh-dss", 11)), ctx, ctx.call).valid());

	// truncated
	auto blob = decode_base64(p256_key.blob);
	blob.resize(blob.size() - 10);
	CHECK(!load_ssh_public_key(blob, ctx, ctx.call).valid());
}

}
