#include "crypto.hpp"
#include "fake_agent.hpp"
#include "agentsig/signer/key_matcher.hpp"
#include <catch2/catch.hpp>

namespace agentsig::test {

static signer_error_code match_error(fake_agent& agent, std::string_view fingerprint) {
	crypto_test_context ctx;
	try {
		match_key(agent, fingerprint, ctx, ctx.call);
	} catch(signer_error const& e) {
		return e.code();
	}
	return signer_noerror;
}

TEST_CASE("match key with all fingerprint forms", "[unit]") {
	crypto_test_context ctx;
	fake_agent agent({to_identity(p256_key), to_identity(rsa_key), to_identity(ed25519_key)});

	auto fp = GENERATE(
		std::string("e6ea6158db717dc07827f716a54baf56"),
		std::string("e6:ea:61:58:db:71:7d:c0:78:27:f7:16:a5:4b:af:56"),
		std::string("MD5:e6:ea:61:58:db:71:7d:c0:78:27:f7:16:a5:4b:af:56"),
		std::string("ip1DZLAAHFWLqToaXXWYWvE2DprbGQCSDhFhavDcCiI"),
		std::string("SHA256:ip1DZLAAHFWLqToaXXWYWvE2DprbGQCSDhFhavDcCiI"),
		std::string(rsa_formatted_fingerprint));
	CAPTURE(fp);

	auto key = match_key(agent, fp, ctx, ctx.call);
	CHECK(key.comment == "rsa-test");
	CHECK(key.blob == decode_base64(rsa_key.blob));
	CHECK(agent.list_calls == 1);
}

TEST_CASE("match every key type", "[unit]") {
	crypto_test_context ctx;
	fake_agent agent({to_identity(rsa_key), to_identity(p256_key), to_identity(p384_key), to_identity(p521_key), to_identity(ed25519_key)});

	for(auto&& k : {rsa_key, p256_key, p384_key, p521_key, ed25519_key}) {
		CAPTURE(k.comment);
		CHECK(match_key(agent, k.md5, ctx, ctx.call).comment == k.comment);
		CHECK(match_key(agent, "SHA256:" + std::string(k.sha256), ctx, ctx.call).comment == k.comment);
	}
}

TEST_CASE("key not found", "[unit]") {
	SECTION("empty agent") {
		fake_agent agent;
		CHECK(match_error(agent, rsa_key.md5) == signer_key_not_found);
	}
	SECTION("no matching key") {
		fake_agent agent({to_identity(p256_key), to_identity(ed25519_key)});
		CHECK(match_error(agent, rsa_key.md5) == signer_key_not_found);
		CHECK(match_error(agent, rsa_key.sha256) == signer_key_not_found);
	}
	SECTION("empty fingerprint") {
		fake_agent agent({to_identity(p256_key)});
		CHECK(match_error(agent, "") == signer_key_not_found);
		CHECK(match_error(agent, "SHA256:") == signer_key_not_found);
	}
	SECTION("case matters for base64") {
		fake_agent agent({to_identity(rsa_key)});
		CHECK(match_error(agent, "IP1DZLAAHFWLQTOAXXWYWVE2DPRBGQCSDHFHAVDCCII") == signer_key_not_found);
	}
}

TEST_CASE("list failure", "[unit]") {
	fake_agent agent({to_identity(rsa_key)});
	agent.fail_list = true;
	CHECK(match_error(agent, rsa_key.md5) == signer_agent_list_error);
}

TEST_CASE("last matching key wins", "[unit]") {
	crypto_test_context ctx;

	auto first = to_identity(rsa_key);
	first.comment = "first";
	auto second = to_identity(rsa_key);
	second.comment = "second";

	fake_agent agent({first, to_identity(p256_key), second, to_identity(ed25519_key)});

	CHECK(match_key(agent, rsa_key.md5, ctx, ctx.call).comment == "second");
	CHECK(match_key(agent, rsa_key.sha256, ctx, ctx.call).comment == "second");
}

}
