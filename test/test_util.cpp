
#include "log.hpp"
#include "agentsig/common/errors.hpp"
#include "agentsig/common/util.hpp"
#include "agentsig/core/fingerprint.hpp"
#include <catch2/catch.hpp>

namespace agentsig::test {

static byte_vector to_vec(std::string_view s) {
	return byte_vector((std::byte const*)s.data(), (std::byte const*)s.data()+s.size());
}

TEST_CASE("decode_base64", "[unit]") {
	CHECK(decode_base64("") == to_vec(""));
	CHECK(decode_base64("Zg") == to_vec("f"));
	CHECK(decode_base64("Zg==") == to_vec("f"));
	CHECK(decode_base64("Zm8") == to_vec("fo"));
	CHECK(decode_base64("Zm8=") == to_vec("fo"));
	CHECK(decode_base64("Zm9v") == to_vec("foo"));
	CHECK(decode_base64("Zm9vYg") == to_vec("foob"));
	CHECK(decode_base64("Zm9vYg==") == to_vec("foob"));
	CHECK(decode_base64("Zm9vYmE") == to_vec("fooba"));
	CHECK(decode_base64("Zm9vYmE=") == to_vec("fooba"));
	CHECK(decode_base64("Zm9vYmFy") == to_vec("foobar"));

	CHECK(decode_base64("=").empty());
	CHECK(decode_base64("==").empty());
	CHECK(decode_base64("-").empty());
	CHECK(decode_base64("G").empty());
	CHECK(decode_base64("G===").empty());
	CHECK(decode_base64("Zm9vYgfdd").empty());
}

TEST_CASE("encode_base64", "[unit]") {
	CHECK(encode_base64(to_span("")) == "");
	CHECK(encode_base64(to_span("f")) == "Zg");
	CHECK(encode_base64(to_span("f"), true) == "Zg==");
	CHECK(encode_base64(to_span("fo")) == "Zm8");
	CHECK(encode_base64(to_span("fo"), true) == "Zm8=");
	CHECK(encode_base64(to_span("foo")) == "Zm9v");
	CHECK(encode_base64(to_span("foo"), true) == "Zm9v");
	CHECK(encode_base64(to_span("foob")) == "Zm9vYg");
	CHECK(encode_base64(to_span("foob"), true) == "Zm9vYg==");
	CHECK(encode_base64(to_span("fooba")) == "Zm9vYmE");
	CHECK(encode_base64(to_span("fooba"), true) == "Zm9vYmE=");
	CHECK(encode_base64(to_span("foobar")) == "Zm9vYmFy");
}

TEST_CASE("encode_hex", "[unit]") {
	CHECK(encode_hex(to_span("")) == "");
	CHECK(encode_hex(to_span("abc")) == "616263");
	byte_vector v{std::byte{0x00}, std::byte{0x0f}, std::byte{0xa0}, std::byte{0xff}};
	CHECK(encode_hex(v) == "000fa0ff");
}

TEST_CASE("format fingerprint", "[unit]") {
	CHECK(format_fingerprint("") == "SHA256:");
	CHECK(format_fingerprint("ab") == "SHA256:ab");
	CHECK(format_fingerprint("abc") == "SHA256:ab:c");
	CHECK(format_fingerprint("abcd") == "SHA256:ab:cd");
	CHECK(format_fingerprint("ip1DZLAAHFWLqToaXXWYWvE2DprbGQCSDhFhavDcCiI")
		== "SHA256:ip:1D:ZL:AA:HF:WL:qT:oa:XX:WY:Wv:E2:Dp:rb:GQ:CS:Dh:Fh:av:Dc:Ci:I");
}

TEST_CASE("normalise fingerprint", "[unit]") {
	CHECK(normalise_fingerprint("e6ea6158db717dc07827f716a54baf56") == "e6ea6158db717dc07827f716a54baf56");
	CHECK(normalise_fingerprint("e6:ea:61:58:db:71:7d:c0:78:27:f7:16:a5:4b:af:56") == "e6ea6158db717dc07827f716a54baf56");
	CHECK(normalise_fingerprint("MD5:e6:ea:61:58:db:71:7d:c0:78:27:f7:16:a5:4b:af:56") == "e6ea6158db717dc07827f716a54baf56");
	CHECK(normalise_fingerprint("SHA256:ip1DZLAAHFWLqToaXXWYWvE2DprbGQCSDhFhavDcCiI") == "ip1DZLAAHFWLqToaXXWYWvE2DprbGQCSDhFhavDcCiI");
	CHECK(normalise_fingerprint("SHA256:ip:1D:ZL:AA:HF:WL:qT:oa:XX:WY:Wv:E2:Dp:rb:GQ:CS:Dh:Fh:av:Dc:Ci:I") == "ip1DZLAAHFWLqToaXXWYWvE2DprbGQCSDhFhavDcCiI");
	CHECK(normalise_fingerprint("") == "");
	CHECK(normalise_fingerprint("SHA256:") == "");
}

TEST_CASE("signer errors", "[unit]") {
	signer_error e(signer_key_not_found, "no key");
	CHECK(e.code() == signer_key_not_found);
	CHECK(e.cause() == signer_key_not_found);
	CHECK(std::string(e.what()) == "no key");

	try {
		throw_wrapped(signer_signing_error, "Error signing date header", e);
	} catch(signer_error const& w) {
		CHECK(w.code() == signer_signing_error);
		CHECK(w.cause() == signer_key_not_found);
		CHECK(std::string(w.what()) == "Error signing date header: no key");
	}

	CHECK(to_string(signer_config_error) == "configuration error");
	CHECK(to_string(signer_signature_decode_error) == "signature decode error");
}

}
