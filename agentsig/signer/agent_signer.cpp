
#include "agent_signer.hpp"
#include "key_matcher.hpp"
#include "agentsig/agent/packet_types.hpp"
#include "agentsig/agent/socket_agent_client.hpp"
#include "agentsig/common/binary_util.hpp"
#include "agentsig/common/errors.hpp"
#include "agentsig/core/fingerprint.hpp"

namespace agentsig {

static void check_config(signer_config const& config) {
	if(config.fingerprint.empty()) {
		throw signer_error(signer_config_error, "No key fingerprint given");
	}
	if(config.account.empty()) {
		throw signer_error(signer_config_error, "No account given");
	}
}

std::string make_key_id(std::string_view account, std::string_view user, std::string_view fingerprint) {
	if(user.empty()) {
		return simple_format("/{}/keys/{}", account, fingerprint);
	}
	return simple_format("/{}/users/{}/keys/{}", account, user, fingerprint);
}

agent_signer::agent_signer(std::shared_ptr<agent::agent_client> agent, signer_config const& config, logger& log, crypto_context crypto)
: agent_(std::move(agent))
, config_(config)
, log_(log)
, crypto_(std::move(crypto))
, call_{log_}
{
	check_config(config_);
	if(!agent_) {
		throw signer_error(signer_config_error, "No agent given");
	}

	key_ = match_key(*agent_, config_.fingerprint, crypto_, call_);

	std::string digest = sha256_fingerprint(key_.blob, crypto_, call_);
	if(digest.empty()) {
		throw signer_error(signer_unsupported_algorithm, "Failed to calculate key fingerprint");
	}
	fingerprint_ = format_fingerprint(digest);
	key_id_ = make_key_id(config_.account, config_.user, fingerprint_);

	log_.log(logger::debug, "Key fingerprint {}, key id {}", fingerprint_, key_id_);

	// ask rsa-sha2-256 signatures for rsa keys so that the header algorithm matches
	ssh_bf_reader reader(key_.blob);
	std::string_view type_name;
	if(reader.read(type_name) && type_name == to_string(key_type::ssh_rsa)) {
		sign_flags_ = agent::rsa_sha2_256;
	}

	if(config_.verify_signatures) {
		load_public_key();
	}

	try {
		default_algorithm_ = sign_payload(probe_message).algorithm;
	} catch(signer_error const& e) {
		log_.log(logger::error, "Probe signature failed: {}", e.what());
		throw_wrapped(signer_signing_error, "Failed to sign probe message", e);
	}

	log_.log(logger::info, "Signing with {} key {}", default_algorithm_, fingerprint_);
}

void agent_signer::load_public_key() {
	public_key_ = load_ssh_public_key(key_.blob, crypto_, call_);
	if(!public_key_.valid()) {
		throw signer_error(signer_unsupported_algorithm, "Cannot load agent key '" + key_.comment + "' for signature verification");
	}
}

normalised_signature agent_signer::sign_payload(std::string_view payload) const {
	auto sig = agent_->sign(key_, to_span(payload), sign_flags_);

	log_.log(logger::debug_trace, "Agent signed {} bytes with {}", payload.size(), sig.format);

	// agents that do not know the flag answer with ssh-rsa (sha1)
	if(sign_flags_ == agent::rsa_sha2_256 && sig.format != "rsa-sha2-256") {
		throw signer_error(signer_signature_decode_error, "Agent returned " + sig.format + " signature for rsa-sha2-256 request");
	}

	auto res = normalise_signature(sig.format, sig.blob);

	if(config_.verify_signatures && !public_key_.verify(to_span(payload), sig.format, sig.blob)) {
		throw signer_error(signer_signature_decode_error, "Agent signature (" + sig.format + ") failed verification");
	}

	return res;
}

std::string agent_signer::sign(std::string_view date) {
	try {
		auto sig = sign_payload("date: " + std::string(date));
		return simple_format("keyId=\"{}\",algorithm=\"{}\",headers=\"date\",signature=\"{}\"",
			key_id_, sig.algorithm, sig.text);
	} catch(signer_error const& e) {
		log_.log(logger::error, "Signing date header failed: {}", e.what());
		throw_wrapped(signer_signing_error, "Error signing date header", e);
	}
}

normalised_signature agent_signer::sign_raw(std::string_view payload) {
	try {
		return sign_payload(payload);
	} catch(signer_error const& e) {
		log_.log(logger::error, "Signing data failed: {}", e.what());
		throw_wrapped(signer_signing_error, "Error signing data", e);
	}
}

std::string const& agent_signer::key_fingerprint() const {
	return fingerprint_;
}

std::string const& agent_signer::default_algorithm() const {
	return default_algorithm_;
}

std::string const& agent_signer::key_id() const {
	return key_id_;
}

agent::agent_identity const& agent_signer::key() const {
	return key_;
}

std::shared_ptr<agent_signer> create_agent_signer(signer_config const& config, logger& log, crypto_context crypto) {
	check_config(config);

	std::string address = config.agent_address.empty() ? agent::agent_address_from_env() : config.agent_address;

	auto agent = std::make_shared<agent::socket_agent_client>(address, log);
	return std::make_shared<agent_signer>(std::move(agent), config, log, std::move(crypto));
}

}
