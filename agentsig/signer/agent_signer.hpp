#ifndef AGENTSIG_SIGNER_AGENT_SIGNER_HEADER
#define AGENTSIG_SIGNER_AGENT_SIGNER_HEADER

#include "signer.hpp"
#include "signer_config.hpp"
#include "agentsig/agent/agent_client.hpp"
#include "agentsig/core/ssh_public_key.hpp"
#include "agentsig/crypto/crypto_context.hpp"

#include <memory>

namespace agentsig {

/** \brief Signer using key held by ssh-agent
 *
 *  The constructor finds the configured key from agent and signs a probe message to learn the
 *  signature algorithm. It either succeeds fully or throws signer_error.
 *
 *  sign and sign_raw can be called concurrently, the agent connection is shared.
 */
class agent_signer : public signer {
public:
	agent_signer(std::shared_ptr<agent::agent_client>, signer_config const&, logger&, crypto_context = default_crypto_context());

	std::string sign(std::string_view date) override;
	normalised_signature sign_raw(std::string_view payload) override;

	std::string const& key_fingerprint() const override;
	std::string const& default_algorithm() const override;
	std::string const& key_id() const override;

	agent::agent_identity const& key() const;

private:
	void load_public_key();
	normalised_signature sign_payload(std::string_view payload) const;

private:
	std::shared_ptr<agent::agent_client> agent_;
	signer_config const config_;
	logger& log_;
	crypto_context const crypto_;
	crypto_call_context const call_;

	agent::agent_identity key_;
	ssh_public_key public_key_;
	std::uint32_t sign_flags_{};

	std::string fingerprint_;
	std::string key_id_;
	std::string default_algorithm_;
};

/// message signed when constructing the signer
std::string_view const probe_message = "HelloWorld";

/// key identifier, /<account>/keys/<fingerprint> or /<account>/users/<user>/keys/<fingerprint>
std::string make_key_id(std::string_view account, std::string_view user, std::string_view fingerprint);

/** \brief Connect to agent and construct signer
 *
 *  Uses config.agent_address or SSH_AUTH_SOCK if not set. Throws signer_error(signer_config_error) before
 *  connecting if there is no address.
 */
std::shared_ptr<agent_signer> create_agent_signer(signer_config const&, logger&, crypto_context = default_crypto_context());

}

#endif
