#ifndef AGENTSIG_AGENT_AGENT_CLIENT_HEADER
#define AGENTSIG_AGENT_AGENT_CLIENT_HEADER

#include "agentsig/common/types.hpp"

#include <string>
#include <vector>

namespace agentsig::agent {

/// public key held by the agent
struct agent_identity {
	byte_vector blob;
	std::string comment;
};

/// signature returned by the agent, format is the signature algorithm name (e.g. rsa-sha2-256)
struct agent_signature {
	std::string format;
	byte_vector blob;
};

/** \brief Minimal ssh-agent client interface
 *
 *  Both operations are blocking round trips to the agent and throw signer_error on failure
 *  (signer_agent_list_error for list, signer_signing_error for sign).
 */
class agent_client {
public:
	virtual ~agent_client() = default;

	virtual std::vector<agent_identity> list() = 0;
	virtual agent_signature sign(agent_identity const& key, const_span data, std::uint32_t flags) = 0;
};

}

#endif
