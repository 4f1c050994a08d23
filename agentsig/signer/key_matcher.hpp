#ifndef AGENTSIG_SIGNER_KEY_MATCHER_HEADER
#define AGENTSIG_SIGNER_KEY_MATCHER_HEADER

#include "agentsig/agent/agent_client.hpp"
#include "agentsig/crypto/crypto_context.hpp"

namespace agentsig {

/** \brief Find the agent key with given fingerprint
 *
 *  The fingerprint can be md5 hex or sha256 base64, with or without "MD5:"/"SHA256:" prefix and colons.
 *  If multiple keys match, the last one in agent's list is selected.
 *
 *  Throws signer_error with signer_agent_list_error if listing fails and signer_key_not_found if no key matches.
 */
agent::agent_identity match_key(agent::agent_client&, std::string_view fingerprint, crypto_context const&, crypto_call_context const&);

}

#endif
