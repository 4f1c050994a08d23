#ifndef AGENTSIG_AGENT_PACKET_TYPES_HEADER
#define AGENTSIG_AGENT_PACKET_TYPES_HEADER

#include <cstdint>

namespace agentsig::agent {

// draft-miller-ssh-agent section 6.1, only the messages used by the client
enum agent_packet_type : std::uint8_t {
	agent_failure                 = 5,
	agent_success                 = 6,
	agentc_request_identities     = 11,
	agent_identities_answer       = 12,
	agentc_sign_request           = 13,
	agent_sign_response           = 14
};

// signature flags (draft-miller-ssh-agent section 6.6)
enum sign_flags : std::uint32_t {
	no_sign_flags  = 0,
	rsa_sha2_256   = 0x02,
	rsa_sha2_512   = 0x04
};

/// maximum accepted agent message length, same limit as OpenSSH uses
std::uint32_t const max_message_length = 256 * 1024;

}

#endif
