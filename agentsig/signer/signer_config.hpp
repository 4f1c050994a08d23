#ifndef AGENTSIG_SIGNER_SIGNER_CONFIG_HEADER
#define AGENTSIG_SIGNER_SIGNER_CONFIG_HEADER

#include <string>

namespace agentsig {

struct signer_config {
	/// md5 or sha256 fingerprint of the key in agent
	std::string fingerprint;
	std::string account;
	/// sub-user of the account, empty when signing as the account itself
	std::string user;
	/// agent socket path, empty to use SSH_AUTH_SOCK
	std::string agent_address;
	/// verify every signature from agent against the key before use
	bool verify_signatures{};
};

}

#endif
