
#include "key_matcher.hpp"
#include "agentsig/common/errors.hpp"
#include "agentsig/core/fingerprint.hpp"

#include <optional>

namespace agentsig {

agent::agent_identity match_key(agent::agent_client& agent, std::string_view fingerprint, crypto_context const& crypto, crypto_call_context const& call) {
	std::vector<agent::agent_identity> keys;
	try {
		keys = agent.list();
	} catch(signer_error const& e) {
		throw_wrapped(signer_agent_list_error, "Failed to list agent keys", e);
	}

	std::string const target = normalise_fingerprint(fingerprint);
	call.log.log(logger::debug, "Matching fingerprint {} against {} agent keys", target, keys.size());

	std::optional<std::size_t> match;
	if(!target.empty()) {
		for(std::size_t i = 0; i != keys.size(); ++i) {
			auto md5 = md5_fingerprint(keys[i].blob, crypto, call);
			auto sha256 = sha256_fingerprint(keys[i].blob, crypto, call);

			call.log.log(logger::debug_trace, "Agent key '{}': MD5:{} SHA256:{}", keys[i].comment, md5, sha256);

			if((!md5.empty() && md5 == target) || (!sha256.empty() && sha256 == target)) {
				match = i;
			}
		}
	}

	if(!match) {
		throw signer_error(signer_key_not_found, "No key in agent matches fingerprint " + std::string(fingerprint));
	}

	call.log.log(logger::info, "Using agent key '{}'", keys[*match].comment);

	return std::move(keys[*match]);
}

}
