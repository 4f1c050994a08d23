
#include "errors.hpp"

namespace agentsig {

std::string_view to_string(signer_error_code c) {
	switch(c) {
		case signer_noerror: return "no error";
		case signer_config_error: return "configuration error";
		case signer_connection_error: return "connection error";
		case signer_agent_list_error: return "agent list error";
		case signer_signing_error: return "signing error";
		case signer_key_not_found: return "key not found";
		case signer_unsupported_algorithm: return "unsupported algorithm";
		case signer_signature_decode_error: return "signature decode error";
	}
	return "unknown error";
}

signer_error::signer_error(signer_error_code code, std::string const& message)
: signer_error(code, message, code)
{
}

signer_error::signer_error(signer_error_code code, std::string const& message, signer_error_code cause)
: std::runtime_error(message)
, code_(code)
, cause_(cause)
{
}

void throw_wrapped(signer_error_code code, std::string_view context, signer_error const& wrapped) {
	throw signer_error(code, std::string(context) + ": " + wrapped.what(), wrapped.cause());
}

}
