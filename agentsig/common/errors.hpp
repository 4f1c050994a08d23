#ifndef AGENTSIG_ERRORS_HEADER
#define AGENTSIG_ERRORS_HEADER

#include "types.hpp"

#include <stdexcept>

namespace agentsig {

enum signer_error_code : std::uint32_t {
	signer_noerror                 = 0,
	signer_config_error            = 1,
	signer_connection_error        = 2,
	signer_agent_list_error        = 3,
	signer_signing_error           = 4,
	signer_key_not_found           = 5,
	signer_unsupported_algorithm   = 6,
	signer_signature_decode_error  = 7
};

std::string_view to_string(signer_error_code);

/** \brief Error raised by the agent client and the signer
 *
 *  code() is the error of the failed operation, cause() is the innermost error code when
 *  the error wraps another one (same as code() otherwise).
 */
class signer_error : public std::runtime_error {
public:
	signer_error(signer_error_code code, std::string const& message);
	signer_error(signer_error_code code, std::string const& message, signer_error_code cause);

	signer_error_code code() const { return code_; }
	signer_error_code cause() const { return cause_; }

private:
	signer_error_code code_;
	signer_error_code cause_;
};

/// Throw new error with the given code, prefixing the message of the wrapped error with context
[[noreturn]] void throw_wrapped(signer_error_code code, std::string_view context, signer_error const& wrapped);

}

#endif
