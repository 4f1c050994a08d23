#ifndef AGENTSIG_SIGNER_SIGNER_HEADER
#define AGENTSIG_SIGNER_SIGNER_HEADER

#include "http_signature.hpp"

namespace agentsig {

/** \brief Produces HTTP signature authorisation headers
 *
 *  All operations throw signer_error on failure.
 */
class signer {
public:
	virtual ~signer() = default;

	/// sign "date: <date>" and return the header value
	virtual std::string sign(std::string_view date) = 0;

	/// sign the payload as is
	virtual normalised_signature sign_raw(std::string_view payload) = 0;

	virtual std::string const& key_fingerprint() const = 0;
	virtual std::string const& default_algorithm() const = 0;
	virtual std::string const& key_id() const = 0;
};

}

#endif
