#ifndef AGENTSIG_AGENT_SOCKET_AGENT_CLIENT_HEADER
#define AGENTSIG_AGENT_SOCKET_AGENT_CLIENT_HEADER

#include "agent_client.hpp"
#include "agentsig/common/errors.hpp"
#include "agentsig/common/logger.hpp"

#include <asio.hpp>

#include <mutex>

namespace agentsig::agent {

/// name of the environment variable holding the agent socket path
char const* const agent_socket_env = "SSH_AUTH_SOCK";

/// read the agent address from SSH_AUTH_SOCK, throws signer_error(signer_config_error) if not set. Empty value is returned as is and fails on connect
std::string agent_address_from_env();

/** \brief ssh-agent client over unix stream socket
 *
 *  The connection is opened in constructor and closed in destructor. Round trips are serialised,
 *  so the client can be used from multiple threads.
 */
class socket_agent_client : public agent_client {
public:
	/// throws signer_error(signer_connection_error) if the connection cannot be opened
	socket_agent_client(std::string const& address, logger& log);
	~socket_agent_client();

	std::vector<agent_identity> list() override;
	agent_signature sign(agent_identity const& key, const_span data, std::uint32_t flags) override;

private:
	// send request and read one whole response message (including the length field), throws signer_error with given code on failure
	byte_vector round_trip(const_span request, signer_error_code code);

private:
	logger& log_;
	asio::io_context io_context_;
	asio::local::stream_protocol::socket socket_;
	std::mutex mutex_;
};

}

#endif
