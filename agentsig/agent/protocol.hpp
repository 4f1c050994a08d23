#ifndef AGENTSIG_AGENT_PROTOCOL_HEADER
#define AGENTSIG_AGENT_PROTOCOL_HEADER

#include "packet_ser_impl.hpp"

namespace agentsig::agent {

/*
	byte SSH_AGENTC_REQUEST_IDENTITIES
*/
using request_identities = agent_packet_ser
<
	agentc_request_identities
>;

/*
	byte SSH_AGENT_IDENTITIES_ANSWER
	uint32 nkeys

	followed by nkeys times:
		string key blob
		string comment
*/
using identities_answer = agent_packet_ser
<
	agent_identities_answer,
	ser::uint32
>;

/*
	byte SSH_AGENTC_SIGN_REQUEST
	string key blob
	string data
	uint32 flags
*/
using sign_request = agent_packet_ser
<
	agentc_sign_request,
	ser::string,
	ser::string,
	ser::uint32
>;

/*
	byte SSH_AGENT_SIGN_RESPONSE
	string signature
*/
using sign_response = agent_packet_ser
<
	agent_sign_response,
	ser::string
>;

/*
	byte SSH_AGENT_FAILURE
*/
using failure = agent_packet_ser
<
	agent_failure
>;

}

#endif
