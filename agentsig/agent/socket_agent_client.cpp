
#include "socket_agent_client.hpp"
#include "protocol.hpp"
#include "agentsig/common/util.hpp"

#include <algorithm>
#include <cstdlib>

namespace agentsig::agent {

std::string agent_address_from_env() {
	char const* v = std::getenv(agent_socket_env);
	if(!v) {
		throw signer_error(signer_config_error, std::string(agent_socket_env) + " is not set");
	}
	return v;
}

socket_agent_client::socket_agent_client(std::string const& address, logger& log)
: log_(log)
, socket_(io_context_)
{
	log_.log(logger::debug, "Connecting to agent at {}", address);

	if(address.empty()) {
		throw signer_error(signer_connection_error, "Failed to connect to agent: empty address");
	}

	asio::error_code ec;
	try {
		socket_.connect(asio::local::stream_protocol::endpoint(address), ec);
	} catch(asio::system_error const& e) {
		// endpoint throws for invalid paths
		ec = e.code();
	}

	if(ec) {
		log_.log(logger::error, "Failed to connect to agent at {}: {}", address, ec.message());
		throw signer_error(signer_connection_error, "Failed to connect to agent at " + address + ": " + ec.message());
	}
}

socket_agent_client::~socket_agent_client() {
	asio::error_code ec;
	socket_.close(ec);
	if(ec) {
		log_.log(logger::debug, "Failed to close agent connection: {}", ec.message());
	}
}

byte_vector socket_agent_client::round_trip(const_span request, signer_error_code code) {
	std::lock_guard lock(mutex_);

	auto fail = [&](std::string const& msg) {
		log_.log(logger::error, "Agent round trip failed: {}", msg);
		throw signer_error(code, msg);
	};

	asio::error_code ec;
	asio::write(socket_, asio::buffer(request.data(), request.size()), ec);
	if(ec) {
		fail("failed to write to agent: " + ec.message());
	}

	byte_vector res(ser::uint32::static_size);
	asio::read(socket_, asio::buffer(res.data(), res.size()), ec);
	if(ec) {
		fail("failed to read from agent: " + ec.message());
	}

	std::uint32_t length = ntou32(res.data());
	if(length == 0 || length > max_message_length) {
		fail("invalid agent message length " + std::to_string(length));
	}

	res.resize(ser::uint32::static_size + length);
	asio::read(socket_, asio::buffer(res.data() + ser::uint32::static_size, length), ec);
	if(ec) {
		fail("failed to read from agent: " + ec.message());
	}

	log_.log(logger::debug_trace, "Agent response of {} bytes", res.size());

	return res;
}

std::vector<agent_identity> socket_agent_client::list() {
	byte_vector req;
	if(!request_identities::save().write(req)) {
		throw signer_error(signer_agent_list_error, "Failed to serialise identities request");
	}

	byte_vector res = round_trip(req, signer_agent_list_error);

	std::uint32_t length{};
	auto type = decode_agent_type(res, length);
	if(type == agent_failure) {
		throw signer_error(signer_agent_list_error, "Agent refused to list keys");
	}

	identities_answer::load packet(ser::match_type_t, res);
	if(!packet) {
		throw signer_error(signer_agent_list_error, "Unexpected agent response to identities request (type " + std::to_string(int(type)) + ")");
	}

	auto& [count] = packet;
	auto& reader = packet.reader();

	log_.log(logger::debug, "Agent has {} keys", count);

	std::vector<agent_identity> keys;
	// every key takes at least two length fields
	keys.reserve(std::min<std::size_t>(count, reader.size_left() / 8));
	for(std::uint32_t i = 0; i != count; ++i) {
		std::string_view blob;
		std::string_view comment;
		if(!reader.read(blob) || !reader.read(comment)) {
			throw signer_error(signer_agent_list_error, "Invalid identities answer from agent");
		}
		keys.push_back(agent_identity{to_byte_vector(blob), std::string(comment)});
	}

	return keys;
}

agent_signature socket_agent_client::sign(agent_identity const& key, const_span data, std::uint32_t flags) {
	byte_vector req;
	if(!sign_request::save(to_string_view(key.blob), to_string_view(data), flags).write(req)) {
		throw signer_error(signer_signing_error, "Sign request for " + std::to_string(data.size()) + " bytes does not fit in agent message");
	}

	byte_vector res = round_trip(req, signer_signing_error);

	std::uint32_t length{};
	auto type = decode_agent_type(res, length);
	if(type == agent_failure) {
		throw signer_error(signer_signing_error, "Agent refused to sign");
	}

	sign_response::load packet(ser::match_type_t, res);
	if(!packet) {
		throw signer_error(signer_signing_error, "Unexpected agent response to sign request (type " + std::to_string(int(type)) + ")");
	}

	auto& [signature] = packet;

	// string format, string blob
	ssh_bf_reader reader(to_span(signature));
	std::string_view format;
	std::string_view blob;
	if(!reader.read(format) || !reader.read(blob)) {
		throw signer_error(signer_signing_error, "Invalid signature from agent");
	}

	log_.log(logger::debug, "Agent signed with {}", format);

	return agent_signature{std::string(format), to_byte_vector(blob)};
}

}
