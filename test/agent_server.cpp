
#include "agent_server.hpp"
#include "log.hpp"
#include "agentsig/agent/protocol.hpp"

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <unistd.h>

namespace agentsig::test {

std::string temp_socket_path() {
	static std::atomic<int> counter{};
	auto p = std::filesystem::temp_directory_path()
		/ ("agentsig-test-" + std::to_string(::getpid()) + "-" + std::to_string(++counter) + ".sock");
	std::filesystem::remove(p);
	return p.string();
}

scripted_agent_server::scripted_agent_server(std::vector<byte_vector> responses)
: path_(temp_socket_path())
, acceptor_(io_, asio::local::stream_protocol::endpoint(path_))
, responses_(std::move(responses))
{
	asio::co_spawn(io_, serve(),
		[](std::exception_ptr e) {
			if(e) {
				try {
					std::rethrow_exception(e);
				} catch(std::exception const& ex) {
					// the client closing the connection ends up here too
					test_log().log(logger::debug, "scripted agent stopped: {}", ex.what());
				}
			}
		});

	thread_ = std::thread([this]{ io_.run(); });
}

scripted_agent_server::~scripted_agent_server() {
	io_.stop();
	thread_.join();
	std::error_code ec;
	std::filesystem::remove(path_, ec);
}

std::vector<byte_vector> scripted_agent_server::requests() const {
	std::lock_guard lock(mutex_);
	return requests_;
}

asio::awaitable<void> scripted_agent_server::serve() {
	auto socket = co_await acceptor_.async_accept(asio::use_awaitable);

	for(auto&& res : responses_) {
		byte_vector req(4);
		co_await asio::async_read(socket, asio::buffer(req), asio::use_awaitable);
		std::uint32_t length = ntou32(req.data());
		req.resize(4 + length);
		co_await asio::async_read(socket, asio::buffer(req.data() + 4, length), asio::use_awaitable);

		{
			std::lock_guard lock(mutex_);
			requests_.push_back(req);
		}

		co_await asio::async_write(socket, asio::buffer(res), asio::use_awaitable);
	}

	// wait for the client to close
	std::byte b{};
	co_await socket.async_read_some(asio::buffer(&b, 1), asio::use_awaitable);
}

scoped_env::scoped_env(char const* name, char const* value)
: name_(name)
{
	if(char const* old = std::getenv(name)) {
		old_ = old;
	}
	if(value) {
		::setenv(name, value, 1);
	} else {
		::unsetenv(name);
	}
}

scoped_env::~scoped_env() {
	if(old_) {
		::setenv(name_.c_str(), old_->c_str(), 1);
	} else {
		::unsetenv(name_.c_str());
	}
}

static void set_length(byte_vector& msg) {
	u32ton(std::uint32_t(msg.size() - 4), msg.data());
}

byte_vector identities_message(std::vector<agent::agent_identity> const& keys) {
	byte_vector msg;
	ssh_bf_writer w(msg);
	w.write(std::uint32_t(0));
	w.write(std::uint8_t(agent::agent_identities_answer));
	w.write(std::uint32_t(keys.size()));
	for(auto&& k : keys) {
		w.write(to_string_view(k.blob));
		w.write(std::string_view(k.comment));
	}
	set_length(msg);
	return msg;
}

byte_vector sign_response_message(std::string_view format, const_span blob) {
	byte_vector sig;
	ssh_bf_writer sw(sig);
	sw.write(format);
	sw.write(to_string_view(blob));

	byte_vector msg;
	agent::sign_response::save(to_string_view(sig)).write(msg);
	return msg;
}

byte_vector failure_message() {
	byte_vector msg;
	agent::failure::save().write(msg);
	return msg;
}

}
