
#include "commands.hpp"

#include <chrono>
#include <ctime>

namespace agentsig {

agentsig_commands::agentsig_commands() {
	add(help, "help", "", "show help");
	add(verbose, "verbose", "v", "verbose logging");
	add(very_verbose, "very-verbose", "vv", "very verbose logging");
	add(fingerprint, "fingerprint", "f", "md5 or sha256 fingerprint of the key in agent");
	add(account, "account", "a", "account name");
	add(user, "user", "u", "sub-user of the account");
	add(agent_address, "agent", "", "agent socket path (default from SSH_AUTH_SOCK)");
	add(date, "date", "d", "date to sign (default current time)");
	add(raw, "raw", "", "sign the date value as is and print the signature and algorithm");
	add(verify_signatures, "verify", "", "verify the agent signatures");
	add(config_file, "config", "c", "config file");
}

std::string http_date_now() {
	std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
	std::tm tm{};
	gmtime_r(&t, &tm);
	char buf[64];
	std::size_t s = std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &tm);
	return std::string(buf, s);
}

}
