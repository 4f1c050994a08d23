#ifndef AGENTSIG_TOOLS_AGENTSIG_COMMANDS_HEADER
#define AGENTSIG_TOOLS_AGENTSIG_COMMANDS_HEADER

#include "agentsig/signer/signer_config.hpp"
#include "tools/common/command_parser.hpp"

namespace agentsig {

struct agentsig_commands : signer_config, command_parser {
	bool help{};
	bool verbose{};
	bool very_verbose{};
	bool raw{};
	std::string date;
	std::string config_file;

	agentsig_commands();
};

/// current time in IMF-fixdate format, e.g. "Tue, 01 Jan 2019 00:00:00 GMT"
std::string http_date_now();

}

#endif
