#ifndef AGENTSIG_TOOLS_COMMON_COMMAND_PARSER_HEADER
#define AGENTSIG_TOOLS_COMMON_COMMAND_PARSER_HEADER

#include <iosfwd>
#include <string>
#include <string_view>
#include <stdexcept>
#include <vector>

namespace agentsig {

struct invalid_argument : std::runtime_error {
	using std::runtime_error::runtime_error;
};

/** \brief Options given as "--name value" or "-alias value", flags take no value
 */
class command_parser {
public:
	void add(std::string& var, std::string name, std::string alias, std::string info);
	void add(bool& var, std::string name, std::string alias, std::string info);

	void parse(int argc, char* argv[]);
	void parse(std::vector<std::string> const& args);

	/// every line is parsed like a command line, empty lines and lines starting with # are skipped
	void parse_file(std::string const& file_name);

	void print_help(std::ostream&) const;

private:
	struct option {
		std::string name;
		std::string alias;
		std::string info;
		std::string* value{};
		bool* flag{};
	};

	option const& find(std::string_view arg) const;

private:
	std::vector<option> options_;
};

/// split at white space, double quotes keep the enclosed text as one argument
std::vector<std::string> split_command_line(std::string_view line);

}

#endif
