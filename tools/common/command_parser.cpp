#include "command_parser.hpp"

#include <cctype>
#include <fstream>
#include <iomanip>
#include <ostream>

namespace agentsig {

void command_parser::add(std::string& var, std::string name, std::string alias, std::string info) {
	options_.push_back(option{std::move(name), std::move(alias), std::move(info), &var, nullptr});
}

void command_parser::add(bool& var, std::string name, std::string alias, std::string info) {
	options_.push_back(option{std::move(name), std::move(alias), std::move(info), nullptr, &var});
}

command_parser::option const& command_parser::find(std::string_view arg) const {
	for(auto&& o : options_) {
		if(arg.starts_with("--") ? arg.substr(2) == o.name : (!o.alias.empty() && arg.substr(1) == o.alias)) {
			return o;
		}
	}
	throw invalid_argument("no parameter named '" + std::string(arg) + "'");
}

void command_parser::parse(int argc, char* argv[]) {
	parse(std::vector<std::string>(argv + 1, argv + argc));
}

void command_parser::parse(std::vector<std::string> const& args) {
	for(std::size_t i = 0; i != args.size(); ++i) {
		std::string const& arg = args[i];
		if(arg.size() < 2 || arg[0] != '-') {
			throw invalid_argument("unexpected argument '" + arg + "'");
		}

		auto const& o = find(arg);
		if(o.flag) {
			*o.flag = true;
		} else {
			if(i + 1 == args.size()) {
				throw invalid_argument("missing value for '" + arg + "'");
			}
			*o.value = args[++i];
		}
	}
}

void command_parser::parse_file(std::string const& file_name) {
	std::ifstream in(file_name);
	if(!in) {
		throw invalid_argument("failed to open '" + file_name + "'");
	}

	std::string line;
	while(std::getline(in, line)) {
		auto args = split_command_line(line);
		if(!args.empty() && !args[0].starts_with("#")) {
			parse(args);
		}
	}
}

void command_parser::print_help(std::ostream& out) const {
	for(auto&& o : options_) {
		std::string names = "--" + o.name;
		if(!o.alias.empty()) {
			names += ", -" + o.alias;
		}
		if(o.value) {
			names += " <value>";
		}
		out << "  " << std::left << std::setw(30) << names << " " << o.info << "\n";
	}
}

std::vector<std::string> split_command_line(std::string_view line) {
	std::vector<std::string> res;
	std::size_t i = 0;
	while(i != line.size()) {
		if(std::isspace(static_cast<unsigned char>(line[i]))) {
			++i;
		} else if(line[i] == '"') {
			auto end = line.find('"', i+1);
			if(end == std::string_view::npos) {
				throw invalid_argument("missing closing quote in '" + std::string(line) + "'");
			}
			res.emplace_back(line.substr(i+1, end-i-1));
			i = end + 1;
		} else {
			std::size_t start = i;
			while(i != line.size() && !std::isspace(static_cast<unsigned char>(line[i]))) {
				++i;
			}
			res.emplace_back(line.substr(start, i-start));
		}
	}
	return res;
}

}
