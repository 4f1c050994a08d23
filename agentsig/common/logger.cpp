
#include "logger.hpp"

#include <utility>
#include <stdio.h>

namespace agentsig {

void stdout_logger::do_log_line(logger::type, std::string const& s, std::source_location&&) {
	std::puts(s.c_str());
}

void console_logger::do_log_line(logger::type t, std::string const& s, std::source_location&& loc) {
	if(t == logger::error) {
		std::fprintf(stderr, "%s (%s:%u)\n", s.c_str(), loc.file_name(), unsigned(loc.line()));
	} else {
		std::puts(s.c_str());
	}
}

}
