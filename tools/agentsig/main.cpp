
#include "commands.hpp"
#include "agentsig/common/logger.hpp"
#include "agentsig/signer/agent_signer.hpp"

#include <stdexcept>
#include <iostream>

int main(int argc, char* argv[]) {
	try {
		using namespace agentsig;
		agentsig_commands p;
		p.parse(argc, argv);
		if(p.help) {
			std::cout << "agentsig - sign HTTP requests with ssh-agent keys\n";
			agentsig_commands().print_help(std::cout);
			return 0;
		}
		if(!p.config_file.empty()) {
			p.parse_file(p.config_file);
		}

		console_logger log(logger::error);
		if(p.very_verbose) {
			log.set_level(logger::log_all);
		} else if(p.verbose) {
			log.set_level(logger::type(logger::error | logger::info | logger::debug));
		}

		auto signer = create_agent_signer(p, log);

		std::cout << "fingerprint: " << signer->key_fingerprint() << "\n";
		std::cout << "algorithm: " << signer->default_algorithm() << "\n";

		std::string date = p.date.empty() ? http_date_now() : p.date;
		if(p.raw) {
			auto sig = signer->sign_raw(date);
			std::cout << "signature: " << sig.text << "\n";
			std::cout << "signature algorithm: " << sig.algorithm << "\n";
		} else {
			std::cout << "date: " << date << "\n";
			std::cout << "authorization: Signature " << signer->sign(date) << "\n";
		}
	} catch(std::exception const& e) {
		std::cerr << "Error: " << e.what() << "\n";
		return 1;
	}
}
