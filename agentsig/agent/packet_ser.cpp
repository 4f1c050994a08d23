
#include "packet_ser_impl.hpp"

namespace agentsig::agent {

agent_packet_type decode_agent_type(const_span s, std::uint32_t& length) {
	agent_packet_type res{};
	ssh_bf_reader reader(s);
	if(reader.read(length) && reader.size_left() >= length) {
		reader.read((std::uint8_t&)res);
	}
	return res;
}

}
