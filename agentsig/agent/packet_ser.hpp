#ifndef AGENTSIG_AGENT_PACKET_SER_HEADER
#define AGENTSIG_AGENT_PACKET_SER_HEADER

#include "packet_types.hpp"
#include "agentsig/common/types.hpp"

namespace agentsig::agent {

namespace ser {

// type tags for packet serialisation
struct uint32;
struct string;

}

/// serialisation for agent messages, every message is prefixed with its length
template<std::uint8_t PacketType, typename... TypeTags>
struct agent_packet_ser;

/// returns the packet type if there is enough data for the whole packet, zero otherwise
agent_packet_type decode_agent_type(const_span, std::uint32_t& length);

}

#endif
