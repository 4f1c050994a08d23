#ifndef AGENTSIG_AGENT_PACKET_SER_IMPL_HEADER
#define AGENTSIG_AGENT_PACKET_SER_IMPL_HEADER

#include "packet_ser.hpp"
#include "agentsig/common/binary_util.hpp"

#include <tuple>
#include <utility>

namespace agentsig::agent {

namespace ser {

template<typename Type>
struct type_base {
	using type = Type;
	type data{};

	type_base() = default;
	type_base(type t) : data(t) {};

	bool read(ssh_bf_reader& r) {
		return r.read(data);
	}

	bool write(ssh_bf_writer& w) const {
		return w.write(data);
	}

	type& view() {
		return data;
	}
};

struct uint32 : type_base<std::uint32_t> {
	using type_base::type_base;
	static constexpr std::size_t static_size = 4;
	std::size_t size() const { return static_size; }
};

struct string : type_base<std::string_view> {
	using type_base::type_base;
	static constexpr std::size_t static_size = 4;
	std::size_t size() const { return static_size + data.size(); }
};

struct match_type_tag {} constexpr match_type_t;

}

template<std::uint8_t Type, typename... TypeTags> struct agent_packet_ser_save;
template<std::uint8_t Type, typename... TypeTags> struct agent_packet_ser_load;

template<std::uint8_t Type, typename... TypeTags>
struct agent_packet_ser {
	/*
		usage: (using sign_request as example)
			byte_vector out;
			if(sign_request::save(key_blob, data, flags).write(out)) {
				...
			}
	*/
	using save = agent_packet_ser_save<Type, TypeTags...>;

	/*
		usage: (using sign_response as example)
			sign_response::load packet(ser::match_type_t, in_span);
			if(packet) {
				auto& [signature] = packet;
			}
	*/
	using load = agent_packet_ser_load<Type, TypeTags...>;

	using members = std::tuple<TypeTags...>;
	static constexpr std::uint8_t packet_type = Type;
};

template<std::uint8_t Type, typename... TypeTags>
struct agent_packet_ser_save {
	using members = std::tuple<TypeTags...>;

	template<typename... Args>
	agent_packet_ser_save(Args&&... args)
	: m_{std::forward<Args>(args)...}
	{
	}

	/// size of the message without the length field, type tag + rest of the packet
	std::size_t payload_size() const {
		return 1 + std::apply(
			[&](auto&&... args) {
				return (( args.size() ) + ... + 0);
			}, m_);
	}

	/// This can be used to allocate buffer for the write()
	std::size_t size() const {
		return ser::uint32::static_size + payload_size();
	}

	bool write(ssh_bf_writer& writer) const {
		bool ret = writer.write(std::uint32_t(payload_size()))
			&& writer.write(std::uint8_t(Type));

		return ret && std::apply(
			[&](auto&&... args) {
				return (( args.write(writer) ) && ...);
			}, m_);
	}

	/// fails if the message would be longer than max_message_length
	bool write(byte_vector& out) const {
		out.clear();
		ssh_bf_writer writer(out, ser::uint32::static_size + max_message_length);
		return write(writer);
	}

private:
	members const m_;
};

template<std::uint8_t Type, typename... TypeTags>
struct agent_packet_ser_load {
	using members = std::tuple<TypeTags...>;

	/// expect the length and type tag to be in front of the given span
	agent_packet_ser_load(ser::match_type_tag, const_span in_data)
	: reader_(in_data)
	{
		std::uint32_t length{};
		if(reader_.read(length) && reader_.size_left() >= length) {
			reader_ = ssh_bf_reader(in_data.subspan(ser::uint32::static_size, length));

			std::uint8_t tag{};
			if(reader_.read(tag) && tag == Type) {
				load_data();
			}
		}
	}

	/// expect the length and type already matched, so in_data starts with the first member
	agent_packet_ser_load(const_span in_data)
	: reader_(in_data)
	{
		load_data();
	}

	explicit operator bool() const {
		return result_;
	}

	template<std::size_t Index>
	auto&& get() {
		return std::get<Index>(m_).view();
	}

	// this can be used to extract variable data at the end of the packet
	ssh_bf_reader& reader() {
		return reader_;
	}

private:
	void load_data() {
		result_ = std::apply(
			[&](auto&&... args) {
				return (( args.read(reader_) ) && ...);
			}, m_);
	}

private:
	members m_;
	ssh_bf_reader reader_;
	bool result_{};
};

}

namespace std {
	template<uint8_t Type, typename... Tags>
	struct tuple_size<::agentsig::agent::agent_packet_ser_load<Type, Tags...>> {
		static constexpr std::size_t value = sizeof...(Tags);
	};

	template<size_t Index, uint8_t Type, typename... Tags>
	struct tuple_element<Index, ::agentsig::agent::agent_packet_ser_load<Type, Tags...>> {
		static_assert(Index < sizeof...(Tags), "Index out of bounds");
		using type = typename std::tuple_element_t<Index, std::tuple<Tags...>>::type;
	};
}

#endif
