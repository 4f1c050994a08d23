#ifndef AGENTSIG_BINARY_UTIL_HEADER
#define AGENTSIG_BINARY_UTIL_HEADER

#include "types.hpp"
#include "util.hpp"

#include <limits>

namespace agentsig {

/// Appends values in the SSH binary format (rfc4251 section 5) to a byte vector, fails if the vector would grow past limit
class ssh_bf_writer {
public:
	ssh_bf_writer(byte_vector& out, std::size_t limit = std::numeric_limits<std::size_t>::max())
	: out_(out)
	, limit_(limit)
	{
	}

	bool write(std::uint32_t v) {
		std::byte buf[4];
		u32ton(v, buf);
		return write(const_span(buf));
	}

	bool write(std::uint8_t v) {
		std::byte const b{v};
		return write(const_span(&b, 1));
	}

	bool write(std::string_view v) {
		return fits(4+v.size())
			&& write(std::uint32_t(v.size()))
			&& write(to_span(v));
	}

	bool write(const_span s) {
		bool ret = fits(s.size());
		if(ret) {
			out_.insert(out_.end(), s.begin(), s.end());
		}
		return ret;
	}

private:
	bool fits(std::size_t s) const {
		return out_.size() <= limit_ && limit_ - out_.size() >= s;
	}

private:
	byte_vector& out_;
	std::size_t limit_;
};

/// Reader for the SSH binary format (rfc4251 section 5)
class ssh_bf_reader {
public:
	ssh_bf_reader(const_span in)
	: in_(in)
	, pos_()
	{
	}

	std::size_t size_left() const {
		return in_.size() - pos_;
	}

	bool read(std::uint32_t& v) {
		bool ret = size_left() >= 4;
		if(ret) {
			v = ntou32(in_.data() + pos_);
			pos_ += 4;
		}
		return ret;
	}

	bool read(std::uint8_t& v) {
		bool ret = size_left() >= 1;
		if(ret) {
			v = std::to_integer<std::uint8_t>(in_[pos_++]);
		}
		return ret;
	}

	bool read(std::string_view& v) {
		std::uint32_t size{};
		bool ret = read(size) && size_left() >= size;
		if(ret) {
			v = std::string_view{reinterpret_cast<char const*>(in_.data())+pos_, size};
			pos_ += size;
		}
		return ret;
	}

	bool read(const_mpint_span& mpint) {
		std::string_view s;
		bool ret = read(s);
		if(ret) {
			if(s.empty()) {
				mpint = const_mpint_span{};
			} else {
				if(std::uint8_t(s[0]) & 0x80) {
					mpint = const_mpint_span{to_span(s), const_mpint_span::signed_t};
				} else {
					mpint = to_umpint(s);
				}
			}
		}
		return ret;
	}

private:
	const_span in_;
	std::size_t pos_;
};

}

#endif
