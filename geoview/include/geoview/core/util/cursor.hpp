#pragma once
#include "geoview/common.hpp"

namespace geoview {

namespace core {

// Read-only cursor over an immutable byte buffer. Every read is bounds checked and throws a
// SerializationException when it would run past the end of the buffer.
class Cursor {
private:
	const_data_ptr_t start;
	const_data_ptr_t ptr;
	const_data_ptr_t end;

public:
	Cursor(const_data_ptr_t start, const_data_ptr_t end) : start(start), ptr(start), end(end) {
	}

	idx_t Position() const {
		return static_cast<idx_t>(ptr - start);
	}

	idx_t Remaining() const {
		D_ASSERT(ptr <= end);
		return static_cast<idx_t>(end - ptr);
	}

	template <class T>
	T Read() {
		static_assert(std::is_trivially_copyable<T>::value, "T must be trivially copyable");
		if (sizeof(T) > Remaining()) {
			throw SerializationException("Trying to read past end of buffer");
		}
		auto result = Load<T>(ptr);
		ptr += sizeof(T);
		return result;
	}

	template <class T>
	T ReadBigEndian() {
		static_assert(std::is_floating_point<T>::value || std::is_integral<T>::value,
		              "T must be a floating point or integral type");
		if (sizeof(T) > Remaining()) {
			throw SerializationException("Trying to read past end of buffer");
		}

		uint8_t in[sizeof(T)];
		uint8_t out[sizeof(T)];
		memcpy(in, ptr, sizeof(T));
		ptr += sizeof(T);

		for (size_t i = 0; i < sizeof(T); i++) {
			out[i] = in[sizeof(T) - i - 1];
		}
		T swapped = 0;
		memcpy(&swapped, out, sizeof(T));
		return swapped;
	}

	// Read a value in the given byte order
	template <class T>
	T Read(bool little_endian) {
		return little_endian ? Read<T>() : ReadBigEndian<T>();
	}

	void Skip(idx_t bytes) {
		if (bytes > Remaining()) {
			throw SerializationException("Trying to read past end of buffer");
		}
		ptr += bytes;
	}
};

} // namespace core

} // namespace geoview
