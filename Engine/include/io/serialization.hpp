/**
 * @file serialization.hpp
 * @brief Little-endian binary writer/reader used by the index file format
 */

#pragma once

#include <core/error.hpp>
#include <cstdint>
#include <cstring>
#include <endian.h>
#include <istream>
#include <ostream>
#include <string>
#include <type_traits>
#include <vector>

namespace Annex {

namespace detail {

template <typename T>
inline T to_little_endian(T value) {
    static_assert(std::is_trivially_copyable_v<T>);
    if constexpr (sizeof(T) == 1) {
        return value;
    } else if constexpr (sizeof(T) == 2) {
        uint16_t raw;
        std::memcpy(&raw, &value, 2);
        raw = htole16(raw);
        std::memcpy(&value, &raw, 2);
        return value;
    } else if constexpr (sizeof(T) == 4) {
        uint32_t raw;
        std::memcpy(&raw, &value, 4);
        raw = htole32(raw);
        std::memcpy(&value, &raw, 4);
        return value;
    } else {
        static_assert(sizeof(T) == 8, "Unsupported scalar width");
        uint64_t raw;
        std::memcpy(&raw, &value, 8);
        raw = htole64(raw);
        std::memcpy(&value, &raw, 8);
        return value;
    }
}

// The byte swap is an involution
template <typename T>
inline T from_little_endian(T value) {
    return to_little_endian(value);
}

} // namespace detail

class BinaryWriter {
public:
    explicit BinaryWriter(std::ostream& out) : out_(out) {}

    template <typename T>
    void write(T value) {
        static_assert(std::is_arithmetic_v<T> || std::is_enum_v<T>);
        if constexpr (std::is_enum_v<T>) {
            write(static_cast<std::underlying_type_t<T>>(value));
        } else {
            T le = detail::to_little_endian(value);
            out_.write(reinterpret_cast<const char*>(&le), sizeof(T));
            check();
        }
    }

    template <typename T>
    void write_vector(const std::vector<T>& values) {
        write(static_cast<uint64_t>(values.size()));
        for (const T& v : values) write(v);
    }

    void write_bytes(const void* data, size_t len) {
        out_.write(static_cast<const char*>(data), static_cast<std::streamsize>(len));
        check();
    }

private:
    void check() {
        if (!out_) throw IoError("Failed to write index data");
    }

    std::ostream& out_;
};

class BinaryReader {
public:
    explicit BinaryReader(std::istream& in) : in_(in) {}

    template <typename T>
    T read() {
        static_assert(std::is_arithmetic_v<T> || std::is_enum_v<T>);
        if constexpr (std::is_enum_v<T>) {
            return static_cast<T>(read<std::underlying_type_t<T>>());
        } else {
            T value;
            in_.read(reinterpret_cast<char*>(&value), sizeof(T));
            if (!in_) throw IoError("Unexpected end of index data");
            return detail::from_little_endian(value);
        }
    }

    /**
     * @param max_size Upper bound on the element count, guards against corrupt lengths
     */
    template <typename T>
    std::vector<T> read_vector(uint64_t max_size) {
        const auto size = read<uint64_t>();
        if (size > max_size) {
            throw IoError("Corrupt index data: vector length " + std::to_string(size) +
                          " exceeds bound " + std::to_string(max_size));
        }
        std::vector<T> values(static_cast<size_t>(size));
        for (auto& v : values) v = read<T>();
        return values;
    }

    void read_bytes(void* data, size_t len) {
        in_.read(static_cast<char*>(data), static_cast<std::streamsize>(len));
        if (!in_) throw IoError("Unexpected end of index data");
    }

private:
    std::istream& in_;
};

} // namespace Annex
