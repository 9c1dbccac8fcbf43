#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>

/// Read a little-endian value of type T from p, independent of host order.
template <typename T>
T readLittleEndian(const uint8_t* p)
{
    static_assert(std::is_trivially_copyable_v<T>, "T must be trivially copyable");
    using U = std::conditional_t<sizeof(T) == 1, uint8_t,
              std::conditional_t<sizeof(T) == 2, uint16_t,
              std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>>>;
    static_assert(sizeof(U) == sizeof(T), "unsupported sample width");

    U bits = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i)
        bits |= static_cast<U>(static_cast<U>(p[i]) << (8 * i));

    T value;
    std::memcpy(&value, &bits, sizeof(T));
    return value;
}

/// Write a value of type T to p in little-endian order.
template <typename T>
void writeLittleEndian(uint8_t* p, T value)
{
    static_assert(std::is_trivially_copyable_v<T>, "T must be trivially copyable");
    using U = std::conditional_t<sizeof(T) == 1, uint8_t,
              std::conditional_t<sizeof(T) == 2, uint16_t,
              std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>>>;

    U bits;
    std::memcpy(&bits, &value, sizeof(T));
    for (std::size_t i = 0; i < sizeof(T); ++i)
        p[i] = static_cast<uint8_t>((bits >> (8 * i)) & 0xFF);
}
