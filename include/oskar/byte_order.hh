/**
 * @file byte_order.hh
 * @brief Byte order (endianness) utilities for OSKAR binary payloads
 */

#pragma once

#include <cstring>
#include <oskar/endian.hh>

namespace oskar {
    /**
     * @enum byte_order
     * @brief Byte order of multi-byte values in a file
     */
    enum class byte_order {
        little, ///< Little-endian (header, tags, and payloads by default)
        big     ///< Big-endian (payloads whose tag sets the big-endian flag)
    };

    /**
     * @brief Check if given byte order matches the native system byte order
     * @param bo Byte order to check
     * @return True if the byte order matches the system's native byte order
     */
    inline bool byte_order_native(byte_order bo) {
        switch (bo) {
            case byte_order::little:
                return is_little_endian;
            case byte_order::big:
                return is_big_endian;
        }
        // make compiler happy
        return false;
    }

    /**
     * @brief Load a value of type T stored in the given byte order
     * @param src Pointer to at least sizeof(T) bytes, no alignment required
     * @param bo Byte order the value was written with
     */
    template<typename T>
    T load(const void* src, byte_order bo) {
        T value;
        std::memcpy(&value, src, sizeof(T));
        if constexpr (sizeof(T) > 1) {
            if (!byte_order_native(bo)) {
                value = swap_byte_order(value);
            }
        }
        return value;
    }
}
