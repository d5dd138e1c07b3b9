/**
 * @file Ipv4Address.hpp
 * @brief Minimal IPv4 address value type used by target generation.
 *
 * Addresses are held as host-order 32-bit integers so that ranges can be
 * enumerated with plain arithmetic.
 */

#pragma once

#include <compare>
#include <cstdint>
#include <string>

namespace channelscout::core {

/**
 * @brief An IPv4 address in host byte order.
 */
class Ipv4Address {
public:
    Ipv4Address() = default;
    explicit Ipv4Address(uint32_t value) : value_(value) {}

    /**
     * @brief Parses a dotted-quad address such as "192.168.1.10".
     * @param text Address text. Leading and trailing whitespace is ignored.
     * @return The parsed address.
     * @throws std::invalid_argument if the text is not a valid IPv4 address.
     */
    static Ipv4Address parse(const std::string& text);

    [[nodiscard]] uint32_t value() const { return value_; }

    /**
     * @brief Formats the address in dotted-quad notation.
     */
    [[nodiscard]] std::string toString() const;

    /**
     * @brief Checks whether the address is RFC1918 private-use space.
     * @return True for 10.0.0.0/8, 172.16.0.0/12 and 192.168.0.0/16.
     */
    [[nodiscard]] bool isPrivate() const;

    /**
     * @brief Checks whether the address lies in the 224.0.0.0/4 multicast block.
     */
    [[nodiscard]] bool isMulticast() const;

    auto operator<=>(const Ipv4Address& other) const = default;

private:
    uint32_t value_{0};
};

} // namespace channelscout::core
