#include "core/types/Ipv4Address.hpp"

#include <cctype>
#include <stdexcept>

namespace channelscout::core {

namespace {

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

} // namespace

Ipv4Address Ipv4Address::parse(const std::string& text) {
    auto input = trim(text);
    if (input.empty()) {
        throw std::invalid_argument("Empty IPv4 address");
    }

    uint32_t value = 0;
    int octets = 0;
    size_t pos = 0;

    while (pos <= input.size()) {
        auto dot = input.find('.', pos);
        auto part = input.substr(pos, dot == std::string::npos ? std::string::npos : dot - pos);

        if (part.empty() || part.size() > 3) {
            throw std::invalid_argument("Invalid IPv4 address: '" + input + "'");
        }
        // Leading zeros are ambiguous (octal in some parsers).
        if (part.size() > 1 && part[0] == '0') {
            throw std::invalid_argument("Leading zero in IPv4 octet of '" + input + "'");
        }
        for (char c : part) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw std::invalid_argument("Invalid IPv4 address: '" + input + "'");
            }
        }

        int octet = std::stoi(part);
        if (octet > 255) {
            throw std::invalid_argument("IPv4 octet out of range in '" + input + "'");
        }

        value = (value << 8) | static_cast<uint32_t>(octet);
        ++octets;

        if (dot == std::string::npos) {
            break;
        }
        pos = dot + 1;
    }

    if (octets != 4) {
        throw std::invalid_argument("Invalid IPv4 address: '" + input + "'");
    }
    return Ipv4Address(value);
}

std::string Ipv4Address::toString() const {
    return std::to_string((value_ >> 24) & 0xFF) + "." + std::to_string((value_ >> 16) & 0xFF) +
           "." + std::to_string((value_ >> 8) & 0xFF) + "." + std::to_string(value_ & 0xFF);
}

bool Ipv4Address::isPrivate() const {
    return (value_ & 0xFF000000u) == 0x0A000000u     // 10.0.0.0/8
           || (value_ & 0xFFF00000u) == 0xAC100000u  // 172.16.0.0/12
           || (value_ & 0xFFFF0000u) == 0xC0A80000u; // 192.168.0.0/16
}

bool Ipv4Address::isMulticast() const {
    return (value_ & 0xF0000000u) == 0xE0000000u;
}

} // namespace channelscout::core
