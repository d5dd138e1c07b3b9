#include "core/strategy/ITargetStrategy.hpp"

namespace channelscout::core {

std::string scanModeToString(ScanMode mode) {
    switch (mode) {
    case ScanMode::Template:
        return "template";
    case ScanMode::Multicast:
        return "multicast";
    }
    return "template";
}

std::optional<ScanMode> scanModeFromString(const std::string& str) {
    if (str == "template")
        return ScanMode::Template;
    if (str == "multicast")
        return ScanMode::Multicast;
    return std::nullopt;
}

} // namespace channelscout::core
