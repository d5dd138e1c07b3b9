/**
 * @file ITargetStrategy.hpp
 * @brief Interface for generators of candidate stream URLs.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace channelscout::core {

/**
 * @brief Available scanning modes.
 */
enum class ScanMode : int {
    Template = 0,  ///< URL pattern substituted over a private address range
    Multicast = 1  ///< protocol://address:port over multicast ranges and ports
};

/**
 * @brief Forward-only cursor over the targets of one traversal.
 */
class TargetCursor {
public:
    virtual ~TargetCursor() = default;

    /**
     * @brief Returns the next target URL.
     * @return The URL, or nullopt once the traversal is exhausted.
     */
    virtual std::optional<std::string> next() = 0;
};

/**
 * @brief Interface for target generation strategies.
 *
 * Strategies are validated when constructed and never perform network I/O.
 * Every call to generateTargets() starts a fresh traversal.
 */
class ITargetStrategy {
public:
    virtual ~ITargetStrategy() = default;

    /**
     * @brief Returns the mode this strategy implements.
     */
    [[nodiscard]] virtual ScanMode mode() const = 0;

    /**
     * @brief Returns the exact number of targets a traversal yields.
     */
    [[nodiscard]] virtual size_t estimateTargetCount() const = 0;

    /**
     * @brief Starts a new traversal over all targets.
     * @return Cursor yielding the targets in generation order.
     */
    [[nodiscard]] virtual std::unique_ptr<TargetCursor> generateTargets() const = 0;
};

/**
 * @brief Converts a ScanMode to its wire name ("template" or "multicast").
 */
std::string scanModeToString(ScanMode mode);

/**
 * @brief Parses a wire name into a ScanMode.
 * @return The mode, or nullopt for an unknown name.
 */
std::optional<ScanMode> scanModeFromString(const std::string& str);

} // namespace channelscout::core
