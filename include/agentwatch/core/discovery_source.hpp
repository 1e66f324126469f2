/**
 * @file discovery_source.hpp
 * @brief Contract shared by every instance discovery mechanism.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#pragma once

#include "agentwatch/core/export.hpp"
#include "agentwatch/core/instance.hpp"
#include "agentwatch/core/stream.hpp"

#include <chrono>
#include <memory>

namespace agentwatch {
namespace core {

using InstanceStream = Stream<DiscoveredInstance>;
using InstanceStreamPtr = StreamPtr<DiscoveredInstance>;

/**
 * @class DiscoverySource
 * @brief One technique for finding running agent hosts.
 *
 * discover() returns a fresh stream per call. The stream ends on the
 * source's own completion or once @p timeout has elapsed, whichever comes
 * first; work still pending at the deadline is abandoned. A source that
 * fails internally returns an empty stream instead of throwing.
 *
 * stop() cancels any in-flight discovery from outside the consuming loop.
 * It is idempotent and safe to call after discovery has completed.
 */
class AGENTWATCH_CORE_API DiscoverySource {
public:
    virtual ~DiscoverySource() = default;

    virtual InstanceStreamPtr discover(std::chrono::milliseconds timeout) = 0;

    virtual void stop() {}

    /**
     * @brief Short name used in log lines.
     */
    virtual const char* name() const = 0;
};

using DiscoverySourcePtr = std::shared_ptr<DiscoverySource>;

}  // namespace core
}  // namespace agentwatch
