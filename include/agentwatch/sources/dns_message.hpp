/**
 * @file dns_message.hpp
 * @brief Minimal DNS wire codec for mDNS service browsing.
 *
 * Only what a DNS-SD browse needs: building a PTR question and reading the
 * PTR and SRV records out of responses, with name compression. Records of
 * other types are skipped.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#pragma once

#include "agentwatch/core/export.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace agentwatch {
namespace sources {

constexpr uint16_t DNS_TYPE_PTR = 12;
constexpr uint16_t DNS_TYPE_SRV = 33;
constexpr uint16_t DNS_CLASS_IN = 1;

/// Set in the question class to ask for a unicast reply.
constexpr uint16_t DNS_CLASS_UNICAST_RESPONSE = 0x8000;

/**
 * @struct DnsRecord
 * @brief A PTR or SRV resource record.
 *
 * Names are canonical: lowercase, no trailing dot. For PTR records
 * @c target is the pointed-to instance name; for SRV records it is the host
 * and @c port is set.
 */
struct DnsRecord {
    std::string name;
    uint16_t type = 0;
    std::string target;
    uint16_t port = 0;
};

/**
 * @brief Lowercase a DNS name and strip trailing dots.
 */
AGENTWATCH_CORE_API std::string canonicalDnsName(const std::string& name);

/**
 * @brief Encode a one-question PTR query.
 * @param unicastResponse Set the QU bit (used when port 5353 is unavailable).
 * @return The packet, or an empty vector if a label exceeds 63 bytes.
 */
AGENTWATCH_CORE_API std::vector<uint8_t> buildPtrQuery(const std::string& serviceType,
                                                       bool unicastResponse = false);

/**
 * @brief Read the PTR and SRV records of a response packet.
 *
 * Queries (QR bit clear) and truncated or malformed packets yield whatever
 * was parsed before the damage, possibly nothing. Never throws.
 */
AGENTWATCH_CORE_API std::vector<DnsRecord> parseDnsResponse(const uint8_t* data, size_t length);

/**
 * @struct ResolvedService
 * @brief A service instance whose SRV record has been seen.
 */
struct ResolvedService {
    std::string instance;  ///< Instance label, e.g. "opencode-4096"
    std::string host;      ///< SRV target, e.g. "devbox.local"
    uint16_t port = 0;
};

/**
 * @class ServiceResolver
 * @brief Joins PTR answers to SRV answers across packets.
 *
 * Responders often send the PTR and the SRV in separate packets, so records
 * accumulate until both halves of an instance are known. Each instance is
 * reported once, the first time it becomes resolvable.
 */
class AGENTWATCH_CORE_API ServiceResolver {
public:
    explicit ServiceResolver(const std::string& serviceType);

    /**
     * @brief Absorb one packet's records.
     * @return Instances that became resolvable with these records.
     */
    std::vector<ResolvedService> add(const std::vector<DnsRecord>& records);

private:
    std::string instanceLabel(const std::string& instanceName) const;

    std::string serviceType_;
    std::set<std::string> instances_;
    std::map<std::string, DnsRecord> srv_;
    std::set<std::string> reported_;
};

}  // namespace sources
}  // namespace agentwatch
