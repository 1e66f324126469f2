/**
 * @file dns_message.cpp
 * @brief DNS wire codec implementation.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#include "agentwatch/sources/dns_message.hpp"

#include <algorithm>
#include <cctype>

namespace agentwatch {
namespace sources {

namespace {

constexpr size_t HEADER_SIZE = 12;
constexpr int MAX_POINTER_DEPTH = 16;

uint16_t read16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

void write16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

// Reads a possibly compressed name at offset. On success advances offset
// past the name as it appears in place (pointers count as two bytes).
std::optional<std::string> readName(const uint8_t* data, size_t length,
                                    size_t& offset, int depth = 0) {
    if (depth > MAX_POINTER_DEPTH) {
        return std::nullopt;
    }

    std::string name;
    size_t pos = offset;

    while (pos < length) {
        uint8_t labelLength = data[pos++];

        if (labelLength == 0) {
            offset = pos;
            return name;
        }

        if ((labelLength & 0xC0) == 0xC0) {
            if (pos >= length) {
                return std::nullopt;
            }
            size_t target = static_cast<size_t>(((labelLength & 0x3F) << 8) | data[pos++]);
            if (target >= length) {
                return std::nullopt;
            }
            auto rest = readName(data, length, target, depth + 1);
            if (!rest) {
                return std::nullopt;
            }
            if (!name.empty() && !rest->empty()) {
                name.push_back('.');
            }
            name += *rest;
            offset = pos;
            return name;
        }

        if ((labelLength & 0xC0) != 0 || pos + labelLength > length) {
            return std::nullopt;
        }
        if (!name.empty()) {
            name.push_back('.');
        }
        name.append(reinterpret_cast<const char*>(data + pos), labelLength);
        pos += labelLength;
    }

    return std::nullopt;
}

}  // namespace

std::string canonicalDnsName(const std::string& name) {
    size_t end = name.size();
    while (end > 0 && name[end - 1] == '.') {
        --end;
    }
    std::string result = name.substr(0, end);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::vector<uint8_t> buildPtrQuery(const std::string& serviceType, bool unicastResponse) {
    std::vector<uint8_t> packet = {
        0, 0,   // id (always 0 in mDNS)
        0, 0,   // flags: standard query
        0, 1,   // one question
        0, 0, 0, 0, 0, 0
    };

    size_t start = 0;
    std::string name = canonicalDnsName(serviceType);
    while (start <= name.size()) {
        size_t dot = name.find('.', start);
        if (dot == std::string::npos) {
            dot = name.size();
        }
        size_t labelLength = dot - start;
        if (labelLength > 63) {
            return {};
        }
        if (labelLength > 0) {
            packet.push_back(static_cast<uint8_t>(labelLength));
            packet.insert(packet.end(), name.begin() + start, name.begin() + dot);
        }
        start = dot + 1;
    }
    packet.push_back(0);

    write16(packet, DNS_TYPE_PTR);
    write16(packet, static_cast<uint16_t>(
        DNS_CLASS_IN | (unicastResponse ? DNS_CLASS_UNICAST_RESPONSE : 0)));
    return packet;
}

std::vector<DnsRecord> parseDnsResponse(const uint8_t* data, size_t length) {
    std::vector<DnsRecord> records;
    if (!data || length < HEADER_SIZE) {
        return records;
    }

    uint16_t flags = read16(data + 2);
    if ((flags & 0x8000) == 0) {
        return records;
    }

    uint16_t questions = read16(data + 4);
    uint32_t resourceCount = static_cast<uint32_t>(read16(data + 6)) +
                             read16(data + 8) + read16(data + 10);

    size_t offset = HEADER_SIZE;
    for (uint16_t i = 0; i < questions; ++i) {
        if (!readName(data, length, offset) || offset + 4 > length) {
            return records;
        }
        offset += 4;
    }

    for (uint32_t i = 0; i < resourceCount; ++i) {
        auto name = readName(data, length, offset);
        if (!name || offset + 10 > length) {
            return records;
        }

        uint16_t type = read16(data + offset);
        uint16_t rrClass = read16(data + offset + 2) & 0x7FFF;
        uint16_t rdLength = read16(data + offset + 8);
        size_t rdata = offset + 10;
        size_t next = rdata + rdLength;
        if (next > length) {
            return records;
        }

        if (rrClass == DNS_CLASS_IN && type == DNS_TYPE_PTR) {
            size_t cursor = rdata;
            if (auto target = readName(data, length, cursor)) {
                records.push_back({canonicalDnsName(*name), type,
                                   canonicalDnsName(*target), 0});
            }
        } else if (rrClass == DNS_CLASS_IN && type == DNS_TYPE_SRV && rdLength >= 6) {
            // priority(2) weight(2) port(2) target
            size_t cursor = rdata + 6;
            if (auto target = readName(data, length, cursor)) {
                records.push_back({canonicalDnsName(*name), type,
                                   canonicalDnsName(*target), read16(data + rdata + 4)});
            }
        }

        offset = next;
    }

    return records;
}

ServiceResolver::ServiceResolver(const std::string& serviceType)
    : serviceType_(canonicalDnsName(serviceType))
{}

std::vector<ResolvedService> ServiceResolver::add(const std::vector<DnsRecord>& records) {
    for (const auto& record : records) {
        if (record.type == DNS_TYPE_PTR && record.name == serviceType_) {
            instances_.insert(record.target);
        } else if (record.type == DNS_TYPE_SRV) {
            srv_[record.name] = record;
        }
    }

    std::vector<ResolvedService> resolved;
    for (const auto& instance : instances_) {
        if (reported_.count(instance)) {
            continue;
        }
        auto srv = srv_.find(instance);
        if (srv == srv_.end()) {
            continue;
        }
        reported_.insert(instance);
        resolved.push_back({instanceLabel(instance), srv->second.target, srv->second.port});
    }
    return resolved;
}

std::string ServiceResolver::instanceLabel(const std::string& instanceName) const {
    std::string suffix = "." + serviceType_;
    if (instanceName.size() > suffix.size() &&
        instanceName.compare(instanceName.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return instanceName.substr(0, instanceName.size() - suffix.size());
    }
    return instanceName;
}

}  // namespace sources
}  // namespace agentwatch
