/**
 * @file status_poller.cpp
 * @brief StatusPoller and status payload decoding.
 *
 * @copyright Copyright (c) 2024 agentwatch Contributors
 * @license MIT License
 */

#include "agentwatch/core/status_poller.hpp"
#include "agentwatch/utils/logger.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cmath>
#include <deque>

namespace agentwatch {
namespace core {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

const Value* findField(const Struct& object, const std::string& key) {
    auto it = object.fields().find(key);
    if (it == object.fields().end()) {
        return nullptr;
    }
    return &it->second;
}

std::optional<int64_t> integerField(const Struct& object, const std::string& key) {
    const Value* value = findField(object, key);
    if (!value || value->kind_case() != Value::kNumberValue) {
        return std::nullopt;
    }
    // Only whole numbers inside [-2^63, 2^63) convert without overflow.
    const double limit = std::ldexp(1.0, 63);
    double number = value->number_value();
    if (!std::isfinite(number) || std::trunc(number) != number ||
        number < -limit || number >= limit) {
        return std::nullopt;
    }
    return static_cast<int64_t>(number);
}

std::optional<std::string> stringField(const Struct& object, const std::string& key) {
    const Value* value = findField(object, key);
    if (!value || value->kind_case() != Value::kStringValue) {
        return std::nullopt;
    }
    return value->string_value();
}

}  // namespace

std::vector<SessionStatus> parseStatusPayload(const std::string& body, uint16_t port) {
    std::vector<SessionStatus> result;

    Struct document;
    auto status = google::protobuf::util::JsonStringToMessage(body, &document);
    if (!status.ok()) {
        LOG_DEBUG("Poller", "Port {}: unparseable status body ({})",
                  port, status.ToString());
        return result;
    }

    // Struct fields are a hash map; sort for a stable emission order.
    std::vector<std::string> ids;
    ids.reserve(document.fields_size());
    for (const auto& entry : document.fields()) {
        ids.push_back(entry.first);
    }
    std::sort(ids.begin(), ids.end());

    for (const auto& id : ids) {
        const Value& entry = document.fields().at(id);
        if (entry.kind_case() != Value::kStructValue) {
            LOG_DEBUG("Poller", "Port {}: session {} is not an object", port, id);
            continue;
        }

        const Struct& fields = entry.struct_value();
        auto type = stringField(fields, "type");
        auto state = type ? parseSessionState(*type) : std::nullopt;
        if (!state) {
            LOG_DEBUG("Poller", "Port {}: session {} has no usable type", port, id);
            continue;
        }

        SessionStatus session;
        session.session_id = id;
        session.port = port;
        session.state = *state;
        if (*state == SessionState::RETRYING) {
            session.retry_attempt = integerField(fields, "attempt");
            session.retry_message = stringField(fields, "message");
            session.retry_next_at = integerField(fields, "next");
        }
        result.push_back(std::move(session));
    }

    return result;
}

StatusPoller::StatusPoller(std::shared_ptr<StatusClient> client)
    : client_(std::move(client))
{}

SessionStreamPtr StatusPoller::poll(InstanceStreamPtr instances) const {
    // The input is shared with the cancel hook, which may run on another thread.
    std::shared_ptr<InstanceStream> input(std::move(instances));
    auto pending = std::make_shared<std::deque<SessionStatus>>();
    auto client = client_;

    auto producer = [input, pending, client]() -> std::optional<SessionStatus> {
        while (pending->empty()) {
            auto instance = input->next();
            if (!instance) {
                return std::nullopt;
            }

            auto body = client->fetchStatus(*instance);
            if (!body) {
                LOG_DEBUG("Poller", "No status from {}", instance->endpoint());
                continue;
            }

            auto sessions = parseStatusPayload(*body, instance->port());
            LOG_TRACE("Poller", "{} reported {} sessions",
                      instance->endpoint(), sessions.size());
            for (auto& session : sessions) {
                pending->push_back(std::move(session));
            }
        }

        SessionStatus front = std::move(pending->front());
        pending->pop_front();
        return front;
    };

    return std::make_unique<GeneratorStream<SessionStatus>>(
        std::move(producer), [input]() { input->cancel(); });
}

}  // namespace core
}  // namespace agentwatch
