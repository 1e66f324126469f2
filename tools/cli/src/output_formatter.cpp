/**
 * @file output_formatter.cpp
 * @brief Output formatting implementation
 */

#include "output_formatter.hpp"

#include <agentwatch/utils/logger.hpp>

#include <google/protobuf/util/json_util.h>

#include <iomanip>

namespace agentwatch::cli {

namespace {

const std::vector<size_t> INSTANCE_WIDTHS = {6, 24, 8, 6, 8};
const std::vector<size_t> SESSION_WIDTHS = {34, 7, 7, 8};

std::string optional_text(const std::optional<std::string>& value) {
    return value ? *value : "-";
}

template<typename T>
std::string optional_number(const std::optional<T>& value) {
    return value ? std::to_string(*value) : "-";
}

} // anonymous namespace

proto::InstanceRecord to_record(const core::DiscoveredInstance& instance) {
    proto::InstanceRecord record;
    record.set_identity(instance.identity());
    record.set_port(instance.port());
    if (instance.hostname()) {
        record.set_hostname(*instance.hostname());
    }
    if (instance.pid()) {
        record.set_pid(*instance.pid());
    }
    if (instance.cwd()) {
        record.set_cwd(*instance.cwd());
    }
    record.set_origin(core::instanceOriginToString(instance.origin()));
    return record;
}

proto::SessionStatusRecord to_record(const core::SessionStatus& status) {
    proto::SessionStatusRecord record;
    record.set_session_id(status.session_id);
    record.set_port(status.port);
    record.set_status(core::sessionStateToString(status.state));
    if (status.retry_attempt) {
        record.set_retry_attempt(*status.retry_attempt);
    }
    if (status.retry_message) {
        record.set_retry_message(*status.retry_message);
    }
    if (status.retry_next_at) {
        record.set_retry_next(*status.retry_next_at);
    }
    return record;
}

OutputFormatter::OutputFormatter(bool json_mode, std::ostream& out)
    : json_mode_(json_mode)
    , out_(out) {}

void OutputFormatter::print_instance_header() {
    if (!json_mode_) {
        print_row({"ORIGIN", "HOST", "PORT", "PID", "CWD"}, INSTANCE_WIDTHS);
    }
}

void OutputFormatter::print_instance(const core::DiscoveredInstance& instance) {
    if (json_mode_) {
        print_json(to_record(instance));
        return;
    }
    print_row({core::instanceOriginToString(instance.origin()),
               instance.hostname().value_or("localhost"),
               instance.hasPort() ? std::to_string(instance.port()) : "-",
               optional_number(instance.pid()),
               optional_text(instance.cwd())},
              INSTANCE_WIDTHS);
}

void OutputFormatter::print_session_header() {
    if (!json_mode_) {
        print_row({"SESSION", "PORT", "STATUS", "ATTEMPT", "MESSAGE"}, SESSION_WIDTHS);
    }
}

void OutputFormatter::print_session(const core::SessionStatus& status) {
    if (json_mode_) {
        print_json(to_record(status));
        return;
    }
    print_row({status.session_id,
               std::to_string(status.port),
               core::sessionStateToString(status.state),
               optional_number(status.retry_attempt),
               optional_text(status.retry_message)},
              SESSION_WIDTHS);
}

void OutputFormatter::print_json(const google::protobuf::Message& message) {
    std::string json;
    auto status = google::protobuf::util::MessageToJsonString(message, &json);
    if (!status.ok()) {
        LOG_ERROR("Output", "Cannot encode {}: {}",
                  message.GetTypeName(), status.ToString());
        return;
    }
    out_ << json << "\n";
}

void OutputFormatter::print_line(const std::string& text) {
    if (!json_mode_) {
        out_ << text << "\n";
    }
}

void OutputFormatter::flush() {
    out_.flush();
}

void OutputFormatter::print_row(const std::vector<std::string>& cells,
                                const std::vector<size_t>& widths) {
    for (size_t i = 0; i < cells.size(); ++i) {
        // Last column is never padded.
        if (i + 1 < cells.size() && i < widths.size()) {
            out_ << std::left << std::setw(static_cast<int>(widths[i] + 2)) << cells[i];
        } else {
            out_ << cells[i];
        }
    }
    out_ << "\n";
}

} // namespace agentwatch::cli
