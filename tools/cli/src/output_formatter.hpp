/**
 * @file output_formatter.hpp
 * @brief Output formatting for CLI (table and JSON lines)
 */

#pragma once

#include <agentwatch/core/instance.hpp>
#include <agentwatch/core/session_status.hpp>
#include <agentwatch/proto/inventory.pb.h>

#include <google/protobuf/message.h>

#include <iostream>
#include <string>
#include <vector>

namespace agentwatch::cli {

/**
 * @brief Convert core records to their JSON wire messages
 */
proto::InstanceRecord to_record(const core::DiscoveredInstance& instance);
proto::SessionStatusRecord to_record(const core::SessionStatus& status);

/**
 * @brief Streams records as aligned rows or as one JSON object per line
 *
 * Rows are printed as records arrive, so table columns use fixed widths
 * instead of being measured over the whole result.
 */
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode = false, std::ostream& out = std::cout);

    bool is_json_mode() const { return json_mode_; }

    void print_instance_header();
    void print_instance(const core::DiscoveredInstance& instance);

    void print_session_header();
    void print_session(const core::SessionStatus& status);

    void print_json(const google::protobuf::Message& message);

    // Human-only messages (ignored in JSON mode)
    void print_line(const std::string& text);

    void flush();

private:
    bool json_mode_;
    std::ostream& out_;

    void print_row(const std::vector<std::string>& cells, const std::vector<size_t>& widths);
};

} // namespace agentwatch::cli
