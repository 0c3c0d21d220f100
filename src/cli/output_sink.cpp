#include "cli/output_sink.hpp"
#include <algorithm>
#include <iomanip>
#include <utility>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

OutputSink::OutputSink(std::ostream& out, std::ostream& err, OutputFormat format)
    : out_(out), err_(err), format_(format) {
}

void OutputSink::printTask(const TaskResult& task) {
    if (format_ == OutputFormat::Json) {
        if (!task.raw.is_null()) {
            out_ << task.raw.dump(2) << std::endl;
        } else {
            json object = {
                {"href", task.href},
                {"name", task.name},
                {"operation", task.operation},
                {"operationName", task.operationName},
                {"status", task.status}
            };
            out_ << object.dump(2) << std::endl;
        }
        return;
    }

    const std::vector<std::pair<std::string, std::string>> rows = {
        {"operation", task.operation},
        {"operationName", task.operationName},
        {"status", task.status},
        {"href", task.href}
    };
    for (const auto& row : rows) {
        if (!row.second.empty()) {
            out_ << std::left << std::setw(15) << row.first << row.second << "\n";
        }
    }
    out_.flush();
}

void OutputSink::printMessage(const std::string& message) {
    if (format_ == OutputFormat::Json) {
        out_ << json({{"message", message}}).dump() << std::endl;
    } else {
        out_ << message << std::endl;
    }
}

void OutputSink::printNetworks(const std::vector<NetworkSummary>& networks) {
    if (format_ == OutputFormat::Json) {
        json list = json::array();
        for (const auto& network : networks) {
            list.push_back({{"name", network.name}});
        }
        out_ << list.dump(2) << std::endl;
        return;
    }

    if (networks.empty()) {
        return;
    }

    size_t width = std::string("name").size();
    for (const auto& network : networks) {
        width = std::max(width, network.name.size());
    }
    out_ << "name" << "\n" << std::string(width, '-') << "\n";
    for (const auto& network : networks) {
        out_ << network.name << "\n";
    }
    out_.flush();
}

void OutputSink::printUsage(const std::string& text) {
    out_ << text;
    out_.flush();
}

void OutputSink::printError(const std::string& message) {
    std::string line = message;
    std::replace(line.begin(), line.end(), '\n', ' ');
    std::replace(line.begin(), line.end(), '\r', ' ');
    err_ << "Error: " << line << std::endl;
}
