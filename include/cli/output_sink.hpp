#pragma once

#include "common/vcd_types.hpp"
#include <ostream>
#include <string>
#include <vector>

enum class OutputFormat {
    Human,
    Json
};

class OutputSink {
public:
    OutputSink(std::ostream& out, std::ostream& err, OutputFormat format = OutputFormat::Human);

    void printTask(const TaskResult& task);
    void printMessage(const std::string& message);
    void printNetworks(const std::vector<NetworkSummary>& networks);
    void printUsage(const std::string& text);

    // One line on the error stream, whatever the output format.
    void printError(const std::string& message);

private:
    std::ostream& out_;
    std::ostream& err_;
    OutputFormat format_;
};
