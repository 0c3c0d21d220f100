#pragma once

#include "cli/command_table.hpp"
#include "cli/confirmer.hpp"
#include "cli/output_sink.hpp"
#include "cli/vcdnet_cli.hpp"
#include "network/platform_api.hpp"
#include "network/resource_locator.hpp"
#include "network/vdc_api.hpp"
#include "session/session_provider.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

// Shared record of what reached the "server".
struct RemoteCallLog {
    std::vector<std::string> calls;

    ExternalNetworkSpec externalSpec;
    ExternalNetworkUpdate externalUpdate;
    DirectNetworkSpec directSpec;
    IsolatedNetworkSpec isolatedSpec;
    std::string deletedName;
    bool deleteForced = false;
    std::string resolvedVdcHref;

    // Served by list calls, in this order
    std::vector<NetworkSummary> networks;

    // Names already present remotely; creating one again is rejected
    std::set<std::string> existingNames;

    OperationStatus nextStatus;

    TaskResult makeTask(const std::string& operation) const {
        TaskResult task;
        task.href = "https://vcd.example.com/api/task/" + std::to_string(calls.size());
        task.operation = operation;
        task.status = "queued";
        return task;
    }

    OperationStatus createNamed(const std::string& call, const std::string& name, TaskResult& task) {
        calls.push_back(call);
        if (!nextStatus) {
            return nextStatus;
        }
        if (!existingNames.insert(name).second) {
            return OperationStatus::failure(ErrorKind::RemoteRejected,
                                            "Network with name '" + name + "' already exists", 400);
        }
        task = makeTask(call + " " + name);
        return OperationStatus::success();
    }

    OperationStatus record(const std::string& call, TaskResult& task) {
        calls.push_back(call);
        if (!nextStatus) {
            return nextStatus;
        }
        task = makeTask(call);
        return OperationStatus::success();
    }

    OperationStatus list(const std::string& call, std::vector<NetworkSummary>& result) {
        calls.push_back(call);
        if (!nextStatus) {
            return nextStatus;
        }
        result = networks;
        return OperationStatus::success();
    }
};

class FakePlatform : public PlatformApi {
public:
    explicit FakePlatform(RemoteCallLog& log) : log_(log) {}

    OperationStatus createExternalNetwork(const ExternalNetworkSpec& spec, TaskResult& task) override {
        log_.externalSpec = spec;
        return log_.createNamed("createExternalNetwork", spec.name, task);
    }
    OperationStatus listExternalNetworks(std::vector<NetworkSummary>& networks) override {
        return log_.list("listExternalNetworks", networks);
    }
    OperationStatus deleteExternalNetwork(const std::string& name, TaskResult& task) override {
        log_.deletedName = name;
        return log_.record("deleteExternalNetwork", task);
    }
    OperationStatus updateExternalNetwork(const ExternalNetworkUpdate& update, TaskResult& task) override {
        log_.externalUpdate = update;
        return log_.record("updateExternalNetwork", task);
    }

private:
    RemoteCallLog& log_;
};

class FakeVdc : public VdcApi {
public:
    explicit FakeVdc(RemoteCallLog& log) : log_(log) {}

    OperationStatus createDirectNetwork(const DirectNetworkSpec& spec, TaskResult& task) override {
        log_.directSpec = spec;
        return log_.createNamed("createDirectNetwork", spec.name, task);
    }
    OperationStatus listDirectNetworks(std::vector<NetworkSummary>& networks) override {
        return log_.list("listDirectNetworks", networks);
    }
    OperationStatus deleteDirectNetwork(const std::string& name, bool force, TaskResult& task) override {
        log_.deletedName = name;
        log_.deleteForced = force;
        return log_.record("deleteDirectNetwork", task);
    }
    OperationStatus createIsolatedNetwork(const IsolatedNetworkSpec& spec, TaskResult& task) override {
        log_.isolatedSpec = spec;
        return log_.createNamed("createIsolatedNetwork", spec.name, task);
    }
    OperationStatus listIsolatedNetworks(std::vector<NetworkSummary>& networks) override {
        return log_.list("listIsolatedNetworks", networks);
    }
    OperationStatus deleteIsolatedNetwork(const std::string& name, bool force, TaskResult& task) override {
        log_.deletedName = name;
        log_.deleteForced = force;
        return log_.record("deleteIsolatedNetwork", task);
    }

private:
    RemoteCallLog& log_;
};

class FakeLocator : public ResourceLocator {
public:
    explicit FakeLocator(RemoteCallLog& log) : log_(log) {}

protected:
    std::unique_ptr<PlatformApi> createPlatform(const SessionContext&) override {
        return std::make_unique<FakePlatform>(log_);
    }
    std::unique_ptr<VdcApi> createVdc(const SessionContext&, const std::string& vdcHref) override {
        log_.resolvedVdcHref = vdcHref;
        return std::make_unique<FakeVdc>(log_);
    }

private:
    RemoteCallLog& log_;
};

// Hands out a session without a client; the VDC check is left to the locator.
class FakeSessionProvider : public SessionProvider {
public:
    OperationStatus restoreSession(bool requireVdcSelected, SessionContext& session) override {
        restoreCount++;
        lastRequireVdc = requireVdcSelected;
        if (!failure.ok()) {
            return failure;
        }
        session.host = "vcd.example.com";
        session.orgName = "org1";
        session.selectedVdcHref = vdcHref;
        return OperationStatus::success();
    }

    std::optional<std::string> vdcHref;
    OperationStatus failure;
    int restoreCount = 0;
    bool lastRequireVdc = false;
};

class ScriptedConfirmer : public Confirmer {
public:
    bool confirm(const std::string& prompt) override {
        prompts.push_back(prompt);
        return answer;
    }

    bool answer = false;
    std::vector<std::string> prompts;
};

class CommandTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        sessions_.vdcHref = "https://vcd.example.com/api/vdc/11111111-2222-3333-4444-555555555555";
    }

    int run(const std::vector<std::string>& args) {
        OutputSink output(out_, err_, format_);
        VcdnetCli cli(CommandContext{sessions_, locator_, confirmer_, output});
        return cli.run(args);
    }

    void resetStreams() {
        out_.str("");
        err_.str("");
    }

    RemoteCallLog remote_;
    FakeSessionProvider sessions_;
    FakeLocator locator_{remote_};
    ScriptedConfirmer confirmer_;
    OutputFormat format_ = OutputFormat::Human;
    std::ostringstream out_;
    std::ostringstream err_;
};
