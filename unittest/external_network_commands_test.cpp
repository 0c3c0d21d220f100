#include <gtest/gtest.h>
#include "fakes.hpp"
#include "cli/network_commands.hpp"

class ExternalNetworkCommandsTest : public CommandTestBase {
protected:
    std::vector<std::string> createArgs(const std::string& name) {
        return {"network", "external", "create", name, "vc1",
                "--port-group", "pg1", "--port-group", "pg2",
                "--gateway", "192.168.1.1", "--netmask", "255.255.255.0",
                "--ip-range", "192.168.1.2-192.168.1.49",
                "--ip-range", "192.168.1.100-192.168.1.149",
                "--description", "External network",
                "--dns1", "8.8.8.8", "--dns2", "8.8.8.9", "--dns-suffix", "example.com"};
    }
};

TEST_F(ExternalNetworkCommandsTest, CreateForwardsEveryField) {
    EXPECT_EQ(VcdnetCli::kExitSuccess, run(createArgs("external-net1")));

    ASSERT_EQ(std::vector<std::string>{"createExternalNetwork"}, remote_.calls);
    const ExternalNetworkSpec& spec = remote_.externalSpec;
    EXPECT_EQ("external-net1", spec.name);
    EXPECT_EQ("vc1", spec.vimServerName);
    EXPECT_EQ((std::vector<std::string>{"pg1", "pg2"}), spec.portGroups);
    EXPECT_EQ("192.168.1.1", spec.gatewayIp);
    EXPECT_EQ("255.255.255.0", spec.netmask);
    EXPECT_EQ((std::vector<std::string>{"192.168.1.2-192.168.1.49", "192.168.1.100-192.168.1.149"}),
              spec.ipRanges);
    EXPECT_EQ("External network", spec.description);
    EXPECT_EQ("8.8.8.8", spec.primaryDns.value_or(""));
    EXPECT_EQ("8.8.8.9", spec.secondaryDns.value_or(""));
    EXPECT_EQ("example.com", spec.dnsSuffix.value_or(""));

    EXPECT_FALSE(sessions_.lastRequireVdc);
    EXPECT_NE(std::string::npos, out_.str().find("createExternalNetwork external-net1"));
    EXPECT_NE(std::string::npos, out_.str().find("External network created successfully."));
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(ExternalNetworkCommandsTest, CreateWithoutDnsLeavesThemUnset) {
    EXPECT_EQ(VcdnetCli::kExitSuccess,
              run({"network", "external", "create", "ext2", "vc1", "-p", "pg1",
                   "--gateway-ip", "10.0.0.1", "-n", "255.255.255.0", "-i", "10.0.0.2-10.0.0.9"}));
    ASSERT_EQ(1u, remote_.calls.size());
    EXPECT_EQ("10.0.0.1", remote_.externalSpec.gatewayIp);
    EXPECT_FALSE(remote_.externalSpec.primaryDns.has_value());
    EXPECT_FALSE(remote_.externalSpec.secondaryDns.has_value());
    EXPECT_FALSE(remote_.externalSpec.dnsSuffix.has_value());
    EXPECT_TRUE(remote_.externalSpec.description.empty());
}

TEST_F(ExternalNetworkCommandsTest, CreateMissingPortGroupSendsNothing) {
    EXPECT_EQ(VcdnetCli::kExitUsage,
              run({"network", "external", "create", "ext", "vc1", "--gateway", "10.0.0.1",
                   "--netmask", "255.255.255.0", "--ip-range", "10.0.0.2-10.0.0.9"}));
    EXPECT_TRUE(remote_.calls.empty());
    EXPECT_EQ(0, sessions_.restoreCount);
    EXPECT_NE(std::string::npos, err_.str().find("--port-group"));
}

TEST_F(ExternalNetworkCommandsTest, CreateMissingIpRangeSendsNothing) {
    EXPECT_EQ(VcdnetCli::kExitUsage,
              run({"network", "external", "create", "ext", "vc1", "--port-group", "pg1",
                   "--gateway", "10.0.0.1", "--netmask", "255.255.255.0"}));
    EXPECT_TRUE(remote_.calls.empty());
    EXPECT_NE(std::string::npos, err_.str().find("--ip-range"));
}

TEST_F(ExternalNetworkCommandsTest, CreateMissingVcNameSendsNothing) {
    EXPECT_EQ(VcdnetCli::kExitUsage,
              run({"network", "external", "create", "ext", "--port-group", "pg1",
                   "--gateway", "10.0.0.1", "--netmask", "255.255.255.0", "--ip-range", "10.0.0.2-10.0.0.9"}));
    EXPECT_TRUE(remote_.calls.empty());
    EXPECT_EQ("Error: Missing argument <vc-name>\n", err_.str());
}

TEST_F(ExternalNetworkCommandsTest, IdenticalCreatesAreBothSent) {
    EXPECT_EQ(VcdnetCli::kExitSuccess, run(createArgs("ext-dup")));
    resetStreams();
    EXPECT_EQ(VcdnetCli::kExitFailure, run(createArgs("ext-dup")));

    EXPECT_EQ((std::vector<std::string>{"createExternalNetwork", "createExternalNetwork"}), remote_.calls);
    EXPECT_EQ("Error: Network with name 'ext-dup' already exists\n", err_.str());
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(ExternalNetworkCommandsTest, CreateWithoutSessionIsAuthFailure) {
    sessions_.failure = OperationStatus::failure(ErrorKind::AuthFailure, "Not logged in: no session profile");
    EXPECT_EQ(VcdnetCli::kExitFailure, run(createArgs("ext")));
    EXPECT_TRUE(remote_.calls.empty());
    EXPECT_NE(std::string::npos, err_.str().find("Not logged in"));
}

TEST_F(ExternalNetworkCommandsTest, SystemCommandsDoNotNeedVdc) {
    sessions_.vdcHref.reset();
    remote_.networks = {NetworkSummary{"ext-a"}};
    EXPECT_EQ(VcdnetCli::kExitSuccess, run({"network", "external", "list"}));
    EXPECT_EQ(std::vector<std::string>{"listExternalNetworks"}, remote_.calls);
}

TEST_F(ExternalNetworkCommandsTest, ListPreservesServerOrder) {
    remote_.networks = {NetworkSummary{"ext-b"}, NetworkSummary{"ext-a"}, NetworkSummary{"ext-c"}};
    EXPECT_EQ(VcdnetCli::kExitSuccess, run({"network", "external", "list"}));
    EXPECT_EQ("name\n-----\next-b\next-a\next-c\n", out_.str());
}

TEST_F(ExternalNetworkCommandsTest, EmptyListPrintsNothing) {
    EXPECT_EQ(VcdnetCli::kExitSuccess, run({"network", "external", "list"}));
    EXPECT_TRUE(out_.str().empty());
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(ExternalNetworkCommandsTest, ListAsJson) {
    format_ = OutputFormat::Json;
    remote_.networks = {NetworkSummary{"ext-a"}};
    EXPECT_EQ(VcdnetCli::kExitSuccess, run({"network", "external", "list"}));
    nlohmann::json printed = nlohmann::json::parse(out_.str());
    ASSERT_TRUE(printed.is_array());
    ASSERT_EQ(1u, printed.size());
    EXPECT_EQ("ext-a", printed[0]["name"].get<std::string>());
}

TEST_F(ExternalNetworkCommandsTest, ListRejectionReported) {
    remote_.nextStatus = OperationStatus::failure(ErrorKind::AuthFailure, "Access is forbidden", 403);
    EXPECT_EQ(VcdnetCli::kExitFailure, run({"network", "external", "list"}));
    EXPECT_EQ("Error: Access is forbidden\n", err_.str());
}

TEST_F(ExternalNetworkCommandsTest, DeleteAsksForConfirmation) {
    confirmer_.answer = true;
    EXPECT_EQ(VcdnetCli::kExitSuccess, run({"network", "external", "delete", "external-net1"}));
    ASSERT_EQ(1u, confirmer_.prompts.size());
    EXPECT_EQ(kDeleteExternalNetworkPrompt, confirmer_.prompts[0]);
    EXPECT_EQ(std::vector<std::string>{"deleteExternalNetwork"}, remote_.calls);
    EXPECT_EQ("external-net1", remote_.deletedName);
    EXPECT_NE(std::string::npos, out_.str().find("External network deleted successfully."));
}

TEST_F(ExternalNetworkCommandsTest, DeclinedDeleteSendsNothing) {
    confirmer_.answer = false;
    EXPECT_EQ(VcdnetCli::kExitSuccess, run({"network", "external", "delete", "external-net1"}));
    EXPECT_EQ(1u, confirmer_.prompts.size());
    EXPECT_TRUE(remote_.calls.empty());
    EXPECT_EQ("Aborted.\n", out_.str());
}

TEST_F(ExternalNetworkCommandsTest, YesSkipsPrompt) {
    EXPECT_EQ(VcdnetCli::kExitSuccess, run({"network", "external", "delete", "external-net1", "-y"}));
    EXPECT_TRUE(confirmer_.prompts.empty());
    EXPECT_EQ(std::vector<std::string>{"deleteExternalNetwork"}, remote_.calls);
}

TEST_F(ExternalNetworkCommandsTest, UpdateForwardsOnlyGivenFields) {
    EXPECT_EQ(VcdnetCli::kExitSuccess,
              run({"network", "external", "update", "external-net1", "--description", "New external network"}));
    ASSERT_EQ(std::vector<std::string>{"updateExternalNetwork"}, remote_.calls);
    EXPECT_EQ("external-net1", remote_.externalUpdate.name);
    EXPECT_FALSE(remote_.externalUpdate.newName.has_value());
    EXPECT_EQ("New external network", remote_.externalUpdate.newDescription.value_or(""));
    EXPECT_NE(std::string::npos, out_.str().find("External network updated successfully."));
}

TEST_F(ExternalNetworkCommandsTest, UpdateRename) {
    EXPECT_EQ(VcdnetCli::kExitSuccess,
              run({"network", "external", "update", "external-net1", "-n", "new-external-net1"}));
    EXPECT_EQ("new-external-net1", remote_.externalUpdate.newName.value_or(""));
    EXPECT_FALSE(remote_.externalUpdate.newDescription.has_value());
}

TEST_F(ExternalNetworkCommandsTest, UpdateWithNoChangesStillSent) {
    EXPECT_EQ(VcdnetCli::kExitSuccess, run({"network", "external", "update", "external-net1"}));
    EXPECT_EQ(std::vector<std::string>{"updateExternalNetwork"}, remote_.calls);
}

TEST_F(ExternalNetworkCommandsTest, UpdateUnknownNetworkFails) {
    remote_.nextStatus = OperationStatus::failure(ErrorKind::RemoteRejected,
                                                  "External network 'missing' not found");
    EXPECT_EQ(VcdnetCli::kExitFailure, run({"network", "external", "update", "missing", "--name", "x"}));
    EXPECT_EQ("Error: External network 'missing' not found\n", err_.str());
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
