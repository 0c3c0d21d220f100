#include <gtest/gtest.h>
#include "session/session_profile.hpp"
#include "session/session_provider.hpp"
#include "network/resource_locator.hpp"
#include "network/vcd_vdc.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

// Remembers the connection settings instead of only building the client.
class RecordingSessionProvider : public ProfileSessionProvider {
public:
    using ProfileSessionProvider::ProfileSessionProvider;

    VcdConnectionConfig lastConfig;
    int clientsCreated = 0;

protected:
    std::shared_ptr<VcdRestClient> createClient(const VcdConnectionConfig& config) override {
        lastConfig = config;
        clientsCreated++;
        return ProfileSessionProvider::createClient(config);
    }
};

class SessionProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
        testDir_ = std::filesystem::temp_directory_path() / ("vcdnet_session_test_" + std::string(info->name()));
        std::filesystem::create_directories(testDir_);
        profilePath_ = (testDir_ / "profile.json").string();
    }

    void TearDown() override {
        std::filesystem::remove_all(testDir_);
    }

    void writeProfile(const std::string& content) {
        std::ofstream file(profilePath_);
        file << content;
    }

    std::filesystem::path testDir_;
    std::string profilePath_;
};

TEST_F(SessionProviderTest, LoadsEveryField) {
    writeProfile(R"({
        "host": "vcd.example.com",
        "api_version": "33.0",
        "token": "abc123",
        "token_type": "bearer",
        "org": "org1",
        "vdc": "vdc1",
        "vdc_href": "https://vcd.example.com/api/vdc/1",
        "verify_ssl": false
    })");

    SessionProfile profile;
    std::string error;
    ASSERT_TRUE(loadSessionProfile(profilePath_, profile, error)) << error;
    EXPECT_EQ("vcd.example.com", profile.host);
    EXPECT_EQ("33.0", profile.apiVersion);
    EXPECT_EQ("abc123", profile.token);
    EXPECT_EQ("bearer", profile.tokenType);
    EXPECT_EQ("org1", profile.org);
    EXPECT_EQ("vdc1", profile.vdc);
    EXPECT_EQ("https://vcd.example.com/api/vdc/1", profile.vdcHref);
    EXPECT_FALSE(profile.verifySsl);
}

TEST_F(SessionProviderTest, DefaultsForOmittedFields) {
    writeProfile(R"({"host": "vcd.example.com", "token": "abc123"})");

    SessionProfile profile;
    std::string error;
    ASSERT_TRUE(loadSessionProfile(profilePath_, profile, error)) << error;
    EXPECT_EQ("31.0", profile.apiVersion);
    EXPECT_EQ("session", profile.tokenType);
    EXPECT_TRUE(profile.vdcHref.empty());
    EXPECT_TRUE(profile.verifySsl);
}

TEST_F(SessionProviderTest, RejectsMalformedProfiles) {
    SessionProfile profile;
    std::string error;

    writeProfile("{ not json");
    EXPECT_FALSE(loadSessionProfile(profilePath_, profile, error));
    EXPECT_NE(std::string::npos, error.find("Failed to parse"));

    writeProfile("[1, 2]");
    EXPECT_FALSE(loadSessionProfile(profilePath_, profile, error));
    EXPECT_NE(std::string::npos, error.find("not a JSON object"));

    writeProfile(R"({"host": 42})");
    EXPECT_FALSE(loadSessionProfile(profilePath_, profile, error));
    EXPECT_NE(std::string::npos, error.find("Invalid value"));
}

TEST_F(SessionProviderTest, MissingProfileIsNotLoggedIn) {
    RecordingSessionProvider provider(profilePath_);
    SessionContext session;
    OperationStatus status = provider.restoreSession(false, session);
    EXPECT_EQ(ErrorKind::AuthFailure, status.kind);
    EXPECT_NE(std::string::npos, status.message.find("Not logged in"));
    EXPECT_EQ(0, provider.clientsCreated);
}

TEST_F(SessionProviderTest, ProfileWithoutTokenIsNotLoggedIn) {
    writeProfile(R"({"host": "vcd.example.com", "org": "org1"})");
    RecordingSessionProvider provider(profilePath_);
    SessionContext session;
    EXPECT_EQ(ErrorKind::AuthFailure, provider.restoreSession(false, session).kind);
    EXPECT_EQ(0, provider.clientsCreated);
}

TEST_F(SessionProviderTest, VdcRequiredButNotSelected) {
    writeProfile(R"({"host": "vcd.example.com", "token": "abc123", "org": "System"})");
    RecordingSessionProvider provider(profilePath_);

    SessionContext session;
    EXPECT_EQ(ErrorKind::NoVdcSelected, provider.restoreSession(true, session).kind);
    EXPECT_EQ(0, provider.clientsCreated);

    ASSERT_TRUE(provider.restoreSession(false, session).ok());
    EXPECT_FALSE(session.selectedVdcHref.has_value());
    EXPECT_EQ("System", session.orgName);
}

TEST_F(SessionProviderTest, RestoresSessionWithVdc) {
    writeProfile(R"({"host": "vcd.example.com", "token": "abc123", "org": "org1",
                     "vdc": "vdc1", "vdc_href": "https://vcd.example.com/api/vdc/1"})");
    RecordingSessionProvider provider(profilePath_);

    SessionContext session;
    ASSERT_TRUE(provider.restoreSession(true, session).ok());
    ASSERT_NE(nullptr, session.client);
    EXPECT_EQ("vcd.example.com", session.host);
    EXPECT_EQ("org1", session.orgName);
    EXPECT_EQ("vdc1", session.selectedVdcName);
    EXPECT_EQ("https://vcd.example.com/api/vdc/1", session.selectedVdcHref.value_or(""));

    EXPECT_EQ("abc123", provider.lastConfig.token);
    EXPECT_FALSE(provider.lastConfig.bearerToken);
    EXPECT_TRUE(provider.lastConfig.verifySsl);
    EXPECT_EQ("31.0", session.client->getApiVersion());
}

TEST_F(SessionProviderTest, ProfilePathFromEnvironment) {
    setenv("VCDNET_PROFILE", profilePath_.c_str(), 1);
    EXPECT_EQ(profilePath_, defaultProfilePath());
    unsetenv("VCDNET_PROFILE");
}

TEST(ResourceLocatorTest, NeedsAuthenticatedClient) {
    VcdResourceLocator locator;
    SessionContext session;

    std::unique_ptr<PlatformApi> platform;
    EXPECT_EQ(ErrorKind::AuthFailure, locator.resolvePlatform(session, platform).kind);
    EXPECT_TRUE(platform == nullptr);

    session.selectedVdcHref = "https://vcd.example.com/api/vdc/1";
    std::unique_ptr<VdcApi> vdc;
    EXPECT_EQ(ErrorKind::AuthFailure, locator.resolveVdc(session, vdc).kind);
}

TEST(ResourceLocatorTest, VdcNeedsSelection) {
    VcdResourceLocator locator;
    SessionContext session;
    VcdConnectionConfig config;
    config.host = "vcd.example.com";
    session.client = std::make_shared<VcdRestClient>(config);

    std::unique_ptr<VdcApi> vdc;
    EXPECT_EQ(ErrorKind::NoVdcSelected, locator.resolveVdc(session, vdc).kind);

    session.selectedVdcHref = "";
    EXPECT_EQ(ErrorKind::NoVdcSelected, locator.resolveVdc(session, vdc).kind);

    session.selectedVdcHref = "https://vcd.example.com/api/vdc/1";
    ASSERT_TRUE(locator.resolveVdc(session, vdc).ok());
    VcdVdc* bound = dynamic_cast<VcdVdc*>(vdc.get());
    ASSERT_NE(nullptr, bound);
    EXPECT_EQ("https://vcd.example.com/api/vdc/1", bound->getHref());

    std::unique_ptr<PlatformApi> platform;
    EXPECT_TRUE(locator.resolvePlatform(session, platform).ok());
    EXPECT_TRUE(platform != nullptr);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
