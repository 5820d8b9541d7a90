#include "src/server/isolation.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace evalbox {
namespace {

using ::testing::_;
using ::testing::DoAll;
using ::testing::Return;
using ::testing::SetArgPointee;

class MockBackend : public IsolationBackend {
public:
    MOCK_METHOD(std::string, Name, (), (const, override));
    MOCK_METHOD(bool, Ping, (std::string * error_message), (override));
    MOCK_METHOD(ProvisionResult, Provision, (const ResourceLimits& limits, const ProgramMount& program),
                (override));
    MOCK_METHOD(RunResult, Run,
                (const std::string& handle, const std::optional<std::string>& input,
                 std::chrono::milliseconds timeout),
                (override));
    MOCK_METHOD(std::optional<std::string>, FetchOutput, (const std::string& handle), (override));
    MOCK_METHOD(DestroyResult, Destroy, (const std::string& handle), (override));
};

ProvisionResult Provisioned(const std::string& handle) {
    ProvisionResult result;
    result.success = true;
    result.handle = handle;
    return result;
}

TEST(IsolationClientTest, StartsDisabledUntilConnected) {
    auto backend = std::make_unique<::testing::StrictMock<MockBackend>>();
    EXPECT_CALL(*backend, Name()).WillRepeatedly(Return("mock"));
    IsolationClient client(std::move(backend));

    EXPECT_TRUE(client.IsDisabled());
    ProvisionResult result = client.Provision(ResourceLimits{}, ProgramMount{});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, IsolationError::kUnavailable);
    EXPECT_EQ(result.error_message, "execution unavailable");
}

TEST(IsolationClientTest, FailedPingDisablesWithoutProvisioning) {
    auto backend = std::make_unique<MockBackend>();
    EXPECT_CALL(*backend, Name()).WillRepeatedly(Return("mock"));
    EXPECT_CALL(*backend, Ping(_)).WillOnce(DoAll(SetArgPointee<0>("daemon down"), Return(false)));
    EXPECT_CALL(*backend, Provision(_, _)).Times(0);
    IsolationClient client(std::move(backend));

    EXPECT_FALSE(client.Connect());
    EXPECT_TRUE(client.IsDisabled());
    EXPECT_EQ(client.DisabledReason(), "daemon down");
    EXPECT_EQ(client.Provision(ResourceLimits{}, ProgramMount{}).error, IsolationError::kUnavailable);
}

TEST(IsolationClientTest, ConnectedClientForwardsToBackend) {
    auto backend = std::make_unique<MockBackend>();
    EXPECT_CALL(*backend, Name()).WillRepeatedly(Return("mock"));
    EXPECT_CALL(*backend, Ping(_)).WillOnce(Return(true));
    EXPECT_CALL(*backend, Provision(_, _)).WillOnce(Return(Provisioned("env-1")));
    IsolationClient client(std::move(backend));

    ASSERT_TRUE(client.Connect());
    ProvisionResult result = client.Provision(ResourceLimits{}, ProgramMount{"/tmp/x", "main.py"});

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.handle, "env-1");
}

TEST(IsolationClientTest, DisablingLaterStopsNewProvisions) {
    auto backend = std::make_unique<MockBackend>();
    EXPECT_CALL(*backend, Name()).WillRepeatedly(Return("mock"));
    EXPECT_CALL(*backend, Ping(_)).WillOnce(Return(true));
    EXPECT_CALL(*backend, Provision(_, _)).Times(0);
    IsolationClient client(std::move(backend));
    ASSERT_TRUE(client.Connect());

    client.Disable("operator request");

    EXPECT_EQ(client.Provision(ResourceLimits{}, ProgramMount{}).error, IsolationError::kUnavailable);
}

TEST(IsolationClientTest, DestroyStillReachesBackendWhenDisabled) {
    auto backend = std::make_unique<MockBackend>();
    DestroyResult gone;
    gone.success = true;
    gone.already_gone = true;
    EXPECT_CALL(*backend, Name()).WillRepeatedly(Return("mock"));
    EXPECT_CALL(*backend, Destroy("env-1")).WillOnce(Return(gone));
    IsolationClient client(std::move(backend));

    DestroyResult result = client.Destroy("env-1");

    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.already_gone);
}

TEST(IsolationErrorTest, NamesEveryErrorClass) {
    EXPECT_STREQ(IsolationErrorName(IsolationError::kUnavailable), "unavailable");
    EXPECT_STREQ(IsolationErrorName(IsolationError::kTimeout), "timeout");
    EXPECT_STREQ(IsolationErrorName(IsolationError::kRuntimeFault), "runtime fault");
    EXPECT_STREQ(IsolationErrorName(IsolationError::kDestroyFailed), "destroy failed");
}

} // namespace
} // namespace evalbox
