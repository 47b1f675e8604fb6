#include <gtest/gtest.h>
#include "../transport/session.hpp"
#include "../common/errors.hpp"
#include "fake_transport.hpp"
#include "test_support.hpp"

class SessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        profile_.name = "test";
        profile_.protocol = TransferProtocol::FTP;
        profile_.directory = "pmps";
        profile_.credentials = {{"Administrator", "1"}};
        profile_.listing_dialect = ListingDialect::EPOCH_SECONDS;

        net_.add_host("plc-01");
        net_.add_file("plc-01", "pmps", "plc-01.json", "{}");
    }

    QuietLogs        quiet_;
    FakeNetwork      net_;
    TransportProfile profile_;
};

TEST_F(SessionTest, OpensListsAndReleases) {
    {
        Session s = Session::open(profile_, net_.factory(), "plc-01");
        EXPECT_TRUE(s.is_open());
        EXPECT_EQ(s.host(), "plc-01");
        EXPECT_EQ(s.directory(), "pmps");
        EXPECT_NE(s.list().find("plc-01.json"), std::string::npos);
        EXPECT_EQ(s.get("plc-01.json"), "{}");
        EXPECT_EQ(net_.connections_open(), 1);
    }
    EXPECT_EQ(net_.connections_open(), 0);
    EXPECT_EQ(net_.count_calls("close plc-01"), 1u);
}

TEST_F(SessionTest, ExplicitDirectoryOverridesProfile) {
    net_.add_file("plc-01", "other", "x.json", "x");
    Session s = Session::open(profile_, net_.factory(), "plc-01", "other");
    EXPECT_EQ(s.directory(), "other");
    EXPECT_EQ(s.get("x.json"), "x");
}

TEST_F(SessionTest, FallsBackToNextCredential) {
    profile_.credentials = {{"anonymous", ""}, {"Administrator", "1"}};
    Session s = Session::open(profile_, net_.factory(), "plc-01");

    auto calls = net_.calls();
    ASSERT_GE(calls.size(), 2u);
    EXPECT_EQ(calls[0], "connect plc-01 anonymous");
    EXPECT_EQ(calls[1], "connect plc-01 Administrator");
    EXPECT_EQ(net_.transports_created(), 2);

    // Same behaviour as a first-try login
    EXPECT_EQ(s.get("plc-01.json"), "{}");
    EXPECT_EQ(net_.connections_open(), 1);
}

TEST_F(SessionTest, StopsAtFirstWorkingCredential) {
    profile_.credentials = {{"Administrator", "1"}, {"anonymous", ""}};
    Session s = Session::open(profile_, net_.factory(), "plc-01");
    EXPECT_EQ(net_.count_calls("connect"), 1u);
}

TEST_F(SessionTest, AllCredentialsFailingAggregatesCauses) {
    profile_.credentials = {{"anonymous", ""}, {"Administrator", "wrong"}};
    try {
        Session::open(profile_, net_.factory(), "plc-01");
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError& e) {
        ASSERT_EQ(e.causes().size(), 2u);
        EXPECT_EQ(e.causes()[0].rfind("anonymous: ", 0), 0u);
        EXPECT_EQ(e.causes()[1].rfind("Administrator: ", 0), 0u);
        EXPECT_EQ(e.host(), "plc-01");
    }
    EXPECT_EQ(net_.connections_open(), 0);
}

TEST_F(SessionTest, SingleCredentialFailureCarriesItsCause) {
    profile_.credentials = {{"Administrator", "wrong"}};
    try {
        Session::open(profile_, net_.factory(), "plc-01");
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError& e) {
        ASSERT_EQ(e.causes().size(), 1u);
        EXPECT_NE(std::string(e.what()).find("Login denied"), std::string::npos);
    }
}

TEST_F(SessionTest, UnknownHostIsConnectionError) {
    EXPECT_THROW(Session::open(profile_, net_.factory(), "nowhere"), ConnectionError);
}

TEST_F(SessionTest, CancelledLoginStopsCredentialFallback) {
    profile_.credentials = {{"Administrator", "1"}, {"anonymous", ""}};
    net_.cancel_connect = true;
    try {
        Session::open(profile_, net_.factory(), "plc-01");
        FAIL() << "expected IOError";
    } catch (const IOError& e) {
        EXPECT_EQ(e.operation(), "connect");
        EXPECT_EQ(e.reason(), "cancelled");
    }
    EXPECT_EQ(net_.count_calls("connect"), 1u);
    EXPECT_EQ(net_.connections_open(), 0);
}

TEST_F(SessionTest, NoCredentialsIsConnectionError) {
    profile_.credentials.clear();
    try {
        Session::open(profile_, net_.factory(), "plc-01");
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_TRUE(e.causes().empty());
    }
    EXPECT_EQ(net_.transports_created(), 0);
}

TEST_F(SessionTest, MissingDirectoryReleasesConnection) {
    EXPECT_THROW(Session::open(profile_, net_.factory(), "plc-01", "missing"),
                 RemoteNotFoundError);
    EXPECT_EQ(net_.connections_open(), 0);
    EXPECT_EQ(net_.count_calls("close plc-01"), 1u);
}

TEST_F(SessionTest, CreatesDirectoryWhenAllowed) {
    profile_.create_directory = true;
    Session s = Session::open(profile_, net_.factory(), "plc-01", "fresh");
    EXPECT_EQ(s.directory(), "fresh");
    EXPECT_EQ(s.list(), "total 0\n");
}

TEST_F(SessionTest, OperationErrorsAreNotRetried) {
    net_.fail_list = true;
    Session s = Session::open(profile_, net_.factory(), "plc-01");
    EXPECT_THROW(s.list(), IOError);
    EXPECT_EQ(net_.count_calls("list"), 1u);
}

TEST_F(SessionTest, MovedSessionOwnsTheConnection) {
    Session a = Session::open(profile_, net_.factory(), "plc-01");
    Session b = std::move(a);
    EXPECT_FALSE(a.is_open());
    EXPECT_TRUE(b.is_open());
    EXPECT_THROW(a.get("plc-01.json"), IOError);
    EXPECT_EQ(b.get("plc-01.json"), "{}");

    b.close();
    b.close();
    EXPECT_EQ(net_.connections_open(), 0);
    EXPECT_THROW(b.list(), IOError);
}

TEST_F(SessionTest, NullFactoryResultIsAnError) {
    TransportFactory broken = []() { return std::unique_ptr<Transport>(); };
    EXPECT_THROW(Session::open(profile_, broken, "plc-01"), std::runtime_error);
}
