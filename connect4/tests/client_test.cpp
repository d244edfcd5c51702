#include <gtest/gtest.h>

#include "client.hpp"
#include "connection_service.hpp"
#include "rpc_server.hpp"

#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using connect4::ClientOptions;
using connect4::client::build_connection_request;
using connect4::client::client_main;
using connect4::client::format_status;
using connect4::service::ConnectionService;
using connect4::service::RpcServer;
using connect4::service::ServiceStats;

namespace {

class ClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        service_ = std::make_unique<ConnectionService>(stats_);
        server_ = std::make_unique<RpcServer>("127.0.0.1:0", *service_);
        ASSERT_TRUE(server_->start());
        target_ = "--target=127.0.0.1:" + std::to_string(server_->port());
    }

    void TearDown() override {
        server_->shutdown(std::chrono::milliseconds(100));
        server_->wait();
    }

    int run(std::vector<const char*> args) {
        args.insert(args.begin(), "connect4_client");
        return client_main(static_cast<int>(args.size()), args.data(), out_, err_);
    }

    ServiceStats stats_;
    std::unique_ptr<ConnectionService> service_;
    std::unique_ptr<RpcServer> server_;
    std::string target_;
    std::ostringstream out_;
    std::ostringstream err_;
};

} // namespace

TEST(ClientRequest, OmittedIdsStayAbsent) {
    ClientOptions options;
    EXPECT_FALSE(build_connection_request(options).has_metadata());

    options.client_id = "c1";
    auto request = build_connection_request(options);
    ASSERT_TRUE(request.has_metadata());
    EXPECT_EQ(request.metadata().client_id(), "c1");
    EXPECT_FALSE(request.metadata().has_account_id());
}

TEST(ClientRequest, FormatsStatusWithCodeName) {
    EXPECT_EQ(format_status(grpc::Status::OK), "OK");
    EXPECT_EQ(format_status(grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "metadata is required")),
              "INVALID_ARGUMENT: metadata is required");
    EXPECT_EQ(format_status(grpc::Status(grpc::StatusCode::UNAVAILABLE, "down")), "UNAVAILABLE: down");
}

TEST_F(ClientTest, SuccessfulConnectExitsZero) {
    int rc = run({target_.c_str(), "--client-id", "c1", "--account-id", "a1"});

    EXPECT_EQ(rc, 0);
    EXPECT_EQ(out_.str(), "OK\n");
    EXPECT_EQ(stats_.connect_ok.load(), 1u);
}

TEST_F(ClientTest, MissingAccountExitsOneWithStatusName) {
    int rc = run({target_.c_str(), "--client-id", "c1"});

    EXPECT_EQ(rc, 1);
    EXPECT_EQ(out_.str(), "INVALID_ARGUMENT: metadata.account_id is required\n");
}

TEST_F(ClientTest, NoIdentityExitsOne) {
    int rc = run({target_.c_str()});

    EXPECT_EQ(rc, 1);
    EXPECT_EQ(out_.str(), "INVALID_ARGUMENT: metadata is required\n");
}

TEST_F(ClientTest, BadArgumentsExitTwo) {
    int rc = run({"--timeout-ms", "soon"});

    EXPECT_EQ(rc, 2);
    EXPECT_TRUE(out_.str().empty());
    EXPECT_NE(err_.str().find("Invalid --timeout-ms value: soon"), std::string::npos);
    EXPECT_EQ(stats_.connect_total.load(), 0u);
}

TEST(ClientUnreachable, ReportsUnavailable) {
    std::ostringstream out;
    std::ostringstream err;
    const char* argv[] = {"connect4_client", "--target=127.0.0.1:1", "--client-id=c1", "--account-id=a1",
                          "--timeout-ms=2000"};

    int rc = client_main(5, argv, out, err);

    EXPECT_EQ(rc, 1);
    EXPECT_EQ(out.str().rfind("UNAVAILABLE: ", 0), 0u) << out.str();
}
