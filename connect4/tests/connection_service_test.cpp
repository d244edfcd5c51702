#include <gtest/gtest.h>

#include "connection_service.hpp"
#include "test_helpers.hpp"

#include <stdexcept>

using connect4::service::ConnectionService;
using connect4::service::ServiceStats;
using connect4::service::snapshot;
using connect4::service::v1::ConnectionRequest;
using connect4::service::v1::ConnectionResponse;

TEST(ConnectionService, AcceptedCallReturnsEmptyBody) {
    ServiceStats stats;
    ConnectionService service(stats);
    ConnectionResponse response;

    auto status = service.handle_connect(make_connection_request("c1", "a1"), response);

    EXPECT_TRUE(status.ok());
    EXPECT_TRUE(response.has_response());
    EXPECT_EQ(response.response().ByteSizeLong(), 0u);

    auto snap = snapshot(stats);
    EXPECT_EQ(snap.connect_total, 1u);
    EXPECT_EQ(snap.connect_ok, 1u);
    EXPECT_EQ(snap.connect_rejected, 0u);
}

TEST(ConnectionService, RejectedCallLeavesResponseUnset) {
    ServiceStats stats;
    ConnectionService service(stats);
    ConnectionResponse response;

    auto status = service.handle_connect(ConnectionRequest(), response);

    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_FALSE(response.has_response());

    auto snap = snapshot(stats);
    EXPECT_EQ(snap.connect_total, 1u);
    EXPECT_EQ(snap.connect_ok, 0u);
    EXPECT_EQ(snap.connect_rejected, 1u);
}

TEST(ConnectionService, RejectionIsStableAcrossRepeatedCalls) {
    ServiceStats stats;
    ConnectionService service(stats);
    ConnectionRequest request;
    request.mutable_metadata()->set_client_id("c1");

    for (int i = 0; i < 5; ++i) {
        ConnectionResponse response;
        auto status = service.handle_connect(request, response);
        EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
        EXPECT_EQ(status.error_message(), "metadata.account_id is required");
    }

    EXPECT_EQ(snapshot(stats).connect_rejected, 5u);
}

TEST(ConnectionService, CancelledCallSkipsValidation) {
    ServiceStats stats;
    bool validated = false;
    ConnectionService service(stats, [&validated](const ConnectionRequest&) {
        validated = true;
        return grpc::Status::OK;
    });
    ConnectionResponse response;

    auto status = service.handle_connect(make_connection_request("c1", "a1"), response, true);

    EXPECT_EQ(status.error_code(), grpc::StatusCode::CANCELLED);
    EXPECT_FALSE(validated);
    EXPECT_FALSE(response.has_response());

    auto snap = snapshot(stats);
    EXPECT_EQ(snap.connect_total, 1u);
    EXPECT_EQ(snap.connect_cancelled, 1u);
    EXPECT_EQ(snap.connect_ok, 0u);
}

TEST(ConnectionService, ThrowingValidatorBecomesInternalError) {
    ServiceStats stats;
    ConnectionService service(stats, [](const ConnectionRequest&) -> grpc::Status {
        throw std::runtime_error("validator exploded");
    });
    ConnectionResponse response;

    auto status = service.handle_connect(make_connection_request("c1", "a1"), response);

    EXPECT_EQ(status.error_code(), grpc::StatusCode::INTERNAL);
    EXPECT_EQ(status.error_message(), "internal error");
    EXPECT_FALSE(response.has_response());

    auto snap = snapshot(stats);
    EXPECT_EQ(snap.connect_total, 1u);
    EXPECT_EQ(snap.connect_failed, 1u);
    EXPECT_EQ(snap.connect_rejected, 0u);
}
