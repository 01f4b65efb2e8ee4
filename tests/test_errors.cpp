#include <gtest/gtest.h>

#include "errors.hpp"

namespace {

using bridge::ErrorCode;
using bridge::ErrorKind;

TEST(ErrorsTest, CodesMapToKinds) {
  EXPECT_EQ(bridge::KindOf(ErrorCode::kMalformedRequest), ErrorKind::kProtocol);
  EXPECT_EQ(bridge::KindOf(ErrorCode::kUnknownTool), ErrorKind::kProtocol);
  EXPECT_EQ(bridge::KindOf(ErrorCode::kSessionNotFound), ErrorKind::kProtocol);
  EXPECT_EQ(bridge::KindOf(ErrorCode::kInvalidArgument), ErrorKind::kValidation);
  EXPECT_EQ(bridge::KindOf(ErrorCode::kBackendUnavailable), ErrorKind::kBackend);
  EXPECT_EQ(bridge::KindOf(ErrorCode::kBackendQueryError), ErrorKind::kBackend);
  EXPECT_EQ(bridge::KindOf(ErrorCode::kWriteFailed), ErrorKind::kTransport);
}

TEST(ErrorsTest, MakeErrorFillsKindAndContext) {
  auto e = bridge::MakeError(ErrorCode::kInvalidArgument, "Invalid table name: x", {{"table_name", "x"}});
  EXPECT_EQ(e.kind, ErrorKind::kValidation);
  EXPECT_EQ(e.message, "Invalid table name: x");
  EXPECT_EQ(e.context["table_name"], "x");
}

TEST(ErrorsTest, ErrorToJsonOmitsEmptyContext) {
  auto j = bridge::ErrorToJson(bridge::MakeError(ErrorCode::kUnknownTool, "Unknown tool: nope"));
  EXPECT_EQ(j["type"], "protocol_error");
  EXPECT_EQ(j["code"], "unknown_tool");
  EXPECT_EQ(j["message"], "Unknown tool: nope");
  EXPECT_FALSE(j.contains("context"));
}

TEST(ErrorsTest, HttpStatusMapping) {
  EXPECT_EQ(bridge::HttpStatusFor(bridge::MakeError(ErrorCode::kMalformedRequest, "")), 400);
  EXPECT_EQ(bridge::HttpStatusFor(bridge::MakeError(ErrorCode::kInvalidArgument, "")), 400);
  EXPECT_EQ(bridge::HttpStatusFor(bridge::MakeError(ErrorCode::kUnknownTool, "")), 404);
  EXPECT_EQ(bridge::HttpStatusFor(bridge::MakeError(ErrorCode::kSessionNotFound, "")), 404);
  EXPECT_EQ(bridge::HttpStatusFor(bridge::MakeError(ErrorCode::kBackendQueryError, "")), 502);
  EXPECT_EQ(bridge::HttpStatusFor(bridge::MakeError(ErrorCode::kBackendUnavailable, "")), 503);
  EXPECT_EQ(bridge::HttpStatusFor(bridge::MakeError(ErrorCode::kHandlerFailed, "")), 500);
}

TEST(ErrorsTest, SetErrorToleratesNull) {
  bridge::SetError(nullptr, ErrorCode::kQueueClosed, "ignored");
  bridge::BridgeError e;
  bridge::SetError(&e, ErrorCode::kQueueClosed, "closed");
  EXPECT_EQ(e.code, ErrorCode::kQueueClosed);
  EXPECT_EQ(e.message, "closed");
}

}  // namespace
