#include "wsgate/upgrade-coordinator.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "wsgate/http-header.hpp"
#include "wsgate/protocol-handler.hpp"
#include "wsgate/request-head.hpp"
#include "wsgate/websocket-config.hpp"
#include "wsgate/websocket-constants.hpp"
#include "wsgate/websocket-frame.hpp"
#include "wsgate/websocket-handler.hpp"
#include "wsgate/websocket-upgrade.hpp"
#include "wsgate/websocket-upgrader.hpp"

namespace wsgate {

using websocket::CloseCode;
using websocket::Opcode;
using websocket::UpgradeError;
using websocket::WebSocketFrame;
using Action = ProtocolProcessResult::Action;

namespace {

constexpr std::string_view kKey = "AQIDBAUGBwgJCgsMDQ4PEC==";
constexpr std::string_view kAccept = "OfS0wDaT5NoxF2gqm7Zj2YtetzM=";

std::string UpgradeRequest(std::string_view path, const std::map<std::string, std::string>& extraHeaders) {
  std::string request("GET ");
  request.append(path);
  request.append(" HTTP/1.1\r\nHost: example.com\r\nConnection: upgrade\r\nUpgrade: websocket\r\n");
  for (const auto& [name, value] : extraHeaders) {
    request.append(name).append(": ").append(value).append("\r\n");
  }
  request.append("\r\n");
  return request;
}

std::string ValidUpgradeRequest(std::string_view path = "/") {
  return UpgradeRequest(path, {{"Sec-WebSocket-Version", "13"}, {"Sec-WebSocket-Key", std::string(kKey)}});
}

std::span<const std::byte> sv_bytes(std::string_view sv) noexcept { return std::as_bytes(std::span(sv)); }

std::string ExpectedResponse(std::string_view extraHeaderLines = {}) {
  std::string response(
      "HTTP/1.1 101 Switching Protocols\r\n"
      "Upgrade: websocket\r\n"
      "Connection: upgrade\r\n"
      "Sec-WebSocket-Accept: ");
  response.append(kAccept);
  response.append("\r\n");
  response.append(extraHeaderLines);
  response.append("\r\n");
  return response;
}

}  // namespace

class UpgradeCoordinatorTest : public ::testing::Test {
 protected:
  // Endpoint accepting every request, recording the frames it receives
  void registerRecorder(http::HeaderSet extraHeaders = {}) {
    registry.registerUpgrader(
        [extraHeaders = std::move(extraHeaders)](const RequestHead&) -> std::optional<http::HeaderSet> {
          return extraHeaders;
        },
        [this](websocket::WebSocketHandler& channel, const RequestHead& head) {
          ++activations;
          activatedPath = std::string(head.path());
          channel.setCallbacks(
              websocket::WebSocketCallbacks{.onFrame = [this](const WebSocketFrame& frame) { frames.push_back(frame); },
                                            .onError = {}});
        });
  }

  // Drain everything the coordinator wants to write
  std::string drainOutput(UpgradeCoordinator& coordinator) {
    std::string out;
    while (coordinator.hasPendingOutput()) {
      const auto pending = coordinator.pendingOutput();
      out.append(reinterpret_cast<const char*>(pending.data()), pending.size());
      coordinator.onOutputWritten(pending.size());
    }
    return out;
  }

  websocket::UpgraderRegistry registry;
  std::vector<WebSocketFrame> frames;
  std::string activatedPath;
  int activations{0};
};

TEST_F(UpgradeCoordinatorTest, BasicUpgradeDance) {
  registerRecorder();
  UpgradeCoordinator coordinator(registry);
  EXPECT_EQ(coordinator.phase(), UpgradeCoordinator::Phase::AwaitingRequest);
  EXPECT_EQ(coordinator.protocol(), ProtocolType::Http11);

  const auto request = ValidUpgradeRequest();
  const auto result = coordinator.processInput(sv_bytes(request));
  EXPECT_EQ(result.action, Action::Upgrade);
  EXPECT_EQ(result.bytesConsumed, request.size());
  EXPECT_FALSE(result.error.has_value());

  EXPECT_EQ(coordinator.phase(), UpgradeCoordinator::Phase::FrameMode);
  EXPECT_EQ(coordinator.protocol(), ProtocolType::WebSocket);
  ASSERT_NE(coordinator.channel(), nullptr);
  EXPECT_EQ(activations, 1);
  EXPECT_EQ(drainOutput(coordinator), ExpectedResponse());
}

TEST_F(UpgradeCoordinatorTest, RequestHeadReceivedInPieces) {
  registerRecorder();
  UpgradeCoordinator coordinator(registry);
  const auto request = ValidUpgradeRequest();

  for (std::size_t pos = 0; pos + 1 < request.size(); ++pos) {
    const auto result = coordinator.processInput(sv_bytes(std::string_view(request).substr(pos, 1)));
    ASSERT_EQ(result.action, Action::Continue);
    EXPECT_FALSE(coordinator.hasPendingOutput());
  }
  EXPECT_EQ(coordinator.processInput(sv_bytes(std::string_view(request).substr(request.size() - 1))).action,
            Action::Upgrade);
  EXPECT_EQ(drainOutput(coordinator), ExpectedResponse());
}

TEST_F(UpgradeCoordinatorTest, CanRejectUpgrade) {
  bool activated = false;
  registry.registerUpgrader([](const RequestHead&) { return std::optional<http::HeaderSet>{}; },
                            [&activated](websocket::WebSocketHandler&, const RequestHead&) { activated = true; });
  UpgradeCoordinator coordinator(registry);

  const auto result = coordinator.processInput(sv_bytes(ValidUpgradeRequest()));
  EXPECT_EQ(result.action, Action::Continue);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(*result.error, UpgradeError::UnsupportedWebSocketTarget);
  EXPECT_EQ(coordinator.phase(), UpgradeCoordinator::Phase::Rejected);
  EXPECT_EQ(coordinator.lastError(), UpgradeError::UnsupportedWebSocketTarget);
  EXPECT_FALSE(coordinator.hasPendingOutput());
  EXPECT_EQ(coordinator.channel(), nullptr);
  EXPECT_FALSE(activated);

  // Further input is left alone and the error is reported again
  const auto again = coordinator.processInput(sv_bytes("more"));
  EXPECT_EQ(again.bytesConsumed, 0U);
  EXPECT_EQ(again.error, UpgradeError::UnsupportedWebSocketTarget);
}

TEST_F(UpgradeCoordinatorTest, RequiresVersion13) {
  registerRecorder();
  UpgradeCoordinator coordinator(registry);
  const auto result = coordinator.processInput(
      sv_bytes(UpgradeRequest("/", {{"Sec-WebSocket-Version", "12"}, {"Sec-WebSocket-Key", std::string(kKey)}})));
  EXPECT_EQ(result.error, UpgradeError::InvalidUpgradeHeader);
  EXPECT_FALSE(coordinator.hasPendingOutput());
  EXPECT_EQ(activations, 0);
}

TEST_F(UpgradeCoordinatorTest, RequiresVersionHeader) {
  registerRecorder();
  UpgradeCoordinator coordinator(registry);
  const auto result = coordinator.processInput(sv_bytes(UpgradeRequest("/", {{"Sec-WebSocket-Key", std::string(kKey)}})));
  EXPECT_EQ(result.error, UpgradeError::InvalidUpgradeHeader);
  EXPECT_FALSE(coordinator.hasPendingOutput());
}

TEST_F(UpgradeCoordinatorTest, RequiresKeyHeader) {
  registerRecorder();
  UpgradeCoordinator coordinator(registry);
  const auto result = coordinator.processInput(sv_bytes(UpgradeRequest("/", {{"Sec-WebSocket-Version", "13"}})));
  EXPECT_EQ(result.error, UpgradeError::InvalidUpgradeHeader);
  EXPECT_FALSE(coordinator.hasPendingOutput());
}

TEST_F(UpgradeCoordinatorTest, RequiresHttp11) {
  registerRecorder();
  UpgradeCoordinator coordinator(registry);
  std::string request = ValidUpgradeRequest();
  request.replace(request.find("HTTP/1.1"), 8, "HTTP/1.0");

  const auto result = coordinator.processInput(sv_bytes(request));
  EXPECT_EQ(result.error, UpgradeError::InvalidUpgradeHeader);
  EXPECT_FALSE(coordinator.hasPendingOutput());
  EXPECT_EQ(activations, 0);
}

TEST_F(UpgradeCoordinatorTest, ThrowingActivationRollsBackHandshake) {
  registry.registerUpgrader(websocket::MatchPath("/"), [](websocket::WebSocketHandler& channel, const RequestHead&) {
    channel.sendText("never sent");
    throw std::runtime_error("endpoint setup failed");
  });
  UpgradeCoordinator coordinator(registry);

  const auto result = coordinator.processInput(sv_bytes(ValidUpgradeRequest()));
  EXPECT_EQ(result.action, Action::Continue);
  EXPECT_EQ(result.error, UpgradeError::EndpointError);
  EXPECT_EQ(coordinator.phase(), UpgradeCoordinator::Phase::Rejected);
  EXPECT_EQ(coordinator.protocol(), ProtocolType::Http11);
  EXPECT_EQ(coordinator.channel(), nullptr);
  EXPECT_FALSE(coordinator.hasPendingOutput());

  const auto again = coordinator.processInput(sv_bytes("more"));
  EXPECT_EQ(again.bytesConsumed, 0U);
  EXPECT_EQ(again.error, UpgradeError::EndpointError);
}

TEST_F(UpgradeCoordinatorTest, ThrowingSelectorRejectsHandshake) {
  registry.registerUpgrader(
      [](const RequestHead&) -> std::optional<http::HeaderSet> { throw std::runtime_error("lookup failed"); },
      [this](websocket::WebSocketHandler&, const RequestHead&) { ++activations; });
  UpgradeCoordinator coordinator(registry);

  const auto result = coordinator.processInput(sv_bytes(ValidUpgradeRequest()));
  EXPECT_EQ(result.error, UpgradeError::EndpointError);
  EXPECT_EQ(coordinator.phase(), UpgradeCoordinator::Phase::Rejected);
  EXPECT_FALSE(coordinator.hasPendingOutput());
  EXPECT_EQ(activations, 0);
}

TEST_F(UpgradeCoordinatorTest, UpgradeMayAddCustomHeaders) {
  registerRecorder(http::HeaderSet{{"TestHeader", "TestValue"}});
  UpgradeCoordinator coordinator(registry);
  EXPECT_EQ(coordinator.processInput(sv_bytes(ValidUpgradeRequest())).action, Action::Upgrade);
  EXPECT_EQ(drainOutput(coordinator), ExpectedResponse("TestHeader: TestValue\r\n"));
}

TEST_F(UpgradeCoordinatorTest, MayRegisterMultipleWebSocketEndpoints) {
  std::vector<std::string> activated;
  for (std::string name : {"first", "second", "third"}) {
    registry.registerUpgrader(websocket::MatchPath("/" + name, http::HeaderSet{{"Target", name}}),
                              [&activated, name](websocket::WebSocketHandler&, const RequestHead&) {
                                activated.push_back(name);
                              });
  }
  UpgradeCoordinator coordinator(registry);
  EXPECT_EQ(coordinator.processInput(sv_bytes(ValidUpgradeRequest("/third"))).action, Action::Upgrade);
  EXPECT_EQ(drainOutput(coordinator), ExpectedResponse("Target: third\r\n"));
  EXPECT_EQ(activated, std::vector<std::string>{"third"});
}

TEST_F(UpgradeCoordinatorTest, SendAFewFrames) {
  registerRecorder();
  UpgradeCoordinator coordinator(registry);
  EXPECT_EQ(coordinator.processInput(sv_bytes(ValidUpgradeRequest())).action, Action::Upgrade);
  EXPECT_EQ(drainOutput(coordinator), ExpectedResponse());

  const auto dataFrame = WebSocketFrame::Binary(sv_bytes("hello, world"));
  const auto pingFrame = WebSocketFrame::Ping();
  auto bytes = websocket::EncodeFrame(dataFrame);
  websocket::EncodeFrame(pingFrame, bytes);

  const auto result = coordinator.processInput(bytes);
  EXPECT_EQ(result.action, Action::Continue);
  EXPECT_EQ(result.bytesConsumed, bytes.size());
  EXPECT_EQ(frames, (std::vector<WebSocketFrame>{dataFrame, pingFrame}));
}

TEST_F(UpgradeCoordinatorTest, FramesPipelinedAfterHeadAreDeliveredAfterActivation) {
  std::vector<std::string> events;
  registry.registerUpgrader(websocket::MatchPath("/"),
                            [&events](websocket::WebSocketHandler& channel, const RequestHead&) {
                              events.emplace_back("activate");
                              channel.setCallbacks(websocket::WebSocketCallbacks{
                                  .onFrame =
                                      [&events](const WebSocketFrame& frame) {
                                        events.emplace_back(frame.payloadAsText());
                                      },
                                  .onError = {}});
                            });
  UpgradeCoordinator coordinator(registry);

  auto maskedText = WebSocketFrame::Text("pipelined");
  maskedText.maskingKey = websocket::GenerateMaskingKey();
  std::string data = ValidUpgradeRequest();
  const auto frameBytes = websocket::EncodeFrame(maskedText);
  data.append(reinterpret_cast<const char*>(frameBytes.data()), frameBytes.size());

  EXPECT_EQ(coordinator.processInput(sv_bytes(data)).action, Action::Upgrade);
  EXPECT_EQ(events, (std::vector<std::string>{"activate", "pipelined"}));
}

TEST_F(UpgradeCoordinatorTest, FramesSentOnActivationFollowTheResponse) {
  registry.registerUpgrader(websocket::MatchPath("/"), [](websocket::WebSocketHandler& channel, const RequestHead&) {
    channel.sendText("welcome");
  });
  UpgradeCoordinator coordinator(registry);
  EXPECT_EQ(coordinator.processInput(sv_bytes(ValidUpgradeRequest())).action, Action::Upgrade);

  const std::string out = drainOutput(coordinator);
  const std::string expectedHead = ExpectedResponse();
  ASSERT_GT(out.size(), expectedHead.size());
  EXPECT_EQ(out.substr(0, expectedHead.size()), expectedHead);
  const auto decoded = websocket::DecodeFrame(sv_bytes(std::string_view(out).substr(expectedHead.size())));
  ASSERT_EQ(decoded.status, websocket::FrameDecodeResult::Status::Complete);
  EXPECT_EQ(decoded.frame, WebSocketFrame::Text("welcome"));
}

TEST_F(UpgradeCoordinatorTest, PartialOutputWrites) {
  registerRecorder();
  UpgradeCoordinator coordinator(registry);
  ASSERT_EQ(coordinator.processInput(sv_bytes(ValidUpgradeRequest())).action, Action::Upgrade);
  coordinator.channel()->sendText("x");

  std::string out;
  while (coordinator.hasPendingOutput()) {
    const auto pending = coordinator.pendingOutput();
    out.push_back(static_cast<char>(pending[0]));
    coordinator.onOutputWritten(1);
  }
  EXPECT_EQ(out, ExpectedResponse() + "\x81\x01x");
}

TEST_F(UpgradeCoordinatorTest, GetOnUpgradedConnectionIsAFrameError) {
  registerRecorder();
  UpgradeCoordinator coordinator(registry);
  ASSERT_EQ(coordinator.processInput(sv_bytes(ValidUpgradeRequest())).action, Action::Upgrade);
  drainOutput(coordinator);

  const auto result = coordinator.processInput(sv_bytes(ValidUpgradeRequest()));
  EXPECT_EQ(result.action, Action::Close);
  EXPECT_EQ(activations, 1);

  const std::string out = drainOutput(coordinator);
  const auto decoded = websocket::DecodeFrame(sv_bytes(out));
  ASSERT_EQ(decoded.status, websocket::FrameDecodeResult::Status::Complete);
  EXPECT_EQ(decoded.frame.opcode, Opcode::Close);
  EXPECT_EQ(websocket::ParseClosePayload(decoded.frame.payload).code, CloseCode::ProtocolError);
}

TEST_F(UpgradeCoordinatorTest, ExternalHeadOnUpgradedConnectionIsRefused) {
  registerRecorder();
  UpgradeCoordinator coordinator(registry);
  ASSERT_EQ(coordinator.processInput(sv_bytes(ValidUpgradeRequest())).action, Action::Upgrade);
  drainOutput(coordinator);

  RequestHead head;
  head.headers = http::HeaderSet{{"Connection", "upgrade"},
                                 {"Upgrade", "websocket"},
                                 {"Sec-WebSocket-Version", "13"},
                                 {"Sec-WebSocket-Key", kKey}};
  const auto result = coordinator.onRequestHead(head);
  EXPECT_FALSE(result.accepted());
  EXPECT_EQ(result.error, UpgradeError::AlreadyUpgraded);
  EXPECT_FALSE(coordinator.hasPendingOutput());
  EXPECT_EQ(coordinator.phase(), UpgradeCoordinator::Phase::FrameMode);
  EXPECT_EQ(activations, 1);
}

TEST_F(UpgradeCoordinatorTest, ExternalHttpLayerWithBufferedTail) {
  registerRecorder();
  UpgradeCoordinator coordinator(registry);

  RequestHead head;
  head.target = "/chat?room=1";
  head.headers = http::HeaderSet{{"Host", "example.com"},
                                 {"Connection", "keep-alive, Upgrade"},
                                 {"Upgrade", "WebSocket"},
                                 {"Sec-WebSocket-Version", "13"},
                                 {"Sec-WebSocket-Key", kKey}};
  const auto tail = websocket::EncodeFrame(WebSocketFrame::Text("early"));

  const auto result = coordinator.onRequestHead(head, tail);
  ASSERT_TRUE(result.accepted());
  EXPECT_EQ(std::string_view(result.acceptKey.data(), result.acceptKey.size()), kAccept);
  EXPECT_EQ(activatedPath, "/chat");
  ASSERT_EQ(frames.size(), 1U);
  EXPECT_EQ(frames[0].payloadAsText(), "early");
  EXPECT_EQ(drainOutput(coordinator), ExpectedResponse());
}

TEST_F(UpgradeCoordinatorTest, MalformedRequestHead) {
  registerRecorder();
  UpgradeCoordinator coordinator(registry);
  const auto result = coordinator.processInput(sv_bytes("GET /\r\n\r\n"));
  EXPECT_EQ(result.error, UpgradeError::MalformedRequestHead);
  EXPECT_EQ(coordinator.phase(), UpgradeCoordinator::Phase::Rejected);
  EXPECT_FALSE(coordinator.hasPendingOutput());
}

TEST_F(UpgradeCoordinatorTest, OversizedRequestHead) {
  registerRecorder();
  UpgradeCoordinator coordinator(registry, websocket::WebSocketConfig{}.withMaxRequestHeadSize(64));
  const auto result = coordinator.processInput(sv_bytes(ValidUpgradeRequest()));
  EXPECT_EQ(result.error, UpgradeError::MalformedRequestHead);
  EXPECT_EQ(activations, 0);
}

TEST_F(UpgradeCoordinatorTest, ConfigIsValidatedAndForwarded) {
  EXPECT_THROW(static_cast<void>(UpgradeCoordinator(registry, websocket::WebSocketConfig{}.withMaxFrameSize(10))),
               std::invalid_argument);

  registerRecorder();
  UpgradeCoordinator coordinator(registry,
                                 websocket::WebSocketConfig{}.withInboundMaskPolicy(websocket::MaskPolicy::Required));
  ASSERT_EQ(coordinator.processInput(sv_bytes(ValidUpgradeRequest())).action, Action::Upgrade);
  EXPECT_EQ(coordinator.channel()->decodeOptions().maskPolicy, websocket::MaskPolicy::Required);
  EXPECT_EQ(coordinator.processInput(websocket::EncodeFrame(WebSocketFrame::Text("unmasked"))).action, Action::Close);
}

TEST(UpgradeCoordinatorPhaseTest, PhaseNames) {
  EXPECT_EQ(PhaseName(UpgradeCoordinator::Phase::AwaitingRequest), "awaiting-request");
  EXPECT_EQ(PhaseName(UpgradeCoordinator::Phase::FrameMode), "frame-mode");
}

}  // namespace wsgate
