#include "wsgate/websocket-config.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace wsgate::websocket {

TEST(WebSocketConfig, DefaultIsValid) {
  WebSocketConfig config;
  EXPECT_NO_THROW(config.validate());
  EXPECT_EQ(config.maxFrameSize, kDefaultMaxFrameSize);
  EXPECT_EQ(config.inboundMaskPolicy, MaskPolicy::Any);
  EXPECT_TRUE(config.requireMinimalLength);
}

TEST(WebSocketConfig, UnlimitedFrameSizeIsValid) { EXPECT_NO_THROW(WebSocketConfig{}.withMaxFrameSize(0).validate()); }

TEST(WebSocketConfig, TooSmallFrameSizeThrows) {
  EXPECT_THROW(WebSocketConfig{}.withMaxFrameSize(10).validate(), std::invalid_argument);
  EXPECT_NO_THROW(WebSocketConfig{}.withMaxFrameSize(kMaxControlFramePayload).validate());
}

TEST(WebSocketConfig, TooSmallRequestHeadSizeThrows) {
  EXPECT_THROW(WebSocketConfig{}.withMaxRequestHeadSize(4).validate(), std::invalid_argument);
}

TEST(WebSocketConfig, BuilderChains) {
  auto config = WebSocketConfig{}
                    .withMaxFrameSize(4096)
                    .withMaxRequestHeadSize(1024)
                    .withInboundMaskPolicy(MaskPolicy::Required)
                    .withRequireMinimalLength(false);
  EXPECT_EQ(config.maxFrameSize, 4096U);
  EXPECT_EQ(config.maxRequestHeadSize, 1024U);
  EXPECT_EQ(config.inboundMaskPolicy, MaskPolicy::Required);
  EXPECT_FALSE(config.requireMinimalLength);
  EXPECT_NO_THROW(config.validate());
}

}  // namespace wsgate::websocket
