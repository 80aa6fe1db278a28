/**
 * @file notification_test.cpp
 * @brief Notification payload parsing, samples and sinks (ads_notification.cpp)
 */

#include <gtest/gtest.h>
#include "ads_notification.hpp"

#include <cstdint>
#include <thread>

using namespace ads;
using std::chrono::milliseconds;

namespace {

const AmsAddr kPlc(AmsNetId(5, 23, 10, 4, 1, 1), ports::Plc);

struct StampSpec {
  uint64_t filetime;
  std::vector<std::pair<uint32_t, std::vector<uint8_t>>> samples;
};

std::vector<uint8_t> build_payload(const std::vector<StampSpec>& stamps) {
  std::vector<uint8_t> body;
  codec::le32(body, static_cast<uint32_t>(stamps.size()));
  for (const auto& st : stamps) {
    codec::le64(body, st.filetime);
    codec::le32(body, static_cast<uint32_t>(st.samples.size()));
    for (const auto& s : st.samples) {
      codec::le32(body, s.first);
      codec::le32(body, static_cast<uint32_t>(s.second.size()));
      body.insert(body.end(), s.second.begin(), s.second.end());
    }
  }
  std::vector<uint8_t> payload;
  codec::le32(payload, static_cast<uint32_t>(body.size()));
  payload.insert(payload.end(), body.begin(), body.end());
  return payload;
}

Sample sample_with(uint32_t handle, std::vector<uint8_t> data) {
  Sample s;
  s.source = kPlc;
  s.handle = handle;
  s.data = std::move(data);
  return s;
}

} // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST(NotificationParseTest, MultipleStampsAndSamples) {
  auto payload = build_payload({
      {kFileTimeUnixOffset + 10, {{0x80, {1, 0}}, {0x81, {2, 0, 0, 0}}}},
      {kFileTimeUnixOffset + 20, {{0x80, {3, 0}}}},
  });

  auto r = parse_notification(kPlc, payload);
  ASSERT_TRUE(r.ok()) << to_string(r.error);
  ASSERT_EQ(r.value.size(), 3u);

  EXPECT_EQ(r.value[0].handle, 0x80u);
  EXPECT_EQ(r.value[0].source, kPlc);
  EXPECT_EQ(r.value[0].filetime, kFileTimeUnixOffset + 10);
  EXPECT_EQ(r.value[1].handle, 0x81u);
  EXPECT_EQ(r.value[1].data.size(), 4u);
  EXPECT_EQ(r.value[2].filetime, kFileTimeUnixOffset + 20);
  EXPECT_EQ(r.value[2].data, (std::vector<uint8_t>{3, 0}));
}

TEST(NotificationParseTest, ZeroStamps) {
  auto r = parse_notification(kPlc, build_payload({}));
  ASSERT_TRUE(r.ok());
  EXPECT_TRUE(r.value.empty());
}

TEST(NotificationParseTest, EmptySampleData) {
  auto r = parse_notification(kPlc, build_payload({{0, {{7, {}}}}}));
  ASSERT_TRUE(r.ok());
  ASSERT_EQ(r.value.size(), 1u);
  EXPECT_TRUE(r.value[0].data.empty());
}

TEST(NotificationParseTest, TooShortForHeader) {
  auto r = parse_notification(kPlc, {1, 2, 3});
  EXPECT_EQ(r.kind(), ErrorKind::MalformedFrame);
}

TEST(NotificationParseTest, LengthFieldDisagrees) {
  auto payload = build_payload({{0, {{1, {9}}}}});
  payload[0] = static_cast<uint8_t>(payload[0] + 1);
  EXPECT_EQ(parse_notification(kPlc, payload).kind(), ErrorKind::MalformedFrame);
}

TEST(NotificationParseTest, SampleSizeOverrunsPayload) {
  auto payload = build_payload({{0, {{1, {9, 9}}}}});
  // Sample size field sits after length, stamps, filetime, samples and handle
  const size_t size_at = 4 + 4 + 8 + 4 + 4;
  payload[size_at] = 50;
  EXPECT_EQ(parse_notification(kPlc, payload).kind(), ErrorKind::MalformedFrame);
}

TEST(NotificationParseTest, TrailingBytesRejected) {
  auto payload = build_payload({{0, {{1, {9}}}}});
  payload.push_back(0xAA);
  const uint32_t length = static_cast<uint32_t>(payload.size() - 4);
  payload[0] = static_cast<uint8_t>(length);
  EXPECT_EQ(parse_notification(kPlc, payload).kind(), ErrorKind::MalformedFrame);
}

// ============================================================================
// Sample
// ============================================================================

TEST(SampleTest, TimestampFromFiletime) {
  Sample s;
  // One second and 100 ns after the Unix epoch
  s.filetime = kFileTimeUnixOffset + 10000001;
  auto since_epoch = s.timestamp().time_since_epoch();
  EXPECT_EQ(std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch).count(),
            1000000100);
}

TEST(SampleTest, TimestampBeforeUnixEpochClamps) {
  Sample s;
  s.filetime = 42;
  EXPECT_EQ(s.timestamp(), std::chrono::system_clock::time_point());
}

TEST(SampleTest, TimestampFarFutureSaturates) {
  Sample late;
  late.filetime = kFileTimeUnixOffset + 90000000000000000ULL;  // ~285 years after 1970
  Sample hostile;
  hostile.filetime = UINT64_MAX;

  EXPECT_GT(hostile.timestamp(), late.timestamp());
  EXPECT_GT(hostile.timestamp(), std::chrono::system_clock::time_point());

  Sample almost;
  almost.filetime = UINT64_MAX - 1;
  EXPECT_EQ(almost.timestamp(), hostile.timestamp());
}

TEST(SampleTest, TypedValue) {
  auto s = sample_with(1, {0x10, 0x27, 0, 0});
  auto v = s.value<uint32_t>();
  ASSERT_TRUE(v.ok());
  EXPECT_EQ(v.value, 10000u);

  auto wrong = s.value<uint16_t>();
  EXPECT_EQ(wrong.kind(), ErrorKind::SizeMismatch);
}

// ============================================================================
// Sinks
// ============================================================================

TEST(NotificationQueueTest, FifoOrder) {
  NotificationQueue q(8);
  q.deliver(sample_with(1, {1}));
  q.deliver(sample_with(2, {2}));
  EXPECT_EQ(q.size(), 2u);

  auto a = q.try_pop();
  auto b = q.try_pop();
  ASSERT_TRUE(a && b);
  EXPECT_EQ(a->handle, 1u);
  EXPECT_EQ(b->handle, 2u);
  EXPECT_FALSE(q.try_pop().has_value());
}

TEST(NotificationQueueTest, DropsOldestWhenFull) {
  NotificationQueue q(3);
  for (uint32_t h = 1; h <= 5; ++h) q.deliver(sample_with(h, {}));

  EXPECT_EQ(q.size(), 3u);
  EXPECT_EQ(q.dropped(), 2u);
  EXPECT_EQ(q.try_pop()->handle, 3u);
}

TEST(NotificationQueueTest, ZeroCapacityHoldsOne) {
  NotificationQueue q(0);
  EXPECT_EQ(q.capacity(), 1u);
  q.deliver(sample_with(1, {}));
  q.deliver(sample_with(2, {}));
  EXPECT_EQ(q.try_pop()->handle, 2u);
}

TEST(NotificationQueueTest, PopTimesOut) {
  NotificationQueue q(4);
  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(q.pop(milliseconds(30)).has_value());
  EXPECT_GE(std::chrono::steady_clock::now() - start, milliseconds(25));
}

TEST(NotificationQueueTest, PopWakesOnDelivery) {
  NotificationQueue q(4);
  std::thread producer([&q] {
    std::this_thread::sleep_for(milliseconds(20));
    q.deliver(sample_with(9, {1}));
  });
  auto s = q.pop(milliseconds(2000));
  producer.join();
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->handle, 9u);
}

TEST(NotificationQueueTest, Clear) {
  NotificationQueue q(4);
  q.deliver(sample_with(1, {}));
  q.clear();
  EXPECT_EQ(q.size(), 0u);
}

TEST(CallbackSinkTest, ForwardsSamples) {
  std::vector<uint32_t> seen;
  CallbackSink sink([&seen](const Sample& s) { seen.push_back(s.handle); });
  sink.deliver(sample_with(4, {}));
  sink.deliver(sample_with(5, {}));
  EXPECT_EQ(seen, (std::vector<uint32_t>{4, 5}));

  CallbackSink empty(nullptr);
  empty.deliver(sample_with(6, {}));
}

// ============================================================================
// AddNotification request body
// ============================================================================

TEST(AddNotificationEncodeTest, Layout) {
  auto body = encode_add_notification(0x4020, 0x10,
                                      Attributes(4, TransmissionMode::ServerCycle,
                                                 milliseconds(50), milliseconds(10)));
  ASSERT_EQ(body.size(), kAddNotificationSize);
  EXPECT_EQ(codec::rd32(body.data()), 0x4020u);
  EXPECT_EQ(codec::rd32(body.data() + 4), 0x10u);
  EXPECT_EQ(codec::rd32(body.data() + 8), 4u);
  EXPECT_EQ(codec::rd32(body.data() + 12), 3u);
  EXPECT_EQ(codec::rd32(body.data() + 16), 50u);
  EXPECT_EQ(codec::rd32(body.data() + 20), 10u);
  for (size_t i = 24; i < body.size(); ++i) {
    EXPECT_EQ(body[i], 0) << "reserved byte " << i;
  }
}

TEST(AddNotificationEncodeTest, Presets) {
  auto a = Attributes::on_change(2, milliseconds(100));
  EXPECT_EQ(a.trans_mode, TransmissionMode::ServerOnChange);
  EXPECT_EQ(a.cycle_time, milliseconds(100));
  EXPECT_EQ(Attributes::cyclic(2, milliseconds(5)).trans_mode, TransmissionMode::ServerCycle);
}
