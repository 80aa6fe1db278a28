/**
 * @file reader_test.cpp
 * @brief Reader loop dispatch and reply validation over a scripted transport
 */

#include <gtest/gtest.h>
#include "ads_client.hpp"
#include "ads_device.hpp"
#include "util/mock_ads_server.hpp"
#include "util/plc_fixture.hpp"
#include "util/scripted_transport.hpp"

#include <atomic>
#include <memory>
#include <thread>

using namespace ads;
using namespace ads::testutil;
using std::chrono::milliseconds;

namespace {

std::vector<uint8_t> run_state() { return {5, 0, 0, 0}; }

} // namespace

class ReaderTest : public ::testing::Test {
protected:
  void SetUp() override {
    script_ = std::make_shared<Script>();
    config_.timeouts = Timeouts::uniform(milliseconds(500));
    config_.reconnect_delay = milliseconds(10);
    config_.max_reconnect_delay = milliseconds(40);
    config_.poll_interval = milliseconds(10);
  }

  void TearDown() override {
    if (client_) client_->shutdown();
    if (reader_thread_.joinable()) reader_thread_.join();
    client_.reset();
  }

  void start() {
    client_.reset(new Client(config_, std::unique_ptr<Transport>(new ScriptedTransport(script_))));
    reader_thread_ = std::thread([reader = client_->reader()]() mutable { reader.run(); });
    ASSERT_TRUE(client_->wait_connected(milliseconds(2000)));
  }

  /// Answer ReadState with Run from the request target
  void answer_read_state() {
    script_->set_responder([](const Frame& req) {
      return std::vector<Frame>{make_reply(req, run_state())};
    });
  }

  Result<std::vector<uint8_t>> read_state(milliseconds timeout = milliseconds(0)) {
    return client_->request(Command::ReadState, plc_addr(), {}, timeout);
  }

  std::shared_ptr<Script> script_;
  ClientConfig config_;
  std::unique_ptr<Client> client_;
  std::thread reader_thread_;
};

// ============================================================================
// Source address
// ============================================================================

TEST_F(ReaderTest, SourceFromLocalIpv4) {
  script_->set_local_ipv4(std::array<uint8_t, 4>{{192, 168, 1, 20}});
  start();
  EXPECT_EQ(client_->source(), AmsAddr(AmsNetId(192, 168, 1, 20, 1, 1), ports::AutoSource));
}

TEST_F(ReaderTest, SourceFallsBackToLocalNetId) {
  start();
  EXPECT_EQ(client_->source(), AmsAddr(AmsNetId::local(), ports::AutoSource));
}

// ============================================================================
// Dispatch
// ============================================================================

TEST_F(ReaderTest, ReplyDeliveredInSmallChunks) {
  script_->set_chunk_limit(3);
  answer_read_state();
  start();

  auto r = read_state();
  ASSERT_TRUE(r.ok()) << to_string(r.error);
  EXPECT_EQ(r.value, (std::vector<uint8_t>{5, 0, 0, 0}));

  auto sent = script_->sent();
  ASSERT_EQ(sent.size(), 1u);
  EXPECT_EQ(sent[0].header.command, static_cast<uint16_t>(Command::ReadState));
  EXPECT_EQ(sent[0].header.state_flags, flags::Request);
  EXPECT_EQ(sent[0].header.target, plc_addr());
  EXPECT_EQ(sent[0].header.source, client_->source());
}

TEST_F(ReaderTest, RouterFramesAreSkipped) {
  start();
  Frame note;
  note.ams_cmd = tcp_cmd::RouterNote;
  note.payload = {1, 0, 0, 0};
  script_->push(note);

  answer_read_state();
  EXPECT_TRUE(read_state().ok());
  EXPECT_EQ(client_->session_id(), 1u);
  EXPECT_EQ(client_->statistics().frames_dropped, 0u);
}

TEST_F(ReaderTest, LateReplyIsDropped) {
  start();
  auto r = read_state(milliseconds(50));
  EXPECT_EQ(r.kind(), ErrorKind::Timeout);

  auto sent = script_->sent();
  ASSERT_EQ(sent.size(), 1u);
  script_->push(make_reply(sent[0], run_state()));

  EXPECT_TRUE(eventually([this] { return client_->statistics().frames_dropped == 1; }));
  EXPECT_EQ(client_->state(), ConnectionState::Connected);
}

TEST_F(ReaderTest, ReplyHookAndCallerAgreeAtDeadline) {
  answer_read_state();
  start();

  // The hook outlasts the caller's deadline: the caller must still get the
  // reply the hook acted on, never a Timeout behind its back.
  std::atomic<bool> hook_ran{false};
  auto r = client_->request(Command::ReadState, plc_addr(), {}, milliseconds(50),
                            [&hook_ran](const Frame&) {
                              std::this_thread::sleep_for(milliseconds(150));
                              hook_ran = true;
                            });
  EXPECT_TRUE(hook_ran);
  ASSERT_TRUE(r.ok()) << to_string(r.error);
  EXPECT_EQ(r.value, run_state());
  EXPECT_EQ(client_->statistics().timeouts, 0u);
}

TEST_F(ReaderTest, AddNotificationReplyAfterTimeoutRegistersNothing) {
  start();
  Device plc = client_->device(plc_addr());

  auto added = plc.add_notification(0x4020, 0, Attributes::on_change(4, milliseconds(10)));
  EXPECT_EQ(added.kind(), ErrorKind::Timeout);

  auto sent = script_->sent();
  ASSERT_EQ(sent.size(), 1u);
  EXPECT_EQ(sent[0].header.command, static_cast<uint16_t>(Command::AddNotification));
  script_->push(make_reply(sent[0], {0x90, 0, 0, 0}));
  script_->push(make_notification(client_->source(), plc_addr(), 0x90, {1, 2, 3, 4}));

  EXPECT_TRUE(eventually([this] { return client_->statistics().frames_dropped == 2; }));
  EXPECT_EQ(client_->active_notifications(), 0u);
  EXPECT_FALSE(client_->notifications()->try_pop().has_value());
}

TEST_F(ReaderTest, MalformedStreamDropsConnection) {
  start();

  Result<std::vector<uint8_t>> r;
  std::thread caller([&] { r = read_state(milliseconds(2000)); });
  ASSERT_TRUE(eventually([this] { return script_->sent().size() == 1; }));

  script_->push(std::vector<uint8_t>{0x42, 0x42, 0, 0, 0, 0});
  caller.join();
  EXPECT_EQ(r.kind(), ErrorKind::ConnectionLost);

  ASSERT_TRUE(eventually([this] { return client_->session_id() == 2; }));
  EXPECT_EQ(script_->opens(), 2);
}

TEST_F(ReaderTest, PeerCloseFailsPendingAndReconnects) {
  start();
  Result<std::vector<uint8_t>> r;
  std::thread caller([&] { r = read_state(milliseconds(2000)); });
  ASSERT_TRUE(eventually([this] { return script_->sent().size() == 1; }));

  script_->hang_up();
  caller.join();
  EXPECT_EQ(r.kind(), ErrorKind::ConnectionLost);

  ASSERT_TRUE(eventually([this] { return client_->session_id() == 2; }));
  answer_read_state();
  ASSERT_TRUE(client_->wait_connected(milliseconds(2000)));
  EXPECT_TRUE(read_state().ok());
}

TEST_F(ReaderTest, SendFailureIsConnectionLost) {
  start();
  script_->fail_next_send();
  EXPECT_EQ(read_state().kind(), ErrorKind::ConnectionLost);

  ASSERT_TRUE(eventually([this] { return client_->session_id() == 2; }));
  answer_read_state();
  ASSERT_TRUE(client_->wait_connected(milliseconds(2000)));
  EXPECT_TRUE(read_state().ok());
}

TEST_F(ReaderTest, ConnectRetriesWithBackoff) {
  script_->fail_opens(3);
  start();
  EXPECT_EQ(script_->opens(), 1);
  EXPECT_EQ(client_->session_id(), 1u);
}

// ============================================================================
// Reply validation
// ============================================================================

TEST_F(ReaderTest, ReplyFromWrongSource) {
  script_->set_responder([](const Frame& req) {
    Frame reply = make_reply(req, run_state());
    reply.header.source = AmsAddr(AmsNetId(1, 1, 1, 1, 1, 1), ports::Plc);
    return std::vector<Frame>{reply};
  });
  start();
  auto r = read_state();
  EXPECT_EQ(r.kind(), ErrorKind::ProtocolError);
}

TEST_F(ReaderTest, ReplyWithWrongCommand) {
  script_->set_responder([](const Frame& req) {
    Frame reply = make_reply(req, run_state());
    reply.header.command = static_cast<uint16_t>(Command::Read);
    return std::vector<Frame>{reply};
  });
  start();
  EXPECT_EQ(read_state().kind(), ErrorKind::ProtocolError);
}

TEST_F(ReaderTest, ReplyWithoutResultField) {
  script_->set_responder([](const Frame& req) {
    Frame reply = make_reply(req, {});
    reply.payload.resize(2);
    return std::vector<Frame>{reply};
  });
  start();
  EXPECT_EQ(read_state().kind(), ErrorKind::ProtocolError);
}

TEST_F(ReaderTest, ReplyToOtherTargetIsIgnored) {
  script_->set_responder([](const Frame& req) {
    Frame stray = make_reply(req, run_state());
    stray.header.target = AmsAddr(AmsNetId(9, 9, 9, 9, 1, 1), 30000);
    return std::vector<Frame>{stray, make_reply(req, run_state())};
  });
  start();
  EXPECT_TRUE(read_state().ok());
  EXPECT_EQ(client_->statistics().frames_dropped, 1u);
}

// ============================================================================
// Notifications
// ============================================================================

TEST_F(ReaderTest, BadNotificationsDroppedStreamStaysInSync) {
  start();
  const AmsAddr me = client_->source();
  client_->register_notification(plc_addr(), 7, client_->notifications());

  // Reply flags on a notification
  Frame wrong_flags = make_notification(me, plc_addr(), 7, {1});
  wrong_flags.header.state_flags = flags::Reply;
  script_->push(wrong_flags);

  // Length field disagrees with the payload
  Frame truncated = make_notification(me, plc_addr(), 7, {1, 2});
  truncated.payload.pop_back();
  truncated.payload[0] = static_cast<uint8_t>(truncated.payload[0] + 10);
  script_->push(truncated);

  // Unknown handle
  script_->push(make_notification(me, plc_addr(), 8, {3}));

  script_->push(make_notification(me, plc_addr(), 7, {4}));

  auto s = client_->notifications()->pop(milliseconds(1000));
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->data, (std::vector<uint8_t>{4}));
  EXPECT_EQ(client_->statistics().frames_dropped, 3u);
  EXPECT_EQ(client_->statistics().notification_samples, 1u);
  EXPECT_EQ(client_->session_id(), 1u);
}

TEST_F(ReaderTest, ShutdownDeletesRegisteredNotifications) {
  answer_read_state();
  start();
  client_->register_notification(plc_addr(), 0x81, client_->notifications());
  script_->set_responder([](const Frame& req) { return std::vector<Frame>{make_reply(req, {})}; });

  client_->shutdown();
  reader_thread_.join();

  auto sent = script_->sent();
  ASSERT_EQ(sent.size(), 1u);
  EXPECT_EQ(sent[0].header.command, static_cast<uint16_t>(Command::DeleteNotification));
  EXPECT_EQ(payload_u32(sent[0], 0), 0x81u);
  EXPECT_EQ(client_->active_notifications(), 0u);
}
