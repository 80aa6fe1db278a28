/**
 * @file symbol_test.cpp
 * @brief Symbol handles and mappings across reconnects and online changes
 *        (ads_symbol.cpp, ads_mapping.cpp)
 */

#include <gtest/gtest.h>
#include "ads_mapping.hpp"
#include "ads_symbol.hpp"
#include "util/plc_fixture.hpp"

#include <array>

using namespace ads;
using namespace ads::testutil;
using std::chrono::milliseconds;

class SymbolTest : public PlcFixture {
protected:
  void SetUp() override {
    PlcFixture::SetUp();
    plc_.add_symbol("MY_SYMBOL", "UDINT", 0x00, {1, 0, 0, 0});
    plc_.add_symbol("MAIN.speed", "REAL", 0x10, {0, 0, 0x80, 0x3F});
    plc_.add_symbol("MAIN.axes", "ARRAY [0..2] OF INT", 0x20, {1, 0, 2, 0, 3, 0});
    start_reader();
  }
};

// ============================================================================
// SymbolHandle
// ============================================================================

TEST_F(SymbolTest, ResolvesLazilyAndReads) {
  SymbolHandle sym(plc(), "MY_SYMBOL");
  EXPECT_FALSE(sym.is_valid());
  EXPECT_TRUE(plc_.resolved_handles().empty());

  auto v = sym.read_value<uint32_t>();
  ASSERT_TRUE(v.ok()) << to_string(v.error);
  EXPECT_EQ(v.value, 1u);

  EXPECT_TRUE(sym.is_valid());
  ASSERT_TRUE(sym.raw().has_value());
  EXPECT_EQ(*sym.raw(), FakePlc::kFirstSymbolHandle);
  EXPECT_EQ(plc_.resolved_handles(), (std::vector<uint32_t>{FakePlc::kFirstSymbolHandle}));

  // Further reads reuse the handle
  ASSERT_TRUE(sym.read_value<uint32_t>().ok());
  EXPECT_EQ(plc_.resolved_handles().size(), 1u);
}

TEST_F(SymbolTest, WriteValue) {
  SymbolHandle sym(plc(), "MAIN.speed");
  ASSERT_TRUE(sym.write_value(2.5f).ok());
  EXPECT_EQ(plc_.symbol_value("MAIN.speed"), (std::vector<uint8_t>{0, 0, 0x20, 0x40}));

  auto v = sym.read_value<float>();
  ASSERT_TRUE(v.ok());
  EXPECT_FLOAT_EQ(v.value, 2.5f);
}

TEST_F(SymbolTest, ArrayValue) {
  SymbolHandle sym(plc(), "MAIN.axes");
  auto v = sym.read_value<std::array<int16_t, 3>>();
  ASSERT_TRUE(v.ok());
  EXPECT_EQ(v.value, (std::array<int16_t, 3>{{1, 2, 3}}));
}

TEST_F(SymbolTest, WrongSizeIsSizeMismatch) {
  SymbolHandle sym(plc(), "MY_SYMBOL");
  // The device returns all 4 bytes it has, which is not 8
  EXPECT_EQ(sym.read_value<uint64_t>().kind(), ErrorKind::SizeMismatch);
}

TEST_F(SymbolTest, UnknownSymbol) {
  SymbolHandle sym(plc(), "MAIN.nothing");
  auto v = sym.read_value<uint32_t>();
  EXPECT_EQ(v.kind(), ErrorKind::ProtocolError);
  EXPECT_EQ(v.error.ads_code, errors::DeviceSymbolNotFound);
  EXPECT_FALSE(sym.is_valid());
}

TEST_F(SymbolTest, ConnectionLossThenTransparentReResolve) {
  SymbolHandle sym(plc(), "MY_SYMBOL");
  ASSERT_TRUE(sym.resolve().ok());
  EXPECT_EQ(plc_.resolved_handles().size(), 1u);

  plc_.drop_on_next(Command::Read);
  auto lost = sym.read_value<uint32_t>();
  EXPECT_EQ(lost.kind(), ErrorKind::ConnectionLost);

  ASSERT_TRUE(eventually([this] { return client_->session_id() == 2; }));
  ASSERT_TRUE(client_->wait_connected(milliseconds(2000)));

  // Handle belongs to the old session
  EXPECT_FALSE(sym.is_valid());

  auto v = sym.read_value<uint32_t>();
  ASSERT_TRUE(v.ok()) << to_string(v.error);
  EXPECT_EQ(v.value, 1u);
  EXPECT_EQ(plc_.resolved_handles().size(), 2u);
  EXPECT_TRUE(sym.is_valid());
}

TEST_F(SymbolTest, OnlineChangeReportsInvalidHandle) {
  SymbolHandle sym(plc(), "MY_SYMBOL");
  ASSERT_TRUE(sym.read_value<uint32_t>().ok());

  plc_.reload_program();
  auto v = sym.read_value<uint32_t>();
  EXPECT_EQ(v.kind(), ErrorKind::InvalidHandle);
  EXPECT_EQ(v.error.ads_code, errors::DeviceSymbolNotFound);
  EXPECT_FALSE(sym.is_valid());

  // The next use resolves a new handle
  auto again = sym.read_value<uint32_t>();
  ASSERT_TRUE(again.ok()) << to_string(again.error);
  ASSERT_TRUE(sym.raw().has_value());
  EXPECT_NE(*sym.raw(), FakePlc::kFirstSymbolHandle);
  EXPECT_EQ(plc_.resolved_handles().size(), 2u);
}

TEST_F(SymbolTest, ResolveReleasesPreviousHandle) {
  SymbolHandle sym(plc(), "MY_SYMBOL");
  ASSERT_TRUE(sym.resolve().ok());
  ASSERT_TRUE(sym.resolve().ok());
  EXPECT_EQ(plc_.released_handles(), 1u);
  EXPECT_EQ(plc_.live_handles(), 1u);
}

TEST_F(SymbolTest, ReleaseAndDestruction) {
  {
    SymbolHandle sym(plc(), "MY_SYMBOL");
    ASSERT_TRUE(sym.resolve().ok());
    EXPECT_EQ(plc_.live_handles(), 1u);
  }
  EXPECT_EQ(plc_.released_handles(), 1u);
  EXPECT_EQ(plc_.live_handles(), 0u);

  SymbolHandle sym(plc(), "MY_SYMBOL");
  // Nothing to release yet
  EXPECT_TRUE(sym.release().ok());
  ASSERT_TRUE(sym.resolve().ok());
  EXPECT_TRUE(sym.release().ok());
  EXPECT_FALSE(sym.is_valid());
  EXPECT_EQ(plc_.released_handles(), 2u);
}

TEST_F(SymbolTest, InvalidateForgetsWithoutRelease) {
  SymbolHandle sym(plc(), "MY_SYMBOL");
  ASSERT_TRUE(sym.resolve().ok());
  sym.invalidate();
  EXPECT_FALSE(sym.is_valid());
  EXPECT_EQ(plc_.released_handles(), 0u);
}

// ============================================================================
// Mapping
// ============================================================================

TEST_F(SymbolTest, MappingReadAndWrite) {
  Mapping m(plc(), "MY_SYMBOL", 4);
  EXPECT_EQ(m.length(), 4u);
  EXPECT_EQ(m.symbol(), "MY_SYMBOL");

  auto v = m.read<uint32_t>();
  ASSERT_TRUE(v.ok()) << to_string(v.error);
  EXPECT_EQ(v.value, 1u);

  ASSERT_TRUE(m.write<uint32_t>(0x01020304).ok());
  EXPECT_EQ(plc_.symbol_value("MY_SYMBOL"), (std::vector<uint8_t>{4, 3, 2, 1}));
  EXPECT_EQ(m.buffer(), (std::vector<uint8_t>{4, 3, 2, 1}));
}

TEST_F(SymbolTest, MappingSizeCheckedBeforeIo) {
  Mapping m(plc(), "MY_SYMBOL", 4);
  const size_t reads = plc_.count(Command::Read);
  const size_t writes = plc_.count(Command::Write);

  EXPECT_EQ(m.read<uint16_t>().kind(), ErrorKind::SizeMismatch);
  EXPECT_EQ(m.write<uint64_t>(7).kind(), ErrorKind::SizeMismatch);

  EXPECT_EQ(plc_.count(Command::Read), reads);
  EXPECT_EQ(plc_.count(Command::Write), writes);
  EXPECT_TRUE(plc_.resolved_handles().empty());
}

TEST_F(SymbolTest, MappingReResolvesOnceAfterOnlineChange) {
  Mapping m(plc(), "MY_SYMBOL", 4);
  ASSERT_TRUE(m.read<uint32_t>().ok());

  plc_.reload_program();
  auto v = m.read<uint32_t>();
  ASSERT_TRUE(v.ok()) << to_string(v.error);
  EXPECT_EQ(v.value, 1u);
  EXPECT_EQ(plc_.resolved_handles().size(), 2u);

  plc_.reload_program();
  ASSERT_TRUE(m.write<uint32_t>(9).ok());
  EXPECT_EQ(plc_.resolved_handles().size(), 3u);
  EXPECT_EQ(plc_.symbol_value("MY_SYMBOL"), (std::vector<uint8_t>{9, 0, 0, 0}));
}

TEST_F(SymbolTest, MappingAfterReconnect) {
  Mapping m(plc(), "MY_SYMBOL", 4);
  ASSERT_TRUE(m.read<uint32_t>().ok());

  server_.drop_connection();
  ASSERT_TRUE(eventually([this] { return client_->session_id() == 2; }));
  ASSERT_TRUE(client_->wait_connected(milliseconds(2000)));

  auto v = m.read<uint32_t>();
  ASSERT_TRUE(v.ok()) << to_string(v.error);
  EXPECT_EQ(plc_.resolved_handles().size(), 2u);
}

TEST_F(SymbolTest, MappingShortReadIsSizeMismatch) {
  Mapping m(plc(), "MAIN.axes", 8);
  EXPECT_EQ(m.read<uint64_t>().kind(), ErrorKind::SizeMismatch);
}
