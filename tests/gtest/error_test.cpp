/**
 * @file error_test.cpp
 * @brief Error records, ADS code interpretation and addressing (ads_error.cpp, ads.cpp)
 */

#include <gtest/gtest.h>
#include "ads.hpp"
#include "ads_error.hpp"

using namespace ads;
using errors::Category;
using errors::Interpreter;

// ============================================================================
// Status and Result
// ============================================================================

TEST(StatusTest, DefaultIsOk) {
  Status s;
  EXPECT_TRUE(s.ok());
  EXPECT_TRUE(static_cast<bool>(s));
  EXPECT_EQ(s.kind(), ErrorKind::None);
}

TEST(StatusTest, ErrorCarriesCode) {
  Status s = make_error(ErrorKind::ProtocolError, "read failed", 0x702);
  EXPECT_FALSE(s.ok());
  EXPECT_EQ(s.kind(), ErrorKind::ProtocolError);
  EXPECT_EQ(s.error.ads_code, 0x702u);
}

TEST(ResultTest, ValueAndError) {
  Result<int> good(42);
  EXPECT_TRUE(good.ok());
  EXPECT_EQ(good.value, 42);
  EXPECT_TRUE(good.status().ok());

  Result<int> bad(make_error(ErrorKind::Timeout, "late"));
  EXPECT_FALSE(bad.ok());
  EXPECT_EQ(bad.kind(), ErrorKind::Timeout);
  EXPECT_EQ(bad.status().kind(), ErrorKind::Timeout);
}

TEST(ErrorTest, KindNames) {
  EXPECT_STREQ(kind_name(ErrorKind::None), "None");
  EXPECT_STREQ(kind_name(ErrorKind::ConnectionLost), "ConnectionLost");
  EXPECT_STREQ(kind_name(ErrorKind::InvalidHandle), "InvalidHandle");
  EXPECT_STREQ(kind_name(ErrorKind::SizeMismatch), "SizeMismatch");
}

TEST(ErrorTest, ToStringIncludesCode) {
  auto e = make_error(ErrorKind::ProtocolError, "read failed", 0x710);
  std::string s = to_string(e);
  EXPECT_NE(s.find("ProtocolError: read failed"), std::string::npos);
  EXPECT_NE(s.find("0x0710"), std::string::npos);
  EXPECT_NE(s.find("ADSERR_DEVICE_SYMBOLNOTFOUND"), std::string::npos);

  EXPECT_EQ(to_string(make_error(ErrorKind::Timeout, "")), "Timeout");
}

// ============================================================================
// Interpreter
// ============================================================================

TEST(InterpreterTest, NamesAndDescriptions) {
  EXPECT_EQ(Interpreter::get_name(0x000), "ERR_NOERROR");
  EXPECT_EQ(Interpreter::get_name(0x006), "ERR_TARGETPORTNOTFOUND");
  EXPECT_EQ(Interpreter::get_name(0x702), "ADSERR_DEVICE_INVALIDGRP");
  EXPECT_EQ(Interpreter::get_description(0x710), "Symbol not found");
  EXPECT_EQ(Interpreter::get_name(0x745), "ADSERR_CLIENT_SYNCTIMEOUT");
}

TEST(InterpreterTest, UnknownCode) {
  EXPECT_EQ(Interpreter::get_name(0x9999), "ADSERR_UNKNOWN");
  EXPECT_EQ(Interpreter::get_description(0x9999), "Unknown ADS error");
  EXPECT_EQ(Interpreter::get_category(0x9999), Category::Unknown);
}

TEST(InterpreterTest, Categories) {
  EXPECT_EQ(Interpreter::get_category(0x000), Category::None);
  EXPECT_EQ(Interpreter::get_category(0x007), Category::Global);
  EXPECT_EQ(Interpreter::get_category(0x506), Category::Router);
  EXPECT_EQ(Interpreter::get_category(0x705), Category::Device);
  EXPECT_EQ(Interpreter::get_category(0x745), Category::Client);
}

TEST(InterpreterTest, InvalidHandleCodes) {
  EXPECT_TRUE(Interpreter::is_invalid_handle(errors::DeviceSymbolNotFound));
  EXPECT_TRUE(Interpreter::is_invalid_handle(errors::DeviceSymbolVersionInvalid));
  EXPECT_FALSE(Interpreter::is_invalid_handle(errors::DeviceNotifyHandleInvalid));
  EXPECT_FALSE(Interpreter::is_invalid_handle(errors::DeviceInvalidGroup));
}

TEST(InterpreterTest, TransientCodes) {
  EXPECT_TRUE(Interpreter::is_transient(errors::DeviceBusy));
  EXPECT_TRUE(Interpreter::is_transient(errors::DeviceNotReady));
  EXPECT_TRUE(Interpreter::is_transient(errors::ClientTimeout));
  EXPECT_FALSE(Interpreter::is_transient(errors::DeviceInvalidGroup));
  EXPECT_FALSE(Interpreter::is_transient(errors::DeviceSymbolNotFound));
}

TEST(InterpreterTest, FormatForLog) {
  EXPECT_EQ(Interpreter::format_for_log(0x705),
            "0x0705: ADSERR_DEVICE_INVALIDSIZE - Parameter size not correct");
  Interpreter interp;
  EXPECT_EQ(interp.description(0x708), "Device busy");
}

// ============================================================================
// Addressing
// ============================================================================

TEST(AmsNetIdTest, ParseAndFormat) {
  auto id = AmsNetId::parse("5.23.10.4.1.1");
  ASSERT_TRUE(id.has_value());
  EXPECT_EQ(*id, AmsNetId(5, 23, 10, 4, 1, 1));
  EXPECT_EQ(id->to_string(), "5.23.10.4.1.1");
}

TEST(AmsNetIdTest, ParseRejectsMalformed) {
  EXPECT_FALSE(AmsNetId::parse("").has_value());
  EXPECT_FALSE(AmsNetId::parse("1.2.3.4.5").has_value());
  EXPECT_FALSE(AmsNetId::parse("1.2.3.4.5.6.7").has_value());
  EXPECT_FALSE(AmsNetId::parse("1.2.3.4.5.256").has_value());
  EXPECT_FALSE(AmsNetId::parse("1.2..4.5.6").has_value());
  EXPECT_FALSE(AmsNetId::parse("1.2.3.4.5.-6").has_value());
  EXPECT_FALSE(AmsNetId::parse("a.b.c.d.e.f").has_value());
}

TEST(AmsNetIdTest, HelpersAndOrdering) {
  EXPECT_TRUE(AmsNetId().is_zero());
  EXPECT_FALSE(AmsNetId::local().is_zero());
  EXPECT_EQ(AmsNetId::local().to_string(), "127.0.0.1.1.1");
  EXPECT_EQ(AmsNetId::from_ipv4({{192, 168, 1, 20}}), AmsNetId(192, 168, 1, 20, 1, 1));
  EXPECT_LT(AmsNetId(1, 0, 0, 0, 0, 0), AmsNetId(2, 0, 0, 0, 0, 0));
}

TEST(AmsAddrTest, ParseAndFormat) {
  auto addr = AmsAddr::parse("192.168.0.2.1.1:851");
  ASSERT_TRUE(addr.has_value());
  EXPECT_EQ(addr->port, ports::Plc);
  EXPECT_EQ(addr->netid, AmsNetId(192, 168, 0, 2, 1, 1));
  EXPECT_EQ(addr->to_string(), "192.168.0.2.1.1:851");

  EXPECT_FALSE(AmsAddr::parse("192.168.0.2.1.1").has_value());
  EXPECT_FALSE(AmsAddr::parse("192.168.0.2.1.1:70000").has_value());
  EXPECT_FALSE(AmsAddr::parse("192.168.0.2.1.1:").has_value());
}

TEST(AmsAddrTest, EqualityNeedsNetIdAndPort) {
  AmsAddr a(AmsNetId(1, 2, 3, 4, 1, 1), 851);
  AmsAddr b(AmsNetId(1, 2, 3, 4, 1, 1), 852);
  AmsAddr c(AmsNetId(1, 2, 3, 5, 1, 1), 851);
  EXPECT_EQ(a, AmsAddr(AmsNetId(1, 2, 3, 4, 1, 1), 851));
  EXPECT_NE(a, b);
  EXPECT_NE(a, c);
  EXPECT_LT(a, b);
}

// ============================================================================
// Commands and states
// ============================================================================

TEST(AdsStateTest, Names) {
  EXPECT_STREQ(state_name(AdsState::Run), "Run");
  EXPECT_STREQ(state_name(AdsState::Config), "Config");
  EXPECT_STREQ(state_name(static_cast<AdsState>(99)), "Unknown");
  EXPECT_STREQ(command_name(Command::ReadWrite), "ReadWrite");
}

TEST(AdsStateTest, FromRaw) {
  EXPECT_EQ(state_from_raw(5), AdsState::Run);
  EXPECT_EQ(state_from_raw(19), AdsState::Exception);
  EXPECT_FALSE(state_from_raw(20).has_value());
}

TEST(AdsStateTest, ParseIsCaseInsensitive) {
  EXPECT_EQ(parse_state("run"), AdsState::Run);
  EXPECT_EQ(parse_state("STOP"), AdsState::Stop);
  EXPECT_EQ(parse_state("Config"), AdsState::Config);
  EXPECT_FALSE(parse_state("running").has_value());
}
