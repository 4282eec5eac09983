// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xtok, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "test_helpers.hpp"

using namespace std::string_view_literals;
using xtok::encoding::BomDetection;
using xtok::encoding::detectEncoding;
using xtok::encoding::Encoding;
using xtok::encoding::encodingForLabel;
using xtok::encoding::encodingName;

TEST_CASE("Byte-order marks are detected with their length", "[encoding][detect]")
{
  SECTION("UTF-16BE")
  {
    auto d = detectEncoding("\xFE\xFF\x00<"sv);
    REQUIRE(d);
    REQUIRE(d->encoding == Encoding::Utf16Be);
    REQUIRE(d->bomLength == 2);
  }

  SECTION("UTF-16LE")
  {
    auto d = detectEncoding("\xFF\xFE<\x00"sv);
    REQUIRE(d);
    REQUIRE(d->encoding == Encoding::Utf16Le);
    REQUIRE(d->bomLength == 2);
  }

  SECTION("UTF-8")
  {
    auto d = detectEncoding("\xEF\xBB\xBF<root/>"sv);
    REQUIRE(d);
    REQUIRE(d->encoding == Encoding::Utf8);
    REQUIRE(d->bomLength == 3);
  }

  SECTION("BOM alone is enough")
  {
    REQUIRE(detectEncoding("\xFF\xFE"sv)->encoding == Encoding::Utf16Le);
    REQUIRE(detectEncoding("\xEF\xBB\xBF"sv)->bomLength == 3);
  }
}

TEST_CASE("BOM-less XML signatures are recognized", "[encoding][detect]")
{
  auto be = detectEncoding("\x00<\x00?\x00x"sv);
  REQUIRE(be);
  REQUIRE(be->encoding == Encoding::Utf16Be);
  REQUIRE(be->bomLength == 0);

  auto le = detectEncoding("<\x00?\x00x\x00"sv);
  REQUIRE(le);
  REQUIRE(le->encoding == Encoding::Utf16Le);
  REQUIRE(le->bomLength == 0);

  auto ascii = detectEncoding("<?xml version='1.0'?>"sv);
  REQUIRE(ascii);
  REQUIRE(ascii->encoding == Encoding::Utf8);
  REQUIRE(ascii->bomLength == 0);
}

TEST_CASE("Inputs without a signature are not detected", "[encoding][detect]")
{
  REQUIRE_FALSE(detectEncoding(""sv));
  REQUIRE_FALSE(detectEncoding("\xEF\xBB"sv));
  REQUIRE_FALSE(detectEncoding("\xFE"sv));
  REQUIRE_FALSE(detectEncoding("<root/>"sv));
  REQUIRE_FALSE(detectEncoding("<?x"sv));
  REQUIRE_FALSE(detectEncoding("plain text"sv));
  // No statistical guessing for high bytes
  REQUIRE_FALSE(detectEncoding("\xD0\xD2\xC9\xD7\xC5\xD4"sv));
}

TEST_CASE("Canonical names", "[encoding][labels]")
{
  REQUIRE(std::string(encodingName(Encoding::Utf8)) == "UTF-8");
  REQUIRE(std::string(encodingName(Encoding::Utf16Le)) == "UTF-16LE");
  REQUIRE(std::string(encodingName(Encoding::Utf16Be)) == "UTF-16BE");
  REQUIRE(std::string(encodingName(Encoding::ShiftJis)) == "Shift_JIS");
  REQUIRE(std::string(encodingName(Encoding::Gb18030)) == "gb18030");
  REQUIRE(std::string(encodingName(Encoding::Windows1251)) == "windows-1251");
  REQUIRE(std::string(encodingName(Encoding::XMacCyrillic)) == "x-mac-cyrillic");
  REQUIRE(std::string(encodingName(Encoding::XUserDefined)) == "x-user-defined");
}

TEST_CASE("Every canonical name resolves to its encoding", "[encoding][labels]")
{
  for (const auto &entry : xtok::encoding::detail::kEncodings)
  {
    INFO(entry.name);
    auto resolved = encodingForLabel(entry.name);
    REQUIRE(resolved);
    REQUIRE(*resolved == entry.encoding);
  }
}

TEST_CASE("Label lookup is lenient about case and whitespace", "[encoding][labels]")
{
  REQUIRE(encodingForLabel("utf-8") == Encoding::Utf8);
  REQUIRE(encodingForLabel("UTF-8") == Encoding::Utf8);
  REQUIRE(encodingForLabel("  Utf-8\t") == Encoding::Utf8);
  REQUIRE(encodingForLabel("WINDOWS-1251") == Encoding::Windows1251);
  REQUIRE(encodingForLabel("shift_jis") == Encoding::ShiftJis);
  REQUIRE(encodingForLabel("GB18030") == Encoding::Gb18030);

  SECTION("Only XML whitespace is stripped")
  {
    REQUIRE(encodingForLabel("\r\nkoi8-r \n") == Encoding::Koi8R);
    REQUIRE_FALSE(encodingForLabel("\futf-8"));
    REQUIRE(xtok::encoding::detail::isXmlSpace('\t'));
    REQUIRE_FALSE(xtok::encoding::detail::isXmlSpace('\f'));
    REQUIRE_FALSE(xtok::encoding::detail::isXmlSpace('\v'));
  }
}

TEST_CASE("Common aliases", "[encoding][labels]")
{
  REQUIRE(encodingForLabel("utf8") == Encoding::Utf8);
  REQUIRE(encodingForLabel("unicode-1-1-utf-8") == Encoding::Utf8);
  REQUIRE(encodingForLabel("UTF-16") == Encoding::Utf16Le);
  REQUIRE(encodingForLabel("unicode") == Encoding::Utf16Le);
  REQUIRE(encodingForLabel("cp1251") == Encoding::Windows1251);
  REQUIRE(encodingForLabel("sjis") == Encoding::ShiftJis);
  REQUIRE(encodingForLabel("csshiftjis") == Encoding::ShiftJis);
  REQUIRE(encodingForLabel("x-gbk") == Encoding::Gbk);
  REQUIRE(encodingForLabel("gb2312") == Encoding::Gbk);
  REQUIRE(encodingForLabel("koi8") == Encoding::Koi8R);
  REQUIRE(encodingForLabel("mac") == Encoding::Macintosh);
  REQUIRE(encodingForLabel("x-mac-ukrainian") == Encoding::XMacCyrillic);
  REQUIRE(encodingForLabel("dos-866") == Encoding::Ibm866);
  REQUIRE(encodingForLabel("logical") == Encoding::Iso8859_8I);

  SECTION("Latin-1 and ASCII labels map to windows-1252")
  {
    REQUIRE(encodingForLabel("latin1") == Encoding::Windows1252);
    REQUIRE(encodingForLabel("ISO-8859-1") == Encoding::Windows1252);
    REQUIRE(encodingForLabel("us-ascii") == Encoding::Windows1252);
    REQUIRE(encodingForLabel("ascii") == Encoding::Windows1252);
  }
}

TEST_CASE("Unknown labels are rejected", "[encoding][labels]")
{
  REQUIRE_FALSE(encodingForLabel(""));
  REQUIRE_FALSE(encodingForLabel("   "));
  REQUIRE_FALSE(encodingForLabel("utf-9"));
  REQUIRE_FALSE(encodingForLabel("klingon"));
  REQUIRE_FALSE(encodingForLabel("utf-8 extra"));
}

TEST_CASE("ASCII compatibility", "[encoding]")
{
  using xtok::encoding::isAsciiCompatible;
  REQUIRE(isAsciiCompatible(Encoding::Utf8));
  REQUIRE(isAsciiCompatible(Encoding::Windows1251));
  REQUIRE(isAsciiCompatible(Encoding::ShiftJis));
  REQUIRE_FALSE(isAsciiCompatible(Encoding::Utf16Le));
  REQUIRE_FALSE(isAsciiCompatible(Encoding::Utf16Be));
  REQUIRE_FALSE(isAsciiCompatible(Encoding::Iso2022Jp));
}
