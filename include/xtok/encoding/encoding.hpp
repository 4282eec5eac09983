// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xtok, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace xtok
{
namespace encoding
{
/// \brief Closed set of character encodings the reader can switch to.
enum class Encoding
{
  // Unicode transformation formats
  Utf8,
  Utf16Le,
  Utf16Be,

  // Legacy multi-byte
  Big5,
  EucJp,
  EucKr,
  Gb18030,
  Gbk,
  Iso2022Jp,
  ShiftJis,

  // Legacy single-byte
  Ibm866,
  Iso8859_2,
  Iso8859_3,
  Iso8859_4,
  Iso8859_5,
  Iso8859_6,
  Iso8859_7,
  Iso8859_8,
  Iso8859_8I,
  Iso8859_10,
  Iso8859_13,
  Iso8859_14,
  Iso8859_15,
  Iso8859_16,
  Koi8R,
  Koi8U,
  Macintosh,
  Windows874,
  Windows1250,
  Windows1251,
  Windows1252,
  Windows1253,
  Windows1254,
  Windows1255,
  Windows1256,
  Windows1257,
  Windows1258,
  XMacCyrillic,
  XUserDefined
};

/// \brief Result of byte-order-mark sniffing.
struct BomDetection
{
  Encoding encoding{Encoding::Utf8};
  std::size_t bomLength{0}; ///< Bytes to skip before the first token
};

namespace detail
{
  /// \brief Static description of one encoding.
  struct EncodingInfo
  {
    Encoding encoding;
    const char *name;    ///< Canonical label
    const char *charset; ///< iconv charset name; nullptr when decoded natively
    bool asciiCompatible;
  };

  // Ordered like the enum so that lookups are direct indexing.
  inline constexpr std::array<EncodingInfo, 39> kEncodings{{
    {Encoding::Utf8, "UTF-8", nullptr, true},
    {Encoding::Utf16Le, "UTF-16LE", "UTF-16LE", false},
    {Encoding::Utf16Be, "UTF-16BE", "UTF-16BE", false},
    {Encoding::Big5, "Big5", "BIG5-HKSCS", true},
    {Encoding::EucJp, "EUC-JP", "EUC-JP", true},
    {Encoding::EucKr, "EUC-KR", "CP949", true},
    {Encoding::Gb18030, "gb18030", "GB18030", true},
    {Encoding::Gbk, "GBK", "GB18030", true},
    {Encoding::Iso2022Jp, "ISO-2022-JP", "ISO-2022-JP", false},
    {Encoding::ShiftJis, "Shift_JIS", "WINDOWS-31J", true},
    {Encoding::Ibm866, "IBM866", "IBM866", true},
    {Encoding::Iso8859_2, "ISO-8859-2", "ISO-8859-2", true},
    {Encoding::Iso8859_3, "ISO-8859-3", "ISO-8859-3", true},
    {Encoding::Iso8859_4, "ISO-8859-4", "ISO-8859-4", true},
    {Encoding::Iso8859_5, "ISO-8859-5", "ISO-8859-5", true},
    {Encoding::Iso8859_6, "ISO-8859-6", "ISO-8859-6", true},
    {Encoding::Iso8859_7, "ISO-8859-7", "ISO-8859-7", true},
    {Encoding::Iso8859_8, "ISO-8859-8", "ISO-8859-8", true},
    {Encoding::Iso8859_8I, "ISO-8859-8-I", "ISO-8859-8", true},
    {Encoding::Iso8859_10, "ISO-8859-10", "ISO-8859-10", true},
    {Encoding::Iso8859_13, "ISO-8859-13", "ISO-8859-13", true},
    {Encoding::Iso8859_14, "ISO-8859-14", "ISO-8859-14", true},
    {Encoding::Iso8859_15, "ISO-8859-15", "ISO-8859-15", true},
    {Encoding::Iso8859_16, "ISO-8859-16", "ISO-8859-16", true},
    {Encoding::Koi8R, "KOI8-R", "KOI8-R", true},
    {Encoding::Koi8U, "KOI8-U", "KOI8-U", true},
    {Encoding::Macintosh, "macintosh", "MACINTOSH", true},
    {Encoding::Windows874, "windows-874", "WINDOWS-874", true},
    {Encoding::Windows1250, "windows-1250", "WINDOWS-1250", true},
    {Encoding::Windows1251, "windows-1251", "WINDOWS-1251", true},
    {Encoding::Windows1252, "windows-1252", "WINDOWS-1252", true},
    {Encoding::Windows1253, "windows-1253", "WINDOWS-1253", true},
    {Encoding::Windows1254, "windows-1254", "WINDOWS-1254", true},
    {Encoding::Windows1255, "windows-1255", "WINDOWS-1255", true},
    {Encoding::Windows1256, "windows-1256", "WINDOWS-1256", true},
    {Encoding::Windows1257, "windows-1257", "WINDOWS-1257", true},
    {Encoding::Windows1258, "windows-1258", "WINDOWS-1258", true},
    {Encoding::XMacCyrillic, "x-mac-cyrillic", "MAC-CYRILLIC", true},
    {Encoding::XUserDefined, "x-user-defined", nullptr, true},
  }};
  static_assert(kEncodings.size() == static_cast<std::size_t>(Encoding::XUserDefined) + 1,
                "encoding table out of sync with Encoding");

  struct LabelAlias
  {
    const char *label;
    Encoding encoding;
  };

  // Aliases from the WHATWG Encoding Standard that are in common use in XML
  // declarations. Canonical names are matched separately.
  inline constexpr LabelAlias kAliases[] = {
    {"unicode-1-1-utf-8", Encoding::Utf8},
    {"unicode11utf8", Encoding::Utf8},
    {"unicode20utf8", Encoding::Utf8},
    {"utf8", Encoding::Utf8},
    {"x-unicode20utf8", Encoding::Utf8},
    {"csunicode", Encoding::Utf16Le},
    {"iso-10646-ucs-2", Encoding::Utf16Le},
    {"ucs-2", Encoding::Utf16Le},
    {"unicode", Encoding::Utf16Le},
    {"unicodefeff", Encoding::Utf16Le},
    {"utf-16", Encoding::Utf16Le},
    {"unicodefffe", Encoding::Utf16Be},
    {"big5-hkscs", Encoding::Big5},
    {"cn-big5", Encoding::Big5},
    {"csbig5", Encoding::Big5},
    {"x-x-big5", Encoding::Big5},
    {"cseucpkdfmtjapanese", Encoding::EucJp},
    {"x-euc-jp", Encoding::EucJp},
    {"cseuckr", Encoding::EucKr},
    {"csksc56011987", Encoding::EucKr},
    {"iso-ir-149", Encoding::EucKr},
    {"korean", Encoding::EucKr},
    {"ks_c_5601-1987", Encoding::EucKr},
    {"ks_c_5601-1989", Encoding::EucKr},
    {"ksc5601", Encoding::EucKr},
    {"ksc_5601", Encoding::EucKr},
    {"windows-949", Encoding::EucKr},
    {"chinese", Encoding::Gbk},
    {"csgb2312", Encoding::Gbk},
    {"csiso58gb231280", Encoding::Gbk},
    {"gb2312", Encoding::Gbk},
    {"gb_2312", Encoding::Gbk},
    {"gb_2312-80", Encoding::Gbk},
    {"iso-ir-58", Encoding::Gbk},
    {"x-gbk", Encoding::Gbk},
    {"csiso2022jp", Encoding::Iso2022Jp},
    {"csshiftjis", Encoding::ShiftJis},
    {"ms932", Encoding::ShiftJis},
    {"ms_kanji", Encoding::ShiftJis},
    {"shift-jis", Encoding::ShiftJis},
    {"sjis", Encoding::ShiftJis},
    {"windows-31j", Encoding::ShiftJis},
    {"x-sjis", Encoding::ShiftJis},
    {"866", Encoding::Ibm866},
    {"cp866", Encoding::Ibm866},
    {"csibm866", Encoding::Ibm866},
    {"dos-866", Encoding::Ibm866},
    {"csisolatin2", Encoding::Iso8859_2},
    {"iso-ir-101", Encoding::Iso8859_2},
    {"iso8859-2", Encoding::Iso8859_2},
    {"iso88592", Encoding::Iso8859_2},
    {"iso_8859-2", Encoding::Iso8859_2},
    {"l2", Encoding::Iso8859_2},
    {"latin2", Encoding::Iso8859_2},
    {"csisolatin3", Encoding::Iso8859_3},
    {"iso-ir-109", Encoding::Iso8859_3},
    {"iso8859-3", Encoding::Iso8859_3},
    {"iso88593", Encoding::Iso8859_3},
    {"iso_8859-3", Encoding::Iso8859_3},
    {"l3", Encoding::Iso8859_3},
    {"latin3", Encoding::Iso8859_3},
    {"csisolatin4", Encoding::Iso8859_4},
    {"iso-ir-110", Encoding::Iso8859_4},
    {"iso8859-4", Encoding::Iso8859_4},
    {"iso88594", Encoding::Iso8859_4},
    {"iso_8859-4", Encoding::Iso8859_4},
    {"l4", Encoding::Iso8859_4},
    {"latin4", Encoding::Iso8859_4},
    {"csisolatincyrillic", Encoding::Iso8859_5},
    {"cyrillic", Encoding::Iso8859_5},
    {"iso-ir-144", Encoding::Iso8859_5},
    {"iso8859-5", Encoding::Iso8859_5},
    {"iso88595", Encoding::Iso8859_5},
    {"iso_8859-5", Encoding::Iso8859_5},
    {"arabic", Encoding::Iso8859_6},
    {"asmo-708", Encoding::Iso8859_6},
    {"csiso88596e", Encoding::Iso8859_6},
    {"csiso88596i", Encoding::Iso8859_6},
    {"csisolatinarabic", Encoding::Iso8859_6},
    {"ecma-114", Encoding::Iso8859_6},
    {"iso-8859-6-e", Encoding::Iso8859_6},
    {"iso-8859-6-i", Encoding::Iso8859_6},
    {"iso-ir-127", Encoding::Iso8859_6},
    {"iso8859-6", Encoding::Iso8859_6},
    {"iso88596", Encoding::Iso8859_6},
    {"iso_8859-6", Encoding::Iso8859_6},
    {"csisolatingreek", Encoding::Iso8859_7},
    {"ecma-118", Encoding::Iso8859_7},
    {"elot_928", Encoding::Iso8859_7},
    {"greek", Encoding::Iso8859_7},
    {"greek8", Encoding::Iso8859_7},
    {"iso-ir-126", Encoding::Iso8859_7},
    {"iso8859-7", Encoding::Iso8859_7},
    {"iso88597", Encoding::Iso8859_7},
    {"iso_8859-7", Encoding::Iso8859_7},
    {"sun_eu_greek", Encoding::Iso8859_7},
    {"csiso88598e", Encoding::Iso8859_8},
    {"csisolatinhebrew", Encoding::Iso8859_8},
    {"hebrew", Encoding::Iso8859_8},
    {"iso-8859-8-e", Encoding::Iso8859_8},
    {"iso-ir-138", Encoding::Iso8859_8},
    {"iso8859-8", Encoding::Iso8859_8},
    {"iso88598", Encoding::Iso8859_8},
    {"iso_8859-8", Encoding::Iso8859_8},
    {"visual", Encoding::Iso8859_8},
    {"csiso88598i", Encoding::Iso8859_8I},
    {"logical", Encoding::Iso8859_8I},
    {"csisolatin6", Encoding::Iso8859_10},
    {"iso-ir-157", Encoding::Iso8859_10},
    {"iso8859-10", Encoding::Iso8859_10},
    {"iso885910", Encoding::Iso8859_10},
    {"l6", Encoding::Iso8859_10},
    {"latin6", Encoding::Iso8859_10},
    {"iso8859-13", Encoding::Iso8859_13},
    {"iso885913", Encoding::Iso8859_13},
    {"iso8859-14", Encoding::Iso8859_14},
    {"iso885914", Encoding::Iso8859_14},
    {"csisolatin9", Encoding::Iso8859_15},
    {"iso8859-15", Encoding::Iso8859_15},
    {"iso885915", Encoding::Iso8859_15},
    {"iso_8859-15", Encoding::Iso8859_15},
    {"l9", Encoding::Iso8859_15},
    {"cskoi8r", Encoding::Koi8R},
    {"koi", Encoding::Koi8R},
    {"koi8", Encoding::Koi8R},
    {"koi8_r", Encoding::Koi8R},
    {"koi8-ru", Encoding::Koi8U},
    {"csmacintosh", Encoding::Macintosh},
    {"mac", Encoding::Macintosh},
    {"x-mac-roman", Encoding::Macintosh},
    {"dos-874", Encoding::Windows874},
    {"iso-8859-11", Encoding::Windows874},
    {"iso8859-11", Encoding::Windows874},
    {"iso885911", Encoding::Windows874},
    {"tis-620", Encoding::Windows874},
    {"cp1250", Encoding::Windows1250},
    {"x-cp1250", Encoding::Windows1250},
    {"cp1251", Encoding::Windows1251},
    {"x-cp1251", Encoding::Windows1251},
    {"ansi_x3.4-1968", Encoding::Windows1252},
    {"ascii", Encoding::Windows1252},
    {"cp1252", Encoding::Windows1252},
    {"cp819", Encoding::Windows1252},
    {"csisolatin1", Encoding::Windows1252},
    {"ibm819", Encoding::Windows1252},
    {"iso-8859-1", Encoding::Windows1252},
    {"iso-ir-100", Encoding::Windows1252},
    {"iso8859-1", Encoding::Windows1252},
    {"iso88591", Encoding::Windows1252},
    {"iso_8859-1", Encoding::Windows1252},
    {"iso_8859-1:1987", Encoding::Windows1252},
    {"l1", Encoding::Windows1252},
    {"latin1", Encoding::Windows1252},
    {"us-ascii", Encoding::Windows1252},
    {"x-cp1252", Encoding::Windows1252},
    {"cp1253", Encoding::Windows1253},
    {"x-cp1253", Encoding::Windows1253},
    {"cp1254", Encoding::Windows1254},
    {"csisolatin5", Encoding::Windows1254},
    {"iso-8859-9", Encoding::Windows1254},
    {"iso-ir-148", Encoding::Windows1254},
    {"iso8859-9", Encoding::Windows1254},
    {"iso88599", Encoding::Windows1254},
    {"iso_8859-9", Encoding::Windows1254},
    {"l5", Encoding::Windows1254},
    {"latin5", Encoding::Windows1254},
    {"x-cp1254", Encoding::Windows1254},
    {"cp1255", Encoding::Windows1255},
    {"x-cp1255", Encoding::Windows1255},
    {"cp1256", Encoding::Windows1256},
    {"x-cp1256", Encoding::Windows1256},
    {"cp1257", Encoding::Windows1257},
    {"x-cp1257", Encoding::Windows1257},
    {"cp1258", Encoding::Windows1258},
    {"x-cp1258", Encoding::Windows1258},
    {"x-mac-ukrainian", Encoding::XMacCyrillic},
  };

  inline char asciiLower(char ch)
  {
    return (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch;
  }

  inline bool equalsIgnoreAsciiCase(std::string_view a, std::string_view b)
  {
    if (a.size() != b.size())
    {
      return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i)
    {
      if (asciiLower(a[i]) != asciiLower(b[i]))
      {
        return false;
      }
    }
    return true;
  }

  /// \brief XML `S` production: space, tab, CR and LF.
  inline bool isXmlSpace(char ch) { return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n'; }

  inline const EncodingInfo &info(Encoding enc)
  {
    return kEncodings[static_cast<std::size_t>(enc)];
  }

  /// \brief Table-driven encodings whose iconv charset maps each byte to at
  /// most one code point.
  inline bool isSingleByte(Encoding enc)
  {
    return enc >= Encoding::Ibm866 && enc <= Encoding::XMacCyrillic;
  }

  /// \brief Windows code pages, where WHATWG decodes the bytes 0x80-0x9F that
  /// Microsoft leaves unassigned to the C1 control of the same value.
  inline bool passesC1Through(Encoding enc)
  {
    return enc >= Encoding::Windows874 && enc <= Encoding::Windows1258;
  }

  /// \brief Code point WHATWG assigns to a byte where the iconv table has none
  /// or a different one. Returns 0 when the iconv mapping stands. For GBK and
  /// gb18030 this applies to 0x80 in lead position only.
  inline uint32_t byteFixup(Encoding enc, unsigned char byte)
  {
    switch (enc)
    {
    case Encoding::Koi8U:
      if (byte == 0xAE)
        return 0x045E;
      if (byte == 0xBE)
        return 0x040E;
      break;
    case Encoding::Macintosh:
      if (byte == 0xC6)
        return 0x2206;
      if (byte == 0xF0)
        return 0xF8FF;
      break;
    case Encoding::XMacCyrillic:
      if (byte == 0xFF)
        return 0x20AC;
      break;
    case Encoding::Windows1255:
      if (byte == 0xCA)
        return 0x05BA;
      break;
    case Encoding::Gbk:
    case Encoding::Gb18030:
      if (byte == 0x80)
        return 0x20AC;
      break;
    default:
      break;
    }
    return 0;
  }
} // namespace detail

/// \brief Canonical, externally visible label of an encoding.
inline const char *encodingName(Encoding enc) { return detail::info(enc).name; }

/// \brief True when `<`, `>`, quotes and whitespace are single ASCII bytes in
/// this encoding, i.e. when the byte-oriented tokenizer sees real markup.
inline bool isAsciiCompatible(Encoding enc) { return detail::info(enc).asciiCompatible; }

/// \brief Resolve a charset label from an XML declaration.
///
/// Leading and trailing XML whitespace is ignored and the comparison is
/// ASCII case-insensitive. A bare "UTF-16" resolves to little-endian.
/// Returns std::nullopt for labels outside the supported set.
inline std::optional<Encoding> encodingForLabel(std::string_view label)
{
  while (!label.empty() && detail::isXmlSpace(label.front()))
  {
    label.remove_prefix(1);
  }
  while (!label.empty() && detail::isXmlSpace(label.back()))
  {
    label.remove_suffix(1);
  }
  if (label.empty())
  {
    return std::nullopt;
  }

  for (const auto &entry : detail::kEncodings)
  {
    if (detail::equalsIgnoreAsciiCase(label, entry.name))
    {
      return entry.encoding;
    }
  }
  for (const auto &alias : detail::kAliases)
  {
    if (detail::equalsIgnoreAsciiCase(label, alias.label))
    {
      return alias.encoding;
    }
  }
  return std::nullopt;
}

/// \brief Inspect the first bytes of a document for an encoding signature.
///
/// Byte-order marks are reported with their length so the caller can skip
/// them. The BOM-less signatures of `<?` in UTF-16 and `<?xm` in an ASCII
/// superset are reported with length 0.
inline std::optional<BomDetection> detectEncoding(std::string_view bytes)
{
  auto startsWith = [&bytes](std::string_view sig)
  { return bytes.size() >= sig.size() && bytes.compare(0, sig.size(), sig) == 0; };

  using namespace std::string_view_literals;
  if (startsWith("\xFE\xFF"sv))
  {
    return BomDetection{Encoding::Utf16Be, 2};
  }
  if (startsWith("\xFF\xFE"sv))
  {
    return BomDetection{Encoding::Utf16Le, 2};
  }
  if (startsWith("\xEF\xBB\xBF"sv))
  {
    return BomDetection{Encoding::Utf8, 3};
  }

  if (startsWith("\x00<\x00?"sv))
  {
    return BomDetection{Encoding::Utf16Be, 0};
  }
  if (startsWith("<\x00?\x00"sv))
  {
    return BomDetection{Encoding::Utf16Le, 0};
  }
  if (startsWith("<?xm"sv))
  {
    return BomDetection{Encoding::Utf8, 0};
  }
  return std::nullopt;
}

} // namespace encoding
} // namespace xtok
