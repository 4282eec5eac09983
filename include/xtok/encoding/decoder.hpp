// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xtok, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "xtok/core/logger.hpp"
#include "xtok/encoding/encoding.hpp"

#include <array>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <iconv.h>
#include <memory>
#include <string>
#include <string_view>

namespace xtok
{
namespace encoding
{
/// \brief Failure to transcode a byte slice.
struct DecodeError
{
  std::size_t offset{0}; ///< Offset of the first offending byte within the slice
  std::string message;
};

namespace utf8
{
  /// \brief Append a code point to out as UTF-8. Rejects surrogates and
  /// values above U+10FFFF.
  inline bool append(uint32_t cp, std::string &out)
  {
    if (cp <= 0x7Fu)
    {
      out.push_back(static_cast<char>(cp));
    }
    else if (cp <= 0x7FFu)
    {
      out.push_back(static_cast<char>(0xC0u | ((cp >> 6) & 0x1Fu)));
      out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
    else if (cp <= 0xFFFFu)
    {
      if (cp >= 0xD800u && cp <= 0xDFFFu)
      {
        return false;
      }
      out.push_back(static_cast<char>(0xE0u | ((cp >> 12) & 0x0Fu)));
      out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
      out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
    else if (cp <= 0x10FFFFu)
    {
      out.push_back(static_cast<char>(0xF0u | ((cp >> 18) & 0x07u)));
      out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
      out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
      out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
    else
    {
      return false;
    }
    return true;
  }

  /// \brief Returns the offset of the first byte that does not start a
  /// well-formed UTF-8 sequence, or std::string_view::npos if all is valid.
  inline std::size_t findInvalid(std::string_view in)
  {
    std::size_t i = 0;
    while (i < in.size())
    {
      auto b0 = static_cast<unsigned char>(in[i]);
      if (b0 < 0x80)
      {
        ++i;
        continue;
      }

      std::size_t len = 0;
      unsigned char lo = 0x80;
      unsigned char hi = 0xBF;
      if (b0 >= 0xC2 && b0 <= 0xDF)
      {
        len = 2;
      }
      else if (b0 >= 0xE0 && b0 <= 0xEF)
      {
        len = 3;
        if (b0 == 0xE0)
          lo = 0xA0; // overlong
        else if (b0 == 0xED)
          hi = 0x9F; // surrogates
      }
      else if (b0 >= 0xF0 && b0 <= 0xF4)
      {
        len = 4;
        if (b0 == 0xF0)
          lo = 0x90; // overlong
        else if (b0 == 0xF4)
          hi = 0x8F; // above U+10FFFF
      }
      else
      {
        return i;
      }

      if (i + len > in.size())
      {
        return i;
      }
      auto b1 = static_cast<unsigned char>(in[i + 1]);
      if (b1 < lo || b1 > hi)
      {
        return i;
      }
      for (std::size_t k = 2; k < len; ++k)
      {
        auto bk = static_cast<unsigned char>(in[i + k]);
        if (bk < 0x80 || bk > 0xBF)
        {
          return i;
        }
      }
      i += len;
    }
    return std::string_view::npos;
  }
} // namespace utf8

/// \brief Transcodes byte slices of one encoding to UTF-8.
///
/// UTF-8 is validated in place and x-user-defined is mapped natively. The
/// single-byte encodings decode through a 128-entry table that is filled from
/// iconv on first use and patched where WHATWG differs from glibc; the
/// multi-byte ones stream through an iconv converter kept for the lifetime of
/// the Decoder. Copies share only the encoding, never the converter.
class Decoder
{
public:
  Decoder() = default;
  explicit Decoder(Encoding enc) : _encoding(enc) {}

  Decoder(const Decoder &other) : _encoding(other._encoding) {}
  Decoder &operator=(const Decoder &other)
  {
    if (this != &other)
    {
      _encoding = other._encoding;
      _converter.reset();
      _table.reset();
    }
    return *this;
  }
  Decoder(Decoder &&) noexcept = default;
  Decoder &operator=(Decoder &&) noexcept = default;

  Encoding encoding() const { return _encoding; }

  /// \brief Decode `in` into `out` (replacing its contents).
  /// \return false if `in` is not valid in this encoding; `err` then holds
  /// the offset of the first bad byte. A leading BOM is decoded as U+FEFF.
  bool decode(std::string_view in, std::string &out, DecodeError *err = nullptr) const
  {
    out.clear();
    switch (_encoding)
    {
    case Encoding::Utf8:
    {
      std::size_t bad = utf8::findInvalid(in);
      if (bad != std::string_view::npos)
      {
        return fail(err, bad, "invalid UTF-8 sequence");
      }
      out.assign(in.data(), in.size());
      return true;
    }
    case Encoding::XUserDefined:
      out.reserve(in.size());
      for (char ch : in)
      {
        auto b = static_cast<unsigned char>(ch);
        // U+0000..U+007F and U+F780..U+F7FF always encode
        (void)utf8::append(b < 0x80 ? b : 0xF700u + b, out);
      }
      return true;
    default:
      if (detail::isSingleByte(_encoding))
      {
        return decodeWithTable(in, out, err);
      }
      return decodeWithIconv(in, out, err);
    }
  }

  /// \brief Like decode(), but first drops a byte-order mark that matches
  /// this decoder's encoding.
  bool decodeWithBomRemoval(std::string_view in, std::string &out,
                            DecodeError *err = nullptr) const
  {
    if (auto bom = detectEncoding(in); bom && bom->bomLength > 0 && bom->encoding == _encoding)
    {
      in.remove_prefix(bom->bomLength);
    }
    return decode(in, out, err);
  }

private:
  // UTF-8 for the bytes 0x80-0xFF; empty where the byte is unassigned
  using ByteTable = std::array<std::string, 128>;

  struct IconvCloser
  {
    void operator()(void *cd) const
    {
      if (cd)
      {
        iconv_close(static_cast<iconv_t>(cd));
      }
    }
  };

  static bool fail(DecodeError *err, std::size_t offset, std::string message)
  {
    if (err)
    {
      err->offset = offset;
      err->message = std::move(message);
    }
    return false;
  }

  bool openConverter(DecodeError *err) const
  {
    if (_converter)
    {
      return true;
    }
    const char *charset = detail::info(_encoding).charset;
    iconv_t cd = iconv_open("UTF-8", charset);
    if (cd == reinterpret_cast<iconv_t>(-1))
    {
      int code = errno;
      XTOK_LOG_WARN("iconv cannot convert from " << charset << ": " << std::strerror(code));
      return fail(err, 0,
                  std::string("charset ") + encodingName(_encoding) + " is not available: " +
                    std::strerror(code));
    }
    _converter.reset(static_cast<void *>(cd));
    return true;
  }

  bool openTable(DecodeError *err) const
  {
    if (_table)
    {
      return true;
    }
    if (!openConverter(err))
    {
      return false;
    }
    auto cd = static_cast<iconv_t>(_converter.get());
    auto table = std::make_unique<ByteTable>();
    for (unsigned value = 0x80; value <= 0xFF; ++value)
    {
      std::string &entry = (*table)[value - 0x80];
      if (uint32_t cp = detail::byteFixup(_encoding, static_cast<unsigned char>(value)))
      {
        (void)utf8::append(cp, entry);
        continue;
      }

      char byte = static_cast<char>(value);
      char *inPtr = &byte;
      std::size_t inLeft = 1;
      char buf[16];
      char *outPtr = buf;
      std::size_t outLeft = sizeof(buf);
      iconv(cd, nullptr, nullptr, nullptr, nullptr);
      // The flush releases a base letter that a composing converter (CP1258) holds back
      if (iconv(cd, &inPtr, &inLeft, &outPtr, &outLeft) != static_cast<std::size_t>(-1) &&
          iconv(cd, nullptr, nullptr, &outPtr, &outLeft) != static_cast<std::size_t>(-1))
      {
        entry.assign(buf, static_cast<std::size_t>(outPtr - buf));
      }
      else if (detail::passesC1Through(_encoding) && value <= 0x9F)
      {
        (void)utf8::append(value, entry);
      }
    }
    _table = std::move(table);
    return true;
  }

  bool decodeWithTable(std::string_view in, std::string &out, DecodeError *err) const
  {
    if (!openTable(err))
    {
      return false;
    }
    out.reserve(in.size() * 2);
    for (std::size_t i = 0; i < in.size(); ++i)
    {
      auto b = static_cast<unsigned char>(in[i]);
      if (b < 0x80)
      {
        out.push_back(in[i]);
        continue;
      }
      const std::string &mapped = (*_table)[b - 0x80];
      if (mapped.empty())
      {
        return fail(err, i, std::string("invalid ") + encodingName(_encoding) + " sequence");
      }
      out += mapped;
    }
    return true;
  }

  bool decodeWithIconv(std::string_view in, std::string &out, DecodeError *err) const
  {
    if (!openConverter(err))
    {
      return false;
    }
    auto cd = static_cast<iconv_t>(_converter.get());

    // Reset shift state left over from a previous call
    iconv(cd, nullptr, nullptr, nullptr, nullptr);

    out.reserve(in.size() * 2);
    char chunk[1024];
    char *inPtr = const_cast<char *>(in.data());
    std::size_t inLeft = in.size();
    while (inLeft > 0)
    {
      char *outPtr = chunk;
      std::size_t outLeft = sizeof(chunk);
      std::size_t rc = iconv(cd, &inPtr, &inLeft, &outPtr, &outLeft);
      out.append(chunk, static_cast<std::size_t>(outPtr - chunk));
      if (rc == static_cast<std::size_t>(-1))
      {
        int code = errno;
        if (code == E2BIG)
        {
          continue;
        }
        if (code == EILSEQ)
        {
          if (uint32_t cp = detail::byteFixup(_encoding, static_cast<unsigned char>(*inPtr)))
          {
            (void)utf8::append(cp, out);
            ++inPtr;
            --inLeft;
            continue;
          }
        }
        std::size_t offset = in.size() - inLeft;
        if (code == EINVAL)
        {
          return fail(err, offset,
                      std::string("incomplete ") + encodingName(_encoding) +
                        " sequence at end of input");
        }
        return fail(err, offset, std::string("invalid ") + encodingName(_encoding) + " sequence");
      }
    }

    // Emit any pending shift sequence (stateful encodings such as ISO-2022-JP)
    char *outPtr = chunk;
    std::size_t outLeft = sizeof(chunk);
    if (iconv(cd, nullptr, nullptr, &outPtr, &outLeft) == static_cast<std::size_t>(-1))
    {
      return fail(err, in.size(),
                  std::string("unterminated ") + encodingName(_encoding) + " shift sequence");
    }
    out.append(chunk, static_cast<std::size_t>(outPtr - chunk));
    return true;
  }

  Encoding _encoding{Encoding::Utf8};
  mutable std::unique_ptr<void, IconvCloser> _converter;
  mutable std::unique_ptr<ByteTable> _table;
};

} // namespace encoding
} // namespace xtok
