// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xtok, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "xtok/encoding/decoder.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace xtok
{
namespace parsers
{
/// \brief Lexical unit kinds produced by the Reader.
enum class EventKind
{
  Declaration,           ///< <?xml ...?>
  StartTag,              ///< <name ...>
  EndTag,                ///< </name>
  EmptyTag,              ///< <name .../>
  Text,                  ///< Character data up to the next '<'
  CData,                 ///< <![CDATA[...]]>
  Comment,               ///< <!--...-->
  ProcessingInstruction, ///< <?target ...?>
  DocType,               ///< <!DOCTYPE ...>
  Eof
};

inline const char *eventKindName(EventKind kind)
{
  switch (kind)
  {
  case EventKind::Declaration:
    return "Declaration";
  case EventKind::StartTag:
    return "StartTag";
  case EventKind::EndTag:
    return "EndTag";
  case EventKind::EmptyTag:
    return "EmptyTag";
  case EventKind::Text:
    return "Text";
  case EventKind::CData:
    return "CData";
  case EventKind::Comment:
    return "Comment";
  case EventKind::ProcessingInstruction:
    return "ProcessingInstruction";
  case EventKind::DocType:
    return "DocType";
  case EventKind::Eof:
    return "Eof";
  }
  return "Unknown";
}

/// \brief Error information for parse and attribute/entity failures.
struct Error
{
  std::size_t offset{0};
  std::string message;
};

/// \brief Attribute view (name/value). Values are undecoded source bytes.
struct Attribute
{
  std::string_view name;
  std::string_view value;
};

namespace detail
{
  using encoding::detail::isXmlSpace;

  inline const encoding::Decoder &defaultDecoder()
  {
    static const encoding::Decoder utf8;
    return utf8;
  }

  // Append a numeric char ref body (e.g. "#10" or "#x1F4A9") to out as UTF-8.
  inline bool appendCharRef(std::string_view entBody, std::string &out)
  {
    if (entBody.size() < 2)
    {
      return false;
    }
    uint32_t code = 0;
    bool hex = (entBody[1] == 'x' || entBody[1] == 'X');
    std::size_t first = hex ? 2 : 1;
    if (first >= entBody.size())
    {
      return false;
    }
    for (std::size_t i = first; i < entBody.size(); ++i)
    {
      char c = entBody[i];
      uint32_t v = 0;
      if (c >= '0' && c <= '9')
        v = static_cast<uint32_t>(c - '0');
      else if (hex && c >= 'a' && c <= 'f')
        v = static_cast<uint32_t>(c - 'a' + 10);
      else if (hex && c >= 'A' && c <= 'F')
        v = static_cast<uint32_t>(c - 'A' + 10);
      else
        return false;
      code = hex ? (code << 4) | v : code * 10u + v;
      if (code > 0x10FFFFu)
      {
        return false;
      }
    }
    if (code == 0)
    {
      return false;
    }
    return encoding::utf8::append(code, out);
  }
} // namespace detail

/// \brief Expand the predefined entities and numeric character references of
/// UTF-8 text. Unknown entities are errors; no DTD entities are resolved.
inline bool unescape(std::string_view in, std::string &out, Error *err = nullptr)
{
  out.clear();
  out.reserve(in.size());
  for (std::size_t i = 0; i < in.size();)
  {
    char ch = in[i];
    if (ch != '&')
    {
      out.push_back(ch);
      ++i;
      continue;
    }
    std::size_t semi = in.find(';', i + 1);
    if (semi == std::string_view::npos)
    {
      if (err)
      {
        *err = {i, "unterminated entity"};
      }
      return false;
    }
    std::string_view ent = in.substr(i + 1, semi - (i + 1));
    if (ent == "lt")
      out.push_back('<');
    else if (ent == "gt")
      out.push_back('>');
    else if (ent == "amp")
      out.push_back('&');
    else if (ent == "apos")
      out.push_back('\'');
    else if (ent == "quot")
      out.push_back('"');
    else if (!ent.empty() && ent[0] == '#')
    {
      if (!detail::appendCharRef(ent, out))
      {
        if (err)
        {
          *err = {i, "invalid character reference"};
        }
        return false;
      }
    }
    else
    {
      if (err)
      {
        *err = {i, "unknown entity '" + std::string(ent) + "'"};
      }
      return false;
    }
    i = semi + 1;
  }
  return true;
}

/// \brief Split the attribute section of a tag, declaration or PI into
/// name/value slices. Values may be quoted with ' or ", or left unquoted up
/// to the next whitespace.
inline bool splitAttributes(std::string_view attrs, std::vector<Attribute> &out,
                            Error *err = nullptr)
{
  out.clear();
  auto failAt = [err](std::size_t offset, const char *msg)
  {
    if (err)
    {
      *err = {offset, msg};
    }
    return false;
  };

  std::size_t i = 0;
  while (true)
  {
    while (i < attrs.size() && detail::isXmlSpace(attrs[i]))
    {
      ++i;
    }
    if (i >= attrs.size())
    {
      return true;
    }

    std::size_t nameStart = i;
    while (i < attrs.size() && attrs[i] != '=' && !detail::isXmlSpace(attrs[i]))
    {
      ++i;
    }
    std::string_view name = attrs.substr(nameStart, i - nameStart);
    if (name.empty())
    {
      return failAt(nameStart, "missing attribute name");
    }

    while (i < attrs.size() && detail::isXmlSpace(attrs[i]))
    {
      ++i;
    }
    if (i >= attrs.size() || attrs[i] != '=')
    {
      return failAt(i, "expected '=' after attribute name");
    }
    ++i;
    while (i < attrs.size() && detail::isXmlSpace(attrs[i]))
    {
      ++i;
    }
    if (i >= attrs.size())
    {
      return failAt(i, "missing attribute value");
    }

    std::string_view value;
    char quote = attrs[i];
    if (quote == '"' || quote == '\'')
    {
      std::size_t close = attrs.find(quote, i + 1);
      if (close == std::string_view::npos)
      {
        return failAt(i, "unterminated attribute value");
      }
      value = attrs.substr(i + 1, close - i - 1);
      i = close + 1;
    }
    else
    {
      std::size_t valueStart = i;
      while (i < attrs.size() && !detail::isXmlSpace(attrs[i]))
      {
        ++i;
      }
      value = attrs.substr(valueStart, i - valueStart);
    }
    out.push_back(Attribute{name, value});
  }
}

/// \brief One lexical token. All slices borrow from the Reader (or from the
/// caller's scratch buffer) and are valid only until the next advance.
struct Event
{
  EventKind kind{EventKind::Eof};
  std::string_view raw;   ///< Bytes between the token delimiters
  std::string_view name;  ///< Tag name, PI target, "xml" or doctype root name; prefix of raw
  std::string_view attrs; ///< Bytes following the name (tags, declaration, PI, doctype)
  std::size_t offset{0};  ///< Document byte offset of the token start (BOM included)
  const encoding::Decoder *decoder{nullptr};

  /// \brief Decode raw bytes to UTF-8 with the producing reader's decoder as
  /// it is at the time of this call.
  bool decode(std::string &out, encoding::DecodeError *err = nullptr) const
  {
    return activeDecoder().decode(raw, out, err);
  }

  /// \brief Decode the name slice only.
  bool decodeName(std::string &out, encoding::DecodeError *err = nullptr) const
  {
    return activeDecoder().decode(name, out, err);
  }

  /// \brief Decode, then expand entities and character references.
  bool unescape(std::string &out, Error *err = nullptr) const
  {
    std::string decoded;
    encoding::DecodeError derr;
    if (!decode(decoded, &derr))
    {
      if (err)
      {
        *err = {derr.offset, derr.message};
      }
      return false;
    }
    return parsers::unescape(decoded, out, err);
  }

  /// \brief Undecoded attribute slices; see splitAttributes().
  bool attributes(std::vector<Attribute> &out, Error *err = nullptr) const
  {
    return splitAttributes(attrs, out, err);
  }

  /// \brief Value of the first attribute with the given name, if the
  /// attribute section is well formed up to it.
  std::optional<std::string_view> attribute(std::string_view attrName) const
  {
    std::vector<Attribute> list;
    // Attributes before a syntax error are still searched
    (void)splitAttributes(attrs, list);
    for (const auto &a : list)
    {
      if (a.name == attrName)
      {
        return a.value;
      }
    }
    return std::nullopt;
  }

  // Declaration accessors
  std::optional<std::string_view> version() const { return attribute("version"); }
  std::optional<std::string_view> encoding() const { return attribute("encoding"); }
  std::optional<std::string_view> standalone() const { return attribute("standalone"); }

  bool isEof() const { return kind == EventKind::Eof; }

private:
  const encoding::Decoder &activeDecoder() const
  {
    return decoder ? *decoder : detail::defaultDecoder();
  }
};

/// \brief Self-contained copy of an Event that outlives the next advance.
/// Decodes with the encoding that was active when the copy was taken.
class OwnedEvent
{
public:
  explicit OwnedEvent(const Event &ev)
    : _kind(ev.kind), _raw(ev.raw), _offset(ev.offset),
      _decoder(ev.decoder ? ev.decoder->encoding() : encoding::Encoding::Utf8)
  {
    _name = locate(ev.raw, ev.name);
    _attrs = locate(ev.raw, ev.attrs);
  }

  EventKind kind() const { return _kind; }
  std::size_t offset() const { return _offset; }
  encoding::Encoding encoding() const { return _decoder.encoding(); }
  const std::string &raw() const { return _raw; }
  std::string_view name() const { return std::string_view(_raw).substr(_name.first, _name.second); }
  std::string_view attrs() const
  {
    return std::string_view(_raw).substr(_attrs.first, _attrs.second);
  }

  /// \brief Event view over this copy's storage.
  Event view() const
  {
    Event ev;
    ev.kind = _kind;
    ev.raw = _raw;
    ev.name = name();
    ev.attrs = attrs();
    ev.offset = _offset;
    ev.decoder = &_decoder;
    return ev;
  }

  bool decode(std::string &out, encoding::DecodeError *err = nullptr) const
  {
    return _decoder.decode(_raw, out, err);
  }

private:
  using Span = std::pair<std::size_t, std::size_t>;

  static Span locate(std::string_view whole, std::string_view part)
  {
    if (part.empty() || part.data() < whole.data() ||
        part.data() + part.size() > whole.data() + whole.size())
    {
      return {0, 0};
    }
    return {static_cast<std::size_t>(part.data() - whole.data()), part.size()};
  }

  EventKind _kind;
  std::string _raw;
  Span _name{0, 0};
  Span _attrs{0, 0};
  std::size_t _offset;
  encoding::Decoder _decoder;
};

} // namespace parsers
} // namespace xtok
