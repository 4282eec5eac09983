// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xtok, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file reader.hpp
/// \brief Forward-only XML event reader with encoding detection.
///
/// The reader scans raw bytes for markup delimiters and hands out Event views
/// without decoding them. The active Decoder is chosen by byte-order-mark
/// sniffing on the first advance and may be replaced once, by the encoding
/// label of the first XML declaration. Readers created from decoded text stay
/// on UTF-8.
///
/// Example:
/// \code
/// auto reader = xtok::parsers::Reader::fromBytes(bytes);
/// while (reader.next())
/// {
///   const auto &ev = reader.current();
///   std::string text;
///   if (ev.kind == xtok::parsers::EventKind::Text && ev.decode(text))
///   {
///     // ...
///   }
/// }
/// if (reader.error()) { /* handle */ }
/// \endcode

#include "xtok/core/logger.hpp"
#include "xtok/encoding/decoder.hpp"
#include "xtok/encoding/encoding.hpp"
#include "xtok/io/byte_source.hpp"
#include "xtok/parsers/event.hpp"

#include <cstddef>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace xtok
{
namespace parsers
{
/// \brief Reader options. Trimming both ends (the `trim_text` configuration
/// key and the CLI's --trim) sets trimTextStart and trimTextEnd together.
struct ReaderConfig
{
  bool trimTextStart{false};       ///< Drop leading whitespace of text; elide whitespace-only text
  bool trimTextEnd{false};         ///< Drop trailing whitespace of text before markup
  bool expandEmptyElements{false}; ///< Report <a/> as StartTag followed by EndTag
  std::size_t chunkSize{8192};     ///< Refill request size for incremental sources
};

/// \brief Pull reader producing one Event per advance.
///
/// Not thread-safe. Events returned by one advance are invalidated by the next.
class Reader
{
public:
  enum class State
  {
    Initial,  ///< Encoding not yet detected
    Scanning, ///< Steady-state token dispatch
    Eof,      ///< Terminal; current() is Eof
    Failed    ///< Terminal; error() is set
  };

  /// \brief Read raw bytes from a borrowed buffer that must outlive the reader.
  static Reader fromBytes(std::string_view bytes, const ReaderConfig &cfg = ReaderConfig{})
  {
    Reader r(cfg);
    r._input = bytes;
    return r;
  }

  /// \brief Read already-decoded UTF-8 text. The decoder stays UTF-8 whatever
  /// the document declares.
  static Reader fromStr(std::string_view text, const ReaderConfig &cfg = ReaderConfig{})
  {
    Reader r(cfg);
    r._input = text;
    r._textOrigin = true;
    return r;
  }

  /// \brief Read raw bytes incrementally from a source, blocking on refills.
  static Reader fromSource(std::unique_ptr<io::ByteSource> source,
                           const ReaderConfig &cfg = ReaderConfig{})
  {
    Reader r(cfg);
    r._source = std::move(source);
    return r;
  }

  /// Moving invalidates current() until the next advance.
  Reader(Reader &&) = default;
  Reader &operator=(Reader &&) = default;
  Reader(const Reader &) = delete;
  Reader &operator=(const Reader &) = delete;

  /// \brief Advance to the next token.
  /// \return true if current() holds a new event other than Eof. Returns
  /// false at end of input (current() is Eof, error() is null) and on a fatal
  /// error (error() is set). Both conditions are sticky.
  bool next() { return advance(nullptr); }

  /// \brief Advance, placing the token bytes of an incremental reader at the
  /// end of `scratch` instead of the reader's own buffer. Borrowed readers
  /// never touch `scratch`.
  bool next(std::string &scratch) { return advance(&scratch); }

  const Event &current() const { return _event; }

  const Error *error() const { return _state == State::Failed ? &_error : nullptr; }

  State state() const { return _state; }

  const encoding::Decoder &decoder() const { return _decoder; }

  encoding::Encoding currentEncoding() const { return _decoder.encoding(); }

  /// \brief True once an XML declaration has been processed.
  bool declarationSeen() const { return _declarationSeen; }

  /// \brief Document byte offset of the scan position.
  std::size_t bufferPosition() const { return _base + _pos; }

  const ReaderConfig &config() const { return _cfg; }

private:
  explicit Reader(const ReaderConfig &cfg) : _cfg(cfg)
  {
    if (_cfg.chunkSize == 0)
    {
      _cfg.chunkSize = ReaderConfig{}.chunkSize;
    }
  }

  // ===== Buffer management =====

  std::string_view data() const { return _source ? std::string_view(_buffer) : _input; }

  // Append one chunk from the source. False at end of input or on I/O error.
  bool fill()
  {
    if (!_source || _sourceDone)
    {
      return false;
    }
    std::size_t old = _buffer.size();
    _buffer.resize(old + _cfg.chunkSize);
    std::size_t got = 0;
    try
    {
      got = _source->read(&_buffer[old], _cfg.chunkSize);
    }
    catch (const std::exception &e)
    {
      _ioError = e.what();
    }
    _buffer.resize(old + got);
    if (got == 0)
    {
      _sourceDone = true;
      return false;
    }
    return true;
  }

  // Make data()[0, end) available. False if the input ends first.
  bool available(std::size_t end)
  {
    while (data().size() < end)
    {
      if (!fill())
      {
        return false;
      }
    }
    return true;
  }

  // Position of `needle` at or after `from`, refilling as needed; npos if the
  // input ends first.
  std::size_t findFrom(std::size_t from, std::string_view needle)
  {
    while (true)
    {
      std::string_view d = data();
      std::size_t hit = d.find(needle, from);
      if (hit != std::string_view::npos)
      {
        return hit;
      }
      std::size_t scanned = d.size();
      if (!fill())
      {
        return std::string_view::npos;
      }
      if (scanned + 1 > needle.size() && scanned + 1 - needle.size() > from)
      {
        from = scanned + 1 - needle.size();
      }
    }
  }

  // Drop bytes consumed by earlier tokens. Invalidates previous events.
  void compact()
  {
    if (_source && _pos > 0)
    {
      _buffer.erase(0, _pos);
      _base += _pos;
      _pos = 0;
    }
  }

  // ===== State machine =====

  bool advance(std::string *scratch)
  {
    if (_state == State::Failed || _state == State::Eof)
    {
      return false;
    }
    if (_state == State::Initial)
    {
      start();
    }
    compact();

    bool produced = _pendingEnd ? emitPendingEnd() : readToken();
    if (!produced)
    {
      return false;
    }
    if (scratch && _source)
    {
      moveToScratch(*scratch);
    }
    _event.decoder = &_decoder;
    return true;
  }

  void start()
  {
    _state = State::Scanning;
    // A short or failing input is reported by the first token read
    (void)available(4);
    auto bom = encoding::detectEncoding(data());
    if (!bom)
    {
      return;
    }
    if (_textOrigin)
    {
      if (bom->encoding == encoding::Encoding::Utf8 && bom->bomLength > 0)
      {
        _pos = bom->bomLength;
      }
      return;
    }
    _pos = bom->bomLength;
    _bomConsumed = bom->bomLength > 0;
    _decoder = encoding::Decoder(bom->encoding);
    XTOK_LOG_DEBUG("detected " << encoding::encodingName(bom->encoding)
                               << (_bomConsumed ? " byte-order mark" : " signature")
                               << " (" << bom->bomLength << " bytes)");
  }

  bool readToken()
  {
    while (true)
    {
      if (!available(_pos + 1))
      {
        if (!_ioError.empty())
        {
          return fail("read error: " + _ioError);
        }
        emitEof();
        return false;
      }

      char c = data()[_pos];
      if (c != '<')
      {
        if (readText())
        {
          return true;
        }
        if (_state == State::Failed)
        {
          return false;
        }
        continue; // whitespace elided by trimming
      }

      if (!available(_pos + 2))
      {
        return failUnterminated("unexpected end after '<'");
      }
      switch (data()[_pos + 1])
      {
      case '?':
        return readQuestion();
      case '!':
        return readBang();
      case '/':
        return readEndTag();
      default:
        return readStartOrEmptyTag();
      }
    }
  }

  // Returns false without failing when trimming removed the whole run.
  bool readText()
  {
    std::size_t start = _pos;
    if (_cfg.trimTextStart)
    {
      while (available(start + 1) && detail::isXmlSpace(data()[start]))
      {
        ++start;
      }
    }
    std::size_t lt = findFrom(start, "<");
    if (lt == std::string_view::npos)
    {
      if (!_ioError.empty())
      {
        return fail("read error: " + _ioError);
      }
      lt = data().size();
    }

    std::size_t end = lt;
    if (_cfg.trimTextEnd)
    {
      while (end > start && detail::isXmlSpace(data()[end - 1]))
      {
        --end;
      }
    }
    _pos = lt;
    if (end == start)
    {
      return false;
    }

    _event = Event{};
    _event.kind = EventKind::Text;
    _event.raw = data().substr(start, end - start);
    _event.offset = _base + start;
    return true;
  }

  // <?xml ...?> or <?target ...?>
  bool readQuestion()
  {
    std::size_t startPos = _pos;
    std::size_t close = findFrom(startPos + 2, "?>");
    if (close == std::string_view::npos)
    {
      return failUnterminated("unterminated processing instruction");
    }
    std::string_view content = data().substr(startPos + 2, close - startPos - 2);
    _pos = close + 2;

    bool isDecl = content.size() >= 3 && content.compare(0, 3, "xml") == 0 &&
                  (content.size() == 3 || detail::isXmlSpace(content[3]));

    _event = Event{};
    _event.kind = isDecl ? EventKind::Declaration : EventKind::ProcessingInstruction;
    _event.offset = _base + startPos;
    splitNameAndAttrs(content);
    if (isDecl)
    {
      onDeclaration();
    }
    return true;
  }

  // <!-- -->, <![CDATA[ ]]>, <!DOCTYPE >
  bool readBang()
  {
    static constexpr std::string_view kComment = "<!--";
    static constexpr std::string_view kCData = "<![CDATA[";
    static constexpr std::string_view kDocType = "<!DOCTYPE";

    std::size_t startPos = _pos;
    (void)available(startPos + kCData.size());
    std::string_view head = data().substr(startPos, kCData.size());

    if (head.size() >= kComment.size() && head.compare(0, kComment.size(), kComment) == 0)
    {
      std::size_t close = findFrom(startPos + kComment.size(), "-->");
      if (close == std::string_view::npos)
      {
        return failUnterminated("unterminated comment");
      }
      return emitDelimited(EventKind::Comment, startPos, startPos + kComment.size(), close,
                           close + 3);
    }
    if (head == kCData)
    {
      std::size_t close = findFrom(startPos + kCData.size(), "]]>");
      if (close == std::string_view::npos)
      {
        return failUnterminated("unterminated CDATA");
      }
      return emitDelimited(EventKind::CData, startPos, startPos + kCData.size(), close,
                           close + 3);
    }
    if (head.size() >= kDocType.size() &&
        encoding::detail::equalsIgnoreAsciiCase(head.substr(0, kDocType.size()), kDocType))
    {
      return readDocType(startPos, startPos + kDocType.size());
    }

    // Input ended inside what could still have been one of the forms above
    if (head.size() < kCData.size() && !_ioError.empty())
    {
      return fail("read error: " + _ioError);
    }
    if (head.size() < kComment.size() && kComment.compare(0, head.size(), head) == 0)
    {
      return fail("unterminated comment");
    }
    if (head.size() < kCData.size() && kCData.compare(0, head.size(), head) == 0)
    {
      return fail("unterminated CDATA");
    }
    if (head.size() < kDocType.size() &&
        encoding::detail::equalsIgnoreAsciiCase(head, kDocType.substr(0, head.size())))
    {
      return fail("unterminated doctype");
    }
    return fail("unsupported markup declaration");
  }

  bool readDocType(std::size_t startPos, std::size_t bodyStart)
  {
    std::size_t i = bodyStart;
    int bracket = 0;
    char quote = 0;
    while (true)
    {
      if (!available(i + 1))
      {
        return failUnterminated("unterminated doctype");
      }
      char ch = data()[i];
      if (quote)
      {
        if (ch == quote)
          quote = 0;
      }
      else if (ch == '"' || ch == '\'')
        quote = ch;
      else if (ch == '[')
        ++bracket;
      else if (ch == ']' && bracket > 0)
        --bracket;
      else if (ch == '>' && bracket == 0)
        break;
      ++i;
    }

    std::size_t contentStart = bodyStart;
    while (contentStart < i && detail::isXmlSpace(data()[contentStart]))
    {
      ++contentStart;
    }
    _pos = i + 1;
    _event = Event{};
    _event.kind = EventKind::DocType;
    _event.offset = _base + startPos;
    splitNameAndAttrs(data().substr(contentStart, i - contentStart));
    return true;
  }

  bool readEndTag()
  {
    std::size_t startPos = _pos;
    std::size_t close = findFrom(startPos + 2, ">");
    if (close == std::string_view::npos)
    {
      return failUnterminated("unterminated tag");
    }
    std::string_view content = data().substr(startPos + 2, close - startPos - 2);
    while (!content.empty() && detail::isXmlSpace(content.back()))
    {
      content.remove_suffix(1);
    }
    if (content.empty() || detail::isXmlSpace(content.front()))
    {
      return fail("invalid end tag name");
    }
    _pos = close + 1;

    _event = Event{};
    _event.kind = EventKind::EndTag;
    _event.raw = content;
    _event.name = content;
    _event.offset = _base + startPos;
    return true;
  }

  bool readStartOrEmptyTag()
  {
    std::size_t startPos = _pos;
    std::size_t i = startPos + 1;
    char quote = 0;
    while (true)
    {
      if (!available(i + 1))
      {
        return failUnterminated("unterminated tag");
      }
      char ch = data()[i];
      if (quote)
      {
        if (ch == quote)
          quote = 0;
      }
      else if (ch == '"' || ch == '\'')
        quote = ch;
      else if (ch == '>')
        break;
      ++i;
    }

    std::string_view content = data().substr(startPos + 1, i - startPos - 1);
    bool empty = !content.empty() && content.back() == '/';
    if (empty)
    {
      content.remove_suffix(1);
    }
    if (content.empty() || detail::isXmlSpace(content.front()))
    {
      return fail("invalid start tag name");
    }
    _pos = i + 1;

    _event = Event{};
    _event.kind = empty ? EventKind::EmptyTag : EventKind::StartTag;
    _event.offset = _base + startPos;
    splitNameAndAttrs(content);

    if (empty && _cfg.expandEmptyElements)
    {
      _event.kind = EventKind::StartTag;
      _pendingEnd = true;
      _pendingEndName.assign(_event.name.data(), _event.name.size());
      _pendingEndOffset = _event.offset;
    }
    return true;
  }

  bool emitPendingEnd()
  {
    _pendingEnd = false;
    _event = Event{};
    _event.kind = EventKind::EndTag;
    _event.raw = _pendingEndName;
    _event.name = _event.raw;
    _event.offset = _pendingEndOffset;
    return true;
  }

  bool emitDelimited(EventKind kind, std::size_t startPos, std::size_t bodyStart,
                     std::size_t bodyEnd, std::size_t next)
  {
    _event = Event{};
    _event.kind = kind;
    _event.raw = data().substr(bodyStart, bodyEnd - bodyStart);
    _event.offset = _base + startPos;
    _pos = next;
    return true;
  }

  // raw = content; name = leading run of non-space bytes; attrs = the rest
  // after separating whitespace.
  void splitNameAndAttrs(std::string_view content)
  {
    std::size_t n = 0;
    while (n < content.size() && !detail::isXmlSpace(content[n]))
    {
      ++n;
    }
    std::size_t a = n;
    while (a < content.size() && detail::isXmlSpace(content[a]))
    {
      ++a;
    }
    _event.raw = content;
    _event.name = content.substr(0, n);
    if (a < content.size())
    {
      _event.attrs = content.substr(a);
    }
  }

  // First declaration of a byte-origin document may replace the decoder.
  void onDeclaration()
  {
    if (_declarationSeen)
    {
      XTOK_LOG_DEBUG("ignoring encoding of XML declaration at offset " << _event.offset
                     << "; decoder stays " << encoding::encodingName(_decoder.encoding()));
      return;
    }
    _declarationSeen = true;

    auto label = _event.encoding();
    if (!label)
    {
      return;
    }
    if (_textOrigin)
    {
      XTOK_LOG_DEBUG("text source stays UTF-8; declared encoding '" << *label << "' recorded only");
      return;
    }

    auto enc = encoding::encodingForLabel(*label);
    if (!enc)
    {
      XTOK_LOG_WARN("unsupported encoding label '" << *label << "' in XML declaration; keeping "
                    << encoding::encodingName(_decoder.encoding()));
      return;
    }
    if (*enc != _decoder.encoding())
    {
      XTOK_LOG_DEBUG("XML declaration switches decoder from "
                     << encoding::encodingName(_decoder.encoding()) << " to "
                     << encoding::encodingName(*enc));
      _decoder = encoding::Decoder(*enc);
    }
    if (!encoding::isAsciiCompatible(*enc))
    {
      XTOK_LOG_DEBUG(encoding::encodingName(*enc)
                     << " is not ASCII compatible; markup after the declaration is scanned "
                        "byte-wise");
    }
  }

  void moveToScratch(std::string &scratch)
  {
    std::string_view raw = _event.raw;
    std::size_t base = scratch.size();
    scratch.append(raw.data(), raw.size());
    std::string_view copy(scratch.data() + base, raw.size());

    auto rebase = [&raw, &copy](std::string_view part)
    {
      if (part.empty())
      {
        return std::string_view{};
      }
      return copy.substr(static_cast<std::size_t>(part.data() - raw.data()), part.size());
    };
    _event.name = rebase(_event.name);
    _event.attrs = rebase(_event.attrs);
    _event.raw = copy;
  }

  void emitEof()
  {
    _state = State::Eof;
    _event = Event{};
    _event.kind = EventKind::Eof;
    _event.offset = bufferPosition();
    _event.decoder = &_decoder;
  }

  bool failUnterminated(const char *msg)
  {
    if (!_ioError.empty())
    {
      return fail("read error: " + _ioError);
    }
    return fail(msg);
  }

  bool fail(const std::string &msg)
  {
    _state = State::Failed;
    _error.offset = bufferPosition();
    _error.message = msg;
    _event = Event{};
    XTOK_LOG_ERROR("XML tokenizer error at offset " << _error.offset << ": " << msg);
    return false;
  }

  ReaderConfig _cfg;
  bool _textOrigin{false};

  // Borrowed input, or incremental source with its owned buffer
  std::string_view _input;
  std::unique_ptr<io::ByteSource> _source;
  std::string _buffer;
  bool _sourceDone{false};
  std::string _ioError;

  std::size_t _base{0}; ///< Document offset of data()[0]
  std::size_t _pos{0};  ///< Scan position within data()

  encoding::Decoder _decoder;
  bool _declarationSeen{false};
  bool _bomConsumed{false};
  State _state{State::Initial};

  Event _event{};
  Error _error{};

  bool _pendingEnd{false};
  std::string _pendingEndName;
  std::size_t _pendingEndOffset{0};
};

} // namespace parsers
} // namespace xtok
