// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xtok, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "test_helpers.hpp"

#include <sstream>

using namespace xtok::parsers;
using xtok::test::ChunkedSource;
using xtok::test::decoded;
using xtok::test::FailingSource;
using xtok::test::kinds;

namespace
{
struct Seen
{
  EventKind kind;
  std::string raw;
  std::string name;
  std::string attrs;
  std::size_t offset;

  bool operator==(const Seen &o) const
  {
    return kind == o.kind && raw == o.raw && name == o.name && attrs == o.attrs &&
           offset == o.offset;
  }
};

std::vector<Seen> collect(Reader &reader)
{
  std::vector<Seen> out;
  while (reader.next())
  {
    const auto &ev = reader.current();
    out.push_back({ev.kind, std::string(ev.raw), std::string(ev.name), std::string(ev.attrs),
                   ev.offset});
  }
  return out;
}

const std::string kDocument = "<?xml version=\"1.0\"?>\n"
                              "<!DOCTYPE root [<!ELEMENT root ANY>]>"
                              "<!-- note -->"
                              "<?render fast?>"
                              "<root a=\"1\" b='x>y'>"
                              "<![CDATA[x<y]]>"
                              "text &amp; more"
                              "<empty/>"
                              "</root>";
} // namespace

TEST_CASE("Reader produces every token kind", "[reader][tokens]")
{
  auto reader = Reader::fromBytes(kDocument);
  REQUIRE(reader.state() == Reader::State::Initial);

  REQUIRE(reader.next());
  REQUIRE(reader.state() == Reader::State::Scanning);
  REQUIRE(reader.current().kind == EventKind::Declaration);
  REQUIRE(reader.current().name == "xml");
  REQUIRE(reader.current().version() == std::optional<std::string_view>("1.0"));
  REQUIRE_FALSE(reader.current().encoding());
  REQUIRE(reader.current().offset == 0);

  REQUIRE(reader.next());
  REQUIRE(reader.current().kind == EventKind::Text);
  REQUIRE(reader.current().raw == "\n");

  REQUIRE(reader.next());
  REQUIRE(reader.current().kind == EventKind::DocType);
  REQUIRE(reader.current().name == "root");
  REQUIRE(reader.current().raw == "root [<!ELEMENT root ANY>]");

  REQUIRE(reader.next());
  REQUIRE(reader.current().kind == EventKind::Comment);
  REQUIRE(reader.current().raw == " note ");

  REQUIRE(reader.next());
  REQUIRE(reader.current().kind == EventKind::ProcessingInstruction);
  REQUIRE(reader.current().name == "render");
  REQUIRE(reader.current().attrs == "fast");

  REQUIRE(reader.next());
  REQUIRE(reader.current().kind == EventKind::StartTag);
  REQUIRE(reader.current().name == "root");
  REQUIRE(reader.current().attrs == "a=\"1\" b='x>y'");

  REQUIRE(reader.next());
  REQUIRE(reader.current().kind == EventKind::CData);
  REQUIRE(reader.current().raw == "x<y");

  REQUIRE(reader.next());
  REQUIRE(reader.current().kind == EventKind::Text);
  REQUIRE(reader.current().raw == "text &amp; more");

  REQUIRE(reader.next());
  REQUIRE(reader.current().kind == EventKind::EmptyTag);
  REQUIRE(reader.current().name == "empty");

  REQUIRE(reader.next());
  REQUIRE(reader.current().kind == EventKind::EndTag);
  REQUIRE(reader.current().name == "root");

  REQUIRE_FALSE(reader.next());
  REQUIRE(reader.error() == nullptr);
  REQUIRE(reader.state() == Reader::State::Eof);
  REQUIRE(reader.current().kind == EventKind::Eof);
  REQUIRE(reader.current().offset == kDocument.size());
}

TEST_CASE("End of input is repeatable", "[reader][eof]")
{
  SECTION("Empty input")
  {
    auto reader = Reader::fromBytes("");
    REQUIRE_FALSE(reader.next());
    REQUIRE_FALSE(reader.next());
    REQUIRE(reader.current().isEof());
    REQUIRE(reader.error() == nullptr);
  }

  SECTION("After the last token")
  {
    auto reader = Reader::fromBytes("<a/>");
    REQUIRE(reader.next());
    for (int i = 0; i < 3; ++i)
    {
      REQUIRE_FALSE(reader.next());
      REQUIRE(reader.current().isEof());
      REQUIRE(reader.error() == nullptr);
    }
  }
}

TEST_CASE("Token offsets and buffer position", "[reader][offsets]")
{
  auto reader = Reader::fromBytes("<a>hi</a >");
  REQUIRE(reader.next());
  REQUIRE(reader.current().offset == 0);
  REQUIRE(reader.bufferPosition() == 3);
  REQUIRE(reader.next());
  REQUIRE(reader.current().offset == 3);
  REQUIRE(reader.next());
  REQUIRE(reader.current().offset == 5);
  REQUIRE(reader.current().name == "a");
  REQUIRE(reader.bufferPosition() == 10);
}

TEST_CASE("Declarations and processing instructions are told apart", "[reader][decl]")
{
  auto reader = Reader::fromBytes("<?xml?><?xml-stylesheet href='s.css'?><?xmlfoo?>");
  REQUIRE(kinds(reader) == std::vector<EventKind>{EventKind::Declaration,
                                                  EventKind::ProcessingInstruction,
                                                  EventKind::ProcessingInstruction});
}

TEST_CASE("Declaration accessors", "[reader][decl]")
{
  auto reader =
    Reader::fromBytes("<?xml version='1.1' encoding=\"UTF-8\" standalone='yes'?><a/>");
  REQUIRE(reader.next());
  const auto &ev = reader.current();
  REQUIRE(ev.version() == std::optional<std::string_view>("1.1"));
  REQUIRE(ev.encoding() == std::optional<std::string_view>("UTF-8"));
  REQUIRE(ev.standalone() == std::optional<std::string_view>("yes"));
  REQUIRE(reader.declarationSeen());
}

TEST_CASE("Doctype names are matched case-insensitively", "[reader][doctype]")
{
  auto reader = Reader::fromBytes("<!doctype html><html/>");
  REQUIRE(reader.next());
  REQUIRE(reader.current().kind == EventKind::DocType);
  REQUIRE(reader.current().name == "html");
  REQUIRE(reader.next());
  REQUIRE(reader.current().kind == EventKind::EmptyTag);
}

TEST_CASE("Attributes are split lazily", "[reader][attributes]")
{
  auto reader = Reader::fromBytes("<a x=\"1\" y = 'two' z=3><b q></b></a>");

  REQUIRE(reader.next());
  std::vector<Attribute> attrs;
  Error err;
  REQUIRE(reader.current().attributes(attrs, &err));
  REQUIRE(attrs.size() == 3);
  REQUIRE(attrs[0].name == "x");
  REQUIRE(attrs[0].value == "1");
  REQUIRE(attrs[1].name == "y");
  REQUIRE(attrs[1].value == "two");
  REQUIRE(attrs[2].name == "z");
  REQUIRE(attrs[2].value == "3");
  REQUIRE(reader.current().attribute("y") == std::optional<std::string_view>("two"));
  REQUIRE_FALSE(reader.current().attribute("missing"));

  SECTION("Malformed attributes are a local error")
  {
    REQUIRE(reader.next());
    REQUIRE(reader.current().name == "b");
    REQUIRE_FALSE(reader.current().attributes(attrs, &err));
    REQUIRE(err.message == "expected '=' after attribute name");
    REQUIRE(reader.next());
    REQUIRE(reader.current().kind == EventKind::EndTag);
    REQUIRE(reader.error() == nullptr);
  }
}

TEST_CASE("Text is decoded and unescaped on demand", "[reader][text]")
{
  auto reader = Reader::fromBytes("<a>x &lt; y &#x41;&#66;</a><b>&bogus;</b>");
  REQUIRE(reader.next());
  REQUIRE(reader.next());
  std::string out;
  REQUIRE(reader.current().unescape(out));
  REQUIRE(out == "x < y AB");
  REQUIRE(decoded(reader.current()) == "x &lt; y &#x41;&#66;");

  REQUIRE(reader.next());
  REQUIRE(reader.next());
  REQUIRE(reader.next());
  Error err;
  REQUIRE_FALSE(reader.current().unescape(out, &err));
  REQUIRE(err.message == "unknown entity 'bogus'");
}

TEST_CASE("Text without markup is a single event", "[reader][text]")
{
  auto reader = Reader::fromBytes("just some text");
  REQUIRE(reader.next());
  REQUIRE(reader.current().kind == EventKind::Text);
  REQUIRE(reader.current().raw == "just some text");
  REQUIRE_FALSE(reader.next());
}

TEST_CASE("Whitespace trimming", "[reader][trim]")
{
  const std::string doc = "<a>\n  <b/>\n  hi  \n</a>";

  SECTION("Whitespace is preserved by default")
  {
    auto reader = Reader::fromBytes(doc);
    REQUIRE(kinds(reader) == std::vector<EventKind>{EventKind::StartTag, EventKind::Text,
                                                    EventKind::EmptyTag, EventKind::Text,
                                                    EventKind::EndTag});
  }

  SECTION("trimTextStart drops whitespace-only text and leading blanks")
  {
    ReaderConfig cfg;
    cfg.trimTextStart = true;
    auto reader = Reader::fromBytes(doc, cfg);
    REQUIRE(reader.next());
    REQUIRE(reader.current().kind == EventKind::StartTag);
    REQUIRE(reader.next());
    REQUIRE(reader.current().kind == EventKind::EmptyTag);
    REQUIRE(reader.next());
    REQUIRE(reader.current().kind == EventKind::Text);
    REQUIRE(reader.current().raw == "hi  \n");
    REQUIRE(reader.current().offset == 13);
    REQUIRE(reader.next());
    REQUIRE(reader.current().kind == EventKind::EndTag);
    REQUIRE_FALSE(reader.next());
  }

  SECTION("trimTextEnd drops trailing blanks")
  {
    ReaderConfig cfg;
    cfg.trimTextStart = true;
    cfg.trimTextEnd = true;
    auto reader = Reader::fromBytes(doc, cfg);
    auto seen = collect(reader);
    REQUIRE(seen.size() == 4);
    REQUIRE(seen[2].raw == "hi");
  }

  SECTION("Trailing whitespace at end of input is elided")
  {
    ReaderConfig cfg;
    cfg.trimTextStart = true;
    auto reader = Reader::fromBytes("<a/>\n\n", cfg);
    REQUIRE(kinds(reader) == std::vector<EventKind>{EventKind::EmptyTag});
    REQUIRE(reader.error() == nullptr);
  }
}

TEST_CASE("Empty elements can be expanded", "[reader][expand]")
{
  ReaderConfig cfg;
  cfg.expandEmptyElements = true;
  auto reader = Reader::fromBytes("<a><b x='1'/></a>", cfg);

  REQUIRE(reader.next());
  REQUIRE(reader.current().kind == EventKind::StartTag);
  REQUIRE(reader.next());
  REQUIRE(reader.current().kind == EventKind::StartTag);
  REQUIRE(reader.current().name == "b");
  REQUIRE(reader.current().attrs == "x='1'");
  REQUIRE(reader.next());
  REQUIRE(reader.current().kind == EventKind::EndTag);
  REQUIRE(reader.current().name == "b");
  REQUIRE(reader.current().offset == 3);
  REQUIRE(reader.next());
  REQUIRE(reader.current().kind == EventKind::EndTag);
  REQUIRE(reader.current().name == "a");
  REQUIRE_FALSE(reader.next());
}

TEST_CASE("Fatal errors name what was unterminated", "[reader][errors]")
{
  auto failWith = [](const std::string &doc, const std::string &message, std::size_t offset)
  {
    INFO(doc);
    auto reader = Reader::fromBytes(doc);
    while (reader.next())
    {
    }
    REQUIRE(reader.state() == Reader::State::Failed);
    REQUIRE(reader.error() != nullptr);
    REQUIRE(reader.error()->message == message);
    REQUIRE(reader.error()->offset == offset);
  };

  failWith("<a><!-- never closed", "unterminated comment", 3);
  failWith("<!-", "unterminated comment", 0);
  failWith("<![CDATA[ abc", "unterminated CDATA", 0);
  failWith("<![CD", "unterminated CDATA", 0);
  failWith("<root attr='1'", "unterminated tag", 0);
  failWith("<a></a", "unterminated tag", 3);
  failWith("<a b='>", "unterminated tag", 0);
  failWith("<?pi data", "unterminated processing instruction", 0);
  failWith("<!DOCTYPE x [ <!ELEMENT x ANY>", "unterminated doctype", 0);
  failWith("<!DOC", "unterminated doctype", 0);
  failWith("text<", "unexpected end after '<'", 4);
  failWith("<!foo>", "unsupported markup declaration", 0);
  failWith("<>", "invalid start tag name", 0);
  failWith("< a>", "invalid start tag name", 0);
  failWith("</>", "invalid end tag name", 0);
}

TEST_CASE("Fatal errors are sticky", "[reader][errors]")
{
  auto reader = Reader::fromBytes("<a><!-- oops");
  REQUIRE(reader.next());
  REQUIRE_FALSE(reader.next());
  REQUIRE(reader.error() != nullptr);
  const std::string message = reader.error()->message;
  for (int i = 0; i < 3; ++i)
  {
    REQUIRE_FALSE(reader.next());
    REQUIRE(reader.error() != nullptr);
    REQUIRE(reader.error()->message == message);
  }
}

TEST_CASE("Tokenizer errors are logged", "[reader][errors][logger]")
{
  xtok::test::LogCapture capture;
  auto reader = Reader::fromBytes("<a");
  REQUIRE_FALSE(reader.next());
  REQUIRE(capture.contains(xtok::core::Logger::Level::Error, "unterminated tag"));
}

TEST_CASE("Incremental reading matches borrowed reading", "[reader][incremental]")
{
  auto borrowed = Reader::fromBytes(kDocument);
  auto expected = collect(borrowed);
  REQUIRE(expected.size() == 10);

  for (std::size_t step : {1u, 2u, 3u, 7u, 64u})
  {
    for (std::size_t chunk : {1u, 4u, 8192u})
    {
      INFO("step " << step << " chunk " << chunk);
      ReaderConfig cfg;
      cfg.chunkSize = chunk;
      auto reader =
        Reader::fromSource(std::make_unique<ChunkedSource>(kDocument, step), cfg);
      REQUIRE(collect(reader) == expected);
      REQUIRE(reader.error() == nullptr);
      REQUIRE(reader.current().offset == kDocument.size());
    }
  }
}

TEST_CASE("Incremental reading reports the same errors", "[reader][incremental][errors]")
{
  ReaderConfig cfg;
  cfg.chunkSize = 2;
  auto reader =
    Reader::fromSource(std::make_unique<ChunkedSource>("<a>text<!-- x -", 1), cfg);
  REQUIRE(kinds(reader) == std::vector<EventKind>{EventKind::StartTag, EventKind::Text});
  REQUIRE(reader.error() != nullptr);
  REQUIRE(reader.error()->message == "unterminated comment");
  REQUIRE(reader.error()->offset == 7);
}

TEST_CASE("Incremental trimming and expansion", "[reader][incremental]")
{
  ReaderConfig cfg;
  cfg.chunkSize = 1;
  cfg.trimTextStart = true;
  cfg.trimTextEnd = true;
  cfg.expandEmptyElements = true;
  auto reader =
    Reader::fromSource(std::make_unique<ChunkedSource>("<a>   <b/>  x  </a>", 1), cfg);
  auto seen = collect(reader);
  REQUIRE(seen.size() == 5);
  REQUIRE(seen[1].kind == EventKind::StartTag);
  REQUIRE(seen[2].kind == EventKind::EndTag);
  REQUIRE(seen[2].name == "b");
  REQUIRE(seen[3].raw == "x");
  REQUIRE(seen[4].name == "a");
}

TEST_CASE("Scratch buffers", "[reader][scratch]")
{
  SECTION("Incremental readers place token bytes in the scratch buffer")
  {
    auto reader = Reader::fromSource(std::make_unique<ChunkedSource>("<root>text</root>", 4));
    std::string scratch;
    REQUIRE(reader.next(scratch));
    REQUIRE(scratch == "root");
    REQUIRE(reader.current().name == "root");
    REQUIRE(reader.current().raw.data() == scratch.data());

    scratch.clear();
    REQUIRE(reader.next(scratch));
    REQUIRE(scratch == "text");
    REQUIRE(reader.current().raw.data() == scratch.data());
  }

  SECTION("Borrowed readers leave the scratch buffer alone")
  {
    auto reader = Reader::fromBytes("<root>text</root>");
    std::string scratch = "keep";
    REQUIRE(reader.next(scratch));
    REQUIRE(reader.next(scratch));
    REQUIRE(scratch == "keep");
    REQUIRE(reader.current().raw == "text");
  }
}

TEST_CASE("Owned events outlive the next advance", "[reader][owned]")
{
  auto reader = Reader::fromSource(std::make_unique<ChunkedSource>("<item id='7'>v</item>", 2));
  REQUIRE(reader.next());
  OwnedEvent owned(reader.current());
  REQUIRE(reader.next());
  REQUIRE(reader.next());

  REQUIRE(owned.kind() == EventKind::StartTag);
  REQUIRE(owned.name() == "item");
  REQUIRE(owned.attrs() == "id='7'");
  REQUIRE(owned.offset() == 0);
  REQUIRE(owned.view().attribute("id") == std::optional<std::string_view>("7"));
  std::string text;
  REQUIRE(owned.decode(text));
  REQUIRE(text == "item id='7'");
}

TEST_CASE("I/O failures become sticky fatal errors", "[reader][io]")
{
  auto reader = Reader::fromSource(std::make_unique<FailingSource>("<root>text"));
  REQUIRE(reader.next());
  REQUIRE(reader.current().kind == EventKind::StartTag);
  REQUIRE_FALSE(reader.next());
  REQUIRE(reader.error() != nullptr);
  REQUIRE(reader.error()->message.find("device unplugged") != std::string::npos);
  REQUIRE_FALSE(reader.next());
  REQUIRE(reader.state() == Reader::State::Failed);
}

TEST_CASE("Stream and file sources", "[reader][io]")
{
  const std::string doc = "<a>\xCF\xF0\xE8</a>";

  SECTION("std::istream")
  {
    std::istringstream in(doc);
    auto reader = Reader::fromSource(std::make_unique<xtok::io::StreamByteSource>(in));
    REQUIRE(kinds(reader) ==
            std::vector<EventKind>{EventKind::StartTag, EventKind::Text, EventKind::EndTag});
  }

  SECTION("File path")
  {
    xtok::test::TempFile file("xtok_reader_source.xml", doc);
    auto reader = Reader::fromSource(std::make_unique<xtok::io::FileByteSource>(file.path()));
    REQUIRE(reader.next());
    REQUIRE(reader.next());
    REQUIRE(reader.current().raw == "\xCF\xF0\xE8");
  }

  SECTION("Missing file")
  {
    REQUIRE_THROWS_AS(xtok::io::FileByteSource("/nonexistent/xtok/input.xml"),
                      std::runtime_error);
  }
}

TEST_CASE("Readers over decoded text strip only a UTF-8 BOM", "[reader][str]")
{
  auto reader = Reader::fromStr("\xEF\xBB\xBF" "hello<a/>");
  REQUIRE(reader.next());
  REQUIRE(reader.current().kind == EventKind::Text);
  REQUIRE(reader.current().raw == "hello");
  REQUIRE(reader.current().offset == 3);
  REQUIRE(reader.currentEncoding() == xtok::encoding::Encoding::Utf8);
}
