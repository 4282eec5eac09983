// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xtok, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#include <xtok/xtok.hpp>

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <unistd.h>

namespace
{
constexpr int kExitOk = 0;
constexpr int kExitParseError = 1;
constexpr int kExitUsage = 2;

struct CliOptions
{
  std::optional<std::string> configFile;
  std::optional<std::string> logLevel;
  std::optional<std::string> inputFile;
  bool trim{false};
  bool expandEmpty{false};
  bool help{false};
};

/// \brief Print help message
void printHelp()
{
  std::cout << "Usage: xtokdump [options] [file]\n"
            << "Prints one JSON object per XML event read from file (or stdin).\n\n"
            << "Options:\n"
            << "  -h, --help                 Show this help message\n"
            << "  -c, --config <file>        Configuration file path (TOML)\n"
            << "      --trim                 Trim whitespace around text events\n"
            << "      --expand-empty         Report <a/> as a start and an end tag\n"
            << "  -l, --log-level <level>    Log level (trace, debug, info, warning, "
               "error, fatal)\n";
}

/// \brief Parse command-line arguments.
/// \throws std::runtime_error on unknown or incomplete options.
CliOptions parseCliArgs(int argc, char **argv)
{
  CliOptions opts;
  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help")
    {
      opts.help = true;
    }
    else if (arg == "-c" || arg == "--config")
    {
      if (i + 1 >= argc)
      {
        throw std::runtime_error(arg + " requires a file argument");
      }
      opts.configFile = argv[++i];
    }
    else if (arg == "-l" || arg == "--log-level")
    {
      if (i + 1 >= argc)
      {
        throw std::runtime_error(arg + " requires a level argument");
      }
      opts.logLevel = argv[++i];
    }
    else if (arg == "--trim")
    {
      opts.trim = true;
    }
    else if (arg == "--expand-empty")
    {
      opts.expandEmpty = true;
    }
    else if (arg.size() > 1 && arg[0] == '-')
    {
      throw std::runtime_error("unknown option: " + arg);
    }
    else if (opts.inputFile)
    {
      throw std::runtime_error("only one input file may be given");
    }
    else
    {
      opts.inputFile = arg;
    }
  }
  return opts;
}

std::string toHex(std::string_view bytes)
{
  static const char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (char ch : bytes)
  {
    auto b = static_cast<unsigned char>(ch);
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0F]);
  }
  return out;
}

xtok::core::Json eventToJson(const xtok::parsers::Reader &reader)
{
  const auto &ev = reader.current();
  xtok::core::Json j;
  j["kind"] = xtok::parsers::eventKindName(ev.kind);
  j["offset"] = ev.offset;
  j["encoding"] = xtok::encoding::encodingName(reader.currentEncoding());

  std::string decoded;
  xtok::encoding::DecodeError err;
  if (!ev.name.empty())
  {
    if (ev.decodeName(decoded, &err))
    {
      j["name"] = decoded;
    }
    else
    {
      j["name"] = nullptr;
    }
  }
  if (ev.decode(decoded, &err))
  {
    j["text"] = decoded;
  }
  else
  {
    j["raw_hex"] = toHex(ev.raw);
    j["decode_error"] = err.message + " at byte " + std::to_string(err.offset);
  }
  return j;
}

} // namespace

int main(int argc, char **argv)
{
  CliOptions opts;
  xtok::parsers::ReaderConfig cfg;
  try
  {
    opts = parseCliArgs(argc, argv);
    if (opts.help)
    {
      printHelp();
      return kExitOk;
    }
    if (opts.configFile)
    {
      xtok::core::ConfigLoader loader(*opts.configFile);
      loader.applyLogging();
      cfg = loader.readerConfig(cfg);
    }
    if (opts.logLevel)
    {
      auto level = xtok::core::Logger::parseLevel(*opts.logLevel);
      if (!level)
      {
        throw std::runtime_error("invalid log level: " + *opts.logLevel);
      }
      xtok::core::Logger::setLevel(*level);
    }
  }
  catch (const std::exception &e)
  {
    std::cerr << "xtokdump: " << e.what() << "\n";
    printHelp();
    return kExitUsage;
  }

  if (opts.trim)
  {
    cfg.trimTextStart = true;
    cfg.trimTextEnd = true;
  }
  if (opts.expandEmpty)
  {
    cfg.expandEmptyElements = true;
  }

  std::unique_ptr<xtok::io::ByteSource> source;
  try
  {
    if (opts.inputFile && *opts.inputFile != "-")
    {
      source = std::make_unique<xtok::io::FileByteSource>(*opts.inputFile);
    }
    else
    {
      source = std::make_unique<xtok::io::FileByteSource>(STDIN_FILENO, false);
    }
  }
  catch (const std::runtime_error &e)
  {
    std::cerr << "xtokdump: " << e.what() << "\n";
    return kExitUsage;
  }

  XTOK_LOG_DEBUG("reading " << (opts.inputFile ? *opts.inputFile : std::string("stdin"))
                            << " with chunk size " << cfg.chunkSize);

  auto reader = xtok::parsers::Reader::fromSource(std::move(source), cfg);
  std::size_t events = 0;
  while (reader.next())
  {
    std::cout << eventToJson(reader).dump() << "\n";
    ++events;
  }
  std::cout.flush();
  XTOK_LOG_DEBUGF("%zu events, final encoding %s", events,
                  xtok::encoding::encodingName(reader.currentEncoding()));

  if (const auto *err = reader.error())
  {
    std::cerr << "xtokdump: error at byte " << err->offset << ": " << err->message << "\n";
    xtok::core::Logger::flush();
    return kExitParseError;
  }
  xtok::core::Logger::flush();
  return kExitOk;
}
