// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xtok, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <fcntl.h>
#include <istream>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace xtok
{
namespace io
{
/// \brief Incremental producer of raw document bytes.
///
/// read() blocks until at least one byte is available or the input has ended.
/// It returns 0 only at end of input and throws std::runtime_error when the
/// underlying device fails.
class ByteSource
{
public:
  virtual ~ByteSource() = default;

  virtual std::size_t read(char *dst, std::size_t max) = 0;
};

/// \brief ByteSource over a std::istream. The stream must outlive the source.
class StreamByteSource : public ByteSource
{
public:
  explicit StreamByteSource(std::istream &in) : _in(in) {}

  std::size_t read(char *dst, std::size_t max) override
  {
    if (max == 0 || _in.eof())
    {
      return 0;
    }
    _in.read(dst, static_cast<std::streamsize>(max));
    std::streamsize got = _in.gcount();
    if (_in.bad())
    {
      throw std::runtime_error("StreamByteSource: stream read failed");
    }
    return static_cast<std::size_t>(got);
  }

private:
  std::istream &_in;
};

/// \brief ByteSource over a POSIX file descriptor.
class FileByteSource : public ByteSource
{
public:
  /// \brief Open a file for reading.
  /// \throws std::runtime_error if the file cannot be opened.
  explicit FileByteSource(const std::string &path)
  {
    _fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (_fd < 0)
    {
      throw std::runtime_error("FileByteSource: cannot open " + path + ": " +
                               std::strerror(errno));
    }
    _owned = true;
  }

  /// \brief Wrap an already open descriptor (e.g. STDIN_FILENO).
  /// \param takeOwnership close the descriptor on destruction
  FileByteSource(int fd, bool takeOwnership) : _fd(fd), _owned(takeOwnership) {}

  FileByteSource(const FileByteSource &) = delete;
  FileByteSource &operator=(const FileByteSource &) = delete;

  ~FileByteSource() override
  {
    if (_owned && _fd >= 0)
    {
      ::close(_fd);
    }
  }

  std::size_t read(char *dst, std::size_t max) override
  {
    while (true)
    {
      ssize_t n = ::read(_fd, dst, max);
      if (n >= 0)
      {
        return static_cast<std::size_t>(n);
      }
      if (errno == EINTR)
      {
        continue;
      }
      throw std::runtime_error(std::string("FileByteSource: read failed: ") +
                               std::strerror(errno));
    }
  }

private:
  int _fd{-1};
  bool _owned{false};
};

} // namespace io
} // namespace xtok
