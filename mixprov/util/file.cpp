#include "file.hpp"

#include "logging.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <stdexcept>

namespace mixprov::util
{
  static auto logcat = log::Cat("util");

  std::string
  file_to_string(const fs::path& filename)
  {
    fs::ifstream in;
    in.exceptions(std::ifstream::failbit | std::ifstream::badbit);
    in.open(filename, std::ios::binary | std::ios::in);
    in.seekg(0, std::ios::end);
    auto size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::string contents;
    contents.resize(size);
    in.read(contents.data(), size);
    return contents;
  }

  void
  buffer_to_file(const fs::path& filename, std::string_view contents)
  {
    fs::ofstream out;
    out.exceptions(std::ifstream::failbit | std::ifstream::badbit);
    out.open(filename, std::ios::binary | std::ios::out | std::ios::trunc);
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
  }

  void
  buffer_to_private_file(const fs::path& filename, std::string_view contents)
  {
    if (auto ec = EnsurePrivateFile(filename))
      throw std::system_error{ec, "cannot create private file " + filename.string()};
    buffer_to_file(filename, contents);
  }

  static std::error_code
  errno_error()
  {
    int e = errno;
    errno = 0;
    return std::make_error_code(static_cast<std::errc>(e));
  }

  std::error_code
  EnsurePrivateFile(const fs::path& pathname)
  {
    std::error_code ec;
    if (fs::exists(pathname, ec))
    {
      fs::permissions(pathname, fs::perms::owner_read | fs::perms::owner_write, ec);
      if (ec)
        log::error(logcat, "failed to set permissions on {}: {}", pathname.string(), ec.message());
      return ec;
    }

    errno = 0;
    int fd = ::open(pathname.c_str(), O_RDWR | O_CREAT, 0600);
    if (fd == -1)
    {
      ec = errno_error();
      log::error(logcat, "failed to ensure {}: {}", pathname.string(), ec.message());
      return ec;
    }
    ::close(fd);
    return {};
  }

}  // namespace mixprov::util
