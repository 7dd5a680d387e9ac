#pragma once

#include "fs.hpp"

#include <string>
#include <string_view>
#include <system_error>

namespace mixprov::util
{
  /// Reads a binary file from disk into a string.  Throws on error.
  std::string
  file_to_string(const fs::path& filename);

  /// Dumps binary string contents to disk. The file is overwritten if it already exists.  Throws
  /// on error.
  void
  buffer_to_file(const fs::path& filename, std::string_view contents);

  /// Writes contents to a file that only the owner may read or write (mode 0600), creating it if
  /// needed and tightening the permissions of an existing file.  Throws on error.
  void
  buffer_to_private_file(const fs::path& filename, std::string_view contents);

  /// Ensure that a file exists and has owner-only permissions.
  /// return any error code or success
  std::error_code
  EnsurePrivateFile(const fs::path& pathname);

}  // namespace mixprov::util
