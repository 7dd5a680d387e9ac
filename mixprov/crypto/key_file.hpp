#pragma once

#include "types.hpp"

#include <mixprov/util/fs.hpp>

#include <stdexcept>
#include <string>
#include <string_view>

namespace mixprov::crypto
{
  inline constexpr std::string_view IDENTITY_KEY_TYPE{"Ed25519 PRIVATE KEY"};
  inline constexpr std::string_view LINK_KEY_TYPE{"X25519 PRIVATE KEY"};

  struct key_file_error : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  /// Serializes a secret key as a single bencoded dict tagged with its key type:
  ///
  ///     d1:k<len>:<key bytes>1:t<len>:<type>e
  ///
  /// The returned string holds key material; the caller is responsible for wiping it.
  std::string
  encode_key_block(std::string_view type, const SecretKey& key);

  /// Parses a key block produced by encode_key_block into `key`.
  ///
  /// @throws key_file_error if the block is malformed, carries a different type tag, has a key of
  ///         the wrong length, or is followed by trailing data
  void
  decode_key_block(std::string_view data, std::string_view type, SecretKey& key);

  /// Loads a key file if it exists.  The raw file buffer and the decoded key bytes are wiped as
  /// soon as they have been consumed.
  ///
  /// @return false if there is no such file
  /// @throws key_file_error / std::exception if the file exists but cannot be read or decoded
  bool
  load_key_file(const fs::path& fname, std::string_view type, SecretKey& key);

  /// Writes a key file with owner-only permissions, replacing any existing file.
  void
  save_key_file(const fs::path& fname, std::string_view type, const SecretKey& key);
}  // namespace mixprov::crypto
