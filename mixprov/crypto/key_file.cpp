#include "key_file.hpp"

#include "crypto.hpp"

#include <mixprov/util/file.hpp>
#include <mixprov/util/logging.hpp>

#include <oxenc/bt_producer.h>
#include <oxenc/bt_serialize.h>

#include <algorithm>
#include <system_error>

namespace mixprov::crypto
{
  static auto logcat = log::Cat("keys");

  namespace
  {
    // size of a bencoded byte string of length n: "<n>:<bytes>"
    size_t
    bt_string_size(size_t n)
    {
      return std::to_string(n).size() + 1 + n;
    }

    // wipes a string holding key material when it goes out of scope
    struct WipeOnExit
    {
      std::string& str;

      ~WipeOnExit()
      {
        wipe(str);
      }
    };
  }  // namespace

  std::string
  encode_key_block(std::string_view type, const SecretKey& key)
  {
    oxenc::bt_dict_producer btdp;
    btdp.append("k", to_sv(key.ToView()));
    btdp.append("t", type);
    return std::move(btdp).str();
  }

  void
  decode_key_block(std::string_view data, std::string_view type, SecretKey& key)
  {
    std::string raw_key;
    WipeOnExit wipe_key{raw_key};
    std::string tag;

    try
    {
      oxenc::bt_dict_consumer btdc{data};
      raw_key = btdc.require<std::string>("k");
      tag = btdc.require<std::string>("t");
      if (not btdc.is_finished())
        throw key_file_error{"unexpected fields in key block"};
    }
    catch (const key_file_error&)
    {
      throw;
    }
    catch (const std::exception& e)
    {
      throw key_file_error{"malformed key block: {}"_format(e.what())};
    }

    if (data.size() != 2 + 2 * bt_string_size(1) + bt_string_size(raw_key.size())
            + bt_string_size(tag.size()))
      throw key_file_error{"trailing garbage after key block"};

    if (tag != type)
      throw key_file_error{"invalid key block type: '{}'"_format(tag)};

    if (raw_key.size() != key.size())
      throw key_file_error{
          "invalid key length {} for '{}' (expected {})"_format(raw_key.size(), tag, key.size())};

    std::copy(raw_key.begin(), raw_key.end(), key.begin());
  }

  bool
  load_key_file(const fs::path& fname, std::string_view type, SecretKey& key)
  {
    std::error_code ec;
    if (not fs::exists(fname, ec))
    {
      if (ec)
        throw std::system_error{ec, "cannot stat key file " + fname.string()};
      return false;
    }

    std::string buf = util::file_to_string(fname);
    WipeOnExit wipe_buf{buf};

    decode_key_block(buf, type, key);
    log::debug(logcat, "Loaded {} from {}", type, fname.string());
    return true;
  }

  void
  save_key_file(const fs::path& fname, std::string_view type, const SecretKey& key)
  {
    std::string block = encode_key_block(type, key);
    WipeOnExit wipe_block{block};

    util::buffer_to_private_file(fname, block);
    log::info(logcat, "Wrote new {} to {}", type, fname.string());
  }
}  // namespace mixprov::crypto
