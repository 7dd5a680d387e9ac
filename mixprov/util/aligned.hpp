#pragma once

#include "types.hpp"

#include <oxenc/hex.h>

#include <algorithm>
#include <array>
#include <cassert>
#include <cstddef>
#include <cstring>
#include <string>
#include <string_view>

namespace mixprov
{
  /// fixed size byte buffer that is sz bytes long, aligned for word-at-a-time access
  template <size_t sz>
  struct alignas(std::max_align_t) AlignedBuffer
  {
    static_assert(
        sz >= 8,
        "AlignedBuffer cannot be used with buffers smaller than 8 "
        "bytes");

    static constexpr size_t SIZE = sz;

    AlignedBuffer()
    {
      Zero();
    }

    explicit AlignedBuffer(const byte_t* data)
    {
      std::memcpy(_data.data(), data, sz);
    }

    explicit AlignedBuffer(const std::array<byte_t, SIZE>& buf) : _data{buf}
    {}

    bool
    operator==(const AlignedBuffer& other) const
    {
      return _data == other._data;
    }

    bool
    operator!=(const AlignedBuffer& other) const
    {
      return _data != other._data;
    }

    bool
    operator<(const AlignedBuffer& other) const
    {
      return _data < other._data;
    }

    byte_t&
    operator[](size_t idx)
    {
      assert(idx < SIZE);
      return _data[idx];
    }

    const byte_t&
    operator[](size_t idx) const
    {
      assert(idx < SIZE);
      return _data[idx];
    }

    static constexpr size_t
    size()
    {
      return sz;
    }

    void
    Fill(byte_t f)
    {
      _data.fill(f);
    }

    byte_t*
    data()
    {
      return _data.data();
    }

    const byte_t*
    data() const
    {
      return _data.data();
    }

    bool
    IsZero() const
    {
      return std::all_of(_data.begin(), _data.end(), [](byte_t b) { return b == 0; });
    }

    void
    Zero()
    {
      _data.fill(0);
    }

    typename std::array<byte_t, SIZE>::iterator
    begin()
    {
      return _data.begin();
    }

    typename std::array<byte_t, SIZE>::iterator
    end()
    {
      return _data.end();
    }

    typename std::array<byte_t, SIZE>::const_iterator
    begin() const
    {
      return _data.cbegin();
    }

    typename std::array<byte_t, SIZE>::const_iterator
    end() const
    {
      return _data.cend();
    }

    ustring_view
    ToView() const
    {
      return {data(), sz};
    }

    std::string
    ToHex() const
    {
      return oxenc::to_hex(begin(), end());
    }

    bool
    FromHex(std::string_view str)
    {
      if (str.size() != 2 * sz or not oxenc::is_hex(str))
        return false;
      oxenc::from_hex(str.begin(), str.end(), begin());
      return true;
    }

   private:
    std::array<byte_t, SIZE> _data;
  };
}  // namespace mixprov
