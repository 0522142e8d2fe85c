#pragma once

#include <libtorrent/add_torrent_params.hpp>
#include <libtorrent/error_code.hpp>
#include <libtorrent/sha1_hash.hpp>
#include <libtorrent/torrent_handle.hpp>
#include <libtorrent/torrent_info.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ts::engine {

constexpr int kSha1Bytes = static_cast<int>(libtorrent::sha1_hash::size());

inline int hex_digit_value(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

inline std::optional<libtorrent::sha1_hash> sha1_from_hex(std::string_view value) {
  if (value.size() != static_cast<std::size_t>(kSha1Bytes * 2)) {
    return std::nullopt;
  }
  libtorrent::sha1_hash result;
  for (int i = 0; i < kSha1Bytes; ++i) {
    int high = hex_digit_value(value[2 * i]);
    int low = hex_digit_value(value[2 * i + 1]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    result[i] = static_cast<std::uint8_t>((high << 4) | low);
  }
  return result;
}

inline std::string info_hash_to_hex(libtorrent::sha1_hash const &hash) {
  constexpr char kHexDigits[] = "0123456789abcdef";
  std::string result;
  result.reserve(kSha1Bytes * 2);
  for (int i = 0; i < kSha1Bytes; ++i) {
    auto byte = static_cast<unsigned char>(hash[i]);
    result.push_back(kHexDigits[byte >> 4]);
    result.push_back(kHexDigits[byte & 0x0F]);
  }
  return result;
}

// Content identifiers are v1 (SHA-1 over the info dictionary); v2-only
// torrents fall back to the truncated v2 hash.
inline std::string info_hash_to_hex(libtorrent::info_hash_t const &info) {
  if (info.has_v1()) {
    return info_hash_to_hex(info.v1);
  }
  return info_hash_to_hex(info.get_best());
}

inline bool hash_is_nonzero(libtorrent::sha1_hash const &hash) {
  return !hash.is_all_zeros();
}

// A bare 40-char hex info-hash, as accepted in place of a magnet link.
inline bool is_info_hash_hex(std::string_view value) {
  return sha1_from_hex(value).has_value();
}

inline std::string magnet_for_info_hash(std::string_view hex) {
  std::string uri = "magnet:?xt=urn:btih:";
  for (char ch : hex) {
    uri.push_back(ch >= 'A' && ch <= 'F' ? static_cast<char>(ch - 'A' + 'a')
                                         : ch);
  }
  return uri;
}

inline std::optional<std::string> info_hash_from_params(
    libtorrent::add_torrent_params const &params) {
  if (hash_is_nonzero(params.info_hashes.get_best())) {
    return info_hash_to_hex(params.info_hashes);
  }
  if (params.ti && hash_is_nonzero(params.ti->info_hashes().get_best())) {
    return info_hash_to_hex(params.ti->info_hashes());
  }
  return std::nullopt;
}

inline std::optional<std::string> hash_from_handle(libtorrent::torrent_handle const &handle) {
  if (!handle.is_valid()) {
    return std::nullopt;
  }
  auto const hashes = handle.info_hashes();
  if (!hash_is_nonzero(hashes.get_best())) {
    return std::nullopt;
  }
  return info_hash_to_hex(hashes);
}

// Adding a torrent the session already has. libtorrent reports it with
// duplicate_torrent; older builds and wrapped errors only carry the text.
inline bool is_duplicate_add_error(libtorrent::error_code const &ec) {
  if (!ec) {
    return false;
  }
  if (ec == libtorrent::errors::duplicate_torrent) {
    return true;
  }
  auto message = ec.message();
  std::transform(message.begin(), message.end(), message.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return message.find("duplicate") != std::string::npos ||
         message.find("already exists") != std::string::npos;
}

} // namespace ts::engine
