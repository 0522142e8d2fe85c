#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <system_error>
#include <vector>

namespace ts::utils
{

// <tmp>/torrent-stream-server; the default DOWNLOAD_DIR.
std::filesystem::path default_download_root();

bool ensure_directory(std::filesystem::path const &path,
                      std::error_code &ec);

std::vector<std::uint8_t> read_file_bytes(std::filesystem::path const &path,
                                          std::error_code &ec);

// Writes to `<target>.tmp`, fsyncs, then renames over `target`.
bool write_file_atomic(std::filesystem::path const &target,
                       std::span<std::uint8_t const> data,
                       std::error_code &ec);

// Removes every entry of `root` except the ones listed in `keep`. Missing
// roots are not an error.
void empty_directory(std::filesystem::path const &root,
                     std::vector<std::filesystem::path> const &keep,
                     std::error_code &ec);

} // namespace ts::utils
