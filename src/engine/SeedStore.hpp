#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace ts::engine
{

// The seed directory: one "<display name>.torrent" per torrent that may
// still be seeding. Optionally mirrors archived files into a second
// directory that is never cleaned up.
class SeedStore
{
  public:
    SeedStore(std::filesystem::path seed_dir,
              std::filesystem::path torrent_file_dir, bool keep_torrent_files);

    std::filesystem::path const &directory() const noexcept
    {
        return seed_dir_;
    }

    // Path separators in `name` are replaced so the file stays inside the
    // seed directory.
    std::filesystem::path path_for(std::string_view name) const;
    bool contains(std::string_view name) const;

    // Writes `bytes` unless a seed file for `name` already exists. Returns
    // false only when nothing usable ended up on disk.
    bool archive(std::string_view name, std::span<std::uint8_t const> bytes,
                 std::error_code &ec);

    std::vector<std::uint8_t> load(std::string_view name,
                                   std::error_code &ec) const;

    // Deletes the seed file for `name`. Failures are logged, never thrown;
    // returns true when a file was removed.
    bool remove(std::string_view name) noexcept;

    // Every regular file in the seed directory, whatever its extension.
    std::vector<std::filesystem::path> list(std::error_code &ec) const;

  private:
    void mirror(std::string_view name, std::filesystem::path const &source);

    std::filesystem::path seed_dir_;
    std::filesystem::path torrent_file_dir_;
    bool keep_torrent_files_ = false;
};

} // namespace ts::engine
