#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

// Byte layout of the records written by the DOS 2.x BACKUP command.

namespace record_layout {

enum class Flag : std::uint8_t { not_last = 0x00, last = 0xff };

constexpr bool is_valid_flag(const std::uint8_t value) noexcept
{
   return value == static_cast<std::uint8_t>(Flag::not_last) ||
          value == static_cast<std::uint8_t>(Flag::last);
}

constexpr bool is_last_flag(const std::uint8_t value) noexcept
{
   return value == static_cast<std::uint8_t>(Flag::last);
}

namespace header {

constexpr std::size_t size = 128;

constexpr std::size_t flag_offset = 0;
constexpr std::size_t sequence_offset = 1;
constexpr std::size_t year_offset = 3;
constexpr std::size_t day_offset = 5;
constexpr std::size_t month_offset = 6;
constexpr std::size_t reserved_offset = 7;

constexpr std::string_view file_name = "BACKUPID.@@@";
}

namespace fragment {

constexpr std::size_t flag_offset = 0;
constexpr std::size_t sequence_offset = 1;
constexpr std::size_t unknown_offset = 3;
constexpr std::size_t path_offset = 5;
constexpr std::size_t path_length_offset = 0x53;
constexpr std::size_t content_offset = 0x80;

constexpr std::size_t max_path_length = 78;

static_assert(path_offset + max_path_length <= path_length_offset,
              "Path bytes must not overlap the path length byte.");

constexpr std::string_view bad_path = "bad_file";
}
}
