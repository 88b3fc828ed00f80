#include "volume_header.hpp"
#include "format_error.hpp"
#include "record_layout.hpp"
#include "record_reader.hpp"
#include "string_helpers.hpp"

#include <fmt/format.h>

namespace layout = record_layout::header;

auto read_volume_header(const gsl::span<const std::byte> bytes) -> Volume_header
{
   if (static_cast<std::size_t>(bytes.size()) != layout::size) {
      throw Format_error{fmt::format("Volume header is {} bytes, expected {}.",
                                     bytes.size(), layout::size)};
   }

   Record_reader reader{bytes};

   const auto flag = reader.read_uint8();

   if (!record_layout::is_valid_flag(flag)) {
      throw Format_error{
         fmt::format("Unrecognised volume header flag value 0x{:02x}.", flag)};
   }

   Volume_header header;

   header.last = record_layout::is_last_flag(flag);
   header.sequence = reader.read_uint16_le();
   header.year = reader.read_uint16_le();
   header.day = reader.read_uint8();
   header.month = reader.read_uint8();

   Ensures(reader.head() == layout::reserved_offset);

   while (reader) {
      const auto offset = reader.head();
      const auto value = reader.read_uint8();

      if (value != 0) {
         header.warnings.emplace_back(
            fmt::format("unexpected non-zero at {}: {}", offset, value));
      }
   }

   return header;
}

auto describe(const Volume_header& header) -> std::string
{
   auto description = fmt::format("Disk {}", header.sequence);

   if (header.last) description += " last";

   description += fmt::format(", {:4}-{:02}-{:02}", header.year, header.month, header.day);

   append_warnings(description, header.warnings);

   return description;
}
