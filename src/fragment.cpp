#include "fragment.hpp"
#include "format_error.hpp"
#include "record_layout.hpp"
#include "record_reader.hpp"
#include "string_helpers.hpp"

#include <fmt/format.h>

#include <algorithm>

using namespace std::literals;

namespace layout = record_layout::fragment;

namespace {

bool is_printable_ascii(const std::byte b) noexcept
{
   return b >= std::byte{0x20} && b < std::byte{0x80};
}

auto read_path(Record_reader& reader, std::vector<std::string>& warnings) -> std::string
{
   reader.seek(layout::path_length_offset);

   const std::size_t path_length = reader.read_uint8();

   if (path_length == 0 || path_length > layout::max_path_length) {
      warnings.emplace_back(fmt::format("unexpected file path len: {}", path_length));

      return std::string{layout::bad_path};
   }

   reader.seek(layout::path_offset);

   auto raw_path = reader.read_bytes(path_length);

   // Trailing terminator.
   if (raw_path[raw_path.size() - 1] == std::byte{0}) {
      raw_path = raw_path.first(raw_path.size() - 1);
   }

   if (raw_path.empty()) {
      warnings.emplace_back("empty file path"s);

      return std::string{layout::bad_path};
   }

   return decode_logical_path(raw_path).text;
}
}

auto decode_logical_path(const gsl::span<const std::byte> raw_path) -> Decoded_path
{
   if (std::all_of(raw_path.begin(), raw_path.end(), is_printable_ascii)) {
      std::string text;
      text.reserve(static_cast<std::size_t>(raw_path.size()));

      for (const auto b : raw_path) text += std::to_integer<char>(b);

      return {std::move(text), Path_encoding::ascii};
   }

   std::string text;
   text.reserve(static_cast<std::size_t>(raw_path.size()) * 3);

   for (const auto b : raw_path) {
      if (is_printable_ascii(b)) {
         text += std::to_integer<char>(b);
      }
      else {
         text += fmt::format("%{:02x}", std::to_integer<unsigned int>(b));
      }
   }

   return {std::move(text), Path_encoding::escaped};
}

auto read_fragment(const gsl::span<const std::byte> bytes) -> Fragment
{
   if (static_cast<std::size_t>(bytes.size()) < layout::content_offset) {
      throw Format_error{fmt::format("Fragment record is {} bytes, expected at least {}.",
                                     bytes.size(), layout::content_offset)};
   }

   Record_reader reader{bytes};
   Fragment fragment;

   const auto flag = reader.read_uint8();

   fragment.last = record_layout::is_last_flag(flag);
   fragment.sequence = reader.read_uint16_le();
   fragment.unknown = reader.read_uint16_le();
   fragment.path = read_path(reader, fragment.warnings);

   if (!record_layout::is_valid_flag(flag)) {
      fragment.warnings.emplace_back(
         fmt::format("{}: unexpected flag value 0x{:02x}", fragment.path, flag));
   }

   reader.seek(layout::content_offset);
   fragment.content = reader.read_rest_copy();

   return fragment;
}

auto describe(const Fragment& fragment) -> std::string
{
   std::string status;

   if (fragment.is_complete()) {
      status = "complete"s;
   }
   else {
      status = fmt::format("seq {}", fragment.sequence);

      if (fragment.last) status += " last"sv;
   }

   auto description = fmt::format("{} ({})", fragment.path, status);

   append_warnings(description, fragment.warnings);

   return description;
}
