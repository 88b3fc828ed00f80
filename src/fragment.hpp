#pragma once

#include <gsl/gsl>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

//! \brief One file record from a backup volume, holding all or part of a file.
struct Fragment {
   bool last = false;
   std::uint16_t sequence = 0;
   std::uint16_t unknown = 0;

   std::string path;
   std::vector<std::byte> content;

   std::vector<std::string> warnings;

   //! \brief A fragment that is both the first and the last piece of its file.
   bool is_complete() const noexcept
   {
      return last && sequence == 1;
   }
};

enum class Path_encoding { ascii, escaped };

struct Decoded_path {
   std::string text;
   Path_encoding encoding = Path_encoding::ascii;
};

//! \brief Decodes the raw path bytes of a fragment record.
//!
//! Paths made only of printable 7-bit ASCII are returned as is. Otherwise every byte
//! that is not printable ASCII is replaced with "%xx", xx being its value in lowercase
//! hex, so the result is always printable text.
auto decode_logical_path(const gsl::span<const std::byte> raw_path) -> Decoded_path;

//! \brief Decodes a fragment record.
//!
//! Malformed metadata (an unexpected flag value, a path length outside 1..78) is
//! recorded in Fragment::warnings rather than thrown, a fragment with a bad path
//! length gets the path "bad_file".
//!
//! \param bytes The whole record, at least 0x80 bytes long.
//!
//! \exception Format_error Thrown when the record is too small to hold the fixed
//!                         fields.
auto read_fragment(const gsl::span<const std::byte> bytes) -> Fragment;

//! \brief Produces a one line description of a fragment, like "\DOS\SYS.COM (seq 2)".
auto describe(const Fragment& fragment) -> std::string;
