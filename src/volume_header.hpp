#pragma once

#include <gsl/gsl>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

//! \brief The identification record (BACKUPID.@@@) found on every backup volume.
struct Volume_header {
   bool last = false;
   std::uint16_t sequence = 0;
   std::uint16_t year = 0;
   std::uint8_t day = 0;
   std::uint8_t month = 0;

   std::vector<std::string> warnings;
};

//! \brief Decodes a volume identification record.
//!
//! \param bytes The record, exactly 128 bytes long.
//!
//! \return The decoded header. Non-zero bytes in the reserved area are recorded in
//!         Volume_header::warnings.
//!
//! \exception Format_error Thrown when the record is not 128 bytes long or the flag
//!                         byte is neither 0x00 nor 0xFF.
auto read_volume_header(const gsl::span<const std::byte> bytes) -> Volume_header;

//! \brief Produces a one line description of a header, like "Disk 2 last, 1988-04-17".
auto describe(const Volume_header& header) -> std::string;
