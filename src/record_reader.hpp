#pragma once

#include <gsl/gsl>

#include <cstddef>
#include <cstdint>
#include <vector>

//! \brief The class used for reading the fixed fields of backup records.
//!
//! Each reader represents a non-owning view at one record (a volume header or a
//! fragment record). A reader holds only one piece of mutable state and that is the
//! offset to the next unread byte. When a reader is copied, this offset is also copied.
//! It can be moved to any offset inside the record by calling Record_reader::seek.
//!
//! Multi-byte values in the backup format are little-endian, the `read_*` functions
//! decode them explicitly so the reader does not depend on the host byte order.
class Record_reader {
public:
   Record_reader() = delete;

   //! \brief Creates a Record_reader from a span of memory.
   //!
   //! \param bytes The span of memory holding the record.
   explicit Record_reader(const gsl::span<const std::byte> bytes) noexcept;

   //! \brief Reads a single byte from the record.
   //!
   //! \exception std::runtime_error Thrown when reading the value would go past the end
   //!                               of the record.
   std::uint8_t read_uint8();

   //! \brief Reads a little-endian 16-bit value from the record.
   //!
   //! \exception std::runtime_error Thrown when reading the value would go past the end
   //!                               of the record.
   std::uint16_t read_uint16_le();

   //! \brief Reads a variable-length array of bytes from the record.
   //!
   //! \param size The number of bytes to read.
   //!
   //! \return A non-owning span of the bytes.
   //!
   //! \exception std::runtime_error Thrown when reading the array would go past the end
   //!                               of the record.
   auto read_bytes(const std::size_t size) -> gsl::span<const std::byte>;

   //! \brief Reads every byte from the read head to the end of the record.
   auto read_rest() noexcept -> gsl::span<const std::byte>;

   //! \brief Reads every byte from the read head to the end of the record into an
   //! owning buffer.
   auto read_rest_copy() -> std::vector<std::byte>;

   //! \brief Moves the read head to an absolute offset inside the record.
   //!
   //! \exception std::runtime_error Thrown when the offset is past the end of the
   //!                               record.
   void seek(const std::size_t offset);

   //! \brief Tests if the end of the record has been reached or not.
   explicit operator bool() const noexcept;

   std::size_t head() const noexcept;

   std::size_t size() const noexcept;

private:
   void check_head(const std::size_t new_head) const;

   gsl::span<const std::byte> _bytes;
   std::size_t _head = 0;
};
