#include "record_reader.hpp"

#include <fmt/format.h>

#include <stdexcept>

Record_reader::Record_reader(const gsl::span<const std::byte> bytes) noexcept
   : _bytes{bytes}
{
}

std::uint8_t Record_reader::read_uint8()
{
   check_head(_head + 1);

   const auto value = std::to_integer<std::uint8_t>(_bytes[_head]);

   _head += 1;

   return value;
}

std::uint16_t Record_reader::read_uint16_le()
{
   check_head(_head + 2);

   const auto low = std::to_integer<std::uint16_t>(_bytes[_head]);
   const auto high = std::to_integer<std::uint16_t>(_bytes[_head + 1]);

   _head += 2;

   return static_cast<std::uint16_t>((high << 8) | low);
}

auto Record_reader::read_bytes(const std::size_t size) -> gsl::span<const std::byte>
{
   check_head(_head + size);

   const auto bytes = _bytes.subspan(_head, size);

   _head += size;

   return bytes;
}

auto Record_reader::read_rest() noexcept -> gsl::span<const std::byte>
{
   const auto bytes = _bytes.subspan(_head);

   _head = this->size();

   return bytes;
}

auto Record_reader::read_rest_copy() -> std::vector<std::byte>
{
   const auto bytes = read_rest();

   return {bytes.begin(), bytes.end()};
}

void Record_reader::seek(const std::size_t offset)
{
   check_head(offset);

   _head = offset;
}

Record_reader::operator bool() const noexcept
{
   return (_head < size());
}

std::size_t Record_reader::head() const noexcept
{
   return _head;
}

std::size_t Record_reader::size() const noexcept
{
   return static_cast<std::size_t>(_bytes.size());
}

void Record_reader::check_head(const std::size_t new_head) const
{
   if (new_head > size()) {
      throw std::runtime_error{fmt::format(
         "Attempt to read past end of record (offset {}, record size {}).", new_head,
         size())};
   }
}
