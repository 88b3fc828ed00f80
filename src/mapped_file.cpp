#include "mapped_file.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

struct Raii_fd {
   explicit Raii_fd(int fd) noexcept : fd{fd} {}

   ~Raii_fd() noexcept
   {
      if (fd >= 0) close(fd);
   }

   Raii_fd(const Raii_fd&) = delete;
   Raii_fd& operator=(const Raii_fd&) = delete;

   int fd;
};

auto errno_message(const fs::path& path, const char* what) -> std::string
{
   return fmt::format("{} '{}': {}", what, path.string(), std::strerror(errno));
}
}

Mapped_file::Mapped_file(const fs::path& path)
{
   if (!fs::exists(path) || fs::is_directory(path)) {
      throw std::runtime_error{fmt::format("File '{}' does not exist.", path.string())};
   }

   _size = static_cast<std::size_t>(fs::file_size(path));

   if (_size == 0) return;

   const auto path_string = path.string();

   Raii_fd file{open(path_string.c_str(), O_RDONLY)};

   if (file.fd < 0) throw std::runtime_error{errno_message(path, "Unable to open")};

   void* const mapping = mmap(nullptr, _size, PROT_READ, MAP_PRIVATE, file.fd, 0);

   if (mapping == MAP_FAILED) {
      throw std::runtime_error{errno_message(path, "Unable to map")};
   }

   const auto size = _size;

   _view.reset(static_cast<const std::byte*>(mapping), [size](const std::byte* ptr) {
      munmap(const_cast<std::byte*>(ptr), size);
   });
}

gsl::span<const std::byte> Mapped_file::bytes() const noexcept
{
   return {_view.get(), _size};
}
