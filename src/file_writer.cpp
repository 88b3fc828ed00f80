#include "file_writer.hpp"
#include "string_helpers.hpp"
#include "synced_cout.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;
using namespace std::literals;

namespace {

bool escapes_root(const fs::path& relative_path) noexcept
{
   if (relative_path.empty() || relative_path.has_root_path()) return true;

   return std::any_of(relative_path.begin(), relative_path.end(),
                      [](const fs::path& part) { return part == ".."; });
}
}

File_writer::File_writer(const fs::path& path, bool verbose)
   : _path{path.lexically_normal()}, _verbose{verbose}
{
   fs::create_directories(_path);
}

void File_writer::write(std::string_view logical_path, gsl::span<const std::byte> contents)
{
   const auto normalized = normalize_path(logical_path);
   const fs::path relative{normalized};

   if (escapes_root(relative)) {
      throw std::runtime_error{fmt::format(
         "Refusing to write '{}' outside of the output directory.", logical_path)};
   }

   const auto path = build_file_path(normalized);

   create_dir(relative.parent_path());

   if (_verbose) {
      synced_cout::print("Info: Saving file "s, path.string(), '\n');
   }

   std::ofstream file{path, std::ios::binary | std::ios::trunc};

   if (!file) {
      throw std::runtime_error{fmt::format("Unable to open '{}' for writing.", path.string())};
   }

   file.write(reinterpret_cast<const char*>(contents.data()),
              static_cast<std::streamsize>(contents.size()));

   if (!file) {
      throw std::runtime_error{fmt::format("Unable to write '{}'.", path.string())};
   }

   ++_files_written;

   std::vector<std::byte> bytes{contents.begin(), contents.end()};

   const auto before = _written.find(normalized);

   if (before == _written.end()) {
      _written.emplace(normalized, std::move(bytes));

      return;
   }

   if (before->second != bytes) {
      _content_changes.emplace_back(normalized);

      synced_cout::print("Warning: content changed on: "s, normalized, '\n');

      before->second = std::move(bytes);
   }
}

auto File_writer::normalize_path(std::string_view logical_path) -> std::string
{
   auto normalized = to_lower_ascii(std::string{logical_path});

   replace_char(normalized, '\\', '/');

   if (!normalized.empty() && normalized.front() == '/') normalized.erase(0, 1);

   return normalized;
}

auto File_writer::build_file_path(std::string_view normalized_path) const -> fs::path
{
   return _path / fs::path{normalized_path};
}

void File_writer::create_dir(const fs::path& directory)
{
   if (directory.empty()) return;

   const auto dir_result =
      std::find(std::cbegin(_created_dirs), std::cend(_created_dirs), directory);

   if (dir_result != std::cend(_created_dirs)) return;

   fs::create_directories(_path / directory);

   _created_dirs.emplace_back(directory);
}

auto File_writer::content_changes() const noexcept -> const std::vector<std::string>&
{
   return _content_changes;
}

std::size_t File_writer::files_written() const noexcept
{
   return _files_written;
}
