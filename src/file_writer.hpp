#pragma once

#include <gsl/gsl>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

//! \brief Writes restored files below an output directory.
//!
//! Every file written during the run is remembered, when a logical path is written a
//! second time with different contents a "content changed" warning is recorded.
class File_writer {
public:
   File_writer(const std::filesystem::path& path, bool verbose = false);

   //! \brief Writes the contents of a restored file.
   //!
   //! \param logical_path The path as stored in the backup, e.g. "\DOS\FORMAT.COM".
   //! \param contents The bytes of the file.
   //!
   //! \exception std::runtime_error Thrown when the path would leave the output
   //!                               directory or the file can not be written.
   void write(std::string_view logical_path, gsl::span<const std::byte> contents);

   //! \brief Maps a backup path to the relative output path, lower case with forward
   //! slashes and without a leading slash.
   static auto normalize_path(std::string_view logical_path) -> std::string;

   auto build_file_path(std::string_view normalized_path) const
      -> std::filesystem::path;

   void create_dir(const std::filesystem::path& directory);

   auto content_changes() const noexcept -> const std::vector<std::string>&;

   std::size_t files_written() const noexcept;

private:
   const std::filesystem::path _path;
   const bool _verbose = false;

   std::vector<std::filesystem::path> _created_dirs;
   std::unordered_map<std::string, std::vector<std::byte>> _written;
   std::vector<std::string> _content_changes;
   std::size_t _files_written = 0;
};
