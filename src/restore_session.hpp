#pragma once

#include "fragment.hpp"
#include "fragment_assembler.hpp"
#include "volume_header.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

class File_writer;

auto read_volume_header_file(const std::filesystem::path& path) -> Volume_header;

auto read_fragment_file(const std::filesystem::path& path) -> Fragment;

struct Decoded_record {
   std::filesystem::path file;
   std::optional<Fragment> fragment;
   std::string error;
};

//! \brief Decodes fragment record files in parallel.
//!
//! \return One entry per input file, in the same order. Files that could not be read
//! or decoded have no fragment and a non-empty error.
auto decode_fragment_files(const std::vector<std::filesystem::path>& files)
   -> std::vector<Decoded_record>;

//! \brief Prints "<file> <description>" for every volume header and fragment record of
//! the volumes, without restoring anything. Records that can not be decoded are printed
//! as errors.
void list_volumes(const std::vector<std::filesystem::path>& headers);

struct Skipped_fragment {
   std::filesystem::path file;
   std::string description;
};

struct Restore_report {
   std::size_t volumes = 0;
   std::size_t volume_errors = 0;
   std::size_t files_written = 0;
   std::size_t fragments_skipped = 0;
   std::size_t duplicates = 0;
   std::size_t record_errors = 0;
   std::size_t inconsistencies = 0;
   std::size_t content_changes = 0;

   std::vector<Unfinished_file> unfinished;
};

//! \brief One restore run over any number of volumes of a backup set.
//!
//! Volumes are restored one at a time, in the order they are given. The fragment
//! records of a volume are decoded in parallel and then fed to the assembler in
//! sorted file order. Errors are reported and counted, they never end the run.
class Restore_session {
public:
   explicit Restore_session(File_writer& writer, bool verbose = false);

   Restore_session(const Restore_session&) = delete;
   Restore_session& operator=(const Restore_session&) = delete;

   //! \brief Restores the volume whose identification record is at header_path.
   //!
   //! \return False when the volume header could not be read or decoded, the volume's
   //!         fragments are then left alone.
   bool restore_volume(const std::filesystem::path& header_path);

   //! \brief Feeds one decoded fragment, read from source_file, to the assembler.
   void add_fragment(const std::filesystem::path& source_file, Fragment fragment);

   auto volumes() const noexcept
      -> const std::map<std::filesystem::path, Volume_header>&;

   auto skipped() const noexcept -> const std::vector<Skipped_fragment>&;

   auto report() const -> Restore_report;

   void print_report() const;

private:
   File_writer& _writer;
   const bool _verbose = false;

   Fragment_assembler _assembler;

   std::map<std::filesystem::path, Volume_header> _volumes;
   std::vector<Skipped_fragment> _skipped;

   std::size_t _volume_errors = 0;
   std::size_t _record_errors = 0;
   std::size_t _duplicates = 0;
};
