#include "restore_session.hpp"
#include "file_writer.hpp"
#include "mapped_file.hpp"
#include "synced_cout.hpp"
#include "volume_scanner.hpp"

#include "tbb/parallel_for.h"

#include <fmt/format.h>

#include <exception>

namespace fs = std::filesystem;
using namespace std::literals;

auto read_volume_header_file(const fs::path& path) -> Volume_header
{
   const Mapped_file file{path};

   return read_volume_header(file.bytes());
}

auto read_fragment_file(const fs::path& path) -> Fragment
{
   const Mapped_file file{path};

   return read_fragment(file.bytes());
}

auto decode_fragment_files(const std::vector<fs::path>& files)
   -> std::vector<Decoded_record>
{
   std::vector<Decoded_record> records(files.size());

   tbb::parallel_for(std::size_t{0}, files.size(), [&](const std::size_t i) {
      auto& record = records[i];

      record.file = files[i];

      try {
         record.fragment = read_fragment_file(files[i]);
      }
      catch (std::exception& e) {
         record.error = e.what();
      }
   });

   return records;
}

void list_volumes(const std::vector<fs::path>& headers)
{
   for (const auto& header_path : headers) {
      try {
         synced_cout::print(header_path.string(), ' ',
                            describe(read_volume_header_file(header_path)), '\n');

         const auto records =
            decode_fragment_files(list_fragment_files(header_path.parent_path()));

         for (const auto& record : records) {
            if (record.fragment) {
               synced_cout::print(record.file.string(), ' ', describe(*record.fragment),
                                  '\n');
            }
            else {
               synced_cout::print("Error: "s, record.file.string(), ": "s, record.error,
                                  '\n');
            }
         }
      }
      catch (std::exception& e) {
         synced_cout::print(
            "Error: Exception occured while listing volume.\n   Volume: "s,
            header_path.string(), '\n', "   Message: "s, e.what(), '\n');
      }
   }
}

Restore_session::Restore_session(File_writer& writer, bool verbose)
   : _writer{writer}, _verbose{verbose}, _assembler{writer}
{
}

bool Restore_session::restore_volume(const fs::path& header_path)
{
   try {
      const auto header = read_volume_header_file(header_path);

      if (!header.warnings.empty()) {
         synced_cout::print("Warning: "s, header_path.string(), ' ', describe(header),
                            '\n');
      }
      else if (_verbose) {
         synced_cout::print("Info: "s, header_path.string(), ' ', describe(header), '\n');
      }

      auto records = decode_fragment_files(list_fragment_files(header_path.parent_path()));

      for (auto& record : records) {
         if (!record.fragment) {
            synced_cout::print(
               "Error: Exception occured while reading fragment.\n   File: "s,
               record.file.string(), '\n', "   Message: "s, record.error, '\n');

            ++_record_errors;

            continue;
         }

         add_fragment(record.file, std::move(*record.fragment));
      }

      _volumes.insert_or_assign(header_path, header);
   }
   catch (std::exception& e) {
      synced_cout::print("Error: Exception occured while processing volume.\n   Volume: "s,
                         header_path.string(), '\n', "   Message: "s, e.what(), '\n');

      ++_volume_errors;

      return false;
   }

   return true;
}

void Restore_session::add_fragment(const fs::path& source_file, Fragment fragment)
{
   auto description = describe(fragment);

   try {
      switch (_assembler.add(std::move(fragment))) {
      case Assemble_result::skipped:
         synced_cout::print("SKIPPING: "s, source_file.string(), ' ', description, '\n');

         _skipped.push_back({source_file, std::move(description)});
         break;
      case Assemble_result::duplicate:
         ++_duplicates;

         if (_verbose) {
            synced_cout::print("Info: Already restored, ignoring "s, source_file.string(),
                               ' ', description, '\n');
         }
         break;
      case Assemble_result::pending:
         if (_verbose) {
            synced_cout::print("Info: Holding "s, source_file.string(), ' ', description,
                               '\n');
         }
         break;
      case Assemble_result::written:
      case Assemble_result::assembled:
         break;
      }
   }
   catch (std::exception& e) {
      synced_cout::print("Error: Exception occured while restoring fragment.\n   File: "s,
                         source_file.string(), '\n', "   Message: "s, e.what(), '\n');

      ++_record_errors;
   }
}

auto Restore_session::volumes() const noexcept -> const std::map<fs::path, Volume_header>&
{
   return _volumes;
}

auto Restore_session::skipped() const noexcept -> const std::vector<Skipped_fragment>&
{
   return _skipped;
}

auto Restore_session::report() const -> Restore_report
{
   Restore_report report;

   report.volumes = _volumes.size();
   report.volume_errors = _volume_errors;
   report.files_written = _writer.files_written();
   report.fragments_skipped = _skipped.size();
   report.duplicates = _duplicates;
   report.record_errors = _record_errors;
   report.inconsistencies = _assembler.inconsistencies().size();
   report.content_changes = _writer.content_changes().size();
   report.unfinished = _assembler.unfinished_files();

   return report;
}

void Restore_session::print_report() const
{
   const auto report = this->report();

   if (!report.unfinished.empty()) {
      synced_cout::print("Unfinished files:\n"s);

      for (const auto& file : report.unfinished) {
         synced_cout::print_line("    {} ({} fragments)", file.path, file.fragments);
      }
   }

   synced_cout::print_line(
      "Restored {} files from {} volumes. {} unfinished, {} skipped fragments, "
      "{} duplicates, {} inconsistencies, {} content changes, {} volume errors, "
      "{} record errors.",
      report.files_written, report.volumes, report.unfinished.size(),
      report.fragments_skipped, report.duplicates, report.inconsistencies,
      report.content_changes, report.volume_errors, report.record_errors);
}
