#include "fragment_assembler.hpp"
#include "file_writer.hpp"
#include "synced_cout.hpp"

#include <fmt/format.h>
#include <gsl/gsl>

#include <algorithm>
#include <numeric>

using namespace std::literals;

Fragment_assembler::Fragment_assembler(File_writer& writer) noexcept : _writer{writer}
{
}

auto Fragment_assembler::add(Fragment fragment) -> Assemble_result
{
   if (!fragment.warnings.empty()) return Assemble_result::skipped;

   if (is_completed(fragment.path)) return Assemble_result::duplicate;

   // Whole files never enter the pending state.
   if (fragment.is_complete()) {
      const auto pending = _pending.find(fragment.path);

      if (pending != _pending.end()) {
         note_inconsistency(fmt::format("{}: complete fragment replaces {} pending fragments",
                                        fragment.path, pending->second.size()));
      }

      write_single(fragment);

      if (pending != _pending.end()) _pending.erase(pending);

      _completed.insert(std::move(fragment.path));

      return Assemble_result::written;
   }

   const auto entry = _pending.try_emplace(fragment.path).first;
   auto& slices = entry->second;

   slices.push_back(std::move(fragment));

   if (!got_all_slices(slices)) return Assemble_result::pending;

   const auto path = entry->first;

   write_slices(path, slices);

   _pending.erase(entry);
   _completed.insert(path);

   return Assemble_result::assembled;
}

auto Fragment_assembler::unfinished_files() const -> std::vector<Unfinished_file>
{
   std::vector<Unfinished_file> unfinished;
   unfinished.reserve(_pending.size());

   for (const auto& [path, slices] : _pending) {
      unfinished.push_back({path, slices.size()});
   }

   return unfinished;
}

auto Fragment_assembler::inconsistencies() const noexcept
   -> const std::vector<std::string>&
{
   return _inconsistencies;
}

bool Fragment_assembler::is_pending(std::string_view path) const
{
   return _pending.find(path) != _pending.end();
}

bool Fragment_assembler::is_completed(std::string_view path) const
{
   return _completed.count(std::string{path}) != 0;
}

void Fragment_assembler::write_single(Fragment& fragment)
{
   _writer.write(fragment.path, fragment.content);
}

void Fragment_assembler::write_slices(const std::string& path,
                                      std::vector<Fragment>& slices)
{
   Expects(!slices.empty());

   const auto total_size =
      std::accumulate(slices.cbegin(), slices.cend(), std::size_t{0},
                      [](std::size_t size, const Fragment& slice) {
                         return size + slice.content.size();
                      });

   std::vector<std::byte> contents;
   contents.reserve(total_size);

   for (const auto& slice : slices) {
      contents.insert(contents.end(), slice.content.cbegin(), slice.content.cend());
   }

   _writer.write(path, contents);
}

bool Fragment_assembler::got_all_slices(std::vector<Fragment>& slices)
{
   Expects(!slices.empty());

   std::stable_sort(slices.begin(), slices.end(),
                    [](const Fragment& left, const Fragment& right) {
                       return left.sequence < right.sequence;
                    });

   for (std::size_t i = 0; i < slices.size(); ++i) {
      if (static_cast<std::size_t>(slices[i].sequence) != i + 1) return false;

      // Tolerated, the set may still complete.
      if (slices[i].last && i != slices.size() - 1) {
         note_inconsistency(
            fmt::format("{}: fragment {} is marked last but is not the final fragment",
                        slices[i].path, slices[i].sequence));
      }
   }

   return slices.back().last;
}

void Fragment_assembler::note_inconsistency(std::string message)
{
   if (std::find(_inconsistencies.cbegin(), _inconsistencies.cend(), message) !=
       _inconsistencies.cend()) {
      return;
   }

   synced_cout::print("Warning: inconsistent: "s, message, '\n');

   _inconsistencies.push_back(std::move(message));
}
