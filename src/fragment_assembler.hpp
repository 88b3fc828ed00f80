#pragma once

#include "fragment.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

class File_writer;

enum class Assemble_result {
   //! The fragment was a whole file and has been written.
   written,
   //! The fragment completed a multi-fragment set and the file has been written.
   assembled,
   //! The fragment is held until the rest of its set arrives.
   pending,
   //! The path was already restored, the fragment was ignored.
   duplicate,
   //! The fragment carried decode warnings and was not merged.
   skipped
};

struct Unfinished_file {
   std::string path;
   std::size_t fragments = 0;
};

//! \brief Reassembles files from the fragments found across every volume of a backup.
//!
//! Each logical path is either absent, pending (some fragments seen) or completed.
//! Single fragment files are written as soon as they arrive. Fragments of split files
//! are held per path and, after every arrival, sorted by sequence number and tested;
//! when the numbering is 1..N without gaps and fragment N carries the last flag the
//! contents are concatenated in sequence order and written.
//!
//! One assembler is shared by every volume of a run, fragments of a file may arrive
//! from any volume in any order.
class Fragment_assembler {
public:
   explicit Fragment_assembler(File_writer& writer) noexcept;

   Fragment_assembler(const Fragment_assembler&) = delete;
   Fragment_assembler& operator=(const Fragment_assembler&) = delete;

   //! \brief Feeds a decoded fragment to the assembler.
   //!
   //! \exception std::runtime_error Thrown when writing a completed file fails. The
   //!                               path is then left pending (or absent).
   auto add(Fragment fragment) -> Assemble_result;

   //! \brief Paths still pending, sorted by path.
   auto unfinished_files() const -> std::vector<Unfinished_file>;

   //! \brief Sequence/last flag inconsistencies seen in pending sets.
   auto inconsistencies() const noexcept -> const std::vector<std::string>&;

   bool is_pending(std::string_view path) const;

   bool is_completed(std::string_view path) const;

private:
   void write_single(Fragment& fragment);

   void write_slices(const std::string& path, std::vector<Fragment>& slices);

   bool got_all_slices(std::vector<Fragment>& slices);

   void note_inconsistency(std::string message);

   File_writer& _writer;

   std::map<std::string, std::vector<Fragment>, std::less<>> _pending;
   std::unordered_set<std::string> _completed;
   std::vector<std::string> _inconsistencies;
};
