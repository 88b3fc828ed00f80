#include "file_writer.hpp"

#include "test_helpers.hpp"

using namespace std::literals;

int main()
{
   test::Runner runner;

   runner.run("normalize_path"sv, [] {
      test::check(File_writer::normalize_path("\\DOS\\FORMAT.COM"sv) == "dos/format.com"s,
                  "backslashes and case");
      test::check(File_writer::normalize_path("README.TXT"sv) == "readme.txt"s,
                  "no directory");
      test::check(File_writer::normalize_path("\\\\A"sv) == "/a"s,
                  "only one leading slash is stripped");
      test::check(File_writer::normalize_path("\\X%01Y"sv) == "x%01y"s, "escapes kept");
   });

   runner.run("creates parent directories"sv, [] {
      test::Temp_dir dir{"writer_dirs"sv};
      File_writer writer{dir.path()};

      writer.write("\\UTIL\\DISK\\CHK.EXE"sv, test::to_bytes("chk"sv));
      writer.write("\\UTIL\\DISK\\FMT.EXE"sv, test::to_bytes("fmt"sv));

      test::check(test::read_file(dir.path() / "util/disk/chk.exe") == "chk"s, "first");
      test::check(test::read_file(dir.path() / "util/disk/fmt.exe") == "fmt"s, "second");
      test::check(writer.files_written() == 2, "count");
   });

   runner.run("existing directory is not an error"sv, [] {
      test::Temp_dir dir{"writer_existing"sv};
      std::filesystem::create_directories(dir.path() / "docs");

      File_writer writer{dir.path()};

      writer.write("\\DOCS\\A.TXT"sv, test::to_bytes("a"sv));

      test::check(test::read_file(dir.path() / "docs/a.txt") == "a"s, "written");
   });

   runner.run("identical rewrite is silent"sv, [] {
      test::Temp_dir dir{"writer_identical"sv};
      File_writer writer{dir.path()};

      writer.write("\\A.TXT"sv, test::to_bytes("same"sv));
      writer.write("\\a.txt"sv, test::to_bytes("same"sv));

      test::check(writer.content_changes().empty(), "no warning");
   });

   runner.run("different rewrite warns once"sv, [] {
      test::Temp_dir dir{"writer_changed"sv};
      File_writer writer{dir.path()};

      writer.write("\\A.TXT"sv, test::to_bytes("before"sv));
      writer.write("\\A.TXT"sv, test::to_bytes("after"sv));

      test::check(writer.content_changes().size() == 1, "one warning");
      test::check(writer.content_changes()[0] == "a.txt"s, writer.content_changes()[0]);
      test::check(test::read_file(dir.path() / "a.txt") == "after"s, "latest content");
   });

   runner.run("paths leaving the output directory are refused"sv, [] {
      test::Temp_dir dir{"writer_escape"sv};
      File_writer writer{dir.path() / "out"};

      test::check_throws<std::runtime_error>(
         [&] { writer.write("\\..\\EVIL.TXT"sv, test::to_bytes("x"sv)); }, "dot dot");
      test::check_throws<std::runtime_error>(
         [&] { writer.write("\\\\ABS.TXT"sv, test::to_bytes("x"sv)); }, "absolute");
      test::check_throws<std::runtime_error>(
         [&] { writer.write(""sv, test::to_bytes("x"sv)); }, "empty");

      test::check(!std::filesystem::exists(dir.path() / "evil.txt"), "nothing escaped");
      test::check(writer.files_written() == 0, "nothing written");
   });

   return runner.result();
}
