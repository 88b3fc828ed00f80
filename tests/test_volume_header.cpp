#include "format_error.hpp"
#include "volume_header.hpp"

#include "test_helpers.hpp"

using namespace std::literals;

int main()
{
   test::Runner runner;

   runner.run("decodes not last volume"sv, [] {
      const auto record = test::header_record(0x00, 3, 1988, 17, 4);
      const auto header = read_volume_header(record);

      test::check(!header.last, "last flag");
      test::check(header.sequence == 3, "sequence");
      test::check(header.year == 1988, "year");
      test::check(header.day == 17, "day");
      test::check(header.month == 4, "month");
      test::check(header.warnings.empty(), "no warnings");
   });

   runner.run("decodes last volume"sv, [] {
      const auto header = read_volume_header(test::header_record(0xff, 0x0102));

      test::check(header.last, "last flag");
      test::check(header.sequence == 0x0102, "little-endian sequence");
   });

   runner.run("unrecognised flag is a format error"sv, [] {
      const auto record = test::header_record(0x01, 1);

      test::check_throws<Format_error>([&] { read_volume_header(record); }, "flag 0x01");
   });

   runner.run("wrong record size is a format error"sv, [] {
      auto record = test::header_record(0x00, 1);
      record.push_back(std::byte{0});

      test::check_throws<Format_error>([&] { read_volume_header(record); }, "129 bytes");

      record.resize(127);

      test::check_throws<Format_error>([&] { read_volume_header(record); }, "127 bytes");
   });

   runner.run("non-zero reserved byte is a warning"sv, [] {
      auto record = test::header_record(0x00, 1);
      record[10] = std::byte{42};

      const auto header = read_volume_header(record);

      test::check(header.warnings.size() == 1, "exactly one warning");
      test::check(header.warnings[0] == "unexpected non-zero at 10: 42"s, header.warnings[0]);
   });

   runner.run("every non-zero reserved byte is reported in order"sv, [] {
      auto record = test::header_record(0x00, 1);
      record[7] = std::byte{1};
      record[127] = std::byte{0xff};

      const auto header = read_volume_header(record);

      test::check(header.warnings.size() == 2, "two warnings");
      test::check(header.warnings[0] == "unexpected non-zero at 7: 1"s, header.warnings[0]);
      test::check(header.warnings[1] == "unexpected non-zero at 127: 255"s,
                  header.warnings[1]);
   });

   runner.run("describe"sv, [] {
      const auto last = read_volume_header(test::header_record(0xff, 2, 1988, 7, 4));

      test::check(describe(last) == "Disk 2 last, 1988-04-07"s, describe(last));

      auto record = test::header_record(0x00, 1, 1987, 30, 12);
      record[20] = std::byte{5};

      const auto warned = read_volume_header(record);

      test::check(describe(warned) ==
                     "Disk 1, 1987-12-30 ## (unexpected non-zero at 20: 5)"s,
                  describe(warned));
   });

   return runner.result();
}
