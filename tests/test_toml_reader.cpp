#include "minitest.hpp"
#include "util/TomlReader.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

static std::string tmp_path(const char* suffix) {
  return (std::filesystem::temp_directory_path() /
          ("iorate_test_toml_" + std::to_string(::getpid()) + "_" + suffix + ".toml")).string();
}

TEST(toml_load_missing_file) {
  iorate::util::TomlReader tr;
  ASSERT_FALSE(tr.load(tmp_path("nonexistent")));
}

TEST(toml_load_sections_and_types) {
  auto path = tmp_path("basic");
  std::ofstream(path) <<
    "# iorate defaults\n"
    "[report]\n"
    "extended = true\n"
    "unit = \"mb\"   # trailing comment\n"
    "\n"
    "[sampling]\n"
    "interval = 2.5\n"
    "count = 10\n";
  iorate::util::TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_TRUE(tr.get_bool("report", "extended").value_or(false));
  ASSERT_EQ(tr.get_string("report", "unit"), "mb");
  ASSERT_NEAR(tr.get_double("sampling", "interval").value_or(0.0), 2.5, 1e-12);
  ASSERT_EQ(tr.get_int("sampling", "count").value_or(-1), 10);
  ASSERT_TRUE(tr.bad_lines().empty());
  std::filesystem::remove(path);
}

TEST(toml_missing_and_mistyped_values) {
  std::istringstream in("[sampling]\ncount = many\ninterval = 1s\n[report]\nextended = sometimes\n");
  iorate::util::TomlReader tr;
  ASSERT_TRUE(tr.parse(in));
  ASSERT_TRUE(tr.has("sampling", "count"));
  ASSERT_FALSE(tr.get_int("sampling", "count").has_value());
  ASSERT_FALSE(tr.get_double("sampling", "interval").has_value());
  ASSERT_FALSE(tr.get_bool("report", "extended").has_value());
  ASSERT_FALSE(tr.has("report", "unit"));
  ASSERT_EQ(tr.get_string("nosection", "key", "nope"), "nope");
}

TEST(toml_records_malformed_lines) {
  std::istringstream in("[report\nno equals sign\n= value\n[report]\nunit = \"kb\"\n");
  iorate::util::TomlReader tr;
  ASSERT_TRUE(tr.parse(in));
  ASSERT_EQ(tr.bad_lines().size(), 3u);
  ASSERT_EQ(tr.bad_lines()[0], 1);
  ASSERT_EQ(tr.get_string("report", "unit"), "kb");
}

TEST(toml_hash_inside_quotes_is_kept) {
  std::istringstream in("[report]\nshow = \"cpu#1\" # comment\n");
  iorate::util::TomlReader tr;
  ASSERT_TRUE(tr.parse(in));
  ASSERT_EQ(tr.get_string("report", "show"), "cpu#1");
}
