#include "minitest.hpp"
#include "util/TomlReader.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using tessera::util::TomlReader;

static std::string tmp_path(const char* suffix) {
  return (std::filesystem::temp_directory_path() /
          ("tessera_test_toml_" + std::to_string(::getpid()) + "_" + suffix + ".toml")).string();
}

static void write_file(const std::string& path, const std::string& content) {
  std::ofstream f(path);
  f << content;
}

static void remove_file(const std::string& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

TEST(toml_load_missing_file) {
  TomlReader tr;
  tr.load_string("[a]\nb = 1\n");
  ASSERT_TRUE(!tr.load(tmp_path("nonexistent")));
  ASSERT_TRUE(!tr.has("a", "b"));
}

TEST(toml_load_basic) {
  auto path = tmp_path("basic");
  write_file(path,
    "[terminal]\n"
    "alt_screen = true\n"
    "title = \"%H:%M\"\n"
    "\n"
    "[pool]\n"
    "initial_size = 3\n"
    "max_size = 12\n"
  );
  TomlReader tr;
  ASSERT_TRUE(tr.load(path));
  ASSERT_EQ(tr.get_bool("terminal", "alt_screen", false), true);
  ASSERT_EQ(tr.get_string("terminal", "title"), "%H:%M");
  ASSERT_EQ(tr.get_int("pool", "initial_size"), 3);
  ASSERT_EQ(tr.get_int("pool", "max_size"), 12);
  remove_file(path);
}

TEST(toml_defaults_for_missing_keys) {
  TomlReader tr;
  tr.load_string("[terminal]\nalt_screen = true\n");
  ASSERT_EQ(tr.get_string("terminal", "missing_key", "fallback"), "fallback");
  ASSERT_EQ(tr.get_int("terminal", "missing_int", 42), 42);
  ASSERT_EQ(tr.get_bool("terminal", "missing_bool", true), true);
  // Missing section entirely
  ASSERT_EQ(tr.get_string("nosection", "key", "nope"), "nope");
  ASSERT_EQ(tr.get_int("nosection", "key", -1), -1);
}

TEST(toml_has) {
  TomlReader tr;
  tr.load_string("[loop]\npoll_ms = 11\n");
  ASSERT_TRUE(tr.has("loop", "poll_ms"));
  ASSERT_TRUE(!tr.has("loop", "missing"));
  ASSERT_TRUE(!tr.has("nosection", "poll_ms"));
}

TEST(toml_bool_variants) {
  TomlReader tr;
  tr.load_string(
    "[b]\n"
    "a = true\n"
    "b = True\n"
    "c = TRUE\n"
    "d = 1\n"
    "e = false\n"
    "f = False\n"
    "g = FALSE\n"
    "h = 0\n"
    "i = junk\n"
  );
  ASSERT_EQ(tr.get_bool("b", "a"), true);
  ASSERT_EQ(tr.get_bool("b", "b"), true);
  ASSERT_EQ(tr.get_bool("b", "c"), true);
  ASSERT_EQ(tr.get_bool("b", "d"), true);
  ASSERT_EQ(tr.get_bool("b", "e"), false);
  ASSERT_EQ(tr.get_bool("b", "f"), false);
  ASSERT_EQ(tr.get_bool("b", "g"), false);
  ASSERT_EQ(tr.get_bool("b", "h"), false);
  // "junk" -> returns default
  ASSERT_EQ(tr.get_bool("b", "i", true), true);
  ASSERT_EQ(tr.get_bool("b", "i", false), false);
}

TEST(toml_int_coercion) {
  TomlReader tr;
  tr.load_string(
    "[n]\n"
    "pos = 42\n"
    "plus = +8\n"
    "neg = -7\n"
    "zero = 0\n"
    "str = hello\n"
    "tail = 12ms\n"
  );
  ASSERT_EQ(tr.get_int("n", "pos"), 42);
  ASSERT_EQ(tr.get_int("n", "plus"), 8);
  ASSERT_EQ(tr.get_int("n", "neg"), -7);
  ASSERT_EQ(tr.get_int("n", "zero"), 0);
  // non-numeric values return the default
  ASSERT_EQ(tr.get_int("n", "str", 99), 99);
  ASSERT_EQ(tr.get_int("n", "tail", 99), 99);
}

TEST(toml_quoted_strings) {
  TomlReader tr;
  tr.load_string(
    "[s]\n"
    "plain = hello\n"
    "quoted = \"world\"\n"
    "empty = \"\"\n"
    "hex = \"#FF00AA\"\n"
  );
  ASSERT_EQ(tr.get_string("s", "plain"), "hello");
  ASSERT_EQ(tr.get_string("s", "quoted"), "world");
  ASSERT_EQ(tr.get_string("s", "empty"), "");
  ASSERT_EQ(tr.get_string("s", "hex"), "#FF00AA");
}

TEST(toml_comments_and_whitespace) {
  TomlReader tr;
  tr.load_string(
    "# Top-level comment\n"
    "\n"
    "[ profile ]  \n"
    "  output  =  frames.json  \n"
    "# inline section comment\n"
    "  max_frames = 10   # keep it short\n"
    "  label = \"a # b\" # trailing\n"
  );
  ASSERT_EQ(tr.get_string("profile", "output"), "frames.json");
  ASSERT_EQ(tr.get_int("profile", "max_frames"), 10);
  ASSERT_EQ(tr.get_string("profile", "label"), "a # b");
}

TEST(toml_later_keys_overwrite) {
  TomlReader tr;
  tr.load_string("[loop]\npoll_ms = 5\npoll_ms = 9\n");
  ASSERT_EQ(tr.get_int("loop", "poll_ms"), 9);
}

TEST(toml_reload_replaces_contents) {
  TomlReader tr;
  tr.load_string("[a]\nx = 1\n");
  tr.load_string("[b]\ny = 2\n");
  ASSERT_TRUE(!tr.has("a", "x"));
  ASSERT_EQ(tr.get_int("b", "y"), 2);
}

TEST(toml_global_keys_no_section) {
  TomlReader tr;
  tr.load_string("key = value\n[sec]\nother = 1\n");
  // Keys before any [section] go under empty-string section
  ASSERT_EQ(tr.get_string("", "key"), "value");
  ASSERT_EQ(tr.get_int("sec", "other"), 1);
}
