#include "minitest.hpp"
#include "util/Platform.hpp"
#include "util/Procfs.hpp"
#include "util/Text.hpp"
#include <filesystem>
#include <string>
#include <unistd.h>

using namespace netsnap::util;

TEST(split_ws_collapses_runs) {
  auto t = split_ws("  a \t b\r\n  c  ");
  ASSERT_EQ(t.size(), 3u);
  ASSERT_EQ(t[0], "a");
  ASSERT_EQ(t[2], "c");
  ASSERT_TRUE(split_ws("   ").empty());
}

TEST(split_lines_handles_trailing_newline) {
  ASSERT_EQ(split_lines("a\nb\n").size(), 2u);
  ASSERT_EQ(split_lines("a\n\nb").size(), 3u);
  ASSERT_TRUE(split_lines("").empty());
}

TEST(dotted_quad_prefix_shapes) {
  ASSERT_TRUE(has_dotted_quad_prefix("10.0.0.0"));
  ASSERT_TRUE(has_dotted_quad_prefix("192.168.1.1/32 link#6"));
  ASSERT_TRUE(has_dotted_quad_prefix("999.1.1.1"));
  ASSERT_FALSE(has_dotted_quad_prefix("192.168.1"));
  ASSERT_FALSE(has_dotted_quad_prefix("127"));
  ASSERT_FALSE(has_dotted_quad_prefix("fe80::1"));
  ASSERT_FALSE(has_dotted_quad_prefix("Destination"));
  ASSERT_FALSE(has_dotted_quad_prefix("1..2.3.4"));
}

TEST(sanitize_utf8_keeps_valid_text) {
  ASSERT_EQ(sanitize_utf8("plain ascii\n"), "plain ascii\n");
  ASSERT_EQ(sanitize_utf8("Ethernet-\xC3\xA4 \xE2\x94\x80"), "Ethernet-\xC3\xA4 \xE2\x94\x80");
}

TEST(sanitize_utf8_replaces_invalid_sequences) {
  ASSERT_EQ(sanitize_utf8("a\xFF" "b"), "a\xEF\xBF\xBD" "b");
  ASSERT_EQ(sanitize_utf8("\xC3"), "\xEF\xBF\xBD");           // truncated
  ASSERT_EQ(sanitize_utf8("\xE2\x28\xA1"), "\xEF\xBF\xBD(\xEF\xBF\xBD");
  ASSERT_EQ(sanitize_utf8("\xC0\xAF"), "\xEF\xBF\xBD\xEF\xBF\xBD"); // overlong
}

TEST(platform_names_map_to_families) {
  ASSERT_TRUE(parse_platform("Linux") == Platform::Linux);
  ASSERT_TRUE(parse_platform("Darwin") == Platform::Darwin);
  ASSERT_TRUE(parse_platform("Windows") == Platform::Windows);
  ASSERT_TRUE(parse_platform("FreeBSD") == Platform::Other);
  ASSERT_TRUE(parse_platform("") == Platform::Other);
  ASSERT_EQ(std::string(platform_name(Platform::Darwin)), "Darwin");
}

TEST(platform_detection_is_supported_here) {
#ifdef __linux__
  ASSERT_TRUE(detect_platform() == Platform::Linux);
#elif defined(__APPLE__)
  ASSERT_TRUE(detect_platform() == Platform::Darwin);
#endif
}

TEST(read_file_string_reports_unreadable_paths) {
  auto dir = std::filesystem::temp_directory_path() /
             ("netsnap_test_read_" + std::to_string(::getpid()));
  std::filesystem::create_directories(dir);
  std::string dir_err, missing_err;
  auto from_dir = read_file_string(dir.string(), &dir_err);
  auto missing = read_file_string((dir / "absent.conf").string(), &missing_err);
  std::filesystem::remove_all(dir);
  ASSERT_FALSE(from_dir.has_value());
  ASSERT_FALSE(dir_err.empty());
  ASSERT_FALSE(missing.has_value());
  ASSERT_FALSE(missing_err.empty());
}
