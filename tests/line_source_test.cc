// tests/line_source_test.cc
#include "procmaps/error.hh"
#include "procmaps/line_source.hh"
#include "procmaps/parser.hh"

#include <cstdlib>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <unistd.h>
#include <vector>

namespace procmaps {
namespace {

TEST(LineSourceTest, PeekDoesNotConsume) {
  auto source = FromString("first\nsecond\n");
  ASSERT_NE(source->Peek(), nullptr);
  EXPECT_EQ(*source->Peek(), "first");
  EXPECT_EQ(*source->Peek(), "first");
  EXPECT_EQ(source->GetLineNumber(), 0u);

  EXPECT_EQ(source->Next(), std::optional<std::string>("first"));
  EXPECT_EQ(source->GetLineNumber(), 1u);
  EXPECT_EQ(*source->Peek(), "second");
  EXPECT_EQ(source->Next(), std::optional<std::string>("second"));

  EXPECT_EQ(source->Peek(), nullptr);
  EXPECT_FALSE(source->Next());
  EXPECT_FALSE(source->Next());
  EXPECT_EQ(source->GetLineNumber(), 2u);
}

TEST(LineSourceTest, LastLineWithoutNewline) {
  auto source = FromString("only");
  EXPECT_EQ(source->Next(), std::optional<std::string>("only"));
  EXPECT_FALSE(source->Next());
}

TEST(LineSourceTest, EmptyInput) {
  auto source = FromString("");
  EXPECT_EQ(source->Peek(), nullptr);
  EXPECT_FALSE(source->Next());
}

TEST(LineSourceTest, ProcPaths) {
  EXPECT_EQ(SmapsPath(42), "/proc/42/smaps");
  EXPECT_EQ(MapsPath(42), "/proc/42/maps");
}

TEST(LineSourceTest, MissingFileIsIoError) {
  try {
    OpenFile("/nonexistent/procmaps/smaps");
    FAIL() << "expected an error";
  } catch (const Error &e) {
    EXPECT_EQ(e.GetKind(), ErrorKind::Io);
    EXPECT_NE(std::string(e.what()).find("/nonexistent/procmaps/smaps"),
              std::string::npos);
  }
  EXPECT_THROW(ReadAll("/nonexistent/procmaps/smaps"), Error);
}

class SmapsFileTest : public ::testing::Test {
protected:
  void SetUp() override {
    char name[] = "/tmp/procmaps_test_XXXXXX";
    int fd = mkstemp(name);
    ASSERT_NE(fd, -1);
    close(fd);
    path_ = name;

    std::ofstream out(path_);
    out << "00400000-00452000 r-xp 00000000 08:02 173521 /usr/bin/cat\n"
        << "Size:                328 kB\n"
        << "Rss:                 256 kB\n"
        << "VmFlags: rd ex mr mw me\n"
        << "01f6e000-01f8f000 rw-p 00000000 00:00 0          [heap]\n"
        << "Size:                132 kB\n"
        << "Rss:                  12 kB\n";
  }

  void TearDown() override {
    if (!path_.empty()) {
      unlink(path_.c_str());
    }
  }

  std::string path_;
};

TEST_F(SmapsFileTest, ReadsFromDisk) {
  std::vector<Entry> entries = ReadAll(path_);
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].first.inode, 173521u);
  EXPECT_EQ(entries[0].second.rss, 256u << 10);
  EXPECT_EQ(entries[1].second.rss, 12u << 10);
}

TEST_F(SmapsFileTest, FilterByPath) {
  std::vector<Entry> entries =
      ReadFilter(path_, [](const Mapping &mapping) {
        return mapping.path && *mapping.path == "[heap]";
      });
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0].first.start, 0x01f6e000u);
}

// Walks the live smaps of this process through the skip path only, so newer
// kernel keys or flags cannot break the test.
TEST(LiveProcessTest, FindsOwnStack) {
  int stack_var = 0;
  const uint64_t addr = reinterpret_cast<uint64_t>(&stack_var);

  Parser parser(OpenFile(SmapsPath(getpid())));
  bool found = false;
  size_t mappings = 0;
  while (auto mapping = parser.NextMapping()) {
    mappings++;
    if (mapping->Contains(addr)) {
      found = true;
      EXPECT_TRUE(mapping->permissions.Has(Permission::Read));
      EXPECT_TRUE(mapping->permissions.Has(Permission::Write));
    }
    parser.SkipUsage();
  }
  EXPECT_GT(mappings, 0u);
  EXPECT_TRUE(found) << "No mapping contains stack address " << std::hex
                     << addr;
}

TEST(LiveProcessTest, RejectAllFilterNeverFails) {
  std::vector<Entry> entries =
      ReadProcess(getpid(), [](const Mapping &) { return false; });
  EXPECT_TRUE(entries.empty());
}

TEST(LiveProcessTest, MapsFileIsAscending) {
  std::vector<Entry> entries = ReadAll(MapsPath(getpid()));
  ASSERT_FALSE(entries.empty());
  for (size_t i = 1; i < entries.size(); ++i) {
    EXPECT_LT(entries[i - 1].first.start, entries[i].first.start);
  }
  for (const auto &entry : entries) {
    EXPECT_EQ(entry.second, Usage());
    EXPECT_LT(entry.first.start, entry.first.end);
  }
}

} // namespace
} // namespace procmaps
