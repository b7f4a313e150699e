#include <gtest/gtest.h>

#include "apps/inventory_list.h"
#include "fakes.h"

namespace {

TEST(InventoryListTest, LoadsLinesAndStripsCarriageReturns) {
  TempDir dir;
  dir.write("inv.txt", "Stimpak x3\r\nRadAway\r\n\r\nNuka-Cola\n");
  InventoryList list(dir.file("inv.txt"), 9);
  list.reload();

  ASSERT_EQ(list.lines().size(), 4u);
  EXPECT_EQ(list.lines()[0], "Stimpak x3");
  EXPECT_EQ(list.lines()[2], "");
  EXPECT_EQ(list.lines()[3], "Nuka-Cola");
}

TEST(InventoryListTest, MissingFileShowsPlaceholder) {
  TempDir dir;
  InventoryList list(dir.file("inv.txt"), 9);
  list.reload();

  ASSERT_FALSE(list.lines().empty());
  EXPECT_NE(list.lines()[0].find("not found"), std::string::npos);
}

TEST(InventoryListTest, UnreadableFileShowsError) {
  TempDir dir;
  // A directory opens fine but cannot be read as text.
  InventoryList list(dir.path(), 9);
  list.reload();

  ASSERT_EQ(list.lines().size(), 1u);
  EXPECT_EQ(list.lines()[0].rfind("ERROR: ", 0), 0u);
}

TEST(InventoryListTest, ScrollIsClampedToTheLastPage) {
  TempDir dir;
  std::string content;
  for (int i = 0; i < 12; ++i) {
    content += "item " + std::to_string(i) + "\n";
  }
  dir.write("inv.txt", content);
  InventoryList list(dir.file("inv.txt"), 9);
  list.reload();

  EXPECT_EQ(list.maxOffset(), 3u);
  list.scrollUp();
  EXPECT_EQ(list.offset(), 0u);
  for (int i = 0; i < 10; ++i) {
    list.scrollDown();
  }
  EXPECT_EQ(list.offset(), 3u);
}

TEST(InventoryListTest, ShortListNeverScrolls) {
  TempDir dir;
  dir.write("inv.txt", "one\ntwo\n");
  InventoryList list(dir.file("inv.txt"), 9);
  list.reload();
  list.scrollDown();
  EXPECT_EQ(list.offset(), 0u);
}

TEST(InventoryListTest, ReloadPicksUpEditsAndResetsScroll) {
  TempDir dir;
  dir.write("inv.txt", "a\nb\nc\nd\n");
  InventoryList list(dir.file("inv.txt"), 2);
  list.reload();
  list.scrollDown();
  ASSERT_EQ(list.offset(), 1u);

  dir.write("inv.txt", "x\n");
  list.reload();
  EXPECT_EQ(list.offset(), 0u);
  ASSERT_EQ(list.lines().size(), 1u);
  EXPECT_EQ(list.lines()[0], "x");
}

}  // namespace
