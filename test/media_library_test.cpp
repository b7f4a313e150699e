#include <gtest/gtest.h>

#include <sys/stat.h>

#include "core/media_library.h"
#include "core/text_file.h"
#include "fakes.h"

namespace {

TEST(MediaLibraryTest, ListsOnlyAudioFilesSorted) {
  TempDir dir;
  dir.write("b_song.OGG", "");
  dir.write("a_song.mp3", "");
  dir.write("c_song.wav", "");
  dir.write("cover.jpg", "");
  dir.write("notes.txt", "");
  ::mkdir(dir.file("album.mp3").c_str(), 0755);

  const std::vector<std::string> tracks = listTracks(dir.path());
  const std::vector<std::string> expected = {"a_song.mp3", "b_song.OGG", "c_song.wav"};
  EXPECT_EQ(tracks, expected);
}

TEST(MediaLibraryTest, MissingDirectoryIsCreatedEmpty) {
  TempDir dir;
  const std::string music = dir.file("music");
  EXPECT_TRUE(listTracks(music).empty());

  struct stat st;
  ASSERT_EQ(::stat(music.c_str(), &st), 0);
  EXPECT_TRUE(S_ISDIR(st.st_mode));
}

TEST(MediaLibraryTest, ExtensionAloneIsNotATrack) {
  EXPECT_FALSE(isTrackFileName(".mp3"));
  EXPECT_TRUE(isTrackFileName("x.Mp3"));
  EXPECT_FALSE(isTrackFileName("song.mp3.part"));
}

TEST(MediaLibraryTest, JoinPath) {
  EXPECT_EQ(joinPath("music", "a.mp3"), "music/a.mp3");
  EXPECT_EQ(joinPath("music/", "a.mp3"), "music/a.mp3");
  EXPECT_EQ(joinPath("", "a.mp3"), "a.mp3");
}

TEST(TextFileTest, MissingFileReportsNotFound) {
  TempDir dir;
  std::vector<std::string> lines;
  std::string err;
  EXPECT_FALSE(loadTextLines(dir.file("nope.txt"), lines, &err));
  EXPECT_EQ(err, "not found");
}

TEST(TextFileTest, LastLineWithoutNewline) {
  TempDir dir;
  dir.write("list.txt", "one\ntwo");
  std::vector<std::string> lines;
  ASSERT_TRUE(loadTextLines(dir.file("list.txt"), lines));
  EXPECT_EQ(lines, std::vector<std::string>({"one", "two"}));
}

}  // namespace
