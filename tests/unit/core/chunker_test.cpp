#include <gtest/gtest.h>

#include <set>
#include <sstream>

#include "../../common/utilities_test.hpp"
#include "lucid_core/chunking/chunker.hpp"

namespace lucid_core {

namespace {

std::vector<std::string> split_words(const std::string& chunk) {
  std::vector<std::string> words;
  std::istringstream stream(chunk);
  std::string word;
  while (stream >> word) {
    words.push_back(word);
  }
  return words;
}

}  // namespace

TEST(ChunkerTest, EmptyAndWhitespaceInputYieldNoChunks) {
  Chunker chunker(10, 2);
  EXPECT_TRUE(chunker.chunk("").empty());
  EXPECT_TRUE(chunker.chunk("   ").empty());
  EXPECT_TRUE(chunker.chunk("\t\n \r").empty());
}

TEST(ChunkerTest, ShortTextFitsInOneChunk) {
  Chunker chunker(10, 2);
  auto chunks = chunker.chunk("the quick   brown\nfox");
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0], "the quick brown fox");
}

TEST(ChunkerTest, ThousandWordsWithDefaultSizes) {
  Chunker chunker(512, 50);
  auto chunks = chunker.chunk(lucid_tests::TestUtilities::make_words(1000));

  ASSERT_EQ(chunks.size(), 3u);

  auto first = split_words(chunks[0]);
  auto second = split_words(chunks[1]);
  auto third = split_words(chunks[2]);

  ASSERT_EQ(first.size(), 512u);
  EXPECT_EQ(first.front(), "w0");
  EXPECT_EQ(first.back(), "w511");

  ASSERT_EQ(second.size(), 512u);
  EXPECT_EQ(second.front(), "w462");
  EXPECT_EQ(second.back(), "w973");

  ASSERT_EQ(third.size(), 76u);
  EXPECT_EQ(third.front(), "w924");
  EXPECT_EQ(third.back(), "w999");
}

TEST(ChunkerTest, ConsecutiveChunksShareOverlapWords) {
  Chunker chunker(5, 2);
  auto chunks = chunker.chunk(lucid_tests::TestUtilities::make_words(12));

  ASSERT_EQ(chunks.size(), 4u);
  EXPECT_EQ(chunks[0], "w0 w1 w2 w3 w4");
  EXPECT_EQ(chunks[1], "w3 w4 w5 w6 w7");
  EXPECT_EQ(chunks[2], "w6 w7 w8 w9 w10");
  EXPECT_EQ(chunks[3], "w9 w10 w11");
}

TEST(ChunkerTest, LastChunkEndingExactlyAtTextEndStopsIteration) {
  Chunker chunker(4, 0);
  auto chunks = chunker.chunk(lucid_tests::TestUtilities::make_words(8));
  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[1], "w4 w5 w6 w7");
}

TEST(ChunkerTest, EveryWordAppearsInSomeChunk) {
  Chunker chunker(7, 3);
  const std::string text = lucid_tests::TestUtilities::make_words(53, "token");

  std::set<std::string> covered;
  for (const auto& chunk : chunker.chunk(text)) {
    for (const auto& word : split_words(chunk)) {
      covered.insert(word);
    }
  }
  for (const auto& word : Chunker::tokenize(text)) {
    EXPECT_TRUE(covered.count(word)) << word;
  }
}

TEST(ChunkerTest, ChunkingIsDeterministic) {
  Chunker chunker(6, 2);
  const std::string text = lucid_tests::TestUtilities::make_words(40);
  EXPECT_EQ(chunker.chunk(text), chunker.chunk(text));
}

TEST(ChunkerTest, ConstructorClampsInvalidSizes) {
  Chunker zero_size(0, 10);
  EXPECT_EQ(zero_size.chunk_size(), Chunker::DEFAULT_CHUNK_SIZE);
  EXPECT_EQ(zero_size.chunk_overlap(), 10);

  Chunker negative_overlap(10, -3);
  EXPECT_EQ(negative_overlap.chunk_overlap(), 0);

  Chunker overlap_too_large(100, 100);
  EXPECT_EQ(overlap_too_large.chunk_overlap(), 25);

  Chunker negative_size(-5, 600);
  EXPECT_EQ(negative_size.chunk_size(), 512);
  EXPECT_EQ(negative_size.chunk_overlap(), 128);
}

TEST(ChunkerTest, SizeOneAdvancesOneWordAtATime) {
  Chunker chunker(1, 0);
  auto chunks = chunker.chunk("a b c");
  EXPECT_EQ(chunks, (std::vector<std::string>{"a", "b", "c"}));
}

TEST(ChunkerTest, TokenizeSplitsOnUnicodeWhitespace) {
  // U+00A0 no-break space, U+3000 ideographic space, U+2003 em space
  auto words = Chunker::tokenize(
      "caf\xC3\xA9\xC2\xA0na\xC3\xAFve\xE3\x80\x80\xE6\x97\xA5\xE2\x80\x83"
      "end");
  ASSERT_EQ(words.size(), 4u);
  EXPECT_EQ(words[0], "caf\xC3\xA9");
  EXPECT_EQ(words[1], "na\xC3\xAFve");
  EXPECT_EQ(words[2], "\xE6\x97\xA5");
  EXPECT_EQ(words[3], "end");
}

TEST(ChunkerTest, TokenizeReplacesInvalidUtf8) {
  auto words = Chunker::tokenize("ok \xFF bad");
  ASSERT_EQ(words.size(), 3u);
  EXPECT_EQ(words[1], "\xEF\xBF\xBD");
}

TEST(ChunkerTest, ChunkWithPositionsNumbersFromZero) {
  Chunker chunker(3, 1);
  auto positioned = chunker.chunk_with_positions(lucid_tests::TestUtilities::make_words(7));
  ASSERT_EQ(positioned.size(), 3u);
  for (size_t i = 0; i < positioned.size(); ++i) {
    EXPECT_EQ(positioned[i].index, static_cast<int>(i));
  }
  EXPECT_EQ(positioned[0].content, "w0 w1 w2");
  EXPECT_EQ(positioned[2].content, "w4 w5 w6");
}

}  // namespace lucid_core
