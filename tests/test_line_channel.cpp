#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "ytp_forge/line_channel.hpp"
#include "ytp_forge/process_runner.hpp"

using namespace ytp_forge;

TEST(LineChannelTest, DeliversInOrderThenDrains) {
  LineChannel channel(4);
  std::thread producer([&channel]() {
    for (int i = 0; i < 100; ++i)
      channel.push("line " + std::to_string(i));
    channel.finish();
  });

  std::vector<std::string> got;
  std::string line;
  while (channel.pop(line))
    got.push_back(line);
  producer.join();

  ASSERT_EQ(got.size(), 100u);
  EXPECT_EQ(got.front(), "line 0");
  EXPECT_EQ(got.back(), "line 99");
}

TEST(LineChannelTest, PendingLinesSurviveFinish) {
  LineChannel channel(8);
  channel.push("a");
  channel.push("b");
  channel.finish();

  std::string line;
  ASSERT_TRUE(channel.pop(line));
  EXPECT_EQ(line, "a");
  ASSERT_TRUE(channel.pop(line));
  EXPECT_EQ(line, "b");
  EXPECT_FALSE(channel.pop(line));
}

TEST(LineChannelTest, CloseUnblocksFullProducer) {
  LineChannel channel(1);
  ASSERT_TRUE(channel.push("fills the channel"));

  std::atomic<bool> result{true};
  std::thread producer([&]() { result = channel.push("blocked"); });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  channel.close();
  producer.join();

  EXPECT_FALSE(result.load());
  EXPECT_TRUE(channel.is_closed());
  std::string line;
  EXPECT_FALSE(channel.pop(line));
}

TEST(LineChannelTest, CapacityIsAtLeastOne) {
  LineChannel channel(0);
  EXPECT_EQ(channel.capacity(), 1u);
}

TEST(LineSplitterTest, HandlesAllTerminators) {
  LineSplitter splitter;
  std::vector<std::string> out;
  std::string data = "one\ntwo\r\nframe=1\rframe=2\r\nlast  \t";
  splitter.feed(data.data(), data.size(), out);
  splitter.flush(out);

  EXPECT_EQ(out, (std::vector<std::string>{"one", "two", "frame=1", "frame=2",
                                           "last"}));
}

TEST(LineSplitterTest, CrLfSplitAcrossChunks) {
  LineSplitter splitter;
  std::vector<std::string> out;
  splitter.feed("abc\r", 4, out);
  splitter.feed("\ndef", 4, out);
  splitter.flush(out);

  EXPECT_EQ(out, (std::vector<std::string>{"abc", "def"}));
}

TEST(LineSplitterTest, EmptyLinesArePreserved) {
  LineSplitter splitter;
  std::vector<std::string> out;
  splitter.feed("a\n\nb\n", 5, out);
  splitter.flush(out);

  EXPECT_EQ(out, (std::vector<std::string>{"a", "", "b"}));
}
