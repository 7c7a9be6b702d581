#include <gtest/gtest.h>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>
#include <nlohmann/json.hpp>

#include "transport/BackendWriter.h"
#include "transport/StdioTransport.h"
#include "core/Errors.h"

TEST(FramedFdWriter, ConcurrentWritersNeverInterleave) {
  int fds[2];
  ASSERT_EQ(pipe(fds), 0);

  const int threads = 8;
  const int perThread = 50;

  std::vector<Frame> frames;
  std::thread reader([&] {
    StdioTransport in(fds[0], -1);
    while (auto frame = in.readMessage()) frames.push_back(*frame);
  });

  {
    FramedFdWriter writer(fds[1]);
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
      workers.emplace_back([&, t] {
        for (int i = 0; i < perThread; ++i) {
          writer.writeMessage({{"thread", t}, {"seq", i}, {"pad", std::string(512, 'x')}});
        }
      });
    }
    for (auto& w : workers) w.join();
  }
  close(fds[1]);
  reader.join();
  close(fds[0]);

  ASSERT_EQ(frames.size(), static_cast<size_t>(threads * perThread));
  std::set<std::pair<int, int>> seen;
  std::vector<int> lastSeq(threads, -1);
  for (const auto& f : frames) {
    EXPECT_EQ(f.framing, Framing::ContentLength);
    auto j = nlohmann::json::parse(f.payload);
    int t = j["thread"].get<int>();
    int seq = j["seq"].get<int>();
    // Per-thread order survives.
    EXPECT_GT(seq, lastSeq[t]);
    lastSeq[t] = seq;
    seen.insert({t, seq});
  }
  EXPECT_EQ(seen.size(), static_cast<size_t>(threads * perThread));
}

TEST(FramedFdWriter, WritesAfterCloseFail) {
  int fds[2];
  ASSERT_EQ(pipe(fds), 0);
  FramedFdWriter writer(fds[1]);
  writer.writeMessage({{"ok", true}});
  writer.close();
  EXPECT_THROW(writer.writeMessage({{"ok", false}}), TransportError);
  // A failed write must not wedge the turn order.
  EXPECT_THROW(writer.writeMessage({{"ok", false}}), TransportError);
  close(fds[0]);
  close(fds[1]);
}
