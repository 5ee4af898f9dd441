#include "courier/content-stream.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "courier/client-errors.hpp"
#include "courier/scheduler.hpp"
#include "courier/task.hpp"

namespace courier {

namespace {

async::Task<void> ReadInto(ContentStream& stream, std::string& out) { out = co_await stream.read(); }

}  // namespace

TEST(ContentStream, ReadBufferedUntilEof) {
  async::Scheduler scheduler;
  ContentStream stream;
  stream.feedData("hello ");
  stream.feedData("world");
  stream.feedEof();
  EXPECT_EQ(stream.totalBytes(), 11U);
  EXPECT_EQ(scheduler.runUntilComplete(stream.read()), "hello world");
  EXPECT_TRUE(stream.atEof());
}

TEST(ContentStream, PendingReadWokenByData) {
  async::Scheduler scheduler;
  ContentStream stream;
  std::string out;
  auto handle = scheduler.spawn(ReadInto(stream, out));
  scheduler.runUntilIdle();
  EXPECT_FALSE(handle.done());
  stream.feedData("abc");
  scheduler.runUntilIdle();
  EXPECT_FALSE(handle.done());
  stream.feedData("def");
  stream.feedEof();
  scheduler.runUntilIdle();
  ASSERT_TRUE(handle.done());
  EXPECT_EQ(out, "abcdef");
}

TEST(ContentStream, ExceptionWinsOverBufferedData) {
  async::Scheduler scheduler;
  ContentStream stream;
  stream.feedData("abc");
  stream.setException(std::make_exception_ptr(ConnectionClosedError()));
  EXPECT_THROW(scheduler.runUntilComplete(stream.read()), ConnectionClosedError);
  EXPECT_THROW(scheduler.runUntilComplete(stream.readChunk(2)), ConnectionClosedError);
}

TEST(ContentStream, ExceptionWakesPendingRead) {
  async::Scheduler scheduler;
  ContentStream stream;
  std::string out;
  auto handle = scheduler.spawn(ReadInto(stream, out));
  scheduler.runUntilIdle();
  stream.setException(std::make_exception_ptr(std::runtime_error("boom")));
  scheduler.runUntilIdle();
  ASSERT_TRUE(handle.done());
  EXPECT_NE(handle.exception(), nullptr);
}

TEST(ContentStream, ReadChunk) {
  async::Scheduler scheduler;
  ContentStream stream;
  stream.feedData("abcdef");
  stream.feedEof();
  EXPECT_EQ(scheduler.runUntilComplete(stream.readChunk(4)), "abcd");
  EXPECT_FALSE(stream.atEof());
  EXPECT_EQ(scheduler.runUntilComplete(stream.readChunk(4)), "ef");
  EXPECT_EQ(scheduler.runUntilComplete(stream.readChunk(4)), "");
  EXPECT_TRUE(stream.atEof());
}

TEST(ContentStream, EofCallbacksRunOnce) {
  ContentStream stream;
  int nbCalls = 0;
  stream.onEof([&nbCalls] { ++nbCalls; });
  stream.feedEof();
  stream.feedEof();
  EXPECT_EQ(nbCalls, 1);
  stream.onEof([&nbCalls] { ++nbCalls; });
  EXPECT_EQ(nbCalls, 2);
}

TEST(ContentStream, ThrowingEofCallbackDoesNotStopOthers) {
  ContentStream stream;
  bool secondCalled = false;
  stream.onEof([] { throw std::runtime_error("callback failure"); });
  stream.onEof([&secondCalled] { secondCalled = true; });
  stream.feedEof();
  EXPECT_TRUE(secondCalled);
}

TEST(ContentStream, FeedAfterEofThrows) {
  ContentStream stream;
  stream.feedEof();
  EXPECT_THROW(stream.feedData("x"), std::logic_error);
  EXPECT_TRUE(stream.isEof());
}

}  // namespace courier
