#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>

#include "lsp/BackendProcess.h"
#include "transport/StdioTransport.h"
#include "core/Errors.h"

namespace fs = std::filesystem;

static std::string readAll(int fd) {
  std::string out;
  char buf[4096];
  ssize_t n;
  while ((n = read(fd, buf, sizeof(buf))) > 0) out.append(buf, static_cast<size_t>(n));
  return out;
}

TEST(BackendProcess, CatEchoesFramesBack) {
  BackendProcess process;
  BackendProcess::Options options;
  options.command = "cat";
  options.workingDir = fs::temp_directory_path();
  process.spawn(options);
  ASSERT_TRUE(process.running());
  EXPECT_GT(process.processId(), 0);

  StdioTransport transport(process.stdoutFd(), process.stdinFd());
  transport.writeMessage(R"({"jsonrpc":"2.0","id":1})", Framing::ContentLength);
  auto frame = transport.readMessage();
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->payload, R"({"jsonrpc":"2.0","id":1})");

  process.terminate();
  EXPECT_FALSE(process.running());
  process.closeStreams();
  EXPECT_EQ(process.stdinFd(), -1);
}

TEST(BackendProcess, MissingExecutableIsStartError) {
  BackendProcess process;
  BackendProcess::Options options;
  options.command = "ramcp-definitely-not-installed";
  try {
    process.spawn(options);
    FAIL() << "expected BackendStartError";
  } catch (const BackendStartError& e) {
    EXPECT_NE(std::string(e.what()).find("ramcp-definitely-not-installed"), std::string::npos);
    EXPECT_NE(std::string(e.what()).find("~/.cargo/bin"), std::string::npos);
  }
  EXPECT_FALSE(process.running());
}

TEST(BackendProcess, BadWorkingDirectoryIsStartError) {
  BackendProcess process;
  BackendProcess::Options options;
  options.command = "cat";
  options.workingDir = fs::temp_directory_path() / "ramcp_no_such_dir_for_spawn";
  EXPECT_THROW(process.spawn(options), BackendStartError);
  EXPECT_FALSE(process.running());
}

TEST(BackendProcess, ForwardedEnvironmentReachesChild) {
  setenv("RAMCP_TEST_FORWARDED", "forwarded-value", 1);

  BackendProcess process;
  BackendProcess::Options options;
  options.command = "sh";
  options.args = {"-c", "printf '%s|%s' \"$RAMCP_TEST_FORWARDED\" \"$(pwd)\""};
  options.workingDir = fs::canonical(fs::temp_directory_path());
  options.forwardEnv = {"RAMCP_TEST_FORWARDED", "RAMCP_TEST_UNSET_VAR"};
  process.spawn(options);

  std::string out = readAll(process.stdoutFd());
  process.terminate();
  process.closeStreams();
  unsetenv("RAMCP_TEST_FORWARDED");

  EXPECT_EQ(out, "forwarded-value|" + options.workingDir.string());
}

TEST(BackendProcess, StderrIsSeparateStream) {
  BackendProcess process;
  BackendProcess::Options options;
  options.command = "sh";
  options.args = {"-c", "echo out; echo err >&2"};
  process.spawn(options);

  std::string out = readAll(process.stdoutFd());
  std::string err = readAll(process.stderrFd());
  process.terminate();
  process.closeStreams();

  EXPECT_EQ(out, "out\n");
  EXPECT_EQ(err, "err\n");
}

TEST(BackendProcess, FindExecutable) {
  EXPECT_FALSE(BackendProcess::findExecutable("sh").empty());
  EXPECT_EQ(BackendProcess::findExecutable("/bin/sh"), fs::absolute("/bin/sh").string());
  EXPECT_TRUE(BackendProcess::findExecutable("ramcp-definitely-not-installed").empty());
  EXPECT_TRUE(BackendProcess::findExecutable("").empty());
}

TEST(BackendProcess, TerminateTwiceIsSafe) {
  BackendProcess process;
  BackendProcess::Options options;
  options.command = "cat";
  process.spawn(options);
  process.terminate();
  process.terminate();
  process.closeStreams();
  process.closeStreams();
  EXPECT_FALSE(process.running());
}
