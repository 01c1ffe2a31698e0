#include <gtest/gtest.h>
#include <ssh/executor.hpp>
#include <core/errors.hpp>
#include <platform/process.hpp>

TEST(ShellExecutor, CapturesStdout) {
    ShellExecutor exec;
    auto r = exec.execute("echo hi", ExecOptions{}, ExecStreams{});
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.stdout_data, "hi\n");
    EXPECT_EQ(r.stderr_data, "");
    EXPECT_GT(r.pid, 0);
}

TEST(ShellExecutor, CapturesStderr) {
    ShellExecutor exec;
    auto r = exec.execute("echo oops 1>&2", ExecOptions{}, ExecStreams{});
    EXPECT_EQ(r.stdout_data, "");
    EXPECT_EQ(r.stderr_data, "oops\n");
}

TEST(ShellExecutor, NonZeroExitThrows) {
    ShellExecutor exec;
    try {
        exec.execute("echo partial; echo bad 1>&2; exit 3", ExecOptions{}, ExecStreams{});
        FAIL() << "expected ProcessError";
    } catch (const ProcessError& e) {
        EXPECT_EQ(e.exit_code(), 3);
        EXPECT_EQ(e.stdout_data(), "partial\n");
        EXPECT_EQ(e.stderr_data(), "bad\n");
        EXPECT_EQ(e.command(), "echo partial; echo bad 1>&2; exit 3");
    }
}

TEST(ShellExecutor, MissingBinaryThrows) {
    ShellExecutor exec;
    EXPECT_THROW(exec.execute("definitely-not-a-real-binary-sshpool", ExecOptions{}, ExecStreams{}),
                 ProcessError);
}

TEST(ShellExecutor, StdoutOverBufferThrows) {
    ShellExecutor exec;
    ExecOptions o;
    o.max_buffer = 100;
    EXPECT_THROW(exec.execute("head -c 5000 /dev/zero | tr '\\0' a", o, ExecStreams{}),
                 BufferLimitError);
}

TEST(ShellExecutor, StderrOverBufferThrows) {
    ShellExecutor exec;
    ExecOptions o;
    o.max_buffer = 100;
    EXPECT_THROW(exec.execute("head -c 5000 /dev/zero | tr '\\0' a 1>&2", o, ExecStreams{}),
                 BufferLimitError);
}

TEST(ShellExecutor, OutputAtLimitIsAccepted) {
    ShellExecutor exec;
    ExecOptions o;
    o.max_buffer = 100;
    auto r = exec.execute("head -c 100 /dev/zero | tr '\\0' a", o, ExecStreams{});
    EXPECT_EQ(r.stdout_data.size(), 100u);
}

TEST(ShellExecutor, HonorsCwd) {
    ShellExecutor exec;
    ExecOptions o;
    o.cwd = "/";
    auto r = exec.execute("pwd", o, ExecStreams{});
    EXPECT_EQ(r.stdout_data, "/\n");
}

TEST(ShellExecutor, StreamsLiveOutput) {
    ShellExecutor exec;
    std::string seen_out, seen_err;
    ExecStreams streams;
    streams.on_stdout = [&](const char* d, std::size_t n) { seen_out.append(d, n); };
    streams.on_stderr = [&](const char* d, std::size_t n) { seen_err.append(d, n); };

    auto r = exec.execute("echo a; echo b 1>&2; echo c", ExecOptions{}, streams);
    EXPECT_EQ(seen_out, "a\nc\n");
    EXPECT_EQ(seen_err, "b\n");
    EXPECT_EQ(r.stdout_data, seen_out);
}

TEST(PathProber, FindsShell) {
    PathProber prober;
    EXPECT_TRUE(prober.is_resolvable("sh"));
    EXPECT_TRUE(prober.is_resolvable("/bin/sh"));
}

TEST(PathProber, MissingBinary) {
    PathProber prober;
    EXPECT_FALSE(prober.is_resolvable("definitely-not-a-real-binary-sshpool"));
    EXPECT_FALSE(prober.is_resolvable(""));
}
