/*
 * Stream relay tests - cmd-runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <cmd-runner/exec/relay.hpp>
#include <cmd-runner/exec/spawn.hpp>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace cmdrun;

namespace {

class RecordingSink : public CategorySink {
public:
    void set(ErrorCategory c, const std::string&) override { seen.push_back(c); }
    std::vector<ErrorCategory> seen;
};

// Classifies each line as Build when it contains "ERR".
struct Fixture {
    ErrorCategoryMapping mapping{{"build", {"ERR"}}};
    RecordingSink sink;
    ErrorClassifier cls{mapping, sink};
};

} // namespace

TEST(LineScanner, LinesSplitAcrossChunks) {
    Fixture f;
    LineScanner sc(f.cls);
    std::string a = "ok\nfirst E", b = "RR here\nok again\n";
    sc.feed(a.data(), a.size());
    EXPECT_TRUE(f.sink.seen.empty());
    sc.feed(b.data(), b.size());
    EXPECT_EQ(f.sink.seen.size(), 1u);
}

TEST(LineScanner, TrailingLineClassifiedOnFinish) {
    Fixture f;
    LineScanner sc(f.cls);
    std::string a = "no newline ERR";
    sc.feed(a.data(), a.size());
    EXPECT_TRUE(f.sink.seen.empty());
    sc.finish();
    EXPECT_EQ(f.sink.seen.size(), 1u);
}

TEST(LineScanner, OversizedLineSkipped) {
    Fixture f;
    LineScanner sc(f.cls, 64);
    std::string big = "ERR" + std::string(100, 'x') + "\n";
    sc.feed(big.data(), big.size());
    EXPECT_TRUE(f.sink.seen.empty());
    EXPECT_EQ(sc.skipped_lines(), 1u);
    // Next line is classified again.
    std::string next = "ERR\n";
    sc.feed(next.data(), next.size());
    EXPECT_EQ(f.sink.seen.size(), 1u);
}

TEST(LineScanner, OversizedLineInManyChunks) {
    Fixture f;
    LineScanner sc(f.cls);
    std::string chunk(4096, 'a');
    chunk += "ERR";
    for (int i=0;i<10;++i) sc.feed(chunk.data(), chunk.size());
    sc.finish();
    EXPECT_TRUE(f.sink.seen.empty());
    EXPECT_EQ(sc.skipped_lines(), 1u);
}

TEST(LineScanner, LineAtLimitIsClassified) {
    Fixture f;
    LineScanner sc(f.cls, 8);
    std::string line = "12345ERR\n";
    sc.feed(line.data(), line.size());
    EXPECT_EQ(f.sink.seen.size(), 1u);
}

TEST(RelayStream, BytesUnchanged) {
    int p[2];
    ASSERT_EQ(pipe(p), 0);
    UniqueFd rd(p[0]);
    std::string payload = "line one\r\nERR two\n" + std::string(70000, 'z') + "\nno newline";
    std::thread writer([&]{ feed_stream(p[1], payload); });
    Fixture f;
    std::ostringstream out;
    std::mutex mu;
    relay_stream(rd.get(), RelayTarget{&out, &mu}, &f.cls);
    writer.join();
    EXPECT_EQ(out.str(), payload);
    EXPECT_EQ(f.sink.seen.size(), 1u);
}

TEST(RelayStream, WriteFailureReportedAfterDrain) {
    int p[2];
    ASSERT_EQ(pipe(p), 0);
    UniqueFd rd(p[0]);
    std::string payload(100000, 'q');
    std::thread writer([&]{ feed_stream(p[1], payload); });
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    std::mutex mu;
    EXPECT_THROW(relay_stream(rd.get(), RelayTarget{&out, &mu}, nullptr), std::runtime_error);
    // The writer finished: the pipe was drained despite the failure.
    writer.join();
}
