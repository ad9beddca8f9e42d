#include <doctest/doctest.h>
#include <algorithm>
#include <cstring>
#include <deque>
#include <string>
#include <utility>
#include <vector>
#include <unistd.h>
#include "scpicore/adapter/adapter_posix.hpp"
#include "scpicore/processor.hpp"
#include "test_instrument.hpp"

using namespace scpicore;
using scpicore::adapter::IoStatus;
using scpicore_test::Session;

namespace {

// Serves scripted reads. An empty chunk reads as WouldBlock; the end of the
// script reads as Closed.
class ScriptedAdapter : public adapter::Adapter {
public:
    explicit ScriptedAdapter(std::deque<std::string> chunks) : chunks_(std::move(chunks)) {}

    IoStatus read(uint8_t* buf, std::size_t cap, std::size_t& count) override {
        count = 0;
        if (chunks_.empty()) return IoStatus::Closed;
        std::string& chunk = chunks_.front();
        if (chunk.empty()) {
            chunks_.pop_front();
            return IoStatus::WouldBlock;
        }
        count = std::min(cap, chunk.size());
        std::memcpy(buf, chunk.data(), count);
        chunk.erase(0, count);
        if (chunk.empty()) chunks_.pop_front();
        return IoStatus::Ok;
    }

    IoStatus write(Bytes data) override {
        if (fail_writes) return IoStatus::Error;
        written.append(reinterpret_cast<const char*>(data.data()), data.size());
        return IoStatus::Ok;
    }

    IoStatus flush() override {
        ++flushes;
        return IoStatus::Ok;
    }

    const char* name() const override { return "scripted"; }

    std::string written;
    int flushes{0};
    bool fail_writes{false};

private:
    std::deque<std::string> chunks_;
};

} // namespace

TEST_CASE("Lines split across reads are processed once complete") {
    Session s;
    Processor<256, 256> loop(s.interpreter);
    ScriptedAdapter io({"*IDN?\nMATH:MU", "LT? 23,42\n"});

    CHECK(loop.process(io) == IoStatus::Closed);
    CHECK(io.written == "\"ACME,Widget,1,1.0\"\n966\n");
    CHECK(io.flushes == 2);
    CHECK(loop.pending() == 0);
}

TEST_CASE("A block containing a newline extends the line") {
    Session s;
    Processor<256, 256> loop(s.interpreter);
    ScriptedAdapter io({"DATA:BLOC #15ab\ncd\nDATA:BLOC?\n"});

    CHECK(loop.process(io) == IoStatus::Closed);
    CHECK(io.written == "#15ab\ncd\n");
    CHECK(s.error_numbers().empty());
}

TEST_CASE("WouldBlock keeps the partial statement pending") {
    Session s;
    Processor<64, 64> loop(s.interpreter);
    ScriptedAdapter io({"*ID", "", "N?\n"});

    CHECK(loop.poll(io) == IoStatus::Ok);
    CHECK(loop.pending() == 3);
    CHECK(loop.poll(io) == IoStatus::WouldBlock);
    CHECK(loop.pending() == 3);
    CHECK(loop.poll(io) == IoStatus::Ok);
    CHECK(loop.pending() == 0);
    CHECK(io.written == "\"ACME,Widget,1,1.0\"\n");
}

TEST_CASE("A full input buffer reports an overrun and resynchronizes") {
    Session s;
    Processor<16, 64> loop(s.interpreter);
    ScriptedAdapter io({"VAL:STR? AAAAAAAAAAAAAAAAAAAA\n*IDN?\n"});

    CHECK(loop.process(io) == IoStatus::Closed);
    CHECK(io.written == "\"ACME,Widget,1,1.0\"\n");
    CHECK(s.error_numbers() == std::vector<int>({-363}));
}

TEST_CASE("After an overrun nothing else in the program message runs") {
    Session s;
    Processor<16, 64> loop(s.interpreter);
    ScriptedAdapter io({"AAAAAAAAAAAAAAAA;VAL:UINT 7\n*IDN?\n"});

    CHECK(loop.process(io) == IoStatus::Closed);
    CHECK(io.written == "\"ACME,Widget,1,1.0\"\n");
    CHECK(s.instrument.uint_ == 0);
    CHECK(s.error_numbers() == std::vector<int>({-363}));
}

TEST_CASE("An unbalanced quote does not hold later lines back") {
    Session s;
    Processor<1024, 64> loop(s.interpreter);
    ScriptedAdapter io({"VAL:TEXT 'abc\n", "*IDN?\n"});

    CHECK(loop.process(io) == IoStatus::Closed);
    CHECK(io.written == "\"ACME,Widget,1,1.0\"\n");
    CHECK(s.error_numbers() == std::vector<int>({-151}));
    CHECK(loop.pending() == 0);
}

TEST_CASE("Write failures end processing") {
    Session s;
    Processor<64, 64> loop(s.interpreter);
    ScriptedAdapter io({"*IDN?\n", "*IDN?\n"});
    io.fail_writes = true;

    CHECK(loop.process(io) == IoStatus::Error);
}

TEST_CASE("File descriptor adapter serves a pipe pair") {
    int in_pipe[2];
    int out_pipe[2];
    REQUIRE(::pipe(in_pipe) == 0);
    REQUIRE(::pipe(out_pipe) == 0);

    const char request[] = "*IDN?\nMATH:MULT? 2,3\n";
    REQUIRE(::write(in_pipe[1], request, sizeof(request) - 1) == ssize_t(sizeof(request) - 1));
    ::close(in_pipe[1]);

    Session s;
    Processor<128, 128> loop(s.interpreter);
    adapter::FdAdapter io(in_pipe[0], out_pipe[1], "pipe");
    CHECK(loop.process(io) == IoStatus::Closed);
    ::close(out_pipe[1]);

    std::string reply;
    char buf[128];
    ssize_t n = 0;
    while ((n = ::read(out_pipe[0], buf, sizeof(buf))) > 0) reply.append(buf, size_t(n));
    CHECK(reply == "\"ACME,Widget,1,1.0\"\n6\n");

    ::close(in_pipe[0]);
    ::close(out_pipe[0]);
}

TEST_CASE("reset drops a half received statement") {
    Session s;
    Processor<64, 64> loop(s.interpreter);
    ScriptedAdapter first({"MEAS:VOLT 3;VOL"});
    CHECK(loop.process(first) == IoStatus::Closed);
    CHECK(loop.pending() > 0);

    loop.reset();
    CHECK(loop.pending() == 0);

    ScriptedAdapter second({"T?\n*IDN?\n"});
    CHECK(loop.process(second) == IoStatus::Closed);
    CHECK(second.written == "\"ACME,Widget,1,1.0\"\n");
    CHECK(s.error_numbers() == std::vector<int>({-113}));
}
