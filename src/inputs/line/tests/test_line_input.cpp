#include <catch2/catch.hpp>
#include <chrono>
#include <future>
#include <sstream>
#include <unistd.h>

#include "inputs/line/CollectorProcess.h"
#include "inputs/line/LineInputStream.h"

using namespace flowvisor::input::line;
using namespace std::chrono_literals;
using flowvisor::json;

namespace {

struct Captured {
    std::vector<std::string> flows;
    std::vector<std::string> diagnostics;
    std::vector<std::string> order;
};

void capture(LineEventProxy *proxy, Captured &captured, std::promise<void> &ended)
{
    proxy->flow_line_signal.connect([&captured](const std::string &line) {
        captured.flows.push_back(line);
        captured.order.push_back(line);
    });
    proxy->diagnostic_line_signal.connect([&captured](const std::string &line) {
        captured.diagnostics.push_back(line);
        captured.order.push_back(line);
    });
    proxy->end_of_stream_signal.connect([&ended] {
        ended.set_value();
    });
}

}

TEST_CASE("Line input routing", "[input][line]")
{
    std::istringstream collector_output(
        "INFO ( default/core ): Start logging ...\n"
        "{\"ip_src\": \"10.0.1.1\", \"ip_dst\": \"10.0.2.1\", \"packets\": 2, \"bytes\": 143}\r\n"
        "\n"
        "  {\"ip_src\": \"10.0.2.1\", \"ip_dst\": \"8.8.8.8\", \"packets\": 1, \"bytes\": 60}\n"
        "{truncated");

    LineInputStream stream("collector", std::make_unique<StreamLineSource>(collector_output));
    CHECK(stream.schema_key() == "line");
    auto proxy = static_cast<LineEventProxy *>(stream.add_event_proxy());

    Captured captured;
    std::promise<void> ended;
    capture(proxy, captured, ended);
    CHECK(stream.consumer_count() == 3);

    stream.start();
    CHECK(stream.running());
    REQUIRE(ended.get_future().wait_for(5s) == std::future_status::ready);
    stream.stop();
    CHECK_FALSE(stream.running());

    CHECK(stream.line_count() == 5);
    REQUIRE(captured.flows.size() == 3);
    CHECK(captured.flows[0] == "{\"ip_src\": \"10.0.1.1\", \"ip_dst\": \"10.0.2.1\", \"packets\": 2, \"bytes\": 143}");
    CHECK(captured.flows[2] == "{truncated");
    REQUIRE(captured.diagnostics.size() == 2);
    CHECK(captured.diagnostics[0] == "INFO ( default/core ): Start logging ...");
    CHECK(captured.diagnostics[1].empty());
    // signals fire in line order
    REQUIRE(captured.order.size() == 5);
    CHECK(captured.order[1] == captured.flows[0]);
    CHECK(captured.order[2].empty());

    json j;
    stream.info_json(j);
    CHECK(j["module"]["name"] == "collector");
    CHECK(j["line"]["lines"] == 5);
}

TEST_CASE("Line input stop closes the source", "[input][line]")
{
    int fds[2];
    REQUIRE(pipe(fds) == 0);

    LineInputStream stream("stdin", std::make_unique<FdLineSource>(fds[0], true, "pipe"));
    auto proxy = static_cast<LineEventProxy *>(stream.add_event_proxy());
    Captured captured;
    std::promise<void> ended;
    auto ended_future = ended.get_future();
    capture(proxy, captured, ended);

    stream.start();
    std::string line = "{\"bytes\": 1}\n";
    REQUIRE(write(fds[1], line.data(), line.size()) == static_cast<ssize_t>(line.size()));

    // writer stays open: only stop() can end the stream
    CHECK(ended_future.wait_for(100ms) == std::future_status::timeout);
    stream.stop();
    CHECK(ended_future.wait_for(0s) == std::future_status::ready);
    close(fds[1]);
}

TEST_CASE("FdLineSource", "[input][line]")
{
    int fds[2];
    REQUIRE(pipe(fds) == 0);
    FdLineSource source(fds[0], true, "pipe");
    CHECK(source.description() == "pipe");

    SECTION("lines and final unterminated line")
    {
        std::string data = "first\nsecond\nlast";
        REQUIRE(write(fds[1], data.data(), data.size()) == static_cast<ssize_t>(data.size()));
        close(fds[1]);

        std::string line;
        REQUIRE(source.read_line(line));
        CHECK(line == "first");
        REQUIRE(source.read_line(line));
        CHECK(line == "second");
        REQUIRE(source.read_line(line));
        CHECK(line == "last");
        CHECK_FALSE(source.read_line(line));
        CHECK_FALSE(source.read_line(line));
    }

    SECTION("close wakes a blocked reader")
    {
        auto reader = std::async(std::launch::async, [&source] {
            std::string line;
            return source.read_line(line);
        });
        CHECK(reader.wait_for(100ms) == std::future_status::timeout);
        source.close();
        REQUIRE(reader.wait_for(5s) == std::future_status::ready);
        CHECK_FALSE(reader.get());
        close(fds[1]);
    }
}

TEST_CASE("Collector process", "[input][collector]")
{
    SECTION("split command")
    {
        auto argv = CollectorProcess::split_command("  pmacctd -r 1 -c src_host,dst_host   -P print -O json ");
        CHECK(argv == std::vector<std::string>{"pmacctd", "-r", "1", "-c", "src_host,dst_host", "-P", "print", "-O", "json"});
        CHECK(CollectorProcess::split_command(CollectorProcess::DEFAULT_COMMAND).front() == "pmacctd");
        CHECK(CollectorProcess::split_command("   ").empty());
    }

    SECTION("empty command")
    {
        CHECK_THROWS_AS(CollectorProcess(std::vector<std::string>{}), CollectorException);
    }

    SECTION("stdout is piped")
    {
        CollectorProcess collector({"/bin/sh", "-c", "printf 'INFO starting\\n{\"bytes\": 1}\\n'"});
        collector.spawn();
        CHECK(collector.running());
        CHECK(collector.pid() > 0);

        FdLineSource source(collector.release_stdout(), true, "collector");
        std::string line;
        REQUIRE(source.read_line(line));
        CHECK(line == "INFO starting");
        REQUIRE(source.read_line(line));
        CHECK(line == "{\"bytes\": 1}");
        CHECK_FALSE(source.read_line(line));

        CHECK(collector.wait() == 0);
        CHECK_FALSE(collector.running());
    }

    SECTION("exit status")
    {
        CollectorProcess collector({"/bin/sh", "-c", "exit 3"});
        collector.spawn();
        CHECK(collector.wait() == 3);
    }

    SECTION("interrupt")
    {
        CollectorProcess collector({"sleep", "30"});
        collector.spawn();
        collector.interrupt(SIGTERM);
        CHECK(collector.wait() == 128 + SIGTERM);
    }

    SECTION("missing executable")
    {
        CollectorProcess collector({"/nonexistent/pmacctd", "-P", "print"});
        CHECK_THROWS_AS(collector.spawn(), CollectorException);
        CHECK_FALSE(collector.running());
    }
}
