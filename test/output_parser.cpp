#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "endpoint_registry.hpp"
#include "event_channel.hpp"
#include "event_relay.hpp"
#include "output_parser.hpp"

using sidecar::EndpointRegistry;
using sidecar::EventChannel;
using sidecar::EventRelay;
using sidecar::NotificationEvent;
using sidecar::OutputParser;
using sidecar::PortLine;
using sidecar::Severity;
using sidecar::StreamEvent;

namespace {

class Recorder {
public:
    explicit Recorder(EventRelay& relay) {
        relay.subscribe([this](const NotificationEvent& e) { events.push_back(e); });
    }

    std::vector<std::string> names() const {
        std::vector<std::string> res;
        for (const auto& e : events) {
            res.emplace_back(e.name());
        }
        return res;
    }

    std::vector<NotificationEvent> events;
};

} // namespace

// NOLINTNEXTLINE
TEST(parse_port_line, plain_marker) {
    auto res = sidecar::parse_port_line("SERVER_PORT=54213");
    ASSERT_EQ(res.kind, PortLine::Kind::Port);
    ASSERT_EQ(res.port, 54213);
}

// NOLINTNEXTLINE
TEST(parse_port_line, marker_inside_line_with_whitespace) {
    auto res = sidecar::parse_port_line("INFO: SERVER_PORT= 8080 \r");
    ASSERT_EQ(res.kind, PortLine::Kind::Port);
    ASSERT_EQ(res.port, 8080);
}

// NOLINTNEXTLINE
TEST(parse_port_line, every_u16_value) {
    for (unsigned p = 0; p <= 65535; ++p) {
        auto res = sidecar::parse_port_line("SERVER_PORT=" + std::to_string(p));
        ASSERT_EQ(res.kind, PortLine::Kind::Port) << p;
        ASSERT_EQ(res.port, p);
    }
}

// NOLINTNEXTLINE
TEST(parse_port_line, malformed_values) {
    for (const char* line : {"SERVER_PORT=", "SERVER_PORT=65536", "SERVER_PORT=-1", "SERVER_PORT=12a",
                             "SERVER_PORT=abc", "SERVER_PORT=80 81", "SERVER_PORT=99999999999"}) {
        ASSERT_EQ(sidecar::parse_port_line(line).kind, PortLine::Kind::Malformed) << line;
    }
}

// NOLINTNEXTLINE
TEST(parse_port_line, no_marker) {
    ASSERT_EQ(sidecar::parse_port_line("Listening...").kind, PortLine::Kind::NoMarker);
    ASSERT_EQ(sidecar::parse_port_line("server_port=80").kind, PortLine::Kind::NoMarker);
    ASSERT_EQ(sidecar::parse_port_line("").kind, PortLine::Kind::NoMarker);
}

// NOLINTNEXTLINE
TEST(classify_stderr_line, keywords_any_case) {
    ASSERT_EQ(sidecar::classify_stderr_line("Download FAILED"), Severity::Error);
    ASSERT_EQ(sidecar::classify_stderr_line("failed to bind"), Severity::Error);
    ASSERT_EQ(sidecar::classify_stderr_line("ERROR: disk full"), Severity::Error);
    ASSERT_EQ(sidecar::classify_stderr_line("Unhandled Exception in task"), Severity::Error);
}

// NOLINTNEXTLINE
TEST(classify_stderr_line, routine_output) {
    ASSERT_EQ(sidecar::classify_stderr_line("connected"), Severity::Info);
    ASSERT_EQ(sidecar::classify_stderr_line("INFO:     Uvicorn running on http://127.0.0.1:54213"),
              Severity::Info);
    ASSERT_EQ(sidecar::classify_stderr_line(""), Severity::Info);
}

// NOLINTNEXTLINE
TEST(output_parser, listening_then_port_then_exit) {
    EndpointRegistry registry;
    EventRelay relay;
    Recorder rec(relay);
    OutputParser parser(registry, relay);

    ASSERT_TRUE(parser.handle(StreamEvent::stdout_line("Listening...")));
    ASSERT_TRUE(parser.handle(StreamEvent::stdout_line("SERVER_PORT=54213")));
    ASSERT_FALSE(parser.handle(StreamEvent::terminated(0)));

    ASSERT_EQ(sidecar::get_sidecar_port(registry), 54213);
    ASSERT_EQ(rec.names(), (std::vector<std::string>{"sidecar-port", "sidecar-terminated"}));
    ASSERT_EQ(rec.events[0].port, 54213);
    ASSERT_EQ(rec.events[1].exit_code, 0);
    ASSERT_TRUE(parser.finished());
}

// NOLINTNEXTLINE
TEST(output_parser, later_port_lines_are_ignored) {
    EndpointRegistry registry;
    EventRelay relay;
    Recorder rec(relay);
    OutputParser parser(registry, relay);

    parser.handle(StreamEvent::stdout_line("SERVER_PORT=1000"));
    parser.handle(StreamEvent::stdout_line("SERVER_PORT=2000"));
    parser.handle(StreamEvent::stdout_line("SERVER_PORT=1000"));

    ASSERT_EQ(registry.get(), 1000);
    ASSERT_EQ(rec.events.size(), 1);
}

// NOLINTNEXTLINE
TEST(output_parser, malformed_port_is_not_fatal) {
    EndpointRegistry registry;
    EventRelay relay;
    Recorder rec(relay);
    OutputParser parser(registry, relay);

    ASSERT_TRUE(parser.handle(StreamEvent::stdout_line("SERVER_PORT=70000")));
    ASSERT_EQ(parser.parse_anomalies(), 1);
    ASSERT_FALSE(registry.has_port());
    ASSERT_TRUE(rec.events.empty());

    ASSERT_TRUE(parser.handle(StreamEvent::stdout_line("SERVER_PORT=7000")));
    ASSERT_EQ(registry.get(), 7000);
}

// NOLINTNEXTLINE
TEST(output_parser, stderr_never_notifies) {
    EndpointRegistry registry;
    EventRelay relay;
    Recorder rec(relay);
    OutputParser parser(registry, relay);

    parser.handle(StreamEvent::stderr_line("Traceback: ValueError exception"));
    parser.handle(StreamEvent::stderr_line("connected to upstream"));
    parser.handle(StreamEvent::stderr_line("SERVER_PORT=1234"));

    ASSERT_EQ(parser.worker_errors(), 1);
    ASSERT_EQ(parser.diagnostic_lines(), 2);
    ASSERT_FALSE(registry.has_port());
    ASSERT_TRUE(rec.events.empty());
}

// NOLINTNEXTLINE
TEST(output_parser, custom_severity_policy) {
    EndpointRegistry registry;
    EventRelay relay;
    OutputParser parser(registry, relay, [](std::string_view line) {
        return line.rfind("E ", 0) == 0 ? Severity::Error : Severity::Info;
    });

    parser.handle(StreamEvent::stderr_line("E disk"));
    parser.handle(StreamEvent::stderr_line("request failed"));

    ASSERT_EQ(parser.worker_errors(), 1);
    ASSERT_EQ(parser.diagnostic_lines(), 1);
}

// NOLINTNEXTLINE
TEST(output_parser, spawn_error_ends_supervision) {
    EndpointRegistry registry;
    EventRelay relay;
    Recorder rec(relay);
    OutputParser parser(registry, relay);

    ASSERT_FALSE(parser.handle(StreamEvent::spawn_error("Sidecar binary not found")));
    ASSERT_FALSE(parser.handle(StreamEvent::stdout_line("SERVER_PORT=1")));

    ASSERT_EQ(rec.names(), (std::vector<std::string>{"sidecar-error"}));
    ASSERT_EQ(rec.events[0].message, "Sidecar binary not found");
    ASSERT_FALSE(registry.has_port());
}

// NOLINTNEXTLINE
TEST(output_parser, drain_consumes_until_terminated) {
    EndpointRegistry registry;
    EventRelay relay;
    Recorder rec(relay);
    OutputParser parser(registry, relay);

    EventChannel<StreamEvent> channel;
    channel.push(StreamEvent::stderr_line("starting up"));
    channel.push(StreamEvent::stdout_line("SERVER_PORT=9100"));
    channel.push(StreamEvent::terminated(std::nullopt, 15));
    channel.push(StreamEvent::stdout_line("SERVER_PORT=9200"));

    parser.drain(channel);

    ASSERT_EQ(registry.get(), 9100);
    ASSERT_EQ(rec.names(), (std::vector<std::string>{"sidecar-port", "sidecar-terminated"}));
    ASSERT_FALSE(rec.events[1].exit_code.has_value());
    ASSERT_EQ(rec.events[1].signal, 15);
    ASSERT_EQ(channel.size(), 1);
}

// NOLINTNEXTLINE
TEST(output_parser, drain_returns_when_channel_closes) {
    EndpointRegistry registry;
    EventRelay relay;
    Recorder rec(relay);
    OutputParser parser(registry, relay);

    EventChannel<StreamEvent> channel;
    channel.push(StreamEvent::stdout_line("hello"));
    channel.close();

    parser.drain(channel);

    ASSERT_TRUE(parser.finished());
    ASSERT_TRUE(rec.events.empty());
}

// NOLINTNEXTLINE
TEST(output_parser, startup_timeout_reports_error_then_keeps_draining) {
    EndpointRegistry registry;
    EventRelay relay;
    Recorder rec(relay);
    OutputParser parser(registry, relay);

    EventChannel<StreamEvent> channel;
    int timeouts = 0;
    parser.drain(channel, std::chrono::milliseconds(50), [&] {
        timeouts++;
        channel.push(StreamEvent::terminated(std::nullopt, 15));
    });

    ASSERT_EQ(timeouts, 1);
    ASSERT_EQ(rec.names(), (std::vector<std::string>{"sidecar-error", "sidecar-terminated"}));
    ASSERT_NE(rec.events[0].message.find("did not report its port"), std::string::npos);
}

// NOLINTNEXTLINE
TEST(output_parser, startup_timeout_not_triggered_once_port_known) {
    EndpointRegistry registry;
    EventRelay relay;
    Recorder rec(relay);
    OutputParser parser(registry, relay);

    EventChannel<StreamEvent> channel;
    channel.push(StreamEvent::stdout_line("SERVER_PORT=3000"));
    std::thread producer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        channel.push(StreamEvent::terminated(0));
    });

    int timeouts = 0;
    parser.drain(channel, std::chrono::milliseconds(50), [&] { timeouts++; });
    producer.join();

    ASSERT_EQ(timeouts, 0);
    ASSERT_EQ(rec.names(), (std::vector<std::string>{"sidecar-port", "sidecar-terminated"}));
}
