#include "output_parser.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <iostream>

namespace sidecar {

namespace {

constexpr std::array<std::string_view, 3> kErrorKeywords = {"error", "failed", "exception"};

std::string_view trim(std::string_view s) {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!s.empty() && is_space(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_space(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

bool contains_ignore_case(std::string_view haystack, std::string_view needle) {
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    return it != haystack.end();
}

std::string describe_exit(const std::optional<int>& code, const std::optional<int>& sig) {
    if (code.has_value()) {
        return "code " + std::to_string(*code);
    }
    if (sig.has_value()) {
        return "signal " + std::to_string(*sig);
    }
    return "unknown status";
}

} // anonymous namespace

Severity classify_stderr_line(std::string_view line) {
    for (auto keyword : kErrorKeywords) {
        if (contains_ignore_case(line, keyword)) {
            return Severity::Error;
        }
    }
    return Severity::Info;
}

PortLine parse_port_line(std::string_view line) {
    PortLine result;

    auto pos = line.find(kPortMarker);
    if (pos == std::string_view::npos) {
        return result;
    }

    std::string_view value = trim(line.substr(pos + kPortMarker.size()));
    result.raw_value = std::string(value);

    uint16_t port = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), port);
    if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
        result.kind = PortLine::Kind::Malformed;
        return result;
    }

    result.kind = PortLine::Kind::Port;
    result.port = port;
    return result;
}

OutputParser::OutputParser(EndpointRegistry& registry, EventRelay& relay, SeverityPolicy policy)
    : registry_(registry), relay_(relay), policy_(std::move(policy)) {
    if (!policy_) {
        policy_ = classify_stderr_line;
    }
}

bool OutputParser::handle(const StreamEvent& event) {
    if (finished_) {
        return false;
    }

    switch (event.kind) {
    case StreamEvent::Kind::StdoutLine:
        handle_stdout(event.text);
        return true;

    case StreamEvent::Kind::StderrLine:
        handle_stderr(event.text);
        return true;

    case StreamEvent::Kind::SpawnError:
        std::cerr << "[OutputParser] Failed to start sidecar: " << event.text << std::endl;
        relay_.emit(NotificationEvent::worker_error(event.text));
        finished_ = true;
        return false;

    case StreamEvent::Kind::Terminated:
        std::cerr << "[OutputParser] Sidecar terminated with "
                  << describe_exit(event.exit_code, event.signal) << std::endl;
        relay_.emit(NotificationEvent::worker_terminated(event.exit_code, event.signal));
        finished_ = true;
        return false;
    }
    return true;
}

void OutputParser::drain(EventChannel<StreamEvent>& channel,
                         std::chrono::milliseconds startup_timeout,
                         std::function<void()> on_startup_timeout) {
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + startup_timeout;

    while (!finished_) {
        std::optional<StreamEvent> event;

        bool waiting_for_port = startup_timeout.count() > 0 && !timed_out_ && !registry_.has_port();
        if (waiting_for_port) {
            auto now = Clock::now();
            if (now >= deadline) {
                handle_startup_timeout(startup_timeout);
                if (on_startup_timeout) {
                    on_startup_timeout();
                }
                continue;
            }
            event = channel.pop_for(deadline - now);
            if (!event) {
                if (channel.is_closed()) {
                    break;
                }
                continue;
            }
        } else {
            event = channel.pop();
            if (!event) {
                break;
            }
        }

        if (!handle(*event)) {
            break;
        }
    }

    if (!finished_) {
        std::cerr << "[OutputParser] Event channel closed before the sidecar terminated" << std::endl;
        finished_ = true;
    }
}

void OutputParser::handle_stdout(const std::string& line) {
    std::cout << "[OutputParser] Sidecar stdout: " << line << std::endl;

    PortLine parsed = parse_port_line(line);
    switch (parsed.kind) {
    case PortLine::Kind::NoMarker:
        diagnostic_lines_++;
        break;

    case PortLine::Kind::Malformed:
        parse_anomalies_++;
        std::cerr << "[OutputParser] Ignoring malformed port value '" << parsed.raw_value
                  << "'" << std::endl;
        break;

    case PortLine::Kind::Port:
        if (!registry_.set(parsed.port)) {
            std::cout << "[OutputParser] Port already known ("
                      << registry_.get().value_or(0) << "), ignoring " << parsed.port << std::endl;
            break;
        }
        std::cout << "[OutputParser] Extracted sidecar port: " << parsed.port << std::endl;
        relay_.emit(NotificationEvent::port_ready(parsed.port));
        break;
    }
}

void OutputParser::handle_stderr(const std::string& line) {
    if (policy_(line) == Severity::Error) {
        worker_errors_++;
        std::cerr << "[OutputParser] Sidecar error: " << line << std::endl;
    } else {
        diagnostic_lines_++;
        std::cout << "[OutputParser] Sidecar stderr: " << line << std::endl;
    }
}

void OutputParser::handle_startup_timeout(std::chrono::milliseconds timeout) {
    timed_out_ = true;
    std::string limit = timeout.count() % 1000 == 0
                            ? std::to_string(timeout.count() / 1000) + " seconds"
                            : std::to_string(timeout.count()) + " ms";
    std::string message = "Sidecar did not report its port within " + limit;
    std::cerr << "[OutputParser] " << message << std::endl;
    relay_.emit(NotificationEvent::worker_error(message));
}

} // namespace sidecar
