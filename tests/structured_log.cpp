#include "wormhole/diagnostics/StructuredLogger.hpp"
#include "wormhole/protocol/Json.hpp"
#include "wormhole/receive/ReceiveSession.hpp"
#include "test_support.hpp"

#include <cassert>
#include <sstream>
#include <string>
#include <vector>

using namespace wormhole;

namespace {

std::vector<protocol::json::Value> parse_lines(const std::string& text) {
    std::vector<protocol::json::Value> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(protocol::json::parse(line));
    }
    return lines;
}

bool has_event(const std::vector<protocol::json::Value>& lines, const std::string& event) {
    for (const auto& line : lines) {
        if (line.find("event")->string_value == event) {
            return true;
        }
    }
    return false;
}

}  // namespace

int main() {
    auto& logger = diagnostics::StructuredLogger::instance();
    std::ostringstream sink;
    logger.set_stream(&sink);

    diagnostics::log_info("test.event", {{"quote", "say \"hi\"\n"}});
    auto lines = parse_lines(sink.str());
    assert(lines.size() == 1);
    assert(lines[0].find("level")->string_value == "info");
    assert(lines[0].find("fields")->find("quote")->string_value == "say \"hi\"\n");
    assert(lines[0].find("ts")->string_value.back() == 'Z');

    sink.str({});
    logger.set_minimum_level(diagnostics::StructuredLogger::Level::Warning);
    diagnostics::log_info("test.dropped");
    diagnostics::log_warning("test.kept");
    lines = parse_lines(sink.str());
    assert(lines.size() == 1);
    assert(lines[0].find("event")->string_value == "test.kept");
    logger.set_minimum_level(diagnostics::StructuredLogger::Level::Info);

    sink.str({});
    logger.set_enabled(false);
    diagnostics::log_error("test.silenced");
    assert(sink.str().empty());
    logger.set_enabled(true);
    assert(logger.enabled());

    // A rejected offer leaves a trail without touching the user-facing output.
    test::FakeWormholeChannel channel;
    channel.queue(R"({"offer": {"bogus": true}})");
    auto record = std::make_shared<test::TransitRecord>();
    std::ostringstream out;
    std::ostringstream err;
    std::istringstream in;
    ReceiveConfig config{};
    config.code = "9-z";
    const auto outcome = receive::receive(channel, config, {out, err, in, test::fake_transit_factory(record)});
    assert(outcome.status == receive::SessionOutcome::Status::Rejected);

    lines = parse_lines(sink.str());
    assert(has_event(lines, "receive.code"));
    assert(has_event(lines, "receive.verified"));
    assert(has_event(lines, "receive.rejected"));
    assert(has_event(lines, "receive.closed"));
    assert(out.str().find("\"event\"") == std::string::npos);

    logger.set_stream(nullptr);
    return 0;
}
