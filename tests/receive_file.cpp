#include "wormhole/receive/ReceiveSession.hpp"
#include "test_support.hpp"

#include <cassert>
#include <iostream>
#include <sstream>

using namespace wormhole;

namespace {

constexpr const char* kTransit = R"({"transit": {
    "direct_connection_hints": [{"type": "direct-tcp-v1", "hostname": "198.51.100.4", "port": 4001}],
    "relay_connection_hints": []}})";

}  // namespace

int main() {
    test::ScopedTempDir dir;
    const std::string payload = "0123456789abcdef0123456789abcdef!";

    test::FakeWormholeChannel channel;
    channel.queue(kTransit);
    channel.queue(R"({"offer": {"file": {"filename": "/home/sender/notes.txt", "filesize": 33}}})");

    auto record = std::make_shared<test::TransitRecord>();
    record->pipe = std::make_shared<test::PipeScript>();
    record->pipe->chunks = test::chunked(to_bytes(payload), 10);

    std::ostringstream out;
    std::ostringstream err;
    std::istringstream in("y\n");

    ReceiveConfig config{};
    config.code = "2-tango-foxtrot";
    config.cwd = dir.path();

    receive::ReceiveSession session(channel, config, {out, err, in, test::fake_transit_factory(record)});
    session.go();

    assert(session.state() == receive::SessionState::Succeeded);
    assert(session.bytes_received() == payload.size());
    assert(test::read_file(dir.path() / "notes.txt") == payload);
    assert(!std::filesystem::exists(dir.path() / "notes.txt.tmp"));

    const std::string expected_out =
        "Receiving file (33 bytes) into: notes.txt\n"
        "ok? (y/n): Receiving (->tcp:fake-peer:4001)..\n"
        "Received file written to notes.txt\n";
    if (out.str() != expected_out) {
        std::cerr << "[ReceiveFile] unexpected output:\n" << out.str() << std::endl;
        return 1;
    }

    assert(record->created == 1);
    assert(record->connects == 1);
    assert(record->key == Bytes(32, 0x42));
    assert(channel.derived_purposes.size() == 1);
    assert(channel.derived_purposes[0] == "lothar.com/wormhole/text-or-file-xfer/transit-key");
    assert(record->peer_direct.size() == 1);
    assert(record->peer_direct[0].hostname == "198.51.100.4");

    assert(channel.sent.size() == 2);
    assert(channel.sent[0].rfind(R"({"transit":{"direct_connection_hints":[{"hostname":"192.0.2.7")", 0) == 0);
    assert(channel.sent[1] == R"({"answer":{"file_ack":"ok"}})");

    assert(record->pipe->records_sent.size() == 1);
    assert(record->pipe->records_sent[0] == "ok\n");
    assert(record->pipe->closed);
    assert(channel.close_calls == 1);

    // With accept_file set no prompt is shown and the output override names the file.
    test::FakeWormholeChannel second;
    second.queue(kTransit);
    second.queue(R"({"offer": {"file": {"filename": "ignored.txt", "filesize": 4}}})");
    auto second_record = std::make_shared<test::TransitRecord>();
    second_record->pipe = std::make_shared<test::PipeScript>();
    second_record->pipe->chunks = {to_bytes("data")};

    ReceiveConfig automatic{};
    automatic.code = "3-x";
    automatic.cwd = dir.path();
    automatic.accept_file = true;
    automatic.output_file = "renamed.txt";
    std::ostringstream second_out;
    std::istringstream no_input;
    const auto outcome = receive::receive(second, automatic,
                                          {second_out, err, no_input, test::fake_transit_factory(second_record)});
    assert(outcome.ok());
    assert(test::read_file(dir.path() / "renamed.txt") == "data");
    assert(!std::filesystem::exists(dir.path() / "ignored.txt"));
    assert(second_out.str().find("ok? (y/n)") == std::string::npos);
    assert(err.str().empty());

    // Only the first transit message builds a transit channel; later hints are dropped.
    test::FakeWormholeChannel repeated;
    repeated.queue(kTransit);
    repeated.queue(R"({"transit": {
        "direct_connection_hints": [{"type": "direct-tcp-v1", "hostname": "203.0.113.50", "port": 4009}],
        "relay_connection_hints": [{"type": "relay-v1", "hints": [
            {"type": "direct-tcp-v1", "hostname": "relay.example", "port": 4001}]}]}})");
    repeated.queue(R"({"offer": {"file": {"filename": "twice.txt", "filesize": 4}}})");
    auto repeated_record = std::make_shared<test::TransitRecord>();
    repeated_record->pipe = std::make_shared<test::PipeScript>();
    repeated_record->pipe->chunks = {to_bytes("once")};

    ReceiveConfig twice{};
    twice.code = "4-echo";
    twice.cwd = dir.path();
    twice.accept_file = true;
    std::ostringstream repeated_out;
    const auto repeated_outcome = receive::receive(
        repeated, twice, {repeated_out, err, no_input, test::fake_transit_factory(repeated_record)});
    assert(repeated_outcome.ok());
    assert(test::read_file(dir.path() / "twice.txt") == "once");
    assert(repeated_record->created == 1);
    assert(repeated_record->connects == 1);
    assert(repeated_record->peer_direct.size() == 1);
    assert(repeated_record->peer_direct[0].hostname == "198.51.100.4");
    assert(repeated_record->peer_relay.empty());
    assert(repeated.derived_purposes.size() == 1);

    std::size_t transit_replies = 0;
    for (const auto& sent : repeated.sent) {
        if (sent.rfind(R"({"transit":)", 0) == 0) {
            ++transit_replies;
        }
    }
    assert(transit_replies == 1);
    assert(repeated.sent.size() == 2);

    return 0;
}
