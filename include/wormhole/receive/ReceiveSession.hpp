#pragma once

#include "wormhole/Config.hpp"
#include "wormhole/Export.hpp"
#include "wormhole/channel/RecordPipe.hpp"
#include "wormhole/channel/TransitChannel.hpp"
#include "wormhole/channel/WormholeChannel.hpp"
#include "wormhole/protocol/Negotiation.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>

namespace wormhole::receive {

using TransitFactory = std::function<std::unique_ptr<channel::TransitChannel>(const ReceiveConfig&)>;

// Where a session talks to the user and how it reaches the network.
struct ReceiveRuntime {
    std::ostream& out;
    std::ostream& err;
    std::istream& in;
    TransitFactory make_transit;
};

// std::cout, std::cerr, std::cin and TcpTransit.
WORMHOLE_API ReceiveRuntime default_runtime();

enum class SessionState {
    Created,
    AwaitingCode,
    Verifying,
    AwaitingMessage,
    Negotiating,
    AwaitingConsent,
    EstablishingTransit,
    Transferring,
    Materializing,
    Closing,
    Succeeded,
    Failed
};

std::string_view to_string(SessionState state);

// Drives one receive: code entry, verification, the negotiation loop and,
// for files and directories, the bulk transfer. The wormhole channel is
// closed on every exit path of go().
class WORMHOLE_API ReceiveSession {
public:
    ReceiveSession(channel::WormholeChannel& channel, ReceiveConfig config, ReceiveRuntime runtime);

    ReceiveSession(const ReceiveSession&) = delete;
    ReceiveSession& operator=(const ReceiveSession&) = delete;

    // Returns on success. Throws AuthenticationError, TransferError,
    // ConfigError or an I/O error otherwise; ResponderError never escapes.
    void go();

    SessionState state() const noexcept { return state_; }
    std::uint64_t bytes_received() const noexcept { return bytes_received_; }

private:
    void run();
    void handle_code();
    void show_verifier();
    void negotiate();
    void handle_transit(const protocol::TransitHintSet& hints);
    void build_transit(const protocol::TransitHintSet& hints);
    void handle_offer(const protocol::json::Value& offer);
    void handle_text(const protocol::TextOffer& offer);
    void handle_file(const protocol::FileOffer& offer);
    void handle_directory(const protocol::DirectoryOffer& offer);
    void handle_unknown(const protocol::UnknownOffer& offer);

    std::unique_ptr<channel::RecordPipe> establish_transit();
    void transfer_data(channel::RecordPipe& pipe, channel::TransferTarget& target);
    void close_transit(channel::RecordPipe& pipe);

    void send_data(ByteView message);
    void notify_peer(const std::string& reason);
    void close_after_failure();
    void msg(const std::string& line);

    channel::WormholeChannel& channel_;
    ReceiveConfig config_;
    ReceiveRuntime runtime_;
    std::unique_ptr<channel::TransitChannel> transit_;
    SessionState state_{SessionState::Created};
    std::uint64_t expected_size_{0};
    std::uint64_t bytes_received_{0};
    bool offer_handled_{false};
};

struct SessionOutcome {
    enum class Status {
        Success,
        Rejected,
        Aborted
    };

    enum class ErrorKind {
        None,
        Authentication,
        Config,
        Io
    };

    Status status{Status::Success};
    ErrorKind error{ErrorKind::None};
    std::string reason;

    bool ok() const noexcept { return status == Status::Success; }
};

// Runs a session and folds its failure into an outcome: TransferError
// becomes Rejected, everything else Aborted.
WORMHOLE_API SessionOutcome receive(channel::WormholeChannel& channel,
                                    const ReceiveConfig& config,
                                    ReceiveRuntime runtime);

}  // namespace wormhole::receive
