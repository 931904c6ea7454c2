#include "wormhole/receive/ReceiveSession.hpp"

#include "wormhole/Errors.hpp"
#include "wormhole/diagnostics/StructuredLogger.hpp"
#include "wormhole/receive/DestinationResolver.hpp"
#include "wormhole/receive/PermissionGate.hpp"
#include "wormhole/receive/TransferTargets.hpp"
#include "wormhole/receive/ZipExtractor.hpp"
#include "wormhole/transit/TcpTransit.hpp"

#include <iostream>
#include <utility>
#include <variant>

namespace wormhole::receive {

namespace {

constexpr std::string_view kCodePrompt = "Enter receive wormhole code: ";
constexpr std::string_view kZeroModeCode = "0-";
constexpr std::string_view kTransitKeySuffix = "/transit-key";
constexpr std::string_view kCompletionRecord = "ok\n";

std::string display_name(const std::filesystem::path& path) {
    return path.filename().string();
}

}  // namespace

ReceiveRuntime default_runtime() {
    return ReceiveRuntime{std::cout, std::cerr, std::cin, &transit::make_tcp_transit};
}

std::string_view to_string(SessionState state) {
    switch (state) {
        case SessionState::Created:
            return "created";
        case SessionState::AwaitingCode:
            return "awaiting_code";
        case SessionState::Verifying:
            return "verifying";
        case SessionState::AwaitingMessage:
            return "awaiting_message";
        case SessionState::Negotiating:
            return "negotiating";
        case SessionState::AwaitingConsent:
            return "awaiting_consent";
        case SessionState::EstablishingTransit:
            return "establishing_transit";
        case SessionState::Transferring:
            return "transferring";
        case SessionState::Materializing:
            return "materializing";
        case SessionState::Closing:
            return "closing";
        case SessionState::Succeeded:
            return "succeeded";
        case SessionState::Failed:
            return "failed";
    }
    return "unknown";
}

ReceiveSession::ReceiveSession(channel::WormholeChannel& channel, ReceiveConfig config, ReceiveRuntime runtime)
    : channel_(channel), config_(std::move(config)), runtime_(std::move(runtime)) {}

void ReceiveSession::go() {
    try {
        run();
    } catch (...) {
        state_ = SessionState::Failed;
        close_after_failure();
        throw;
    }

    state_ = SessionState::Closing;
    try {
        channel_.close();
    } catch (...) {
        state_ = SessionState::Failed;
        throw;
    }
    state_ = SessionState::Succeeded;
    diagnostics::log_info("receive.closed", {{"state", std::string(to_string(state_))}});
}

void ReceiveSession::run() {
    validate(config_);
    handle_code();
    show_verifier();
    negotiate();
}

void ReceiveSession::handle_code() {
    state_ = SessionState::AwaitingCode;
    auto code = config_.code;
    if (config_.zero_mode) {
        code = std::string(kZeroModeCode);
    }

    if (code && !code->empty()) {
        channel_.set_code(*code);
        diagnostics::log_info("receive.code", {{"source", config_.zero_mode ? "zero" : "configured"}});
    } else {
        channel_.input_code(std::string(kCodePrompt), config_.code_length);
        diagnostics::log_info("receive.code", {{"source", "interactive"}});
    }
}

void ReceiveSession::show_verifier() {
    state_ = SessionState::Verifying;
    const auto verifier = channel_.verify();
    diagnostics::log_info("receive.verified");
    if (config_.verify) {
        msg("Verifier " + to_hex(verifier) + ".");
    }
}

void ReceiveSession::negotiate() {
    while (true) {
        state_ = SessionState::AwaitingMessage;
        Bytes raw;
        try {
            raw = channel_.get();
        } catch (const ChannelClosedError&) {
            throw TransferError("unexpected close");
        }

        const auto message = protocol::decode_message(raw);
        state_ = SessionState::Negotiating;
        switch (message.kind) {
            case protocol::MessageKind::Error:
                throw TransferError(message.error);
            case protocol::MessageKind::Transit:
                handle_transit(message.transit);
                continue;
            case protocol::MessageKind::Offer:
                if (offer_handled_) {
                    throw TransferError("duplicate offer");
                }
                offer_handled_ = true;
                try {
                    handle_offer(message.offer);
                } catch (const ResponderError& rejection) {
                    notify_peer(rejection.response());
                    throw TransferError(rejection.response());
                }
                return;
            case protocol::MessageKind::Unknown:
                diagnostics::log_warning("receive.unrecognized_message",
                                         {{"message", protocol::json::serialize(message.raw)}});
                throw TransferError("expected offer, got none");
        }
    }
}

void ReceiveSession::handle_transit(const protocol::TransitHintSet& hints) {
    if (transit_) {
        diagnostics::log_info("receive.transit_hints_ignored");
        return;
    }
    build_transit(hints);
}

void ReceiveSession::build_transit(const protocol::TransitHintSet& hints) {
    transit_ = runtime_.make_transit(config_);
    if (!transit_) {
        throw TransferError("transit channel unavailable");
    }

    const auto key = channel_.derive_key(std::string(kAppId) + std::string(kTransitKeySuffix),
                                         channel::TransitChannel::kTransitKeyLength);
    transit_->set_transit_key(key);
    transit_->add_peer_direct_hints(hints.direct_hints);
    transit_->add_peer_relay_hints(hints.relay_hints);

    protocol::TransitHintSet own{};
    own.direct_hints = transit_->own_direct_hints();
    own.relay_hints = transit_->own_relay_hints();
    diagnostics::log_info("receive.transit_hints", {{"peer_direct", std::to_string(hints.direct_hints.size())},
                                                    {"peer_relay", std::to_string(hints.relay_hints.size())},
                                                    {"own_direct", std::to_string(own.direct_hints.size())},
                                                    {"own_relay", std::to_string(own.relay_hints.size())}});
    send_data(protocol::encode_transit(own));
}

void ReceiveSession::handle_offer(const protocol::json::Value& value) {
    const auto offer = protocol::decode_offer(value);
    if (const auto* text = std::get_if<protocol::TextOffer>(&offer)) {
        handle_text(*text);
    } else if (const auto* file = std::get_if<protocol::FileOffer>(&offer)) {
        handle_file(*file);
    } else if (const auto* directory = std::get_if<protocol::DirectoryOffer>(&offer)) {
        handle_directory(*directory);
    } else {
        handle_unknown(std::get<protocol::UnknownOffer>(offer));
    }
}

void ReceiveSession::handle_text(const protocol::TextOffer& offer) {
    diagnostics::log_info("receive.offer", {{"type", "text"}, {"bytes", std::to_string(offer.body.size())}});
    msg(offer.body);
    send_data(protocol::encode_message_ack());
}

void ReceiveSession::handle_file(const protocol::FileOffer& offer) {
    diagnostics::log_info("receive.offer", {{"type", "file"}, {"bytes", std::to_string(offer.size)}});
    const DestinationResolver resolver(config_.cwd, config_.output_file, runtime_.out);
    const auto destination = resolver.resolve(DestinationKind::File, offer.filename);
    expected_size_ = offer.size;

    msg("Receiving file (" + std::to_string(expected_size_) + " bytes) into: " + display_name(destination));
    state_ = SessionState::AwaitingConsent;
    PermissionGate(config_.accept_file, runtime_.in, runtime_.out, runtime_.err).request();

    FileTarget target(destination);
    send_data(protocol::encode_file_ack());
    auto pipe = establish_transit();
    transfer_data(*pipe, target);

    state_ = SessionState::Materializing;
    target.commit();
    msg("Received file written to " + display_name(destination));
    diagnostics::log_info("receive.materialized", {{"path", destination.string()}});
    close_transit(*pipe);
}

void ReceiveSession::handle_directory(const protocol::DirectoryOffer& offer) {
    diagnostics::log_info("receive.offer", {{"type", "directory"}, {"bytes", std::to_string(offer.archive_size)}});
    if (offer.mode != protocol::kDirectoryMode) {
        msg("Error: unknown directory-transfer mode '" + offer.mode + "'");
        throw ResponderError("unknown mode");
    }
    const DestinationResolver resolver(config_.cwd, config_.output_file, runtime_.out);
    const auto destination = resolver.resolve(DestinationKind::Directory, offer.dirname);
    expected_size_ = offer.archive_size;

    msg("Receiving directory (" + std::to_string(expected_size_) + " bytes) into: " +
        display_name(destination) + "/");
    msg(std::to_string(offer.file_count) + " files, " + std::to_string(offer.total_bytes) +
        " bytes (uncompressed)");
    state_ = SessionState::AwaitingConsent;
    PermissionGate(config_.accept_file, runtime_.in, runtime_.out, runtime_.err).request();

    StagingDirectory staging(destination);
    SpoolTarget spool;
    send_data(protocol::encode_file_ack());
    auto pipe = establish_transit();
    transfer_data(*pipe, spool);

    state_ = SessionState::Materializing;
    msg("Unpacking zipfile..");
    ZipExtractor::extract(spool, staging);
    msg("Received files written to " + display_name(destination) + "/");
    diagnostics::log_info("receive.materialized", {{"path", destination.string()}});
    close_transit(*pipe);
}

void ReceiveSession::handle_unknown(const protocol::UnknownOffer& offer) {
    msg("I don't know what they're offering\n");
    msg("Offer details: " + protocol::json::serialize(offer.raw));
    throw ResponderError("unknown offer type");
}

std::unique_ptr<channel::RecordPipe> ReceiveSession::establish_transit() {
    if (!transit_) {
        throw TransferError("offer arrived before transit hints");
    }
    state_ = SessionState::EstablishingTransit;
    auto pipe = transit_->connect();
    if (!pipe) {
        throw TransferError("unable to establish a transit connection");
    }
    diagnostics::log_info("receive.transit_connected", {{"connection", pipe->describe()}});
    return pipe;
}

void ReceiveSession::transfer_data(channel::RecordPipe& pipe, channel::TransferTarget& target) {
    state_ = SessionState::Transferring;
    msg("Receiving (" + pipe.describe() + ")..");

    const auto received = pipe.write_to_file(target, expected_size_, [this](std::uint64_t bytes) {
        bytes_received_ += bytes;
    });
    bytes_received_ = received;

    const auto counts = "got " + std::to_string(received) + " bytes, wanted " + std::to_string(expected_size_);
    if (received < expected_size_) {
        msg("");
        msg("Connection dropped before full file received");
        msg(counts);
        throw TransferError("Connection dropped before full file received (" + counts + ")");
    }
    if (received > expected_size_) {
        throw TransferError("received more bytes than advertised (" + counts + ")");
    }
    diagnostics::log_info("receive.transfer_complete", {{"bytes", std::to_string(received)}});
}

void ReceiveSession::close_transit(channel::RecordPipe& pipe) {
    state_ = SessionState::Closing;
    pipe.send_record(to_bytes(kCompletionRecord));
    pipe.close();
}

void ReceiveSession::send_data(ByteView message) {
    channel_.send(message);
}

void ReceiveSession::notify_peer(const std::string& reason) {
    diagnostics::log_info("receive.rejected", {{"reason", reason}});
    try {
        send_data(protocol::encode_error(reason));
    } catch (const std::exception& ex) {
        diagnostics::log_warning("receive.notify_failed", {{"reason", reason}, {"error", ex.what()}});
    }
}

void ReceiveSession::close_after_failure() {
    try {
        channel_.close();
    } catch (const std::exception& ex) {
        diagnostics::log_warning("receive.close_failed", {{"error", ex.what()}});
    }
    diagnostics::log_info("receive.closed", {{"state", std::string(to_string(state_))}});
}

void ReceiveSession::msg(const std::string& line) {
    runtime_.out << line << std::endl;
}

SessionOutcome receive(channel::WormholeChannel& channel, const ReceiveConfig& config, ReceiveRuntime runtime) {
    ReceiveSession session(channel, config, std::move(runtime));
    SessionOutcome outcome{};
    try {
        session.go();
    } catch (const AuthenticationError& ex) {
        outcome.status = SessionOutcome::Status::Aborted;
        outcome.error = SessionOutcome::ErrorKind::Authentication;
        outcome.reason = ex.what();
    } catch (const TransferError& ex) {
        outcome.status = SessionOutcome::Status::Rejected;
        outcome.reason = ex.what();
    } catch (const ConfigError& ex) {
        outcome.status = SessionOutcome::Status::Aborted;
        outcome.error = SessionOutcome::ErrorKind::Config;
        outcome.reason = ex.what();
    } catch (const std::exception& ex) {
        outcome.status = SessionOutcome::Status::Aborted;
        outcome.error = SessionOutcome::ErrorKind::Io;
        outcome.reason = ex.what();
    }
    return outcome;
}

}  // namespace wormhole::receive
