#include <deque>
#include <fstream>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "ferry/common/errors.hpp"
#include "ferry/config/config.hpp"
#include "ferry/crypto/crypto.hpp"
#include "ferry/handshake/handshake.hpp"
#include "ferry/packet/frame.hpp"
#include "ferry/reliability/reliability.hpp"
#include "ferry/session/session_manager.hpp"
#include "ferry/transfer/chunker.hpp"
#include "ferry/transfer/file_receiver.hpp"
#include "ferry/transfer/file_sender.hpp"
#include "ferry/transfer/resume_store.hpp"
#include "ferry/utils/logging.hpp"
#include "ferry/utils/time.hpp"

using namespace ferry;

namespace {

using Wire = std::deque<std::vector<uint8_t>>;

// Simulated clock so retransmission can be shown without sleeping
struct DemoClock {
    utils::TimePoint now = utils::Clock::now();
    utils::NowFn fn() { return [this] { return now; }; }
};

struct Peer {
    Peer(const config::ProtocolConfig& cfg, DemoClock& clock)
        : sessions(clock.fn()),
          protocol(cfg.device_id, cfg.capabilities, cfg.handshake),
          handshake(protocol, sessions, clock.fn()) {}

    session::SecureSessionManager sessions;
    handshake::HandshakeProtocol protocol;
    handshake::Handshake handshake;
};

void send_to(Wire& wire, const packet::ProtocolFrame& frame) {
    wire.push_back(packet::encode(frame));
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"ferry demo - loopback secure file transfer"};

    std::string input;
    std::string output;
    std::string config_path;
    std::string session_id = "demo-session";
    std::string log_level;
    std::string log_file;
    std::string resume_dir;
    size_t window = 0;
    size_t chunk_size = 0;
    size_t drop_every = 0;

    app.add_option("-i,--input", input, "File to send")->required()->check(CLI::ExistingFile);
    app.add_option("-o,--output", output, "Where the receiver writes the file")->required();
    app.add_option("--config", config_path, "INI configuration file");
    app.add_option("-s,--session", session_id, "Session identifier");
    app.add_option("-w,--window", window, "Chunks in flight (overrides config)");
    app.add_option("-c,--chunk-size", chunk_size, "Chunk size in bytes (overrides config)");
    app.add_option("--resume-dir", resume_dir, "Directory for resume records (overrides config)");
    app.add_option("--drop-every", drop_every, "Drop every Nth data frame to exercise retransmission");
    app.add_option("-l,--log-level", log_level, "Log level: trace,debug,info,warn,error");
    app.add_option("--log-file", log_file, "Also write logs to this file");

    CLI11_PARSE(app, argc, argv);

    utils::init_logging();

    // Initialize crypto
    if (!crypto::init()) {
        spdlog::error("Failed to initialize crypto subsystem");
        return 1;
    }

    config::ProtocolConfig base;
    if (!config_path.empty()) {
        auto loaded = config::load_config(config_path);
        if (!loaded) {
            spdlog::error("Cannot read config file {}", config_path);
            return 1;
        }
        base = *loaded;
    }
    if (window != 0) base.reliability.window_size = window;
    if (chunk_size != 0) base.reliability.chunk_size = chunk_size;
    if (!resume_dir.empty()) base.resume_directory = resume_dir;
    if (!log_level.empty()) base.log_level = log_level;
    if (!log_file.empty()) base.log_file = log_file;

    utils::LogOptions log_options;
    log_options.level = utils::string_to_log_level(base.log_level);
    log_options.file = base.log_file;
    try {
        utils::init_logging(log_options);
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::error("Cannot open log file {}: {}", base.log_file, e.what());
        return 1;
    }

    config::ProtocolConfig sender_cfg = base;
    config::ProtocolConfig receiver_cfg = base;
    if (sender_cfg.device_id.empty()) sender_cfg.device_id = "demo-sender";
    receiver_cfg.device_id = sender_cfg.device_id + "-peer";

    auto validation = config::validate_config(sender_cfg);
    for (const auto& w : validation.warnings) {
        spdlog::warn("Config: {}", w);
    }
    if (!validation.valid) {
        for (const auto& e : validation.errors) {
            spdlog::error("Config: {}", e);
        }
        return 1;
    }

    DemoClock clock;
    Peer sender(sender_cfg, clock);
    Peer receiver(receiver_cfg, clock);
    Wire to_receiver;
    Wire to_sender;

    sender.handshake.set_send_callback([&](const packet::ControlFrame& f) { send_to(to_receiver, f); });
    receiver.handshake.set_send_callback([&](const packet::ControlFrame& f) { send_to(to_sender, f); });

    try {
        // Handshake
        sender.handshake.start(session_id);
        receiver.handshake.start(session_id);

        while (!to_receiver.empty() || !to_sender.empty()) {
            if (!to_receiver.empty()) {
                auto frame = packet::decode(to_receiver.front());
                to_receiver.pop_front();
                receiver.handshake.process_frame(std::get<packet::ControlFrame>(frame));
            }
            if (!to_sender.empty()) {
                auto frame = packet::decode(to_sender.front());
                to_sender.pop_front();
                sender.handshake.process_frame(std::get<packet::ControlFrame>(frame));
            }
        }

        if (sender.handshake.state() != handshake::HandshakeState::CONNECTED ||
            receiver.handshake.state() != handshake::HandshakeState::CONNECTED) {
            spdlog::error("Handshake did not complete");
            return 1;
        }

        // Resume record
        transfer::ResumeStore store(sender_cfg.resume_directory);
        transfer::Chunker chunker(input, std::filesystem::path(input).filename().string(),
                                  sender_cfg.reliability.chunk_size);

        std::set<uint64_t> already_sent;
        if (store.is_resumable(session_id, chunker.file_id())) {
            auto state = store.load_transfer_state(session_id);
            already_sent = state->find_file(chunker.file_id())->completed_chunks;
            spdlog::info("Resuming: {} chunks already confirmed", already_sent.size());
        } else {
            const int64_t now = utils::unix_time_ms();
            transfer::TransferState state;
            state.session_id = session_id;
            state.sender_id = sender_cfg.device_id;
            state.receiver_id = receiver_cfg.device_id;
            state.status = transfer::TransferStatus::IN_PROGRESS;
            state.created_at_ms = now;
            state.last_updated_ms = now;
            state.file_states.push_back(transfer::FileTransferState{
                .file_id = chunker.file_id(),
                .file_name = chunker.file_id(),
                .total_size = chunker.file_size(),
                .chunk_size = chunker.chunk_size(),
                .created_at_ms = now,
                .last_updated_ms = now,
            });
            store.save_transfer_state(state);
        }

        // Output file
        {
            std::ofstream create(output, std::ios::binary | std::ios::app);
        }
        std::fstream out(output, std::ios::binary | std::ios::in | std::ios::out);
        if (!out) {
            spdlog::error("Cannot open output {}", output);
            return 1;
        }

        // Transfer
        constexpr uint32_t transfer_id = 1;
        size_t data_frames = 0;
        transfer::FileSender* file_sender = nullptr;

        reliability::ReliabilityProtocol window_proto(
            sender_cfg.reliability,
            reliability::ReliabilityCallbacks{
                .on_frame_send = [&](const packet::ProtocolFrame& f) {
                    ++data_frames;
                    if (drop_every != 0 && data_frames % drop_every == 0) {
                        spdlog::warn("Dropping data frame #{}", data_frames);
                        return;
                    }
                    send_to(to_receiver, f);
                },
                .on_ack_received = nullptr,
                .on_chunk_delivered = [&](uint32_t id, uint64_t offset) {
                    file_sender->on_chunk_delivered(id, offset);
                },
            },
            clock.fn());

        transfer::FileSender sending(chunker, transfer_id, session_id, sender.sessions,
                                     window_proto, &store);
        file_sender = &sending;

        transfer::FileReceiver receiving(
            session_id, receiver.sessions,
            [&out](uint64_t offset, std::span<const uint8_t> data) {
                out.seekp(static_cast<std::streamoff>(offset));
                out.write(reinterpret_cast<const char*>(data.data()),
                          static_cast<std::streamsize>(data.size()));
            },
            [&](const packet::ProtocolFrame& f) { send_to(to_sender, f); });

        sending.start(already_sent);
        sending.pump();

        while (!sending.is_finished()) {
            if (to_receiver.empty() && to_sender.empty()) {
                // Nothing on the wire: let the ack timer fire
                clock.now += sender_cfg.reliability.ack_timeout;
                window_proto.retransmit_expired();
                continue;
            }
            if (!to_receiver.empty()) {
                auto frame = packet::decode(to_receiver.front());
                to_receiver.pop_front();
                receiving.handle_data_frame(std::get<packet::DataFrame>(frame));
            }
            if (!to_sender.empty()) {
                auto frame = packet::decode(to_sender.front());
                to_sender.pop_front();
                const auto& control = std::get<packet::ControlFrame>(frame);
                window_proto.process_ack(packet::decode_ack(control.payload));
            }
        }

        store.update_status(session_id, transfer::TransferStatus::COMPLETED);

        const auto stats = window_proto.get_stats();
        spdlog::info("Transfer complete: {} chunks acked, {} retransmits, {} bytes written",
                     stats.acked_chunks, stats.retransmits, receiving.bytes_received());

        sender.sessions.end_all_sessions();
        receiver.sessions.end_all_sessions();
    } catch (const ProtocolError& e) {
        spdlog::error("Transfer failed: {}", e.what());
        return 1;
    }

    return 0;
}
