#include "supervisor.hpp"
#include "errors.hpp"
#include "frame.hpp"
#include <iostream>

namespace chatmux {

ConnectionSupervisor::ConnectionSupervisor(Connection& conn, SessionMultiplexer& mux)
    : conn_(conn), mux_(mux) {}

ConnectionSupervisor::~ConnectionSupervisor() {
    teardown();
}

void ConnectionSupervisor::serve() {
    live_.store(true);
    writer_ = std::thread([this]() { write_loop(); });
    std::cerr << "[supervisor] " << mux_.session_id() << " serving " << conn_.peer() << "\n";

    std::string text;
    while (live_.load()) {
        ReadStatus status = conn_.read_message(text);
        if (status != ReadStatus::Message) {
            if (status == ReadStatus::Error) {
                std::cerr << "[supervisor] " << mux_.session_id() << " read error\n";
            }
            break;
        }
        try {
            mux_.route(parse_inbound(text));
        } catch (const ChatError& e) {
            mux_.report_protocol_error(e.what(), "bad_frame");
        }
    }

    teardown();
    std::cerr << "[supervisor] " << mux_.session_id() << " closed ("
              << frames_written_.load() << " frames written)\n";
}

void ConnectionSupervisor::write_loop() {
    while (auto frame = mux_.next_outbound()) {
        if (!live_.load()) break;
        if (!conn_.write_message(encode_outbound(*frame))) {
            std::cerr << "[supervisor] " << mux_.session_id() << " write failed\n";
            live_.store(false);
            mux_.close_outbound();
            conn_.close();
            break;
        }
        frames_written_.fetch_add(1);
    }
}

void ConnectionSupervisor::teardown() {
    std::lock_guard<std::mutex> lock(teardown_mutex_);
    if (torn_down_) return;
    torn_down_ = true;

    live_.store(false);
    mux_.close_outbound();
    conn_.close();
    mux_.shutdown();
    if (writer_.joinable()) writer_.join();
}

} // namespace chatmux
