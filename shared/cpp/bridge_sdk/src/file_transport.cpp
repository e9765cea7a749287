#include "../include/file_transport.hpp"
#include "../include/credential.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include "../include/util.hpp"
#include <chrono>
#include <cstdio>
#include <system_error>

namespace {
const Logger log_("messenger");
}

FileTransport::FileTransport(const std::filesystem::path& project_root, Mailbox role, int poll_interval_ms)
    : outbox_(bridge_dir(project_root) / "outbox"),
      inbox_(bridge_dir(project_root) / "inbox"),
      role_(role),
      poll_interval_ms_(poll_interval_ms > 0 ? poll_interval_ms : kDefaultPollIntervalMs) {}

FileTransport::~FileTransport() {
    disconnect();
}

void FileTransport::connect() {
    if (connected_.load()) return;
    std::filesystem::create_directories(outbox_);
    std::filesystem::create_directories(inbox_);
    {
        std::lock_guard<std::mutex> lock(loop_mtx_);
        stop_requested_ = false;
    }
    connected_ = true;
    worker_ = std::thread(&FileTransport::loop, this);
    log_.debug("Messenger connected", {{"outbox", outbox_.string()}, {"inbox", inbox_.string()}});
}

void FileTransport::disconnect() {
    {
        std::lock_guard<std::mutex> lock(loop_mtx_);
        stop_requested_ = true;
    }
    loop_cv_.notify_all();
    if (worker_.joinable()) worker_.join();
    if (connected_.exchange(false)) {
        std::lock_guard<std::mutex> lock(scan_mtx_);
        delivered_.clear();
        reported_malformed_.clear();
        log_.debug("Messenger disconnected");
    }
}

void FileTransport::on_message(MessageCallback cb) {
    std::lock_guard<std::mutex> lock(cb_mtx_);
    callbacks_.push_back(std::move(cb));
}

std::string FileTransport::next_file_name() {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%013lld-%06llu-",
                  static_cast<long long>(now_ms()),
                  static_cast<unsigned long long>(seq_.fetch_add(1)));
    return std::string(buf) + random_suffix() + ".json";
}

std::filesystem::path FileTransport::send(const BridgeMessage& msg) {
    if (!connected_.load()) {
        throw BridgeError("FileTransport is not connected. Call connect() first.");
    }
    std::filesystem::path file = send_dir() / next_file_name();
    write_text_file_atomic(file, msg.to_json().dump(2));
    log_.debug("Message sent", {{"type", to_string(msg.type())}, {"file", file.filename().string()}});
    return file;
}

std::size_t FileTransport::poll_once() {
    std::lock_guard<std::mutex> scan_lock(scan_mtx_);
    std::vector<MessageCallback> cbs;
    {
        std::lock_guard<std::mutex> lock(cb_mtx_);
        cbs = callbacks_;
    }
    // Nobody to hand messages to yet; leave the inbox untouched.
    if (cbs.empty()) return 0;

    std::size_t dispatched = 0;
    // A missing directory yields an empty listing.
    for (const auto& path : list_files(receive_dir(), ".json")) {
        std::string name = path.filename().string();
        if (delivered_.count(name)) continue;

        std::string raw;
        try {
            raw = read_text_file(path);
        } catch (const std::exception&) {
            // Removed by someone else between listing and reading.
            continue;
        }

        ValidationResult v = deserialize_message(raw);
        if (!v.valid) {
            if (reported_malformed_.insert(name).second) {
                log_.warn("Skipping malformed message file", {{"file", name}, {"error", v.error}});
            }
            continue;
        }

        log_.debug("Message received", {{"type", to_string(v.message->type())}, {"file", name}});
        for (const auto& cb : cbs) {
            try {
                cb(*v.message);
            } catch (const std::exception& e) {
                log_.error("Message handler failed", {{"file", name}, {"error", e.what()}});
            }
        }
        delivered_.insert(name);
        ++dispatched;

        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            log_.warn("Could not remove consumed message file", {{"file", name}, {"error", ec.message()}});
        } else {
            delivered_.erase(name);
        }
    }
    return dispatched;
}

void FileTransport::loop() {
    std::unique_lock<std::mutex> lock(loop_mtx_);
    while (!stop_requested_) {
        if (loop_cv_.wait_for(lock, std::chrono::milliseconds(poll_interval_ms_),
                              [this] { return stop_requested_; })) {
            break;
        }
        lock.unlock();
        try {
            poll_once();
        } catch (const std::exception& e) {
            log_.debug("Inbox poll error", {{"error", e.what()}});
        }
        lock.lock();
    }
}
