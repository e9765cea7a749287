#pragma once
#include "message.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

// Which side of the mailbox this instance plays. The controller writes to
// outbox/ and reads inbox/; the agent does the opposite.
enum class Mailbox { Controller, Agent };

// Filesystem mailbox under <project>/.bridge/{outbox,inbox}: one JSON message
// per file, files removed once their message has been dispatched.
class FileTransport {
public:
    using MessageCallback = std::function<void(const BridgeMessage&)>;

    static constexpr int kDefaultPollIntervalMs = 500;

    explicit FileTransport(const std::filesystem::path& project_root,
                           Mailbox role = Mailbox::Controller,
                           int poll_interval_ms = kDefaultPollIntervalMs);
    ~FileTransport();

    FileTransport(const FileTransport&) = delete;
    FileTransport& operator=(const FileTransport&) = delete;

    // Creates both directories and starts the inbox poll loop.
    void connect();
    // Stops the poll loop. Safe to call more than once.
    void disconnect();
    bool connected() const { return connected_.load(); }

    void on_message(MessageCallback cb);

    // Returns the path of the written file. Throws BridgeError when not connected.
    std::filesystem::path send(const BridgeMessage& msg);

    // One scan of the receive directory; returns the number of messages dispatched.
    // With no subscriber registered the files are left for a later scan.
    std::size_t poll_once();

    const std::filesystem::path& outbox_dir() const { return outbox_; }
    const std::filesystem::path& inbox_dir() const { return inbox_; }
    const std::filesystem::path& send_dir() const { return role_ == Mailbox::Controller ? outbox_ : inbox_; }
    const std::filesystem::path& receive_dir() const { return role_ == Mailbox::Controller ? inbox_ : outbox_; }

private:
    void loop();
    std::string next_file_name();

    std::filesystem::path outbox_;
    std::filesystem::path inbox_;
    Mailbox role_;
    int poll_interval_ms_;

    std::atomic<bool> connected_{false};
    std::atomic<uint64_t> seq_{0};

    std::mutex cb_mtx_;
    std::vector<MessageCallback> callbacks_;

    std::mutex scan_mtx_;
    std::set<std::string> delivered_;
    std::set<std::string> reported_malformed_;

    std::mutex loop_mtx_;
    std::condition_variable loop_cv_;
    bool stop_requested_{false};
    std::thread worker_;
};
