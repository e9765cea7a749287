#pragma once
#include <filesystem>
#include <optional>
#include <string>

// Contents of <project>/.bridge/bridge.json.
struct Credential {
    int port{0};
    std::string token;
    long pid{0};
    std::string started_at; // ISO-8601 UTC
};

std::filesystem::path bridge_dir(const std::filesystem::path& project_root);
std::filesystem::path credential_path(const std::filesystem::path& project_root);

void write_credential(const std::filesystem::path& project_root, const Credential& cred);
// nullopt when the file is missing, unreadable or lacks numeric port/pid.
std::optional<Credential> read_credential(const std::filesystem::path& project_root);
// Idempotent; returns true only if a file was actually removed.
bool remove_credential(const std::filesystem::path& project_root);

bool is_process_alive(long pid);
