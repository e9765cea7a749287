#include "../include/credential.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <cerrno>
#include <signal.h>
#include <system_error>

using json = nlohmann::json;

std::filesystem::path bridge_dir(const std::filesystem::path& project_root) {
    return project_root / ".bridge";
}

std::filesystem::path credential_path(const std::filesystem::path& project_root) {
    return bridge_dir(project_root) / "bridge.json";
}

void write_credential(const std::filesystem::path& project_root, const Credential& cred) {
    std::filesystem::create_directories(bridge_dir(project_root));
    json j = {
        {"port", cred.port},
        {"token", cred.token},
        {"pid", cred.pid},
        {"startedAt", cred.started_at}
    };
    write_text_file_atomic(credential_path(project_root), j.dump(2));
}

std::optional<Credential> read_credential(const std::filesystem::path& project_root) {
    std::string raw;
    try {
        raw = read_text_file(credential_path(project_root));
    } catch (const std::exception&) {
        return std::nullopt;
    }
    json j = json::parse(raw, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    if (!j.contains("port") || !j["port"].is_number_integer()) return std::nullopt;
    if (!j.contains("pid") || !j["pid"].is_number_integer()) return std::nullopt;
    Credential c;
    c.port = j["port"].get<int>();
    c.pid = j["pid"].get<long>();
    c.token = j.value("token", std::string());
    c.started_at = j.value("startedAt", std::string());
    return c;
}

bool remove_credential(const std::filesystem::path& project_root) {
    std::error_code ec;
    bool removed = std::filesystem::remove(credential_path(project_root), ec);
    return !ec && removed;
}

bool is_process_alive(long pid) {
    if (pid <= 0) return false;
    if (::kill(static_cast<pid_t>(pid), 0) == 0) return true;
    return errno == EPERM;
}
