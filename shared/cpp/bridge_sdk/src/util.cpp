#include "../include/util.hpp"
#include <openssl/rand.h>
#include <pthread.h>
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

int getenv_int_or(const char* key, int def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    try {
        return std::stoi(v);
    } catch (const std::exception&) {
        return def;
    }
}

bool is_valid_port(int port) {
    return port >= 1 && port <= 65535;
}

sigset_t block_shutdown_signals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0) throw std::system_error(rc, std::generic_category(), "pthread_sigmask");
    return set;
}

int wait_for_shutdown_signal(const sigset_t& signals) {
    int sig = 0;
    int rc = sigwait(&signals, &sig);
    if (rc != 0) throw std::system_error(rc, std::generic_category(), "sigwait");
    return sig;
}

std::string gen_token() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(sizeof(bytes) * 2);
    for (unsigned char b : bytes) {
        out.push_back(hex[(b >> 4) & 0xF]);
        out.push_back(hex[b & 0xF]);
    }
    return out;
}

std::string random_suffix(std::size_t len) {
    static const char* alphabet = "abcdefghijklmnopqrstuvwxyz0123456789";
    thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<int> dist(0, 35);
    std::string out;
    out.reserve(len);
    for (std::size_t i = 0; i < len; ++i) out.push_back(alphabet[dist(rng)]);
    return out;
}

int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string iso8601_utc(int64_t ms) {
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms % 1000));
    return std::string(buf);
}

int64_t parse_iso8601_utc(const std::string& s) {
    std::tm tm{};
    int millis = 0;
    int n = std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3dZ",
                        &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                        &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &millis);
    if (n < 6) return -1;
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    std::time_t secs = timegm(&tm);
    if (secs == static_cast<std::time_t>(-1)) return -1;
    return static_cast<int64_t>(secs) * 1000 + (n == 7 ? millis : 0);
}

std::string format_uptime(int64_t ms) {
    int64_t seconds = std::max<int64_t>(0, ms / 1000);
    if (seconds < 60) return std::to_string(seconds) + "s";
    int64_t minutes = seconds / 60;
    if (minutes < 60) return std::to_string(minutes) + "m " + std::to_string(seconds % 60) + "s";
    int64_t hours = minutes / 60;
    return std::to_string(hours) + "h " + std::to_string(minutes % 60) + "m";
}

std::string read_text_file(const std::filesystem::path& p) {
    std::ifstream f(p);
    if (!f) throw std::runtime_error("cannot open " + p.string());
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

void write_text_file_atomic(const std::filesystem::path& p, const std::string& text) {
    std::filesystem::path tmp = p;
    tmp += ".tmp";
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) throw std::runtime_error("cannot write " + tmp.string());
        f << text;
        if (!f) throw std::runtime_error("write failed: " + tmp.string());
    }
    std::filesystem::rename(tmp, p);
}

std::vector<std::filesystem::path> list_files(const std::filesystem::path& dir, const std::string& ext) {
    std::vector<std::filesystem::path> out;
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) return out;
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) continue;
        if (entry.path().extension() == ext) out.push_back(entry.path());
    }
    std::sort(out.begin(), out.end(), [](const std::filesystem::path& a, const std::filesystem::path& b) {
        return a.filename().string() < b.filename().string();
    });
    return out;
}
