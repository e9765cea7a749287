#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>
#include <signal.h>

std::string getenv_or(const char* key, const std::string& def);
int getenv_int_or(const char* key, int def);

// 1..65535; anything else cannot be bound or connected to.
bool is_valid_port(int port);

// Blocks SIGINT and SIGTERM in the calling thread and returns that set.
// Threads started afterwards inherit the mask, so call it before spawning any.
sigset_t block_shutdown_signals();
// Sleeps until one of the blocked signals is pending and returns its number.
// A signal raised before the call is not lost.
int wait_for_shutdown_signal(const sigset_t& signals);

// 16 random bytes, lowercase hex (32 chars).
std::string gen_token();
std::string random_suffix(std::size_t len = 6);

int64_t now_ms();
std::string iso8601_utc(int64_t ms);
// Parses the subset of ISO-8601 produced by iso8601_utc(); -1 on failure.
int64_t parse_iso8601_utc(const std::string& s);
std::string format_uptime(int64_t ms);

std::string read_text_file(const std::filesystem::path& p);
// Writes via <p>.tmp + rename so readers never observe a partial file.
void write_text_file_atomic(const std::filesystem::path& p, const std::string& text);
// Regular files with the given extension, sorted by filename.
std::vector<std::filesystem::path> list_files(const std::filesystem::path& dir, const std::string& ext);
