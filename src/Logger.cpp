#include "Logger.hpp"
#include <chrono>
#include <iostream>
#include <fmt/chrono.h>
#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <mutex>

#include <string>

// Serialize concurrent writes across all Logger instances
static std::mutex g_log_file_mutex;

// Sanitize a log line (trim CRLF, keep printable ASCII/whitespace, redact credentials, cap length)
static std::string sanitize_http_line(std::string s) {
    // Trim at first CRLF
    if (auto p = s.find("\r\n"); p != std::string::npos)
        s.erase(p);

    // Keep only printable ASCII and tab
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if ((c >= 32 && c <= 126) || c == '\t')
            out.push_back(static_cast<char>(c));
    }

    // Redact credentials if present
    auto redact = [&](const char* key){
        std::string k = key;
        auto pos = out.find(k);
        if (pos != std::string::npos) {
            auto val_start = pos + k.size();
            while (val_start < out.size() &&
                   (out[val_start] == ' ' || out[val_start] == '\t'))
                ++val_start;
            out.replace(val_start, out.size() - val_start, "[REDACTED]");
        }
    };
    redact("Proxy-Authorization:");
    redact("Authorization: Basic");
    redact("Authorization: Digest");

    // Cap length
    constexpr size_t kMax = 512;
    if (out.size() > kMax) {
        out.resize(kMax);
        out += "...";
    }
    return out;
}


// Create a new logger object for the given request
Logger::Logger(std::string clientID, LogSettings settings)
    : clientID(std::move(clientID)), settings(std::move(settings)) {

    // Ensure the log directory exists (safe if it already exists)
    if (!this->settings.file.empty()) {
        std::filesystem::path parent = std::filesystem::path(this->settings.file).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
        }
    }
}

Logger::~Logger(){
}

bool Logger::enabled() const {
    return !settings.file.empty() || settings.console;
}

const std::string Logger::getTime(){
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", std::chrono::system_clock::now());
}

void Logger::logRequest(std::string request){
    if (!enabled()) return;
    logToFile(fmt::format("{} [{}]: Request: {}", getTime(), clientID, sanitize_http_line(request)));
}

void Logger::logResponse(std::string response){
    if (!enabled()) return;
    logToFile(fmt::format("{} [{}]: Response: {}", getTime(), clientID, sanitize_http_line(response)));
}

void Logger::logTunnelEstablished(std::string host, int port){
    if (!enabled()) return;
    logToFile(fmt::format("{} [{}]: Tunnel established to {}:{}", getTime(), clientID, host, port));
}
void Logger::logConnectionOpened(std::string host, int port){
    if (!enabled()) return;
    logToFile(fmt::format("{} [{}]: Connection opened to {}:{}", getTime(), clientID, host, port));
}
void Logger::logConnectionReused(std::string host, int port){
    if (!enabled()) return;
    logToFile(fmt::format("{} [{}]: Connection reused for {}:{}", getTime(), clientID, host, port));
}
void Logger::logConnectionClosed(std::string host, int port){
    if (!enabled()) return;
    logToFile(fmt::format("{} [{}]: Connection closed for {}:{}", getTime(), clientID, host, port));
}
void Logger::logCustomMsg(std::string entry){
    if (!enabled()) return;
    logToFile(fmt::format("{} [{}]: {}", getTime(), clientID, sanitize_http_line(entry)));
}


void Logger::logToFile(std::string entry){
    std::lock_guard<std::mutex> lock(g_log_file_mutex); //Guard concurrent appends.

    if (settings.console) {
        std::cout << entry << std::endl;
    }
    if (settings.file.empty()) {
        return;
    }

    std::ofstream out(settings.file, std::ios::app); //Open in append mode
    if (!out){
        std::cerr << "[Logger] ERROR: cannot open " << settings.file << "\n";
        return;
    }
    out << entry << '\n';
}
