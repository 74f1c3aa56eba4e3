#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <string>

/**
 * Where log lines go; both targets off means logging is disabled
 */
struct LogSettings {
    std::string file;       // appended to when non-empty
    bool console = false;   // echo to std::cout
};

class Logger {
    public:
        Logger(std::string clientID, LogSettings settings);
        ~Logger();
        void logRequest(std::string request); //Log the request line and timestamp
        void logResponse(std::string response); //Log the status line and timestamp
        void logTunnelEstablished(std::string host, int port); //Log CONNECT tunnel through a proxy
        void logConnectionOpened(std::string host, int port); //Log connection opening
        void logConnectionReused(std::string host, int port); //Log pooled connection checkout
        void logConnectionClosed(std::string host, int port); //Log connection closure
        void logCustomMsg(std::string entry); //Log custom message
        bool enabled() const;
    private:
        std::string clientID;
        LogSettings settings;
        const std::string getTime();
        void logToFile(std::string entry);
};

#endif // LOGGER_HPP
