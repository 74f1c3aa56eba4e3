#include "Agent.hpp"
#include "Connection.hpp"

#include <chrono>
#include <vector>

namespace {

bool isExpired(const Connection& conn, long timeout_ms, std::chrono::steady_clock::time_point now) {
    if (timeout_ms <= 0) {
        return false;
    }
    return now - conn.last_used > std::chrono::milliseconds(timeout_ms);
}

} // namespace

Agent::Agent(AgentOptions options) : agent_options(options) {}

Agent::~Agent() {
    shutdown();
}

std::unique_ptr<Connection> Agent::checkout(const std::string& key) {
    std::vector<std::unique_ptr<Connection>> stale;
    std::unique_ptr<Connection> found;
    auto now = std::chrono::steady_clock::now();

    {
        std::lock_guard<std::mutex> lock(mtx);
        if (shut_down || !agent_options.keep_alive) {
            return nullptr;
        }

        // Most recently released first
        for (auto it = idle.begin(); it != idle.end();) {
            bool remove_entry = isExpired(**it, agent_options.free_socket_timeout_ms, now) || !(*it)->isAlive();
            if (remove_entry) {
                stale.push_back(std::move(*it));
                it = idle.erase(it);
                continue;
            }
            if ((*it)->pool_key == key) {
                found = std::move(*it);
                idle.erase(it);
                reused++;
                break;
            }
            ++it;
        }
    }

    // stale connections close here, outside the lock
    return found;
}

void Agent::release(std::unique_ptr<Connection> conn) {
    if (!conn) {
        return;
    }
    conn->last_used = std::chrono::steady_clock::now();
    conn->setCancelToken(nullptr);

    std::unique_ptr<Connection> evicted;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (shut_down || !agent_options.keep_alive || agent_options.max_free_sockets == 0) {
            return;
        }
        idle.push_front(std::move(conn));
        if (idle.size() > agent_options.max_free_sockets) {
            evicted = std::move(idle.back());
            idle.pop_back();
        }
    }
}

void Agent::recordCreated() {
    std::lock_guard<std::mutex> lock(mtx);
    created++;
}

void Agent::shutdown() {
    std::list<std::unique_ptr<Connection>> to_close;
    {
        std::lock_guard<std::mutex> lock(mtx);
        shut_down = true;
        to_close.swap(idle);
    }
    tls_contexts.clear();
}

Agent::Stats Agent::stats() const {
    std::lock_guard<std::mutex> lock(mtx);
    Stats s;
    s.idle = idle.size();
    s.created = created;
    s.reused = reused;
    return s;
}
