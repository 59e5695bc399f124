#pragma once

#include "wirecast/net/NetConfig.hpp"

#include <memory>
#include <thread>

namespace wirecast::net {

/**
 * @brief Owns an io_context and the thread that runs it.
 *
 * The deadline-bounded byteable reads and writes block the calling thread
 * while their completion handlers run on this loop, so some io_context must be
 * running elsewhere. Sockets used with them are usually created on io().
 *
 * Destroy sockets before the service. The destructor releases the work guard,
 * stops the loop and joins the thread.
 */
class NetService {
public:
    NetService();
    ~NetService();

    NetService(const NetService&) = delete;
    NetService& operator=(const NetService&) = delete;

    std::shared_ptr<asio::io_context> io() const { return io_; }

private:
    std::shared_ptr<asio::io_context> io_;
    asio::executor_work_guard<asio::io_context::executor_type> workGuard_;
    std::thread thread_;
};

// Lazily started process-wide service.
NetService& ensureNetService();
std::shared_ptr<asio::io_context> shared_io_context();

} // namespace wirecast::net
