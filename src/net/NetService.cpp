#include "wirecast/net/NetService.hpp"
#include "wirecast/log/Log.hpp"

namespace wirecast::net {

NetService::NetService()
: io_(std::make_shared<asio::io_context>())
, workGuard_(asio::make_work_guard(*io_))
, thread_([io = io_] { io->run(); })
{
    logInfo("[wirecast] io thread started\n");
}

NetService::~NetService() {
    workGuard_.reset();
    io_->stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

NetService& ensureNetService() {
    static NetService service;
    return service;
}

std::shared_ptr<asio::io_context> shared_io_context() {
    return ensureNetService().io();
}

} // namespace wirecast::net
