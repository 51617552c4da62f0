#include "wellscan/io/IoService.hpp"
#include "wellscan/log/Log.hpp"

namespace wellscan::io {

namespace {
IoService& static_service() {
    static IoService service;
    return service;
}
} // namespace

IoService::IoService()
: io_(std::make_shared<asio::io_context>())
, work_guard_(asio::make_work_guard(*io_))
, t_([this]{ io_->run(); })
{
    logInfo("[IoService] I/O thread started\n");
}

IoService::~IoService() {
    work_guard_.reset();
    io_->stop();
    if (t_.joinable()) t_.join();
}

std::shared_ptr<asio::io_context> shared_io_context() {
    return static_service().io();
}

} // namespace wellscan::io
