#include "radariq/connection.hpp"

#include <ros/ros.h>

#include "radariq/errors.hpp"

namespace radariq {

Connection::Connection(std::unique_ptr<SerialTransport> transport,
                       const std::string& port,
                       uint32_t baud_rate,
                       StatusCallback callback,
                       const ReconnectPolicy& policy)
    : transport_(std::move(transport))
    , port_(port)
    , baud_rate_(baud_rate)
    , callback_(std::move(callback))
    , policy_(policy)
{
    if (!transport_) {
        throw std::invalid_argument("Connection requires a transport");
    }
    transport_->open(port_, baud_rate_);
    start();
    notify(ConnectionStatus::Connected);
}

Connection::~Connection() {
    close();
}

void Connection::start() {
    if (running_.exchange(true)) {
        return;
    }
    if (rx_thread_.joinable()) {
        rx_thread_.join();  // previous loop ended on its own (fatal disconnect)
    }
    rx_thread_ = std::thread(&Connection::rxLoop, this);
}

void Connection::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        running_.store(false);
    }
    wake_cv_.notify_all();

    if (rx_thread_.joinable() && rx_thread_.get_id() != std::this_thread::get_id()) {
        rx_thread_.join();
    }
}

void Connection::close() noexcept {
    stop();
    transport_->close();
}

void Connection::sendPacket(const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> packet = codec::encode(payload);
    ROS_DEBUG("Sending: %s", codec::toHex(payload).c_str());
    transport_->write(packet);
}

bool Connection::readFromQueue(std::vector<uint8_t>& packet) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (queue_.empty()) {
        return false;
    }
    packet = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

bool Connection::waitForPacket(std::vector<uint8_t>& packet, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    if (!queue_cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
        return false;
    }
    packet = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

void Connection::emptyQueue() {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.clear();
}

void Connection::flushAll() {
    {
        std::lock_guard<std::mutex> lock(framer_mutex_);
        framer_.clear();
    }
    transport_->flushInput();
    emptyQueue();
}

size_t Connection::rxBufferLength() const {
    std::lock_guard<std::mutex> lock(framer_mutex_);
    return framer_.buffered();
}

size_t Connection::queueSize() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

void Connection::rxLoop() {
    std::vector<uint8_t> chunk(READ_CHUNK);
    std::vector<uint8_t> raw;

    while (running_.load()) {
        try {
            size_t n = transport_->read(chunk.data(), chunk.size(), READ_TIMEOUT);
            if (n == 0) {
                continue;
            }

            std::vector<std::vector<uint8_t>> decoded;
            {
                std::lock_guard<std::mutex> lock(framer_mutex_);
                framer_.feed(chunk.data(), n);
                while (framer_.next(raw)) {
                    try {
                        decoded.push_back(codec::decode(raw));
                    } catch (const codec::DecodeError& e) {
                        ROS_WARN_THROTTLE(5.0, "Dropping packet: %s", e.what());
                    }
                }
            }

            if (!decoded.empty()) {
                {
                    std::lock_guard<std::mutex> lock(queue_mutex_);
                    for (auto& payload : decoded) {
                        queue_.push_back(std::move(payload));
                    }
                }
                queue_cv_.notify_all();
            }
        } catch (const SerialError& e) {
            ROS_ERROR("Serial connection lost: %s", e.what());
            if (!reconnect()) {
                break;
            }
        }
    }
    running_.store(false);
}

bool Connection::reconnect() {
    transport_->close();
    notify(ConnectionStatus::Disconnected);

    for (int attempt = 1; attempt <= policy_.attempts; ++attempt) {
        ROS_ERROR("The serial connection has been disconnected... attempting to reconnect. Attempt %d.",
                  attempt);
        if (!waitInterruptible(policy_.interval)) {
            return false;
        }
        try {
            transport_->open(port_, baud_rate_);
        } catch (const SerialError& e) {
            ROS_DEBUG("Reconnect attempt %d failed: %s", attempt, e.what());
            continue;
        }
        {
            std::lock_guard<std::mutex> lock(framer_mutex_);
            framer_.clear();
        }
        ROS_ERROR("The serial connection has been restored.");
        notify(ConnectionStatus::Reconnected);
        return true;
    }

    ROS_ERROR("The serial connection has been lost. Please manually reconnect.");
    notify(ConnectionStatus::Fatal);
    return false;
}

bool Connection::waitInterruptible(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    wake_cv_.wait_for(lock, duration, [this] { return !running_.load(); });
    return running_.load();
}

void Connection::notify(ConnectionStatus status) {
    ROS_DEBUG("Connection status: %s", toString(status).c_str());
    if (callback_) {
        callback_(status);
    }
}

}  // namespace radariq
