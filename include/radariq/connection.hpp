#ifndef RADARIQ_CONNECTION_HPP
#define RADARIQ_CONNECTION_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "radariq/packet_codec.hpp"
#include "radariq/serial_transport.hpp"
#include "radariq/types.hpp"

namespace radariq {

/// How often, and how far apart, a lost port is reopened before giving up.
struct ReconnectPolicy {
    int attempts = 9;
    std::chrono::milliseconds interval{2000};
};

/// Threaded packet link to the sensor.
///
/// A receive thread pulls bytes from the transport, splits them into packets,
/// checks them and queues the decoded payloads. Outgoing payloads are encoded
/// and written on the caller's thread.
///
/// When the transport reports the device gone, the receive thread closes the
/// port and retries opening it according to the ReconnectPolicy, reporting
/// each transition through the status callback.
class Connection {
public:
    using StatusCallback = std::function<void(ConnectionStatus)>;

    /// Opens the transport and starts the receive thread.
    /// Throws SerialError if the port cannot be opened.
    Connection(std::unique_ptr<SerialTransport> transport,
               const std::string& port,
               uint32_t baud_rate = DEFAULT_BAUD_RATE,
               StatusCallback callback = nullptr,
               const ReconnectPolicy& policy = ReconnectPolicy());
    ~Connection();

    // Non-copyable, non-movable
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /// Start the receive thread (no-op if running).
    void start();

    /// Stop the receive thread. Interrupts a pending reconnect.
    void stop();

    /// Stop and close the port.
    void close() noexcept;

    /// Encode and send one payload. Throws SerialError or std::length_error.
    void sendPacket(const std::vector<uint8_t>& payload);

    /// Pop a decoded payload if one is queued.
    bool readFromQueue(std::vector<uint8_t>& packet);

    /// Pop a decoded payload, waiting up to `timeout`.
    bool waitForPacket(std::vector<uint8_t>& packet, std::chrono::milliseconds timeout);

    void emptyQueue();

    /// Drop the framer buffer, pending transport input and the queue.
    void flushAll();

    size_t rxBufferLength() const;
    size_t queueSize() const;
    bool isRunning() const { return running_.load(); }
    const std::string& port() const { return port_; }

private:
    void rxLoop();
    bool reconnect();
    bool waitInterruptible(std::chrono::milliseconds duration);
    void notify(ConnectionStatus status);

    std::unique_ptr<SerialTransport> transport_;
    std::string port_;
    uint32_t baud_rate_;
    StatusCallback callback_;
    ReconnectPolicy policy_;

    std::atomic<bool> running_{false};
    std::thread rx_thread_;

    mutable std::mutex framer_mutex_;
    codec::PacketFramer framer_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::vector<uint8_t>> queue_;

    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

    static constexpr size_t READ_CHUNK = 512;
    static constexpr std::chrono::milliseconds READ_TIMEOUT{10};
};

}  // namespace radariq

#endif  // RADARIQ_CONNECTION_HPP
