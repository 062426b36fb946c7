#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>

#include "colourlink/core/Color.hpp"
#include "colourlink/core/Expected.hpp"
#include "colourlink/colourspace/ColourSpaceConfig.hpp"
#include "colourlink/colourspace/Connection.hpp"
#include "colourlink/colourspace/SharedState.hpp"
#include "colourlink/colourspace/XmlLog.hpp"

namespace colourlink::colourspace {

/**
 * @brief Tunables for one measurement worker. Defaults come from ColourSpaceConfig.
 */
struct WorkerOptions {
    std::chrono::milliseconds sendInterval = config::SEND_INTERVAL;
    std::chrono::milliseconds retryBackoff = config::RECEIVE_RETRY_BACKOFF;
    std::chrono::milliseconds connectTimeout = config::CONNECT_TIMEOUT;
    std::chrono::milliseconds writeTimeout = config::WRITE_TIMEOUT;

    MeasurementPolicy policy{};

    /// Append every received payload to an XmlLog.
    bool logReceivedXml = false;
    /// Overrides XmlLog::defaultPath() when set.
    std::optional<std::string> xmlLogPath{};
};

/**
 * @brief Keeps a ColourSpace instrument and the shared display state in step.
 *
 * Two loops run on their own threads once `start()` is called:
 * - receiver: sends the `init profile` handshake, then blocks on frames.
 *   Transient I/O errors and the disconnect signal clear `connected` and
 *   retry after `retryBackoff`. A protocol violation records a fault and
 *   stops the worker.
 * - sender: every `sendInterval` transmits a measurement request for the
 *   current requested colour, connected or not. A write failure clears
 *   `connected` and ends the sender only.
 *
 * Both loops end on `stop()` or destruction.
 */
class MeasurementWorker {
public:
    explicit MeasurementWorker(WorkerOptions options = {});
    ~MeasurementWorker();

    // non-copyable / non-movable
    MeasurementWorker(const MeasurementWorker&) = delete;
    MeasurementWorker& operator=(const MeasurementWorker&) = delete;
    MeasurementWorker(MeasurementWorker&&) = delete;
    MeasurementWorker& operator=(MeasurementWorker&&) = delete;

    /// Connect once; see Connection::connect.
    expected<void> connect(const std::string& address);

    void start();
    void stop();   // idempotent

    bool isRunning() const { return running.load(); }
    bool isSending() const { return sending.load(); }

    SharedState& state() { return sharedState; }
    const SharedState& state() const { return sharedState; }

private:
    void runReceiver();
    void runSender();

    void sendHandshake();
    void waitForHandshake();
    void handleMeasurement(const std::string& payload);
    void handleTransientFailure(std::string_view where, const std::error_code& ec);
    void handleProtocolViolation(std::string_view where, const std::error_code& ec);

    /// Sleep for @p duration unless the worker stops first.
    void pause(std::chrono::milliseconds duration);

    WorkerOptions options;
    Connection connection;
    SharedState sharedState;
    std::optional<XmlLog> xmlLog;

    std::thread receiver;
    std::thread sender;
    std::atomic<bool> running{false};
    std::atomic<bool> sending{false};

    std::mutex wakeMutex;
    std::condition_variable wake;
    bool handshakeSent = false;

    std::optional<std::error_code> lastReceiveError{};
};

/**
 * @brief Consumer-facing view of a running worker.
 *
 * Copies share the worker; the last copy to go stops it.
 */
class SharedStateHandle {
public:
    explicit SharedStateHandle(std::shared_ptr<MeasurementWorker> worker);

    Snapshot read() const;
    void setRequestedColor(const core::Color& color);

    bool connected() const;
    /// Set once the worker has stopped on a protocol violation.
    std::optional<std::error_code> fault() const;

    MeasurementWorker& worker() { return *worker_; }

private:
    std::shared_ptr<MeasurementWorker> worker_;
};

/**
 * @brief Connect to @p address and start a worker.
 *
 * Fails with the connection error when the instrument cannot be reached
 * within `options.connectTimeout`; no worker is started in that case.
 */
expected<SharedStateHandle> spawn(const std::string& address, WorkerOptions options = {});

} // namespace colourlink::colourspace
