/**
 * @brief Implements the ColourSpace worker: handshake, receive loop and paced sender.
 */
#include "colourlink/colourspace/MeasurementWorker.hpp"

#include "colourlink/colourspace/ColourSpaceCommand.hpp"
#include "colourlink/colourspace/MeasurementParser.hpp"
#include "colourlink/core/Errors.hpp"
#include "colourlink/log/Log.hpp"

#include <utility>

namespace colourlink::colourspace {

MeasurementWorker::MeasurementWorker(WorkerOptions workerOptions)
: options(std::move(workerOptions)) {
    connection.setWriteTimeout(options.writeTimeout);
    if (options.logReceivedXml) {
        xmlLog.emplace(options.xmlLogPath.value_or(XmlLog::defaultPath()));
    }
}

MeasurementWorker::~MeasurementWorker() {
    // Orderly shutdown: unblock both loops, join them, release the socket.
    stop();
    connection.close();
}

expected<void> MeasurementWorker::connect(const std::string& address) {
    return connection.connect(address, options.connectTimeout);
}

void MeasurementWorker::start() {
    if (running) return; // Already running.
    // Loops that ended on a protocol violation have exited but are not joined yet.
    if (receiver.joinable()) receiver.join();
    if (sender.joinable()) sender.join();
    {
        std::lock_guard lock(wakeMutex);
        handshakeSent = false;
    }
    running = true;
    sending = true;
    receiver = std::thread([this] { runReceiver(); });
    sender = std::thread([this] { runSender(); });
}

void MeasurementWorker::stop() {
    {
        std::lock_guard lock(wakeMutex);
        running = false;
    }
    wake.notify_all();
    // The receiver may be parked in a read with no deadline.
    connection.close();

    if (receiver.joinable()) {
        receiver.join();
    }
    if (sender.joinable()) {
        sender.join();
    }
    sending = false;
}

void MeasurementWorker::runReceiver() {
    sendHandshake();

    while (running) {
        auto frame = connection.receiveFrame();
        if (!running) {
            break;
        }

        if (!frame) {
            if (isProtocolViolation(frame.error())) {
                handleProtocolViolation("receive", frame.error());
                break;
            }
            handleTransientFailure("receive", frame.error());
            pause(options.retryBackoff);
            continue;
        }

        if (!frame->has_value()) {
            // Negative length: the remote may still resume on this socket.
            handleTransientFailure("receive", make_error_code(Errc::Disconnected));
            pause(options.retryBackoff);
            continue;
        }

        lastReceiveError.reset();
        handleMeasurement(**frame);
    }
}

void MeasurementWorker::runSender() {
    waitForHandshake();

    ColourSpaceCommand command;
    while (running) {
        command.setMeasurementCommand(sharedState.requestedColor());

        if (auto sent = connection.sendFrame(command.payload()); !sent) {
            if (running) {
                logError("[MeasurementWorker] measurement send failed: ",
                         sent.error().message(), "; sender stopping\n");
                sharedState.setConnected(false);
            }
            break;
        }

        pause(options.sendInterval);
    }
    sending = false;
}

void MeasurementWorker::sendHandshake() {
    ColourSpaceCommand command;
    command.setInitProfileCommand();
    if (auto sent = connection.sendFrame(command.payload()); !sent) {
        logError("[MeasurementWorker] init profile failed: ", sent.error().message(), "\n");
        sharedState.setConnected(false);
    } else {
        logInfo("[MeasurementWorker] TX init profile\n");
    }

    {
        std::lock_guard lock(wakeMutex);
        handshakeSent = true;
    }
    wake.notify_all();
}

void MeasurementWorker::waitForHandshake() {
    std::unique_lock lock(wakeMutex);
    wake.wait(lock, [this] { return handshakeSent || !running; });
}

void MeasurementWorker::handleMeasurement(const std::string& payload) {
    if (payload.empty()) {
        // Zero-length frame: the link is alive but carries nothing to apply.
        sharedState.setConnected(true);
        return;
    }

    if (xmlLog) {
        if (auto logged = xmlLog->append(payload); !logged) {
            logError("[MeasurementWorker] Failed to log received XML command: ",
                     logged.error().message(), "\n");
        }
    }

    // Scalars the remote leaves out echo what we asked for. Replies carry no
    // request id, so this is the colour requested as the reply is handled,
    // which may be newer than the request the reply answers.
    const core::Color fallback = sharedState.requestedColor().toEightBit();
    auto result = parseMeasurement(payload, fallback);
    if (!result) {
        handleProtocolViolation("parse", result.error());
        return;
    }

    sharedState.applyMeasurement(*result, options.policy);
}

void MeasurementWorker::handleTransientFailure(std::string_view where, const std::error_code& ec) {
    sharedState.setConnected(false);
    // Log each distinct failure once rather than every retry.
    if (lastReceiveError != ec) {
        logError("[MeasurementWorker] ", where, " failed: ", ec.message(),
                 "; retrying every ", options.retryBackoff.count(), "ms\n");
        lastReceiveError = ec;
    }
}

void MeasurementWorker::handleProtocolViolation(std::string_view where, const std::error_code& ec) {
    logError("[MeasurementWorker] protocol violation during ", where, ": ", ec.message(),
             "; stopping worker\n");
    sharedState.setFault(ec);
    {
        std::lock_guard lock(wakeMutex);
        running = false;
    }
    wake.notify_all();
}

void MeasurementWorker::pause(std::chrono::milliseconds duration) {
    std::unique_lock lock(wakeMutex);
    wake.wait_for(lock, duration, [this] { return !running; });
}

SharedStateHandle::SharedStateHandle(std::shared_ptr<MeasurementWorker> worker)
: worker_(std::move(worker)) {}

Snapshot SharedStateHandle::read() const {
    return worker_->state().read();
}

void SharedStateHandle::setRequestedColor(const core::Color& color) {
    worker_->state().setRequestedColor(color);
}

bool SharedStateHandle::connected() const {
    return worker_->state().connected();
}

std::optional<std::error_code> SharedStateHandle::fault() const {
    return worker_->state().fault();
}

expected<SharedStateHandle> spawn(const std::string& address, WorkerOptions options) {
    auto worker = std::make_shared<MeasurementWorker>(std::move(options));
    if (auto connected = worker->connect(address); !connected) {
        return unexpected(connected.error());
    }
    worker->start();
    return SharedStateHandle(std::move(worker));
}

} // namespace colourlink::colourspace
