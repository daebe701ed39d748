#pragma once
#include <QString>
#include <QVector>
#include <functional>
#include <memory>
#include <optional>

#include "include/types.hpp"
#include "session/CancelToken.hpp"

// Transport-level access to one terminal. A driver is created, used and
// destroyed on a single worker thread. Failures are reported as
// ConnectionError (transport) or ProtocolError (unexpected reply).
// Blocking calls end with ConnectionError shortly after the bound token is
// cancelled; close() still says goodbye to the device.
class DeviceDriver {
public:
	virtual ~DeviceDriver() = default;

	virtual void open(const DeviceConfig& config, int connectTimeoutMs) = 0;
	virtual void close() noexcept = 0;
	virtual bool isAlive() const = 0;

	// Empty when the terminal does not report one.
	virtual QString serialNumber() = 0;
	virtual void setIoTimeout(int ms) = 0;

	virtual QVector<DeviceUser> readUsers() = 0;
	virtual HistoricalBatch readAttendance() = 0;

	virtual void startLiveCapture() = 0;
	// std::nullopt when nothing arrived within waitMs.
	virtual std::optional<DevicePunch> waitForPunch(int waitMs) = 0;
	virtual void stopLiveCapture() noexcept = 0;

	void bindCancelToken(const CancelToken* token) { cancel_ = token; }

protected:
	bool cancelRequested() const { return cancel_ && cancel_->isCancelled(); }

private:
	const CancelToken* cancel_ = nullptr;
};

using DriverFactory = std::function<std::unique_ptr<DeviceDriver>(const DeviceConfig&)>;
