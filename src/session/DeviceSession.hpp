#pragma once
#include <QString>
#include <QVector>
#include <memory>
#include <optional>

#include "include/types.hpp"
#include "session/CancelToken.hpp"
#include "session/DeviceDriver.hpp"

struct SessionTimeouts {
	int connectTimeoutMs = 5000;
	int bootstrapTimeoutMs = 30000;
	int liveReadTimeoutMs = 60000;
};

class DeviceSession;

// Blocking stream of live punches. Single use: once it has failed or been
// cancelled it stays terminated; open a new session instead.
class LiveSubscription {
public:
	LiveSubscription(LiveSubscription&& other) noexcept;
	LiveSubscription& operator=(LiveSubscription&&) = delete;
	LiveSubscription(const LiveSubscription&) = delete;
	LiveSubscription& operator=(const LiveSubscription&) = delete;
	~LiveSubscription();

	// Blocks until a punch arrives. std::nullopt means the token was cancelled.
	// Throws ConnectionError/ProtocolError when the transport fails.
	std::optional<DevicePunch> next();

	bool isTerminated() const { return terminated_; }

private:
	friend class DeviceSession;
	LiveSubscription(DeviceSession* session, CancelToken* token, int sliceMs);

	DeviceSession* session_ = nullptr;
	CancelToken* token_ = nullptr;
	int sliceMs_ = 1000;
	bool terminated_ = false;
};

// One transport connection to one terminal, owned by one worker.
class DeviceSession {
public:
	DeviceSession(std::unique_ptr<DeviceDriver> driver, const DeviceConfig& config,
	              const SessionTimeouts& timeouts, const CancelToken* cancel = nullptr);
	~DeviceSession();

	DeviceSession(const DeviceSession&) = delete;
	DeviceSession& operator=(const DeviceSession&) = delete;

	void connect();
	void disconnect() noexcept;		// idempotent

	bool isConnected() const { return connected_; }
	bool isAlive() const;

	// Serial reported by the terminal, else the configured identity.
	const QString& deviceSerial() const { return serial_; }

	QVector<DeviceUser> listUsers();
	HistoricalBatch fetchHistoricalRecords();
	LiveSubscription subscribeLive(CancelToken& token);

private:
	friend class LiveSubscription;
	void requireConnected(const char* operation) const;

	std::unique_ptr<DeviceDriver> driver_;
	DeviceConfig config_;
	SessionTimeouts timeouts_;
	QString serial_;
	bool connected_ = false;
	bool subscribed_ = false;
};
