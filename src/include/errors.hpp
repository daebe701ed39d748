#pragma once
#include <QString>
#include <exception>
#include <string>

// Base of every error the sync engine raises on purpose.
// Anything else reaching a worker boundary is a defect.
class SyncError : public std::exception {
public:
	explicit SyncError(const QString& message)
		: message_(message), what_(message.toStdString()) {}

	const char* what() const noexcept override { return what_.c_str(); }
	const QString& message() const noexcept { return message_; }

private:
	QString message_;
	std::string what_;
};

// Network failure, handshake failure, or a dropped transport.
class ConnectionError : public SyncError {
public:
	using SyncError::SyncError;
};

// The device answered with something unparseable or a command was refused.
class ProtocolError : public SyncError {
public:
	using SyncError::SyncError;
};

// A single record failed normalization. Dropped, never retried.
class ValidationError : public SyncError {
public:
	using SyncError::SyncError;
};

// The database could not be reached or a statement failed.
class StoreError : public SyncError {
public:
	using SyncError::SyncError;
};

class ConfigError : public SyncError {
public:
	using SyncError::SyncError;
};
