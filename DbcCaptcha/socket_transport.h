#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "constants.h"
#include "response_parser.h"
#include "transport.h"

struct SocketOptions {
	SocketOptions();

	std::string Host;
	std::vector<int> Ports; // tried in order, the first one accepting wins
	int Reconnects;
	int IoTimeoutSeconds;
};

class SocketConnection {
public:
	virtual ~SocketConnection() {}

	virtual void Send(const std::string& Data) = 0;
	// Blocks until a full line ending with Terminator arrived; the
	// terminator is stripped.
	virtual std::string ReceiveLine(const std::string& Terminator) = 0;
	virtual void Close() = 0;
};

class SocketConnector {
public:
	virtual ~SocketConnector() {}

	// Throws TransportError when the port does not accept the connection.
	virtual std::unique_ptr<SocketConnection> Connect(const std::string& Host, int Port) = 0;
};

class PosixSocketConnector : public SocketConnector {
public:
	explicit PosixSocketConnector(int InputIoTimeoutSeconds = DBC_SOCKET_IO_TIMEOUT);

	std::unique_ptr<SocketConnection> Connect(const std::string& Host, int Port) override;

private:
	int IoTimeoutSeconds;
};

/*
Talks to the service over one persistent TCP connection, logged in once per
connection. Requests are serialized: a mutex covers every send/receive cycle,
so responses always belong to the request just sent. A connection lost in the
middle of a request is re-established (and the request repeated) a bounded
number of times before the TransportError reaches the caller.
*/
class SocketTransport : public TransportClient {
public:
	explicit SocketTransport(const Credentials& InputCredentials, const SocketOptions& InputOptions = SocketOptions());
	SocketTransport(const Credentials& InputCredentials, std::unique_ptr<SocketConnector> InputConnector, const SocketOptions& InputOptions = SocketOptions());
	~SocketTransport() override;

	UserAccount GetUser() override;
	CaptchaId Submit(const CaptchaSubmission& Submission) override;
	CaptchaStatus CheckStatus(CaptchaId Id) override;
	bool Report(CaptchaId Id) override;
	void Close() override;

	// Opens and logs in the connection ahead of the first request.
	void Connect();
	bool IsConnected();
	int ConnectedPort();

private:
	nlohmann::json Call(const std::string& Command, nlohmann::json Data);
	void OpenLocked();
	void LoginLocked();
	void CloseLocked();
	nlohmann::json ExchangeLocked(const std::string& Command, const nlohmann::json& Request, const std::string& Payload);

	SocketOptions Options;
	std::unique_ptr<SocketConnector> Connector;
	std::unique_ptr<SocketConnection> Connection;
	int Port;
	std::mutex ConnectionMutex;
};
