#include "socket_transport.h"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

#include <base64.h>

#include "captcha_error.h"
#include "log.h"

using json = nlohmann::json;

SocketOptions::SocketOptions() :
	Host(DBC_SOCKET_HOST), Reconnects(DBC_SOCKET_RECONNECTS), IoTimeoutSeconds(DBC_SOCKET_IO_TIMEOUT)
{
	for (int Candidate = DBC_SOCKET_FIRST_PORT; Candidate <= DBC_SOCKET_LAST_PORT; ++Candidate) {
		Ports.push_back(Candidate);
	}
}

class PosixSocketConnection : public SocketConnection {
public:
	explicit PosixSocketConnection(int InputSocket) : SocketFd(InputSocket) {}
	~PosixSocketConnection() override { Close(); }

	void Send(const std::string& Data) override
	{
		if (SocketFd < 0) {
			throw TransportError("socket is closed");
		}

		size_t BytesSent = 0;
		while (BytesSent != Data.length()) {
			ssize_t Sent = send(SocketFd, Data.data() + BytesSent, Data.length() - BytesSent, MSG_NOSIGNAL);
			if (Sent < 0) {
				if (errno == EINTR) {
					continue;
				}
				throw TransportError(vformat("send failed: %s", std::strerror(errno)));
			}
			BytesSent += static_cast<size_t>(Sent);
		}
	}

	std::string ReceiveLine(const std::string& Terminator) override
	{
		if (SocketFd < 0) {
			throw TransportError("socket is closed");
		}

		std::string::size_type End;
		while ((End = ReadBuffer.find(Terminator)) == std::string::npos) {
			char Chunk[4096];
			ssize_t Received = recv(SocketFd, Chunk, sizeof(Chunk), 0);
			if (Received == 0) {
				throw TransportError("connection closed by the service");
			}
			if (Received < 0) {
				if (errno == EINTR) {
					continue;
				}
				if (errno == EAGAIN || errno == EWOULDBLOCK) {
					throw TransportError("timed out waiting for the service");
				}
				throw TransportError(vformat("recv failed: %s", std::strerror(errno)));
			}
			ReadBuffer.append(Chunk, static_cast<size_t>(Received));
		}

		std::string Line = ReadBuffer.substr(0, End);
		ReadBuffer.erase(0, End + Terminator.length());
		return Line;
	}

	void Close() override
	{
		if (SocketFd >= 0) {
			shutdown(SocketFd, SHUT_RDWR);
			close(SocketFd);
			SocketFd = -1;
		}
		ReadBuffer.clear();
	}

private:
	int SocketFd;
	std::string ReadBuffer;
};

PosixSocketConnector::PosixSocketConnector(int InputIoTimeoutSeconds) :
	IoTimeoutSeconds(InputIoTimeoutSeconds)
{
}

std::unique_ptr<SocketConnection> PosixSocketConnector::Connect(const std::string& Host, int Port)
{
	struct addrinfo hints, *res = nullptr;
	std::memset(&hints, 0, sizeof(hints));
	hints.ai_family = AF_UNSPEC;
	hints.ai_socktype = SOCK_STREAM;

	int Status = getaddrinfo(Host.c_str(), std::to_string(Port).c_str(), &hints, &res);
	if (Status != 0) {
		throw TransportError(vformat("cannot resolve %s: %s", Host.c_str(), gai_strerror(Status)));
	}
	std::unique_ptr<struct addrinfo, void (*)(struct addrinfo*)> Addresses(res, freeaddrinfo);

	struct timeval Timeout;
	Timeout.tv_sec = IoTimeoutSeconds;
	Timeout.tv_usec = 0;

	for (struct addrinfo* Address = Addresses.get(); Address; Address = Address->ai_next) {
		int SocketFd = socket(Address->ai_family, Address->ai_socktype, Address->ai_protocol);
		if (SocketFd < 0) {
			continue;
		}

		// SO_SNDTIMEO bounds connect() as well
		setsockopt(SocketFd, SOL_SOCKET, SO_RCVTIMEO, &Timeout, sizeof(Timeout));
		setsockopt(SocketFd, SOL_SOCKET, SO_SNDTIMEO, &Timeout, sizeof(Timeout));

		if (connect(SocketFd, Address->ai_addr, Address->ai_addrlen) == 0) {
			return std::make_unique<PosixSocketConnection>(SocketFd);
		}
		close(SocketFd);
	}

	throw TransportError(vformat("cannot connect to %s:%d", Host.c_str(), Port));
}

// Copy of a request that is safe to print.
static json RedactForLog(json Request)
{
	static const char* const Secrets[] = { "password", "authtoken" };
	for (const char* Key : Secrets) {
		if (Request.count(Key)) {
			Request[Key] = "********";
		}
	}
	static const char* const Images[] = { "captcha", "banner" };
	for (const char* Key : Images) {
		if (Request.count(Key) && Request[Key].is_string()) {
			Request[Key] = vformat("<%zu base64 characters>", Request[Key].get<std::string>().length());
		}
	}
	return Request;
}

// The wire form of a request; text that is not valid UTF-8 cannot be sent.
static std::string Serialize(const json& Request)
{
	try {
		return Request.dump();
	}
	catch (const json::type_error& e) {
		throw ValidationError(vformat("request cannot be encoded: %s", e.what()));
	}
}

SocketTransport::SocketTransport(const Credentials& InputCredentials, const SocketOptions& InputOptions) :
	TransportClient(InputCredentials), Options(InputOptions), Connector(std::make_unique<PosixSocketConnector>(InputOptions.IoTimeoutSeconds)), Port(0)
{
}

SocketTransport::SocketTransport(const Credentials& InputCredentials, std::unique_ptr<SocketConnector> InputConnector, const SocketOptions& InputOptions) :
	TransportClient(InputCredentials), Options(InputOptions), Connector(std::move(InputConnector)), Port(0)
{
	if (!Connector) {
		throw std::invalid_argument("SocketTransport needs a connector");
	}
}

SocketTransport::~SocketTransport()
{
	Close();
}

UserAccount SocketTransport::GetUser()
{
	return ParseUserAccount(Call("user", json::object()));
}

CaptchaId SocketTransport::Submit(const CaptchaSubmission& Submission)
{
	json Data = json::object();
	Data["swid"] = 0;
	Data["type"] = Submission.Type();

	if (Submission.IsImage()) {
		const std::string& Image = Submission.Image();
		Data[Submission.ImageField()] = base64_encode(reinterpret_cast<const unsigned char*>(Image.c_str()), static_cast<unsigned int>(Image.length()));
	}
	for (const auto& Param : Submission.Params()) {
		Data[Param.first] = Param.second;
	}

	return ParseCaptchaId(Call("upload", Data));
}

CaptchaStatus SocketTransport::CheckStatus(CaptchaId Id)
{
	json Data = json::object();
	Data["captcha"] = Id;
	return ParseCaptchaStatus(Call("captcha", Data));
}

bool SocketTransport::Report(CaptchaId Id)
{
	json Data = json::object();
	Data["captcha"] = Id;

	bool Reported = ParseReportAck(Call("report", Data));
	if (!Reported) {
		DBC_LOG_WARN("report for captcha %lld was not accepted", Id);
	}
	return Reported;
}

void SocketTransport::Close()
{
	std::lock_guard<std::mutex> Lock(ConnectionMutex);
	CloseLocked();
}

void SocketTransport::Connect()
{
	std::lock_guard<std::mutex> Lock(ConnectionMutex);
	if (!Connection) {
		OpenLocked();
		LoginLocked();
	}
}

bool SocketTransport::IsConnected()
{
	std::lock_guard<std::mutex> Lock(ConnectionMutex);
	return Connection != nullptr;
}

int SocketTransport::ConnectedPort()
{
	std::lock_guard<std::mutex> Lock(ConnectionMutex);
	return Connection ? Port : 0;
}

json SocketTransport::Call(const std::string& Command, json Data)
{
	Data["cmd"] = Command;
	Data["version"] = DBC_API_VERSION;
	std::string Payload = Serialize(Data);

	json Response;
	{
		std::lock_guard<std::mutex> Lock(ConnectionMutex);

		for (int Reconnects = 0;; ++Reconnects) {
			bool Fresh = false;
			if (!Connection) {
				// no port accepting at all is not retried
				OpenLocked();
				Fresh = true;
			}

			try {
				if (Fresh) {
					LoginLocked();
				}
				Response = ExchangeLocked(Command, Data, Payload);
				break;
			}
			catch (const TransportError& e) {
				CloseLocked();
				if (Reconnects >= Options.Reconnects) {
					DBC_LOG_ERROR("%s failed after %d reconnects: %s", Command.c_str(), Reconnects, e.what());
					throw;
				}
				DBC_LOG_WARN("connection lost during %s (%s), reconnecting", Command.c_str(), e.what());
			}
		}
	}

	CheckServerError(Response);
	return Response;
}

void SocketTransport::OpenLocked()
{
	for (int Candidate : Options.Ports) {
		try {
			Connection = Connector->Connect(Options.Host, Candidate);
			Port = Candidate;
			return;
		}
		catch (const TransportError& e) {
			if (IsVerbose()) {
				DBC_LOG_DEBUG("%s:%d refused: %s", Options.Host.c_str(), Candidate, e.what());
			}
		}
	}

	throw TransportError(vformat("no port of %s accepted the connection", Options.Host.c_str()));
}

void SocketTransport::LoginLocked()
{
	json Login = json::object();
	for (const auto& Field : Auth().Fields()) {
		Login[Field.first] = Field.second;
	}
	Login["cmd"] = "login";
	Login["version"] = DBC_API_VERSION;

	try {
		json Response = ExchangeLocked("login", Login, Serialize(Login));
		CheckServerError(Response);
		if (Response.value("user", 0LL) <= 0) {
			throw AuthenticationError("access denied, check your credentials");
		}
	}
	catch (const json::exception& e) {
		CloseLocked();
		throw TransportError(vformat("invalid API response: %s", e.what()));
	}
	catch (const CaptchaError&) {
		CloseLocked();
		throw;
	}

	if (IsVerbose()) {
		DBC_LOG_DEBUG("logged in on %s:%d", Options.Host.c_str(), Port);
	}
}

void SocketTransport::CloseLocked()
{
	if (Connection) {
		Connection->Close();
		Connection.reset();
		if (IsVerbose()) {
			DBC_LOG_DEBUG("closed connection to %s:%d", Options.Host.c_str(), Port);
		}
	}
	Port = 0;
}

json SocketTransport::ExchangeLocked(const std::string& Command, const json& Request, const std::string& Payload)
{
	if (IsVerbose()) {
		LogTraffic("SEND", Command, RedactForLog(Request).dump());
	}
	Connection->Send(Payload + DBC_SOCKET_TERMINATOR);

	std::string Line = Connection->ReceiveLine(DBC_SOCKET_TERMINATOR);
	LogTraffic("RECV", Command, Line);
	return ParseResponse(Line);
}
