#pragma once

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "captcha_error.h"
#include "http_transport.h"
#include "poll_scheduler.h"
#include "socket_transport.h"
#include "transport.h"

// Time only moves when somebody sleeps.
class FakeClock : public Clock {
public:
	FakeClock() : Current(std::chrono::steady_clock::time_point()) {}

	TimePoint Now() override
	{
		std::lock_guard<std::mutex> Lock(Mutex);
		return Current;
	}

	void SleepFor(Milliseconds Duration) override
	{
		{
			std::lock_guard<std::mutex> Lock(Mutex);
			Current += Duration;
			Sleeps.push_back(Duration);
		}
		std::this_thread::yield();
	}

	void Advance(Milliseconds Duration)
	{
		std::lock_guard<std::mutex> Lock(Mutex);
		Current += Duration;
	}

	std::vector<Milliseconds> Sleeps;

private:
	std::mutex Mutex;
	TimePoint Current;
};

struct RecordedRequest {
	std::string Method;
	std::string Url;
	std::vector<FormPart> Fields;

	const FormPart* Field(const std::string& Name) const
	{
		for (const FormPart& Part : Fields) {
			if (Part.Name == Name) {
				return &Part;
			}
		}
		return nullptr;
	}
};

// Answers requests from a queue of canned responses.
class FakeHttpSession : public HttpSession {
public:
	HttpResponse Get(const std::string& Url, const std::vector<FormPart>& Fields) override
	{
		return Answer("GET", Url, Fields);
	}

	HttpResponse Post(const std::string& Url, const std::vector<FormPart>& Fields) override
	{
		return Answer("POST", Url, Fields);
	}

	void Queue(long StatusCode, const std::string& Body, const std::string& Location = "")
	{
		HttpResponse Response;
		Response.StatusCode = StatusCode;
		Response.Body = Body;
		Response.Location = Location;
		Responses.push_back(Response);
	}

	// The next request after the already queued ones fails like an unreachable host.
	void QueueFailure() { Queue(-1, ""); }

	std::vector<RecordedRequest> Requests;

private:
	HttpResponse Answer(const std::string& Method, const std::string& Url, const std::vector<FormPart>& Fields)
	{
		Requests.push_back(RecordedRequest{ Method, Url, Fields });
		if (Responses.empty()) {
			throw TransportError("no response queued for " + Url);
		}
		HttpResponse Response = Responses.front();
		Responses.pop_front();
		if (Response.StatusCode < 0) {
			throw TransportError("[CURL Error] : 7 Couldn't connect to server | " + Url);
		}
		return Response;
	}

	std::deque<HttpResponse> Responses;
};

/*
In-memory stand-in for the socket service. Tracks every request it sees and
flags a protocol violation whenever a request arrives while the previous one
has not been answered yet.
*/
class FakeSocketService {
public:
	std::mutex Mutex;
	std::vector<nlohmann::json> Requests;
	std::vector<int> ConnectAttempts;
	std::vector<int> RefusedPorts;
	int Connections = 0;
	int Closed = 0;
	int Violations = 0;
	bool InFlight = false;

	long long UserId = 42;
	double Balance = 1234.75;
	int PollsUntilSolved = 2;
	bool Unsolvable = false;
	long long NextCaptchaId = 1000;
	std::map<long long, int> Polls;
	std::map<std::string, std::string> Errors; // cmd -> error code to answer with
	int DropReceives = 0; // fail this many receives before answering again

	std::string Handle(const std::string& Line)
	{
		nlohmann::json Request = nlohmann::json::parse(Line);
		Requests.push_back(Request);

		std::string Command = Request.value("cmd", "");
		nlohmann::json Response = nlohmann::json::object();
		if (Errors.count(Command)) {
			Response["error"] = Errors[Command];
			return Response.dump();
		}

		if (Command == "login") {
			Response["user"] = UserId;
			Response["balance"] = Balance;
		}
		else if (Command == "user") {
			Response["user"] = UserId;
			Response["balance"] = Balance;
			Response["rate"] = 0.139;
			Response["is_banned"] = false;
		}
		else if (Command == "upload") {
			long long Id = NextCaptchaId++;
			Polls[Id] = 0;
			Response["captcha"] = Id;
			Response["text"] = nullptr;
			Response["is_correct"] = true;
		}
		else if (Command == "captcha") {
			long long Id = Request["captcha"].get<long long>();
			int Count = ++Polls[Id];
			Response["captcha"] = Id;
			if (Unsolvable) {
				Response["text"] = nullptr;
				Response["is_correct"] = false;
			}
			else if (PollsUntilSolved > 0 && Count >= PollsUntilSolved) {
				Response["text"] = "text-" + std::to_string(Id);
				Response["is_correct"] = true;
			}
			else {
				Response["text"] = nullptr;
				Response["is_correct"] = true;
			}
		}
		else if (Command == "report") {
			Response["captcha"] = Request["captcha"];
			Response["is_correct"] = false;
		}
		else {
			Response["error"] = "unknown-command";
		}
		return Response.dump();
	}

	std::vector<std::string> Commands()
	{
		std::lock_guard<std::mutex> Lock(Mutex);
		std::vector<std::string> Result;
		for (const nlohmann::json& Request : Requests) {
			Result.push_back(Request.value("cmd", ""));
		}
		return Result;
	}
};

class FakeSocketConnection : public SocketConnection {
public:
	explicit FakeSocketConnection(std::shared_ptr<FakeSocketService> InputService) : Service(InputService), Open(true) {}

	void Send(const std::string& Data) override
	{
		if (!Open) {
			throw TransportError("socket is closed");
		}
		std::string Terminator = DBC_SOCKET_TERMINATOR;
		if (Data.size() < Terminator.size() || Data.compare(Data.size() - Terminator.size(), Terminator.size(), Terminator) != 0) {
			throw std::logic_error("request is not terminated");
		}

		std::lock_guard<std::mutex> Lock(Service->Mutex);
		if (Service->InFlight) {
			++Service->Violations;
		}
		Service->InFlight = true;
		Pending.push_back(Data.substr(0, Data.size() - Terminator.size()));
	}

	std::string ReceiveLine(const std::string& Terminator) override
	{
		// let other threads try to squeeze a request in
		std::this_thread::yield();

		std::lock_guard<std::mutex> Lock(Service->Mutex);
		Service->InFlight = false;
		if (Pending.empty()) {
			throw TransportError("nothing to answer");
		}
		std::string Request = Pending.front();
		Pending.pop_front();

		if (Service->DropReceives > 0) {
			--Service->DropReceives;
			Open = false;
			throw TransportError("connection reset by peer");
		}
		(void)Terminator;
		return Service->Handle(Request);
	}

	void Close() override
	{
		std::lock_guard<std::mutex> Lock(Service->Mutex);
		if (Open) {
			++Service->Closed;
		}
		Open = false;
	}

private:
	std::shared_ptr<FakeSocketService> Service;
	std::deque<std::string> Pending;
	bool Open;
};

class FakeSocketConnector : public SocketConnector {
public:
	explicit FakeSocketConnector(std::shared_ptr<FakeSocketService> InputService) : Service(InputService) {}

	std::unique_ptr<SocketConnection> Connect(const std::string& Host, int Port) override
	{
		(void)Host;
		std::lock_guard<std::mutex> Lock(Service->Mutex);
		Service->ConnectAttempts.push_back(Port);
		for (int Refused : Service->RefusedPorts) {
			if (Refused == Port) {
				throw TransportError("connection refused");
			}
		}
		++Service->Connections;
		return std::make_unique<FakeSocketConnection>(Service);
	}

private:
	std::shared_ptr<FakeSocketService> Service;
};

// Scripted transport for facade and solver tests.
class FakeTransport : public TransportClient {
public:
	FakeTransport() : TransportClient(Credentials("user", "password")) {}

	UserAccount GetUser() override
	{
		++UserCalls;
		if (BalanceFailures > 0) {
			--BalanceFailures;
			throw TransportError("connection reset by peer");
		}
		if (DenyAccess) {
			throw AuthenticationError("access denied");
		}
		UserAccount Account;
		Account.UserId = 7;
		Account.BalanceCents = BalanceCents;
		Account.Rate = 0.139;
		return Account;
	}

	CaptchaId Submit(const CaptchaSubmission& Submission) override
	{
		++SubmitCalls;
		LastType = Submission.Type();
		LastWasImage = Submission.IsImage();
		if (OverloadedSubmits > 0) {
			--OverloadedSubmits;
			throw OverloadError("service-overload");
		}
		Polls = 0;
		return CaptchaIdToIssue;
	}

	CaptchaStatus CheckStatus(CaptchaId Id) override
	{
		++Polls;
		CaptchaStatus Status;
		Status.Id = Id;
		if (Unsolvable) {
			Status.IsCorrect = false;
		}
		else if (PollsUntilSolved > 0 && Polls >= PollsUntilSolved) {
			Status.Text = "solved-text";
			BalanceCents -= CostPerSolve;
		}
		return Status;
	}

	bool Report(CaptchaId Id) override
	{
		ReportedIds.push_back(Id);
		BalanceCents += CostPerSolve;
		return true;
	}

	void Close() override
	{
		++CloseCalls;
		if (CloseCounter) {
			++*CloseCounter;
		}
	}

	CaptchaId CaptchaIdToIssue = 77;
	int PollsUntilSolved = 3;
	bool Unsolvable = false;
	int OverloadedSubmits = 0;
	int BalanceFailures = 0;
	bool DenyAccess = false;
	long long BalanceCents = 500;
	long long CostPerSolve = 1;

	int Polls = 0;
	int UserCalls = 0;
	int SubmitCalls = 0;
	int CloseCalls = 0;
	int* CloseCounter = nullptr; // survives the transport
	int LastType = -1;
	bool LastWasImage = false;
	std::vector<CaptchaId> ReportedIds;
};

static const std::string PngHeader("\x89PNG\r\n\x1a\n\0\0\0\rIHDR", 16);
