#include "http_transport.h"

#include <cstdlib>
#include <mutex>
#include <stdexcept>

#include <curl/curl.h>

#include "captcha_error.h"
#include "log.h"

using json = nlohmann::json;

static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp)
{
	((std::string*)userp)->append((char*)contents, size * nmemb);
	return size * nmemb;
}

static std::once_flag CurlGlobalFlag;

// Owns one easy handle and the header list attached to it.
class CurlRequest {
public:
	CurlRequest() : Handle(curl_easy_init()), Headers(nullptr), Mime(nullptr)
	{
		if (!Handle) {
			throw TransportError("curl_easy_init failed");
		}
	}

	~CurlRequest()
	{
		if (Mime) {
			curl_mime_free(Mime);
		}
		if (Headers) {
			curl_slist_free_all(Headers);
		}
		curl_easy_cleanup(Handle);
	}

	CurlRequest(const CurlRequest&) = delete;
	CurlRequest& operator=(const CurlRequest&) = delete;

	CURL* Handle;
	curl_slist* Headers;
	curl_mime* Mime;
};

static void CurlInitial(CurlRequest& Request, const HttpOptions& Options, std::string& ReadBuffer)
{
	curl_easy_setopt(Request.Handle, CURLOPT_WRITEFUNCTION, WriteCallback);
	curl_easy_setopt(Request.Handle, CURLOPT_WRITEDATA, &ReadBuffer);
	curl_easy_setopt(Request.Handle, CURLOPT_TIMEOUT, Options.TimeoutSeconds);
	curl_easy_setopt(Request.Handle, CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(Request.Handle, CURLOPT_USERAGENT, Options.UserAgent.c_str());

	if (Options.Proxy.length()) {
		curl_easy_setopt(Request.Handle, CURLOPT_PROXY, Options.Proxy.c_str());
	}

	// the upload answers with a 303 whose body already carries the captcha
	curl_easy_setopt(Request.Handle, CURLOPT_FOLLOWLOCATION, 0L);

	Request.Headers = curl_slist_append(Request.Headers, "Accept: " DBC_HTTP_RESPONSE_TYPE);
	Request.Headers = curl_slist_append(Request.Headers, "Expect:");
	curl_easy_setopt(Request.Handle, CURLOPT_HTTPHEADER, Request.Headers);
}

static HttpResponse Perform(CurlRequest& Request, const std::string& Url, std::string& ReadBuffer)
{
	curl_easy_setopt(Request.Handle, CURLOPT_URL, Url.c_str());

	CURLcode res = curl_easy_perform(Request.Handle);
	if (res != CURLE_OK) {
		throw TransportError(vformat("[CURL Error] : %d %s | %s", res, curl_easy_strerror(res), Url.c_str()));
	}

	HttpResponse Response;
	curl_easy_getinfo(Request.Handle, CURLINFO_RESPONSE_CODE, &Response.StatusCode);

	char* Location = nullptr;
	if (curl_easy_getinfo(Request.Handle, CURLINFO_REDIRECT_URL, &Location) == CURLE_OK && Location) {
		Response.Location = Location;
	}

	Response.Body.swap(ReadBuffer);
	return Response;
}

CurlSession::CurlSession(const HttpOptions& InputOptions) :
	Options(InputOptions)
{
	std::call_once(CurlGlobalFlag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse CurlSession::Get(const std::string& Url, const std::vector<FormPart>& Fields)
{
	CurlRequest Request;
	std::string ReadBuffer;
	CurlInitial(Request, Options, ReadBuffer);

	std::string Query;
	for (const FormPart& Field : Fields) {
		char* Name = curl_easy_escape(Request.Handle, Field.Name.c_str(), static_cast<int>(Field.Name.length()));
		char* Value = curl_easy_escape(Request.Handle, Field.Value.c_str(), static_cast<int>(Field.Value.length()));
		if (!Name || !Value) {
			curl_free(Name);
			curl_free(Value);
			throw TransportError("curl_easy_escape failed");
		}
		Query += Query.empty() ? "?" : "&";
		Query += Name;
		Query += "=";
		Query += Value;
		curl_free(Name);
		curl_free(Value);
	}

	curl_easy_setopt(Request.Handle, CURLOPT_HTTPGET, 1L);
	return Perform(Request, Url + Query, ReadBuffer);
}

HttpResponse CurlSession::Post(const std::string& Url, const std::vector<FormPart>& Fields)
{
	CurlRequest Request;
	std::string ReadBuffer;
	CurlInitial(Request, Options, ReadBuffer);

	Request.Mime = curl_mime_init(Request.Handle);
	for (const FormPart& Field : Fields) {
		curl_mimepart* Part = curl_mime_addpart(Request.Mime);
		curl_mime_name(Part, Field.Name.c_str());
		curl_mime_data(Part, Field.Value.data(), Field.Value.size());
		if (Field.FileName.length()) {
			curl_mime_filename(Part, Field.FileName.c_str());
		}
		if (Field.ContentType.length()) {
			curl_mime_type(Part, Field.ContentType.c_str());
		}
	}
	curl_easy_setopt(Request.Handle, CURLOPT_MIMEPOST, Request.Mime);

	return Perform(Request, Url, ReadBuffer);
}

HttpTransport::HttpTransport(const Credentials& InputCredentials, const HttpOptions& InputOptions) :
	TransportClient(InputCredentials), Options(InputOptions), Session(std::make_unique<CurlSession>(InputOptions))
{
}

HttpTransport::HttpTransport(const Credentials& InputCredentials, std::unique_ptr<HttpSession> InputSession, const HttpOptions& InputOptions) :
	TransportClient(InputCredentials), Options(InputOptions), Session(std::move(InputSession))
{
	if (!Session) {
		throw std::invalid_argument("HttpTransport needs a session");
	}
}

UserAccount HttpTransport::GetUser()
{
	LogTraffic("SEND", "user", "");
	HttpResponse Response = Session->Get(Url("/user"), AuthFields());
	return ParseUserAccount(Evaluate("user", Response));
}

CaptchaId HttpTransport::Submit(const CaptchaSubmission& Submission)
{
	std::vector<FormPart> Fields = AuthFields();
	Fields.push_back(FormPart{ "swid", "0", "", "" });
	Fields.push_back(FormPart{ "type", std::to_string(Submission.Type()), "", "" });

	if (Submission.IsImage()) {
		FormPart Image;
		Image.Name = Submission.ImageField();
		Image.Value = Submission.Image();
		Image.FileName = std::string("captcha.") + ImageSniffer::FileExtension(Submission.ImageType());
		Image.ContentType = ImageSniffer::MimeType(Submission.ImageType());
		Fields.push_back(Image);
	}
	for (const auto& Param : Submission.Params()) {
		Fields.push_back(FormPart{ Param.first, Param.second, "", "" });
	}

	LogTraffic("SEND", "upload", vformat("type %d, %zu bytes of image", Submission.Type(), Submission.Image().size()));
	HttpResponse Response = Session->Post(Url("/captcha"), Fields);

	// some deployments answer the upload with an empty 303 pointing at the captcha
	if (Response.Body.empty() && Response.StatusCode == 303 && Response.Location.length()) {
		std::string::size_type Slash = Response.Location.find_last_of('/');
		std::string Tail = Response.Location.substr(Slash == std::string::npos ? 0 : Slash + 1);
		LogTraffic("RECV", "upload", Response.Location);

		char* End = nullptr;
		CaptchaId Id = std::strtoll(Tail.c_str(), &End, 10);
		if (Tail.empty() || *End != '\0' || Id <= 0) {
			throw TransportError("invalid API response: bad captcha location " + Response.Location);
		}
		return Id;
	}

	return ParseCaptchaId(Evaluate("upload", Response));
}

CaptchaStatus HttpTransport::CheckStatus(CaptchaId Id)
{
	std::string Command = vformat("captcha/%lld", Id);
	LogTraffic("SEND", Command, "");
	HttpResponse Response = Session->Get(Url("/" + Command), AuthFields());
	return ParseCaptchaStatus(Evaluate(Command, Response));
}

bool HttpTransport::Report(CaptchaId Id)
{
	std::string Command = vformat("captcha/%lld/report", Id);
	LogTraffic("SEND", Command, "");
	HttpResponse Response = Session->Post(Url("/" + Command), AuthFields());
	bool Reported = ParseReportAck(Evaluate(Command, Response));
	if (!Reported) {
		DBC_LOG_WARN("report for captcha %lld was not accepted", Id);
	}
	return Reported;
}

std::vector<FormPart> HttpTransport::AuthFields() const
{
	std::vector<FormPart> Fields;
	for (const auto& Field : Auth().Fields()) {
		Fields.push_back(FormPart{ Field.first, Field.second, "", "" });
	}
	return Fields;
}

std::string HttpTransport::Url(const std::string& Resource) const
{
	return Options.BaseUrl + Resource;
}

json HttpTransport::Evaluate(const std::string& Command, const HttpResponse& Response) const
{
	LogTraffic("RECV", Command, vformat("HTTP %ld %s", Response.StatusCode, Response.Body.c_str()));

	if (Response.StatusCode == 401 || Response.StatusCode == 403) {
		throw AuthenticationError("access denied, check your credentials and/or balance");
	}
	if (Response.StatusCode == 400 || Response.StatusCode == 413) {
		throw ValidationError(vformat("captcha was rejected by the service (HTTP %ld)", Response.StatusCode));
	}
	if (Response.StatusCode >= 500) {
		throw OverloadError(vformat("captcha was rejected due to service overload (HTTP %ld), try again later", Response.StatusCode));
	}
	if (Response.StatusCode != 200 && Response.StatusCode != 303) {
		throw TransportError(vformat("unexpected HTTP status %ld for %s", Response.StatusCode, Command.c_str()));
	}

	json j = ParseResponse(Response.Body);
	CheckServerError(j);
	return j;
}
