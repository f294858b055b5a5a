/* SPDX-License-Identifier: LGPL-2.1-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * HTTP CGI transport with digest authentication
 */

#include <atomic>
#include <errno.h>
#include <map>
#include <mutex>
#include <stdlib.h>
#include <string>
#include <vector>

#include <curl/curl.h>

#include <camtune/base/log.h>
#include <camtune/base/mutex.h>
#include <camtune/base/utils.h>

#include "camtune/internal/protocol_transport.h"

namespace camtune {

LOG_DEFINE_CATEGORY(CGI)

namespace {

constexpr const char *kInquiryPath = "/command/inquiry.cgi?inqjs=imaging";
constexpr const char *kImagingPath = "/command/imaging.cgi?";

std::once_flag curlInitFlag;

size_t appendBody(char *data, size_t size, size_t nmemb, void *userdata)
{
	std::string *body = static_cast<std::string *>(userdata);
	body->append(data, size * nmemb);
	return size * nmemb;
}

} /* namespace */

class CgiTransport : public ProtocolTransport, public Loggable
{
public:
	CgiTransport(const TransportOptions &options);
	~CgiTransport();

	int connect() override;
	void disconnect() override;
	bool isConnected() const override { return connected_; }

	std::vector<CommandResult>
	getParameters(const std::vector<std::string> &names) override;
	std::vector<CommandResult>
	setParameters(const ParameterValues &values) override;

	int applyPreset(const std::string &arguments) override;

	void abort() override;

protected:
	std::string logPrefix() const override;

private:
	enum class Status {
		Ok,
		Rejected,
		ServerError,
		Timeout,
		ConnectionFailed,
		Aborted,
	};

	struct Response {
		Status status;
		long httpCode;
		std::string body;
	};

	CURL *acquireHandle();
	void releaseHandle(CURL *curl, bool failed);

	Response perform(const std::string &url, bool post);
	Response request(const std::string &url, bool post, unsigned int attempts);
	bool waitRetryDelay();

	static Outcome toOutcome(Status status);
	static int toErrno(Status status);
	static std::map<std::string, std::string> parseInquiry(const std::string &body);

	TransportOptions options_;
	std::string baseUrl_;

	Mutex mutex_;
	ConditionVariable poolCv_;
	std::vector<CURL *> idle_ CAMTUNE_TSA_GUARDED_BY(mutex_);
	unsigned int busy_ CAMTUNE_TSA_GUARDED_BY(mutex_);

	Mutex abortMutex_;
	ConditionVariable abortCv_;
	std::atomic<bool> aborted_;
	std::atomic<bool> connected_;
	bool initialized_;
};

CgiTransport::CgiTransport(const TransportOptions &options)
	: options_(options), busy_(0), aborted_(false), connected_(false), initialized_(false)
{
	std::call_once(curlInitFlag, []() {
		curl_global_init(CURL_GLOBAL_DEFAULT);
	});

	if (options_.address.rfind("http://", 0) == 0 ||
	    options_.address.rfind("https://", 0) == 0)
		baseUrl_ = options_.address;
	else
		baseUrl_ = "http://" + options_.address;
}

CgiTransport::~CgiTransport()
{
	disconnect();
}

std::string CgiTransport::logPrefix() const
{
	return "camera " + std::to_string(options_.cameraId);
}

/*
 * The pool holds at most poolSize easy handles, created on demand. A handle
 * that failed a request is destroyed instead of being returned, so that no
 * connection or digest authentication state survives a failure.
 */
CURL *CgiTransport::acquireHandle()
{
	{
		MutexLocker locker(mutex_);
		poolCv_.wait(locker, [this]() CAMTUNE_TSA_REQUIRES(mutex_) {
			return aborted_ || busy_ < options_.cgi.poolSize;
		});
		if (aborted_)
			return nullptr;

		busy_++;
		if (!idle_.empty()) {
			CURL *curl = idle_.back();
			idle_.pop_back();
			return curl;
		}
	}

	CURL *curl = curl_easy_init();
	if (!curl) {
		LOG(CGI, Error) << "Failed to create HTTP handle";

		{
			MutexLocker locker(mutex_);
			busy_--;
		}
		poolCv_.notify_one();
	}

	return curl;
}

void CgiTransport::releaseHandle(CURL *curl, bool failed)
{
	if (failed)
		curl_easy_cleanup(curl);

	{
		MutexLocker locker(mutex_);
		if (!failed)
			idle_.push_back(curl);
		busy_--;
	}

	poolCv_.notify_one();
}

CgiTransport::Response CgiTransport::perform(const std::string &url, bool post)
{
	Response response{ Status::ConnectionFailed, 0, {} };

	CURL *curl = acquireHandle();
	if (!curl) {
		response.status = aborted_ ? Status::Aborted : Status::ConnectionFailed;
		return response;
	}

	long timeoutMs = static_cast<long>(options_.cgi.timeout.get<std::milli>());

	curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl, CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_DIGEST));
	curl_easy_setopt(curl, CURLOPT_USERNAME, options_.cgi.username.c_str());
	curl_easy_setopt(curl, CURLOPT_PASSWORD, options_.cgi.password.c_str());
	curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeoutMs);
	curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeoutMs);
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, appendBody);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

	if (post) {
		curl_easy_setopt(curl, CURLOPT_POST, 1L);
		curl_easy_setopt(curl, CURLOPT_POSTFIELDS, "");
		curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, 0L);
	} else {
		curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
	}

	CURLcode res = curl_easy_perform(curl);
	if (res == CURLE_OK)
		curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.httpCode);

	if (res == CURLE_OPERATION_TIMEDOUT) {
		response.status = Status::Timeout;
	} else if (res != CURLE_OK) {
		LOG(CGI, Debug) << url << ": " << curl_easy_strerror(res);
		response.status = Status::ConnectionFailed;
	} else if (response.httpCode >= 200 && response.httpCode < 300) {
		response.status = Status::Ok;
	} else if (response.httpCode >= 400 && response.httpCode < 500) {
		response.status = Status::Rejected;
	} else {
		response.status = Status::ServerError;
	}

	releaseHandle(curl, response.status != Status::Ok &&
			    response.status != Status::Rejected);

	return response;
}

bool CgiTransport::waitRetryDelay()
{
	MutexLocker locker(abortMutex_);
	abortCv_.wait_for(locker, options_.cgi.retryDelay.toClock(),
			  [this]() { return aborted_.load(); });
	return !aborted_;
}

/*
 * Issue a request, retrying transient failures. Rejections are final, the
 * last transient failure is returned when all attempts are exhausted.
 */
CgiTransport::Response CgiTransport::request(const std::string &url, bool post,
					     unsigned int attempts)
{
	Response response{ Status::Aborted, 0, {} };

	for (unsigned int attempt = 1; attempt <= attempts; ++attempt) {
		if (aborted_) {
			response.status = Status::Aborted;
			break;
		}

		response = perform(url, post);
		if (response.status == Status::Ok ||
		    response.status == Status::Rejected ||
		    response.status == Status::Aborted)
			break;

		LOG(CGI, Debug)
			<< "Attempt " << attempt << "/" << attempts
			<< " failed (HTTP " << response.httpCode << ")";

		if (attempt < attempts && !waitRetryDelay()) {
			response.status = Status::Aborted;
			break;
		}
	}

	return response;
}

Outcome CgiTransport::toOutcome(Status status)
{
	switch (status) {
	case Status::Ok:
		return Outcome::Ok;
	case Status::Rejected:
		return Outcome::Rejected;
	case Status::ServerError:
	case Status::Timeout:
		return Outcome::Timeout;
	case Status::ConnectionFailed:
		return Outcome::Error;
	case Status::Aborted:
		return Outcome::Cancelled;
	}

	return Outcome::Error;
}

int CgiTransport::toErrno(Status status)
{
	switch (status) {
	case Status::Ok:
		return 0;
	case Status::Rejected:
		return -EINVAL;
	case Status::ServerError:
	case Status::Timeout:
		return -ETIMEDOUT;
	case Status::Aborted:
		return -ECANCELED;
	case Status::ConnectionFailed:
	default:
		return -EIO;
	}
}

/*
 * The inquiry body is a javascript snippet made of statements such as
 * var ExposureIris="11";
 */
std::map<std::string, std::string> CgiTransport::parseInquiry(const std::string &body)
{
	std::map<std::string, std::string> values;

	for (const std::string &line : utils::split(body, "\n")) {
		for (const std::string &token : utils::split(line, ";")) {
			std::string statement = utils::trim(token);
			if (statement.rfind("var ", 0) != 0)
				continue;

			std::string::size_type eq = statement.find('=');
			if (eq == std::string::npos)
				continue;

			std::string name = utils::trim(statement.substr(4, eq - 4));
			std::string value = utils::trim(statement.substr(eq + 1));
			if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
				value = value.substr(1, value.size() - 2);

			values[name] = value;
		}
	}

	return values;
}

int CgiTransport::connect()
{
	{
		MutexLocker locker(abortMutex_);
		aborted_ = false;
	}

	/* Check that the camera answers a single inquiry. */
	Response response = request(baseUrl_ + kInquiryPath, false, 1);
	if (response.status != Status::Ok) {
		LOG(CGI, Warning)
			<< "Camera unreachable at " << baseUrl_
			<< " (HTTP " << response.httpCode << ")";
		connected_ = false;
		return response.status == Status::Rejected ? -EACCES
							   : toErrno(response.status);
	}

	connected_ = true;

	if (!initialized_ && !options_.cgi.initialArguments.empty()) {
		int ret = applyPreset(options_.cgi.initialArguments);
		if (ret < 0) {
			LOG(CGI, Error) << "Failed to set initial parameters";
			return ret;
		}

		LOG(CGI, Info) << "Initial parameters applied";
	}

	initialized_ = true;
	return 0;
}

void CgiTransport::disconnect()
{
	connected_ = false;

	MutexLocker locker(mutex_);
	for (CURL *curl : idle_)
		curl_easy_cleanup(curl);
	idle_.clear();
}

void CgiTransport::abort()
{
	{
		MutexLocker locker(abortMutex_);
		aborted_ = true;
	}

	abortCv_.notify_all();

	/* Wake up requests waiting for a free handle. */
	{
		MutexLocker locker(mutex_);
	}
	poolCv_.notify_all();
}

std::vector<CommandResult>
CgiTransport::getParameters(const std::vector<std::string> &names)
{
	std::vector<CommandResult> results;
	if (names.empty())
		return results;

	Response response = request(baseUrl_ + kInquiryPath, false,
				    options_.cgi.maxAttempts);
	std::map<std::string, std::string> values;
	if (response.status == Status::Ok)
		values = parseInquiry(response.body);

	for (const std::string &name : names) {
		CommandResult result{ name, std::nullopt, std::nullopt,
				      toOutcome(response.status) };

		if (response.status == Status::Ok) {
			auto it = values.find(name);
			char *end = nullptr;
			long value = it != values.end()
				   ? strtol(it->second.c_str(), &end, 10) : 0;

			if (it == values.end() || it->second.empty() || *end != '\0') {
				LOG(CGI, Warning) << "Inquiry has no value for " << name;
				result.outcome = Outcome::Rejected;
			} else {
				result.achieved = static_cast<int32_t>(value);
			}
		}

		results.push_back(std::move(result));
	}

	return results;
}

std::vector<CommandResult>
CgiTransport::setParameters(const ParameterValues &values)
{
	std::vector<CommandResult> results;
	if (values.empty())
		return results;

	std::string query = utils::join(values, "&", [](const auto &value) {
		return value.first + "=" + std::to_string(value.second);
	});
	if (!options_.cgi.fixedArguments.empty())
		query += "&" + options_.cgi.fixedArguments;

	Response response = request(baseUrl_ + kImagingPath + query, true,
				    options_.cgi.maxAttempts);
	Outcome outcome = toOutcome(response.status);

	if (response.status == Status::Rejected)
		LOG(CGI, Warning)
			<< "Camera rejected " << query
			<< " (HTTP " << response.httpCode << ")";

	for (const auto &[name, value] : values) {
		CommandResult result{ name, value, std::nullopt, outcome };
		if (outcome == Outcome::Ok)
			result.achieved = value;
		results.push_back(std::move(result));
	}

	return results;
}

int CgiTransport::applyPreset(const std::string &arguments)
{
	Response response = request(baseUrl_ + kImagingPath + arguments, true,
				    options_.cgi.maxAttempts);
	return toErrno(response.status);
}

REGISTER_TRANSPORT(CgiTransport, "cgi")

} /* namespace camtune */
