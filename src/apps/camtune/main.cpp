/* SPDX-License-Identifier: GPL-2.0-or-later */
/*
 * Copyright (C) 2026, camtune authors
 *
 * camtune - Exposure control daemon
 */

#include <errno.h>
#include <fcntl.h>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

#include <camtune/base/log.h>
#include <camtune/base/unique_fd.h>
#include <camtune/base/utils.h>
#include <camtune/logging.h>

#include "camtune/internal/camera_session.h"
#include "camtune/internal/configuration.h"
#include "camtune/internal/sync.h"

#include "../common/event_loop.h"
#include "../common/options.h"

#include "main.h"

using namespace camtune;

namespace camtune {

LOG_DEFINE_CATEGORY(Daemon)

} /* namespace camtune */

namespace {

/*
 * Parse a feature line of the form "<camera id> <feature>=<value> ...".
 * Blank lines and lines starting with '#' are skipped.
 */
bool parseFeatureLine(const std::string &line, unsigned int &id,
		      FeatureValues &features)
{
	bool first = true;

	for (const std::string &token : utils::split(utils::trim(line), " ")) {
		if (token.empty())
			continue;

		if (first) {
			char *end;
			unsigned long value = strtoul(token.c_str(), &end, 10);
			if (*end != '\0')
				return false;

			id = value;
			first = false;
			continue;
		}

		std::string::size_type pos = token.find('=');
		if (pos == std::string::npos || pos == 0)
			return false;

		std::optional<double> number = utils::toDouble(token.substr(pos + 1));
		if (!number)
			return false;

		features[token.substr(0, pos)] = *number;
	}

	return !first && !features.empty();
}

} /* namespace */

class CamtuneApp
{
public:
	CamtuneApp();

	static CamtuneApp *instance();

	int init(int argc, char **argv);
	void cleanup();

	int exec();
	void quit();
	void printStats();

private:
	int parseOptions(int argc, char *argv[]);
	int openFeatures();
	void readFeatures();
	void processLine(const std::string &line);
	void postFeatures();
	int startSync();
	int run();

	static CamtuneApp *app_;
	Options options_;

	std::optional<Configuration> config_;

	std::unique_ptr<UdpBus> bus_;
	std::unique_ptr<SyncPublisher> publisher_;
	std::vector<std::unique_ptr<TargetCache>> caches_;
	std::vector<std::unique_ptr<SyncSubscriber>> subscribers_;

	std::map<unsigned int, std::unique_ptr<CameraSession>> sessions_;
	std::map<unsigned int, FeatureValues> latest_;

	UniqueFD features_;
	std::string buffer_;

	EventLoop loop_;
};

CamtuneApp *CamtuneApp::app_ = nullptr;

CamtuneApp::CamtuneApp()
{
	CamtuneApp::app_ = this;
}

CamtuneApp *CamtuneApp::instance()
{
	return CamtuneApp::app_;
}

int CamtuneApp::init(int argc, char **argv)
{
	int ret;

	ret = parseOptions(argc, argv);
	if (ret < 0)
		return ret;

	config_ = Configuration::load(options_.string(OptConfig));
	if (!config_) {
		std::cerr << "Invalid configuration "
			  << options_.string(OptConfig) << std::endl;
		return -EINVAL;
	}

	return 0;
}

void CamtuneApp::cleanup()
{
	for (auto &[id, session] : sessions_)
		session->stop();

	sessions_.clear();
	subscribers_.clear();
	caches_.clear();
}

int CamtuneApp::exec()
{
	int ret;

	ret = run();
	cleanup();

	return ret;
}

void CamtuneApp::quit()
{
	loop_.stop();
}

int CamtuneApp::parseOptions(int argc, char *argv[])
{
	OptionsParser parser("camtune -c <config.yaml> [options]");
	parser.addOption(OptConfig, OptionType::String, "config",
			 "Load the deployment configuration from a YAML file",
			 "file");
	parser.addOption(OptCamera, OptionType::Integer, "camera",
			 "Control only the camera with the given id\n"
			 "All enabled cameras are controlled by default.",
			 "id", true);
	parser.addOption(OptFeatures, OptionType::String, "features",
			 "Read feature lines from a file or FIFO, '-' for stdin\n"
			 "Each line is '<camera id> <feature>=<value> ...'. Default is stdin.",
			 "path");
	parser.addOption(OptHelp, OptionType::Flag, "help",
			 "Display this help message");
	parser.addOption(OptLogLevel, OptionType::String, "log-level",
			 "Set the log level, globally or per category\n"
			 "As 'level' or 'category:level[,category:level...]'",
			 "levels");

	std::optional<Options> options = parser.parse(argc, argv);
	if (!options)
		return -EINVAL;

	options_ = std::move(*options);

	if (options_.isSet(OptHelp)) {
		parser.usage();
		return -EINTR;
	}

	if (!options_.isSet(OptConfig)) {
		std::cerr << "Missing configuration file" << std::endl;
		parser.usage();
		return -EINVAL;
	}

	if (options_.isSet(OptLogLevel)) {
		for (const std::string &entry : utils::split(options_.string(OptLogLevel), ",")) {
			std::string::size_type pos = entry.find(':');
			int ret = pos == std::string::npos
				? logSetLevel("*", entry.c_str())
				: logSetLevel(entry.substr(0, pos).c_str(),
					      entry.substr(pos + 1).c_str());
			if (ret < 0) {
				std::cerr << "Invalid log level '" << entry << "'"
					  << std::endl;
				return ret;
			}
		}
	}

	return 0;
}

int CamtuneApp::openFeatures()
{
	std::string path = options_.isSet(OptFeatures)
			 ? options_.string(OptFeatures) : "-";

	if (path == "-") {
		features_ = UniqueFD(dup(STDIN_FILENO));
	} else {
		/*
		 * Open FIFOs read-write so that the daemon doesn't see an end
		 * of file when the last writer goes away.
		 */
		struct stat st;
		int flags = O_RDONLY;
		if (stat(path.c_str(), &st) == 0 && S_ISFIFO(st.st_mode))
			flags = O_RDWR;

		features_ = UniqueFD(open(path.c_str(), flags | O_CLOEXEC));
	}

	if (!features_.isValid()) {
		int ret = -errno;
		std::cerr << "Failed to open feature input " << path << ": "
			  << strerror(-ret) << std::endl;
		return ret;
	}

	int flags = fcntl(features_.get(), F_GETFL);
	if (flags < 0 || fcntl(features_.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
		int ret = -errno;
		std::cerr << "Failed to configure feature input: "
			  << strerror(-ret) << std::endl;
		return ret;
	}

	return loop_.watchReadable(features_.get(), [this]() { readFeatures(); });
}

void CamtuneApp::readFeatures()
{
	char data[4096];

	while (true) {
		ssize_t size = read(features_.get(), data, sizeof(data));
		if (size < 0) {
			if (errno == EINTR)
				continue;
			if (errno != EAGAIN && errno != EWOULDBLOCK) {
				LOG(Daemon, Error)
					<< "Failed to read features: " << strerror(errno);
				quit();
			}
			break;
		}

		if (size == 0) {
			LOG(Daemon, Info) << "End of feature input";
			quit();
			break;
		}

		buffer_.append(data, size);
	}

	std::string::size_type pos;
	while ((pos = buffer_.find('\n')) != std::string::npos) {
		processLine(buffer_.substr(0, pos));
		buffer_.erase(0, pos + 1);
	}
}

void CamtuneApp::processLine(const std::string &line)
{
	std::string trimmed = utils::trim(line);
	if (trimmed.empty() || trimmed[0] == '#')
		return;

	unsigned int id;
	FeatureValues features;
	if (!parseFeatureLine(trimmed, id, features)) {
		LOG(Daemon, Warning) << "Malformed feature line '" << trimmed << "'";
		return;
	}

	if (!sessions_.count(id)) {
		LOG(Daemon, Debug) << "Ignoring features for camera " << id;
		return;
	}

	for (const auto &[name, value] : features)
		latest_[id][name] = value;
}

/* Hand the latest features of every camera to its session. */
void CamtuneApp::postFeatures()
{
	for (auto &[id, features] : latest_) {
		if (features.empty())
			continue;

		sessions_[id]->post(features);
		features.clear();
	}
}

int CamtuneApp::startSync()
{
	const SyncConfig &sync = config_->sync;

	bus_ = std::make_unique<UdpBus>(sync.group, sync.port);
	int ret = bus_->open();
	if (ret < 0)
		return ret;

	ret = loop_.watchReadable(bus_->fd(), [this]() { bus_->process(); });
	if (ret < 0)
		return ret;

	publisher_ = std::make_unique<SyncPublisher>(bus_.get(),
						     *config_->masterCamera);

	return 0;
}

void CamtuneApp::printStats()
{
	for (const auto &[id, session] : sessions_) {
		ConcurrencyStats stats = session->stats();
		CycleSummary summary = session->lastSummary();

		std::cout << "camera " << id << ": limit " << stats.currentLimit
			  << "/" << stats.maxLimit
			  << (stats.enabled ? "" : " (sequential)")
			  << ", ok " << stats.successCount
			  << ", failed " << stats.failureCount
			  << ", success rate " << std::fixed << std::setprecision(1)
			  << stats.successRate * 100 << "%"
			  << ", rate limiting " << (stats.rateLimitingActive ? "on" : "off")
			  << ", cycles " << session->cycles()
			  << ", last " << summary.applied << "/" << summary.requested
			  << " applied"
			  << (session->healthy() ? "" : ", UNHEALTHY") << std::endl;
	}
}

int CamtuneApp::run()
{
	int ret;

	/* 1. Pick the cameras. */
	std::vector<const CameraConfig *> cameras;

	if (options_.isSet(OptCamera)) {
		for (int id : options_.integers(OptCamera)) {
			const CameraConfig *camera = config_->camera(id);
			if (!camera) {
				std::cerr << "Unknown camera " << id << std::endl;
				return -ENODEV;
			}

			cameras.push_back(camera);
		}
	} else {
		for (const CameraConfig &camera : config_->cameras) {
			if (camera.enabled)
				cameras.push_back(&camera);
		}
	}

	if (cameras.empty()) {
		std::cerr << "No camera to control" << std::endl;
		return -ENODEV;
	}

	/* 2. Set up the sync bus. */
	if (config_->sync.enabled) {
		ret = startSync();
		if (ret < 0) {
			std::cerr << "Failed to start sync: " << strerror(-ret)
				  << std::endl;
			return ret;
		}
	}

	/* 3. Create and start the sessions. */
	for (const CameraConfig *camera : cameras) {
		TargetCache *cache = nullptr;
		SyncPublisher *publisher = nullptr;

		if (bus_) {
			if (camera->id == *config_->masterCamera) {
				publisher = publisher_.get();
			} else {
				caches_.push_back(std::make_unique<TargetCache>(
					*config_->masterCamera, camera->id,
					config_->sync.staleness));
				cache = caches_.back().get();
				subscribers_.push_back(std::make_unique<SyncSubscriber>(
					bus_.get(), cache));
			}
		}

		auto session = std::make_unique<CameraSession>(*config_, *camera,
							       cache, publisher);
		ret = session->start();
		if (ret < 0) {
			std::cerr << "Failed to start camera " << camera->id
				  << std::endl;
			return ret;
		}

		sessions_[camera->id] = std::move(session);
	}

	/* 4. Wire the event sources. */
	ret = openFeatures();
	if (ret < 0)
		return ret;

	auto cycle = std::chrono::duration_cast<std::chrono::microseconds>(
		config_->cycleInterval.toClock());
	ret = loop_.every(cycle, [this]() { postFeatures(); });
	if (ret < 0)
		return ret;

	if (config_->statsInterval) {
		auto interval = std::chrono::duration_cast<std::chrono::microseconds>(
			config_->statsInterval.toClock());
		ret = loop_.every(interval, [this]() { printStats(); });
		if (ret < 0)
			return ret;
	}

	ret = loop_.onSignal(SIGINT, [this]() { quit(); });
	if (ret == 0)
		ret = loop_.onSignal(SIGTERM, [this]() { quit(); });
	if (ret == 0)
		ret = loop_.onSignal(SIGUSR1, [this]() { printStats(); });
	if (ret < 0)
		return ret;

	LOG(Daemon, Info) << "Controlling " << sessions_.size() << " camera(s)";

	return loop_.run();
}

int main(int argc, char **argv)
{
	CamtuneApp app;
	int ret;

	ret = app.init(argc, argv);
	if (ret)
		return ret == -EINTR ? 0 : EXIT_FAILURE;

	if (app.exec())
		return EXIT_FAILURE;

	return 0;
}
