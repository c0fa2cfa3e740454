#include <iostream>
#include <string>
#include <vector>
#include <getopt.h>
#include <sysexits.h>
#include <stdlib.h>

#include <curl/curl.h>

#include "INIReader.h"

#include "logger.hpp"
#include "ClientConfig.hpp"
#include "HttpTransport.hpp"
#include "MasterPool.hpp"
#include "UploadErrors.hpp"
#include "Uploader.hpp"

using namespace std;

static void usage(const char* prog)
{
	cerr << "Usage: " << prog << " [--settings config_file] --mode video|model"
	     << " [--video path] [--model path --config path --code path] master..." << endl;
}

int main(int argc, char** argv) {
	initLogging();
	auto log = logger();

	string settingsPath, mode, videoPath, modelPath, configPath, codePath;

	static struct option longOptions[] = {
		{"settings", required_argument, nullptr, 's'},
		{"mode", required_argument, nullptr, 'm'},
		{"video", required_argument, nullptr, 'v'},
		{"model", required_argument, nullptr, 'M'},
		{"config", required_argument, nullptr, 'c'},
		{"code", required_argument, nullptr, 'C'},
		{"help", no_argument, nullptr, 'h'},
		{nullptr, 0, nullptr, 0}
	};

	int opt;
	while ((opt = getopt_long(argc, argv, "", longOptions, nullptr)) != -1) {
		switch (opt) {
			case 's': settingsPath = optarg; break;
			case 'm': mode = optarg; break;
			case 'v': videoPath = optarg; break;
			case 'M': modelPath = optarg; break;
			case 'c': configPath = optarg; break;
			case 'C': codePath = optarg; break;
			case 'h':
				usage(argv[0]);
				return EX_OK;
			default:
				usage(argv[0]);
				return EX_USAGE;
		}
	}

	// Read in the configuration file, if any
	ClientConfig config;
	if (!settingsPath.empty()) {
		INIReader ini(settingsPath);
		if (ini.ParseError() < 0) {
			cerr << "Error parsing config file " << settingsPath << endl;
			return EX_CONFIG;
		}
		if (!config.load(ini)) {
			return EX_CONFIG;
		}
	}

	vector<string> masterList(argv + optind, argv + argc);
	if (masterList.empty()) {
		masterList = config.masters;
	}
	if (masterList.empty()) {
		log->error("No masters ip provided");
		usage(argv[0]);
		return EX_USAGE;
	}
	for (auto& m : masterList) {
		if (m.empty()) {
			log->error("Empty master address");
			return EX_USAGE;
		}
	}

	if (mode == "video") {
		if (videoPath.empty()) {
			log->error("video flag wasn't provided");
			return EX_USAGE;
		}
	} else if (mode == "model") {
		if (modelPath.empty()) {
			log->error("model flag wasn't provided");
			return EX_USAGE;
		}
		if (configPath.empty()) {
			log->error("config flag wasn't provided");
			return EX_USAGE;
		}
		if (codePath.empty()) {
			log->error("code flag wasn't provided");
			return EX_USAGE;
		}
	} else {
		log->error("Invalid mode: '{}'", mode);
		usage(argv[0]);
		return EX_USAGE;
	}

	if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
		log->error("Unable to initialize libcurl");
		return EX_SOFTWARE;
	}

	int status = EX_OK;
	{
		MasterPool masters(masterList);
		CurlTransport curlTransport(config.connect_timeout_seconds, config.timeout_seconds,
		                            config.low_speed_limit_bytes, config.low_speed_time_seconds);
		RetryingTransport transport(curlTransport, config.requestPolicy());
		Uploader uploader(config, masters, transport);

		try {
			bool ok = (mode == "video")
				? uploader.uploadVideo(videoPath)
				: uploader.uploadModel(modelPath, configPath, codePath);
			if (!ok) {
				log->critical("File not uploaded: upload failed");
				status = EX_UNAVAILABLE;
			}
		} catch (LocalFileError& e) {
			log->critical("File not uploaded: {}", e.what());
			status = EX_NOINPUT;
		} catch (SessionInitFailed& e) {
			log->critical("File not uploaded: {}", e.what());
			status = EX_PROTOCOL;
		}
	}

	curl_global_cleanup();
	return status;
}
