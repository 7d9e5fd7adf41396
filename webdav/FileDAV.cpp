/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#include <atomic>
#include <memory>
#include <new>
#include <string>
#include <utility>
#include <vector>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <poll.h>
#include <libHX/option.h>
#include <libxml/parser.h>
#include <filedav/platform.h>
#include <filedav/davcodes.h>
#include <filedav/FDChannel.h>
#include <filedav/FDConfig.h>
#include <filedav/FDLogger.h>
#include <filedav/fileutil.hpp>
#include <filedav/stringutil.h>
#include <filedav/UnixUtil.h>
#include "DavDelegate.h"
#include "DavRequest.h"
#include "DavServer.h"
#include "Http.h"
#include "WebDav.h"

using namespace FD;

/* A connection handed to its own thread */
struct dav_conn {
	std::unique_ptr<FDChannel> chan;
	bool tls;
};

static const char *opt_config_file;
static int opt_foreground;
static bool g_bQuit;
static std::shared_ptr<FDLogger> g_lpLogger;
static std::shared_ptr<FDConfig> g_lpConfig;
static std::unique_ptr<DavServer> g_lpServer;
static pthread_t mainthread;
static std::atomic<int> nChildren{0};
/* listening sockets; g_listen_tls[i] tells whether g_listen[i] speaks TLS */
static std::vector<struct pollfd> g_listen;
static std::vector<bool> g_listen_tls;
static HRESULT dav_listen(FDConfig *cfg);
static HRESULT dav_accept_loop();

#define KEEP_ALIVE_TIME 300

static constexpr const struct HXoption dav_options[] = {
	{"config", 'c', HXTYPE_STRING, &opt_config_file, nullptr, nullptr, 0, "Specify alternate config file"},
	{"foreground", 'F', HXTYPE_NONE, &opt_foreground, nullptr, nullptr, 0, "Do not run in the background"},
	HXOPT_AUTOHELP,
	HXOPT_TABLEEND,
};

static constexpr const configsetting_t dav_config_defaults[] = {
	{"upload_directory", "", CONFIGSETTING_NONEMPTY},
	{"allowed_extensions", ""},
	{"allow_hidden_items", "no"},
	{"filedav_listen", "*:8080"},
	{"filedavs_listen", ""},
	{"lock_timeout", "600"},
	{"lock_max_timeout", "3600"},
	{"max_body_size", "1g", CONFIGSETTING_SIZE | CONFIGSETTING_RELOADABLE},
	{"server_name", "filedav", CONFIGSETTING_RELOADABLE},
	{"run_as_user", "filedav"},
	{"run_as_group", "filedav"},
	{"pid_file", "/var/run/filedav/filedav.pid"},
	{"tmp_path", "/tmp"},
	{"log_method", "auto", CONFIGSETTING_NONEMPTY},
	{"log_file", ""},
	{"log_level", "3", CONFIGSETTING_NONEMPTY | CONFIGSETTING_RELOADABLE},
	{"log_timestamp", "1"},
	{"log_buffer_size", "0"},
	{"ssl_private_key_file", "/etc/filedav/privkey.pem"},
	{"ssl_certificate_file", "/etc/filedav/cert.pem"},
	{"ssl_protocols", FD_DEFAULT_SSLPROTOLIST},
	{"ssl_ciphers", FD_DEFAULT_CIPHERLIST},
	{"ssl_prefer_server_ciphers", "yes"},
	{"ssl_curves", FD_DEFAULT_ECDH_CURVES},
	{"ssl_verify_client", "no"},
	{"ssl_verify_file", ""},
	{"ssl_verify_path", ""},
	{nullptr, nullptr},
};

static void sigterm(int)
{
	g_bQuit = true;
}

/* Rereads filedav.cfg and reopens the log, for logrotate. */
static void sighup(int)
{
	if (pthread_equal(pthread_self(), mainthread) == 0 ||
	    g_lpConfig == nullptr || g_lpLogger == nullptr)
		return;
	if (!g_lpConfig->ReloadSettings())
		fd_log_crit("Unable to reload configuration file, continuing with current settings.");
	g_lpLogger->SetLoglevel(strtoul(g_lpConfig->GetSetting("log_level"), nullptr, 0));
	g_lpLogger->Reset();
	fd_log_warn("Log connection was reset");
}

static HRESULT running_service()
{
	fd_log(FD_LOGLEVEL_ALWAYS, "Starting filedav version " FILEDAV_VERSION " (pid %d uid %u) on %s",
		getpid(), getuid(), fd_os_pretty_name().c_str());
	auto hr = DavServer::Create(g_lpConfig.get(), std::make_shared<LoggingDelegate>(), &g_lpServer);
	if (hr != hrSuccess)
		return fd_perror("Unable to set up the upload directory", hr);
	hr = dav_listen(g_lpConfig.get());
	if (hr != hrSuccess)
		return hr;
	if (unix_runas(g_lpConfig.get()))
		return FDERR_CALL_FAILED;

	struct sigaction act{};
	signal(SIGPIPE, SIG_IGN);
	sigemptyset(&act.sa_mask);
	act.sa_flags = SA_RESTART;
	act.sa_handler = sigterm;
	sigaction(SIGTERM, &act, nullptr);
	sigaction(SIGINT, &act, nullptr);
	act.sa_handler = sighup;
	sigaction(SIGHUP, &act, nullptr);
	fd_setup_segv_handler("filedav", FILEDAV_VERSION);
	if (!opt_foreground && unix_daemonize(g_lpConfig.get()))
		return FDERR_CALL_FAILED;
	if (opt_foreground)
		setsid();
	if (unix_create_pidfile(g_lpConfig.get()) < 0)
		fd_log_warn("Continuing without a pid file");
	g_lpLogger->SetThreadPrefix(true);

	mainthread = pthread_self();
	hr = dav_accept_loop();
	if (hr != hrSuccess)
		return hr;
	fd_log_info("WebDAV server will now exit");

	/* connection threads notice g_bQuit within one poll round */
	int i = 30;
	while (nChildren > 0 && i > 0) {
		if (i % 5 == 0)
			fd_log_notice("Waiting for %d threads to exit", nChildren.load());
		sleep(1);
		--i;
	}
	if (nChildren > 0) {
		/* threads still reference g_lpServer */
		fd_log_notice("Forced shutdown with %d threads left", nChildren.load());
		g_lpServer.release();
		return hrSuccess;
	}
	g_lpServer->notifier().flush();
	g_lpServer.reset();
	fd_log_info("WebDAV server shutdown complete");
	return hrSuccess;
}

static bool dav_parse_options(int &argc, const char **&argv)
{
	g_lpConfig.reset(FDConfig::Create(dav_config_defaults));
	if (HX_getopt(dav_options, &argc, &argv, HXOPT_USAGEONERR | HXOPT_PTHRU) != HXOPT_ERR_SUCCESS)
		return false;
	std::string cfgfile = opt_config_file != nullptr ? opt_config_file : FDConfig::GetDefaultPath("filedav.cfg");
	if (!g_lpConfig->LoadSettings(cfgfile.c_str(), opt_config_file == nullptr) ||
	    g_lpConfig->ParseParams(argc - 1, const_cast<char **>(&argv[1])) < 0 ||
	    g_lpConfig->HasErrors()) {
		fprintf(stderr, "Error reading config file %s\n", cfgfile.c_str());
		LogConfigErrors(g_lpConfig.get());
		return false;
	}
	return true;
}

int main(int argc, const char **argv)
{
	setlocale(LC_ALL, "");
	if (!dav_parse_options(argc, argv))
		return EXIT_FAILURE;
	g_lpLogger = CreateLogger(g_lpConfig.get(), argv[0]);
	fd_log_set(g_lpLogger);
	if (g_lpConfig->HasWarnings())
		LogConfigErrors(g_lpConfig.get());
	/* spooled request bodies go to tmp_path */
	if (!TmpPath::instance.OverridePath(g_lpConfig.get()))
		fd_log_warn("Spooling request bodies to \"%s\"", TmpPath::instance.getTempPath().c_str());

	xmlInitParser();
	auto hr = running_service();
	FDChannel::HrFreeCtx();
	xmlCleanupParser();
	return hr == hrSuccess ? EXIT_SUCCESS : EXIT_FAILURE;
}

static HRESULT dav_add_listener(const std::string &spec, bool tls)
{
	struct pollfd pfd{};
	if (fd_listen(spec.c_str(), &pfd.fd) < 0)
		return FDERR_NETWORK_ERROR;
	pfd.events = POLLIN;
	g_listen.push_back(pfd);
	g_listen_tls.push_back(tls);
	fd_log_notice("Listening on %s%s", spec.c_str(), tls ? " (TLS)" : "");
	return hrSuccess;
}

static HRESULT dav_listen(FDConfig *cfg)
{
	auto plain = tokenize(cfg->GetSetting("filedav_listen"), ' ', true);
	auto secure = tokenize(cfg->GetSetting("filedavs_listen"), ' ', true);

	if (!secure.empty()) {
		auto hr = FDChannel::HrSetCtx(cfg);
		if (hr != hrSuccess) {
			fd_perror("Error loading SSL context, TLS listeners will be disabled", hr);
			secure.clear();
		}
	}
	if (plain.empty() && secure.empty()) {
		fd_log_crit("No listening sockets configured");
		return FDERR_INVALID_PARAMETER;
	}
	for (const auto &spec : plain) {
		auto hr = dav_add_listener(spec, false);
		if (hr != hrSuccess)
			return hr;
	}
	for (const auto &spec : secure) {
		auto hr = dav_add_listener(spec, true);
		if (hr != hrSuccess)
			return hr;
	}
	return hrSuccess;
}

/**
 * Reads one request from the channel, runs it through WebDav and writes
 * the response. Any error return ends the connection.
 */
static HRESULT dav_handle_request(FDChannel *chan)
{
	Http http(chan, g_lpConfig.get());
	std::string method;

	auto hr = http.HrReadHeaders();
	if (hr == FDERR_TOO_BIG || hr == FDERR_INVALID_PARAMETER)
		return http.HrWriteError(hr);
	else if (hr != hrSuccess)
		/* the client went away between requests */
		return FDERR_USER_CANCEL;
	http.HrGetMethod(&method);
	hr = http.HrValidateReq();
	if (hr != hrSuccess) {
		fd_log_info("Unsupported request method \"%s\"", method.c_str());
		return http.HrWriteError(hr);
	}
	hr = http.HrReadBody();
	if (hr != hrSuccess) {
		fd_log_err("Error reading %s request body: %s (%x)",
			method.c_str(), GetErrorMessage(hr), hr);
		http.HrWriteError(hr);
		return FDERR_END_OF_SESSION;
	}
	http.HrSetKeepAlive(KEEP_ALIVE_TIME);

	DavRequest req;
	hr = http.ToRequest(&req);
	if (hr != hrSuccess)
		return http.HrWriteError(hr);
	DavResponse resp;
	hr = WebDav(*g_lpServer, req, &resp).HrHandleCommand();
	if (hr != hrSuccess)
		fd_log_info("Error processing %s request for \"%s\": %s (%x)",
			method.c_str(), req.strPath.c_str(), GetErrorMessage(hr), hr);
	return http.HrWriteResponse(resp);
}

/* Thread body: serves requests until the client leaves or idles out. */
static void *dav_conn_main(void *arg)
{
	std::unique_ptr<dav_conn> conn(static_cast<dav_conn *>(arg));
	auto chan = conn->chan.get();

	fdsrv_blocksigs();
	set_thread_name(pthread_self(), std::string("dav/") + chan->peer_addr());
	if (conn->tls && chan->HrEnableTLS() != hrSuccess) {
		fd_log_err("Unable to negotiate TLS with %s", chan->peer_addr());
	} else {
		while (!g_bQuit) {
			auto hr = chan->HrSelect(KEEP_ALIVE_TIME);
			if (hr == FDERR_CANCEL)
				continue;
			if (hr != hrSuccess) {
				fd_log_info("Keep-alive timeout, closing connection");
				break;
			}
			if (dav_handle_request(chan) != hrSuccess)
				break;
		}
	}
	fd_log_info("Connection with %s closed", chan->peer_addr());
	conn.reset();
	--nChildren;
	return nullptr;
}

static HRESULT dav_spawn(std::unique_ptr<FDChannel> &&chan, bool tls)
{
	std::unique_ptr<dav_conn> conn(new(std::nothrow) dav_conn{std::move(chan), tls});
	if (conn == nullptr)
		return FDERR_NOT_ENOUGH_MEMORY;
	pthread_t tid;
	++nChildren;
	auto ret = pthread_create(&tid, nullptr, dav_conn_main, conn.get());
	if (ret != 0) {
		--nChildren;
		fd_log_err("Could not create WebDAV thread: %s", strerror(ret));
		return FDERR_CALL_FAILED;
	}
	conn.release();
	pthread_detach(tid);
	return hrSuccess;
}

/**
 * Accepts connections on all listeners until SIGTERM/SIGINT, and gives
 * each one a thread of its own.
 */
static HRESULT dav_accept_loop()
{
	while (!g_bQuit) {
		for (auto &pfd : g_listen)
			pfd.revents = 0;
		auto n = poll(g_listen.data(), g_listen.size(), 10 * 1000);
		if (n < 0 && errno != EINTR) {
			fd_log_crit("poll on listening sockets: %s", strerror(errno));
			return FDERR_NETWORK_ERROR;
		}
		if (n <= 0 || g_bQuit)
			continue;
		for (size_t i = 0; i < g_listen.size(); ++i) {
			/* the OS may set more bits than requested */
			if (!(g_listen[i].revents & POLLIN))
				continue;
			FDChannel *chan = nullptr;
			auto hr = HrAccept(g_listen[i].fd, &chan);
			if (hr != hrSuccess) {
				fd_perror("Could not accept incoming connection", hr);
				continue;
			}
			hr = dav_spawn(std::unique_ptr<FDChannel>(chan), g_listen_tls[i]);
			if (hr != hrSuccess)
				fd_perror("Handling client connection failed", hr);
		}
	}
	return hrSuccess;
}
