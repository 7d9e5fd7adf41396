/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#include <filedav/platform.h>
#include <algorithm>
#include <memory>
#include <new>
#include <string>
#include <vector>
#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <filedav/FDChannel.h>
#include <filedav/FDConfig.h>
#include <filedav/FDLogger.h>
#include <filedav/davcodes.h>
#include <filedav/stringutil.h>

namespace FD {

/*
 * Test key and certificate:
 * openssl req -x509 -newkey rsa:2048 -nodes -keyout privkey.pem -out cert.pem -days 365
 */
SSL_CTX *FDChannel::s_ctx = nullptr;

static const struct {
	const char *name;
	long no_op;
} tls_versions[] = {
	{"SSLv3", SSL_OP_NO_SSLv3},
	{"TLSv1", SSL_OP_NO_TLSv1},
	{"TLSv1.1", SSL_OP_NO_TLSv1_1},
	{"TLSv1.2", SSL_OP_NO_TLSv1_2},
#ifdef SSL_OP_NO_TLSv1_3
	{"TLSv1.3", SSL_OP_NO_TLSv1_3},
#endif
};

static const char *ssl_errstr()
{
	return ERR_error_string(ERR_get_error(), nullptr);
}

/**
 * Turns ssl_protocols ("TLSv1.2 TLSv1.3", "!SSLv3 !TLSv1") into SSL_OP_NO_*
 * flags. Naming any version without "!" disables all versions not named.
 * Unknown negated names are ignored, e.g. SSLv2 which OpenSSL no longer
 * has.
 */
static HRESULT tls_version_options(const char *spec, long *ops)
{
	long include = 0, exclude = 0, all = 0;
	for (const auto &v : tls_versions)
		all |= v.no_op;
	for (const auto &word : tokenize(spec != nullptr ? spec : "", " \t")) {
		bool neg = word[0] == '!';
		auto name = neg ? word.substr(1) : word;
		auto v = std::find_if(std::begin(tls_versions), std::end(tls_versions),
			[&](const auto &e) { return strcasecmp(e.name, name.c_str()) == 0; });
		if (v == std::end(tls_versions)) {
			if (neg)
				continue;
			fd_log_err("Unknown protocol \"%s\" in ssl_protocols setting", name.c_str());
			return FDERR_INVALID_PARAMETER;
		}
		(neg ? exclude : include) |= v->no_op;
	}
	if (include != 0)
		exclude |= all & ~include;
	*ops = exclude;
	return hrSuccess;
}

/**
 * Sets up the server-wide TLS context from the ssl_* settings.
 */
HRESULT FDChannel::HrSetCtx(FDConfig *cfg)
{
	if (cfg == nullptr)
		return FDERR_INVALID_PARAMETER;
	auto cert_file = cfg->GetSetting("ssl_certificate_file");
	auto key_file = cfg->GetSetting("ssl_private_key_file");
	auto ciphers = cfg->GetSetting("ssl_ciphers");
	auto curves = cfg->GetSetting("ssl_curves");
	auto verify_file = cfg->GetSetting("ssl_verify_file");
	auto verify_path = cfg->GetSetting("ssl_verify_path");

	if (cert_file == nullptr || access(cert_file, R_OK) != 0) {
		fd_log_err("Cannot read certificate file \"%s\": %s", cert_file, strerror(errno));
		return FDERR_CALL_FAILED;
	}
	if (key_file == nullptr || access(key_file, R_OK) != 0) {
		fd_log_err("Cannot read private key file \"%s\": %s", key_file, strerror(errno));
		return FDERR_CALL_FAILED;
	}
	long version_ops = 0;
	auto hr = tls_version_options(cfg->GetSetting("ssl_protocols"), &version_ops);
	if (hr != hrSuccess)
		return hr;

	std::unique_ptr<SSL_CTX, decltype(&SSL_CTX_free)> ctx(SSL_CTX_new(TLS_server_method()), &SSL_CTX_free);
	if (ctx == nullptr) {
		fd_log_err("SSL_CTX_new: %s", ssl_errstr());
		return FDERR_CALL_FAILED;
	}
#ifndef SSL_OP_NO_RENEGOTIATION
#	define SSL_OP_NO_RENEGOTIATION 0
#endif
	SSL_CTX_set_options(ctx.get(), SSL_OP_ALL | SSL_OP_NO_RENEGOTIATION | version_ops);
	if (parseBool(cfg->GetSetting("ssl_prefer_server_ciphers")))
		SSL_CTX_set_options(ctx.get(), SSL_OP_CIPHER_SERVER_PREFERENCE);
	if (ciphers == nullptr || *ciphers == '\0')
		ciphers = FD_DEFAULT_CIPHERLIST;
	if (SSL_CTX_set_cipher_list(ctx.get(), ciphers) != 1) {
		fd_log_err("Cannot set cipher list \"%s\": %s", ciphers, ssl_errstr());
		return FDERR_CALL_FAILED;
	}
#if !defined(OPENSSL_NO_ECDH) && defined(SSL_CTX_set1_curves_list)
	if (curves == nullptr || *curves == '\0')
		curves = FD_DEFAULT_ECDH_CURVES;
	if (SSL_CTX_set1_curves_list(ctx.get(), curves) != 1) {
		fd_log_err("Cannot set curve list \"%s\": %s", curves, ssl_errstr());
		return FDERR_CALL_FAILED;
	}
#endif
	if (SSL_CTX_use_certificate_chain_file(ctx.get(), cert_file) != 1 ||
	    SSL_CTX_use_PrivateKey_file(ctx.get(), key_file, SSL_FILETYPE_PEM) != 1 ||
	    SSL_CTX_check_private_key(ctx.get()) != 1) {
		fd_log_err("Cannot load certificate \"%s\" with key \"%s\": %s", cert_file, key_file, ssl_errstr());
		return FDERR_CALL_FAILED;
	}
	SSL_CTX_set_default_verify_paths(ctx.get());
	if (parseBool(cfg->GetSetting("ssl_verify_client")))
		SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER | SSL_VERIFY_FAIL_IF_NO_PEER_CERT, nullptr);
	else
		SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_NONE, nullptr);
	if (verify_file != nullptr && *verify_file == '\0')
		verify_file = nullptr;
	if (verify_path != nullptr && *verify_path == '\0')
		verify_path = nullptr;
	if ((verify_file != nullptr || verify_path != nullptr) &&
	    SSL_CTX_load_verify_locations(ctx.get(), verify_file, verify_path) != 1)
		fd_log_err("Cannot load client verify locations: %s", ssl_errstr());

	HrFreeCtx();
	s_ctx = ctx.release();
	return hrSuccess;
}

HRESULT FDChannel::HrFreeCtx()
{
	SSL_CTX_free(s_ctx);
	s_ctx = nullptr;
	return hrSuccess;
}

FDChannel::FDChannel(int sockfd) :
	m_fd(sockfd)
{}

FDChannel::~FDChannel()
{
	if (m_ssl != nullptr) {
		SSL_shutdown(m_ssl);
		SSL_free(m_ssl);
	}
	close(m_fd);
}

HRESULT FDChannel::HrEnableTLS()
{
	if (m_ssl != nullptr || s_ctx == nullptr)
		return FDERR_NOT_INITIALIZED;
	std::unique_ptr<SSL, decltype(&SSL_free)> ssl(SSL_new(s_ctx), &SSL_free);
	if (ssl == nullptr) {
		fd_log_err("SSL_new: %s", ssl_errstr());
		return FDERR_NOT_ENOUGH_MEMORY;
	}
	if (SSL_set_fd(ssl.get(), m_fd) != 1) {
		fd_log_err("SSL_set_fd: %s", ssl_errstr());
		return FDERR_CALL_FAILED;
	}
	SSL_set_accept_state(ssl.get());
	auto rc = SSL_accept(ssl.get());
	if (rc != 1) {
		fd_log_err("TLS handshake with %s failed: %d", peer_addr(), SSL_get_error(ssl.get(), rc));
		return FDERR_NETWORK_ERROR;
	}
	m_ssl = ssl.release();
	return hrSuccess;
}

ssize_t FDChannel::RawRead(char *buf, size_t len)
{
	len = std::min(len, static_cast<size_t>(INT_MAX));
	if (m_ssl != nullptr)
		return SSL_read(m_ssl, buf, len);
	ssize_t ret;
	do {
		ret = recv(m_fd, buf, len, 0);
	} while (ret < 0 && errno == EINTR);
	return ret;
}

/* Appends whatever the peer has sent; EOF counts as an error. */
HRESULT FDChannel::HrFill()
{
	char buf[16384];
	auto n = RawRead(buf, sizeof(buf));
	if (n <= 0)
		return FDERR_NETWORK_ERROR;
	m_rbuf.append(buf, n);
	return hrSuccess;
}

void FDChannel::Consume(size_t len)
{
	m_rpos += len;
	if (m_rpos == m_rbuf.size()) {
		m_rbuf.clear();
		m_rpos = 0;
	} else if (m_rpos >= 65536) {
		m_rbuf.erase(0, m_rpos);
		m_rpos = 0;
	}
}

HRESULT FDChannel::HrReadLine(std::string &line, size_t maxbuf)
{
	line.clear();
	size_t scanned = m_rpos;
	while (true) {
		auto nl = m_rbuf.find('\n', scanned);
		if (nl != std::string::npos) {
			if (nl - m_rpos > maxbuf)
				return FDERR_TOO_BIG;
			line.assign(m_rbuf, m_rpos, nl - m_rpos);
			if (!line.empty() && line.back() == '\r')
				line.pop_back();
			Consume(nl - m_rpos + 1);
			return hrSuccess;
		}
		if (m_rbuf.size() - m_rpos > maxbuf)
			return FDERR_TOO_BIG;
		scanned = m_rbuf.size();
		auto hr = HrFill();
		if (hr != hrSuccess)
			return hr;
	}
}

HRESULT FDChannel::HrReadBytes(std::string *out, size_t len)
{
	if (out == nullptr)
		return FDERR_INVALID_PARAMETER;
	try {
		out->resize(len);
	} catch (const std::bad_alloc &) {
		return FDERR_NOT_ENOUGH_MEMORY;
	}
	size_t done = std::min(len, m_rbuf.size() - m_rpos);
	if (done > 0) {
		memcpy(&(*out)[0], m_rbuf.data() + m_rpos, done);
		Consume(done);
	}
	while (done < len) {
		auto n = RawRead(&(*out)[done], len - done);
		if (n <= 0)
			return FDERR_NETWORK_ERROR;
		done += n;
	}
	return hrSuccess;
}

HRESULT FDChannel::HrWriteString(const std::string &data)
{
	size_t done = 0;
	while (done < data.size()) {
		auto len = std::min(data.size() - done, static_cast<size_t>(INT_MAX));
		ssize_t ret;
		if (m_ssl != nullptr)
			ret = SSL_write(m_ssl, data.data() + done, len);
		else
			ret = send(m_fd, data.data() + done, len, MSG_NOSIGNAL);
		if (ret < 0 && m_ssl == nullptr && errno == EINTR)
			continue;
		if (ret <= 0)
			return FDERR_NETWORK_ERROR;
		done += ret;
	}
	return hrSuccess;
}

HRESULT FDChannel::HrSelect(int seconds)
{
	if (m_rpos < m_rbuf.size() || (m_ssl != nullptr && SSL_pending(m_ssl) > 0))
		return hrSuccess;
	struct pollfd pfd = {m_fd, POLLIN, 0};
	auto ret = poll(&pfd, 1, seconds * 1000);
	if (ret < 0)
		/* the caller has to see SIGTERM */
		return errno == EINTR ? FDERR_CANCEL : FDERR_NETWORK_ERROR;
	return ret == 0 ? FDERR_TIMEOUT : hrSuccess;
}

void FDChannel::SetIPAddress(const struct sockaddr *sa, socklen_t len)
{
	char host[256], serv[16];
	if (sa->sa_family == AF_UNIX)
		m_peer = "unix:";
	else if (getnameinfo(sa, len, host, sizeof(host), serv, sizeof(serv),
	    NI_NUMERICHOST | NI_NUMERICSERV) != 0)
		m_peer = "<indeterminate>";
	else if (sa->sa_family == AF_INET6)
		m_peer = std::string("[") + host + "]:" + serv;
	else
		m_peer = std::string(host) + ":" + serv;
}

HRESULT HrAccept(int lfd, FDChannel **chp)
{
	if (lfd < 0 || chp == nullptr)
		return FDERR_INVALID_PARAMETER;
	struct sockaddr_storage peer{};
	socklen_t len = sizeof(peer);
	int fd;
	do {
		fd = accept(lfd, reinterpret_cast<struct sockaddr *>(&peer), &len);
	} while (fd < 0 && errno == EINTR);
	if (fd < 0) {
		fd_log_err("accept: %s", strerror(errno));
		return FDERR_NETWORK_ERROR;
	}
	auto ch = new(std::nothrow) FDChannel(fd);
	if (ch == nullptr) {
		close(fd);
		return FDERR_NOT_ENOUGH_MEMORY;
	}
	ch->SetIPAddress(reinterpret_cast<const struct sockaddr *>(&peer), len);
	fd_log_info("Accepted connection from %s", ch->peer_addr());
	*chp = ch;
	return hrSuccess;
}

static bool parse_port(const char *s, uint16_t *port)
{
	char *end = nullptr;
	auto v = strtoul(s, &end, 10);
	if (*s == '\0' || *end != '\0' || v > 65535)
		return false;
	*port = v;
	return true;
}

std::pair<std::string, uint16_t> fd_parse_bindaddr(const char *spec)
{
	std::string host;
	const char *rest;
	if (*spec == '[') {
		auto close_br = strchr(spec, ']');
		if (close_br == nullptr)
			return {"!", 0};
		host.assign(spec + 1, close_br);
		rest = close_br + 1;
		if (*rest != '\0' && *rest != ':')
			return {"!", 0};
	} else {
		rest = strchr(spec, ':');
		if (rest == nullptr)
			rest = spec + strlen(spec);
		host.assign(spec, rest);
	}
	if (host == "*")
		/* getaddrinfo binds to any address for a null node */
		host.clear();
	uint16_t port = 0;
	if (*rest == ':' && !parse_port(rest + 1, &port))
		return {"!", 0};
	return {std::move(host), port};
}

/**
 * Binds a listening TCP socket. Of the addresses getaddrinfo proposes,
 * IPv6 is tried first since it also accepts mapped IPv4 connections.
 */
int fd_listen(const char *spec, int *pfd)
{
	auto addr = fd_parse_bindaddr(spec);
	if (addr.first == "!" || addr.second == 0) {
		fd_log_err("Invalid listen address \"%s\"", spec);
		return -EINVAL;
	}
	struct addrinfo hints{}, *res = nullptr;
	hints.ai_flags = AI_NUMERICHOST | AI_NUMERICSERV | AI_PASSIVE;
	hints.ai_socktype = SOCK_STREAM;
	auto port = std::to_string(addr.second);
	auto ret = getaddrinfo(addr.first.empty() ? nullptr : addr.first.c_str(),
	           port.c_str(), &hints, &res);
	if (ret != 0) {
		fd_log_err("getaddrinfo %s: %s", spec, ret == EAI_SYSTEM ? strerror(errno) : gai_strerror(ret));
		return -EINVAL;
	}
	std::unique_ptr<struct addrinfo, decltype(&freeaddrinfo)> res_free(res, &freeaddrinfo);
	std::vector<const struct addrinfo *> cand;
	for (auto ai = res; ai != nullptr; ai = ai->ai_next)
		cand.push_back(ai);
	std::stable_partition(cand.begin(), cand.end(),
		[](const struct addrinfo *ai) { return ai->ai_family == AF_INET6; });

	int err = ENOENT;
	for (auto ai : cand) {
		int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
		if (fd < 0) {
			err = errno;
			continue;
		}
		int on = 1;
		if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) < 0)
			fd_log_warn("setsockopt SO_REUSEADDR: %s", strerror(errno));
		if (bind(fd, ai->ai_addr, ai->ai_addrlen) == 0 && listen(fd, SOMAXCONN) == 0) {
			*pfd = fd;
			return 0;
		}
		err = errno;
		close(fd);
		/* do not fall back to another family that happens to be free */
		if (err == EADDRINUSE)
			break;
	}
	fd_log_crit("Unable to listen on %s: %s", spec, strerror(err));
	return -err;
}

} /* namespace */
