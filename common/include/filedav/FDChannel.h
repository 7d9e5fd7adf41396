/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#ifndef FD_CHANNEL_H
#define FD_CHANNEL_H

#include <string>
#include <utility>
#include <cstdint>
#include <sys/socket.h>
#include <sys/types.h>
#include <openssl/ossl_typ.h>
#include <filedav/fddefs.h>
#include <filedav/platform.h>

namespace FD {

class FDConfig;

#define FD_DEFAULT_SSLPROTOLIST "!SSLv2 !SSLv3 !TLSv1 !TLSv1.1"
#define FD_DEFAULT_CIPHERLIST "DEFAULT:!LOW:!SSLv2:!SSLv3:!TLSv1.0:!TLSv1.1:!EXPORT:!DH:!PSK:!kRSA:!aDSS:!aNULL:+AES"
#ifdef NID_X25519
#	define FD_DEFAULT_ECDH_CURVES "X25519:P-521:P-384:P-256"
#else
#	define FD_DEFAULT_ECDH_CURVES "P-521:P-384:P-256"
#endif

/*
 * Connection to one HTTP client, plain or TLS. Reads are buffered, so
 * lines and bodies of pipelined requests can follow each other in one
 * segment. The channel owns the socket.
 */
class FD_EXPORT FDChannel FD_FINAL {
	public:
	FDChannel(int sockfd);
	~FDChannel();
	HRESULT HrEnableTLS();
	/* One line without its CR/LF; FDERR_TOO_BIG beyond @maxbuf bytes */
	HRESULT HrReadLine(std::string &line, size_t maxbuf = 65536);
	HRESULT HrReadBytes(std::string *buf, size_t len);
	HRESULT HrWriteString(const std::string &);
	/* Waits until input is available: FDERR_TIMEOUT, or FDERR_CANCEL on a signal */
	HRESULT HrSelect(int seconds);
	void SetIPAddress(const struct sockaddr *, socklen_t);
	const char *peer_addr() const { return m_peer.c_str(); }
	static HRESULT HrSetCtx(FDConfig *);
	static HRESULT HrFreeCtx();

	private:
	FD_HIDDEN ssize_t RawRead(char *buf, size_t len);
	FD_HIDDEN HRESULT HrFill();
	FD_HIDDEN void Consume(size_t len);

	int m_fd;
	SSL *m_ssl = nullptr;
	std::string m_peer = "<indeterminate>";
	std::string m_rbuf;
	size_t m_rpos = 0;
	static SSL_CTX *s_ctx;
};

extern FD_EXPORT HRESULT HrAccept(int fd, FDChannel **ch);
/*
 * Splits "host:port", "[v6addr]:port" or "*:port". The host is "!" for a
 * malformed spec and empty for the wildcard; a missing port yields 0.
 */
extern FD_EXPORT std::pair<std::string, uint16_t> fd_parse_bindaddr(const char *);
/* Binds and listens on an address spec; 0 or -errno */
extern FD_EXPORT int fd_listen(const char *spec, int *pfd);

} /* namespace FD */

#endif /* FD_CHANNEL_H */
