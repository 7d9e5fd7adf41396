/* SPDX-License-Identifier: LGPL-3.0-or-later */
/* Copyright 2016, Kopano and its licensors */
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <cppunit/CompilerOutputter.h>
#include <cppunit/extensions/TestFactoryRegistry.h>
#include <cppunit/ui/text/TestRunner.h>
#include <cppunit/extensions/HelperMacros.h>
#include <libxml/parser.h>
#include <filedav/platform.h>
#include <filedav/davcodes.h>
#include <filedav/fileutil.hpp>
#include <filedav/memory.hpp>
#include "DavDelegate.h"
#include "DavRequest.h"
#include "DavServer.h"
#include "DavStorage.h"
#include "DavXml.h"
#include "WebDav.h"

using namespace FD;

/* remembers notifications, and refuses what it is told to refuse */
class recording_delegate FD_FINAL : public DavDelegate {
	public:
	bool shouldDeleteItemAtPath(const std::string &) override { return !veto; }
	bool shouldUploadFileAtPath(const std::string &, const std::string &) override { return !veto; }
	bool shouldMoveItemFromPath(const std::string &, const std::string &) override { return !veto; }
	bool shouldCopyItemFromPath(const std::string &, const std::string &) override { return !veto; }
	bool shouldCreateDirectoryAtPath(const std::string &) override { return !veto; }
	void didDownloadFileAtPath(const std::string &p) override { add("download " + p); }
	void didUploadFileAtPath(const std::string &p) override { add("upload " + p); }
	void didMoveItemFromPath(const std::string &a, const std::string &b) override { add("move " + a + " " + b); }
	void didCopyItemFromPath(const std::string &a, const std::string &b) override { add("copy " + a + " " + b); }
	void didDeleteItemAtPath(const std::string &p) override { add("delete " + p); }
	void didCreateDirectoryAtPath(const std::string &p) override { add("mkcol " + p); }

	std::vector<std::string> take()
	{
		std::vector<std::string> out;
		std::lock_guard<std::mutex> lk(mtx);
		out.swap(events);
		return out;
	}
	bool veto = false;

	private:
	void add(std::string &&e)
	{
		std::lock_guard<std::mutex> lk(mtx);
		events.emplace_back(std::move(e));
	}
	std::mutex mtx;
	std::vector<std::string> events;
};

class handler_test : public CppUnit::TestFixture {
	CPPUNIT_TEST_SUITE(handler_test);
	CPPUNIT_TEST(test_options);
	CPPUNIT_TEST(test_get);
	CPPUNIT_TEST(test_put);
	CPPUNIT_TEST(test_put_spooled);
	CPPUNIT_TEST(test_mkcol);
	CPPUNIT_TEST(test_delete);
	CPPUNIT_TEST(test_copy);
	CPPUNIT_TEST(test_move);
	CPPUNIT_TEST(test_move_round_trip);
	CPPUNIT_TEST(test_rename_cross_device);
	CPPUNIT_TEST(test_propfind);
	CPPUNIT_TEST(test_lock);
	CPPUNIT_TEST(test_veto);
	CPPUNIT_TEST(test_notifications);
	CPPUNIT_TEST(test_security);
	CPPUNIT_TEST(test_security_hidden_allowed);
	CPPUNIT_TEST(test_error_body);
	CPPUNIT_TEST(test_unknown_method);
	CPPUNIT_TEST_SUITE_END();
	public:
	void setUp();
	void tearDown();
	void test_options();
	void test_get();
	void test_put();
	void test_put_spooled();
	void test_mkcol();
	void test_delete();
	void test_copy();
	void test_move();
	void test_move_round_trip();
	void test_rename_cross_device();
	void test_propfind();
	void test_lock();
	void test_veto();
	void test_notifications();
	void test_security();
	void test_security_hidden_allowed();
	void test_error_body();
	void test_unknown_method();

	private:
	DavResponse run(const std::string &method, const std::string &path,
		const DavHeaders &hdr = {}, const std::string &body = {});
	void put_file(const std::string &rel, const std::string &data);
	std::string read_file(const std::string &rel);
	bool exists(const std::string &rel, bool *coll = nullptr);
	bool leftovers();

	std::string m_base, m_root;
	std::shared_ptr<recording_delegate> m_delegate;
	std::unique_ptr<DavServer> m_server;
};

CPPUNIT_TEST_SUITE_REGISTRATION(handler_test);

void handler_test::setUp()
{
	char tmpl[] = "/tmp/davhandlers-XXXXXX";
	CPPUNIT_ASSERT(mkdtemp(tmpl) != nullptr);
	std::unique_ptr<char, cstdlib_deleter> canon(realpath(tmpl, nullptr));
	CPPUNIT_ASSERT(canon != nullptr);
	m_base = canon.get();
	m_root = m_base + "/root";
	CPPUNIT_ASSERT_EQUAL(0, mkdir(m_root.c_str(), 0755));
	m_delegate = std::make_shared<recording_delegate>();
	m_server.reset(new DavServer(m_root, "txt pdf", false, m_delegate, 600, 3600));
	CPPUNIT_ASSERT_EQUAL(hrSuccess, m_server->HrInit());
}

void handler_test::tearDown()
{
	m_server.reset();
	HrRemoveTree(m_base);
}

DavResponse handler_test::run(const std::string &method, const std::string &path,
    const DavHeaders &hdr, const std::string &body)
{
	DavRequest req;
	DavResponse resp;
	req.strMethod = method;
	req.strPath = path;
	req.strUrl = path;
	req.strHttpVer = "HTTP/1.1";
	req.mapHeaders = hdr;
	req.strBody = body;
	WebDav(*m_server, req, &resp).HrHandleCommand();
	return resp;
}

void handler_test::put_file(const std::string &rel, const std::string &data)
{
	int fd = open((m_root + rel).c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
	CPPUNIT_ASSERT(fd >= 0);
	CPPUNIT_ASSERT_EQUAL(static_cast<ssize_t>(data.size()), write(fd, data.c_str(), data.size()));
	close(fd);
}

std::string handler_test::read_file(const std::string &rel)
{
	std::unique_ptr<FILE, file_deleter> fp(fopen((m_root + rel).c_str(), "r"));
	std::string data;
	if (fp != nullptr)
		HrMapFileToString(fp.get(), &data);
	return data;
}

bool handler_test::exists(const std::string &rel, bool *coll)
{
	return DavExists(m_root + rel, coll);
}

/* any temp file left in the root by an aborted write */
bool handler_test::leftovers()
{
	std::vector<std::string> names;
	CPPUNIT_ASSERT_EQUAL(hrSuccess, HrListDirectory(m_root, &names));
	for (const auto &n : names)
		if (n.compare(0, 9, ".filedav-") == 0)
			return true;
	return false;
}

static bool dav_error(const DavResponse &r, const char *condition)
{
	DavXmlElement root;
	if (HrParseDavXml(r.strBody, &root) != hrSuccess || !root.is(WEBDAVNS, "error"))
		return false;
	if (condition == nullptr)
		return root.lstChildren.empty();
	return root.find(WEBDAVNS, condition) != nullptr;
}

static std::string header(const DavResponse &r, const char *name)
{
	std::string v;
	r.HrGetHeaderValue(name, &v);
	return v;
}

void handler_test::test_options()
{
	auto r = run("OPTIONS", "/");
	CPPUNIT_ASSERT_EQUAL(200U, r.ulCode);
	CPPUNIT_ASSERT_EQUAL(std::string(DAV_ALLOWED_METHODS), header(r, "Allow"));
	CPPUNIT_ASSERT_EQUAL(std::string("1"), header(r, "DAV"));

	r = run("OPTIONS", "/", {{"User-Agent", "WebDAVFS/3.0 (03008000) Darwin/21.6.0 (x86_64)"}});
	CPPUNIT_ASSERT_EQUAL(std::string("1, 2"), header(r, "DAV"));
	CPPUNIT_ASSERT_EQUAL(std::string(), header(r, "MS-Author-Via"));

	r = run("OPTIONS", "/", {{"user-agent", "Microsoft-WebDAV-MiniRedir/10.0.19045"}});
	CPPUNIT_ASSERT_EQUAL(std::string("1, 2"), header(r, "DAV"));
	CPPUNIT_ASSERT_EQUAL(std::string("DAV"), header(r, "MS-Author-Via"));
}

void handler_test::test_get()
{
	put_file("/a.txt", "hello");
	auto r = run("GET", "/a.txt");
	CPPUNIT_ASSERT_EQUAL(200U, r.ulCode);
	CPPUNIT_ASSERT_EQUAL(m_root + "/a.txt", r.strFile);
	CPPUNIT_ASSERT_EQUAL(static_cast<uint64_t>(5), r.ullFileSize);
	CPPUNIT_ASSERT_EQUAL(std::string("text/plain"), header(r, "Content-Type"));
	CPPUNIT_ASSERT(!header(r, "Last-Modified").empty());

	r = run("HEAD", "/a.txt");
	CPPUNIT_ASSERT_EQUAL(200U, r.ulCode);
	CPPUNIT_ASSERT_EQUAL(static_cast<uint64_t>(5), r.ullFileSize);

	r = run("GET", "/");
	CPPUNIT_ASSERT_EQUAL(200U, r.ulCode);
	CPPUNIT_ASSERT(r.strFile.empty());
	CPPUNIT_ASSERT(r.strBody.empty());

	CPPUNIT_ASSERT_EQUAL(404U, run("GET", "/missing.txt").ulCode);
	/* only GET counts as a download */
	m_server->notifier().flush();
	auto ev = m_delegate->take();
	CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(1), ev.size());
	CPPUNIT_ASSERT_EQUAL("download " + m_root + "/a.txt", ev[0]);
}

void handler_test::test_put()
{
	auto r = run("PUT", "/new.txt", {}, "first");
	CPPUNIT_ASSERT_EQUAL(201U, r.ulCode);
	CPPUNIT_ASSERT_EQUAL(std::string("first"), read_file("/new.txt"));

	r = run("PUT", "/new.txt", {}, "second");
	CPPUNIT_ASSERT_EQUAL(204U, r.ulCode);
	CPPUNIT_ASSERT_EQUAL(std::string("second"), read_file("/new.txt"));

	r = run("PUT", "/empty.txt");
	CPPUNIT_ASSERT_EQUAL(201U, r.ulCode);
	CPPUNIT_ASSERT(exists("/empty.txt"));

	CPPUNIT_ASSERT_EQUAL(409U, run("PUT", "/nodir/x.txt", {}, "x").ulCode);
	CPPUNIT_ASSERT_EQUAL(0, mkdir((m_root + "/dir").c_str(), 0755));
	CPPUNIT_ASSERT_EQUAL(405U, run("PUT", "/dir", {}, "x").ulCode);
	CPPUNIT_ASSERT_EQUAL(405U, run("PUT", "/other/", {}, "x").ulCode);
	CPPUNIT_ASSERT_EQUAL(403U, run("PUT", "/evil.exe", {}, "x").ulCode);
	CPPUNIT_ASSERT(!exists("/evil.exe"));
}

void handler_test::test_put_spooled()
{
	/* the HTTP layer hands over large bodies as a temp file */
	std::string tmp;
	CPPUNIT_ASSERT_EQUAL(hrSuccess, HrCreateTempFile(m_base, "spooled body", &tmp));
	DavRequest req;
	DavResponse resp;
	req.strMethod = "PUT";
	req.strPath = "/big.txt";
	req.strTempFile = tmp;
	CPPUNIT_ASSERT_EQUAL(hrSuccess, WebDav(*m_server, req, &resp).HrHandleCommand());
	CPPUNIT_ASSERT_EQUAL(201U, resp.ulCode);
	CPPUNIT_ASSERT_EQUAL(std::string("spooled body"), read_file("/big.txt"));
	CPPUNIT_ASSERT(!DavExists(tmp));

	/* a failed upload does not leave the temp file behind */
	CPPUNIT_ASSERT_EQUAL(hrSuccess, HrCreateTempFile(m_base, "x", &tmp));
	req.strPath = "/nodir/big.txt";
	req.strTempFile = tmp;
	resp = DavResponse();
	CPPUNIT_ASSERT_EQUAL(FDERR_CONFLICT, WebDav(*m_server, req, &resp).HrHandleCommand());
	CPPUNIT_ASSERT_EQUAL(409U, resp.ulCode);
	CPPUNIT_ASSERT(!DavExists(tmp));
}

void handler_test::test_mkcol()
{
	bool coll = false;
	CPPUNIT_ASSERT_EQUAL(201U, run("MKCOL", "/sub").ulCode);
	CPPUNIT_ASSERT(exists("/sub", &coll) && coll);
	CPPUNIT_ASSERT_EQUAL(405U, run("MKCOL", "/sub").ulCode);
	CPPUNIT_ASSERT_EQUAL(201U, run("MKCOL", "/sub/deeper/").ulCode);
	CPPUNIT_ASSERT_EQUAL(409U, run("MKCOL", "/a/b").ulCode);
	CPPUNIT_ASSERT_EQUAL(415U, run("MKCOL", "/withbody", {}, "<x/>").ulCode);
	CPPUNIT_ASSERT(!exists("/withbody"));
	/* collections are not subject to the extension list */
	CPPUNIT_ASSERT_EQUAL(201U, run("MKCOL", "/folder.exe").ulCode);
	CPPUNIT_ASSERT_EQUAL(403U, run("MKCOL", "/.hidden").ulCode);
}

void handler_test::test_delete()
{
	put_file("/a.txt", "a");
	CPPUNIT_ASSERT_EQUAL(0, mkdir((m_root + "/tree").c_str(), 0755));
	put_file("/tree/b.txt", "b");

	CPPUNIT_ASSERT_EQUAL(204U, run("DELETE", "/a.txt").ulCode);
	CPPUNIT_ASSERT(!exists("/a.txt"));
	CPPUNIT_ASSERT_EQUAL(404U, run("DELETE", "/a.txt").ulCode);
	CPPUNIT_ASSERT_EQUAL(400U, run("DELETE", "/tree", {{"Depth", "0"}}).ulCode);
	CPPUNIT_ASSERT(exists("/tree/b.txt"));
	CPPUNIT_ASSERT_EQUAL(204U, run("DELETE", "/tree", {{"Depth", "infinity"}}).ulCode);
	CPPUNIT_ASSERT(!exists("/tree"));
	CPPUNIT_ASSERT_EQUAL(403U, run("DELETE", "/").ulCode);
	CPPUNIT_ASSERT(exists("/"));
}

void handler_test::test_copy()
{
	put_file("/a.txt", "aaa");
	CPPUNIT_ASSERT_EQUAL(0, mkdir((m_root + "/dir").c_str(), 0755));
	put_file("/dir/in.txt", "in");

	auto r = run("COPY", "/a.txt", {{"Destination", "/b.txt"}});
	CPPUNIT_ASSERT_EQUAL(201U, r.ulCode);
	CPPUNIT_ASSERT_EQUAL(std::string("aaa"), read_file("/b.txt"));
	CPPUNIT_ASSERT_EQUAL(std::string("aaa"), read_file("/a.txt"));

	put_file("/a.txt", "new");
	r = run("COPY", "/a.txt", {{"Destination", "/b.txt"}, {"Overwrite", "F"}});
	CPPUNIT_ASSERT_EQUAL(412U, r.ulCode);
	CPPUNIT_ASSERT_EQUAL(std::string("aaa"), read_file("/b.txt"));
	CPPUNIT_ASSERT_EQUAL(std::string("new"), read_file("/a.txt"));
	r = run("COPY", "/a.txt", {{"Destination", "http://localhost:8080/b.txt"}, {"Host", "localhost:8080"}, {"Overwrite", "T"}});
	CPPUNIT_ASSERT_EQUAL(204U, r.ulCode);
	CPPUNIT_ASSERT_EQUAL(std::string("new"), read_file("/b.txt"));

	r = run("COPY", "/dir", {{"Destination", "/dir%20copy"}});
	CPPUNIT_ASSERT_EQUAL(201U, r.ulCode);
	CPPUNIT_ASSERT_EQUAL(std::string("in"), read_file("/dir copy/in.txt"));
	bool coll = false;
	r = run("COPY", "/dir", {{"Destination", "/shallow"}, {"Depth", "0"}});
	CPPUNIT_ASSERT_EQUAL(201U, r.ulCode);
	CPPUNIT_ASSERT(exists("/shallow", &coll) && coll);
	CPPUNIT_ASSERT(!exists("/shallow/in.txt"));

	CPPUNIT_ASSERT_EQUAL(400U, run("COPY", "/dir", {{"Destination", "/d1"}, {"Depth", "1"}}).ulCode);
	CPPUNIT_ASSERT_EQUAL(400U, run("COPY", "/a.txt").ulCode);
	CPPUNIT_ASSERT_EQUAL(400U, run("COPY", "/a.txt", {{"Destination", "/c.txt"}, {"Overwrite", "maybe"}}).ulCode);
	CPPUNIT_ASSERT_EQUAL(400U, run("COPY", "/a.txt", {{"Destination", "http://elsewhere/c.txt"}, {"Host", "localhost"}}).ulCode);
	CPPUNIT_ASSERT_EQUAL(404U, run("COPY", "/none.txt", {{"Destination", "/c.txt"}}).ulCode);
	CPPUNIT_ASSERT_EQUAL(409U, run("COPY", "/a.txt", {{"Destination", "/nodir/c.txt"}}).ulCode);
	CPPUNIT_ASSERT_EQUAL(403U, run("COPY", "/a.txt", {{"Destination", "/a.txt"}}).ulCode);
	CPPUNIT_ASSERT_EQUAL(403U, run("COPY", "/dir", {{"Destination", "/dir/inner"}}).ulCode);
	CPPUNIT_ASSERT_EQUAL(403U, run("COPY", "/a.txt", {{"Destination", "/c.exe"}}).ulCode);
	CPPUNIT_ASSERT(!exists("/c.exe"));
}

void handler_test::test_move()
{
	put_file("/a.txt", "aaa");
	put_file("/b.txt", "bbb");
	CPPUNIT_ASSERT_EQUAL(0, mkdir((m_root + "/dir").c_str(), 0755));

	CPPUNIT_ASSERT_EQUAL(400U, run("MOVE", "/a.txt", {{"Destination", "/c.txt"}, {"Depth", "0"}}).ulCode);
	CPPUNIT_ASSERT_EQUAL(201U, run("MOVE", "/a.txt", {{"Destination", "/dir/a.txt"}}).ulCode);
	CPPUNIT_ASSERT(!exists("/a.txt"));
	CPPUNIT_ASSERT_EQUAL(std::string("aaa"), read_file("/dir/a.txt"));

	CPPUNIT_ASSERT_EQUAL(412U, run("MOVE", "/b.txt", {{"Destination", "/dir/a.txt"}, {"Overwrite", "F"}}).ulCode);
	CPPUNIT_ASSERT_EQUAL(std::string("bbb"), read_file("/b.txt"));
	CPPUNIT_ASSERT_EQUAL(std::string("aaa"), read_file("/dir/a.txt"));
	CPPUNIT_ASSERT_EQUAL(204U, run("MOVE", "/b.txt", {{"Destination", "/dir/a.txt"}}).ulCode);
	CPPUNIT_ASSERT_EQUAL(std::string("bbb"), read_file("/dir/a.txt"));

	CPPUNIT_ASSERT_EQUAL(201U, run("MOVE", "/dir", {{"Destination", "/renamed"}}).ulCode);
	CPPUNIT_ASSERT_EQUAL(std::string("bbb"), read_file("/renamed/a.txt"));
	CPPUNIT_ASSERT_EQUAL(403U, run("MOVE", "/renamed", {{"Destination", "/renamed/sub"}}).ulCode);
	CPPUNIT_ASSERT_EQUAL(403U, run("MOVE", "/", {{"Destination", "/x"}}).ulCode);
}

void handler_test::test_move_round_trip()
{
	CPPUNIT_ASSERT_EQUAL(0, mkdir((m_root + "/A").c_str(), 0750));
	CPPUNIT_ASSERT_EQUAL(0, mkdir((m_root + "/A/sub").c_str(), 0755));
	put_file("/A/one.txt", "one");
	put_file("/A/sub/two.txt", "two");
	put_file("/f.txt", "file");

	CPPUNIT_ASSERT_EQUAL(201U, run("MOVE", "/A", {{"Destination", "/B"}}).ulCode);
	CPPUNIT_ASSERT(!exists("/A"));
	CPPUNIT_ASSERT_EQUAL(201U, run("MOVE", "/B", {{"Destination", "/A"}}).ulCode);
	CPPUNIT_ASSERT(!exists("/B"));
	CPPUNIT_ASSERT_EQUAL(std::string("one"), read_file("/A/one.txt"));
	CPPUNIT_ASSERT_EQUAL(std::string("two"), read_file("/A/sub/two.txt"));
	struct stat sb;
	CPPUNIT_ASSERT_EQUAL(0, stat((m_root + "/A").c_str(), &sb));
	CPPUNIT_ASSERT_EQUAL(static_cast<mode_t>(0750), sb.st_mode & 07777);
	std::vector<std::string> names;
	CPPUNIT_ASSERT_EQUAL(hrSuccess, HrListDirectory(m_root + "/A", &names));
	CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(2), names.size());

	CPPUNIT_ASSERT_EQUAL(201U, run("MOVE", "/f.txt", {{"Destination", "/g.txt"}}).ulCode);
	CPPUNIT_ASSERT_EQUAL(201U, run("MOVE", "/g.txt", {{"Destination", "/f.txt"}}).ulCode);
	CPPUNIT_ASSERT_EQUAL(std::string("file"), read_file("/f.txt"));
	CPPUNIT_ASSERT(!exists("/g.txt"));
	CPPUNIT_ASSERT(!leftovers());
}

void handler_test::test_rename_cross_device()
{
	/* /proc is always another filesystem, and reading this file fails */
	put_file("/dst.txt", "original");
	CPPUNIT_ASSERT(HrRenameItem("/proc/self/mem", m_root + "/dst.txt") != hrSuccess);
	CPPUNIT_ASSERT_EQUAL(std::string("original"), read_file("/dst.txt"));
	CPPUNIT_ASSERT(!leftovers());

	CPPUNIT_ASSERT(HrCopyOver("/proc/self/mem", m_root + "/dst.txt") != hrSuccess);
	CPPUNIT_ASSERT_EQUAL(std::string("original"), read_file("/dst.txt"));
	CPPUNIT_ASSERT(!leftovers());

	/* a successful replacement keeps the source's mode */
	put_file("/src.txt", "replacement");
	CPPUNIT_ASSERT_EQUAL(0, chmod((m_root + "/src.txt").c_str(), 0600));
	CPPUNIT_ASSERT_EQUAL(hrSuccess, HrCopyOver(m_root + "/src.txt", m_root + "/dst.txt"));
	CPPUNIT_ASSERT_EQUAL(std::string("replacement"), read_file("/dst.txt"));
	struct stat sb;
	CPPUNIT_ASSERT_EQUAL(0, stat((m_root + "/dst.txt").c_str(), &sb));
	CPPUNIT_ASSERT_EQUAL(static_cast<mode_t>(0600), sb.st_mode & 07777);
	CPPUNIT_ASSERT(!leftovers());
}

void handler_test::test_propfind()
{
	put_file("/a.txt", "aaa");
	CPPUNIT_ASSERT_EQUAL(0, mkdir((m_root + "/dir").c_str(), 0755));

	auto r = run("PROPFIND", "/", {{"Depth", "1"}});
	CPPUNIT_ASSERT_EQUAL(207U, r.ulCode);
	CPPUNIT_ASSERT_EQUAL(std::string(DAV_XML_CONTENT_TYPE), header(r, "Content-Type"));
	DavXmlElement ms;
	CPPUNIT_ASSERT_EQUAL(hrSuccess, HrParseDavXml(r.strBody, &ms));
	CPPUNIT_ASSERT(ms.is(WEBDAVNS, "multistatus"));
	CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(3), ms.lstChildren.size());

	r = run("PROPFIND", "/a.txt", {{"Depth", "0"}},
		"<?xml version=\"1.0\"?><D:propfind xmlns:D=\"DAV:\"><D:prop><D:getcontentlength/></D:prop></D:propfind>");
	CPPUNIT_ASSERT_EQUAL(207U, r.ulCode);
	CPPUNIT_ASSERT(r.strBody.find(">3</D:getcontentlength>") != std::string::npos);

	CPPUNIT_ASSERT_EQUAL(403U, run("PROPFIND", "/").ulCode);
	CPPUNIT_ASSERT_EQUAL(403U, run("PROPFIND", "/", {{"Depth", "infinity"}}).ulCode);
	CPPUNIT_ASSERT_EQUAL(400U, run("PROPFIND", "/", {{"Depth", "one"}}).ulCode);
	CPPUNIT_ASSERT_EQUAL(400U, run("PROPFIND", "/", {{"Depth", "0"}}, "<D:propfind").ulCode);
	CPPUNIT_ASSERT_EQUAL(404U, run("PROPFIND", "/none.txt", {{"Depth", "0"}}).ulCode);
}

void handler_test::test_lock()
{
	static const char lockinfo[] =
		"<?xml version=\"1.0\" encoding=\"utf-8\"?>"
		"<D:lockinfo xmlns:D=\"DAV:\"><D:lockscope><D:exclusive/></D:lockscope>"
		"<D:locktype><D:write/></D:locktype>"
		"<D:owner><D:href>mailto:someone@example.com</D:href></D:owner></D:lockinfo>";

	auto r = run("LOCK", "/locked.txt", {{"Timeout", "Second-60"}}, lockinfo);
	CPPUNIT_ASSERT_EQUAL(201U, r.ulCode);
	CPPUNIT_ASSERT(exists("/locked.txt"));
	auto token = header(r, "Lock-Token");
	CPPUNIT_ASSERT(token.size() > 2 && token.front() == '<' && token.back() == '>');
	token = token.substr(1, token.size() - 2);
	CPPUNIT_ASSERT(r.strBody.find(token) != std::string::npos);
	CPPUNIT_ASSERT(r.strBody.find("Second-60") != std::string::npos);
	CPPUNIT_ASSERT(r.strBody.find("mailto:someone@example.com") != std::string::npos);
	CPPUNIT_ASSERT(m_server->locks().IsLocked(m_root + "/locked.txt"));
	CPPUNIT_ASSERT(!leftovers());
	m_server->notifier().flush();
	auto ev = m_delegate->take();
	CPPUNIT_ASSERT_EQUAL(static_cast<size_t>(1), ev.size());
	CPPUNIT_ASSERT_EQUAL("upload " + m_root + "/locked.txt", ev[0]);

	/* refresh with the token in If */
	r = run("LOCK", "/locked.txt", {{"If", "(<" + token + ">)"}, {"Timeout", "Second-120"}});
	CPPUNIT_ASSERT_EQUAL(200U, r.ulCode);
	CPPUNIT_ASSERT_EQUAL("<" + token + ">", header(r, "Lock-Token"));
	CPPUNIT_ASSERT(r.strBody.find("Second-120") != std::string::npos);

	CPPUNIT_ASSERT_EQUAL(400U, run("UNLOCK", "/locked.txt").ulCode);
	CPPUNIT_ASSERT_EQUAL(409U, run("UNLOCK", "/locked.txt", {{"Lock-Token", "<urn:uuid:nope>"}}).ulCode);
	CPPUNIT_ASSERT_EQUAL(204U, run("UNLOCK", "/locked.txt", {{"Lock-Token", "<" + token + ">"}}).ulCode);
	CPPUNIT_ASSERT(!m_server->locks().IsLocked(m_root + "/locked.txt"));

	CPPUNIT_ASSERT_EQUAL(409U, run("LOCK", "/nodir/x.txt").ulCode);
	CPPUNIT_ASSERT_EQUAL(400U, run("LOCK", "/x.txt", {}, "<D:propfind xmlns:D=\"DAV:\"/>").ulCode);
	CPPUNIT_ASSERT_EQUAL(403U, run("LOCK", "/x.exe").ulCode);
}

void handler_test::test_veto()
{
	put_file("/a.txt", "a");
	m_delegate->veto = true;
	CPPUNIT_ASSERT_EQUAL(403U, run("DELETE", "/a.txt").ulCode);
	CPPUNIT_ASSERT_EQUAL(403U, run("PUT", "/a.txt", {}, "changed").ulCode);
	CPPUNIT_ASSERT_EQUAL(403U, run("MKCOL", "/d").ulCode);
	put_file("/b.txt", "b");
	CPPUNIT_ASSERT_EQUAL(403U, run("COPY", "/a.txt", {{"Destination", "/b.txt"}}).ulCode);
	CPPUNIT_ASSERT_EQUAL(403U, run("MOVE", "/a.txt", {{"Destination", "/b.txt"}}).ulCode);
	CPPUNIT_ASSERT_EQUAL(403U, run("LOCK", "/new.txt").ulCode);
	CPPUNIT_ASSERT(!exists("/new.txt"));
	CPPUNIT_ASSERT(!m_server->locks().IsLocked(m_root + "/new.txt"));
	CPPUNIT_ASSERT(!leftovers());
	/* nothing changed */
	CPPUNIT_ASSERT_EQUAL(std::string("a"), read_file("/a.txt"));
	CPPUNIT_ASSERT_EQUAL(std::string("b"), read_file("/b.txt"));
	CPPUNIT_ASSERT(!exists("/d"));
	m_server->notifier().flush();
	CPPUNIT_ASSERT(m_delegate->take().empty());
}

void handler_test::test_notifications()
{
	run("PUT", "/a.txt", {}, "a");
	run("MKCOL", "/d");
	run("COPY", "/a.txt", {{"Destination", "/d/a.txt"}});
	run("MOVE", "/a.txt", {{"Destination", "/b.txt"}});
	run("DELETE", "/b.txt");
	m_server->notifier().flush();

	auto ev = m_delegate->take();
	std::vector<std::string> exp = {
		"upload " + m_root + "/a.txt",
		"mkcol " + m_root + "/d",
		"copy " + m_root + "/a.txt " + m_root + "/d/a.txt",
		"move " + m_root + "/a.txt " + m_root + "/b.txt",
		"delete " + m_root + "/b.txt",
	};
	CPPUNIT_ASSERT_EQUAL(exp.size(), ev.size());
	for (size_t i = 0; i < exp.size(); ++i)
		CPPUNIT_ASSERT_EQUAL(exp[i], ev[i]);
}

void handler_test::test_security()
{
	CPPUNIT_ASSERT_EQUAL(0, mkdir((m_base + "/outside").c_str(), 0755));
	int fd = open((m_base + "/outside/secret.txt").c_str(), O_WRONLY | O_CREAT, 0644);
	CPPUNIT_ASSERT(fd >= 0);
	close(fd);

	CPPUNIT_ASSERT_EQUAL(403U, run("GET", "/../outside/secret.txt").ulCode);
	CPPUNIT_ASSERT_EQUAL(403U, run("PROPFIND", "/../outside", {{"Depth", "1"}}).ulCode);
	put_file("/a.txt", "a");
	CPPUNIT_ASSERT_EQUAL(403U, run("COPY", "/a.txt", {{"Destination", "/../outside/a.txt"}}).ulCode);
	CPPUNIT_ASSERT(!DavExists(m_base + "/outside/a.txt"));
	CPPUNIT_ASSERT_EQUAL(403U, run("DELETE", "/../outside/secret.txt").ulCode);
	CPPUNIT_ASSERT(DavExists(m_base + "/outside/secret.txt"));
}

void handler_test::test_security_hidden_allowed()
{
	m_server.reset(new DavServer(m_root, "", true, m_delegate, 600, 3600));
	CPPUNIT_ASSERT_EQUAL(hrSuccess, m_server->HrInit());
	CPPUNIT_ASSERT_EQUAL(0, mkdir((m_base + "/outside").c_str(), 0755));
	int fd = open((m_base + "/outside/x.txt").c_str(), O_WRONLY | O_CREAT, 0644);
	CPPUNIT_ASSERT(fd >= 0);
	CPPUNIT_ASSERT_EQUAL(static_cast<ssize_t>(6), write(fd, "secret", 6));
	close(fd);
	CPPUNIT_ASSERT_EQUAL(0, symlink((m_base + "/outside").c_str(), (m_root + "/escape").c_str()));

	CPPUNIT_ASSERT_EQUAL(201U, run("PUT", "/.hidden", {}, "dot").ulCode);
	CPPUNIT_ASSERT_EQUAL(std::string("dot"), read_file("/.hidden"));
	CPPUNIT_ASSERT_EQUAL(200U, run("GET", "/.hidden").ulCode);

	CPPUNIT_ASSERT_EQUAL(403U, run("GET", "/escape/x.txt").ulCode);
	CPPUNIT_ASSERT_EQUAL(403U, run("GET", "/nope/../escape/x.txt").ulCode);
	CPPUNIT_ASSERT_EQUAL(403U, run("PUT", "/nope/../escape/x.txt", {}, "owned").ulCode);
	CPPUNIT_ASSERT_EQUAL(403U, run("DELETE", "/nope/../escape/x.txt").ulCode);
	CPPUNIT_ASSERT_EQUAL(403U, run("MOVE", "/.hidden", {{"Destination", "/nope/../escape/y.txt"}}).ulCode);
	std::unique_ptr<FILE, file_deleter> fp(fopen((m_base + "/outside/x.txt").c_str(), "r"));
	CPPUNIT_ASSERT(fp != nullptr);
	std::string data;
	CPPUNIT_ASSERT_EQUAL(hrSuccess, HrMapFileToString(fp.get(), &data));
	CPPUNIT_ASSERT_EQUAL(std::string("secret"), data);
	CPPUNIT_ASSERT(!DavExists(m_base + "/outside/y.txt"));
	CPPUNIT_ASSERT(exists("/.hidden"));
}

void handler_test::test_error_body()
{
	put_file("/a.txt", "a");
	put_file("/b.txt", "b");

	auto r = run("COPY", "/a.txt", {{"Destination", "/b.txt"}, {"Overwrite", "F"}});
	CPPUNIT_ASSERT_EQUAL(412U, r.ulCode);
	CPPUNIT_ASSERT_EQUAL(std::string(DAV_XML_CONTENT_TYPE), header(r, "Content-Type"));
	CPPUNIT_ASSERT(dav_error(r, nullptr));

	r = run("MKCOL", "/nodir/sub");
	CPPUNIT_ASSERT_EQUAL(409U, r.ulCode);
	CPPUNIT_ASSERT(dav_error(r, nullptr));

	r = run("PROPFIND", "/", {{"Depth", "infinity"}});
	CPPUNIT_ASSERT_EQUAL(403U, r.ulCode);
	CPPUNIT_ASSERT(dav_error(r, "propfind-finite-depth"));

	r = run("LOCK", "/a.txt");
	CPPUNIT_ASSERT_EQUAL(200U, r.ulCode);
	r = run("UNLOCK", "/a.txt", {{"Lock-Token", "<urn:uuid:nope>"}});
	CPPUNIT_ASSERT_EQUAL(409U, r.ulCode);
	CPPUNIT_ASSERT(dav_error(r, "lock-token-matches-request-uri"));

	/* no paths in error bodies, and plain errors stay empty */
	CPPUNIT_ASSERT(r.strBody.find(m_root) == std::string::npos);
	r = run("GET", "/missing.txt");
	CPPUNIT_ASSERT_EQUAL(404U, r.ulCode);
	CPPUNIT_ASSERT(r.strBody.empty());
}

void handler_test::test_unknown_method()
{
	auto r = run("PROPPATCH", "/");
	CPPUNIT_ASSERT_EQUAL(501U, r.ulCode);
}

int main(int argc, char **argv)
{
	using namespace CppUnit;
	xmlInitParser();
	auto suite = TestFactoryRegistry::getRegistry().makeTest();
	TextUi::TestRunner runner;
	runner.addTest(suite);
	runner.setOutputter(new CompilerOutputter(&runner.result(), std::cerr));
	bool ok = runner.run();
	xmlCleanupParser();
	return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
