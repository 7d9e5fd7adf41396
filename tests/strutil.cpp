/* SPDX-License-Identifier: LGPL-3.0-or-later */
/* Copyright 2016, Kopano and its licensors */
#include <string>
#include <vector>
#include <cstdio>
#include <cstdlib>
#include <filedav/platform.h>
#include <filedav/stringutil.h>

using namespace FD;

static int fails;

static void as(const char *label, const std::string &actual, const std::string &exp)
{
	if (actual == exp)
		return;
	fprintf(stderr, "%s: \"%s\", but expected \"%s\"\n", label, actual.c_str(), exp.c_str());
	++fails;
}

static void test_tokenize()
{
	auto v = tokenize("a,,b", ',');
	as("tokenize", fd_join(v, "|"), "a||b");
	v = tokenize("a,,b,", ',', true);
	as("tokenize filtered", fd_join(v, "|"), "a|b");
	v = tokenize(std::string(" *:8080  127.0.0.1:8443 "), " \t");
	as("tokenize set", fd_join(v, "|"), "*:8080|127.0.0.1:8443");
	as("trim", trim("  x y  "), "x y");
	as("trim set", trim("\t x \r\n", " \t\r\n"), "x");
	as("trim all", trim("   "), "");
	as("trim none", trim("x"), "x");
	if (!tokenize("", '/').empty() || tokenize("/a", '/').size() != 2) {
		fprintf(stderr, "tokenize edge cases\n");
		++fails;
	}
}

static void test_url()
{
	as("encode", urlEncode("a b/c"), "a%20b%2Fc");
	as("encode reserved", urlEncode("#?&%"), "%23%3F%26%25");
	as("encode utf8", urlEncode("\xc3\xa9"), "%C3%A9");
	as("encode plain", urlEncode("file-1_2.txt~"), "file-1_2.txt~");
	as("encode sub-delims", urlEncode("a!b(1)"), "a%21b%281%29");
	as("encode path", urlEncodePath("/my docs/a#1.txt"), "/my%20docs/a%231.txt");
	as("encode path dir", urlEncodePath("/a/"), "/a/");
	as("decode", urlDecode("%41%2c%20b"), "A, b");
	as("decode malformed", urlDecode("%zz%4"), "%zz%4");
	as("decode trailing", urlDecode("abc%"), "abc%");
	as("decode utf8", urlDecode("%C3%A9"), "\xc3\xa9");
}

static void test_misc()
{
	as("lower", strToLower("WebDAV"), "webdav");
	as("stringify", stringify(207), "207");
	if (atoui("600") != 600 || atoui(nullptr) != 0 || atoui("x") != 0) {
		fprintf(stderr, "atoui mismatch\n");
		++fails;
	}
	char buf[4];
	as("strlcpy", fd_strlcpy(buf, "abcdef", sizeof(buf)), "abc");
	if (!fd_starts_with("urn:uuid:1", "urn:uuid:") || fd_starts_with("urn", "urn:uuid:") ||
	    !fd_istarts_with("WebDAVFS/3.0", "webdavfs/") || !fd_ends_with("a.TXT", ".TXT") ||
	    fd_ends_with("TXT", "a.TXT")) {
		fprintf(stderr, "prefix/suffix mismatch\n");
		++fails;
	}
	if (!parseBool("yes") || parseBool("no") || parseBool("No") || parseBool("FALSE") ||
	    parseBool("0") || !parseBool(nullptr)) {
		fprintf(stderr, "parseBool mismatch\n");
		++fails;
	}
	strcasecmp_comparison cmp;
	if (cmp("Depth", "depth") || cmp("depth", "Depth")) {
		fprintf(stderr, "header comparison is not case-insensitive\n");
		++fails;
	}
}

int main(void)
{
	test_tokenize();
	test_url();
	test_misc();
	return fails == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
