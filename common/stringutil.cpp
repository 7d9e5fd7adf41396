/*
 * SPDX-License-Identifier: AGPL-3.0-only
 * Copyright 2005 - 2016 Zarafa and its licensors
 */
#include <filedav/platform.h>
#include <algorithm>
#include <string>
#include <vector>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <strings.h>
#include <filedav/stringutil.h>

namespace FD {

std::string strToLower(std::string s)
{
	for (auto &c : s)
		c = tolower(static_cast<unsigned char>(c));
	return s;
}

bool parseBool(const char *s)
{
	if (s == nullptr)
		return true;
	return strcmp(s, "0") != 0 && strcasecmp(s, "no") != 0 &&
	       strcasecmp(s, "false") != 0;
}

unsigned int atoui(const char *s)
{
	return s == nullptr ? 0 : strtoul(s, nullptr, 10);
}

std::vector<std::string> tokenize(const std::string &input, char sep, bool filter_empty)
{
	std::vector<std::string> out;
	size_t start = 0;

	if (input.empty())
		return out;
	for (;;) {
		auto pos = input.find(sep, start);
		auto field = input.substr(start, pos == std::string::npos ? std::string::npos : pos - start);
		if (!filter_empty || !field.empty())
			out.emplace_back(std::move(field));
		if (pos == std::string::npos || pos + 1 == input.size())
			break;
		start = pos + 1;
	}
	return out;
}

std::vector<std::string> tokenize(const std::string &input, const char *seps)
{
	std::vector<std::string> out;
	auto start = input.find_first_not_of(seps);

	while (start != std::string::npos) {
		auto end = input.find_first_of(seps, start);
		out.emplace_back(input, start, end == std::string::npos ? std::string::npos : end - start);
		start = input.find_first_not_of(seps, end);
	}
	return out;
}

std::string trim(const std::string &input, const std::string &strip)
{
	auto first = input.find_first_not_of(strip);
	if (first == std::string::npos)
		return std::string();
	return input.substr(first, input.find_last_not_of(strip) - first + 1);
}

static int hexval(char c)
{
	if (c >= '0' && c <= '9')
		return c - '0';
	if (c >= 'a' && c <= 'f')
		return c - 'a' + 10;
	if (c >= 'A' && c <= 'F')
		return c - 'A' + 10;
	return -1;
}

/**
 * Percent-encodes a single path component. Only the RFC 3986 unreserved
 * characters are left alone, so "/" is encoded as well; see urlEncodePath
 * for whole paths.
 */
std::string urlEncode(const std::string &input)
{
	static const char digits[] = "0123456789ABCDEF";
	std::string output;

	output.reserve(input.size());
	for (auto ch : input) {
		auto c = static_cast<unsigned char>(ch);
		if (isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
			output += ch;
			continue;
		}
		output += '%';
		output += digits[c >> 4];
		output += digits[c & 0x0F];
	}
	return output;
}

/* Encodes every component of a path and keeps the slashes between them. */
std::string urlEncodePath(const std::string &input)
{
	std::string output;
	size_t start = 0, pos;

	while ((pos = input.find('/', start)) != std::string::npos) {
		output += urlEncode(input.substr(start, pos - start)) + "/";
		start = pos + 1;
	}
	return output + urlEncode(input.substr(start));
}

/**
 * Replaces %XX escapes by the byte they stand for, e.g. "a%2Cb" becomes
 * "a,b". An escape that is cut short or not hex is copied as it is.
 */
std::string urlDecode(const std::string &input)
{
	std::string output;

	output.reserve(input.size());
	for (size_t i = 0; i < input.size(); ++i) {
		int hi, lo;
		if (input[i] == '%' && i + 2 < input.size() &&
		    (hi = hexval(input[i+1])) >= 0 && (lo = hexval(input[i+2])) >= 0) {
			output += static_cast<char>((hi << 4) | lo);
			i += 2;
		} else {
			output += input[i];
		}
	}
	return output;
}

char *fd_strlcpy(char *dest, const char *src, size_t n)
{
	if (n == 0)
		return dest;
	auto len = std::min(strlen(src), n - 1);
	memcpy(dest, src, len);
	dest[len] = '\0';
	return dest;
}

bool fd_starts_with(const std::string &full, const std::string &prefix)
{
	return full.size() >= prefix.size() &&
	       full.compare(0, prefix.size(), prefix) == 0;
}

bool fd_istarts_with(const std::string &full, const std::string &prefix)
{
	return full.size() >= prefix.size() &&
	       strncasecmp(full.c_str(), prefix.c_str(), prefix.size()) == 0;
}

bool fd_ends_with(const std::string &full, const std::string &suffix)
{
	return full.size() >= suffix.size() &&
	       full.compare(full.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} /* namespace */
