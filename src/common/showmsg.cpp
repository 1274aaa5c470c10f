// Copyright (c) rAthena Dev Teams - Licensed under GNU GPL
// For more information, see LICENCE in the main folder

#include "showmsg.hpp"

#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>
#include <string>
#include <vector>

int stdout_with_ansisequence = 0;
int msg_silent = 0;
int console_msg_log = 0;
char console_log_filepath[256] = "./log/tpsdk-msg_log.log";
char timestamp_format[20] = "";

namespace {

std::mutex show_mutex;

const char* msg_prefix(enum msg_type flag) {
	switch (flag) {
		case MSG_STATUS:      return CL_GREEN "[Status]" CL_RESET ":";
		case MSG_INFORMATION: return CL_WHITE "[Info]" CL_RESET ":";
		case MSG_NOTICE:      return CL_WHITE "[Notice]" CL_RESET ":";
		case MSG_WARNING:     return CL_YELLOW "[Warning]" CL_RESET ":";
		case MSG_DEBUG:       return CL_CYAN "[Debug]" CL_RESET ":";
		case MSG_ERROR:       return CL_RED "[Error]" CL_RESET ":";
		case MSG_FATALERROR:  return CL_RED "[Fatal Error]" CL_RESET ":";
		default:              return "";
	}
}

bool is_silenced(enum msg_type flag) {
	switch (flag) {
		case MSG_INFORMATION: return (msg_silent & 1) != 0;
		case MSG_STATUS:      return (msg_silent & 2) != 0;
		case MSG_NOTICE:      return (msg_silent & 4) != 0;
		case MSG_WARNING:     return (msg_silent & 8) != 0;
		case MSG_ERROR:       return (msg_silent & 16) != 0;
		case MSG_DEBUG:       return (msg_silent & 32) != 0;
		default:              return false;
	}
}

bool is_logged(enum msg_type flag) {
	switch (flag) {
		case MSG_WARNING:    return (console_msg_log & 1) != 0;
		case MSG_ERROR:
		case MSG_FATALERROR: return (console_msg_log & 2) != 0;
		case MSG_DEBUG:      return (console_msg_log & 4) != 0;
		default:             return false;
	}
}

// Removes "\033[...m" style sequences
std::string strip_ansi(const std::string& str) {
	std::string out;
	out.reserve(str.size());

	for (size_t i = 0; i < str.size(); ++i) {
		if (str[i] == '\033' && i + 1 < str.size() && str[i + 1] == '[') {
			size_t end = i + 2;
			while (end < str.size() && !((str[end] >= 'A' && str[end] <= 'Z') || (str[end] >= 'a' && str[end] <= 'z')))
				end++;
			i = end;
			continue;
		}
		out += str[i];
	}

	return out;
}

std::string format_timestamp() {
	if (timestamp_format[0] == '\0')
		return "";

	std::time_t now = std::time(nullptr);
	std::tm tm_now;
	localtime_r(&now, &tm_now);

	char buf[64];
	if (std::strftime(buf, sizeof(buf), timestamp_format, &tm_now) == 0)
		return "";
	return buf;
}

} // namespace

int _vShowMessage(enum msg_type flag, const char* format, va_list ap) {
	if (format == nullptr || *format == '\0')
		return 1;

	va_list apcopy;
	va_copy(apcopy, ap);
	int len = std::vsnprintf(nullptr, 0, format, apcopy);
	va_end(apcopy);

	if (len < 0)
		return 1;

	std::vector<char> body(static_cast<size_t>(len) + 1);
	std::vsnprintf(body.data(), body.size(), format, ap);

	// The output settings are only read and written under show_mutex
	std::lock_guard<std::mutex> lock(show_mutex);

	bool silenced = is_silenced(flag);
	bool logged = is_logged(flag);

	if (silenced && !logged)
		return 0;

	std::string line = format_timestamp();
	const char* prefix = msg_prefix(flag);
	if (*prefix != '\0') {
		line += prefix;
		line += ' ';
	}
	line += body.data();

	if (!silenced) {
		FILE* out = (flag == MSG_WARNING || flag == MSG_ERROR || flag == MSG_FATALERROR) ? stderr : stdout;
		const std::string console = stdout_with_ansisequence ? line : strip_ansi(line);
		std::fputs(console.c_str(), out);
		std::fflush(out);
	}

	if (logged) {
		FILE* log = std::fopen(console_log_filepath, "a");
		if (log != nullptr) {
			std::fputs(strip_ansi(line).c_str(), log);
			std::fclose(log);
		}
	}

	return 0;
}

void showmsg_configure(int silent, int file_mask, bool colors, const char* timestamp, const char* log_file) {
	std::lock_guard<std::mutex> lock(show_mutex);

	msg_silent = silent;
	console_msg_log = file_mask;
	stdout_with_ansisequence = colors ? 1 : 0;

	if (timestamp != nullptr) {
		std::strncpy(timestamp_format, timestamp, sizeof(timestamp_format) - 1);
		timestamp_format[sizeof(timestamp_format) - 1] = '\0';
	}
	if (log_file != nullptr && *log_file != '\0') {
		std::strncpy(console_log_filepath, log_file, sizeof(console_log_filepath) - 1);
		console_log_filepath[sizeof(console_log_filepath) - 1] = '\0';
	}
}

void ShowMessage(const char* format, ...) {
	va_list ap;
	va_start(ap, format);
	_vShowMessage(MSG_NONE, format, ap);
	va_end(ap);
}

void ShowStatus(const char* format, ...) {
	va_list ap;
	va_start(ap, format);
	_vShowMessage(MSG_STATUS, format, ap);
	va_end(ap);
}

void ShowInfo(const char* format, ...) {
	va_list ap;
	va_start(ap, format);
	_vShowMessage(MSG_INFORMATION, format, ap);
	va_end(ap);
}

void ShowNotice(const char* format, ...) {
	va_list ap;
	va_start(ap, format);
	_vShowMessage(MSG_NOTICE, format, ap);
	va_end(ap);
}

void ShowWarning(const char* format, ...) {
	va_list ap;
	va_start(ap, format);
	_vShowMessage(MSG_WARNING, format, ap);
	va_end(ap);
}

void ShowDebug(const char* format, ...) {
	va_list ap;
	va_start(ap, format);
	_vShowMessage(MSG_DEBUG, format, ap);
	va_end(ap);
}

void ShowError(const char* format, ...) {
	va_list ap;
	va_start(ap, format);
	_vShowMessage(MSG_ERROR, format, ap);
	va_end(ap);
}

void ShowFatalError(const char* format, ...) {
	va_list ap;
	va_start(ap, format);
	_vShowMessage(MSG_FATALERROR, format, ap);
	va_end(ap);
}
