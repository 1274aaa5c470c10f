// Copyright (c) rAthena Dev Teams - Licensed under GNU GPL
// For more information, see LICENCE in the main folder

#ifndef TPSDK_SHOWMSG_HPP
#define TPSDK_SHOWMSG_HPP

#include <cstdarg>

// for help with the console colors look here:
// http://www.edoceo.com/liberum/?doc=printf-with-color
// some code explanation (used here):
// \033[2J : clear screen and go up/left (0, 0 position)
// \033[K  : clear line from actual position to end of the line
// \033[0m : reset color parameter
// \033[1m : use bold for font

#define CL_RESET	"\033[0m"
#define CL_CLS		"\033[2J"
#define CL_CLL		"\033[K"

// font settings
#define CL_BOLD		"\033[1m"
#define CL_NORM		CL_RESET
#define CL_NORMAL	CL_RESET
#define CL_NONE		CL_RESET
// foreground color and bold font (bright color on windows)
#define CL_WHITE	"\033[1;37m"
#define CL_GRAY		"\033[1;30m"
#define CL_RED		"\033[1;31m"
#define CL_GREEN	"\033[1;32m"
#define CL_YELLOW	"\033[1;33m"
#define CL_BLUE		"\033[1;34m"
#define CL_MAGENTA	"\033[1;35m"
#define CL_CYAN		"\033[1;36m"

#define CL_SPACE	"           "	// space aquivalent of the print messages

extern int stdout_with_ansisequence; ///< If the color ansi sequences are to be used
extern int msg_silent; ///< Bitmask of message classes hidden from the console
extern int console_msg_log; ///< Bitmask of message classes copied to console_log_filepath
extern char console_log_filepath[256]; ///< File receiving the console_msg_log classes
extern char timestamp_format[20]; ///< strftime format prefixed to every line, empty for none

/**
 * @brief Message classes
 *
 * msg_silent bits:     1 info, 2 status, 4 notice, 8 warning, 16 error, 32 debug
 * console_msg_log bits: 1 warning, 2 error, 4 debug
 */
enum msg_type {
	MSG_NONE,
	MSG_STATUS,
	MSG_INFORMATION,
	MSG_NOTICE,
	MSG_WARNING,
	MSG_DEBUG,
	MSG_ERROR,
	MSG_FATALERROR
};

int _vShowMessage(enum msg_type flag, const char* format, va_list ap);

/**
 * @brief Replace the output settings while other threads may be logging
 *
 * A null timestamp keeps the current format; a null or empty log_file keeps
 * the current path.
 */
void showmsg_configure(int silent, int file_mask, bool colors, const char* timestamp, const char* log_file);

void ShowMessage(const char* format, ...);
void ShowStatus(const char* format, ...);
void ShowInfo(const char* format, ...);
void ShowNotice(const char* format, ...);
void ShowWarning(const char* format, ...);
void ShowDebug(const char* format, ...);
void ShowError(const char* format, ...);
void ShowFatalError(const char* format, ...);

#endif /* TPSDK_SHOWMSG_HPP */
