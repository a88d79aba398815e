#pragma once

#include "types.hxx"

#include <cstdio>
#include <errno.h>
#include <string.h>

#ifndef SRC_FILE_NAME
#define SRC_FILE_NAME __FILE__
#endif

#define TW_COLOR_BLUE		"\x1B[34m"
#define TW_COLOR_DEFAULT	"\x1B[0m"
#define TW_COLOR_RED		"\e[0;91m"
#define TW_COLOR_MAGENTA	"\e[35m"
#define TW_BOLD_START		"\e[1m"
#define TW_BOLD_END			"\033[0m"

#define tw_info(fmt, args...) fprintf(stdout, \
	"%s[%s:%.3d %s]%s " fmt "\n", TW_COLOR_BLUE, SRC_FILE_NAME, \
	__LINE__, __FUNCTION__, TW_COLOR_DEFAULT, ##args)

#define tw_warn(fmt, args...) fprintf(stdout, \
	"%s[%s:%.3d %s] " fmt "%s\n", TW_COLOR_RED, SRC_FILE_NAME, \
	__LINE__, __FUNCTION__, ##args, TW_COLOR_DEFAULT)

#define tw_trace(fmt, args...) fprintf(stdout, \
	"%s%s[%s:%.3d %s]%s%s " fmt "\n", TW_BOLD_START, TW_COLOR_MAGENTA, SRC_FILE_NAME, \
	__LINE__, __FUNCTION__, TW_BOLD_END, TW_COLOR_DEFAULT, ##args)

#define tw_status(status) fprintf (stdout, "%s[%s %.3d] %s%s\n", \
	TW_COLOR_RED, SRC_FILE_NAME, \
	__LINE__, strerror(status), TW_COLOR_DEFAULT)

#define tw_errno() tw_status(errno)

#define tw_printq(msg, s) {\
	tw_info("%s\"%s\"", msg, qPrintable(s));\
}

#define NO_ASSIGN_COPY_MOVE(TypeName)\
	TypeName(const TypeName&) = delete;\
	void operator=(const TypeName&) = delete;\
	TypeName(TypeName&&) = delete;

#define TW_CHECK(flag) {\
	if (!(flag)) {\
		tw_trace();\
		return false;\
	}\
}

#define TW_CHECK_ARG(flag, ret) {\
	if (!(flag)) {\
		tw_trace();\
		return ret;\
	}\
}

#define TW_CHECK_VOID(flag) {\
	if (!(flag)) {\
		tw_trace();\
		return;\
	}\
}
