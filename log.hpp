#ifndef SIGDUMP_LOG_HDR
#define SIGDUMP_LOG_HDR

#include <cstdio>

// normal-context diagnostics only; never use from inside a signal handler
#define LOG_RAW_LINE(fmt, ...) do {                      \
	fprintf(stderr, fmt, ##__VA_ARGS__);                 \
	fprintf(stderr, "\n"              );                 \
	FILE* log_file_ = sigdump::log::get_log_file();      \
	if (log_file_ != nullptr) {                          \
		fprintf(log_file_, fmt, ##__VA_ARGS__);          \
		fprintf(log_file_, "\n"              );          \
		fflush(log_file_);                               \
	}                                                    \
} while (false)


namespace sigdump {
	namespace log {
		// mirror diagnostics into <file> as well as stderr; null stops mirroring
		void set_log_file(FILE* file);
		FILE* get_log_file();
	}
}

#endif
