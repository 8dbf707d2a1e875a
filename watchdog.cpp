#include <atomic>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstring>

#include <signal.h>
#include <unistd.h>
#include <sys/time.h>

#include "double_buffer.hpp"
#include "sigdump.hpp"
#include "trace_writer.hpp"


typedef struct sigaction sigaction_t;

struct t_watchdog_config {
	int fd;
	bool all_threads;
	bool repeat;
	bool exit;

	// the custom header, or "Timeout (<timeout>)!"
	char header[sigdump::MAX_HEADER_LENGTH];
};


static sigdump::double_buffer<t_watchdog_config> watchdog_config;
static std::atomic<bool> watchdog_armed{false};

static bool alarm_handler_installed = false;
static sigaction_t previous_alarm_action;


// same layout as a Python timedelta: "[D day[s], ]H:MM:SS[.ffffff]"
static void format_timeout(char* buf, size_t size, std::chrono::microseconds timeout) {
	const long long us = timeout.count();
	const long long total_secs = us / 1000000;
	const long long micros = us % 1000000;

	const long long days = total_secs / 86400;
	const long long hours = (total_secs % 86400) / 3600;
	const long long minutes = (total_secs % 3600) / 60;
	const long long seconds = total_secs % 60;

	int n = 0;

	if (days != 0)
		n = snprintf(buf, size, "%lld day%s, ", days, (days == 1)? "": "s");

	if (n < 0 || size_t(n) >= size)
		return;

	if (micros != 0) {
		snprintf(buf + n, size - n, "%lld:%02lld:%02lld.%06lld", hours, minutes, seconds, micros);
	} else {
		snprintf(buf + n, size - n, "%lld:%02lld:%02lld", hours, minutes, seconds);
	}
}

static bool set_timer(std::chrono::microseconds value, std::chrono::microseconds interval) {
	struct itimerval timer;

	timer.it_value.tv_sec = value.count() / 1000000;
	timer.it_value.tv_usec = value.count() % 1000000;
	timer.it_interval.tv_sec = interval.count() / 1000000;
	timer.it_interval.tv_usec = interval.count() % 1000000;

	return (setitimer(ITIMER_REAL, &timer, nullptr) == 0);
}

static void stop_timer() {
	set_timer(std::chrono::microseconds(0), std::chrono::microseconds(0));
}


// dumps the traceback of the thread that received the alarm, or of all
// threads; a repeating watchdog is re-armed by the kernel (it_interval)
static void handle_alarm(int signal, siginfo_t* siginfo, void* pctx) {
	(void) signal;
	(void) siginfo;
	(void) pctx;

	// cancelled while the signal was in flight
	if (!watchdog_armed.load())
		return;

	const t_watchdog_config* config = watchdog_config.load();

	if (config == nullptr)
		return;

	const int saved_errno = errno;

	if (!config->repeat)
		watchdog_armed.store(false);

	trace_writer::write_header_line(config->fd, config->header);
	trace_writer::dump_traceback(config->fd, config->all_threads);

	if (config->exit)
		_exit(1);

	errno = saved_errno;
}

static sigdump_error install_alarm_handler() {
	if (alarm_handler_installed)
		return SIGDUMP_ERR_NONE;

	sigaction_t sa;
	memset(&sa, 0, sizeof(sa));
	sigemptyset(&sa.sa_mask);

	// interrupted system calls of the watched code resume after a dump
	sa.sa_flags = SA_SIGINFO | SA_RESTART | SA_ONSTACK;
	sa.sa_sigaction = handle_alarm;

	if (sigaction(sigdump::WATCHDOG_SIGNAL, &sa, &previous_alarm_action) != 0) {
		LOG_RAW_LINE("[%s] unable to set SIGALRM handler: %s", __func__, strerror(errno));
		return SIGDUMP_ERR_SIGACTION;
	}

	alarm_handler_installed = true;
	return SIGDUMP_ERR_NONE;
}


namespace sigdump {
	namespace detail {
		void release_watchdog() {
			cancel_dump_traceback_later();

			if (!alarm_handler_installed)
				return;

			sigaction(WATCHDOG_SIGNAL, &previous_alarm_action, nullptr);
			alarm_handler_installed = false;
		}
	}


	sigdump_error dump_traceback_later(
		std::chrono::microseconds timeout,
		bool repeat,
		int fd,
		bool all_threads,
		const char* header,
		bool exit
	) {
		if (timeout.count() <= 0)
			return SIGDUMP_ERR_INVALID_TIMEOUT;
		if (std::chrono::duration_cast<std::chrono::seconds>(timeout).count() > INT_MAX)
			return SIGDUMP_ERR_INVALID_TIMEOUT;

		// the replaced watchdog must not fire anymore
		watchdog_armed.store(false);
		stop_timer();

		t_watchdog_config& config = watchdog_config.back();

		config.fd = fd;
		config.all_threads = all_threads;
		config.repeat = repeat;
		config.exit = exit;

		if (header != nullptr) {
			detail::copy_header(config.header, header);
		} else {
			char timeout_str[64];
			format_timeout(timeout_str, sizeof(timeout_str), timeout);
			snprintf(config.header, sizeof(config.header), "Timeout (%s)!", timeout_str);
		}

		watchdog_config.publish();

		const sigdump_error err = install_alarm_handler();

		if (err != SIGDUMP_ERR_NONE) {
			watchdog_config.clear();
			return err;
		}

		watchdog_armed.store(true);

		if (!set_timer(timeout, repeat? timeout: std::chrono::microseconds(0))) {
			LOG_RAW_LINE("[%s] setitimer failed: %s", __func__, strerror(errno));

			watchdog_armed.store(false);
			watchdog_config.clear();
			return SIGDUMP_ERR_TIMER;
		}

		return SIGDUMP_ERR_NONE;
	}

	void cancel_dump_traceback_later() {
		// flag first: an alarm already in flight sees it and does nothing
		watchdog_armed.store(false);
		stop_timer();
		watchdog_config.clear();
	}
}
