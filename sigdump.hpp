#ifndef SIGDUMP_HDR
#define SIGDUMP_HDR

#include <signal.h>
#include <unistd.h> // STDERR_FILENO

#include <chrono>

#include "frame_source.hpp"
#include "log.hpp"
#include "threading.hpp"

enum sigdump_error {
	SIGDUMP_ERR_NONE,
	SIGDUMP_ERR_INVALID_SIGNAL,
	SIGDUMP_ERR_FATAL_SIGNAL,
	SIGDUMP_ERR_RESERVED_SIGNAL,
	SIGDUMP_ERR_INVALID_TIMEOUT,
	SIGDUMP_ERR_SIGACTION,
	SIGDUMP_ERR_TIMER
};

namespace sigdump {
	static constexpr int MAX_HEADER_LENGTH = 1024;

	// owned by dump_traceback_later, never accepted by register_signal
	static constexpr int WATCHDOG_SIGNAL = SIGALRM;

	const char* error_to_string(sigdump_error error);


	// fatal signals: SIGSEGV, SIGABRT, SIGFPE, SIGBUS, SIGILL
	//
	// on delivery writes "Fatal Python error: <reason>[: <header>]", a blank
	// line and the traceback(s) to <fd>, then re-raises the signal with its
	// default disposition; calling enable again only replaces the settings
	sigdump_error enable(int fd = STDERR_FILENO, bool all_threads = true, const char* header = nullptr, bool c_stack = false);
	// returns true if the handlers were installed
	bool disable();
	bool is_enabled();

	// enables if SIGDUMP_FAULTHANDLER is set (and not "0"); see SIGDUMP_ALL_THREADS
	// and SIGDUMP_C_STACK for the options
	sigdump_error enable_from_environment();

	// reports an unrecoverable condition detected by the host and aborts
	[[noreturn]] void fatal_error(const char* message);


	// dump on demand, from normal or signal context
	void dump_traceback(int fd = STDERR_FILENO, bool all_threads = false);
	void dump_c_stack(int fd = STDERR_FILENO);


	// watchdog: dumps after <timeout> unless cancelled first, every <timeout>
	// if <repeat>; re-arming replaces the previous watchdog
	sigdump_error dump_traceback_later(
		std::chrono::microseconds timeout,
		bool repeat = false,
		int fd = STDERR_FILENO,
		bool all_threads = false,
		const char* header = nullptr,
		bool exit = false
	);
	void cancel_dump_traceback_later();


	// dumps when <signum> is delivered, then returns to the interrupted code;
	// with <chain>, the handler that was installed before is called as well
	sigdump_error register_signal(int signum, int fd = STDERR_FILENO, bool all_threads = false, bool chain = false, const char* header = nullptr);
	// returns false if nothing was registered for <signum>
	bool unregister_signal(int signum);


	// null restores the built-in shadow stack
	void set_frame_source(const frame_source::source* src);

	// cancels the watchdog, unregisters all user signals and disables the
	// fatal handlers
	void shutdown();


	// internal, shared between the engines
	namespace detail {
		// copies <src> into <dst>, or an empty string for null
		void copy_header(char* dst, const char* src);

		// user registration rejects the signals owned by enable()
		bool is_fatal_signal(int signum);

		void release_fatal_altstack();
		// cancels the watchdog and gives SIGALRM back to its previous handler
		void release_watchdog();
		void unregister_all_signals();
	}
}

#endif
