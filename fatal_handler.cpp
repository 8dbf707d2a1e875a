#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <exception>

#include <signal.h>
#include <unistd.h>

#include "double_buffer.hpp"
#include "native_stack.hpp"
#include "sigdump.hpp"
#include "trace_writer.hpp"


typedef struct sigaction sigaction_t;
typedef void (*sigact_handler_t)(int, siginfo_t*, void*);

struct t_fault_handler {
	int signum;
	const char* name;

	sigaction_t previous;
	bool enabled;
};

struct t_fatal_config {
	int fd;
	bool all_threads;
	bool c_stack;
	char header[sigdump::MAX_HEADER_LENGTH];
};


// define SIGSEGV at the end to make it the default choice if a lookup fails
static t_fault_handler fault_handlers[] = {
#ifdef SIGBUS
	{SIGBUS , "Bus error"               , {}, false},
#endif
#ifdef SIGILL
	{SIGILL , "Illegal instruction"     , {}, false},
#endif
	{SIGFPE , "Floating point exception", {}, false},
	{SIGABRT, "Aborted"                 , {}, false},
	{SIGSEGV, "Segmentation fault"      , {}, false},
};

static constexpr int NUM_FAULT_HANDLERS = sizeof(fault_handlers) / sizeof(fault_handlers[0]);

static sigdump::double_buffer<t_fatal_config> fatal_config;
static std::atomic<bool> fatal_enabled{false};

// alternate stack of the thread that called enable(), for stack overflows
static void* fatal_altstack_mem = nullptr;

static std::terminate_handler previous_terminate = nullptr;

static __thread int THREAD_SIGNAL_REENTRANCE_CTR = 0;


static sigaction_t get_sig_action(sigact_handler_t sigact_handler) {
	sigaction_t sa;

	memset(&sa, 0, sizeof(sa));
	sigemptyset(&sa.sa_mask);

	if (sigact_handler == nullptr) {
		// the default signal handler uses the old sa_handler interface, so just identify this case with sigact_handler == null
		sa.sa_handler = SIG_DFL;
	} else {
		// SA_ONSTACK is a no-op for threads without an alternate stack
		sa.sa_flags |= (SA_SIGINFO | SA_ONSTACK);
		sa.sa_sigaction = sigact_handler;
	}

	return sa;
}

static const t_fault_handler* find_fault_handler(int signum) {
	for (int i = 0; i < NUM_FAULT_HANDLERS; i++) {
		if (fault_handlers[i].signum == signum)
			return &fault_handlers[i];
	}

	return nullptr;
}

// restore the default disposition and send <signal> again; it stays blocked
// until the handler returns, then the process dies the conventional way
static void kill_with_default_action(int signal) {
	const sigaction_t sa = get_sig_action(nullptr);

	sigaction(signal, &sa, nullptr);
	raise(signal);
}


// handler of SIGSEGV, SIGFPE, SIGABRT, SIGBUS and SIGILL
static void handle_fatal_signal(int signal, siginfo_t* siginfo, void* pctx) {
	(void) siginfo;
	(void) pctx;

	const int saved_errno = errno;

	// a fault inside the dump itself; do not try again
	if ((++THREAD_SIGNAL_REENTRANCE_CTR) >= 2) {
		kill_with_default_action(signal);
		errno = saved_errno;
		return;
	}

	const t_fault_handler* handler = find_fault_handler(signal);
	const t_fatal_config* config = fatal_config.load();

	if (handler != nullptr && config != nullptr) {
		const int fd = config->fd;

		trace_writer::write_str(fd, trace_writer::FATAL_ERROR_PREFIX);
		trace_writer::write_str(fd, handler->name);

		if (config->header[0] != 0) {
			trace_writer::write_str(fd, ": ");
			trace_writer::write_ascii(fd, config->header);
		}

		trace_writer::write_str(fd, "\n\n");
		trace_writer::dump_traceback(fd, config->all_threads);

		if (config->c_stack) {
			trace_writer::write_str(fd, "\n");
			native_stack::dump_c_stack(fd);
		}
	}

	kill_with_default_action(signal);
	errno = saved_errno;
}

static void handle_terminate() {
	const t_fatal_config* config = fatal_config.load();
	const int fd = (config != nullptr)? config->fd: STDERR_FILENO;

	trace_writer::write_str(fd, trace_writer::FATAL_ERROR_PREFIX);

	if (std::current_exception() == nullptr) {
		trace_writer::write_str(fd, "terminate called without an active exception\n");
	} else {
		try {
			std::rethrow_exception(std::current_exception());
		} catch (const std::exception& e) {
			trace_writer::write_str(fd, "terminate called after throwing an exception: ");
			trace_writer::write_ascii(fd, e.what());
			trace_writer::write_str(fd, "\n");
		} catch (...) {
			trace_writer::write_str(fd, "terminate called after throwing a non-standard exception\n");
		}
	}

	// the SIGABRT handler writes the traceback
	abort();
}


namespace sigdump {
	const char* error_to_string(sigdump_error error) {
		switch (error) {
			case SIGDUMP_ERR_NONE           : { return "no error"; } break;
			case SIGDUMP_ERR_INVALID_SIGNAL : { return "invalid signal number"; } break;
			case SIGDUMP_ERR_FATAL_SIGNAL   : { return "signal is handled by enable()"; } break;
			case SIGDUMP_ERR_RESERVED_SIGNAL: { return "signal is used by dump_traceback_later()"; } break;
			case SIGDUMP_ERR_INVALID_TIMEOUT: { return "timeout must be greater than 0"; } break;
			case SIGDUMP_ERR_SIGACTION      : { return "unable to install signal handler"; } break;
			case SIGDUMP_ERR_TIMER          : { return "unable to arm timer"; } break;
			default                         : {                                    } break;
		}

		return "unknown error";
	}


	namespace detail {
		void copy_header(char* dst, const char* src) {
			dst[0] = 0;

			if (src == nullptr)
				return;

			strncpy(dst, src, MAX_HEADER_LENGTH - 1);
			dst[MAX_HEADER_LENGTH - 1] = 0;
		}

		bool is_fatal_signal(int signum) {
			return (find_fault_handler(signum) != nullptr);
		}

		void release_fatal_altstack() {
			// only the enabling thread can take its alternate stack down
			if (threading::remove_altstack(fatal_altstack_mem))
				fatal_altstack_mem = nullptr;
		}
	}


	sigdump_error enable(int fd, bool all_threads, const char* header, bool c_stack) {
		t_fatal_config& config = fatal_config.back();

		config.fd = fd;
		config.all_threads = all_threads;
		config.c_stack = c_stack;
		detail::copy_header(config.header, header);

		fatal_config.publish();

		if (fatal_enabled.load())
			return SIGDUMP_ERR_NONE;

		// stack overflows can only be reported from an alternate stack; if
		// none can be installed that case degrades to no output
		if (fatal_altstack_mem == nullptr) {
			stack_t cur;

			if (sigaltstack(nullptr, &cur) == 0 && (cur.ss_flags & SS_DISABLE) != 0) {
				if ((fatal_altstack_mem = threading::install_altstack()) == nullptr)
					LOG_RAW_LINE("[%s] unable to install an alternate signal stack, stack overflows will not be reported", __func__);
			}
		}

		const sigaction_t sa = get_sig_action(&handle_fatal_signal);

		for (int i = 0; i < NUM_FAULT_HANDLERS; i++) {
			t_fault_handler& handler = fault_handlers[i];

			if (sigaction(handler.signum, &sa, &handler.previous) == 0) {
				handler.enabled = true;
				continue;
			}

			LOG_RAW_LINE("[%s] sigaction(%d) failed: %s", __func__, handler.signum, strerror(errno));

			// all or nothing
			for (int j = 0; j < i; j++) {
				sigaction(fault_handlers[j].signum, &fault_handlers[j].previous, nullptr);
				fault_handlers[j].enabled = false;
			}

			fatal_config.clear();
			return SIGDUMP_ERR_SIGACTION;
		}

		previous_terminate = std::set_terminate(handle_terminate);
		fatal_enabled.store(true);
		return SIGDUMP_ERR_NONE;
	}

	bool disable() {
		if (!fatal_enabled.load())
			return false;

		for (int i = 0; i < NUM_FAULT_HANDLERS; i++) {
			t_fault_handler& handler = fault_handlers[i];

			if (!handler.enabled)
				continue;

			sigaction(handler.signum, &handler.previous, nullptr);
			handler.enabled = false;
		}

		std::set_terminate(previous_terminate);
		previous_terminate = nullptr;

		fatal_enabled.store(false);
		fatal_config.clear();
		return true;
	}

	bool is_enabled() {
		return (fatal_enabled.load());
	}


	sigdump_error enable_from_environment() {
		const char* value = getenv("SIGDUMP_FAULTHANDLER");

		if (value == nullptr || value[0] == 0 || strcmp(value, "0") == 0)
			return SIGDUMP_ERR_NONE;

		const char* all_threads = getenv("SIGDUMP_ALL_THREADS");
		const char* c_stack = getenv("SIGDUMP_C_STACK");

		return (enable(
			STDERR_FILENO,
			(all_threads == nullptr || strcmp(all_threads, "0") != 0),
			nullptr,
			(c_stack != nullptr && c_stack[0] != 0 && strcmp(c_stack, "0") != 0)
		));
	}


	void fatal_error(const char* message) {
		const t_fatal_config* config = fatal_config.load();
		const int fd = (config != nullptr)? config->fd: STDERR_FILENO;

		trace_writer::write_str(fd, trace_writer::FATAL_ERROR_PREFIX);

		if (message != nullptr)
			trace_writer::write_ascii(fd, message);

		trace_writer::write_str(fd, "\n");

		// the SIGABRT handler (if enabled) writes the traceback
		abort();
	}


	void dump_traceback(int fd, bool all_threads) {
		trace_writer::dump_traceback(fd, all_threads);
	}

	void dump_c_stack(int fd) {
		native_stack::dump_c_stack(fd);
	}

	void set_frame_source(const frame_source::source* src) {
		frame_source::set_source(src);
	}


	void shutdown() {
		detail::release_watchdog();
		detail::unregister_all_signals();
		disable();
		detail::release_fatal_altstack();
	}
}
