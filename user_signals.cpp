#include <cerrno>
#include <cstring>

#include <pthread.h>
#include <signal.h>

#include "double_buffer.hpp"
#include "sigdump.hpp"
#include "trace_writer.hpp"


typedef struct sigaction sigaction_t;

struct t_user_signal_config {
	int fd;
	bool all_threads;
	bool chain;
	char header[sigdump::MAX_HEADER_LENGTH];

	// disposition found at the first registration of the signal
	sigaction_t previous;
};


static sigdump::double_buffer<t_user_signal_config> user_signals[NSIG];

// normal-context bookkeeping, never read by the handler
static bool registered[NSIG];
static sigaction_t previous_actions[NSIG];


static bool is_valid_user_signal(int signum) {
	if (signum < 1 || signum >= NSIG)
		return false;

	// neither can be caught
	return (signum != SIGKILL && signum != SIGSTOP);
}

static void chain_previous(int signum, siginfo_t* siginfo, void* pctx, const sigaction_t& previous, const sigaction_t& own) {
	if ((previous.sa_flags & SA_SIGINFO) != 0) {
		if (previous.sa_sigaction != nullptr)
			previous.sa_sigaction(signum, siginfo, pctx);

		return;
	}

	if (previous.sa_handler == SIG_IGN)
		return;

	if (previous.sa_handler != SIG_DFL) {
		previous.sa_handler(signum);
		return;
	}

	// the handler runs with SA_NODEFER when chaining, so the default action
	// (usually termination) takes effect inside raise()
	sigaction(signum, &previous, nullptr);
	raise(signum);
	sigaction(signum, &own, nullptr);
}

static void handle_user_signal(int signum, siginfo_t* siginfo, void* pctx) {
	if (signum < 1 || signum >= NSIG)
		return;

	const t_user_signal_config* config = user_signals[signum].load();

	if (config == nullptr)
		return;

	const int saved_errno = errno;

	trace_writer::write_header_line(config->fd, config->header);
	trace_writer::dump_traceback(config->fd, config->all_threads);

	if (config->chain) {
		sigaction_t own;

		// reinstalled after a default action that did not terminate
		memset(&own, 0, sizeof(own));
		sigemptyset(&own.sa_mask);
		own.sa_flags = SA_SIGINFO | SA_RESTART | SA_ONSTACK | SA_NODEFER;
		own.sa_sigaction = handle_user_signal;

		chain_previous(signum, siginfo, pctx, config->previous, own);
	}

	errno = saved_errno;
}


namespace sigdump {
	namespace detail {
		void unregister_all_signals() {
			for (int signum = 1; signum < NSIG; signum++) {
				unregister_signal(signum);
			}
		}
	}


	sigdump_error register_signal(int signum, int fd, bool all_threads, bool chain, const char* header) {
		if (!is_valid_user_signal(signum))
			return SIGDUMP_ERR_INVALID_SIGNAL;
		if (detail::is_fatal_signal(signum))
			return SIGDUMP_ERR_FATAL_SIGNAL;
		if (signum == WATCHDOG_SIGNAL)
			return SIGDUMP_ERR_RESERVED_SIGNAL;

		// re-registering keeps the handler found the first time, which is
		// never our own
		if (!registered[signum]) {
			if (sigaction(signum, nullptr, &previous_actions[signum]) != 0) {
				LOG_RAW_LINE("[%s] unable to query handler of signal %d: %s", __func__, signum, strerror(errno));
				return SIGDUMP_ERR_SIGACTION;
			}
		}

		// keep the handler off this thread while the slot is written
		sigset_t block_set;
		sigset_t saved_set;

		sigemptyset(&block_set);
		sigaddset(&block_set, signum);
		pthread_sigmask(SIG_BLOCK, &block_set, &saved_set);

		t_user_signal_config& config = user_signals[signum].back();

		config.fd = fd;
		config.all_threads = all_threads;
		config.chain = chain;
		config.previous = previous_actions[signum];
		detail::copy_header(config.header, header);

		user_signals[signum].publish();

		sigaction_t sa;
		memset(&sa, 0, sizeof(sa));
		sigemptyset(&sa.sa_mask);

		sa.sa_flags = SA_SIGINFO | SA_RESTART | SA_ONSTACK;
		sa.sa_sigaction = handle_user_signal;

		if (chain)
			sa.sa_flags |= SA_NODEFER;

		sigdump_error err = SIGDUMP_ERR_NONE;

		if (sigaction(signum, &sa, nullptr) == 0) {
			registered[signum] = true;
		} else {
			LOG_RAW_LINE("[%s] unable to set handler of signal %d: %s", __func__, signum, strerror(errno));

			if (!registered[signum])
				user_signals[signum].clear();

			err = SIGDUMP_ERR_SIGACTION;
		}

		pthread_sigmask(SIG_SETMASK, &saved_set, nullptr);
		return err;
	}

	bool unregister_signal(int signum) {
		if (signum < 1 || signum >= NSIG)
			return false;
		if (!registered[signum])
			return false;

		sigaction(signum, &previous_actions[signum], nullptr);

		registered[signum] = false;
		user_signals[signum].clear();
		return true;
	}
}
