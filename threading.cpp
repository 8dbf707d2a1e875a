#include "threading.hpp"

#include <algorithm>
#include <cinttypes>
#include <cstdlib>
#include <cstring> // memset
#include <functional>
#include <string>

#include <condition_variable>
#include <mutex>

#if defined(__USE_GNU)
	#include <sys/prctl.h>
#endif
#include <unistd.h> // syscall
#include <sys/syscall.h> // SYS_*

#include "log.hpp"


// no glibc wrapper for this
static pid_t get_tid() { return (syscall(SYS_gettid)); }


namespace threading {
	static thread_slot thread_slots[MAX_NTHREADS];

	// plain TLS pointer, safe to read from a handler running on this thread
	static __thread thread_slot* current_slot = nullptr;

	// releases the slot when a registered thread exits without unregistering
	struct slot_guard {
		bool armed = false;

		~slot_guard() {
			if (armed)
				unregister_current_thread();
		}
	};

	static thread_local slot_guard current_guard;


	size_t altstack_size() {
		// the handlers format into stack buffers and walk the native stack,
		// SIGSTKSZ alone is too tight for that
		return (std::max<size_t>(64 * 1024, std::max<size_t>(MINSIGSTKSZ, SIGSTKSZ)));
	}

	void* install_altstack() {
		stack_t cur;

		// keep an alternate stack the host installed itself
		if (sigaltstack(nullptr, &cur) == 0 && (cur.ss_flags & SS_DISABLE) == 0)
			return nullptr;

		stack_t altstack;
		altstack.ss_size = altstack_size();
		altstack.ss_sp = malloc(altstack.ss_size);
		altstack.ss_flags = 0;

		if (altstack.ss_sp == nullptr)
			return nullptr;

		if (sigaltstack(&altstack, nullptr) != 0) {
			free(altstack.ss_sp);
			return nullptr;
		}

		return altstack.ss_sp;
	}

	bool remove_altstack(void* mem) {
		if (mem == nullptr)
			return false;

		stack_t cur;

		if (sigaltstack(nullptr, &cur) != 0 || cur.ss_sp != mem || (cur.ss_flags & SS_ONSTACK) != 0)
			return false;

		stack_t disable;
		memset(&disable, 0, sizeof(disable));
		disable.ss_flags = SS_DISABLE;

		if (sigaltstack(&disable, nullptr) != 0)
			return false;

		free(mem);
		return true;
	}


	native_thread_id get_current_thread_id() {
		return pthread_self();
	}


	thread_slot::thread_slot() {
		memset(name, 0, sizeof(name));
		memset(frames, 0, sizeof(frames));
	}

	bool thread_slot::claim() {
		bool expected = false;

		if (!in_use.compare_exchange_strong(expected, true))
			return false;

		depth.store(0);
		return true;
	}

	void thread_slot::release() {
		// hide the slot from handlers before its contents go stale
		live.store(false);
		depth.store(0);
		in_use.store(false);
	}


	thread_slot* get_thread_slot(int index) {
		if (index < 0 || index >= MAX_NTHREADS)
			return nullptr;

		return &thread_slots[index];
	}

	thread_slot* get_current_thread_slot() {
		return current_slot;
	}


	thread_slot* register_current_thread(const char* name) {
		if (current_slot != nullptr)
			return current_slot;

		thread_slot* slot = nullptr;

		for (int i = 0; i < MAX_NTHREADS; i++) {
			if (!thread_slots[i].claim())
				continue;

			slot = &thread_slots[i];
			slot->index = i;
			break;
		}

		if (slot == nullptr) {
			LOG_RAW_LINE("[%s] thread table full (%d threads), frames of this thread will not be dumped", __func__, MAX_NTHREADS);
			return nullptr;
		}

		slot->id = get_current_thread_id();
		slot->tid = get_tid();
		memset(slot->name, 0, sizeof(slot->name));

		if (name != nullptr)
			strncpy(slot->name, name, sizeof(slot->name) - 1);

		slot->altstack_mem = install_altstack();
		slot->live.store(true);

		current_slot = slot;
		current_guard.armed = true;
		return slot;
	}

	void unregister_current_thread() {
		thread_slot* slot = current_slot;

		if (slot == nullptr)
			return;

		current_slot = nullptr;
		current_guard.armed = false;

		// a stack that cannot be taken down is leaked rather than freed under the kernel's feet
		remove_altstack(slot->altstack_mem);
		slot->altstack_mem = nullptr;
		slot->release();
	}


	void set_thread_name(const char* name) {
		#if defined(__USE_GNU)
		// alternative: pthread_setname_np(pthread_self(), name);
		prctl(PR_SET_NAME, name, 0, 0, 0);
		#else
		(void) name;
		#endif

		if (current_slot == nullptr)
			return;

		memset(current_slot->name, 0, sizeof(current_slot->name));
		strncpy(current_slot->name, name, sizeof(current_slot->name) - 1);
	}


	// entry point for the wrapped thread; registers it before the task runs
	// so that a dump taken right after create_traced_thread sees it
	static void thread_start(
		std::function<void()> task_func,
		std::string thread_name,
		std::mutex* init_mutex,
		std::condition_variable* init_cond,
		bool* initialized
	) {
		const char* name = thread_name.empty()? nullptr: thread_name.c_str();

		if (name != nullptr)
			set_thread_name(name);

		register_current_thread(name);

		{
			// fully initialized, notify the condition variable
			// thread's parent will unblock in create_traced_thread
			std::lock_guard<std::mutex> lock(*init_mutex);
			*initialized = true;
			init_cond->notify_all();
		}

		task_func();
		unregister_current_thread();
	}

	std::thread create_traced_thread(std::function<void()> task_func, const char* name) {
		std::mutex init_mutex;
		std::condition_variable init_cond;
		bool initialized = false;

		std::unique_lock<std::mutex> lock(init_mutex);
		std::thread local_thread(std::bind(thread_start, task_func, std::string((name != nullptr)? name: ""), &init_mutex, &init_cond, &initialized));

		// wait so that we know the thread is running and registered before returning
		init_cond.wait(lock, [&]() { return initialized; });
		return local_thread;
	}
}
