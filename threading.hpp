#ifndef SIGDUMP_THREADING_HDR
#define SIGDUMP_THREADING_HDR

#include <pthread.h>
#include <signal.h>

#include <atomic>
#include <cinttypes>
#include <functional>

#include <thread>

#include "frame.hpp"


namespace threading {
	typedef pthread_t native_thread_id;

	static constexpr int MAX_NTHREADS = 100;
	static constexpr int MAX_THREAD_NAME_LENGTH = 16;

	native_thread_id get_current_thread_id();

	inline bool native_thread_ids_equal(const native_thread_id a, const native_thread_id b) {
		// pthread_t is an unsigned long on Linux; the dumps print and order
		// thread ids as integers, which pthread_equal would not allow anyway
		return (a == b);
	}


	// one slot per live host thread; claimed and released from normal
	// execution context, read (never written) from signal handlers
	class thread_slot {
	public:
		thread_slot();

		bool claim();
		void release();

		std::atomic<bool> in_use{false};
		std::atomic<bool> live{false};

		int index{-1};
		native_thread_id id{0};
		pid_t tid{0};
		char name[MAX_THREAD_NAME_LENGTH];

		// per-thread alternate signal stack, null if sigaltstack failed
		void* altstack_mem{nullptr};

		// shadow stack fed by the host; index 0 is the outermost caller
		// depth may exceed MAX_FRAME_DEPTH, deeper frames are not stored
		frame_source::t_frame frames[frame_source::MAX_FRAME_DEPTH];
		std::atomic<int> depth{0};
	};

	thread_slot* get_thread_slot(int index);
	thread_slot* get_current_thread_slot();

	// claims a slot for the calling thread and installs its alternate signal
	// stack; returns the existing slot if the thread is already registered
	// and null if the table is full
	thread_slot* register_current_thread(const char* name = nullptr);
	void unregister_current_thread();

	// creates a new thread whose entry-function is wrapped by boilerplate that
	// registers it (so its frames are visible to dumps); thread is guaranteed
	// to be registered and running when this returns
	std::thread create_traced_thread(std::function<void()> task_func, const char* name = nullptr);

	void set_thread_name(const char* name);

	// allocates and installs an alternate signal stack for the calling
	// thread; null if it already has one or sigaltstack fails
	void* install_altstack();
	// false (and <mem> kept) unless <mem> is the calling thread's idle alternate stack
	bool remove_altstack(void* mem);
	size_t altstack_size();
}

#endif
