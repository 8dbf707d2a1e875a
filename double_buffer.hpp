#ifndef SIGDUMP_DOUBLE_BUFFER_HDR
#define SIGDUMP_DOUBLE_BUFFER_HDR

#include <atomic>

namespace sigdump {
	// state shared between one writer running in normal context and any
	// number of signal handlers
	//
	// the writer fills the slot that is not currently published and makes it
	// visible with a single pointer store, so a handler never observes a half
	// written configuration; a handler still reading the previous slot when
	// the writer publishes twice in a row may see mixed fields, which is the
	// tolerated race of a best-effort dump
	template<typename T> class double_buffer {
	public:
		double_buffer(): active(nullptr), next(0) {}

		double_buffer(const double_buffer&) = delete;
		double_buffer& operator = (const double_buffer&) = delete;

		// writer side: the slot to fill before publish()
		T& back() {
			const T* cur = active.load(std::memory_order_relaxed);

			if (cur == &slots[next])
				next ^= 1;

			return slots[next];
		}

		void publish() {
			active.store(&slots[next], std::memory_order_release);
			next ^= 1;
		}

		void clear() { active.store(nullptr, std::memory_order_release); }

		// reader side; null if nothing is published
		const T* load() const { return (active.load(std::memory_order_acquire)); }

	private:
		T slots[2];

		std::atomic<const T*> active;
		int next;
	};
}

#endif
