#include <atomic>

#include "frame_source.hpp"


namespace frame_source {
	static const shadow_stack_source default_source;
	static std::atomic<const source*> active_source{&default_source};


	int shadow_stack_source::get_threads(t_thread_trace* traces, int max_traces) const {
		int n = 0;

		for (int i = 0; i < threading::MAX_NTHREADS && n < max_traces; i++) {
			const threading::thread_slot* slot = threading::get_thread_slot(i);

			if (!slot->live.load(std::memory_order_acquire))
				continue;

			const int depth = slot->depth.load(std::memory_order_acquire);

			t_thread_trace& trace = traces[n++];
			trace.thread_id = slot->id;
			trace.frames = slot->frames;
			trace.depth = depth;
			trace.num_frames = (depth < MAX_FRAME_DEPTH)? depth: MAX_FRAME_DEPTH;
		}

		return n;
	}


	const source* get_source() {
		return (active_source.load(std::memory_order_acquire));
	}

	void set_source(const source* src) {
		if (src == nullptr)
			src = &default_source;

		active_source.store(src, std::memory_order_release);
	}


	scoped_frame::scoped_frame(const char* file, const char* function, int line) {
		slot = threading::register_current_thread();
		level = 0;

		if (slot == nullptr)
			return;

		level = slot->depth.load(std::memory_order_relaxed);

		// frame contents first, then publish the new depth
		if (level < MAX_FRAME_DEPTH) {
			t_frame& frame = slot->frames[level];
			frame.file = file;
			frame.function = function;
			frame.line = line;
		}

		slot->depth.store(level + 1, std::memory_order_release);
	}

	scoped_frame::~scoped_frame() {
		if (slot == nullptr)
			return;

		// the thread may have unregistered itself while this frame was live
		if (threading::get_current_thread_slot() != slot)
			return;

		slot->depth.store(level, std::memory_order_release);
	}

	void scoped_frame::set_line(int line) {
		if (slot == nullptr || level >= MAX_FRAME_DEPTH)
			return;

		slot->frames[level].line = line;
	}
}
