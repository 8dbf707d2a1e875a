#ifndef SIGDUMP_FRAME_SOURCE_HDR
#define SIGDUMP_FRAME_SOURCE_HDR

#include "frame.hpp"
#include "threading.hpp"


namespace frame_source {
	struct t_thread_trace {
		threading::native_thread_id thread_id;

		const t_frame* frames; // outermost caller first
		int num_frames;        // frames stored in <frames>
		int depth;             // real depth, larger than num_frames if the stack overflowed its storage
	};

	// the seam between a host runtime and the dump engines
	//
	// get_threads is called from signal handlers: it must not allocate, lock
	// or call into non-reentrant code, and the frames it hands out must stay
	// readable for the duration of the dump
	class source {
	public:
		virtual ~source() {}

		// fills at most <max_traces> entries, one per live thread, in any order
		virtual int get_threads(t_thread_trace* traces, int max_traces) const = 0;
	};

	// frames pushed by SIGDUMP_FRAME into the per-thread slots of the
	// threading registry
	class shadow_stack_source: public source {
	public:
		int get_threads(t_thread_trace* traces, int max_traces) const override;
	};

	// the source dumps read from; never null
	const source* get_source();
	// null restores the shadow stack
	void set_source(const source* src);


	// pushes a frame for the enclosing scope onto the calling thread's shadow
	// stack, registering the thread on first use
	class scoped_frame {
	public:
		scoped_frame(const char* file, const char* function, int line);
		~scoped_frame();

		scoped_frame(const scoped_frame&) = delete;
		scoped_frame& operator = (const scoped_frame&) = delete;

		void set_line(int line);

	private:
		threading::thread_slot* slot;
		int level;
	};
}

#define SIGDUMP_FRAME() frame_source::scoped_frame sigdump_scoped_frame_(__FILE__, __func__, __LINE__)
#define SIGDUMP_LINE() sigdump_scoped_frame_.set_line(__LINE__)

#endif
