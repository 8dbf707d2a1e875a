#ifndef SIGDUMP_NATIVE_STACK_HDR
#define SIGDUMP_NATIVE_STACK_HDR

namespace native_stack {
	static constexpr int MAX_STACKTRACE_DEPTH = 100;

	// walks the machine stack of the calling thread with libunwind and writes
	//
	//   Current thread's C stack trace (most recent call first):
	//     Binary file "<module>", at <symbol>+0x<offset> [0x<pc>]
	//
	// the frames of the dump machinery itself are skipped; usable from a
	// signal handler (local unwinding only, stack buffers)
	void dump_c_stack(int fd);
}

#endif
