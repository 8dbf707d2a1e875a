#ifndef SIGDUMP_FRAME_HDR
#define SIGDUMP_FRAME_HDR

namespace frame_source {
	static constexpr int MAX_FRAME_DEPTH = 100;

	// file and function must outlive the frame (string literals, interned
	// names of the host runtime); a dump reads them without copying
	struct t_frame {
		const char* file;
		const char* function;
		int line;
	};
}

#endif
