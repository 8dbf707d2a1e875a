#ifndef SIGDUMP_TRACE_WRITER_HDR
#define SIGDUMP_TRACE_WRITER_HDR

#include <cstddef>

#include "frame_source.hpp"

// everything in here is async-signal-safe: raw write(2) on stack buffers,
// no allocation, no locks, no stdio
namespace trace_writer {
	static constexpr int MAX_STRING_LENGTH = 500;

	static const char* const STACK_CAPTION = "Stack (most recent call first):\n";
	static const char* const FATAL_ERROR_PREFIX = "Fatal Python error: ";

	// write failures are dropped; the dump is best-effort
	void write_bytes(int fd, const char* buf, size_t len);
	void write_str(int fd, const char* str);

	// no padding, values outside [0, 999999] are skipped
	void write_decimal(int fd, int value);
	void write_hexadecimal(int fd, unsigned long value, int width);

	// printable ASCII as-is, other bytes as \xHH; truncated to
	// MAX_STRING_LENGTH characters followed by "..."
	void write_ascii(int fd, const char* text);

	// <header> followed by a newline, nothing if <header> is null or empty
	void write_header_line(int fd, const char* header);

	//   File "<file>", line <N> in <function>
	void dump_frame(int fd, const frame_source::t_frame& frame);

	// frames of one thread, innermost call first
	void dump_frames(int fd, const frame_source::t_thread_trace& trace);

	// single thread: STACK_CAPTION and the frames of the calling thread
	// all threads: one labelled block per thread, calling thread last
	void dump_traceback(int fd, bool all_threads);
	void dump_traceback_threads(int fd);
}

#endif
