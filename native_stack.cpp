#include <cinttypes> // uintptr_t
#include <cstring>

#define UNW_LOCAL_ONLY
#include <libunwind.h>
#include <dlfcn.h>

#include "native_stack.hpp"
#include "trace_writer.hpp"


namespace native_stack {
	static constexpr int MAX_SYMBOL_LENGTH = 512;

	// dump_c_stack itself
	static constexpr int SKIP_FRAMES = 1;


	static void dump_native_frame(int fd, unw_cursor_t* cursor, unw_word_t ip) {
		char proc_buffer[MAX_SYMBOL_LENGTH];
		unw_word_t offp = 0;

		trace_writer::write_str(fd, "  Binary file ");

		Dl_info info;

		if (dladdr(reinterpret_cast<void*>(ip), &info) != 0 && info.dli_fname != nullptr && info.dli_fname[0] != 0) {
			trace_writer::write_str(fd, "\"");
			trace_writer::write_ascii(fd, info.dli_fname);
			trace_writer::write_str(fd, "\"");
		} else {
			trace_writer::write_str(fd, "\"<unknown>\"");
		}

		memset(proc_buffer, 0, sizeof(proc_buffer));

		if (unw_get_proc_name(cursor, proc_buffer, sizeof(proc_buffer) - 1, &offp) == 0) {
			trace_writer::write_str(fd, ", at ");
			trace_writer::write_ascii(fd, proc_buffer);
			trace_writer::write_str(fd, "+0x");
			trace_writer::write_hexadecimal(fd, (unsigned long) offp, 1);
		}

		trace_writer::write_str(fd, " [0x");
		trace_writer::write_hexadecimal(fd, (unsigned long) ip, sizeof(uintptr_t) * 2);
		trace_writer::write_str(fd, "]\n");
	}

	void dump_c_stack(int fd) {
		unw_context_t context;
		unw_cursor_t cursor;

		trace_writer::write_str(fd, "Current thread's C stack trace (most recent call first):\n");

		if (unw_getcontext(&context) != 0 || unw_init_local(&cursor, &context) != 0) {
			trace_writer::write_str(fd, "  <cannot get C stack on this system>\n");
			return;
		}

		int level = 0;

		do {
			unw_word_t ip = 0;

			if (unw_get_reg(&cursor, UNW_REG_IP, &ip) != 0 || ip == 0)
				break;

			if (level >= MAX_STACKTRACE_DEPTH + SKIP_FRAMES) {
				trace_writer::write_str(fd, "  <truncated rest of calls>\n");
				break;
			}

			if (level >= SKIP_FRAMES)
				dump_native_frame(fd, &cursor, ip);

			level++;
		} while (unw_step(&cursor) > 0);
	}
}
