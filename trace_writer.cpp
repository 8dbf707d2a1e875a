#include <cerrno>
#include <cstring> // strlen

#include <unistd.h>

#include "trace_writer.hpp"


namespace trace_writer {
	static constexpr int MAX_NTHREADS = threading::MAX_NTHREADS;

	static const char* const HEX_DIGITS = "0123456789abcdef";


	// reverse a string, e.g. "abcd" becomes "dcba"
	static void reverse_string(char* text, const size_t len) {
		if (len == 0)
			return;

		for (size_t i = 0, j = len - 1; i < j; i++, j--) {
			const char tmp = text[i];
			text[i] = text[j];
			text[j] = tmp;
		}
	}


	void write_bytes(int fd, const char* buf, size_t len) {
		while (len > 0) {
			const ssize_t n = write(fd, buf, len);

			if (n < 0) {
				if (errno == EINTR)
					continue;

				return;
			}

			buf += n;
			len -= n;
		}
	}

	void write_str(int fd, const char* str) {
		write_bytes(fd, str, strlen(str));
	}

	void write_decimal(int fd, int value) {
		char buffer[7];
		size_t len = 0;

		if (value < 0 || 999999 < value)
			return;

		do {
			buffer[len++] = '0' + (value % 10);
			value /= 10;
		} while (value != 0);

		reverse_string(buffer, len);
		write_bytes(fd, buffer, len);
	}

	void write_hexadecimal(int fd, unsigned long value, int width) {
		char buffer[sizeof(unsigned long) * 2 + 1];
		size_t len = 0;

		do {
			buffer[len++] = HEX_DIGITS[value & 15];
			value >>= 4;
		} while ((len < size_t(width) || value != 0) && len < sizeof(buffer));

		reverse_string(buffer, len);
		write_bytes(fd, buffer, len);
	}

	void write_ascii(int fd, const char* text) {
		// worst case every byte expands to \xHH
		char buffer[128];
		size_t len = 0;
		int i = 0;

		for (; text[i] != 0 && i < MAX_STRING_LENGTH; i++) {
			const unsigned char ch = text[i];

			if (len + 4 > sizeof(buffer)) {
				write_bytes(fd, buffer, len);
				len = 0;
			}

			if (' ' <= ch && ch < 0x7f) {
				buffer[len++] = ch;
			} else {
				buffer[len++] = '\\';
				buffer[len++] = 'x';
				buffer[len++] = HEX_DIGITS[(ch >> 4) & 15];
				buffer[len++] = HEX_DIGITS[ch & 15];
			}
		}

		write_bytes(fd, buffer, len);

		if (text[i] != 0)
			write_str(fd, "...");
	}

	void write_header_line(int fd, const char* header) {
		if (header == nullptr || header[0] == 0)
			return;

		write_ascii(fd, header);
		write_str(fd, "\n");
	}


	void dump_frame(int fd, const frame_source::t_frame& frame) {
		write_str(fd, "  File ");

		if (frame.file != nullptr) {
			write_str(fd, "\"");
			write_ascii(fd, frame.file);
			write_str(fd, "\"");
		} else {
			write_str(fd, "???");
		}

		write_str(fd, ", line ");
		write_decimal(fd, frame.line);
		write_str(fd, " in ");

		if (frame.function != nullptr) {
			write_ascii(fd, frame.function);
		} else {
			write_str(fd, "???");
		}

		write_str(fd, "\n");
	}

	void dump_frames(int fd, const frame_source::t_thread_trace& trace) {
		// innermost frames past the stored ones are lost; say so up front
		if (trace.depth > trace.num_frames)
			write_str(fd, "  ...\n");

		for (int i = trace.num_frames - 1; i >= 0; i--) {
			dump_frame(fd, trace.frames[i]);
		}
	}


	static void write_thread_id(int fd, threading::native_thread_id thread_id, bool is_current) {
		if (is_current) {
			write_str(fd, "Current thread 0x");
		} else {
			write_str(fd, "Thread 0x");
		}

		write_hexadecimal(fd, (unsigned long) thread_id, sizeof(unsigned long) * 2);
		write_str(fd, " (most recent call first):\n");
	}

	// index of the current thread's trace in <traces>, -1 if it has none
	static int find_current_thread(const frame_source::t_thread_trace* traces, int num_traces) {
		const threading::native_thread_id self = threading::get_current_thread_id();

		for (int i = 0; i < num_traces; i++) {
			if (threading::native_thread_ids_equal(traces[i].thread_id, self))
				return i;
		}

		return -1;
	}


	void dump_traceback_threads(int fd) {
		frame_source::t_thread_trace traces[MAX_NTHREADS + 1];

		const int num_traces = frame_source::get_source()->get_threads(traces, MAX_NTHREADS + 1);
		const int current = find_current_thread(traces, num_traces);

		// past the limit the last slot stays reserved for the current thread
		const bool truncated = (num_traces > MAX_NTHREADS);
		const int max_others = truncated? (MAX_NTHREADS - 1): MAX_NTHREADS;

		// non-current threads by ascending id; selection instead of sorting
		// keeps <traces> untouched and needs no scratch memory
		bool have_last = false;
		unsigned long last_id = 0;
		int nthreads = 0;

		while (nthreads < max_others) {
			int next = -1;

			for (int i = 0; i < num_traces; i++) {
				if (i == current)
					continue;

				const unsigned long id = (unsigned long) traces[i].thread_id;

				if (have_last && id <= last_id)
					continue;
				if (next != -1 && id >= (unsigned long) traces[next].thread_id)
					continue;

				next = i;
			}

			if (next == -1)
				break;

			if (nthreads++ != 0)
				write_str(fd, "\n");

			write_thread_id(fd, traces[next].thread_id, false);
			dump_frames(fd, traces[next]);

			have_last = true;
			last_id = (unsigned long) traces[next].thread_id;
		}

		if (truncated) {
			if (nthreads != 0)
				write_str(fd, "\n");

			write_str(fd, "...\n");
			nthreads++;
		}

		if (nthreads != 0)
			write_str(fd, "\n");

		write_thread_id(fd, threading::get_current_thread_id(), true);

		if (current != -1)
			dump_frames(fd, traces[current]);
	}

	void dump_traceback(int fd, bool all_threads) {
		if (all_threads) {
			dump_traceback_threads(fd);
			return;
		}

		frame_source::t_thread_trace traces[MAX_NTHREADS];

		const int num_traces = frame_source::get_source()->get_threads(traces, MAX_NTHREADS);
		const int current = find_current_thread(traces, num_traces);

		write_str(fd, STACK_CAPTION);

		if (current != -1)
			dump_frames(fd, traces[current]);
	}
}
