#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

#include "sigdump.hpp"
#include "trace_writer.hpp"
#include "test_helpers.hpp"

using test_helpers::capture;
using test_helpers::split_lines;


static int line_inner = 0;
static int line_outer = 0;
static int line_main = 0;

static std::string frame_line(int line, const char* function) {
	return (std::string("  File \"") + __FILE__ + "\", line " + std::to_string(line) + " in " + function);
}


static void dump_inner(int fd, bool all_threads) {
	SIGDUMP_FRAME();
	SIGDUMP_LINE(); line_inner = __LINE__;
	sigdump::dump_traceback(fd, all_threads);
}

static void dump_outer(int fd, bool all_threads) {
	SIGDUMP_FRAME();
	SIGDUMP_LINE(); line_outer = __LINE__;
	dump_inner(fd, all_threads);
}

static void dump_main(int fd, bool all_threads) {
	SIGDUMP_FRAME();
	SIGDUMP_LINE(); line_main = __LINE__;
	dump_outer(fd, all_threads);
}

static void dump_recursive(int fd, int remaining) {
	SIGDUMP_FRAME();

	if (remaining == 0) {
		sigdump::dump_traceback(fd, false);
		return;
	}

	dump_recursive(fd, remaining - 1);
}


// fixed traces for the formatting of the threads form
class fixed_source: public frame_source::source {
public:
	// with <with_current>, the first trace belongs to the calling thread
	explicit fixed_source(int num_threads, bool with_current = false): num_threads(num_threads), with_current(with_current) {
		frames[0] = {"outer.src", "main", 1};
		frames[1] = {"inner.src", "work", 42};
	}

	int get_threads(frame_source::t_thread_trace* traces, int max_traces) const override {
		int n = 0;

		for (int i = 0; i < num_threads && n < max_traces; i++, n++) {
			// descending, the dump has to order them
			traces[n].thread_id = threading::native_thread_id(num_threads - i);

			if (with_current && i == 0)
				traces[n].thread_id = threading::get_current_thread_id();

			traces[n].frames = frames;
			traces[n].num_frames = 2;
			traces[n].depth = 2;
		}

		return n;
	}

private:
	int num_threads;
	bool with_current;
	frame_source::t_frame frames[2];
};


TEST_CASE("trace writer - primitives", "[trace_writer]")
{
	SECTION("decimal without padding")
	{
		REQUIRE(capture([](int fd) { trace_writer::write_decimal(fd, 0); }) == "0");
		REQUIRE(capture([](int fd) { trace_writer::write_decimal(fd, 1234); }) == "1234");
		REQUIRE(capture([](int fd) { trace_writer::write_decimal(fd, 999999); }) == "999999");
	}

	SECTION("decimal out of range is skipped")
	{
		REQUIRE(capture([](int fd) { trace_writer::write_decimal(fd, -1); }).empty());
		REQUIRE(capture([](int fd) { trace_writer::write_decimal(fd, 1000000); }).empty());
	}

	SECTION("hexadecimal is zero padded to the width")
	{
		REQUIRE(capture([](int fd) { trace_writer::write_hexadecimal(fd, 0xab, 4); }) == "00ab");
		REQUIRE(capture([](int fd) { trace_writer::write_hexadecimal(fd, 0x12345, 1); }) == "12345");
		REQUIRE(capture([](int fd) { trace_writer::write_hexadecimal(fd, 0, 16); }) == "0000000000000000");
	}

	SECTION("non-printable bytes are escaped")
	{
		REQUIRE(capture([](int fd) { trace_writer::write_ascii(fd, "caf\xc3\xa9\t!"); }) == "caf\\xc3\\xa9\\x09!");
	}

	SECTION("long strings are truncated")
	{
		const std::string name(600, 'x');
		const std::string output = capture([&](int fd) { trace_writer::write_ascii(fd, name.c_str()); });

		REQUIRE(output == std::string(500, 'x') + "...");
	}

	SECTION("header line")
	{
		REQUIRE(capture([](int fd) { trace_writer::write_header_line(fd, "hello"); }) == "hello\n");
		REQUIRE(capture([](int fd) { trace_writer::write_header_line(fd, ""); }).empty());
		REQUIRE(capture([](int fd) { trace_writer::write_header_line(fd, nullptr); }).empty());
	}

	SECTION("writes to a closed descriptor are dropped")
	{
		trace_writer::write_str(-1, "lost");
		SUCCEED();
	}
}


TEST_CASE("trace writer - single thread", "[trace_writer]")
{
	SECTION("frames innermost first")
	{
		const std::string output = capture([](int fd) { dump_main(fd, false); });
		const std::vector<std::string> lines = split_lines(output);

		REQUIRE(lines.size() == 4);
		REQUIRE(lines[0] == "Stack (most recent call first):");
		REQUIRE(lines[1] == frame_line(line_inner, "dump_inner"));
		REQUIRE(lines[2] == frame_line(line_outer, "dump_outer"));
		REQUIRE(lines[3] == frame_line(line_main, "dump_main"));
	}

	SECTION("frames are popped when their scope ends")
	{
		capture([](int fd) { dump_outer(fd, false); });

		const std::string output = capture([](int fd) { sigdump::dump_traceback(fd, false); });
		REQUIRE(output == "Stack (most recent call first):\n");
	}

	SECTION("a thread without frames gets the caption only")
	{
		std::string output;

		std::thread t([&]() { output = capture([](int fd) { sigdump::dump_traceback(fd, false); }); });
		t.join();

		REQUIRE(output == "Stack (most recent call first):\n");
	}

	SECTION("long and non-printable names")
	{
		const std::string name(600, 'f');

		const std::string output = capture([&](int fd) {
			frame_source::scoped_frame frame(nullptr, name.c_str(), 7);
			frame_source::scoped_frame inner("bad\x01.src", nullptr, 8);
			sigdump::dump_traceback(fd, false);
		});

		const std::vector<std::string> lines = split_lines(output);

		REQUIRE(lines.size() == 3);
		REQUIRE(lines[1] == "  File \"bad\\x01.src\", line 8 in ???");
		REQUIRE(lines[2] == "  File ???, line 7 in " + std::string(500, 'f') + "...");
	}

	SECTION("deep stacks keep the outermost frames")
	{
		const std::string output = capture([](int fd) { dump_recursive(fd, 110); });
		const std::vector<std::string> lines = split_lines(output);

		REQUIRE(lines.size() == 102);
		REQUIRE(lines[0] == "Stack (most recent call first):");
		REQUIRE(lines[1] == "  ...");
		REQUIRE(test_helpers::count_occurrences(output, " in dump_recursive\n") == 100);
	}
}


TEST_CASE("trace writer - all threads", "[trace_writer]")
{
	SECTION("other threads first, current thread last")
	{
		std::atomic<bool> waiting{false};
		std::atomic<bool> release{false};
		int line_wait = 0;

		std::thread worker = threading::create_traced_thread([&]() {
			SIGDUMP_FRAME(); line_wait = __LINE__;
			waiting.store(true);

			while (!release.load()) {
				std::this_thread::sleep_for(std::chrono::milliseconds(1));
			}
		}, "waiter");

		while (!waiting.load()) {
			std::this_thread::sleep_for(std::chrono::milliseconds(1));
		}

		const std::string worker_id = test_helpers::format_thread_id((unsigned long) worker.native_handle());
		const std::string output = capture([](int fd) { dump_outer(fd, true); });

		release.store(true);
		worker.join();

		const std::vector<std::string> lines = split_lines(output);
		const std::string main_id = test_helpers::format_thread_id((unsigned long) pthread_self());

		REQUIRE(lines.size() == 6);
		REQUIRE(lines[0] == "Thread " + worker_id + " (most recent call first):");
		REQUIRE(lines[1].find("  File \"" + std::string(__FILE__) + "\", line " + std::to_string(line_wait) + " in ") == 0);
		REQUIRE(lines[2].empty());
		REQUIRE(lines[3] == "Current thread " + main_id + " (most recent call first):");
		REQUIRE(lines[4] == frame_line(line_inner, "dump_inner"));
		REQUIRE(lines[5] == frame_line(line_outer, "dump_outer"));
	}

	SECTION("an exited thread is not listed")
	{
		std::thread worker = threading::create_traced_thread([]() {}, "short");
		worker.join();

		const std::string output = capture([](int fd) { sigdump::dump_traceback(fd, true); });

		REQUIRE(test_helpers::count_occurrences(output, "Thread 0x") == 0);
		REQUIRE(output.find("Current thread 0x") == 0);
	}

	SECTION("non-current threads ordered by id")
	{
		fixed_source src(3);
		sigdump::set_frame_source(&src);

		const std::string output = capture([](int fd) { sigdump::dump_traceback(fd, true); });
		sigdump::set_frame_source(nullptr);

		const std::string expected =
			"Thread 0x0000000000000001 (most recent call first):\n"
			"  File \"inner.src\", line 42 in work\n"
			"  File \"outer.src\", line 1 in main\n"
			"\n"
			"Thread 0x0000000000000002 (most recent call first):\n"
			"  File \"inner.src\", line 42 in work\n"
			"  File \"outer.src\", line 1 in main\n"
			"\n"
			"Thread 0x0000000000000003 (most recent call first):\n"
			"  File \"inner.src\", line 42 in work\n"
			"  File \"outer.src\", line 1 in main\n"
			"\n"
			"Current thread " + test_helpers::format_thread_id((unsigned long) pthread_self()) + " (most recent call first):\n";

		REQUIRE(output == expected);
	}

	SECTION("too many threads")
	{
		fixed_source src(threading::MAX_NTHREADS + 5);
		sigdump::set_frame_source(&src);

		const std::string output = capture([](int fd) { sigdump::dump_traceback(fd, true); });
		sigdump::set_frame_source(nullptr);

		const std::vector<std::string> lines = split_lines(output);

		REQUIRE(test_helpers::count_occurrences(output, "Thread 0x") == size_t(threading::MAX_NTHREADS - 1));
		REQUIRE(lines.size() >= 3);
		REQUIRE(lines[lines.size() - 3] == "...");
		REQUIRE(lines[lines.size() - 2] == "");
		REQUIRE(lines.back() == "Current thread " + test_helpers::format_thread_id((unsigned long) pthread_self()) + " (most recent call first):");
	}

	SECTION("too many threads still list the current one")
	{
		fixed_source src(threading::MAX_NTHREADS + 5, true);
		sigdump::set_frame_source(&src);

		const std::string output = capture([](int fd) { sigdump::dump_traceback(fd, true); });
		sigdump::set_frame_source(nullptr);

		const std::vector<std::string> lines = split_lines(output);

		REQUIRE(test_helpers::count_occurrences(output, "Thread 0x") == size_t(threading::MAX_NTHREADS - 1));
		REQUIRE(test_helpers::count_occurrences(output, "Current thread 0x") == 1);
		REQUIRE(lines.size() >= 5);
		REQUIRE(lines[lines.size() - 5] == "...");
		REQUIRE(lines[lines.size() - 4] == "");
		REQUIRE(lines[lines.size() - 3] == "Current thread " + test_helpers::format_thread_id((unsigned long) pthread_self()) + " (most recent call first):");
		REQUIRE(lines[lines.size() - 2] == "  File \"inner.src\", line 42 in work");
		REQUIRE(lines[lines.size() - 1] == "  File \"outer.src\", line 1 in main");
	}

	SECTION("the single thread form of a custom source")
	{
		struct self_source: public frame_source::source {
			frame_source::t_frame frame;

			int get_threads(frame_source::t_thread_trace* traces, int max_traces) const override {
				if (max_traces < 1)
					return 0;

				traces[0].thread_id = threading::get_current_thread_id();
				traces[0].frames = &frame;
				traces[0].num_frames = 1;
				traces[0].depth = 1;
				return 1;
			}
		};

		self_source src;
		src.frame = {"host.src", "entry", 3};

		sigdump::set_frame_source(&src);
		const std::string output = capture([](int fd) { sigdump::dump_traceback(fd, false); });
		sigdump::set_frame_source(nullptr);

		REQUIRE(output == "Stack (most recent call first):\n  File \"host.src\", line 3 in entry\n");
	}
}
