#include <atomic>

#include "log.hpp"

namespace sigdump {
	namespace log {
		static std::atomic<FILE*> log_file{nullptr};

		void set_log_file(FILE* file) { log_file.store(file); }
		FILE* get_log_file() { return (log_file.load()); }
	}
}
