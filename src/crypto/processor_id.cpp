#include "processor_id.hpp"
#include "cryptorand/common.hpp"
#include <functional>
#include <thread>

#if defined(CRYPTORAND_PLATFORM_WINDOWS)
    #include <windows.h>
#elif defined(CRYPTORAND_PLATFORM_LINUX)
    #include <sched.h>
#endif

namespace cryptorand::crypto::processor_id {

#if !defined(CRYPTORAND_PLATFORM_WINDOWS)
namespace {
    size_t thread_hash_slot() {
        thread_local const size_t hash = std::hash<std::thread::id>()(std::this_thread::get_id());
        return hash;
    }
}
#endif

size_t logical_processor_count() {
    unsigned count = std::thread::hardware_concurrency();
    return count == 0 ? 1 : static_cast<size_t>(count);
}

size_t current_slot(size_t slot_count) {
    if (slot_count <= 1) {
        return 0;
    }

#if defined(CRYPTORAND_PLATFORM_WINDOWS)
    return static_cast<size_t>(GetCurrentProcessorNumber()) % slot_count;
#elif defined(CRYPTORAND_PLATFORM_LINUX)
    int cpu = sched_getcpu();
    if (cpu >= 0) {
        return static_cast<size_t>(cpu) % slot_count;
    }
    return thread_hash_slot() % slot_count;
#else
    return thread_hash_slot() % slot_count;
#endif
}

} // namespace cryptorand::crypto::processor_id
