#pragma once
#include <atomic>
#include <cstdint>
#include <liburing.h>

#include "event_loop_definitions.h"
#include "scoped_fd.h"

// io_uring completion loop for the supervisor's accept socket and tick timer.
// The thread that calls init() owns the ring and is the only one allowed to
// queue work; anything else stops the loop through request_stop() or by
// writing a byte to wake_fd().
class event_loop
{
public:
    explicit event_loop(uint32_t queue_depth = 64);
    ~event_loop();

    event_loop(const event_loop&) = delete;
    event_loop& operator=(const event_loop&) = delete;

    bool init();
    void run();
    void request_stop();
    // Write end of the wake pipe; async-signal-safe to write to.
    int wake_fd() const { return m_wake_write.get(); }
    bool running() const { return m_running.load(std::memory_order_acquire); }

    // Queued, not submitted: run() or flush() hands them to the kernel.
    void submit_accept(int listen_fd, io_request* req);
    void submit_timeout(struct __kernel_timespec* ts, io_request* req);
    void flush();

private:
    struct io_uring_sqe* next_sqe();
    bool arm_wake_read();
    void dispatch_completions();

    struct io_uring m_ring{};
    bool m_ring_ready = false;
    std::atomic<bool> m_running{false};
    bool m_woken = false;
    uint32_t m_queue_depth;
    uint32_t m_queued = 0;

    scoped_fd m_wake_read;
    scoped_fd m_wake_write;
    io_request m_wake_req{};
    char m_wake_byte = 0;
};
