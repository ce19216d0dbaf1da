#include "event_loop.h"
#include <cerrno>
#include <fcntl.h>
#include <sys/socket.h>

event_loop::event_loop(uint32_t queue_depth)
    : m_queue_depth(queue_depth)
{
}

event_loop::~event_loop()
{
    if (m_ring_ready)
        io_uring_queue_exit(&m_ring);
}

bool event_loop::init()
{
    if (m_ring_ready)
        return true;

    struct io_uring_params params{};
    params.flags = IORING_SETUP_SINGLE_ISSUER;
    int rc = io_uring_queue_init_params(m_queue_depth, &m_ring, &params);
    if (rc < 0)
        rc = io_uring_queue_init(m_queue_depth, &m_ring, 0);   // pre-6.0 kernels
    if (rc < 0)
        return false;
    m_ring_ready = true;

    int fds[2];
    if (pipe2(fds, O_NONBLOCK | O_CLOEXEC) == 0)
    {
        m_wake_read.reset(fds[0]);
        m_wake_write.reset(fds[1]);
    }

    if (!m_wake_read || !arm_wake_read())
    {
        io_uring_queue_exit(&m_ring);
        m_ring_ready = false;
        m_wake_read.reset();
        m_wake_write.reset();
        return false;
    }

    m_running.store(true, std::memory_order_release);
    return true;
}

bool event_loop::arm_wake_read()
{
    struct io_uring_sqe* sqe = next_sqe();
    if (!sqe)
        return false;

    m_wake_req = {nullptr, &m_wake_byte, m_wake_read.get(), 1, op_read};
    io_uring_prep_read(sqe, m_wake_read.get(), &m_wake_byte, 1, 0);
    io_uring_sqe_set_data(sqe, &m_wake_req);
    flush();
    return true;
}

struct io_uring_sqe* event_loop::next_sqe()
{
    struct io_uring_sqe* sqe = io_uring_get_sqe(&m_ring);
    if (!sqe)
    {
        // Submission queue full: push what we have and retry once.
        flush();
        sqe = io_uring_get_sqe(&m_ring);
    }
    if (sqe)
        ++m_queued;
    return sqe;
}

void event_loop::flush()
{
    if (m_queued == 0)
        return;
    io_uring_submit(&m_ring);
    m_queued = 0;
}

void event_loop::run()
{
    m_woken = false;

    while (m_running.load(std::memory_order_acquire) && !m_woken)
    {
        int rc = io_uring_submit_and_wait(&m_ring, 1);
        m_queued = 0;
        if (rc == -EINTR)
            continue;
        if (rc < 0)
            break;

        dispatch_completions();
    }

    m_running.store(false, std::memory_order_release);
}

void event_loop::dispatch_completions()
{
    struct io_uring_cqe* cqe;
    unsigned head;
    unsigned seen = 0;

    io_uring_for_each_cqe(&m_ring, head, cqe)
    {
        ++seen;
        auto* req = static_cast<io_request*>(io_uring_cqe_get_data(cqe));
        if (req == &m_wake_req)
        {
            m_woken = true;
            break;
        }
        if (req && req->owner)
            req->owner->on_cqe(cqe);
    }

    io_uring_cq_advance(&m_ring, seen);
}

void event_loop::request_stop()
{
    m_running.store(false, std::memory_order_release);

    if (m_wake_write)
    {
        char c = 1;
        if (::write(m_wake_write.get(), &c, 1) < 0) {}
    }
}

void event_loop::submit_accept(int listen_fd, io_request* req)
{
    struct io_uring_sqe* sqe = next_sqe();
    if (!sqe)
        return;
    io_uring_prep_accept(sqe, listen_fd, nullptr, nullptr, SOCK_CLOEXEC);
    io_uring_sqe_set_data(sqe, req);
}

void event_loop::submit_timeout(struct __kernel_timespec* ts, io_request* req)
{
    struct io_uring_sqe* sqe = next_sqe();
    if (!sqe)
        return;
    io_uring_prep_timeout(sqe, ts, 0, 0);
    io_uring_sqe_set_data(sqe, req);
}
