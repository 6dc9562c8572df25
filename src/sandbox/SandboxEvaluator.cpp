#include "SandboxEvaluator.hpp"

#include <cmath>
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <cstddef>
#include <algorithm>

#include <poll.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <sys/resource.h>

#include <duktape.h>

#include "../debug/log.hpp"

constexpr const size_t HEAP_LIMIT        = 64 * 1024 * 1024;
constexpr const size_t ALLOC_HEADER      = alignof(std::max_align_t);
constexpr const size_t MAX_REPLY_SIZE    = 1024;
constexpr const int    REPLY_FD          = 3;

constexpr const char   REPLY_NUMBER      = 'N';
constexpr const char   REPLY_SCRIPT_FAIL = 'E';

constexpr const int    EXIT_ENGINE_FATAL = 3;
constexpr const int    EXIT_NO_HEAP      = 4;

CSandboxEvaluator::CSandboxEvaluator(std::chrono::milliseconds deadline) : m_deadline(deadline) {
    ;
}

std::expected<double, SError> CSandboxEvaluator::evaluate(const std::string& script) const {
    return evaluate(script, m_deadline);
}

// child side. Nothing here may touch the parent's locks, so no Debug::log.

static void writeAll(int fd, const char* data, size_t len) {
    while (len > 0) {
        const ssize_t N = write(fd, data, len);
        if (N < 0 && errno == EINTR)
            continue;
        if (N <= 0)
            return;
        data += N;
        len -= N;
    }
}

// duktape allocator that refuses to grow the script heap past HEAP_LIMIT
static size_t heapUsed = 0;

static void*  sandboxAlloc(void* udata, duk_size_t size) {
    if (size > HEAP_LIMIT - heapUsed)
        return nullptr;

    auto* block = static_cast<char*>(std::malloc(size + ALLOC_HEADER));
    if (!block)
        return nullptr;

    std::memcpy(block, &size, sizeof(size));
    heapUsed += size;
    return block + ALLOC_HEADER;
}

static void sandboxFree(void* udata, void* ptr) {
    if (!ptr)
        return;

    auto*  block = static_cast<char*>(ptr) - ALLOC_HEADER;
    size_t size  = 0;
    std::memcpy(&size, block, sizeof(size));
    heapUsed -= size;
    std::free(block);
}

static void* sandboxRealloc(void* udata, void* ptr, duk_size_t size) {
    if (!ptr)
        return sandboxAlloc(udata, size);

    if (size == 0) {
        sandboxFree(udata, ptr);
        return nullptr;
    }

    auto*  block = static_cast<char*>(ptr) - ALLOC_HEADER;
    size_t old   = 0;
    std::memcpy(&old, block, sizeof(old));

    if (size > old && size - old > HEAP_LIMIT - heapUsed)
        return nullptr;

    auto* grown = static_cast<char*>(std::realloc(block, size + ALLOC_HEADER));
    if (!grown)
        return nullptr;

    std::memcpy(grown, &size, sizeof(size));
    heapUsed = heapUsed - old + size;
    return grown + ALLOC_HEADER;
}

static void sandboxFatal(void* udata, const char* msg) {
    _exit(EXIT_ENGINE_FATAL);
}

static duk_ret_t coerceToNumber(duk_context* ctx, void* udata) {
    duk_to_number(ctx, -1);
    return 1;
}

[[noreturn]] static void runChild(int fd, const std::string& script, std::chrono::milliseconds deadline) {
    prctl(PR_SET_PDEATHSIG, SIGKILL);

    // keep only the reply pipe and stdio, sockets and other sandboxes' pipes are not ours
    if (fd != REPLY_FD) {
        dup2(fd, REPLY_FD);
        fd = REPLY_FD;
    }
    close_range(REPLY_FD + 1, ~0U, 0);

    // the cpu limit only matters if the parent is gone before it can kill us
    rlimit rl;
    rl.rlim_cur = rl.rlim_max = std::chrono::duration_cast<std::chrono::seconds>(deadline).count() + 1;
    setrlimit(RLIMIT_CPU, &rl);

    rl.rlim_cur = rl.rlim_max = 0;
    setrlimit(RLIMIT_FSIZE, &rl);

    duk_context* ctx = duk_create_heap(sandboxAlloc, sandboxRealloc, sandboxFree, nullptr, sandboxFatal);
    if (!ctx)
        _exit(EXIT_NO_HEAP);

    std::string reply;

    // the completion value of the program is left on the stack
    if (duk_peval_lstring(ctx, script.c_str(), script.size()) != 0 || duk_safe_call(ctx, coerceToNumber, nullptr, 1, 1) != DUK_EXEC_SUCCESS) {
        reply = REPLY_SCRIPT_FAIL;
        reply += duk_safe_to_string(ctx, -1);
        reply.resize(std::min(reply.size(), MAX_REPLY_SIZE));
    } else {
        const double ANSWER = duk_get_number(ctx, -1);
        reply               = REPLY_NUMBER;
        reply.append(reinterpret_cast<const char*>(&ANSWER), sizeof(ANSWER));
    }

    writeAll(fd, reply.data(), reply.size());
    close(fd);

    _exit(0);
}

std::expected<double, SError> CSandboxEvaluator::evaluate(const std::string& script, std::chrono::milliseconds deadline) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) < 0)
        return std::unexpected(SError{ERROR_SANDBOX, fmt::format("Cannot create the sandbox pipe: {}", strerror(errno))});

    const auto  BEGIN = std::chrono::steady_clock::now();
    const pid_t PID   = fork();

    if (PID < 0) {
        const int ERR = errno;
        close(fds[0]);
        close(fds[1]);
        return std::unexpected(SError{ERROR_SANDBOX, fmt::format("Cannot fork the sandbox: {}", strerror(ERR))});
    }

    if (PID == 0) {
        close(fds[0]);
        runChild(fds[1], script, deadline);
    }

    close(fds[1]);

    // race the reply (or EOF when the child dies) against the deadline
    const auto  END      = BEGIN + deadline;
    std::string reply;
    bool        timedOut = false;
    bool        readFail = false;

    while (true) {
        const auto LEFT = std::chrono::duration_cast<std::chrono::milliseconds>(END - std::chrono::steady_clock::now()).count();
        if (LEFT <= 0) {
            timedOut = true;
            break;
        }

        pollfd    pfd{fds[0], POLLIN, 0};
        const int READY = poll(&pfd, 1, (int)LEFT);
        if (READY < 0 && errno == EINTR)
            continue;
        if (READY < 0) {
            readFail = true;
            break;
        }
        if (READY == 0) {
            timedOut = true;
            break;
        }

        char          buf[512];
        const ssize_t N = read(fds[0], buf, sizeof(buf));
        if (N < 0 && errno == EINTR)
            continue;
        if (N < 0) {
            readFail = true;
            break;
        }
        if (N == 0)
            break;

        reply.append(buf, N);
        if (reply.size() > MAX_REPLY_SIZE + 1)
            break;
    }

    close(fds[0]);

    if (timedOut || readFail)
        kill(PID, SIGKILL);

    int status = 0;
    while (waitpid(PID, &status, 0) < 0 && errno == EINTR) {
        ;
    }

    if (timedOut) {
        Debug::log(WARN, "Sandboxed script did not finish within {}ms, killed", deadline.count());
        return std::unexpected(SError{ERROR_TIMEOUT, fmt::format("The sandboxed script ran for longer than {}ms", deadline.count())});
    }

    if (readFail)
        return std::unexpected(SError{ERROR_SANDBOX, "Lost the connection to the sandbox"});

    Debug::log(TRACE, "Sandboxed script finished in {}ms",
               std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - BEGIN).count());

    if (WIFSIGNALED(status))
        return std::unexpected(SError{ERROR_MALFORMED, fmt::format("The sandboxed script was killed by signal {}", WTERMSIG(status))});

    if (WIFEXITED(status) && WEXITSTATUS(status) == EXIT_NO_HEAP)
        return std::unexpected(SError{ERROR_SANDBOX, "The sandbox could not create a script heap"});

    if (WIFEXITED(status) && WEXITSTATUS(status) == EXIT_ENGINE_FATAL)
        return std::unexpected(SError{ERROR_MALFORMED, "The sandboxed script hit a fatal engine error"});

    if (reply.empty())
        return std::unexpected(SError{ERROR_MALFORMED, "The sandboxed script produced no result"});

    if (reply[0] == REPLY_SCRIPT_FAIL) {
        Debug::log(TRACE, "Sandboxed script failed: {}", reply.substr(1));
        return std::unexpected(SError{ERROR_MALFORMED, reply.substr(1)});
    }

    if (reply[0] != REPLY_NUMBER || reply.size() != 1 + sizeof(double))
        return std::unexpected(SError{ERROR_MALFORMED, "The sandbox sent a garbled result"});

    double answer = 0;
    std::memcpy(&answer, reply.data() + 1, sizeof(answer));

    if (!std::isfinite(answer))
        return std::unexpected(SError{ERROR_MALFORMED, fmt::format("The sandboxed script returned {}, which is not a finite number", answer)});

    return answer;
}
