/**
 * @file BoundedExecutor.cpp
 * @brief Isolamento por processo (fork + pipe) com prazo e morte forçada.
 */
#include "BoundedExecutor.hpp"
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <exception>
#include <system_error>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cavern {

namespace {

/** @brief Cabeçalho do quadro: tipo (1) + nó (8) + tamanho do texto (4). */
constexpr size_t FRAME_HEADER = 1 + 8 + 4;
/** @brief Texto de falha é truncado para este tamanho. */
constexpr uint32_t MAX_TEXT = 4096;

/**
 * @brief Sink do lado do filho: serializa quadros no pipe.
 */
class PipeSink : public MessageSink {
public:
    explicit PipeSink(int fd) : fd_(fd) {}

    void send(const PhaseMessage& msg) override {
        const uint32_t len = msg.text.size() > MAX_TEXT ? MAX_TEXT : static_cast<uint32_t>(msg.text.size());
        char frame[FRAME_HEADER + MAX_TEXT];
        frame[0] = static_cast<char>(msg.kind);
        std::memcpy(frame + 1, &msg.node, 8);
        std::memcpy(frame + 9, &len, 4);
        std::memcpy(frame + FRAME_HEADER, msg.text.data(), len);
        size_t left = FRAME_HEADER + len;
        const char* p = frame;
        while (left > 0) {
            ssize_t n = ::write(fd_, p, left);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                // o pai não escuta mais: não há a quem relatar
                std::fflush(nullptr);
                ::_exit(3);
            }
            p += n;
            left -= static_cast<size_t>(n);
        }
    }

private:
    int fd_;
};

/**
 * @brief Sink em processo: entrega direto ao handler.
 *
 * Uma falha do handler (motor) é guardada e relançada depois do corpo, para
 * não ser confundida com falha da callback.
 */
class DirectSink : public MessageSink {
public:
    explicit DirectSink(const BoundedExecutor::Handler& h) : handler_(h) {}

    void send(const PhaseMessage& msg) override {
        try {
            handler_(msg);
        } catch (...) {
            engine_error_ = std::current_exception();
            throw;
        }
    }

    std::exception_ptr engineError() const { return engine_error_; }

private:
    const BoundedExecutor::Handler& handler_;
    std::exception_ptr engine_error_{};
};

/** @brief Executa o corpo no filho e relata o desfecho; nunca retorna. */
[[noreturn]] void child_main(int fd, const BoundedExecutor::Body& body) {
    PipeSink sink(fd);
    PhaseMessage last;
    try {
        body(sink);
        last.kind = PhaseMessage::Kind::Done;
    } catch (const std::exception& e) {
        last.kind = PhaseMessage::Kind::Fault;
        last.text = e.what();
    } catch (...) {
        last.kind = PhaseMessage::Kind::Fault;
        last.text = "non-standard exception";
    }
    sink.send(last);
    std::fflush(nullptr);
    ::close(fd);
    ::_exit(0);
}

void kill_and_reap(pid_t pid) {
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

int reap(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    return status;
}

/**
 * @brief Extrai um quadro completo do início de `buf`.
 * @return 1 se extraiu, 0 se incompleto, -1 se corrompido
 */
int take_frame(std::string& buf, PhaseMessage& out) {
    if (buf.size() < FRAME_HEADER) return 0;
    uint32_t len = 0;
    std::memcpy(&out.node, buf.data() + 1, 8);
    std::memcpy(&len, buf.data() + 9, 4);
    const auto kind = static_cast<uint8_t>(buf[0]);
    if (len > MAX_TEXT || kind < 1 || kind > 4) return -1;
    if (buf.size() < FRAME_HEADER + len) return 0;
    out.kind = static_cast<PhaseMessage::Kind>(kind);
    out.text.assign(buf.data() + FRAME_HEADER, len);
    buf.erase(0, FRAME_HEADER + len);
    return 1;
}

} // namespace

const char* execStatusName(ExecStatus s) {
    switch (s) {
        case ExecStatus::Completed: return "completed";
        case ExecStatus::Faulted:   return "faulted";
        case ExecStatus::TimedOut:  return "timed out";
    }
    return "unknown";
}

ExecResult BoundedExecutor::runIsolated(const Body& body, std::chrono::milliseconds deadline, const Handler& handler) {
    using clock = std::chrono::steady_clock;
    int fds[2];
    if (::pipe(fds) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe");
    }
    // Evita que buffers pendentes do pai sejam emitidos duas vezes pelo filho
    std::fflush(nullptr);
    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        throw std::system_error(err, std::generic_category(), "fork");
    }
    if (pid == 0) {
        ::close(fds[0]);
        child_main(fds[1], body);
    }

    ::close(fds[1]);
    const int fd = fds[0];
    const auto limit = clock::now() + deadline;
    std::string buf;
    char chunk[4096];
    bool terminal = false;
    ExecResult result;

    auto abandon = [&]() { kill_and_reap(pid); ::close(fd); };

    for (;;) {
        const auto now = clock::now();
        if (now >= limit) {
            abandon();
            if (terminal) return result;
            return ExecResult{ExecStatus::TimedOut, "exceeded " + std::to_string(deadline.count()) + " ms"};
        }
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(limit - now).count() + 1;
        pollfd pfd{fd, POLLIN, 0};
        const int r = ::poll(&pfd, 1, static_cast<int>(left));
        if (r < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            abandon();
            throw std::system_error(err, std::generic_category(), "poll");
        }
        if (r == 0) continue;

        const ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            const int err = errno;
            abandon();
            throw std::system_error(err, std::generic_category(), "read");
        }
        if (n == 0) break; // EOF: filho terminou
        buf.append(chunk, static_cast<size_t>(n));

        PhaseMessage msg;
        int got;
        while ((got = take_frame(buf, msg)) == 1) {
            if (terminal) continue;
            if (msg.kind == PhaseMessage::Kind::Done) {
                terminal = true;
                result = ExecResult{ExecStatus::Completed, ""};
            } else if (msg.kind == PhaseMessage::Kind::Fault) {
                terminal = true;
                result = ExecResult{ExecStatus::Faulted, msg.text};
            } else {
                try {
                    handler(msg);
                } catch (...) {
                    abandon();
                    throw;
                }
            }
        }
        if (got < 0) {
            abandon();
            return ExecResult{ExecStatus::Faulted, "corrupt message stream from solver process"};
        }
    }

    ::close(fd);
    const int status = reap(pid);
    if (terminal) return result;
    if (status >= 0 && WIFSIGNALED(status)) {
        const int sig = WTERMSIG(status);
        return ExecResult{ExecStatus::Faulted, "solver process killed by signal " + std::to_string(sig) +
                                               " (" + std::string(strsignal(sig)) + ")"};
    }
    if (status >= 0 && WIFEXITED(status)) {
        return ExecResult{ExecStatus::Faulted, "solver process exited with status " +
                                               std::to_string(WEXITSTATUS(status)) + " without reporting"};
    }
    return ExecResult{ExecStatus::Faulted, "solver process ended without reporting"};
}

ExecResult BoundedExecutor::runInline(const Body& body, const Handler& handler) {
    DirectSink sink(handler);
    ExecResult result;
    try {
        body(sink);
    } catch (const std::exception& e) {
        result = ExecResult{ExecStatus::Faulted, e.what()};
    } catch (...) {
        result = ExecResult{ExecStatus::Faulted, "non-standard exception"};
    }
    if (sink.engineError()) std::rethrow_exception(sink.engineError());
    return result;
}

} // namespace cavern
