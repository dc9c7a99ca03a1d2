#include "common/utils.hpp"
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/core.h>
#include <cerrno>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <stdexcept>
#include <system_error>

namespace sandbox {
using namespace std;

static void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

static void append_limited(string &buffer, const char *data, size_t len, size_t limit, bool &truncated) {
    if (buffer.size() >= limit) {
        if (len > 0) truncated = true;
        return;
    }
    size_t take = min(len, limit - buffer.size());
    buffer.append(data, take);
    if (take < len) truncated = true;
}

process_result capture_process(const vector<string> &argv, const string &input, optional<chrono::milliseconds> timeout, size_t output_limit) {
    // 使用 POSIX 提供的函数来实现外部程序调用
    int in_pipe[2], out_pipe[2], err_pipe[2];
    if (pipe2(in_pipe, O_CLOEXEC) < 0)
        throw system_error(errno, system_category(), "pipe");
    if (pipe2(out_pipe, O_CLOEXEC) < 0) {
        close(in_pipe[0]), close(in_pipe[1]);
        throw system_error(errno, system_category(), "pipe");
    }
    if (pipe2(err_pipe, O_CLOEXEC) < 0) {
        close(in_pipe[0]), close(in_pipe[1]);
        close(out_pipe[0]), close(out_pipe[1]);
        throw system_error(errno, system_category(), "pipe");
    }

    vector<const char *> args;
    for (auto &arg : argv) args.push_back(arg.c_str());
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {  // fork 失败
        int err = errno;
        for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) close(fd);
        throw system_error(err, system_category(), "fork");
    }

    if (pid == 0) {  // 子进程
        // 避免子进程被终止，要求父进程处理中断信号
        signal(SIGINT, SIG_IGN);
        signal(SIGPIPE, SIG_DFL);
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        execvp(args[0], (char **)args.data());
        _exit(127);
    }

    // 父进程
    close(in_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[1]);
    int in_fd = in_pipe[1], out_fd = out_pipe[0], err_fd = err_pipe[0];

    // 子进程可能不读 stdin，写入不能阻塞；进程需忽略 SIGPIPE
    fcntl(in_fd, F_SETFL, fcntl(in_fd, F_GETFL) | O_NONBLOCK);
    size_t written = 0;
    if (input.empty()) close_fd(in_fd);

    process_result result;
    auto deadline = timeout ? optional(chrono::steady_clock::now() + *timeout) : nullopt;
    char buffer[65536];

    while (out_fd >= 0 || err_fd >= 0) {
        pollfd fds[3];
        int nfds = 0;
        int out_idx = -1, err_idx = -1, in_idx = -1;
        if (out_fd >= 0) out_idx = nfds, fds[nfds++] = {out_fd, POLLIN, 0};
        if (err_fd >= 0) err_idx = nfds, fds[nfds++] = {err_fd, POLLIN, 0};
        if (in_fd >= 0) in_idx = nfds, fds[nfds++] = {in_fd, POLLOUT, 0};

        int wait_ms = -1;
        if (deadline) {
            auto remain = chrono::duration_cast<chrono::milliseconds>(*deadline - chrono::steady_clock::now()).count();
            if (remain <= 0) {
                result.timed_out = true;
                kill(pid, SIGKILL);
                break;
            }
            wait_ms = (int)min<long long>(remain, 100);
        }

        int ret = poll(fds, nfds, wait_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            close_fd(in_fd), close_fd(out_fd), close_fd(err_fd);
            throw system_error(err, system_category(), "poll");
        }
        if (ret == 0) continue;

        if (out_idx >= 0 && (fds[out_idx].revents & (POLLIN | POLLHUP | POLLERR))) {
            ssize_t n = read(out_fd, buffer, sizeof(buffer));
            if (n > 0)
                append_limited(result.out, buffer, n, output_limit, result.out_truncated);
            else if (n == 0 || errno != EINTR)
                close_fd(out_fd);
        }
        if (err_idx >= 0 && (fds[err_idx].revents & (POLLIN | POLLHUP | POLLERR))) {
            ssize_t n = read(err_fd, buffer, sizeof(buffer));
            if (n > 0)
                append_limited(result.err, buffer, n, output_limit, result.err_truncated);
            else if (n == 0 || errno != EINTR)
                close_fd(err_fd);
        }
        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLHUP | POLLERR))) {
            if (fds[in_idx].revents & (POLLHUP | POLLERR)) {
                close_fd(in_fd);
            } else {
                ssize_t n = write(in_fd, input.data() + written, input.size() - written);
                if (n > 0) written += n;
                if ((n < 0 && errno != EAGAIN && errno != EINTR) || written == input.size())
                    close_fd(in_fd);
            }
        }
    }

    close_fd(in_fd);
    close_fd(out_fd);
    close_fd(err_fd);

    int status;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) throw system_error(errno, system_category(), "waitpid");
    }
    if (WIFEXITED(status))
        result.exit_code = WEXITSTATUS(status);
    else
        result.exit_code = -1;
    return result;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::seconds() const {
    return duration<chrono::microseconds>().count() / 1e6;
}

string generate_uuid() {
    // random_generator 不是线程安全的
    static mutex generator_mutex;
    static boost::uuids::random_generator generator;
    lock_guard<mutex> guard(generator_mutex);
    return boost::lexical_cast<string>(generator());
}

static constexpr int64_t SECONDS_PER_DAY = 24 * 60 * 60;

int64_t day_of(chrono::system_clock::time_point time) {
    int64_t seconds = chrono::duration_cast<chrono::seconds>(time.time_since_epoch()).count();
    // 向下取整，1970 年以前的时间也能得到正确的日期
    return seconds >= 0 ? seconds / SECONDS_PER_DAY : -((-seconds + SECONDS_PER_DAY - 1) / SECONDS_PER_DAY);
}

chrono::system_clock::time_point start_of_day(int64_t day) {
    return chrono::system_clock::time_point(chrono::seconds(day * SECONDS_PER_DAY));
}

string format_date(int64_t day) {
    time_t t = (time_t)(day * SECONDS_PER_DAY);
    struct tm tm;
    gmtime_r(&t, &tm);
    return fmt::format("{:04}-{:02}-{:02}", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
}

int64_t parse_date(const string &date) {
    int year, month, day;
    char tail;
    if (sscanf(date.c_str(), "%4d-%2d-%2d%c", &year, &month, &day, &tail) != 3 ||
        month < 1 || month > 12 || day < 1 || day > 31)
        throw invalid_argument("Malformed date " + date + ", expected YYYY-MM-DD");
    struct tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    time_t t = timegm(&tm);
    if (format_date(t / SECONDS_PER_DAY) != fmt::format("{:04}-{:02}-{:02}", year, month, day))
        throw invalid_argument("Malformed date " + date + ", no such day");
    return t / SECONDS_PER_DAY;
}

int64_t to_millis(chrono::system_clock::time_point time) {
    return chrono::duration_cast<chrono::milliseconds>(time.time_since_epoch()).count();
}

chrono::system_clock::time_point from_millis(int64_t millis) {
    return chrono::system_clock::time_point(chrono::duration_cast<chrono::system_clock::duration>(chrono::milliseconds(millis)));
}

}  // namespace sandbox
