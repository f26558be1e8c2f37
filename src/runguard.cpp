#include "runguard.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <string.h>
#include <sys/select.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <system_error>
#include "common/defer.hpp"
#include "common/utils.hpp"

extern char **environ;

namespace localjudge {
using namespace std;

const long KILL_DELAY_US = 100000;  // 0.1s

// 有管道可读写时 select 最多等待这么久，子进程退出时管道会读到 EOF 从而立刻唤醒；
// 但子进程的子进程可能还持有管道，因此仍需要定期检查子进程是否已经退出
const long PIPE_POLL_US = 100000;

// 没有任何管道可读写时（比如子进程关闭了 stdout/stderr 但还在运行），检查子进程状态的间隔
const long IDLE_POLL_US = 5000;

const int BUF_SIZE = 65536;

const int PIPE_READ = 0;
const int PIPE_WRITE = 1;

// 评测进程因这些信号终止时，需要先杀死正在运行的子进程
static const int TERMINATE_SIGNALS[] = {SIGTERM, SIGINT, SIGHUP};

// 正在运行的子进程，评测进程同一时间只运行一个子进程
static volatile sig_atomic_t running_child = 0;
static struct sigaction saved_actions[NSIG];

template <typename... Args>
static void error(int err, const char *format, const Args &... args) {
    throw system_error(err, system_category(), fmt::vformat(format, fmt::make_format_args(args...)));
}

static void close_fd(int &fd) {
    if (fd < 0) return;
    int ret = close(fd);
    fd = -1;
    if (ret != 0) error(errno, "closing fd");
}

static void close_fd_quietly(int &fd) {
    if (fd < 0) return;
    if (close(fd) != 0) PLOG(WARNING) << "closing fd " << fd;
    fd = -1;
}

static void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1) error(errno, "fcntl, getting flags");
    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) error(errno, "fcntl, setting flags");
}

static struct timeval to_timeval(long us) {
    struct timeval tv;
    tv.tv_sec = us / 1000000;
    tv.tv_usec = us % 1000000;
    return tv;
}

/**
 * @brief 评测进程收到终止信号时杀死子进程所在的进程组
 * 之后恢复原来的信号处理方式并重新发送该信号，信号在处理函数返回后才会送达
 */
static void terminate_child(int sig) {
    int saved_errno = errno;
    pid_t pid = running_child;
    if (pid > 0) kill(-pid, SIGKILL);
    sigaction(sig, &saved_actions[sig], nullptr);
    raise(sig);
    errno = saved_errno;
}

static void report_child_error(int errfd) {
    int err = errno;
    if (write(errfd, &err, sizeof(err)) != (ssize_t)sizeof(err))
        _exit(126);
    _exit(127);
}

/**
 * @brief fork 之后在子进程中执行，不会返回
 * 只调用 async-signal-safe 的函数，需要的参数和环境变量都在 fork 之前准备好
 */
static void exec_child(int pipefd[3][2], int errfd, const char *work_dir, char **args, char **envp, const sigset_t *sigmask) {
    // 将子进程分离到一个独立的进程组，超时时连同选手程序创建的子进程一起杀死
    setpgid(0, 0);

    // fork 前屏蔽了终止信号，信号屏蔽字在 exec 之后仍然保留
    sigprocmask(SIG_SETMASK, sigmask, nullptr);

    // 父进程忽略了 SIGPIPE，而被忽略的信号在 exec 之后仍然被忽略，这里恢复默认行为
    signal(SIGPIPE, SIG_DFL);

    // 所有管道都带有 O_CLOEXEC，exec 时自动关闭，dup2 得到的 0/1/2 不受影响
    if (dup2(pipefd[STDIN_FILENO][PIPE_READ], STDIN_FILENO) < 0 ||
        dup2(pipefd[STDOUT_FILENO][PIPE_WRITE], STDOUT_FILENO) < 0 ||
        dup2(pipefd[STDERR_FILENO][PIPE_WRITE], STDERR_FILENO) < 0)
        report_child_error(errfd);

    if (work_dir && chdir(work_dir) != 0)
        report_child_error(errfd);

    environ = envp;
    execvp(args[0], args);
    report_child_error(errfd);
}

static int prepare_fds(int pipefd[3][2], fd_set *readfds, fd_set *writefds) {
    FD_ZERO(readfds);
    FD_ZERO(writefds);
    int nfds = -1;
    if (pipefd[STDIN_FILENO][PIPE_WRITE] >= 0) {
        FD_SET(pipefd[STDIN_FILENO][PIPE_WRITE], writefds);
        nfds = max(nfds, pipefd[STDIN_FILENO][PIPE_WRITE]);
    }
    for (int i = 1; i <= 2; i++) {
        if (pipefd[i][PIPE_READ] >= 0) {
            FD_SET(pipefd[i][PIPE_READ], readfds);
            nfds = max(nfds, pipefd[i][PIPE_READ]);
        }
    }
    return nfds;
}

static void pump_input(int &fd, fd_set *writefds, const string &input, size_t &written) {
    if (fd < 0 || !FD_ISSET(fd, writefds)) return;

    size_t to_write = min((size_t)BUF_SIZE, input.size() - written);
    ssize_t nwritten = write(fd, input.data() + written, to_write);
    if (nwritten == -1) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return;
        if (errno == EPIPE) {
            // 子进程不再读取 stdin，剩下的输入数据直接丢弃
            close_fd(fd);
            return;
        }
        error(errno, "writing data to child stdin");
    }

    written += nwritten;
    if (written == input.size()) close_fd(fd);
}

static void pump_pipes(int pipefd[3][2], fd_set *readfds, string *buffers[3]) {
    char buf[BUF_SIZE];

    /* Check to see if data is available and pass it on */
    for (int i = 1; i <= 2; i++) {
        int &fd = pipefd[i][PIPE_READ];
        if (fd < 0 || !FD_ISSET(fd, readfds)) continue;

        ssize_t nread = read(fd, buf, BUF_SIZE);
        if (nread == -1) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            error(errno, "copying data fd {}", i);
        }
        if (nread == 0) {
            /* EOF detected: close fd and indicate this with -1 */
            close_fd(fd);
            continue;
        }
        buffers[i]->append(buf, nread);
    }
}

/**
 * @brief 进程组被杀死后，读完管道里剩余的输出
 * 如果有进程脱离了进程组并继续持有管道，等待 KILL_DELAY_US 没有新数据后放弃
 */
static void drain_pipes(int pipefd[3][2], string *buffers[3]) {
    close_fd(pipefd[STDIN_FILENO][PIPE_WRITE]);

    while (true) {
        fd_set readfds, writefds;
        int nfds = prepare_fds(pipefd, &readfds, &writefds);
        if (nfds < 0) break;

        struct timeval timeout = to_timeval(KILL_DELAY_US);
        int r = select(nfds + 1, &readfds, nullptr, nullptr, &timeout);
        if (r == -1) {
            if (errno == EINTR) continue;
            error(errno, "waiting for child data");
        }
        if (r == 0) {
            LOG(WARNING) << "output pipes are still held by processes outside the process group";
            break;
        }
        pump_pipes(pipefd, &readfds, buffers);
    }
}

runguard_result runit(const runguard_options &opt) {
    if (opt.command.empty()) error(EINVAL, "no command to run");

    // 在 fork 之前准备好参数和环境变量，子进程中不再分配内存
    vector<string> command = opt.command;
    vector<char *> args;
    for (auto &arg : command) args.push_back(arg.data());
    args.push_back(nullptr);

    vector<string> environment = make_environment(opt.env);
    vector<char *> envp;
    for (auto &entry : environment) envp.push_back(entry.data());
    envp.push_back(nullptr);

    string work_dir = opt.work_dir.string();

    int pipefd[3][2] = {{-1, -1}, {-1, -1}, {-1, -1}};
    int errpipe[2] = {-1, -1};
    defer {
        for (auto &fds : pipefd)
            for (int &fd : fds) close_fd_quietly(fd);
        for (int &fd : errpipe) close_fd_quietly(fd);
    };

    for (int i = 0; i < 3; i++) {
        if (pipe2(pipefd[i], O_CLOEXEC) != 0) error(errno, "creating pipe for fd {}", i);
    }
    if (pipe2(errpipe, O_CLOEXEC) != 0) error(errno, "creating pipe for exec status");

    // 子进程提前关闭 stdin 时写入会产生 SIGPIPE，这里忽略 SIGPIPE，改为处理 EPIPE
    struct sigaction sigact, old_sigact;
    memset(&sigact, 0, sizeof(sigact));
    sigact.sa_handler = SIG_IGN;
    if (sigemptyset(&sigact.sa_mask) != 0) error(errno, "creating empty signal mask");
    if (sigaction(SIGPIPE, &sigact, &old_sigact) != 0) error(errno, "installing signal handler");
    defer {
        if (sigaction(SIGPIPE, &old_sigact, nullptr) != 0)
            PLOG(WARNING) << "could not restore signal handler";
    };

    // 子进程在独立的进程组中，不会收到终端发给评测进程的 SIGINT，
    // 评测进程被终止时由 terminate_child 杀死子进程，被忽略的信号（比如 nohup）保持忽略
    sigset_t terminate_mask, old_mask;
    if (sigemptyset(&terminate_mask) != 0) error(errno, "creating empty signal mask");
    for (int sig : TERMINATE_SIGNALS)
        if (sigaddset(&terminate_mask, sig) != 0) error(errno, "setting signal mask");

    struct sigaction terminate_act;
    memset(&terminate_act, 0, sizeof(terminate_act));
    terminate_act.sa_handler = terminate_child;
    terminate_act.sa_mask = terminate_mask;
    terminate_act.sa_flags = SA_RESTART;

    vector<int> installed_signals;
    defer {
        running_child = 0;
        for (int sig : installed_signals)
            if (sigaction(sig, &saved_actions[sig], nullptr) != 0)
                PLOG(WARNING) << "could not restore handler of signal " << sig;
    };
    for (int sig : TERMINATE_SIGNALS) {
        if (sigaction(sig, nullptr, &saved_actions[sig]) != 0) error(errno, "querying signal handler");
        if (!(saved_actions[sig].sa_flags & SA_SIGINFO) && saved_actions[sig].sa_handler == SIG_IGN) continue;
        if (sigaction(sig, &terminate_act, nullptr) != 0) error(errno, "installing signal handler");
        installed_signals.push_back(sig);
    }

    LOG(INFO) << "starting command " << opt.command[0];

    // fork 到记录 running_child 之间屏蔽终止信号，避免子进程在此期间成为孤儿进程
    if (sigprocmask(SIG_BLOCK, &terminate_mask, &old_mask) != 0) error(errno, "blocking signals");
    bool masked = true;
    defer {
        if (masked && sigprocmask(SIG_SETMASK, &old_mask, nullptr) != 0)
            PLOG(WARNING) << "could not restore signal mask";
    };

    elapsed_time timer;
    pid_t child_pid = fork();
    if (child_pid == -1) error(errno, "unable to fork");
    if (child_pid == 0) {
        exec_child(pipefd, errpipe[PIPE_WRITE], work_dir.empty() ? nullptr : work_dir.c_str(), args.data(), envp.data(), &old_mask);
    }
    running_child = child_pid;

    // 子进程可能还没来得及调用 setpgid，父进程也设置一次，保证之后 kill(-pid) 一定有效
    if (setpgid(child_pid, child_pid) != 0 && errno != EACCES && errno != ESRCH)
        PLOG(WARNING) << "setting process group of child " << child_pid;

    bool reaped = false;
    defer {
        if (reaped) return;
        /* Make sure that all children are killed before leaving */
        if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
            PLOG(ERROR) << "unable to send SIGKILL to children";
        running_child = 0;
        if (waitpid(child_pid, nullptr, 0) < 0)
            PLOG(ERROR) << "unable to reap child " << child_pid;
    };

    masked = false;
    if (sigprocmask(SIG_SETMASK, &old_mask, nullptr) != 0) error(errno, "unblocking signals");

    close_fd(pipefd[STDIN_FILENO][PIPE_READ]);
    close_fd(pipefd[STDOUT_FILENO][PIPE_WRITE]);
    close_fd(pipefd[STDERR_FILENO][PIPE_WRITE]);
    close_fd(errpipe[PIPE_WRITE]);

    // exec 成功时 errpipe 因 O_CLOEXEC 被关闭，读到 EOF；失败时读到子进程的 errno
    int exec_errno = 0;
    ssize_t nread;
    do {
        nread = read(errpipe[PIPE_READ], &exec_errno, sizeof(exec_errno));
    } while (nread == -1 && errno == EINTR);
    if (nread == -1) error(errno, "reading exec status of command {}", opt.command[0]);
    if (nread > 0) error(exec_errno, "unable to start command {}", opt.command[0]);
    close_fd(errpipe[PIPE_READ]);

    runguard_result result;
    string *buffers[3] = {nullptr, &result.output, &result.error_output};
    size_t written = 0;

    if (opt.input.empty())
        close_fd(pipefd[STDIN_FILENO][PIPE_WRITE]);
    else
        set_nonblocking(pipefd[STDIN_FILENO][PIPE_WRITE]);
    set_nonblocking(pipefd[STDOUT_FILENO][PIPE_READ]);
    set_nonblocking(pipefd[STDERR_FILENO][PIPE_READ]);

    bool timed_out = false;
    while (true) {
        double remaining = opt.time_limit - timer.milliseconds();
        if (remaining <= 0) {
            timed_out = true;
            break;
        }

        // 只检查子进程是否退出而不回收：未回收的子进程会保留进程组，之后仍然可以杀死整个进程组
        siginfo_t info;
        memset(&info, 0, sizeof(info));
        if (waitid(P_PID, child_pid, &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
            if (errno == EINTR) continue;
            error(errno, "waiting on child");
        }
        if (info.si_pid == child_pid) break;

        fd_set readfds, writefds;
        int nfds = prepare_fds(pipefd, &readfds, &writefds);

        long timeout_us = min((long)(remaining * 1000) + 1, nfds >= 0 ? PIPE_POLL_US : IDLE_POLL_US);
        struct timeval timeout = to_timeval(timeout_us);
        int r = select(nfds + 1, &readfds, &writefds, nullptr, &timeout);
        if (r == -1) {
            if (errno == EINTR) continue;
            error(errno, "waiting for child data");
        }
        if (r > 0) {
            pump_input(pipefd[STDIN_FILENO][PIPE_WRITE], &writefds, opt.input, written);
            pump_pipes(pipefd, &readfds, buffers);
        }
    }
    result.wall_time = timer.milliseconds();

    if (timed_out) {
        LOG(WARNING) << fmt::format("timelimit exceeded (hard wall time {} ms): aborting command", opt.time_limit);
    }

    // 杀死进程组内所有的进程，确保选手程序创建的子进程不会在评测结束后留驻系统
    if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
        error(errno, "sending SIGKILL to command");
    running_child = 0;

    drain_pipes(pipefd, buffers);

    int status = 0;
    pid_t pid;
    do {
        pid = waitpid(child_pid, &status, 0);
    } while (pid == -1 && errno == EINTR);
    if (pid < 0) error(errno, "waiting on child");
    reaped = true;

    if (WIFEXITED(status)) {
        result.exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.exitcode = result.signal + 128;
        if (!timed_out)
            LOG(WARNING) << "Command terminated with signal (" << result.signal << ", " << strsignal(result.signal) << ")";
    } else {
        throw runtime_error(fmt::format("unknown status: {:x}", status));
    }

    if (timed_out || result.wall_time >= opt.time_limit)
        result.outcome = run_outcome::TIMED_OUT;
    else if (WIFEXITED(status) && result.exitcode == 0)
        result.outcome = run_outcome::COMPLETED;
    else
        result.outcome = run_outcome::CRASHED;

    LOG(INFO) << fmt::format("run time: real {:.3f} ms, exitcode {}", result.wall_time, result.exitcode);

    return result;
}

}  // namespace localjudge
