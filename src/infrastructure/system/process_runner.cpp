// EN: POSIX implementation of the process runner: pipes + poll loop, process-group termination.
// FR: Implémentation POSIX du lanceur de processus : pipes + boucle poll, terminaison par groupe.

#include "infrastructure/system/process_runner.hpp"
#include "infrastructure/logging/logger.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace CDP {

namespace {

void setNonBlocking(int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// EN: Drain a non-blocking fd; returns false once EOF is reached.
// FR: Vide un fd non bloquant ; retourne false une fois EOF atteint.
bool drain(int fd, std::string& buffer) {
    std::array<char, 4096> chunk{};
    while (true) {
        const ssize_t bytes = read(fd, chunk.data(), chunk.size());
        if (bytes > 0) {
            buffer.append(chunk.data(), static_cast<size_t>(bytes));
            continue;
        }
        if (bytes == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

struct Pipe {
    int read_end = -1;
    int write_end = -1;
    
    bool open() {
        int fds[2] = {-1, -1};
        if (pipe(fds) != 0) {
            return false;
        }
        read_end = fds[0];
        write_end = fds[1];
        return true;
    }
    
    void closeBoth() {
        closeFd(read_end);
        closeFd(write_end);
    }
};

// EN: argv and envp prepared before fork; the child only calls async-signal-safe functions.
// FR: argv et envp préparés avant fork ; l'enfant n'appelle que des fonctions async-signal-safe.
class ExecImage {
public:
    explicit ExecImage(const ProcessSpec& spec) : strings_(spec.argv) {
        for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
            const std::string variable(*entry);
            const auto eq = variable.find('=');
            if (eq != std::string::npos && spec.environment.count(variable.substr(0, eq)) > 0) {
                continue;
            }
            strings_.push_back(variable);
        }
        for (const auto& [key, value] : spec.environment) {
            strings_.push_back(key + "=" + value);
        }
        
        const size_t argc = spec.argv.size();
        for (size_t i = 0; i < strings_.size(); ++i) {
            auto& target = i < argc ? argv_ : envp_;
            target.push_back(const_cast<char*>(strings_[i].c_str()));
        }
        argv_.push_back(nullptr);
        envp_.push_back(nullptr);
    }
    
    char* const* argv() const { return argv_.data(); }
    char* const* envp() const { return envp_.data(); }

private:
    std::vector<std::string> strings_;
    std::vector<char*> argv_;
    std::vector<char*> envp_;
};

[[noreturn]] void execChild(const ExecImage& image, const char* working_directory, Pipe& in, Pipe& out, Pipe& err) {
    // EN: Own process group so the whole tree can be terminated on timeout.
    // FR: Groupe de processus propre pour terminer tout l'arbre sur timeout.
    (void)setpgid(0, 0);
    
    (void)dup2(in.read_end, STDIN_FILENO);
    (void)dup2(out.write_end, STDOUT_FILENO);
    (void)dup2(err.write_end, STDERR_FILENO);
    in.closeBoth();
    out.closeBoth();
    err.closeBoth();
    
    if (working_directory != nullptr && chdir(working_directory) != 0) {
        _exit(126);
    }
    execvpe(image.argv()[0], image.argv(), image.envp());
    _exit(127);
}

// EN: Writes stdin data with SIGPIPE blocked on this thread; a child closing its stdin early yields EPIPE.
// FR: Écrit les données stdin avec SIGPIPE bloqué sur ce thread ; un enfant fermant stdin tôt donne EPIPE.
void writeStdin(int fd, const std::string& data) {
    sigset_t sigpipe_set;
    sigset_t previous_mask;
    sigemptyset(&sigpipe_set);
    sigaddset(&sigpipe_set, SIGPIPE);
    (void)pthread_sigmask(SIG_BLOCK, &sigpipe_set, &previous_mask);
    
    bool broken_pipe = false;
    size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            broken_pipe = errno == EPIPE;
            break;
        }
        written += static_cast<size_t>(n);
    }
    
    // EN: Consume the SIGPIPE raised by this write so it is not delivered once unblocked.
    // FR: Consomme le SIGPIPE levé par cette écriture pour qu'il ne soit pas délivré au déblocage.
    if (broken_pipe && !sigismember(&previous_mask, SIGPIPE)) {
        const struct timespec no_wait{0, 0};
        (void)sigtimedwait(&sigpipe_set, nullptr, &no_wait);
    }
    (void)pthread_sigmask(SIG_SETMASK, &previous_mask, nullptr);
}

} // namespace

std::string ProcessResult::combinedOutput() const {
    if (stderr_text.empty()) {
        return stdout_text;
    }
    if (stdout_text.empty()) {
        return stderr_text;
    }
    std::string combined = stdout_text;
    if (combined.back() != '\n') {
        combined.push_back('\n');
    }
    return combined + stderr_text;
}

std::string joinCommandLine(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) {
            out.push_back(' ');
        }
        if (arg.find_first_of(" \t\"'") != std::string::npos) {
            out += "'" + arg + "'";
        } else {
            out += arg;
        }
    }
    return out;
}

ProcessResult PosixProcessRunner::run(const ProcessSpec& spec, const CancellationToken* token) {
    ProcessResult result;
    if (spec.argv.empty()) {
        result.exit_code = 127;
        result.stderr_text = "empty command";
        return result;
    }
    
    Pipe in, out, err;
    if (!in.open() || !out.open() || !err.open()) {
        in.closeBoth();
        out.closeBoth();
        err.closeBoth();
        result.exit_code = 127;
        result.stderr_text = "failed to create pipes";
        return result;
    }
    
    const ExecImage image(spec);
    const char* working_directory = spec.working_directory.empty() ? nullptr : spec.working_directory.c_str();
    
    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        in.closeBoth();
        out.closeBoth();
        err.closeBoth();
        result.exit_code = 127;
        result.stderr_text = "failed to fork";
        return result;
    }
    if (pid == 0) {
        execChild(image, working_directory, in, out, err);
    }
    
    (void)setpgid(pid, pid);
    closeFd(in.read_end);
    closeFd(out.write_end);
    closeFd(err.write_end);
    setNonBlocking(out.read_end);
    setNonBlocking(err.read_end);
    
    // EN: Feed stdin up front; secrets given this way never appear in argv.
    // FR: Alimente stdin d'emblée ; les secrets passés ainsi n'apparaissent jamais dans argv.
    if (spec.stdin_data && !spec.stdin_data->empty()) {
        writeStdin(in.write_end, *spec.stdin_data);
    }
    closeFd(in.write_end);
    
    int status = 0;
    bool exited = false;
    std::optional<std::chrono::steady_clock::time_point> term_sent_at;
    
    while (!exited) {
        // EN: Closed fds become -1, which poll ignores; a hung-up pipe must not wake the loop.
        // FR: Les fd fermés valent -1, ignorés par poll ; un pipe raccroché ne doit pas réveiller la boucle.
        if (out.read_end >= 0 && !drain(out.read_end, result.stdout_text)) closeFd(out.read_end);
        if (err.read_end >= 0 && !drain(err.read_end, result.stderr_text)) closeFd(err.read_end);
        
        const pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            exited = true;
            break;
        }
        
        const auto now = std::chrono::steady_clock::now();
        if (!term_sent_at) {
            const bool timed_out = spec.timeout.count() > 0 && now - started > spec.timeout;
            const bool cancelled = token != nullptr && token->isCancelled();
            if (timed_out || cancelled) {
                result.timed_out = timed_out;
                result.cancelled = cancelled && !timed_out;
                (void)kill(-pid, SIGTERM);
                term_sent_at = now;
                LOG_WARN("process", std::string(timed_out ? "Timeout" : "Cancellation") +
                         ", terminating: " + joinCommandLine(spec.argv));
            }
        } else if (now - *term_sent_at > spec.kill_grace) {
            (void)kill(-pid, SIGKILL);
        }
        
        struct pollfd poll_fds[2] = {
            {out.read_end, POLLIN, 0},
            {err.read_end, POLLIN, 0},
        };
        (void)poll(poll_fds, 2, 50);
    }
    
    if (out.read_end >= 0) (void)drain(out.read_end, result.stdout_text);
    if (err.read_end >= 0) (void)drain(err.read_end, result.stderr_text);
    closeFd(out.read_end);
    closeFd(err.read_end);
    
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
        result.exit_code = 128 + result.term_signal;
    }
    return result;
}

} // namespace CDP
