// ==============================================================================
// git.cpp - Взаимодействие с git
// ==============================================================================
//
// Дочерний процесс: fork + execvp, stdout/stderr через pipe, чтение через
// poll (без взаимоблокировки при заполнении одного из каналов).
// Ошибка execvp передаётся родителю через отдельный pipe с O_CLOEXEC.
//
// ==============================================================================

#include "lfstrack/git.hpp"

#include "lfstrack/platform.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace lfstrack::git {

namespace {

// ----------------------------------------------------------------------------
// Fd - владелец файлового дескриптора
// ----------------------------------------------------------------------------

class Fd {
public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() { reset(); }

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    int get() const { return fd_; }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

std::string errno_message(int err) {
    return std::error_code(err, std::generic_category()).message();
}

/// Создать пару дескрипторов
void make_pipe(Fd& read_end, Fd& write_end, int flags) {
    int fds[2];
    if (::pipe2(fds, flags) != 0) {
        throw Error("failed to create pipe - " + errno_message(errno));
    }
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
}

/// Убрать завершающие пробельные символы
std::string trim_right(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' ||
                          s.back() == '\t')) {
        s.pop_back();
    }
    return s;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && (s[start] == ' ' || s[start] == '\t' || s[start] == '\r')) {
        ++start;
    }
    return trim_right(s.substr(start));
}

}  // namespace

// ----------------------------------------------------------------------------
// run
// ----------------------------------------------------------------------------

CommandResult run(const std::string& program, const std::vector<std::string>& args,
                  const std::filesystem::path& cwd) {
    Fd out_r, out_w, err_r, err_w, exec_r, exec_w;
    make_pipe(out_r, out_w, 0);
    make_pipe(err_r, err_w, 0);
    make_pipe(exec_r, exec_w, O_CLOEXEC);

    // argv готовится до fork
    std::vector<std::string> storage;
    storage.reserve(args.size() + 1);
    storage.push_back(program);
    storage.insert(storage.end(), args.begin(), args.end());

    std::vector<char*> argv;
    for (auto& s : storage) {
        argv.push_back(s.data());
    }
    argv.push_back(nullptr);

    std::string cwd_str = platform::path_to_utf8(cwd);

    pid_t pid = ::fork();
    if (pid == -1) {
        throw Error("failed to fork - " + errno_message(errno));
    }

    if (pid == 0) {
        // Дочерний процесс: только async-signal-safe вызовы
        ::dup2(out_w.get(), STDOUT_FILENO);
        ::dup2(err_w.get(), STDERR_FILENO);
        ::close(out_r.get());
        ::close(err_r.get());
        ::close(exec_r.get());
        ::close(out_w.get());
        ::close(err_w.get());

        int err = 0;
        if (!cwd_str.empty() && ::chdir(cwd_str.c_str()) != 0) {
            err = errno;
        } else {
            ::execvp(argv[0], argv.data());
            err = errno;
        }
        ssize_t written = ::write(exec_w.get(), &err, sizeof(err));
        (void)written;
        ::_exit(127);
    }

    out_w.reset();
    err_w.reset();
    exec_w.reset();

    // Ошибка chdir/execvp в дочернем процессе
    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(exec_r.get(), &exec_errno, sizeof(exec_errno));
    } while (n == -1 && errno == EINTR);
    bool exec_failed = (n == static_cast<ssize_t>(sizeof(exec_errno)));

    CommandResult result;
    if (!exec_failed) {
        pollfd fds[2] = {{out_r.get(), POLLIN, 0}, {err_r.get(), POLLIN, 0}};
        std::string* sinks[2] = {&result.out, &result.err};
        int open_count = 2;
        char buf[4096];

        while (open_count > 0) {
            int rc = ::poll(fds, 2, -1);
            if (rc == -1) {
                if (errno == EINTR) {
                    continue;
                }
                break;
            }
            for (int i = 0; i < 2; ++i) {
                if (fds[i].fd < 0 || fds[i].revents == 0) {
                    continue;
                }
                ssize_t got = ::read(fds[i].fd, buf, sizeof(buf));
                if (got > 0) {
                    sinks[i]->append(buf, static_cast<size_t>(got));
                } else if (got == 0 || errno != EINTR) {
                    fds[i].fd = -1;
                    --open_count;
                }
            }
        }
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw Error("failed to wait for " + program + " - " + errno_message(errno));
        }
    }

    if (exec_failed) {
        throw Error("failed to execute " + program + " - " + errno_message(exec_errno));
    }

    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}

// ----------------------------------------------------------------------------
// Версия
// ----------------------------------------------------------------------------

namespace {

/// Числовые компоненты до первого нечислового: "2.37.1 (Apple)" -> {2, 37, 1}
std::vector<unsigned long> version_numbers(const std::string& text) {
    std::vector<unsigned long> numbers;
    size_t pos = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        unsigned long value = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            value = value * 10 + static_cast<unsigned long>(text[pos] - '0');
            ++pos;
        }
        numbers.push_back(value);
        if (pos >= text.size() || text[pos] != '.') {
            break;
        }
        ++pos;
    }
    return numbers;
}

}  // namespace

std::string version(const std::string& program, const std::filesystem::path& cwd) {
    CommandResult r = run(program, {"version"}, cwd);
    if (!r.ok()) {
        throw Error("Error getting git version: " + trim_right(r.err));
    }
    std::string text = trim_right(r.out);
    constexpr const char* prefix = "git version ";
    if (text.compare(0, std::strlen(prefix), prefix) == 0) {
        text.erase(0, std::strlen(prefix));
    }
    return text;
}

bool version_at_least(const std::string& actual, const std::string& minimum) {
    std::vector<unsigned long> have = version_numbers(actual);
    std::vector<unsigned long> want = version_numbers(minimum);
    if (have.empty()) {
        return false;
    }
    size_t n = std::max(have.size(), want.size());
    have.resize(n, 0);
    want.resize(n, 0);
    return have >= want;
}

// ----------------------------------------------------------------------------
// Окружение
// ----------------------------------------------------------------------------

std::optional<std::filesystem::path> locate_work_tree(const std::string& program,
                                                      const std::filesystem::path& cwd) {
    CommandResult r = run(program, {"rev-parse", "--show-toplevel"}, cwd);
    if (!r.ok()) {
        return std::nullopt;
    }
    std::string top = trim_right(r.out);
    if (top.empty()) {
        return std::nullopt;
    }
    return platform::path_from_utf8(top);
}

std::optional<std::filesystem::path> locate_git_dir(const std::string& program,
                                                    const std::filesystem::path& cwd) {
    CommandResult r = run(program, {"rev-parse", "--git-dir"}, cwd);
    if (!r.ok()) {
        return std::nullopt;
    }
    std::string dir = trim_right(r.out);
    if (dir.empty()) {
        return std::nullopt;
    }
    std::filesystem::path p = platform::path_from_utf8(dir);
    if (p.is_relative()) {
        p = cwd / p;
    }
    return p.lexically_normal();
}

// ----------------------------------------------------------------------------
// GitRepository
// ----------------------------------------------------------------------------

GitRepository::GitRepository(std::string program, std::filesystem::path cwd)
    : program_(std::move(program)), cwd_(std::move(cwd)) {}

std::vector<std::string> GitRepository::tracked_files(const std::string& pattern) {
    std::string safe = sanitize_pattern(pattern);
    bool root_wildcard = safe.size() < pattern.size() && safe.find('*') != std::string::npos;

    CommandResult r = run(program_,
                          {"-c", "core.quotepath=false", "ls-files", "--cached", "--", safe},
                          cwd_);
    if (!r.ok()) {
        std::string reason = trim(r.err);
        if (reason.empty()) {
            reason = "git ls-files exited with status " + std::to_string(r.exit_code);
        }
        throw Error(reason);
    }

    return parse_ls_files(r.out, root_wildcard);
}

std::string sanitize_pattern(const std::string& pattern) {
    size_t start = 0;
    while (start < pattern.size() && pattern[start] == '/') {
        ++start;
    }
    return pattern.substr(start);
}

std::vector<std::string> parse_ls_files(const std::string& output, bool root_wildcard) {
    std::vector<std::string> files;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        if (root_wildcard && line.find('/') != std::string::npos) {
            continue;
        }
        files.push_back(line);
    }
    return files;
}

// ----------------------------------------------------------------------------
// Хуки
// ----------------------------------------------------------------------------

const char* const PRE_PUSH_HOOK =
    "#!/bin/sh\n"
    "command -v git-lfs >/dev/null 2>&1 || { echo >&2 \"\\nThis repository is configured for "
    "Git LFS but 'git-lfs' was not found on your path. If you no longer wish to use Git LFS, "
    "remove this hook by deleting .git/hooks/pre-push.\\n\"; exit 2; }\n"
    "git lfs pre-push \"$@\"\n";

HookResult install_hooks(const std::filesystem::path& git_dir, bool force) {
    HookResult result;
    std::filesystem::path hooks_dir = git_dir / "hooks";
    result.path = hooks_dir / "pre-push";

    std::error_code ec;
    std::filesystem::create_directories(hooks_dir, ec);
    if (ec) {
        result.message = "failed to create " + platform::path_to_utf8(hooks_dir) + " - " +
                         ec.message();
        return result;
    }

    if (std::filesystem::exists(result.path, ec)) {
        std::ifstream in(result.path, std::ios::binary);
        std::ostringstream current;
        if (in) {
            current << in.rdbuf();
        }
        if (current.str() == PRE_PUSH_HOOK) {
            result.installed = true;
            return result;
        }
        if (!force) {
            result.conflict = true;
            result.message = "Hook already exists: pre-push";
            return result;
        }
    }

    std::ofstream out(result.path, std::ios::binary | std::ios::trunc);
    out << PRE_PUSH_HOOK;
    out.close();
    if (!out) {
        result.message = "failed to write " + platform::path_to_utf8(result.path);
        return result;
    }

    std::filesystem::permissions(result.path,
                                 std::filesystem::perms::owner_all |
                                     std::filesystem::perms::group_read |
                                     std::filesystem::perms::group_exec |
                                     std::filesystem::perms::others_read |
                                     std::filesystem::perms::others_exec,
                                 ec);
    if (ec) {
        result.message = "failed to make " + platform::path_to_utf8(result.path) +
                         " executable - " + ec.message();
        return result;
    }

    result.installed = true;
    return result;
}

}  // namespace lfstrack::git
