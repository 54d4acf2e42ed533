#include "io/process.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#ifdef _WIN32
#define NOMINMAX
#include <windows.h>
#else
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace droidpack::io {
namespace {

constexpr std::size_t kReadChunk = 16 * 1024;

constexpr const char *kInlinePassword = "pass:";
constexpr const char *kMaskedSecret = "****";

bool isPasswordFlag(const std::string &arg) {
    return arg == "--ks-pass" || arg == "--key-pass";
}

bool isDirectory(const std::filesystem::path &path) {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

#ifdef _WIN32

class OwnedHandle {
public:
    OwnedHandle() = default;
    explicit OwnedHandle(HANDLE handle) : handle_(handle) {}
    ~OwnedHandle() { reset(); }

    OwnedHandle(const OwnedHandle &) = delete;
    OwnedHandle &operator=(const OwnedHandle &) = delete;

    HANDLE get() const { return handle_; }
    HANDLE *out() { return &handle_; }

    void reset() {
        if (handle_ != nullptr && handle_ != INVALID_HANDLE_VALUE) {
            CloseHandle(handle_);
        }
        handle_ = nullptr;
    }

private:
    HANDLE handle_ = nullptr;
};

std::wstring widen(const std::string &text) {
    if (text.empty()) {
        return {};
    }
    const int count = MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, text.data(),
                                          static_cast<int>(text.size()), nullptr, 0);
    if (count <= 0) {
        return {};
    }
    std::wstring wide(static_cast<std::size_t>(count), L'\0');
    MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, text.data(), static_cast<int>(text.size()),
                        wide.data(), count);
    return wide;
}

int spawnAndCollect(const std::string &commandLine, const std::filesystem::path &cwd,
                    std::string &output, const droidpack::Context &ctx) {
    std::wstring wideLine = widen(commandLine);
    if (wideLine.empty()) {
        ctx.error("Command line is not valid UTF-8: ", commandLine);
        return -1;
    }
    const std::wstring wideCwd = cwd.empty() ? std::wstring() : cwd.wstring();

    SECURITY_ATTRIBUTES inherit{};
    inherit.nLength = sizeof(inherit);
    inherit.bInheritHandle = TRUE;

    OwnedHandle readEnd;
    OwnedHandle writeEnd;
    if (!CreatePipe(readEnd.out(), writeEnd.out(), &inherit, 0)) {
        ctx.error("CreatePipe failed with error ", static_cast<unsigned long>(GetLastError()));
        return -1;
    }
    SetHandleInformation(readEnd.get(), HANDLE_FLAG_INHERIT, 0);

    STARTUPINFOW startup{};
    startup.cb = sizeof(startup);
    startup.dwFlags = STARTF_USESTDHANDLES;
    startup.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
    startup.hStdOutput = writeEnd.get();
    startup.hStdError = writeEnd.get();

    PROCESS_INFORMATION info{};
    const BOOL started = CreateProcessW(nullptr, wideLine.data(), nullptr, nullptr, TRUE, CREATE_NO_WINDOW,
                                        nullptr, wideCwd.empty() ? nullptr : wideCwd.c_str(), &startup, &info);
    writeEnd.reset();
    if (!started) {
        ctx.error("CreateProcess failed with error ", static_cast<unsigned long>(GetLastError()));
        return -1;
    }
    OwnedHandle process(info.hProcess);
    OwnedHandle thread(info.hThread);

    std::vector<char> chunk(kReadChunk);
    DWORD got = 0;
    while (ReadFile(readEnd.get(), chunk.data(), static_cast<DWORD>(chunk.size()), &got, nullptr) && got > 0) {
        output.append(chunk.data(), got);
    }

    WaitForSingleObject(process.get(), INFINITE);
    DWORD exitCode = 0;
    if (!GetExitCodeProcess(process.get(), &exitCode)) {
        ctx.error("GetExitCodeProcess failed with error ", static_cast<unsigned long>(GetLastError()));
        return -1;
    }
    return static_cast<int>(exitCode);
}

#else

class OwnedFd {
public:
    OwnedFd() = default;
    explicit OwnedFd(int fd) : fd_(fd) {}
    ~OwnedFd() { reset(); }

    OwnedFd(const OwnedFd &) = delete;
    OwnedFd &operator=(const OwnedFd &) = delete;

    int get() const { return fd_; }

    void adopt(int fd) {
        reset();
        fd_ = fd;
    }

    void reset() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = -1;
    }

private:
    int fd_ = -1;
};

// Both ends close-on-exec: placement workers fork while other pipes are open.
bool openPipe(OwnedFd &readEnd, OwnedFd &writeEnd) {
    int fds[2];
#ifdef __linux__
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
#else
    if (::pipe(fds) != 0) {
        return false;
    }
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
#endif
    readEnd.adopt(fds[0]);
    writeEnd.adopt(fds[1]);
    return true;
}

void drainInto(int fd, std::string &output) {
    std::vector<char> chunk(kReadChunk);
    for (;;) {
        const ssize_t got = ::read(fd, chunk.data(), chunk.size());
        if (got > 0) {
            output.append(chunk.data(), static_cast<std::size_t>(got));
        } else if (got < 0 && errno == EINTR) {
            continue;
        } else {
            return;
        }
    }
}

int decodeStatus(int status, const droidpack::Context &ctx) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        ctx.warn("Child killed by signal ", WTERMSIG(status));
        return 128 + WTERMSIG(status);
    }
    ctx.error("Child ended with unexpected status ", status);
    return -1;
}

int spawnAndCollect(const std::string &command, const std::vector<std::string> &args,
                    const std::filesystem::path &cwd, std::string &output, const droidpack::Context &ctx) {
    // argv is built before fork; the child only calls async-signal-safe functions.
    std::vector<std::string> words;
    words.reserve(args.size() + 1);
    words.push_back(command);
    words.insert(words.end(), args.begin(), args.end());
    std::vector<char *> argv;
    argv.reserve(words.size() + 1);
    for (auto &word : words) {
        argv.push_back(word.data());
    }
    argv.push_back(nullptr);

    OwnedFd readEnd;
    OwnedFd writeEnd;
    if (!openPipe(readEnd, writeEnd)) {
        ctx.error("pipe failed: ", std::strerror(errno));
        return -1;
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        ctx.error("fork failed: ", std::strerror(errno));
        return -1;
    }
    if (pid == 0) {
        ::dup2(writeEnd.get(), STDOUT_FILENO);
        ::dup2(writeEnd.get(), STDERR_FILENO);
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            ::_exit(127);
        }
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    writeEnd.reset();
    drainInto(readEnd.get(), output);

    int status = 0;
    pid_t waited = 0;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);
    if (waited < 0) {
        ctx.error("waitpid failed: ", std::strerror(errno));
        return -1;
    }
    return decodeStatus(status, ctx);
}

bool isShellSafe(char ch) {
    if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9')) {
        return true;
    }
    switch (ch) {
    case '_': case '-': case '.': case '/': case ':': case ',': case '+': case '=': case '@': case '%':
        return true;
    default:
        return false;
    }
}

#endif

} // namespace

std::string shellQuote(const std::string &value) {
#ifdef _WIN32
    // CommandLineToArgvW rules: backslashes are literal unless they precede a quote.
    if (!value.empty() && value.find_first_of(" \t\"") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    std::size_t pendingSlashes = 0;
    for (char ch : value) {
        if (ch == '\\') {
            ++pendingSlashes;
            continue;
        }
        if (ch == '"') {
            quoted.append(pendingSlashes * 2 + 1, '\\');
        } else {
            quoted.append(pendingSlashes, '\\');
        }
        pendingSlashes = 0;
        quoted.push_back(ch);
    }
    quoted.append(pendingSlashes * 2, '\\');
    quoted.push_back('"');
    return quoted;
#else
    if (!value.empty()) {
        bool safe = true;
        for (char ch : value) {
            safe = safe && isShellSafe(ch);
        }
        if (safe) {
            return value;
        }
    }
    std::string quoted = "'";
    for (char ch : value) {
        quoted += (ch == '\'') ? std::string("'\"'\"'") : std::string(1, ch);
    }
    quoted.push_back('\'');
    return quoted;
#endif
}

std::string displayCommand(const std::string &command, const std::vector<std::string> &args) {
    std::ostringstream line;
    line << shellQuote(command);
    for (std::size_t i = 0; i < args.size(); ++i) {
        const bool secret = i > 0 && isPasswordFlag(args[i - 1]) && args[i].rfind(kInlinePassword, 0) == 0;
        if (secret) {
            line << ' ' << kInlinePassword << kMaskedSecret;
        } else {
            line << ' ' << shellQuote(args[i]);
        }
    }
    return line.str();
}

ProcessResult runCommand(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const droidpack::Context &ctx,
    bool dryRun
) {
    ProcessResult result;
    result.commandLine = displayCommand(command, args);
    ctx.log(cwd.empty() ? std::string() : "[" + cwd.string() + "] ", result.commandLine);

    if (dryRun) {
        result.code = 0;
        return result;
    }
    if (!cwd.empty() && !isDirectory(cwd)) {
        ctx.error("Working directory does not exist: ", cwd.string());
        return result;
    }

#ifdef _WIN32
    result.code = spawnAndCollect(result.commandLine, cwd, result.output, ctx);
#else
    result.code = spawnAndCollect(command, args, cwd, result.output, ctx);
#endif
    return result;
}

} // namespace droidpack::io
