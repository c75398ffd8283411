#include "platform/platform_abi.hpp"

#include <unistd.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <spawn.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <vector>

extern char **environ;

namespace platform {

namespace {

void close_pipe(int pipe_descriptors[2]) {
    for (int index = 0; index < 2; index++) {
        if (pipe_descriptors[index] >= 0) {
            close(pipe_descriptors[index]);
            pipe_descriptors[index] = -1;
        }
    }
}

// Read whatever is available on descriptor. Marks it closed on EOF or hard error.
void drain_descriptor(int descriptor, bool &is_open, std::string &output) {
    char buffer[4096];
    ssize_t bytes_read = read(descriptor, buffer, sizeof(buffer));
    if (bytes_read > 0) {
        output.append(buffer, static_cast<size_t>(bytes_read));
        return;
    }
    if (bytes_read < 0 && (errno == EINTR || errno == EAGAIN)) {
        return;
    }
    is_open = false;
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}

} // namespace

ShellCommandResult run_shell_command(const std::string &command, int timeout_milliseconds) {
    ShellCommandResult result;

    // Close-on-exec so that concurrently spawned commands never inherit each other's pipes.
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0 || pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        result.error_message = "pipe failed: " + std::string(strerror(errno));
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return result;
    }

    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_addopen(&file_actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&file_actions, stdout_pipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&file_actions, stderr_pipe[1], STDERR_FILENO);

    // Build argv array: [/bin/sh, -c, command, nullptr]
    std::vector<std::string> argv_strings = {"/bin/sh", "-c", command};
    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(argument_string.data());
    }
    argv_pointers.push_back(nullptr);

    pid_t child_pid = 0;
    int spawn_status = posix_spawn(&child_pid, "/bin/sh", &file_actions, nullptr,
                                    argv_pointers.data(), environ);
    posix_spawn_file_actions_destroy(&file_actions);

    // The parent keeps only the read ends.
    close(stdout_pipe[1]);
    stdout_pipe[1] = -1;
    close(stderr_pipe[1]);
    stderr_pipe[1] = -1;

    if (spawn_status != 0) {
        result.error_message = "posix_spawn failed: " + std::string(strerror(spawn_status));
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return result;
    }

    auto start_time = std::chrono::steady_clock::now();
    bool stdout_open = true;
    bool stderr_open = true;

    while (stdout_open || stderr_open) {
        if (timeout_milliseconds > 0) {
            auto elapsed = std::chrono::steady_clock::now() - start_time;
            if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() > timeout_milliseconds) {
                result.timed_out = true;
                kill_process(static_cast<int>(child_pid));
                // Grandchildren may still hold the pipes open; stop reading here.
                break;
            }
        }

        pollfd poll_descriptors[2];
        nfds_t descriptor_count = 0;
        if (stdout_open) {
            poll_descriptors[descriptor_count].fd = stdout_pipe[0];
            poll_descriptors[descriptor_count].events = POLLIN;
            poll_descriptors[descriptor_count].revents = 0;
            descriptor_count++;
        }
        if (stderr_open) {
            poll_descriptors[descriptor_count].fd = stderr_pipe[0];
            poll_descriptors[descriptor_count].events = POLLIN;
            poll_descriptors[descriptor_count].revents = 0;
            descriptor_count++;
        }

        int ready_count = poll(poll_descriptors, descriptor_count, 100);
        if (ready_count < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.error_message = "poll failed: " + std::string(strerror(errno));
            kill_process(static_cast<int>(child_pid));
            break;
        }

        for (nfds_t index = 0; index < descriptor_count; index++) {
            if (poll_descriptors[index].revents == 0) {
                continue;
            }
            if (poll_descriptors[index].fd == stdout_pipe[0]) {
                drain_descriptor(stdout_pipe[0], stdout_open, result.stdout_text);
            } else {
                drain_descriptor(stderr_pipe[0], stderr_open, result.stderr_text);
            }
        }
    }

    close_pipe(stdout_pipe);
    close_pipe(stderr_pipe);

    int status = 0;
    pid_t waited_pid = -1;
    do {
        waited_pid = waitpid(child_pid, &status, 0);
    } while (waited_pid < 0 && errno == EINTR);

    if (waited_pid < 0) {
        result.error_message = "waitpid failed: " + std::string(strerror(errno));
        return result;
    }

    result.exit_code = decode_wait_status(status);
    if (result.timed_out) {
        result.error_message = "command timed out after " + std::to_string(timeout_milliseconds) + " ms";
        return result;
    }
    if (!result.error_message.empty()) {
        return result;
    }

    result.success = true;
    return result;
}

bool kill_process(int process_id) {
    if (process_id <= 0) {
        return false;
    }
    int kill_result = kill(static_cast<pid_t>(process_id), SIGKILL);
    return (kill_result == 0);
}

} // namespace platform
