#include "../../include/training/session_control.hpp"
#include "../../include/logger.hpp"
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

std::string apply_session_command(TrainingSession& session, const std::string& command) {
    if (command == "pause") {
        return session.pause();
    }
    if (command == "resume") {
        return session.resume();
    }
    if (command == "stop") {
        return session.stop();
    }
    if (command.empty()) {
        return "";
    }
    return "Unknown command: " + command;
}

namespace {

void handle_line(std::string line, TrainingSession& session, std::ostream& replies) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    std::string reply = apply_session_command(session, line);
    if (!reply.empty()) {
        replies << reply << std::endl;
    }
}

} // namespace

void read_session_commands(int fd, TrainingSession& session, const std::atomic<bool>& done,
                           std::ostream& replies, int poll_ms) {
    std::string pending;
    char buffer[256];

    while (!done) {
        pollfd input{fd, POLLIN, 0};
        int ready = ::poll(&input, 1, poll_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            Logger::getInstance().log("Control input poll failed: " + std::string(std::strerror(errno)),
                                      true);
            return;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t count = ::read(fd, buffer, sizeof(buffer));
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }
            Logger::getInstance().log("Control input read failed: " + std::string(std::strerror(errno)),
                                      true);
            return;
        }
        if (count == 0) {
            break;
        }

        pending.append(buffer, static_cast<size_t>(count));
        size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            handle_line(pending.substr(0, newline), session, replies);
            pending.erase(0, newline + 1);
        }
    }

    // Last line without a trailing newline
    if (!done && !pending.empty()) {
        handle_line(pending, session, replies);
    }
    Logger::getInstance().log("Control input closed");
}
