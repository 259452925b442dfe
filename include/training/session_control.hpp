#pragma once
#include "training_session.hpp"
#include <atomic>
#include <ostream>
#include <string>

/// Applies "pause", "resume" or "stop" and returns the session's reply.
/// A blank line gives an empty reply; anything else is reported as unknown.
std::string apply_session_command(TrainingSession& session, const std::string& command);

/**
 * @brief Reads newline-separated control commands from a file descriptor.
 *
 * Returns at end of input, on a read error, or once done is set. The
 * descriptor is polled in slices of poll_ms, so a caller can end the loop
 * and join its thread while the input is still open.
 *
 * @param replies Receives one line per non-empty reply
 */
void read_session_commands(int fd, TrainingSession& session, const std::atomic<bool>& done,
                           std::ostream& replies, int poll_ms = 100);
