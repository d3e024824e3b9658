/*
 * File:        log_line_reader.h
 * Module:      ropmon-core
 * Purpose:     Timeout-bounded line extraction from the render output stream
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace ropmon {

enum class ReadStatus {
    Line,      ///< A complete line is available in ReadResult::line
    Timeout,   ///< Nothing arrived within the timeout; poll again
    Closed     ///< The stream is closed and fully drained
};

struct ReadResult {
    ReadStatus status = ReadStatus::Timeout;
    std::string line;   ///< Raw bytes without the trailing '\n'
};

/**
 * @brief Splits a non-blocking file descriptor into lines
 *
 * read_line() never blocks for longer than the timeout it is given, which
 * lets the monitor loop interleave cancellation checks and timer refreshes
 * with log consumption. A final unterminated line is returned when the
 * writer closes the stream. Text longer than max_line_length without a
 * newline is returned in pieces of that length, so the buffer stays
 * bounded. The descriptor is borrowed, not owned.
 */
class LineReader {
public:
    explicit LineReader(int fd, size_t max_line_length = 1024 * 1024);

    ReadResult read_line(std::chrono::milliseconds timeout);

    /// True once the writer closed the stream and the buffer is empty
    bool is_closed() const { return eof_ && read_pos_ >= buffer_.size(); }

private:
    bool take_buffered_line(std::string& line);
    void drain_available();
    void compact();

    int fd_;
    size_t max_line_length_;
    std::string buffer_;
    size_t read_pos_ = 0;   ///< Start of the first unconsumed byte
    size_t scan_pos_ = 0;   ///< Bytes before this are known to hold no newline
    bool eof_ = false;
};

/**
 * @brief Convert raw log bytes to UTF-8 text
 *
 * Valid UTF-8 sequences pass through unchanged; every byte that is not part
 * of a valid sequence is replaced by a "\xNN" escape, so one bad byte never
 * costs the whole line.
 */
std::string decode_log_bytes(const std::string& raw);

/**
 * @brief Strip vendor tokens (e.g. "[Redshift] ") and trailing whitespace
 *
 * Tokens are removed in the order given, everywhere in the line.
 */
std::string normalize_log_line(const std::string& text, const std::vector<std::string>& strip_tokens);

} // namespace ropmon
