/*
 * File:        log_line_reader.cpp
 * Module:      ropmon-core
 * Purpose:     Timeout-bounded line extraction from the render output stream
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "log_line_reader.h"
#include "logging.h"

#include <fmt/format.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace ropmon {

namespace {

constexpr size_t READ_CHUNK = 4096;
constexpr size_t MAX_READ_PER_CALL = 64 * 1024;

} // anonymous namespace

LineReader::LineReader(int fd, size_t max_line_length)
    : fd_(fd)
    , max_line_length_(std::max<size_t>(1, max_line_length))
    , eof_(fd < 0)
{
}

bool LineReader::take_buffered_line(std::string& line) {
    auto newline = buffer_.find('\n', scan_pos_);
    if (newline == std::string::npos) {
        scan_pos_ = buffer_.size();
        if (buffer_.size() - read_pos_ < max_line_length_) {
            return false;
        }
        // No newline in sight: hand the text out in max_line_length_ pieces
        line.assign(buffer_, read_pos_, max_line_length_);
        read_pos_ += max_line_length_;
        scan_pos_ = read_pos_;
        return true;
    }

    line.assign(buffer_, read_pos_, newline - read_pos_);
    read_pos_ = newline + 1;
    scan_pos_ = read_pos_;
    return true;
}

void LineReader::compact() {
    if (read_pos_ == 0) {
        return;
    }
    buffer_.erase(0, read_pos_);
    scan_pos_ -= read_pos_;
    read_pos_ = 0;
}

void LineReader::drain_available() {
    compact();

    char chunk[READ_CHUNK];
    size_t total = 0;
    while (total < MAX_READ_PER_CALL) {
        ssize_t n = ::read(fd_, chunk, sizeof(chunk));
        if (n > 0) {
            buffer_.append(chunk, static_cast<size_t>(n));
            total += static_cast<size_t>(n);
            continue;
        }
        if (n == 0) {
            eof_ = true;
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            ROPMON_LOG_WARN("LineReader: read failed: {}", std::strerror(errno));
            eof_ = true;
        }
        return;
    }
}

ReadResult LineReader::read_line(std::chrono::milliseconds timeout) {
    ReadResult result;
    auto deadline = std::chrono::steady_clock::now() + timeout;

    for (;;) {
        if (take_buffered_line(result.line)) {
            result.status = ReadStatus::Line;
            return result;
        }

        if (eof_) {
            if (read_pos_ < buffer_.size()) {
                // Writer closed without a final newline
                result.line.assign(buffer_, read_pos_, std::string::npos);
                buffer_.clear();
                read_pos_ = 0;
                scan_pos_ = 0;
                result.status = ReadStatus::Line;
                return result;
            }
            result.status = ReadStatus::Closed;
            return result;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() < 0) {
            remaining = std::chrono::milliseconds(0);
        }

        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            ROPMON_LOG_WARN("LineReader: poll failed: {}", std::strerror(errno));
            eof_ = true;
            continue;
        }
        if (ready == 0) {
            result.status = ReadStatus::Timeout;
            return result;
        }

        // POLLHUP/POLLERR still go through read() so that buffered data and
        // the EOF are both picked up
        drain_available();
    }
}

namespace {

// Length of the valid UTF-8 sequence starting at data[pos], or 0
size_t valid_utf8_length(const std::string& data, size_t pos) {
    auto byte = [&](size_t i) { return static_cast<unsigned char>(data[i]); };
    unsigned char lead = byte(pos);
    size_t available = data.size() - pos;

    if (lead < 0x80) {
        return 1;
    }

    size_t length;
    unsigned char min_second = 0x80;
    unsigned char max_second = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) min_second = 0xA0;      // overlong
        if (lead == 0xED) max_second = 0x9F;      // surrogates
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) min_second = 0x90;      // overlong
        if (lead == 0xF4) max_second = 0x8F;      // > U+10FFFF
    } else {
        return 0;
    }

    if (available < length) {
        return 0;
    }
    if (byte(pos + 1) < min_second || byte(pos + 1) > max_second) {
        return 0;
    }
    for (size_t i = 2; i < length; ++i) {
        if ((byte(pos + i) & 0xC0) != 0x80) {
            return 0;
        }
    }
    return length;
}

} // anonymous namespace

std::string decode_log_bytes(const std::string& raw) {
    std::string text;
    text.reserve(raw.size());

    size_t pos = 0;
    while (pos < raw.size()) {
        size_t length = valid_utf8_length(raw, pos);
        if (length == 0) {
            text += fmt::format("\\x{:02x}", static_cast<unsigned char>(raw[pos]));
            ++pos;
            continue;
        }
        text.append(raw, pos, length);
        pos += length;
    }
    return text;
}

std::string normalize_log_line(const std::string& text, const std::vector<std::string>& strip_tokens) {
    std::string line = text;

    for (const auto& token : strip_tokens) {
        if (token.empty()) {
            continue;
        }
        size_t pos = 0;
        while ((pos = line.find(token, pos)) != std::string::npos) {
            line.erase(pos, token.size());
        }
    }

    size_t end = line.find_last_not_of(" \t\r\n\f\v");
    if (end == std::string::npos) {
        line.clear();
    } else {
        line.erase(end + 1);
    }
    return line;
}

} // namespace ropmon
