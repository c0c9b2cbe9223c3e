// Copyright 2018 The Beam Team
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "logger.h"
#include "helpers.h"
#include <boost/filesystem.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <stdexcept>
#include <mutex>
#include <algorithm>

namespace wtoken {

using namespace std;

Logger* Logger::g_logger = 0;

namespace {

// A single output stream with its own level threshold
class Sink {
public:
    Sink(FILE* f, int minLevel, int flushLevel, bool owned) :
        _f(f),
        _minLevel(minLevel),
        _flushLevel(flushLevel),
        _owned(owned)
    {}

    ~Sink() {
        if (_owned && _f) fclose(_f);
    }

    bool accepts(int level) const {
        return (_minLevel > 0) && (level >= _minLevel);
    }

    void write(int level, const char* header, size_t headerSize, const char* msg, size_t size) {
        if (!_f || !accepts(level)) return;
        lock_guard<mutex> lock(_mutex);
        fwrite(header, 1, headerSize, _f);
        fwrite(msg, 1, size, _f);
        if (level >= _flushLevel) fflush(_f);
    }

private:
    mutex _mutex;
    FILE* _f;
    int _minLevel;
    int _flushLevel;
    bool _owned;
};

FILE* open_log_file(const string& fileNamePrefix, const string& dstPath, string& fullPath) {
    string fileName(fileNamePrefix);
    fileName += format_timestamp("%y_%m_%d_%H_%M_%S", local_timestamp_msec(), false);
    fileName += ".log";

    if (!dstPath.empty()) {
        boost::filesystem::path path{ dstPath.c_str() };
        if (!boost::filesystem::exists(path)) {
            boost::filesystem::create_directories(path);
        }

        path /= fileName;
        fullPath = path.string();
    } else {
        fullPath = fileName;
    }

    FILE* f = fopen(fullPath.c_str(), "ab");
    if (!f) throw runtime_error(string("cannot open file ") + fullPath);
    return f;
}

class LoggerImpl : public Logger {
    static const size_t MAX_HEADER_SIZE = 128;
    static const size_t MAX_TIMESTAMP_SIZE = 80;

    unique_ptr<Sink> _console;
    unique_ptr<Sink> _file;
    string _timeFormat;
    bool _printMilliseconds;

public:
    explicit LoggerImpl(const LoggerConfig& cfg) :
        _timeFormat("%Y-%m-%d.%T"),
        _printMilliseconds(true)
    {
        if (cfg.consoleLevel > 0) {
            _console = make_unique<Sink>(stdout, cfg.consoleLevel, cfg.flushLevel, false);
        }
        if (cfg.fileLevel > 0) {
            string fileName;
            FILE* f = open_log_file(cfg.filePrefix, cfg.dstPath, fileName);
            _file = make_unique<Sink>(f, cfg.fileLevel, cfg.flushLevel, true);
        }
        if (!_console && !_file) throw runtime_error("no logger sink configured");
    }

    ~LoggerImpl() override {
        if (this == g_logger) {
            g_logger = 0;
        }
    }

    bool level_accepted(int level) override {
        return (_console && _console->accepts(level)) || (_file && _file->accepts(level));
    }

    void write_message(const LogMessageHeader& header, const char* buf, size_t size) override {
        char timestampFormatted[MAX_TIMESTAMP_SIZE];
        char headerFormatted[MAX_HEADER_SIZE];
        if (!_timeFormat.empty()) {
            format_timestamp(timestampFormatted, MAX_TIMESTAMP_SIZE, _timeFormat.c_str(), header.timestamp, _printMilliseconds);
        } else {
            timestampFormatted[0] = 0;
        }
        int n = snprintf(headerFormatted, MAX_HEADER_SIZE, "%c %s ", loglevel_tag(header.level), timestampFormatted);
        size_t headerSize = (n > 0) ? std::min(size_t(n), MAX_HEADER_SIZE - 1) : 0;

        if (_console) _console->write(header.level, headerFormatted, headerSize, buf, size);
        if (_file) _file->write(header.level, headerFormatted, headerSize, buf, size);
    }
};

static constexpr size_t MAX_MSG_SIZE = 10000;

struct LogThreadContext {
    using Formatter = boost::iostreams::filtering_ostream;

    std::string msgBuffer;
    std::unique_ptr<Formatter> formatter;

    LogThreadContext() :
        formatter(std::make_unique<Formatter>(boost::iostreams::back_inserter(msgBuffer)))
    {}

    void reset() {
        msgBuffer = std::string();
        formatter = std::make_unique<Formatter>(boost::iostreams::back_inserter(msgBuffer));
    }
};

LogThreadContext* get_context() {
    static thread_local LogThreadContext ctx;
    return &ctx;
}

} //namespace

std::shared_ptr<Logger> Logger::create(
    int flushLevel,
    int consoleLevel,
    int fileLevel,
    const std::string& fileNamePrefix,
    const std::string& dstPath
) {
    LoggerConfig cfg;
    cfg.flushLevel = flushLevel;
    cfg.consoleLevel = consoleLevel;
    cfg.fileLevel = fileLevel;
    cfg.filePrefix = fileNamePrefix;
    cfg.dstPath = dstPath;
    return create(cfg);
}

std::shared_ptr<Logger> Logger::create(const LoggerConfig& cfg) {
    if (g_logger) {
        throw runtime_error("logger already initialized");
    }

    std::shared_ptr<Logger> logger = std::make_shared<LoggerImpl>(cfg);
    g_logger = logger.get();
    return logger;
}

LogMessageHeader::LogMessageHeader(int _level) :
    timestamp(local_timestamp_msec()),
    level(_level)
{}

LogMessage::LogMessage(int _level) :
    header(_level)
{
    LogThreadContext* ctx = get_context();
    if (ctx->msgBuffer.capacity() < MAX_MSG_SIZE) {
        ctx->msgBuffer.reserve(MAX_MSG_SIZE);
    }

    _formatter = ctx->formatter.get();
}

LogMessage::~LogMessage() {
    if (Logger::g_logger && _formatter) {
        *_formatter << '\n';
        _formatter->flush();
        std::string& buffer = get_context()->msgBuffer;
        Logger::g_logger->write_message(header, buffer.data(), buffer.size());
        if (buffer.size() > MAX_MSG_SIZE) {
            get_context()->reset();
        }
        else {
            buffer.clear();
        }
    }
}

} //namespace
