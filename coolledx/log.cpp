#include "log.h"
#include <iostream>
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace coolledx {

    const char* LogLevel::ToString(LogLevel::Level level) {
        switch (level) {
            case DEBUG: return "DEBUG";
            case INFO:  return "INFO";
            case WARN:  return "WARN";
            case ERROR: return "ERROR";
            case FATAL: return "FATAL";
            default:    return "UNKNOWN";
        }
    }

    LogLevel::Level LogLevel::FromString(const std::string& str) {
        std::string s = str;
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (s == "DEBUG") return DEBUG;
        if (s == "INFO")  return INFO;
        if (s == "WARN" || s == "WARNING") return WARN;
        if (s == "ERROR") return ERROR;
        if (s == "FATAL" || s == "CRITICAL") return FATAL;
        return UNKNOWN;
    }

    LogEvent::LogEvent(std::shared_ptr<Logger> logger, LogLevel::Level level,
                       const char* file, int32_t line, uint64_t time)
        : file_(file)
        , line_(line)
        , time_(time)
        , logger_(logger)
        , level_(level) {
    }

    LogEventWrap::LogEventWrap(LogEvent::ptr e)
        : event_(e) {
    }

    LogEventWrap::~LogEventWrap() {
        event_->getLogger()->log(event_->getLevel(), event_);
    }

    std::stringstream& LogEventWrap::getSS() {
        return event_->getSS();
    }

    // ---- formatting shared by the appenders ----
    static std::string format_event(const std::string& logger_name, LogLevel::Level level,
                                    const LogEvent::ptr& event) {
        std::stringstream ss;
        time_t t = static_cast<time_t>(event->getTime());
        struct tm tm;
        localtime_r(&t, &tm);
        char buf[64];
        strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);

        const char* file = event->getFile();
        const char* base = file;
        for (const char* p = file; p && *p; ++p) {
            if (*p == '/') base = p + 1;
        }

        ss << buf << "\t" << LogLevel::ToString(level)
           << "\t[" << logger_name << "]\t"
           << (base ? base : "") << ":" << event->getLine()
           << "\t" << event->getContent();
        return ss.str();
    }

    void StdoutLogAppender::log(std::shared_ptr<Logger> logger, LogLevel::Level level, LogEvent::ptr event) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << format_event(logger->getName(), level, event) << std::endl;
    }

    void MemoryLogAppender::log(std::shared_ptr<Logger> logger, LogLevel::Level level, LogEvent::ptr event) {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.push_back(format_event(logger->getName(), level, event));
    }

    std::list<std::string> MemoryLogAppender::lines() {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_;
    }

    void MemoryLogAppender::clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.clear();
    }

    Logger::Logger(const std::string& name)
        : name_(name)
        , level_(LogLevel::INFO) {
    }

    void Logger::log(LogLevel::Level level, LogEvent::ptr event) {
        if (level < level_) {
            return;
        }
        // forwarded events keep the name of the logger that made them
        Logger::ptr self = event->getLogger() ? event->getLogger() : shared_from_this();
        std::list<LogAppender::ptr> appenders;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            appenders = appenders_;
        }
        if (!appenders.empty()) {
            for (auto& a : appenders) {
                a->log(self, level, event);
            }
        } else if (root_) {
            root_->log(level, event);
        }
    }

    void Logger::addAppender(LogAppender::ptr appender) {
        std::lock_guard<std::mutex> lock(mutex_);
        appenders_.push_back(appender);
    }

    void Logger::delAppender(LogAppender::ptr appender) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = appenders_.begin(); it != appenders_.end(); ++it) {
            if (*it == appender) {
                appenders_.erase(it);
                break;
            }
        }
    }

    void Logger::clearAppenders() {
        std::lock_guard<std::mutex> lock(mutex_);
        appenders_.clear();
    }

    LoggerManager::LoggerManager() {
        root_.reset(new Logger);
        root_->addAppender(LogAppender::ptr(new StdoutLogAppender));
        loggers_[root_->name_] = root_;
    }

    Logger::ptr LoggerManager::getLogger(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = loggers_.find(name);
        if (it != loggers_.end()) {
            return it->second;
        }

        Logger::ptr logger(new Logger(name));
        logger->root_ = root_;
        logger->setLevel(root_->getLevel());
        loggers_[name] = logger;
        return logger;
    }

    void LoggerManager::setLevel(LogLevel::Level level) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& kv : loggers_) {
            kv.second->setLevel(level);
        }
    }
}
