#ifndef __COOLLEDX_LOG_H__
#define __COOLLEDX_LOG_H__

#include <string>
#include <memory>
#include <sstream>
#include <list>
#include <map>
#include <mutex>
#include <cstdint>
#include <ctime>

#define COOLLEDX_LOG_LEVEL(logger, level) \
    if (logger->getLevel() <= level) \
        coolledx::LogEventWrap(coolledx::LogEvent::ptr(new coolledx::LogEvent(logger, level, \
                        __FILE__, __LINE__, time(0)))).getSS()

#define COOLLEDX_LOG_DEBUG(logger) COOLLEDX_LOG_LEVEL(logger, coolledx::LogLevel::DEBUG)
#define COOLLEDX_LOG_INFO(logger)  COOLLEDX_LOG_LEVEL(logger, coolledx::LogLevel::INFO)
#define COOLLEDX_LOG_WARN(logger)  COOLLEDX_LOG_LEVEL(logger, coolledx::LogLevel::WARN)
#define COOLLEDX_LOG_ERROR(logger) COOLLEDX_LOG_LEVEL(logger, coolledx::LogLevel::ERROR)
#define COOLLEDX_LOG_FATAL(logger) COOLLEDX_LOG_LEVEL(logger, coolledx::LogLevel::FATAL)

#define COOLLEDX_LOG_ROOT() coolledx::LoggerMgr::GetInstance()->getRoot()
#define COOLLEDX_LOG_NAME(name) coolledx::LoggerMgr::GetInstance()->getLogger(name)

namespace coolledx {

    class Logger;

    class LogLevel {
        public:
        enum Level {
            UNKNOWN = 0,
            DEBUG = 1,
            INFO = 2,
            WARN = 3,
            ERROR = 4,
            FATAL = 5
        };

        static const char* ToString(LogLevel::Level level);
        static LogLevel::Level FromString(const std::string& str);
    };

    class LogEvent {
        public:
        typedef std::shared_ptr<LogEvent> ptr;
        LogEvent(std::shared_ptr<Logger> logger, LogLevel::Level level,
                 const char* file, int32_t line, uint64_t time);

        const char* getFile() const { return file_; }
        int32_t getLine() const { return line_; }
        uint64_t getTime() const { return time_; }
        std::string getContent() const { return ss_.str(); }
        std::shared_ptr<Logger> getLogger() const { return logger_; }
        LogLevel::Level getLevel() const { return level_; }
        std::stringstream& getSS() { return ss_; }

        private:
        const char* file_ = nullptr;
        int32_t line_ = 0;
        uint64_t time_ = 0;
        std::stringstream ss_;
        std::shared_ptr<Logger> logger_;
        LogLevel::Level level_;
    };

    // Flushes the event to its logger when the statement ends.
    class LogEventWrap {
        public:
        LogEventWrap(LogEvent::ptr e);
        ~LogEventWrap();
        std::stringstream& getSS();

        private:
        LogEvent::ptr event_;
    };

    class LogAppender {
        public:
        typedef std::shared_ptr<LogAppender> ptr;
        virtual ~LogAppender() {}

        virtual void log(std::shared_ptr<Logger> logger, LogLevel::Level level, LogEvent::ptr event) = 0;

        protected:
        std::mutex mutex_;
    };

    class StdoutLogAppender : public LogAppender {
        public:
        typedef std::shared_ptr<StdoutLogAppender> ptr;
        void log(std::shared_ptr<Logger> logger, LogLevel::Level level, LogEvent::ptr event) override;
    };

    // Collects every event in memory. Used by tests to check what was logged.
    class MemoryLogAppender : public LogAppender {
        public:
        typedef std::shared_ptr<MemoryLogAppender> ptr;
        void log(std::shared_ptr<Logger> logger, LogLevel::Level level, LogEvent::ptr event) override;

        std::list<std::string> lines();
        void clear();

        private:
        std::list<std::string> lines_;
    };

    class Logger : public std::enable_shared_from_this<Logger> {
        public:
        typedef std::shared_ptr<Logger> ptr;

        Logger(const std::string& name = "root");
        void log(LogLevel::Level level, LogEvent::ptr event);

        void addAppender(LogAppender::ptr appender);
        void delAppender(LogAppender::ptr appender);
        void clearAppenders();

        LogLevel::Level getLevel() const { return level_; }
        void setLevel(LogLevel::Level val) { level_ = val; }
        const std::string& getName() const { return name_; }

        private:
        std::string name_;
        LogLevel::Level level_;
        std::mutex mutex_;
        std::list<LogAppender::ptr> appenders_;
        Logger::ptr root_;

        friend class LoggerManager;
    };

    class LoggerManager {
        public:
        LoggerManager();
        Logger::ptr getLogger(const std::string& name);
        Logger::ptr getRoot() const { return root_; }

        // Applies the level to the root and every named logger.
        void setLevel(LogLevel::Level level);

        private:
        std::mutex mutex_;
        std::map<std::string, Logger::ptr> loggers_;
        Logger::ptr root_;
    };

    class LoggerMgr {
        public:
        static LoggerManager* GetInstance() {
            static LoggerManager v;
            return &v;
        }
    };
}

#endif
