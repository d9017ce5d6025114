/*
 * WifiSort - Kismet Capture Classification Toolkit
 * Copyright (C) 2026 WifiSort Authors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#pragma once
/**
 * @file Logger.hpp
 * @brief Thread-safe logging system for the WifiSort tools.
 *
 * Provides:
 * - Optional asynchronous logging through a bounded queue
 * - Console (stderr) and file output targets
 * - Log rotation with configurable size and count limits
 * - JSON Lines output format support
 * - Source location tracking (file, line, function)
 * - Scoped logging with timing measurements
 * - Thread-safe singleton pattern
 *
 * @note Thread-safe for all public methods.
 * @warning Messages logged before Initialize() are discarded by the macros.
 */

#include <atomic>
#include <cstdint>
#include <cstdarg>
#include <cstdio>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <string>
#include <thread>
#include <vector>

namespace WifiSort {
	namespace Utils {

		// ============================================================================
		// Log Levels
		// ============================================================================

		/**
		 * @brief Severity levels for log messages.
		 *
		 * Ordered from least to most severe. Messages below the configured
		 * minimum level are discarded.
		 */
		enum class LogLevel : uint8_t {
			Trace = 0,  ///< Verbose debugging information
			Debug,      ///< Debug-level information
			Info,       ///< Informational messages
			Warn,       ///< Warning conditions
			Error,      ///< Error conditions
			Fatal       ///< Fatal/critical errors
		};

		/// @brief Upper-case level name ("TRACE".."FATAL")
		[[nodiscard]] const char* LogLevelToString(LogLevel level) noexcept;

		/**
		 * @brief Parse a level name ("trace", "debug", "info", "warn", "error", "fatal").
		 * @return false if the name is not recognised (out is left unchanged)
		 */
		[[nodiscard]] bool ParseLogLevel(const std::string& name, LogLevel& out) noexcept;

		// ============================================================================
		// Configuration
		// ============================================================================

		/**
		 * @brief Configuration options for the Logger.
		 */
		struct LoggerConfig {
			bool async = false;             ///< Hand lines to a worker thread (queue blocks when full)
			bool toConsole = true;          ///< Output to stderr
			bool toFile = false;            ///< Output to filePath
			bool jsonLines = false;         ///< One JSON object per line instead of text
			bool useUtcTime = true;         ///< Use UTC timestamps
			bool includeSrcLocation = false;///< Include source file/line/function

			/// Exact log file path, used as given. Rotated copies get ".1", ".2", ... appended.
			std::string filePath = "wifi-sort.log";
			uint64_t maxFileSizeBytes = 10ULL * 1024ULL * 1024ULL;  ///< Rotate above this size (0 = never)
			size_t maxFileCount = 5;                  ///< Files kept, the live one included

			LogLevel minimalLevel = LogLevel::Warn;   ///< Minimum level to log
			LogLevel flushLevel = LogLevel::Error;    ///< Level that triggers flush
		};

		// ============================================================================
		// Logger Class
		// ============================================================================

		/**
		 * @brief Thread-safe singleton logger with optional async support.
		 *
		 * Usage:
		 * @code
		 *   LoggerConfig cfg;
		 *   cfg.toFile = true;
		 *   cfg.filePath = "logs/wifi-sort.log";
		 *   Logger::Instance().Initialize(cfg);
		 *
		 *   WS_LOG_INFO("Capture", "Read %zu devices", count);
		 *   WS_LOG_ERROR("Report", "Cannot write %s", path.c_str());
		 *
		 *   Logger::Instance().ShutDown();
		 * @endcode
		 *
		 * @note Call ShutDown() before application exit to flush pending logs.
		 */
		class Logger {
		public:
			/**
			 * @brief Get the singleton Logger instance.
			 */
			[[nodiscard]] static Logger& Instance();

			/**
			 * @brief Initialize (or re-initialize) the logger with configuration.
			 *
			 * A running async worker is stopped and drained before the new
			 * configuration takes effect.
			 */
			void Initialize(const LoggerConfig& cfg);

			/**
			 * @brief Shut down the logger and flush pending messages.
			 */
			void ShutDown();

			[[nodiscard]] bool IsInitialized() const noexcept;

			[[nodiscard]] bool IsEnabled(LogLevel level) const noexcept;

			/**
			 * @brief Log a printf-style formatted message with source location.
			 */
			void LogEx(LogLevel level,
			           const char* category,
			           const char* file,
			           int line,
			           const char* function,
			           const char* format, ...);

			/**
			 * @brief Format a message with va_list.
			 */
			[[nodiscard]] static std::string FormatMessageV(const char* fmt, va_list args);

			/**
			 * @brief RAII scope logger for function entry/exit timing.
			 */
			class Scope {
			public:
				Scope(const char* category,
				      const char* file,
				      int line,
				      const char* function,
				      const char* messageOnEnter = "Enter",
				      LogLevel level = LogLevel::Debug);
				~Scope();

				// Non-copyable, non-movable
				Scope(const Scope&) = delete;
				Scope& operator=(const Scope&) = delete;
				Scope(Scope&&) = delete;
				Scope& operator=(Scope&&) = delete;

			private:
				const char* m_category;
				const char* m_file;
				const char* m_function;
				int m_line;
				std::chrono::steady_clock::time_point m_start;
				LogLevel m_level;
			};

			// Non-copyable singleton
			Logger(const Logger&) = delete;
			Logger& operator=(const Logger&) = delete;

		private:
			Logger();
			~Logger();

			// ========================================================================
			// Internal Types
			// ========================================================================

			struct LogItem {
				LogLevel level = LogLevel::Info;
				std::string category;
				std::string message;
				std::string file;
				std::string function;
				int line = 0;
				int64_t tsMillis = 0;   ///< Milliseconds since Unix epoch
			};

			// ========================================================================
			// Internal Methods
			// ========================================================================

			void LogMessage(LogLevel level,
			                const char* category,
			                const std::string& message,
			                const char* file,
			                int line,
			                const char* function);

			void StopWorker();
			void WorkerLoop();
			void Enqueue(LogItem&& item);
			[[nodiscard]] bool Dequeue(LogItem& out);
			void Dispatch(const LogItem& item);

			void WriteConsole(const std::string& line);
			void WriteFile(const std::string& line);

			[[nodiscard]] std::string FormatLine(const LogItem& item) const;
			[[nodiscard]] std::string FormatPrefix(const LogItem& item) const;
			[[nodiscard]] std::string FormatAsJson(const LogItem& item) const;
			[[nodiscard]] static std::string EscapeJson(const std::string& s);

			void OpenLogFileIfNeeded();
			void RotateIfNeeded(size_t nextWriteBytes);
			void PerformRotation();
			[[nodiscard]] std::string BaseLogPath() const;

			[[nodiscard]] static int64_t NowAsEpochMillis();
			[[nodiscard]] static std::string FormatIso8601(int64_t epochMillis, bool utc);

			// ========================================================================
			// Member Variables
			// ========================================================================

			/// Flag indicating logger is accepting messages
			std::atomic<bool> m_accepting{ false };

			/// Initialization state
			std::atomic<bool> m_initialized{ false };

			/// Current minimum log level
			std::atomic<LogLevel> m_minLevel{ LogLevel::Warn };

			/// Logger configuration
			LoggerConfig m_cfg{};

			/// Mutex protecting configuration and sink access
			mutable std::mutex m_cfgMutex;

			/// Log message queue for async mode
			std::deque<LogItem> m_queue;

			/// Mutex protecting queue access
			mutable std::mutex m_queueMutex;

			/// Condition variable for queue signaling
			std::condition_variable m_queueCv;

			/// Async worker thread
			std::thread m_worker;

			/// Stop flag for worker thread
			std::atomic<bool> m_stop{ false };

			/// Log file handle
			std::FILE* m_file{ nullptr };

			/// Current log file size
			uint64_t m_currentSize{ 0 };
		};

	}  // namespace Utils
}  // namespace WifiSort

// ═══════════════════════════════════════════════════════════════════════════
// LOGGING MACROS
// ═══════════════════════════════════════════════════════════════════════════
//
// Usage:
//   WS_LOG_INFO("Category", "Message with %d format", value);
//   WS_LOG_ERROR("Category", "Error occurred: %s", errorMsg.c_str());
//   WS_LOG_SCOPE("Category");  // Logs function entry/exit with timing
//
// ═══════════════════════════════════════════════════════════════════════════

#define WS_LOG_AT_LEVEL_(lvl, category, fmt, ...) \
    do { \
        auto& _lg = ::WifiSort::Utils::Logger::Instance(); \
        if (_lg.IsInitialized() && _lg.IsEnabled(lvl)) { \
            _lg.LogEx((lvl), (category), __FILE__, __LINE__, __func__, (fmt), ##__VA_ARGS__); \
        } \
    } while(0)

/// @brief Log at TRACE level
#define WS_LOG_TRACE(category, fmt, ...) \
    WS_LOG_AT_LEVEL_(::WifiSort::Utils::LogLevel::Trace, category, fmt, ##__VA_ARGS__)

/// @brief Log at DEBUG level
#define WS_LOG_DEBUG(category, fmt, ...) \
    WS_LOG_AT_LEVEL_(::WifiSort::Utils::LogLevel::Debug, category, fmt, ##__VA_ARGS__)

/// @brief Log at INFO level
#define WS_LOG_INFO(category, fmt, ...) \
    WS_LOG_AT_LEVEL_(::WifiSort::Utils::LogLevel::Info, category, fmt, ##__VA_ARGS__)

/// @brief Log at WARN level
#define WS_LOG_WARN(category, fmt, ...) \
    WS_LOG_AT_LEVEL_(::WifiSort::Utils::LogLevel::Warn, category, fmt, ##__VA_ARGS__)

/// @brief Log at ERROR level
#define WS_LOG_ERROR(category, fmt, ...) \
    WS_LOG_AT_LEVEL_(::WifiSort::Utils::LogLevel::Error, category, fmt, ##__VA_ARGS__)

/// @brief Log at FATAL level
#define WS_LOG_FATAL(category, fmt, ...) \
    WS_LOG_AT_LEVEL_(::WifiSort::Utils::LogLevel::Fatal, category, fmt, ##__VA_ARGS__)

#define WS_LOG_CONCAT_INNER_(a, b) a##b
#define WS_LOG_CONCAT_(a, b) WS_LOG_CONCAT_INNER_(a, b)

/// @brief RAII scope logger - logs function entry and exit with timing
#define WS_LOG_SCOPE(category) \
    ::WifiSort::Utils::Logger::Scope WS_LOG_CONCAT_(_ws_scope_obj_, __LINE__)( \
        (category), __FILE__, __LINE__, __func__)
