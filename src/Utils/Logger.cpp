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
#include "pch.h"
#include "Logger.hpp"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace WifiSort {
	namespace Utils {

		namespace {
			/// Upper bound for a single formatted message (64KB)
			constexpr size_t kMaxMessageBytes = 64 * 1024;

			/// Async producers wait once this many lines are pending
			constexpr size_t kMaxQueuedItems = 1000;

			const char* BaseName(const char* path) noexcept {
				if (!path) return "";
				const char* slash = std::strrchr(path, '/');
				return slash ? slash + 1 : path;
			}
		}

		const char* LogLevelToString(LogLevel level) noexcept {
			switch (level) {
			case LogLevel::Trace: return "TRACE";
			case LogLevel::Debug: return "DEBUG";
			case LogLevel::Info:  return "INFO";
			case LogLevel::Warn:  return "WARN";
			case LogLevel::Error: return "ERROR";
			case LogLevel::Fatal: return "FATAL";
			}
			return "UNKNOWN";
		}

		bool ParseLogLevel(const std::string& name, LogLevel& out) noexcept {
			std::string lower;
			lower.reserve(name.size());
			for (char c : name) {
				lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
			}

			if (lower == "trace") { out = LogLevel::Trace; return true; }
			if (lower == "debug") { out = LogLevel::Debug; return true; }
			if (lower == "info")  { out = LogLevel::Info;  return true; }
			if (lower == "warn" || lower == "warning") { out = LogLevel::Warn; return true; }
			if (lower == "error") { out = LogLevel::Error; return true; }
			if (lower == "fatal") { out = LogLevel::Fatal; return true; }
			return false;
		}

		// ============================================================================
		// Lifecycle
		// ============================================================================

		Logger& Logger::Instance() {
			static Logger instance;
			return instance;
		}

		Logger::Logger() = default;

		Logger::~Logger() {
			ShutDown();
		}

		void Logger::Initialize(const LoggerConfig& cfg) {
			// Drain a previous configuration first so no item is written with the wrong sinks
			StopWorker();

			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				if (m_file) {
					std::fclose(m_file);
					m_file = nullptr;
					m_currentSize = 0;
				}
				m_cfg = cfg;
				m_minLevel.store(cfg.minimalLevel, std::memory_order_release);
				if (m_cfg.toFile) {
					OpenLogFileIfNeeded();
				}
			}

			m_stop.store(false, std::memory_order_release);
			if (cfg.async) {
				m_worker = std::thread(&Logger::WorkerLoop, this);
			}

			m_accepting.store(true, std::memory_order_release);
			m_initialized.store(true, std::memory_order_release);
		}

		void Logger::ShutDown() {
			if (!m_initialized.exchange(false, std::memory_order_acq_rel)) {
				return;
			}
			m_accepting.store(false, std::memory_order_release);

			StopWorker();

			std::lock_guard<std::mutex> lock(m_cfgMutex);
			if (m_file) {
				std::fflush(m_file);
				std::fclose(m_file);
				m_file = nullptr;
			}
			m_currentSize = 0;
		}

		void Logger::StopWorker() {
			if (!m_worker.joinable()) {
				return;
			}
			m_stop.store(true, std::memory_order_release);
			m_queueCv.notify_all();
			m_worker.join();

			// Anything enqueued after the worker observed the stop flag
			LogItem item;
			while (Dequeue(item)) {
				Dispatch(item);
			}
		}

		bool Logger::IsInitialized() const noexcept {
			return m_initialized.load(std::memory_order_acquire);
		}

		bool Logger::IsEnabled(LogLevel level) const noexcept {
			return static_cast<uint8_t>(level) >=
				static_cast<uint8_t>(m_minLevel.load(std::memory_order_acquire));
		}

		// ============================================================================
		// Logging Entry Points
		// ============================================================================

		void Logger::LogEx(LogLevel level,
		                   const char* category,
		                   const char* file,
		                   int line,
		                   const char* function,
		                   const char* format, ...) {
			if (!format) return;

			va_list args;
			va_start(args, format);
			std::string message = FormatMessageV(format, args);
			va_end(args);

			LogMessage(level, category, message, file, line, function);
		}

		void Logger::LogMessage(LogLevel level,
		                        const char* category,
		                        const std::string& message,
		                        const char* file,
		                        int line,
		                        const char* function) {
			if (!m_accepting.load(std::memory_order_acquire) || !IsEnabled(level)) {
				return;
			}

			LogItem item;
			item.level = level;
			item.category = category ? category : "";
			item.message = message;
			item.file = BaseName(file);
			item.function = function ? function : "";
			item.line = line;
			item.tsMillis = NowAsEpochMillis();

			if (m_worker.joinable()) {
				Enqueue(std::move(item));
			}
			else {
				Dispatch(item);
			}
		}

		std::string Logger::FormatMessageV(const char* fmt, va_list args) {
			if (!fmt) return std::string();

			va_list copy;
			va_copy(copy, args);
			const int needed = std::vsnprintf(nullptr, 0, fmt, copy);
			va_end(copy);

			if (needed <= 0) {
				return std::string();
			}

			const size_t size = std::min(static_cast<size_t>(needed), kMaxMessageBytes);
			std::string out(size + 1, '\0');
			std::vsnprintf(out.data(), out.size(), fmt, args);
			out.resize(size);
			return out;
		}

		// ============================================================================
		// Async Queue
		// ============================================================================

		void Logger::Enqueue(LogItem&& item) {
			std::unique_lock<std::mutex> lock(m_queueMutex);

			m_queueCv.wait(lock, [this] {
				return m_queue.size() < kMaxQueuedItems || m_stop.load();
			});

			m_queue.push_back(std::move(item));
			lock.unlock();
			m_queueCv.notify_all();
		}

		bool Logger::Dequeue(LogItem& out) {
			std::lock_guard<std::mutex> lock(m_queueMutex);
			if (m_queue.empty()) {
				return false;
			}
			out = std::move(m_queue.front());
			m_queue.pop_front();
			return true;
		}

		void Logger::WorkerLoop() {
			for (;;) {
				LogItem item;
				{
					std::unique_lock<std::mutex> lock(m_queueMutex);
					m_queueCv.wait(lock, [this] { return !m_queue.empty() || m_stop.load(); });

					if (m_queue.empty()) {
						// stop requested and nothing left
						m_queueCv.notify_all();
						return;
					}

					item = std::move(m_queue.front());
					m_queue.pop_front();
				}
				m_queueCv.notify_all();
				Dispatch(item);
			}
		}

		// ============================================================================
		// Sinks
		// ============================================================================

		void Logger::Dispatch(const LogItem& item) {
			std::lock_guard<std::mutex> lock(m_cfgMutex);

			const std::string line = FormatLine(item);
			if (m_cfg.toConsole) {
				WriteConsole(line);
			}
			if (m_cfg.toFile) {
				WriteFile(line);
			}

			if (static_cast<uint8_t>(item.level) >= static_cast<uint8_t>(m_cfg.flushLevel)) {
				std::fflush(stderr);
				if (m_file) std::fflush(m_file);
			}
		}

		void Logger::WriteConsole(const std::string& line) {
			std::fwrite(line.data(), 1, line.size(), stderr);
		}

		void Logger::WriteFile(const std::string& line) {
			OpenLogFileIfNeeded();
			if (!m_file) return;

			RotateIfNeeded(line.size());
			if (!m_file) return;

			const size_t written = std::fwrite(line.data(), 1, line.size(), m_file);
			m_currentSize += written;
		}

		std::string Logger::FormatLine(const LogItem& item) const {
			std::string line = m_cfg.jsonLines ? FormatAsJson(item) : FormatPrefix(item) + item.message;
			line.push_back('\n');
			return line;
		}

		std::string Logger::FormatPrefix(const LogItem& item) const {
			std::ostringstream oss;
			oss << FormatIso8601(item.tsMillis, m_cfg.useUtcTime)
				<< " [" << LogLevelToString(item.level) << "]";

			if (!item.category.empty()) {
				oss << " [" << item.category << "]";
			}
			if (m_cfg.includeSrcLocation && !item.file.empty()) {
				oss << " (" << item.file << ":" << item.line;
				if (!item.function.empty()) {
					oss << " " << item.function;
				}
				oss << ")";
			}
			oss << " ";
			return oss.str();
		}

		std::string Logger::FormatAsJson(const LogItem& item) const {
			std::ostringstream oss;
			oss << "{\"ts\":\"" << FormatIso8601(item.tsMillis, m_cfg.useUtcTime) << "\""
				<< ",\"level\":\"" << LogLevelToString(item.level) << "\""
				<< ",\"category\":\"" << EscapeJson(item.category) << "\"";

			if (m_cfg.includeSrcLocation) {
				oss << ",\"file\":\"" << EscapeJson(item.file) << "\""
					<< ",\"line\":" << item.line
					<< ",\"function\":\"" << EscapeJson(item.function) << "\"";
			}
			oss << ",\"message\":\"" << EscapeJson(item.message) << "\"}";
			return oss.str();
		}

		std::string Logger::EscapeJson(const std::string& s) {
			std::string out;
			out.reserve(s.size() + 8);
			for (const char ch : s) {
				const auto c = static_cast<unsigned char>(ch);
				switch (c) {
				case '"':  out += "\\\""; break;
				case '\\': out += "\\\\"; break;
				case '\n': out += "\\n"; break;
				case '\r': out += "\\r"; break;
				case '\t': out += "\\t"; break;
				default:
					if (c < 0x20) {
						char buf[8];
						std::snprintf(buf, sizeof(buf), "\\u%04x", c);
						out += buf;
					}
					else {
						out.push_back(ch);
					}
				}
			}
			return out;
		}

		// ============================================================================
		// File Rotation
		// ============================================================================

		std::string Logger::BaseLogPath() const {
			return m_cfg.filePath;
		}

		void Logger::OpenLogFileIfNeeded() {
			if (m_file) return;

			std::error_code ec;
			const std::filesystem::path parent = std::filesystem::path(m_cfg.filePath).parent_path();
			if (!parent.empty()) {
				std::filesystem::create_directories(parent, ec);
			}

			const std::string path = BaseLogPath();
			m_file = std::fopen(path.c_str(), "ab");
			if (!m_file) {
				std::fprintf(stderr, "[Logger] cannot open log file %s: %s\n",
					path.c_str(), std::strerror(errno));
				m_cfg.toFile = false;
				return;
			}

			const auto size = std::filesystem::file_size(path, ec);
			m_currentSize = ec ? 0 : static_cast<uint64_t>(size);
		}

		void Logger::RotateIfNeeded(size_t nextWriteBytes) {
			if (m_cfg.maxFileSizeBytes == 0) return;
			if (m_currentSize + nextWriteBytes <= m_cfg.maxFileSizeBytes) return;
			PerformRotation();
		}

		void Logger::PerformRotation() {
			if (m_file) {
				std::fclose(m_file);
				m_file = nullptr;
			}

			const std::string base = BaseLogPath();
			std::error_code ec;

			// base.(N-1) is dropped, base.k -> base.(k+1), base -> base.1
			if (m_cfg.maxFileCount > 1) {
				std::filesystem::remove(base + "." + std::to_string(m_cfg.maxFileCount - 1), ec);
				for (size_t i = m_cfg.maxFileCount - 1; i > 1; --i) {
					const std::string from = base + "." + std::to_string(i - 1);
					if (std::filesystem::exists(from, ec)) {
						std::filesystem::rename(from, base + "." + std::to_string(i), ec);
					}
				}
				std::filesystem::rename(base, base + ".1", ec);
			}
			else {
				std::filesystem::remove(base, ec);
			}

			m_currentSize = 0;
			OpenLogFileIfNeeded();
		}

		// ============================================================================
		// Time Helpers
		// ============================================================================

		int64_t Logger::NowAsEpochMillis() {
			using namespace std::chrono;
			return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
		}

		std::string Logger::FormatIso8601(int64_t epochMillis, bool utc) {
			const std::time_t secs = static_cast<std::time_t>(epochMillis / 1000);
			const int millis = static_cast<int>(epochMillis % 1000);

			std::tm tmv{};
			if (utc) {
				::gmtime_r(&secs, &tmv);
			}
			else {
				::localtime_r(&secs, &tmv);
			}

			char buf[48];
			const size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tmv);
			std::snprintf(buf + n, sizeof(buf) - n, ".%03d%s", millis, utc ? "Z" : "");
			return buf;
		}

		// ============================================================================
		// Scope
		// ============================================================================

		Logger::Scope::Scope(const char* category,
		                     const char* file,
		                     int line,
		                     const char* function,
		                     const char* messageOnEnter,
		                     LogLevel level)
			: m_category(category)
			, m_file(file)
			, m_function(function)
			, m_line(line)
			, m_start(std::chrono::steady_clock::now())
			, m_level(level) {
			auto& lg = Logger::Instance();
			if (lg.IsInitialized() && lg.IsEnabled(m_level)) {
				lg.LogEx(m_level, m_category, m_file, m_line, m_function, "%s: %s",
					m_function ? m_function : "", messageOnEnter ? messageOnEnter : "Enter");
			}
		}

		Logger::Scope::~Scope() {
			auto& lg = Logger::Instance();
			if (lg.IsInitialized() && lg.IsEnabled(m_level)) {
				const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
					std::chrono::steady_clock::now() - m_start).count();
				lg.LogEx(m_level, m_category, m_file, m_line, m_function, "%s: Exit (%lld us)",
					m_function ? m_function : "", static_cast<long long>(elapsed));
			}
		}

	}  // namespace Utils
}  // namespace WifiSort
