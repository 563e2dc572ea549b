#pragma once

#include <string>
#include <exception>
#include <memory>
#include <functional>
#include <chrono>
#include <map>
#include <mutex>
#include <vector>

namespace voicebridge {
namespace utils {

/**
 * Error severity levels
 */
enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

/**
 * Error categories for better classification
 */
enum class ErrorCategory {
    WEBSOCKET,
    ADMISSION,
    SESSION,
    AUDIO_PROCESSING,
    PROVIDER,
    QUEUE,
    ORDERING,
    CONFIG,
    SYSTEM,
    UNKNOWN
};

/**
 * Wire-level error codes reported to clients and monitoring
 */
namespace error_codes {
    constexpr const char* CAPACITY_EXCEEDED = "CapacityExceeded";
    constexpr const char* UNKNOWN_SESSION = "UnknownSession";
    constexpr const char* PROVIDER_TIMEOUT = "ProviderTimeout";
    constexpr const char* PROVIDER_ERROR = "ProviderError";
    constexpr const char* ALL_PROVIDERS_EXHAUSTED = "AllProvidersExhausted";
    constexpr const char* QUEUE_UNAVAILABLE = "QueueUnavailable";
    constexpr const char* REORDER_TIMEOUT = "ReorderTimeout";
    constexpr const char* OVERLOADED = "Overloaded";
    constexpr const char* INVALID_MESSAGE = "InvalidMessage";
    constexpr const char* UNAUTHORIZED = "Unauthorized";
}

/**
 * Structured error information
 */
struct ErrorInfo {
    std::string id;
    ErrorCategory category;
    ErrorSeverity severity;
    std::string code;
    std::string message;
    std::string details;
    std::string context;
    std::chrono::steady_clock::time_point timestamp;
    std::string session_id;
    
    ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg, 
              const std::string& det = "", const std::string& ctx = "", 
              const std::string& sid = "", const std::string& errorCode = "");
};

/**
 * Base exception carrying structured error information
 */
class VoiceBridgeException : public std::exception {
public:
    explicit VoiceBridgeException(const ErrorInfo& error_info);
    const char* what() const noexcept override;
    const ErrorInfo& getErrorInfo() const { return error_info_; }
    const std::string& getCode() const { return error_info_.code; }

private:
    ErrorInfo error_info_;
    mutable std::string what_message_;
};

// Admission refused: process-wide or per-client cap, or rate limit
class CapacityExceededException : public VoiceBridgeException {
public:
    CapacityExceededException(const std::string& message, const std::string& client_key = "");
};

// Operation on a session that does not exist or no longer accepts audio
class UnknownSessionException : public VoiceBridgeException {
public:
    explicit UnknownSessionException(const std::string& session_id);
};

class ProviderTimeoutException : public VoiceBridgeException {
public:
    ProviderTimeoutException(const std::string& provider, std::chrono::milliseconds timeout);
};

class ProviderException : public VoiceBridgeException {
public:
    ProviderException(const std::string& provider, const std::string& message);
};

class AllProvidersExhaustedException : public VoiceBridgeException {
public:
    AllProvidersExhaustedException(const std::string& session_id, uint64_t sequence);
};

class QueueUnavailableException : public VoiceBridgeException {
public:
    explicit QueueUnavailableException(const std::string& message);
};

class ConfigException : public VoiceBridgeException {
public:
    ConfigException(const std::string& message, const std::string& path = "");
};

/**
 * Error handler callback type
 */
using ErrorCallback = std::function<void(const ErrorInfo&)>;

/**
 * Central error handler for the application
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();
    
    // Error reporting
    void reportError(const ErrorInfo& error);
    void reportError(const std::exception& e, const std::string& context = "", 
                    const std::string& session_id = "");
    
    void setErrorCallback(ErrorCallback callback);
    
    // Error statistics
    size_t getErrorCount(ErrorCategory category = ErrorCategory::UNKNOWN) const;
    size_t getErrorCountByCode(const std::string& code) const;
    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    void clearErrorHistory();
    void setMaxHistorySize(size_t max_size);

    static std::string categoryToString(ErrorCategory category);
    static std::string severityToString(ErrorSeverity severity);

private:
    ErrorHandler() = default;
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;
    
    void logError(const ErrorInfo& error) const;
    
    ErrorCallback error_callback_;
    std::vector<ErrorInfo> error_history_;
    std::map<std::string, size_t> code_counts_;
    size_t max_history_size_ = 1000;
    
    mutable std::mutex mutex_;
};

/**
 * RAII error context manager
 */
class ErrorContext {
public:
    ErrorContext(const std::string& context, const std::string& session_id = "");
    ~ErrorContext();
    
    static std::string getCurrentContext();
    static std::string getCurrentSessionId();

private:
    std::string previous_context_;
    std::string previous_session_id_;
    
    static thread_local std::string current_context_;
    static thread_local std::string current_session_id_;
};

#define VB_REPORT_ERROR(category, severity, message, details) \
    do { \
        ::voicebridge::utils::ErrorInfo vb_error_(category, severity, message, details, \
                       ::voicebridge::utils::ErrorContext::getCurrentContext(), \
                       ::voicebridge::utils::ErrorContext::getCurrentSessionId()); \
        ::voicebridge::utils::ErrorHandler::getInstance().reportError(vb_error_); \
    } while(0)

} // namespace utils
} // namespace voicebridge
