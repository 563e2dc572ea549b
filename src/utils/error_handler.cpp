#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <sstream>
#include <iomanip>
#include <random>
#include <algorithm>

namespace voicebridge {
namespace utils {

thread_local std::string ErrorContext::current_context_;
thread_local std::string ErrorContext::current_session_id_;

ErrorInfo::ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg, 
                     const std::string& det, const std::string& ctx, const std::string& sid,
                     const std::string& errorCode)
    : category(cat), severity(sev), code(errorCode), message(msg), details(det), context(ctx), 
      timestamp(std::chrono::steady_clock::now()), session_id(sid) {
    
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);
    
    std::stringstream ss;
    ss << "err_";
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    id = ss.str();
}

VoiceBridgeException::VoiceBridgeException(const ErrorInfo& error_info) 
    : error_info_(error_info) {
}

const char* VoiceBridgeException::what() const noexcept {
    if (what_message_.empty()) {
        what_message_ = error_info_.message;
        if (!error_info_.details.empty()) {
            what_message_ += ": " + error_info_.details;
        }
    }
    return what_message_.c_str();
}

CapacityExceededException::CapacityExceededException(const std::string& message, const std::string& client_key)
    : VoiceBridgeException(ErrorInfo(ErrorCategory::ADMISSION, ErrorSeverity::WARNING,
                                     message, client_key.empty() ? "" : "client " + client_key,
                                     "Admission", "", error_codes::CAPACITY_EXCEEDED)) {
}

UnknownSessionException::UnknownSessionException(const std::string& session_id)
    : VoiceBridgeException(ErrorInfo(ErrorCategory::SESSION, ErrorSeverity::WARNING,
                                     "Unknown or inactive session", session_id,
                                     "SessionManager", session_id, error_codes::UNKNOWN_SESSION)) {
}

ProviderTimeoutException::ProviderTimeoutException(const std::string& provider, std::chrono::milliseconds timeout)
    : VoiceBridgeException(ErrorInfo(ErrorCategory::PROVIDER, ErrorSeverity::WARNING,
                                     "Provider timed out", provider + " after " + std::to_string(timeout.count()) + "ms",
                                     "Provider", "", error_codes::PROVIDER_TIMEOUT)) {
}

ProviderException::ProviderException(const std::string& provider, const std::string& message)
    : VoiceBridgeException(ErrorInfo(ErrorCategory::PROVIDER, ErrorSeverity::WARNING,
                                     "Provider error", provider + ": " + message,
                                     "Provider", "", error_codes::PROVIDER_ERROR)) {
}

AllProvidersExhaustedException::AllProvidersExhaustedException(const std::string& session_id, uint64_t sequence)
    : VoiceBridgeException(ErrorInfo(ErrorCategory::PROVIDER, ErrorSeverity::ERROR,
                                     "All providers exhausted", "sequence " + std::to_string(sequence),
                                     "ProviderDispatcher", session_id, error_codes::ALL_PROVIDERS_EXHAUSTED)) {
}

QueueUnavailableException::QueueUnavailableException(const std::string& message)
    : VoiceBridgeException(ErrorInfo(ErrorCategory::QUEUE, ErrorSeverity::WARNING,
                                     "Queue unavailable", message, "QueueBridge", "",
                                     error_codes::QUEUE_UNAVAILABLE)) {
}

ConfigException::ConfigException(const std::string& message, const std::string& path)
    : VoiceBridgeException(ErrorInfo(ErrorCategory::CONFIG, ErrorSeverity::CRITICAL,
                                     message, path, "Config")) {
}

ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::reportError(const ErrorInfo& error) {
    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        
        logError(error);
        
        error_history_.push_back(error);
        if (error_history_.size() > max_history_size_) {
            error_history_.erase(error_history_.begin());
        }
        if (!error.code.empty()) {
            code_counts_[error.code]++;
        }
        callback = error_callback_;
    }
    
    // Invoked outside the lock so callbacks may query the handler
    if (callback) {
        try {
            callback(error);
        } catch (const std::exception& e) {
            Logger::error("Error in error callback: " + std::string(e.what()));
        }
    }
}

void ErrorHandler::reportError(const std::exception& e, const std::string& context, 
                              const std::string& session_id) {
    if (auto* vb = dynamic_cast<const VoiceBridgeException*>(&e)) {
        ErrorInfo info = vb->getErrorInfo();
        if (!context.empty()) {
            info.context = context;
        }
        if (!session_id.empty()) {
            info.session_id = session_id;
        }
        reportError(info);
        return;
    }
    
    ErrorInfo error(ErrorCategory::UNKNOWN, ErrorSeverity::ERROR, e.what(), "", context, session_id);
    reportError(error);
}

void ErrorHandler::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_callback_ = std::move(callback);
}

size_t ErrorHandler::getErrorCount(ErrorCategory category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (category == ErrorCategory::UNKNOWN) {
        return error_history_.size();
    }
    
    return std::count_if(error_history_.begin(), error_history_.end(),
                        [category](const ErrorInfo& error) {
                            return error.category == category;
                        });
}

size_t ErrorHandler::getErrorCountByCode(const std::string& code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = code_counts_.find(code);
    return it != code_counts_.end() ? it->second : 0;
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (error_history_.size() <= count) {
        return error_history_;
    }
    
    return std::vector<ErrorInfo>(error_history_.end() - count, error_history_.end());
}

void ErrorHandler::clearErrorHistory() {
    std::lock_guard<std::mutex> lock(mutex_);
    error_history_.clear();
    code_counts_.clear();
}

void ErrorHandler::setMaxHistorySize(size_t max_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_history_size_ = std::max<size_t>(1, max_size);
    while (error_history_.size() > max_history_size_) {
        error_history_.erase(error_history_.begin());
    }
}

std::string ErrorHandler::categoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::WEBSOCKET: return "WebSocket";
        case ErrorCategory::ADMISSION: return "Admission";
        case ErrorCategory::SESSION: return "Session";
        case ErrorCategory::AUDIO_PROCESSING: return "Audio";
        case ErrorCategory::PROVIDER: return "Provider";
        case ErrorCategory::QUEUE: return "Queue";
        case ErrorCategory::ORDERING: return "Ordering";
        case ErrorCategory::CONFIG: return "Config";
        case ErrorCategory::SYSTEM: return "System";
        case ErrorCategory::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

std::string ErrorHandler::severityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::INFO: return "INFO";
        case ErrorSeverity::WARNING: return "WARN";
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
    }
    return "ERROR";
}

void ErrorHandler::logError(const ErrorInfo& error) const {
    std::stringstream log_message;
    log_message << "[" << error.id << "] " << categoryToString(error.category);
    if (!error.code.empty()) {
        log_message << " (" << error.code << ")";
    }
    log_message << " - " << error.message;
    
    if (!error.details.empty()) {
        log_message << " | Details: " << error.details;
    }
    
    if (!error.context.empty()) {
        log_message << " | Context: " << error.context;
    }
    
    if (!error.session_id.empty()) {
        log_message << " | Session: " << error.session_id;
    }
    
    switch (error.severity) {
        case ErrorSeverity::INFO:
            Logger::info(log_message.str());
            break;
        case ErrorSeverity::WARNING:
            Logger::warn(log_message.str());
            break;
        case ErrorSeverity::ERROR:
        case ErrorSeverity::CRITICAL:
            Logger::error(log_message.str());
            break;
    }
}

ErrorContext::ErrorContext(const std::string& context, const std::string& session_id) 
    : previous_context_(current_context_), previous_session_id_(current_session_id_) {
    current_context_ = context;
    if (!session_id.empty()) {
        current_session_id_ = session_id;
    }
}

ErrorContext::~ErrorContext() {
    current_context_ = previous_context_;
    current_session_id_ = previous_session_id_;
}

std::string ErrorContext::getCurrentContext() {
    return current_context_;
}

std::string ErrorContext::getCurrentSessionId() {
    return current_session_id_;
}

} // namespace utils
} // namespace voicebridge
