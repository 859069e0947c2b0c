#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace harbor::control {
struct LogConfig;
}

namespace harbor::logging {

// Start the Quill backend thread (called once at startup)
void init_logging_system();

// Create the process logger from config ("stdout" or a log directory)
// Subsequent calls return the already created logger
quill::Logger* init_logger(const harbor::control::LogConfig& config);

// Shutdown logging system (called at exit)
void shutdown_logging();

// UUID v4 base plus per-thread counter: {uuid}#{n}
std::string generate_correlation_id();

// Validate correlation ID format
bool is_valid_correlation_id(std::string_view id);

// Process logger (nullptr until init_logger has run)
quill::Logger* get_current_logger();

// Request completion logging
#define LOG_REQUEST(logger, method, path, status, duration_us, client_ip, correlation_id) \
    LOG_INFO(logger,                                                                      \
             "Request completed: method={}, path={}, status={}, "                         \
             "duration_us={}, client_ip={}, correlation_id={}",                           \
             method, path, status, duration_us, client_ip, correlation_id)

// Error logging with context
#define LOG_ERROR_CTX(logger, message, correlation_id, error_code, error_detail)        \
    LOG_ERROR(logger, "{}: correlation_id={}, error_code={}, error_detail={}", message, \
              correlation_id, error_code, error_detail)

// Upstream connection event logging
#define LOG_UPSTREAM(logger, event, pool, backend_host, backend_port, correlation_id) \
    LOG_INFO(logger, "Upstream {}: pool={}, backend={}:{}, correlation_id={}", event,  \
             pool, backend_host, backend_port, correlation_id)

}  // namespace harbor::logging
