#ifndef QB_MODULE_CORS_LOGGER_H_
#define QB_MODULE_CORS_LOGGER_H_

#include <qb/io.h> // This should include nanolog.h if QB_LOGGER is defined

// Common prefix for all qbm-cors logs.
#define QBM_CORS_LOG_PREFIX "[qbm-cors] "

#ifdef QB_LOGGER

#define LOG_CORS_TRACE(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::DEBUG) && \
           NANO_LOG(nanolog::LogLevel::DEBUG) << QBM_CORS_LOG_PREFIX << "TRACE: " << X)

#define LOG_CORS_DEBUG(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::DEBUG) && \
           NANO_LOG(nanolog::LogLevel::DEBUG) << QBM_CORS_LOG_PREFIX << "DEBUG: " << X)

#define LOG_CORS_INFO(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::INFO) && \
           NANO_LOG(nanolog::LogLevel::INFO) << QBM_CORS_LOG_PREFIX << "INFO: " << X)

#define LOG_CORS_WARN(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::WARN) && \
           NANO_LOG(nanolog::LogLevel::WARN) << QBM_CORS_LOG_PREFIX << "WARN: " << X)

#define LOG_CORS_ERROR(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::CRIT) && \
           NANO_LOG(nanolog::LogLevel::CRIT) << QBM_CORS_LOG_PREFIX << "ERROR: " << X) // nanolog has no ERROR level

#define LOG_CORS_CRIT(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::CRIT) && \
           NANO_LOG(nanolog::LogLevel::CRIT) << QBM_CORS_LOG_PREFIX << "CRITICAL: " << X)

#else // QB_LOGGER not defined, fallback to QB_STDOUT_LOG or no-op

#ifdef QB_STDOUT_LOG
#define LOG_CORS_TRACE(X) qb::io::cout() << QBM_CORS_LOG_PREFIX << "TRACE: " << X << std::endl
#define LOG_CORS_DEBUG(X) qb::io::cout() << QBM_CORS_LOG_PREFIX << "DEBUG: " << X << std::endl
#define LOG_CORS_INFO(X)  qb::io::cout() << QBM_CORS_LOG_PREFIX << "INFO: " << X << std::endl
#define LOG_CORS_WARN(X)  qb::io::cout() << QBM_CORS_LOG_PREFIX << "WARN: " << X << std::endl
#define LOG_CORS_ERROR(X) qb::io::cerr() << QBM_CORS_LOG_PREFIX << "ERROR: " << X << std::endl
#define LOG_CORS_CRIT(X)  qb::io::cerr() << QBM_CORS_LOG_PREFIX << "CRITICAL: " << X << std::endl

#else // QB_STDOUT_LOG not defined, logs are no-ops

#define LOG_CORS_TRACE(X) do {} while (false)
#define LOG_CORS_DEBUG(X) do {} while (false)
#define LOG_CORS_INFO(X)  do {} while (false)
#define LOG_CORS_WARN(X)  do {} while (false)
#define LOG_CORS_ERROR(X) do {} while (false)
#define LOG_CORS_CRIT(X)  do {} while (false)

#endif // QB_STDOUT_LOG
#endif // QB_LOGGER

#endif // QB_MODULE_CORS_LOGGER_H_
