#ifndef QB_MODULE_VALIDATION_LOGGER_H_
#define QB_MODULE_VALIDATION_LOGGER_H_

#include <qb/io.h> // Pulls in nanolog.h when QB_LOGGER is defined

// Every qbm-validation log line starts with this tag.
#define QBM_VALIDATION_LOG_PREFIX "[qbm-validation] "

#ifdef QB_LOGGER

// nanolog has no TRACE level, traces go to DEBUG with their own tag
#define LOG_VALIDATION_TRACE(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::DEBUG) && \
           NANO_LOG(nanolog::LogLevel::DEBUG) << QBM_VALIDATION_LOG_PREFIX << "TRACE: " << X)

#define LOG_VALIDATION_DEBUG(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::DEBUG) && \
           NANO_LOG(nanolog::LogLevel::DEBUG) << QBM_VALIDATION_LOG_PREFIX << "DEBUG: " << X)

#define LOG_VALIDATION_INFO(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::INFO) && \
           NANO_LOG(nanolog::LogLevel::INFO) << QBM_VALIDATION_LOG_PREFIX << "INFO: " << X)

#define LOG_VALIDATION_WARN(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::WARN) && \
           NANO_LOG(nanolog::LogLevel::WARN) << QBM_VALIDATION_LOG_PREFIX << "WARN: " << X)

#define LOG_VALIDATION_ERROR(X) \
    (void)(nanolog::is_logged(nanolog::LogLevel::CRIT) && \
           NANO_LOG(nanolog::LogLevel::CRIT) << QBM_VALIDATION_LOG_PREFIX << "ERROR: " << X)

#else // QB_LOGGER not defined, fallback to QB_STDOUT_LOG or no-op

#ifdef QB_STDOUT_LOG
#define LOG_VALIDATION_TRACE(X) qb::io::cout() << QBM_VALIDATION_LOG_PREFIX << "TRACE: " << X << std::endl
#define LOG_VALIDATION_DEBUG(X) qb::io::cout() << QBM_VALIDATION_LOG_PREFIX << "DEBUG: " << X << std::endl
#define LOG_VALIDATION_INFO(X)  qb::io::cout() << QBM_VALIDATION_LOG_PREFIX << "INFO: " << X << std::endl
#define LOG_VALIDATION_WARN(X)  qb::io::cout() << QBM_VALIDATION_LOG_PREFIX << "WARN: " << X << std::endl
#define LOG_VALIDATION_ERROR(X) qb::io::cerr() << QBM_VALIDATION_LOG_PREFIX << "ERROR: " << X << std::endl

#else // QB_STDOUT_LOG not defined, logs are no-ops

#define LOG_VALIDATION_TRACE(X) do {} while (false)
#define LOG_VALIDATION_DEBUG(X) do {} while (false)
#define LOG_VALIDATION_INFO(X)  do {} while (false)
#define LOG_VALIDATION_WARN(X)  do {} while (false)
#define LOG_VALIDATION_ERROR(X) do {} while (false)

#endif // QB_STDOUT_LOG
#endif // QB_LOGGER

#endif // QB_MODULE_VALIDATION_LOGGER_H_
