// File: CampaignError.hpp
// Description: Error kinds raised by the campaign core. Every failure that
// reaches a client goes through CampaignError so the session layer can turn
// it into a "SERVER:ERROR:<KIND>:<message>" reply.
#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind : int {
	NOT_FOUND = 0,
	ILLEGAL_ACTION,
	CONCURRENCY_CONFLICT,
	PERSISTENCE_FAILURE,
	VALIDATION_ERROR
};

inline const char* error_kind_name(ErrorKind kind)
{
	switch (kind) {
	case ErrorKind::NOT_FOUND:            return "NOT_FOUND";
	case ErrorKind::ILLEGAL_ACTION:       return "ILLEGAL_ACTION";
	case ErrorKind::CONCURRENCY_CONFLICT: return "CONCURRENCY_CONFLICT";
	case ErrorKind::PERSISTENCE_FAILURE:  return "PERSISTENCE_FAILURE";
	case ErrorKind::VALIDATION_ERROR:     return "VALIDATION_ERROR";
	}
	return "UNKNOWN";
}

class CampaignError : public std::runtime_error
{
	ErrorKind kind_;

public:
	CampaignError(ErrorKind kind, const std::string& message)
		: std::runtime_error(message), kind_(kind) {
	}

	ErrorKind kind() const { return kind_; }
};

// Short helpers so call sites read like the rule they enforce
[[noreturn]] inline void throw_not_found(const std::string& what)
{
	throw CampaignError(ErrorKind::NOT_FOUND, what);
}

[[noreturn]] inline void throw_illegal(const std::string& why)
{
	throw CampaignError(ErrorKind::ILLEGAL_ACTION, why);
}

[[noreturn]] inline void throw_invalid(const std::string& why)
{
	throw CampaignError(ErrorKind::VALIDATION_ERROR, why);
}
