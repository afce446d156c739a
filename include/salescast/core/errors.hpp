#pragma once

#include <stdexcept>
#include <string>

namespace salescast::core {

/// Base class of every error the engine raises on purpose.
class SalescastError : public std::runtime_error {
public:
	explicit SalescastError(const std::string &message) : std::runtime_error(message) {
	}
};

/// Model artifact, feature manifest or config file missing or malformed.
class ConfigurationError : public SalescastError {
public:
	explicit ConfigurationError(const std::string &message) : SalescastError("Configuration error: " + message) {
	}
};

/// No historical rows are available to seed a requested period.
class NoContextError : public SalescastError {
public:
	explicit NoContextError(const std::string &message) : SalescastError("No context: " + message) {
	}
};

/// The predictor threw, or its input/output did not honour the manifest contract.
class PredictionFailure : public SalescastError {
public:
	explicit PredictionFailure(const std::string &message) : SalescastError("Prediction failure: " + message) {
	}
};

/// Malformed request input (dates, presets, counts).
class ValidationError : public SalescastError {
public:
	explicit ValidationError(const std::string &message) : SalescastError("Validation error: " + message) {
	}
};

/// The historical store could not be opened, written or queried.
class StorageError : public SalescastError {
public:
	explicit StorageError(const std::string &message) : SalescastError("Storage error: " + message) {
	}
};

} // namespace salescast::core
