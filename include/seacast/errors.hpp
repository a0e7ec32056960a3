#pragma once

#include <exception>
#include <map>
#include <stdexcept>
#include <string>

namespace seacast {

/**
 * @class ForecastError
 * @brief Base class of every fatal error raised by the forecasting pipeline.
 *
 * Carries a key/value context (resolved column names, row counts, paths) which is
 * also appended to what() so a single log line is enough for diagnosis.
 */
class ForecastError : public std::runtime_error {
public:
	using Context = std::map<std::string, std::string>;

	ForecastError(const std::string &message, Context context = {});

	const std::string &message() const {
		return message_;
	}

	const Context &context() const {
		return context_;
	}

private:
	static std::string render(const std::string &message, const Context &context);

	std::string message_;
	Context context_;
};

/// The date or target column could not be determined.
class SchemaInferenceError : public ForecastError {
public:
	using ForecastError::ForecastError;
};

/// No usable rows remain after cleaning, or a requested column does not exist.
class DataPreparationError : public ForecastError {
public:
	using ForecastError::ForecastError;
};

/// The auxiliary regressor table is unusable. Never escapes RegressorSynthesizer::synthesize.
class RegressorSynthesisFailure : public ForecastError {
public:
	using ForecastError::ForecastError;
};

/// An input table could not be read or parsed.
class InputReadError : public ForecastError {
public:
	using ForecastError::ForecastError;
};

/// An output artifact could not be written.
class OutputWriteError : public ForecastError {
public:
	using ForecastError::ForecastError;
};

/**
 * @class ModelFitFailure
 * @brief The forecasting capability failed while fitting or predicting.
 *
 * The original exception is kept and can be inspected with rethrowCause().
 */
class ModelFitFailure : public ForecastError {
public:
	ModelFitFailure(const std::string &stage, std::exception_ptr cause, Context context = {});

	const std::string &stage() const {
		return stage_;
	}

	std::exception_ptr cause() const {
		return cause_;
	}

	[[noreturn]] void rethrowCause() const;

private:
	static std::string describe(const std::string &stage, const std::exception_ptr &cause);

	std::string stage_;
	std::exception_ptr cause_;
};

} // namespace seacast
