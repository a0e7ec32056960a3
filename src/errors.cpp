#include "seacast/errors.hpp"

#include <sstream>
#include <utility>

namespace seacast {

ForecastError::ForecastError(const std::string &message, Context context)
    : std::runtime_error(render(message, context)), message_(message), context_(std::move(context)) {
}

std::string ForecastError::render(const std::string &message, const Context &context) {
	if (context.empty()) {
		return message;
	}
	std::ostringstream out;
	out << message << " [";
	bool first = true;
	for (const auto &entry : context) {
		if (!first) {
			out << ", ";
		}
		out << entry.first << "=" << entry.second;
		first = false;
	}
	out << "]";
	return out.str();
}

ModelFitFailure::ModelFitFailure(const std::string &stage, std::exception_ptr cause, Context context)
    : ForecastError(describe(stage, cause), std::move(context)), stage_(stage), cause_(std::move(cause)) {
}

void ModelFitFailure::rethrowCause() const {
	if (cause_) {
		std::rethrow_exception(cause_);
	}
	throw std::logic_error("ModelFitFailure has no recorded cause.");
}

std::string ModelFitFailure::describe(const std::string &stage, const std::exception_ptr &cause) {
	std::string detail = "unknown error";
	if (cause) {
		try {
			std::rethrow_exception(cause);
		} catch (const std::exception &e) {
			detail = e.what();
		} catch (...) {
			detail = "non-standard exception";
		}
	}
	return "Model fit failed during " + stage + ": " + detail;
}

} // namespace seacast
