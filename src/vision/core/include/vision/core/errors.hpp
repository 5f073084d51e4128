#pragma once

#include <stdexcept>
#include <string>

namespace bubbler::vision::core {

//! Base class of all errors raised by the extraction pipeline.
class Error : public std::runtime_error {
public:
	explicit Error(const std::string& message) : std::runtime_error(message) {
	}
};

//! Input image could not be decoded. Fatal for the run.
class ImageLoadError : public Error {
public:
	explicit ImageLoadError(const std::string& message) : Error("Image load failed: " + message) {
	}
};

//! Learned model artifact missing or corrupt. Recovered by falling back to the heuristic classifier.
class ModelLoadError : public Error {
public:
	explicit ModelLoadError(const std::string& message) : Error("Model load failed: " + message) {
	}
};

//! Malformed sheet template.
class TemplateError : public Error {
public:
	explicit TemplateError(const std::string& message) : Error("Invalid template: " + message) {
	}
};

//! Classifier produced output that does not match its input batch.
class InferenceError : public Error {
public:
	explicit InferenceError(const std::string& message) : Error("Inference failed: " + message) {
	}
};

} // namespace bubbler::vision::core
