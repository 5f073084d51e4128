#include "backend/gradingClient.hpp"

#include <spdlog/spdlog.h>

#include <nlohmann/json.hpp>

namespace bubbler::backend {

BackendError::BackendError(const int status, std::string body, const std::string& message)
        : std::runtime_error("Grading backend: " + message), m_status{status}, m_body{std::move(body)} {
}

EvaluateRequest buildEvaluateRequest(const BackendConfig& config, const std::string_view submissionId, const report::EvaluationPayload& payload) {
	if (submissionId.empty()) {
		throw std::invalid_argument("submission id must not be empty");
	}

	std::string base = config.apiBase;
	while (!base.empty() && base.back() == '/') {
		base.pop_back();
	}
	if (base.empty()) {
		throw std::invalid_argument("API base URL must not be empty");
	}

	EvaluateRequest request;
	request.url = base + "/exam/evaluate/" + std::string(submissionId);
	request.headers.emplace_back("Content-Type", "application/json");
	if (config.token && !config.token->empty()) {
		request.headers.emplace_back("Authorization", "Bearer " + *config.token);
	}
	request.body = nlohmann::json(payload).dump();
	return request;
}

BackendResponse evaluate(GradingClient& client, const BackendConfig& config, const std::string_view submissionId, const report::EvaluationPayload& payload) {
	const EvaluateRequest request = buildEvaluateRequest(config, submissionId, payload);
	spdlog::info("Submitting {} key entries and {} student answers to {}", payload.answerKey.size(), payload.studentAnswers.size(), request.url);

	BackendResponse response = client.submit(request);
	spdlog::debug("Backend answered {} ({} bytes)", response.status, response.body.size());
	return response;
}

} // namespace bubbler::backend
