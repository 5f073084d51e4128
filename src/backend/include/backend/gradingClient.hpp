#pragma once

#include "report/records.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bubbler::backend {

struct BackendConfig {
	std::string apiBase{"http://localhost:8080/api/v1/examiner"}; //!< Examiner API root, without trailing slash.
	std::optional<std::string> token{};                          //!< Sent as "Authorization: Bearer <token>" if set.
};

//! Fully prepared HTTP request. Building it needs no network.
struct EvaluateRequest {
	std::string url;
	std::vector<std::pair<std::string, std::string>> headers;
	std::string body;
};

//! Raw backend answer. The body is passed on unmodified.
struct BackendResponse {
	int status{0};
	std::string body{};
};

//! Transport failure or non-2xx answer of the grading backend. Keeps the response body for diagnostics.
class BackendError : public std::runtime_error {
public:
	BackendError(int status, std::string body, const std::string& message);

	int status() const {
		return m_status;
	}
	const std::string& body() const {
		return m_body;
	}

private:
	int m_status;       //!< HTTP status, 0 if no response arrived.
	std::string m_body; //!< Response body as received.
};

//! Sends an evaluation request. The only side-effecting seam of the project.
class GradingClient {
public:
	virtual ~GradingClient() = default;

	//! Blocking call without retry. Throws BackendError unless the backend answers 2xx.
	virtual BackendResponse submit(const EvaluateRequest& request) = 0;
};

/*! Build POST {apiBase}/exam/evaluate/{submissionId} with body {"answerKey": [...], "studentAnswers": [...]}.
 *  Throws std::invalid_argument for an empty submission id or API base.
 */
EvaluateRequest buildEvaluateRequest(const BackendConfig& config, std::string_view submissionId, const report::EvaluationPayload& payload);

//! Build the request and submit it through client.
BackendResponse evaluate(GradingClient& client, const BackendConfig& config, std::string_view submissionId, const report::EvaluationPayload& payload);

} // namespace bubbler::backend
