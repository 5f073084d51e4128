#pragma once

#include "backend/gradingClient.hpp"

namespace bubbler::backend {

//! GradingClient on top of QNetworkAccessManager.
//! \note Spins a local QEventLoop until the reply finished. A QCoreApplication must exist.
class QtGradingClient final : public GradingClient {
public:
	BackendResponse submit(const EvaluateRequest& request) override;
};

} // namespace bubbler::backend
