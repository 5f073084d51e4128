#include "backend/qtGradingClient.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QEventLoop>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QUrl>
#include <QtNetwork/QNetworkAccessManager>
#include <QtNetwork/QNetworkReply>
#include <QtNetwork/QNetworkRequest>

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace bubbler::backend {

struct ReplyDeleter {
	void operator()(QNetworkReply* reply) const {
		reply->deleteLater();
	}
};

BackendResponse QtGradingClient::submit(const EvaluateRequest& request) {
	const QUrl url(QString::fromStdString(request.url));
	if (!url.isValid()) {
		throw BackendError(0, {}, "invalid URL " + request.url);
	}

	QNetworkRequest httpRequest(url);
	for (const auto& [name, value]: request.headers) {
		httpRequest.setRawHeader(QByteArray::fromStdString(name), QByteArray::fromStdString(value));
	}

	QNetworkAccessManager manager;
	std::unique_ptr<QNetworkReply, ReplyDeleter> reply{manager.post(httpRequest, QByteArray::fromStdString(request.body))};

	QEventLoop loop;
	QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
	if (!reply->isFinished()) {
		loop.exec();
	}

	BackendResponse response;
	response.status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
	response.body   = reply->readAll().toStdString();

	if (response.status == 0) {
		throw BackendError(0, std::move(response.body), "no response from " + request.url + ": " + reply->errorString().toStdString());
	}
	if (response.status < 200 || response.status >= 300) {
		spdlog::error("Backend rejected evaluation with HTTP {}: {}", response.status, response.body);
		throw BackendError(response.status, std::move(response.body), "HTTP " + std::to_string(response.status) + " from " + request.url);
	}

	return response;
}

} // namespace bubbler::backend
