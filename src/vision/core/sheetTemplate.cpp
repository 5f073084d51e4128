#include "vision/core/sheetTemplate.hpp"
#include "vision/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <fstream>
#include <string>
#include <system_error>
#include <unordered_set>

namespace bubbler::vision::core {

static unsigned parseQuestionNumber(const std::string& key) {
	unsigned value      = 0u;
	const char* first   = key.data();
	const char* last    = key.data() + key.size();
	const auto [ptr, ec] = std::from_chars(first, last, value);
	if (key.empty() || ec != std::errc{} || ptr != last || value == 0u) {
		throw TemplateError("question key '" + key + "' is not a positive integer");
	}
	return value;
}

static cv::Point2f parseCenter(const nlohmann::ordered_json& value, const std::string& where) {
	if (!value.is_array() || value.size() != 2u || !value[0].is_number() || !value[1].is_number()) {
		throw TemplateError(where + ": center must be an [x, y] number pair");
	}
	return {value[0].get<float>(), value[1].get<float>()};
}

void SheetTemplate::add(const unsigned questionNumber, const char option, const cv::Point2f center) {
	if (questionNumber == 0u) {
		throw TemplateError("question numbers start at 1");
	}
	if (option < 'A' || option > 'Z') {
		throw TemplateError("question " + std::to_string(questionNumber) + ": option must be an uppercase letter");
	}

	const auto duplicate = std::any_of(m_entries.begin(), m_entries.end(), [&](const TemplateEntry& e) {
		return e.questionNumber == questionNumber && e.option == option;
	});
	if (duplicate) {
		throw TemplateError("question " + std::to_string(questionNumber) + ": option " + std::string(1, option) + " defined twice");
	}

	m_entries.push_back({questionNumber, option, center});
}

std::vector<unsigned> SheetTemplate::questions() const {
	std::vector<unsigned> result;
	std::unordered_set<unsigned> seen;
	for (const auto& entry: m_entries) {
		if (seen.insert(entry.questionNumber).second) {
			result.push_back(entry.questionNumber);
		}
	}
	return result;
}

std::size_t SheetTemplate::questionCount() const {
	return questions().size();
}

SheetTemplate SheetTemplate::fromJson(const nlohmann::ordered_json& document) {
	if (!document.is_object()) {
		throw TemplateError("document root must be an object of questions");
	}

	SheetTemplate sheet;
	for (const auto& [questionKey, options]: document.items()) {
		const unsigned question = parseQuestionNumber(questionKey);
		const std::string where = "question " + questionKey;

		if (!options.is_object() || options.empty()) {
			throw TemplateError(where + ": needs at least one option");
		}

		for (const auto& [optionKey, center]: options.items()) {
			if (optionKey.size() != 1u) {
				throw TemplateError(where + ": option '" + optionKey + "' is not a single letter");
			}
			sheet.add(question, optionKey[0], parseCenter(center, where + " option " + optionKey));
		}
	}

	spdlog::debug("Parsed template with {} questions and {} bubbles", sheet.questionCount(), sheet.entries().size());
	return sheet;
}

SheetTemplate SheetTemplate::load(const std::filesystem::path& path) {
	std::ifstream stream(path);
	if (!stream) {
		throw TemplateError("cannot open " + path.string());
	}

	nlohmann::ordered_json document;
	try {
		document = nlohmann::ordered_json::parse(stream);
	} catch (const nlohmann::json::parse_error& e) {
		throw TemplateError(path.string() + ": " + e.what());
	}
	return fromJson(document);
}

SheetTemplate exampleTemplate() {
	static constexpr char OPTIONS[] = {'A', 'B', 'C', 'D'};

	SheetTemplate sheet;
	for (unsigned question = 1u; question <= 3u; ++question) {
		const float y = 400.0f + 50.0f * static_cast<float>(question - 1u);
		float x       = 200.0f;
		for (const char option: OPTIONS) {
			sheet.add(question, option, {x, y});
			x += 60.0f;
		}
	}
	return sheet;
}

} // namespace bubbler::vision::core
