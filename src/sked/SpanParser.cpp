#include "sked/SpanParser.hpp"

#include "sked/ErrorReporter.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <cstdlib>
#include <string>
#include <utility>

namespace {

std::string_view trim(std::string_view text) {
    size_t start = text.find_first_not_of(" \t");
    if (start == std::string_view::npos) {
        return std::string_view();
    }
    size_t end = text.find_last_not_of(" \t");
    return text.substr(start, end - start + 1);
}

} // namespace

namespace sked {

SpanParser::SpanParser(std::string_view text, std::shared_ptr<ErrorReporter> errorReporter):
    m_text(text), m_errorReporter(std::move(errorReporter)) {}

bool SpanParser::parse() {
    m_spans.clear();
    if (trim(m_text).empty()) {
        return true;
    }

    size_t start = 0;
    while (start <= m_text.size()) {
        size_t comma = m_text.find(',', start);
        if (comma == std::string_view::npos) {
            comma = m_text.size();
        }
        std::string_view span = trim(m_text.substr(start, comma - start));
        start = comma + 1;

        size_t colon = span.find(':');
        if (colon == std::string_view::npos) {
            m_errorReporter->addValueError(fmt::format("Span '{}' must be written lower:upper", span));
            return false;
        }
        auto lower = parseNumber(span.substr(0, colon), span);
        if (!lower) {
            return false;
        }
        auto upper = parseNumber(span.substr(colon + 1), span);
        if (!upper) {
            return false;
        }
        if (*upper < *lower) {
            m_errorReporter->addValueError(fmt::format("Span '{}' has upper bound below lower bound", span));
            return false;
        }
        m_spans.emplace_back(Interval<double>(*lower, *upper));
    }

    SPDLOG_DEBUG("Parsed {} spans from '{}'", m_spans.size(), m_text);
    return true;
}

std::optional<double> SpanParser::parseNumber(std::string_view number, std::string_view span) {
    // strtod needs a terminated string.
    std::string digits(trim(number));
    if (digits.empty()) {
        m_errorReporter->addValueError(fmt::format("Span '{}' is missing a bound", span));
        return std::nullopt;
    }
    char* end = nullptr;
    double value = std::strtod(digits.c_str(), &end);
    if (end != digits.c_str() + digits.size()) {
        m_errorReporter->addValueError(fmt::format("Bound '{}' of span '{}' is not a number", digits, span));
        return std::nullopt;
    }
    return value;
}

} // namespace sked
