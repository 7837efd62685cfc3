#include "sked/ErrorReporter.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <cassert>

namespace sked {

ErrorReporter::ErrorReporter(bool suppress): m_suppress(suppress) {}

ErrorReporter::~ErrorReporter() {}

void ErrorReporter::addError(Kind kind, const std::string& message) {
    if (!m_suppress) {
        SPDLOG_ERROR("{}: {}", kindName(kind), message);
    }
    m_errors.emplace_back(Error{kind, message});
}

size_t ErrorReporter::errorCount(Kind kind) const {
    return std::count_if(m_errors.begin(), m_errors.end(), [kind](const Error& e) { return e.kind == kind; });
}

const ErrorReporter::Error& ErrorReporter::lastError() const {
    assert(!ok());
    return m_errors.back();
}

const char* ErrorReporter::kindName(Kind kind) {
    switch (kind) {
        case Kind::kTimeline:
            return "Timeline_Error";

        case Kind::kValue:
            return "ValueError";
    }
    return "Error";
}

} // namespace sked
