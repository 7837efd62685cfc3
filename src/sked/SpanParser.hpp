#ifndef SRC_SKED_SPAN_PARSER_HPP_
#define SRC_SKED_SPAN_PARSER_HPP_

#include "sked/Interval.hpp"

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace sked {

class ErrorReporter;

// Parses a comma-separated list of spans written "lower:upper", for instance "100:120, 300:330". Whitespace around
// numbers is ignored and an empty string is an empty list.
class SpanParser {
public:
    SpanParser() = delete;
    SpanParser(std::string_view text, std::shared_ptr<ErrorReporter> errorReporter);
    ~SpanParser() = default;

    // Returns false and adds a ValueError on the first malformed span. Spans before it are kept.
    bool parse();

    const std::vector<Interval<double>>& spans() const { return m_spans; }

private:
    std::optional<double> parseNumber(std::string_view number, std::string_view span);

    std::string_view m_text;
    std::shared_ptr<ErrorReporter> m_errorReporter;
    std::vector<Interval<double>> m_spans;
};

} // namespace sked

#endif // SRC_SKED_SPAN_PARSER_HPP_
