#ifndef SRC_SKED_ERROR_REPORTER_HPP_
#define SRC_SKED_ERROR_REPORTER_HPP_

#include <string>
#include <vector>

namespace sked {

// Collects the errors raised by interval and timeline operations. Operations that fail return false (or an empty
// optional) to their caller and leave the details here.
class ErrorReporter {
public:
    enum class Kind {
        // Misuse of a Timeline: stale or foreign sections, unprepared or out-of-bounds cuts, periodic spans longer
        // than their period.
        kTimeline,
        // Arguments that can not be satisfied: spans not exactly covered by free space, empty generations, bad k or
        // minimum sizes, malformed span lists.
        kValue
    };

    struct Error {
        Kind kind;
        std::string message;
    };

    // A suppressed reporter still collects errors but keeps them out of the log. Tests that provoke failures use one.
    ErrorReporter(bool suppress = false);
    ~ErrorReporter();

    void addError(Kind kind, const std::string& message);
    void addTimelineError(const std::string& message) { addError(Kind::kTimeline, message); }
    void addValueError(const std::string& message) { addError(Kind::kValue, message); }

    size_t errorCount() const { return m_errors.size(); }
    size_t errorCount(Kind kind) const;
    bool ok() const { return m_errors.size() == 0; }
    const std::vector<Error>& errors() const { return m_errors; }
    // Must not be called when ok().
    const Error& lastError() const;

    void clear() { m_errors.clear(); }

    static const char* kindName(Kind kind);

private:
    bool m_suppress;
    std::vector<Error> m_errors;
};

} // namespace sked

#endif // SRC_SKED_ERROR_REPORTER_HPP_
