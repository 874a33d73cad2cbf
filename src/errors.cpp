#include "scicalc/errors.hpp"

#include <sstream>

namespace scicalc {

namespace {
// Текст для what(): сообщение и контекст в виде "ключ: значение | ..."
std::string composeWhat(const std::string& message, const CalcError::Context& context) {
    if (context.empty()) {
        return message;
    }
    std::string result = message + " (";
    bool first = true;
    for (const auto& [key, value] : context) {
        if (!first) {
            result += " | ";
        }
        result += key + ": " + value;
        first = false;
    }
    result += ")";
    return result;
}

CalcError::Context withPosition(CalcError::Context context, std::size_t position) {
    context["position"] = std::to_string(position);
    return context;
}
}

const char* toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Syntax:
        return "syntax";
    case ErrorKind::Domain:
        return "domain";
    case ErrorKind::Dimensionality:
        return "dimensionality";
    case ErrorKind::Evaluation:
        return "evaluation";
    }
    return "unknown";
}

CalcError::CalcError(ErrorKind kind, std::string message, Context context, std::string hint)
    : std::runtime_error(composeWhat(message, context)),
      errorKind(kind),
      text(std::move(message)),
      details(std::move(context)),
      remedy(std::move(hint)) {}

SyntaxError::SyntaxError(std::string message, std::size_t position, Context context, std::string hint)
    : CalcError(ErrorKind::Syntax, std::move(message), withPosition(std::move(context), position),
                std::move(hint)),
      offset(position) {}

std::string formatNumber(double value) {
    std::ostringstream stream;
    stream.precision(12);
    stream << value;
    return stream.str();
}

} // namespace scicalc
