#include "calculator.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>

namespace {

constexpr int kMaxNestingDepth = 256;

class Parser {
  public:
    explicit Parser(const std::string &text) : m_Text(text) {}

    double Parse() {
        double value = Expression();
        SkipSpace();
        if (m_Pos != m_Text.size()) {
            throw std::runtime_error(fmt::format("unexpected '{}' at {}", m_Text[m_Pos], m_Pos));
        }
        return value;
    }

  private:
    struct DepthGuard {
        explicit DepthGuard(int &depth) : m_Depth(depth) {
            if (++m_Depth > kMaxNestingDepth) {
                --m_Depth;
                throw std::runtime_error("expression nested too deeply");
            }
        }
        ~DepthGuard() {
            --m_Depth;
        }
        int &m_Depth;
    };

    void SkipSpace() {
        while (m_Pos < m_Text.size() && std::isspace(static_cast<unsigned char>(m_Text[m_Pos]))) {
            m_Pos++;
        }
    }

    bool Accept(char c) {
        SkipSpace();
        if (m_Pos < m_Text.size() && m_Text[m_Pos] == c) {
            m_Pos++;
            return true;
        }
        return false;
    }

    double Expression() {
        double value = Term();
        while (true) {
            if (Accept('+')) {
                value += Term();
            } else if (Accept('-')) {
                value -= Term();
            } else {
                return value;
            }
        }
    }

    double Term() {
        double value = Unary();
        while (true) {
            if (Accept('*')) {
                value *= Unary();
            } else if (Accept('/')) {
                const double rhs = Unary();
                if (rhs == 0.0) {
                    throw std::runtime_error("division by zero");
                }
                value /= rhs;
            } else if (Accept('%')) {
                const double rhs = Unary();
                if (rhs == 0.0) {
                    throw std::runtime_error("modulo by zero");
                }
                value = std::fmod(value, rhs);
            } else {
                return value;
            }
        }
    }

    // Every recursion path goes through Unary, so this bounds the stack.
    double Unary() {
        DepthGuard guard(m_Depth);
        if (Accept('-')) {
            return -Unary();
        }
        if (Accept('+')) {
            return Unary();
        }
        return Primary();
    }

    double Primary() {
        if (Accept('(')) {
            DepthGuard guard(m_Depth);
            double value = Expression();
            if (!Accept(')')) {
                throw std::runtime_error("missing ')'");
            }
            return value;
        }

        SkipSpace();
        const size_t start = m_Pos;
        while (m_Pos < m_Text.size() &&
               (std::isdigit(static_cast<unsigned char>(m_Text[m_Pos])) || m_Text[m_Pos] == '.')) {
            m_Pos++;
        }
        if (start == m_Pos) {
            if (m_Pos >= m_Text.size()) {
                throw std::runtime_error("unexpected end of expression");
            }
            throw std::runtime_error(fmt::format("unexpected '{}' at {}", m_Text[m_Pos], m_Pos));
        }

        const std::string number = m_Text.substr(start, m_Pos - start);
        char *end = nullptr;
        const double value = std::strtod(number.c_str(), &end);
        if (end != number.c_str() + number.size()) {
            throw std::runtime_error("invalid number '" + number + "'");
        }
        return value;
    }

    const std::string &m_Text;
    size_t m_Pos = 0;
    int m_Depth = 0;
};

} // namespace

// ─────────────────────────────────────
std::string SanitizeExpression(const std::string &expression) {
    std::string out;
    out.reserve(expression.size());
    for (char c : expression) {
        if (std::isdigit(static_cast<unsigned char>(c)) ||
            std::isspace(static_cast<unsigned char>(c)) ||
            std::string("+-*/().%").find(c) != std::string::npos) {
            out.push_back(c);
        }
    }
    return out;
}

// ─────────────────────────────────────
double Calculate(const std::string &expression) {
    const std::string clean = SanitizeExpression(expression);
    Parser parser(clean);
    return parser.Parse();
}

// ─────────────────────────────────────
std::string FormatNumber(double value) {
    if (std::isfinite(value) && std::floor(value) == value && std::fabs(value) < 1e15) {
        return fmt::format("{}", static_cast<long long>(value));
    }
    return fmt::format("{}", value);
}
