#pragma once

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>

// ============================================================================
// Minimal arithmetic evaluator for rendered raster-calculator expressions
// ============================================================================
// Grammar:
//   expr    := term (('+' | '-') term)*
//   term    := unary (('*' | '/') unary)*
//   unary   := '-' unary | power
//   power   := primary ('^' unary)?
//   primary := number | '(' expr ')'
// ============================================================================

namespace splitwindow::test {

class ExpressionEvaluator {
public:
    static double Evaluate(const std::string& text) {
        ExpressionEvaluator parser(text);
        double value = parser.ParseExpr();
        parser.SkipSpaces();
        if (parser.m_pos != parser.m_text.size()) {
            throw std::runtime_error("Trailing input at offset " + std::to_string(parser.m_pos));
        }
        return value;
    }

private:
    explicit ExpressionEvaluator(const std::string& text) : m_text(text) {}

    void SkipSpaces() {
        while (m_pos < m_text.size() && std::isspace(static_cast<unsigned char>(m_text[m_pos]))) {
            ++m_pos;
        }
    }

    bool Accept(char c) {
        SkipSpaces();
        if (m_pos < m_text.size() && m_text[m_pos] == c) {
            ++m_pos;
            return true;
        }
        return false;
    }

    double ParseExpr() {
        double value = ParseTerm();
        for (;;) {
            if (Accept('+')) value = value + ParseTerm();
            else if (Accept('-')) value = value - ParseTerm();
            else return value;
        }
    }

    double ParseTerm() {
        double value = ParseUnary();
        for (;;) {
            if (Accept('*')) value = value * ParseUnary();
            else if (Accept('/')) value = value / ParseUnary();
            else return value;
        }
    }

    double ParseUnary() {
        if (Accept('-')) return -ParseUnary();
        return ParsePower();
    }

    double ParsePower() {
        double base = ParsePrimary();
        if (Accept('^')) {
            double exponent = ParseUnary();
            // Squares are multiplied so they round like x * x
            return exponent == 2.0 ? base * base : std::pow(base, exponent);
        }
        return base;
    }

    double ParsePrimary() {
        if (Accept('(')) {
            double value = ParseExpr();
            if (!Accept(')')) {
                throw std::runtime_error("Expected ')' at offset " + std::to_string(m_pos));
            }
            return value;
        }

        SkipSpaces();
        const char* begin = m_text.c_str() + m_pos;
        char* end = nullptr;
        double value = std::strtod(begin, &end);
        if (end == begin) {
            throw std::runtime_error("Expected number at offset " + std::to_string(m_pos));
        }
        m_pos += static_cast<std::size_t>(end - begin);
        return value;
    }

    const std::string& m_text;
    std::size_t m_pos = 0;
};

inline std::string ReplaceAll(std::string text, const std::string& token, const std::string& value) {
    std::size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.size(), value);
        pos += value.size();
    }
    return text;
}

} // namespace splitwindow::test
