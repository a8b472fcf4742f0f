#pragma once

#include <string>

// Arithmetic over + - * / %, unary minus, parentheses and decimals. Any other
// character in the input is dropped before parsing. Throws std::runtime_error on
// bad syntax and on division or modulo by zero.
double Calculate(const std::string &expression);

// Drops characters outside digits, operators, parentheses, '.' and whitespace.
std::string SanitizeExpression(const std::string &expression);

std::string FormatNumber(double value);
