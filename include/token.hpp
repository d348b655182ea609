#pragma once

#include <cstddef>
#include <string>

namespace ratcalc {

// Типы лексем
enum class TokenType {
    Number,     // Числовой литерал: 12, 12.5, .5
    Identifier, // Имя переменной или функции
    Plus,       // +
    Minus,      // -
    Star,       // *
    Slash,      // /
    Caret,      // ^
    Root,       // √
    LParen,     // (
    RParen,     // )
    Comma,      // , (только между аргументами функции)
    Assign,     // =
    End         // Конец ввода
};

// Лексема: тип, исходный текст и его положение во входной строке
struct Token {
    TokenType type;
    std::string text;
    std::size_t position; // Смещение в байтах от начала строки
    std::size_t length;   // Длина исходного фрагмента в байтах
};

} // namespace ratcalc
